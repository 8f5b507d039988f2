#pragma once

#include "upstream/iupstream_client.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace rulegate {

/**
 * @brief IUpstreamClient over cpp-httplib
 *
 * A fresh httplib::Client is created per exchange, so instances are safe to
 * share between request threads.
 */
class HttpUpstreamClient : public IUpstreamClient {
public:
    struct Config {
        std::string scheme_host_port;       // e.g. "http://127.0.0.1:8000"
        bool follow_redirects = false;
        bool verify_tls = true;
    };

    explicit HttpUpstreamClient(Config config);

    [[nodiscard]] Result<UpstreamResponse> send(const UpstreamRequest& request) override;

    struct Stats {
        uint64_t requests;
        uint64_t transport_failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            requests_.load(std::memory_order_relaxed),
            transport_failures_.load(std::memory_order_relaxed),
        };
    }

private:
    Config config_;
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> transport_failures_{0};
};

} // namespace rulegate
