#pragma once

#include "stream/istream_transport.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace rulegate {

class CurlHandlePool;

/**
 * @brief Fallback streaming transport built on libcurl
 *
 * Independent of cpp-httplib. Each stream runs curl_easy_perform() on a
 * worker thread with an easy handle borrowed from a pool, so keep-alive
 * connections to the upstream are reused across streams. The write
 * callback feeds the same kind of bounded chunk channel the httplib
 * transport uses; close() makes the next callback abort the transfer.
 */
class CurlStreamTransport : public IStreamTransport {
public:
    struct Config {
        std::string scheme_host_port;       // e.g. "https://ragflow.internal:443"
        bool verify_tls = true;
        size_t max_idle_handles = 8;
    };

    explicit CurlStreamTransport(Config config);
    ~CurlStreamTransport() override;

    [[nodiscard]] Result<std::unique_ptr<IStreamConnection>> open(
        const UpstreamRequest& request) override;

    [[nodiscard]] std::string_view name() const override { return "curl"; }

    /// Handles parked in the pool, ready for the next stream
    [[nodiscard]] size_t idle_handles() const;

private:
    Config config_;
    std::shared_ptr<CurlHandlePool> pool_;
};

} // namespace rulegate
