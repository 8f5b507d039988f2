#pragma once

#include "stream/istream_transport.hpp"

#include <string>

namespace rulegate {

/**
 * @brief Primary streaming transport built on cpp-httplib
 *
 * The exchange runs on a worker thread; body chunks are handed to the
 * reading side through a bounded condition-variable channel. Closing the
 * connection stops the httplib client, which unblocks the worker.
 */
class HttplibStreamTransport : public IStreamTransport {
public:
    struct Config {
        std::string scheme_host_port;
        bool verify_tls = true;
    };

    explicit HttplibStreamTransport(Config config);

    [[nodiscard]] Result<std::unique_ptr<IStreamConnection>> open(
        const UpstreamRequest& request) override;

    [[nodiscard]] std::string_view name() const override { return "httplib"; }

private:
    Config config_;
};

} // namespace rulegate
