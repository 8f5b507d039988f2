#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rulegate {

/**
 * @brief Parsed upstream base URL: http(s)://host[:port][/base/path]
 */
struct UpstreamUrl {
    bool use_ssl = false;
    std::string host;
    uint16_t port = 80;
    std::string base_path;      // Without trailing slash, may be empty

    /// "http://host:port" form understood by httplib::Client
    [[nodiscard]] std::string scheme_host_port() const;

    [[nodiscard]] static std::optional<UpstreamUrl> parse(const std::string& url);
};

} // namespace rulegate
