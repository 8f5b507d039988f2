#include "upstream/upstream_url.hpp"
#include "core/utils.hpp"

#include <format>

namespace rulegate {

std::string UpstreamUrl::scheme_host_port() const {
    return std::format("{}{}:{}", use_ssl ? "https://" : "http://", host, port);
}

std::optional<UpstreamUrl> UpstreamUrl::parse(const std::string& input) {
    UpstreamUrl parsed;
    std::string url = input;

    if (url.starts_with("https://")) {
        parsed.use_ssl = true;
        url = url.substr(8);
        parsed.port = 443;
    } else if (url.starts_with("http://")) {
        url = url.substr(7);
        parsed.port = 80;
    } else {
        return std::nullopt;
    }

    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        parsed.host = url.substr(0, path_pos);
        parsed.base_path = url.substr(path_pos);
        while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
            parsed.base_path.pop_back();
        }
    } else {
        parsed.host = url;
    }

    const auto port_pos = parsed.host.find(':');
    if (port_pos != std::string::npos) {
        const auto port = utils::try_parse_int<uint16_t>(parsed.host.substr(port_pos + 1));
        if (!port || *port == 0) return std::nullopt;
        parsed.port = *port;
        parsed.host = parsed.host.substr(0, port_pos);
    }

    if (parsed.host.empty()) return std::nullopt;
    return parsed;
}

} // namespace rulegate
