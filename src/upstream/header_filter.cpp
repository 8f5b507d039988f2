#include "upstream/header_filter.hpp"
#include "core/utils.hpp"

#include <array>

namespace rulegate::header_filter {

namespace {

constexpr std::array<std::string_view, 8> kHopByHop = {
    "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
    "te", "trailer", "transfer-encoding", "upgrade",
};

bool any_of_names(std::string_view name, std::initializer_list<std::string_view> names) {
    for (const auto n : names) {
        if (utils::iequals(name, n)) return true;
    }
    return false;
}

} // anonymous namespace

bool is_hop_by_hop(std::string_view name) {
    for (const auto h : kHopByHop) {
        if (utils::iequals(name, h)) return true;
    }
    return false;
}

HeaderMap for_upstream(const HeaderMap& caller_headers) {
    HeaderMap filtered;
    for (const auto& [name, value] : caller_headers) {
        if (is_hop_by_hop(name)) continue;
        if (any_of_names(name, {"host", "content-length", "authorization"})) continue;
        filtered.emplace(name, value);
    }
    return filtered;
}

HeaderMap for_caller(const HeaderMap& upstream_headers) {
    HeaderMap filtered;
    for (const auto& [name, value] : upstream_headers) {
        if (is_hop_by_hop(name)) continue;
        if (any_of_names(name, {"content-length", "content-type"})) continue;
        filtered.emplace(name, value);
    }
    return filtered;
}

} // namespace rulegate::header_filter
