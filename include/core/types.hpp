#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <unordered_set>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cctype>
#include <algorithm>

namespace rulegate {

// ============================================================================
// HTTP Primitives
// ============================================================================

inline const std::string kMethodWildcard = "*";

/**
 * @brief Case-insensitive ordering for header names
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HeaderMap = std::multimap<std::string, std::string, CaseInsensitiveLess>;
using QueryParams = std::multimap<std::string, std::string>;

/// First value of a header, empty string if absent
inline std::string header_value(const HeaderMap& headers, const std::string& name) {
    const auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string{};
}

/// Replace every value of a header with a single value
inline void set_header(HeaderMap& headers, const std::string& name, std::string value) {
    headers.erase(name);
    headers.emplace(name, std::move(value));
}

inline bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

// ============================================================================
// Access Requirements
// ============================================================================

/**
 * @brief Permission or role requirement attached to a rule
 *
 * Absent (no values): no check. One value: membership. Several values:
 * all required when strict, any one suffices otherwise.
 */
struct Requirement {
    std::vector<std::string> values;
    bool strict = false;
    bool present = false;

    static Requirement none() { return {}; }

    static Requirement single(std::string value) {
        Requirement r;
        r.values.push_back(std::move(value));
        r.present = true;
        return r;
    }

    static Requirement any_of(std::vector<std::string> values) {
        Requirement r;
        r.values = std::move(values);
        r.present = true;
        return r;
    }

    static Requirement all_of(std::vector<std::string> values) {
        Requirement r = any_of(std::move(values));
        r.strict = true;
        return r;
    }
};

// ============================================================================
// Caller Identity
// ============================================================================

struct CallerIdentity {
    std::string user_id;
    std::string user_name;
    std::unordered_set<std::string> permissions;
    std::unordered_set<std::string> roles;
    bool admin = false;
    std::vector<std::string> scope_ids;     // Resource ids the caller may see
};

// ============================================================================
// Upstream Exchange
// ============================================================================

struct UpstreamTimeouts {
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds read{60000};
    std::chrono::milliseconds write{60000};
};

struct UpstreamRequest {
    std::string method;
    std::string path;                       // Path on the upstream, no query
    QueryParams params;                     // Structured query parameters
    std::string raw_query;                  // Used verbatim when non-empty
    HeaderMap headers;
    std::string body;
    std::string content_type;
    UpstreamTimeouts timeouts;
};

struct UpstreamResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
    std::string content_type;
};

} // namespace rulegate
