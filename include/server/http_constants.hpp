#pragma once

#include <string>
#include <string_view>

namespace rulegate::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// Header lookups take const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kOctetStreamContentType = "application/octet-stream";
inline constexpr const char* kEventStreamContentType = "text/event-stream";

} // namespace rulegate::http
