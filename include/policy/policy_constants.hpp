#pragma once

#include <string>
#include <string_view>

namespace rulegate::policy {

// Holding this permission grants every permission check
inline const std::string kAllPermission = "*:*:*";
// Holding this role key grants every role check
inline const std::string kAdminRole = "admin";

inline constexpr std::string_view kReasonRuleNotFound = "rule_not_found";
inline constexpr std::string_view kReasonPermissionDenied = "permission_denied";
inline constexpr std::string_view kReasonRoleDenied = "role_denied";

} // namespace rulegate::policy
