#pragma once

#include "core/types.hpp"
#include "policy/data_scope.hpp"
#include "routing/rule.hpp"

#include <string>
#include <unordered_set>

namespace rulegate {

/**
 * @brief Outcome of a permission or role check
 */
struct AccessDecision {
    bool allowed = true;
    std::string reason;     // Stable machine-readable reason when denied
    std::string detail;     // Human-readable explanation

    static AccessDecision allow() { return {}; }

    static AccessDecision deny(std::string reason, std::string detail) {
        return {false, std::move(reason), std::move(detail)};
    }
};

/**
 * @brief Decides whether a caller may use a rule, and what data it may see
 *
 * Administrators (admin flag, the all-permission "*:*:*" or the admin role)
 * pass every check. Stateless; all methods are thread-safe.
 */
class PermissionEvaluator {
public:
    [[nodiscard]] static bool is_admin(const CallerIdentity& identity);

    [[nodiscard]] static AccessDecision check_permission(
        const CallerIdentity& identity, const Rule& rule);

    [[nodiscard]] static AccessDecision check_role(
        const CallerIdentity& identity, const Rule& rule);

    /**
     * @brief Build the record filter for the caller's scoped ids
     *
     * Admin -> ALL, empty scope set -> NONE, otherwise IN_SET over the ids.
     */
    [[nodiscard]] static DataScopePredicate build_data_scope(
        const CallerIdentity& identity,
        const std::string& entity,
        const std::string& column);

    /// Membership test shared by permission and role checks
    [[nodiscard]] static bool satisfies(
        const Requirement& requirement,
        const std::unordered_set<std::string>& held);
};

} // namespace rulegate
