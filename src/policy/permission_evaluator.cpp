#include "policy/permission_evaluator.hpp"
#include "policy/policy_constants.hpp"

#include <algorithm>
#include <format>

namespace rulegate {

namespace {

std::string describe(const Requirement& requirement) {
    std::string joined;
    for (size_t i = 0; i < requirement.values.size(); ++i) {
        if (i > 0) joined += requirement.strict ? " AND " : " OR ";
        joined += requirement.values[i];
    }
    return joined;
}

} // anonymous namespace

bool PermissionEvaluator::is_admin(const CallerIdentity& identity) {
    return identity.admin ||
           identity.permissions.contains(policy::kAllPermission) ||
           identity.roles.contains(policy::kAdminRole);
}

bool PermissionEvaluator::satisfies(const Requirement& requirement,
                                    const std::unordered_set<std::string>& held) {
    if (!requirement.present) return true;

    const auto has = [&held](const std::string& v) { return held.contains(v); };
    if (requirement.strict) {
        return std::all_of(requirement.values.begin(), requirement.values.end(), has);
    }
    return std::any_of(requirement.values.begin(), requirement.values.end(), has);
}

AccessDecision PermissionEvaluator::check_permission(const CallerIdentity& identity,
                                                     const Rule& rule) {
    if (is_admin(identity)) return AccessDecision::allow();
    if (satisfies(rule.permission, identity.permissions)) return AccessDecision::allow();

    return AccessDecision::deny(std::string(policy::kReasonPermissionDenied),
        std::format("Missing permission: {}", describe(rule.permission)));
}

AccessDecision PermissionEvaluator::check_role(const CallerIdentity& identity,
                                               const Rule& rule) {
    if (is_admin(identity)) return AccessDecision::allow();
    if (satisfies(rule.role, identity.roles)) return AccessDecision::allow();

    return AccessDecision::deny(std::string(policy::kReasonRoleDenied),
        std::format("Missing role: {}", describe(rule.role)));
}

DataScopePredicate PermissionEvaluator::build_data_scope(const CallerIdentity& identity,
                                                         const std::string& entity,
                                                         const std::string& column) {
    DataScopePredicate predicate;
    predicate.entity = entity;
    predicate.column = column;

    if (is_admin(identity)) {
        predicate.kind = DataScopePredicate::Kind::ALL;
    } else if (identity.scope_ids.empty()) {
        predicate.kind = DataScopePredicate::Kind::NONE;
    } else {
        predicate.kind = DataScopePredicate::Kind::IN_SET;
        predicate.ids = identity.scope_ids;
    }
    return predicate;
}

} // namespace rulegate
