#include <catch2/catch_test_macros.hpp>
#include "policy/permission_evaluator.hpp"

using namespace rulegate;

namespace {

CallerIdentity caller(std::unordered_set<std::string> permissions,
                      std::unordered_set<std::string> roles = {}) {
    CallerIdentity id;
    id.user_id = "42";
    id.user_name = "analyst";
    id.permissions = std::move(permissions);
    id.roles = std::move(roles);
    return id;
}

Rule rule_with(Requirement permission, Requirement role = Requirement::none()) {
    Rule r;
    r.name = "r";
    r.path_pattern = "/x";
    r.permission = std::move(permission);
    r.role = std::move(role);
    return r;
}

} // namespace

TEST_CASE("PermissionEvaluator: absent requirement allows everyone", "[policy]") {
    const auto rule = rule_with(Requirement::none());
    CHECK(PermissionEvaluator::check_permission(caller({}), rule).allowed);
    CHECK(PermissionEvaluator::check_role(caller({}), rule).allowed);
}

TEST_CASE("PermissionEvaluator: single permission", "[policy]") {
    const auto rule = rule_with(Requirement::single("ai:kb:list"));

    CHECK(PermissionEvaluator::check_permission(caller({"ai:kb:list"}), rule).allowed);

    const auto denied = PermissionEvaluator::check_permission(caller({"ai:kb:edit"}), rule);
    CHECK_FALSE(denied.allowed);
    CHECK(denied.reason == "permission_denied");
    CHECK(denied.detail == "Missing permission: ai:kb:list");
}

TEST_CASE("PermissionEvaluator: any-of versus all-of", "[policy]") {
    const std::vector<std::string> values{"ai:kb:edit", "ai:kb:remove"};
    const auto holder = caller({"ai:kb:edit"});

    SECTION("Non-strict: one of the listed permissions suffices") {
        const auto rule = rule_with(Requirement::any_of(values));
        CHECK(PermissionEvaluator::check_permission(holder, rule).allowed);
        CHECK_FALSE(PermissionEvaluator::check_permission(caller({"ai:kb:list"}), rule).allowed);
    }

    SECTION("Strict: every listed permission is needed") {
        const auto rule = rule_with(Requirement::all_of(values));
        const auto denied = PermissionEvaluator::check_permission(holder, rule);
        CHECK_FALSE(denied.allowed);
        CHECK(denied.detail == "Missing permission: ai:kb:edit AND ai:kb:remove");

        CHECK(PermissionEvaluator::check_permission(
            caller({"ai:kb:edit", "ai:kb:remove"}), rule).allowed);
    }
}

TEST_CASE("PermissionEvaluator: roles", "[policy]") {
    const auto rule = rule_with(Requirement::none(), Requirement::any_of({"operator", "analyst"}));

    CHECK(PermissionEvaluator::check_role(caller({}, {"analyst"}), rule).allowed);

    const auto denied = PermissionEvaluator::check_role(caller({}, {"viewer"}), rule);
    CHECK_FALSE(denied.allowed);
    CHECK(denied.reason == "role_denied");
    CHECK(denied.detail == "Missing role: operator OR analyst");
}

TEST_CASE("PermissionEvaluator: administrators pass every check", "[policy]") {
    const auto rule = rule_with(Requirement::all_of({"a", "b"}), Requirement::single("operator"));

    auto flagged = caller({});
    flagged.admin = true;
    auto wildcard = caller({"*:*:*"});
    auto admin_role = caller({}, {"admin"});

    for (const auto* id : {&flagged, &wildcard, &admin_role}) {
        CHECK(PermissionEvaluator::is_admin(*id));
        CHECK(PermissionEvaluator::check_permission(*id, rule).allowed);
        CHECK(PermissionEvaluator::check_role(*id, rule).allowed);
    }
    CHECK_FALSE(PermissionEvaluator::is_admin(caller({"a", "b"}, {"operator"})));
}

TEST_CASE("PermissionEvaluator: data scope by caller kind", "[policy][scope]") {
    SECTION("Admin sees everything") {
        auto id = caller({});
        id.admin = true;
        const auto scope = PermissionEvaluator::build_data_scope(id, "knowledgebase", "id");
        CHECK(scope.kind == DataScopePredicate::Kind::ALL);
        CHECK(scope.to_sql() == "1 = 1");
    }

    SECTION("Empty scope set sees nothing") {
        const auto scope = PermissionEvaluator::build_data_scope(caller({"ai:kb:list"}), "knowledgebase", "id");
        CHECK(scope.kind == DataScopePredicate::Kind::NONE);
        CHECK(scope.to_sql() == "1 = 0");
        CHECK_FALSE(scope.admits("kb-1"));
    }

    SECTION("Scoped ids") {
        auto id = caller({"ai:kb:list"});
        id.scope_ids = {"kb-1", "kb-7"};
        const auto scope = PermissionEvaluator::build_data_scope(id, "knowledgebase", "id");
        CHECK(scope.kind == DataScopePredicate::Kind::IN_SET);
        CHECK(scope.to_sql() == "knowledgebase.id IN ('kb-1', 'kb-7')");
        CHECK(scope.admits("kb-7"));
        CHECK_FALSE(scope.admits("kb-2"));
    }
}
