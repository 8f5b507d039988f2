#include <catch2/catch_test_macros.hpp>
#include "hooks/builtin_hooks.hpp"
#include "hooks/hook_registry.hpp"
#include "policy/permission_evaluator.hpp"

using namespace rulegate;

namespace {

// Everything a hook looks at, owned in one place
struct HookFixture {
    InboundRequest request;
    Rule rule;
    CallerIdentity identity;
    DataScopePredicate scope;
    Body payload;

    explicit HookFixture(std::vector<std::string> scope_ids, bool admin = false) {
        rule.name = "list-datasets";
        rule.path_pattern = "/api/v1/datasets";
        identity.user_name = "analyst";
        identity.admin = admin;
        identity.scope_ids = std::move(scope_ids);
        scope = PermissionEvaluator::build_data_scope(identity, "knowledgebase", "id");
    }

    HookOutcome run(IPreProcessor& hook, std::string_view body) {
        payload = Body::parse(body);
        HookContext ctx{request, rule, identity, scope, payload, 0};
        return hook.process(ctx);
    }

    HookOutcome run(IPostProcessor& hook, std::string_view body) {
        payload = Body::parse(body);
        HookContext ctx{request, rule, identity, scope, payload, 200};
        return hook.process(ctx);
    }
};

} // namespace

// ============================================================================
// scope_filter
// ============================================================================

TEST_CASE("ScopeFilter: keeps only scoped list elements", "[hooks][scope_filter]") {
    HookFixture fx({"kb-1", "7"});
    ScopeFilterPostProcessor hook("filter", "/data", "id");

    const auto outcome = fx.run(hook,
        R"({"code":0,"data":[{"id":"kb-1"},{"id":"kb-2"},{"id":7},{"name":"no id"}]})");
    CHECK_FALSE(outcome.aborted());
    CHECK(outcome.modified);
    CHECK(fx.payload.serialize() == R"({"code":0,"data":[{"id":"kb-1"},{"id":7}]})");
}

TEST_CASE("ScopeFilter: lists of bare ids", "[hooks][scope_filter]") {
    HookFixture fx({"kb-1", "7"});
    ScopeFilterPostProcessor hook("filter", "/data", "id");

    const auto outcome = fx.run(hook, R"({"data":["kb-1","kb-2",7,8,null,[1],{"id":"kb-1"}]})");
    CHECK(outcome.modified);
    CHECK(fx.payload.serialize() == R"({"data":["kb-1",7,{"id":"kb-1"}]})");
}

TEST_CASE("ScopeFilter: nested list pointer and custom id field", "[hooks][scope_filter]") {
    HookFixture fx({"t-2"});
    ScopeFilterPostProcessor hook("filter", "/data/items", "thread_id");

    const auto outcome = fx.run(hook,
        R"({"data":{"items":[{"thread_id":"t-1"},{"thread_id":"t-2"}],"total":2}})");
    CHECK(outcome.modified);
    CHECK(fx.payload.json()["data"]["items"].size() == 1);
    CHECK(fx.payload.json()["data"]["total"] == 2);
}

TEST_CASE("ScopeFilter: empty scope empties the list", "[hooks][scope_filter]") {
    HookFixture fx({});
    ScopeFilterPostProcessor hook("filter", "/data", "id");

    const auto outcome = fx.run(hook, R"({"data":[{"id":"kb-1"}]})");
    CHECK(outcome.modified);
    CHECK(fx.payload.json()["data"].empty());
}

TEST_CASE("ScopeFilter: payloads it cannot filter pass through", "[hooks][scope_filter]") {
    ScopeFilterPostProcessor hook("filter", "/data", "id");

    SECTION("Admin") {
        HookFixture fx({}, true);
        const auto outcome = fx.run(hook, R"({"data":[{"id":"kb-1"}]})");
        CHECK_FALSE(outcome.modified);
        CHECK(fx.payload.json()["data"].size() == 1);
    }

    SECTION("Not JSON") {
        HookFixture fx({"kb-1"});
        const auto outcome = fx.run(hook, "plain text");
        CHECK_FALSE(outcome.modified);
        CHECK_FALSE(outcome.aborted());
    }

    SECTION("No list at the pointer") {
        HookFixture fx({"kb-1"});
        const auto outcome = fx.run(hook, R"({"data":{"id":"kb-1"}})");
        CHECK_FALSE(outcome.modified);
    }
}

// ============================================================================
// require_scoped_id
// ============================================================================

TEST_CASE("RequireScopedId: aborts for ids outside the scope", "[hooks][require_scoped_id]") {
    HookFixture fx({"assistant-3"});
    RequireScopedIdPreProcessor hook("require", "assistant_id", 403);

    SECTION("In scope") {
        CHECK_FALSE(fx.run(hook, R"({"assistant_id":"assistant-3","input":{}})").aborted());
    }

    SECTION("Out of scope") {
        const auto outcome = fx.run(hook, R"({"assistant_id":"assistant-9"})");
        REQUIRE(outcome.aborted());
        CHECK(outcome.status == 403);
        CHECK(outcome.reason.find("assistant-9") != std::string::npos);
    }

    SECTION("Field absent or body not an object") {
        CHECK_FALSE(fx.run(hook, R"({"input":{}})").aborted());
        CHECK_FALSE(fx.run(hook, R"([1,2])").aborted());
        CHECK_FALSE(fx.run(hook, "").aborted());
    }
}

// ============================================================================
// attach_data_scope
// ============================================================================

TEST_CASE("AttachDataScope: adds the predicate to object bodies", "[hooks][attach_data_scope]") {
    HookFixture fx({"kb-1"});
    AttachDataScopePreProcessor hook("attach", "data_scope");

    const auto outcome = fx.run(hook, R"({"limit":10})");
    CHECK(outcome.modified);
    const auto& doc = fx.payload.json();
    CHECK(doc["limit"] == 10);
    CHECK(doc["data_scope"]["kind"] == "in_set");
    CHECK(doc["data_scope"]["sql"] == "knowledgebase.id IN ('kb-1')");

    CHECK_FALSE(fx.run(hook, "not json").modified);
}

// ============================================================================
// HookRegistry
// ============================================================================

TEST_CASE("HookRegistry: built-ins are registered under their type", "[hooks][registry]") {
    const auto registry = HookRegistry::with_builtins();
    CHECK(registry.size() == 3);
    CHECK(registry.find_post("scope_filter") != nullptr);
    CHECK(registry.find_pre("require_scoped_id") != nullptr);
    CHECK(registry.find_pre("attach_data_scope") != nullptr);
    CHECK(registry.find_pre("scope_filter") == nullptr);
}

TEST_CASE("HookRegistry: configured instances", "[hooks][registry]") {
    auto registry = HookRegistry::with_builtins();

    SECTION("Custom name with options") {
        auto added = registry.add_builtin("filter_threads", "scope_filter",
                                          {{"list_pointer", "/items"}, {"id_field", "thread_id"}});
        REQUIRE(added.is_ok());
        CHECK(registry.find_post("filter_threads") != nullptr);
    }

    SECTION("Name already taken") {
        auto added = registry.add_builtin("scope_filter", "scope_filter", {});
        REQUIRE(added.is_error());
        CHECK(added.error_category() == ErrorCategory::CONFIG_ERROR);
    }

    SECTION("Unknown type") {
        CHECK(registry.add_builtin("x", "rewrite_everything", {}).is_error());
    }

    SECTION("Invalid options") {
        CHECK(registry.add_builtin("p", "scope_filter", {{"list_pointer", "data"}}).is_error());
        CHECK(registry.add_builtin("s", "require_scoped_id", {{"status", "200"}}).is_error());
        CHECK(registry.add_builtin("t", "require_scoped_id", {{"status", "abc"}}).is_error());
    }
}

TEST_CASE("HookRegistry: resolves names in order", "[hooks][registry]") {
    auto registry = HookRegistry::with_builtins();
    REQUIRE(registry.add_builtin("second", "attach_data_scope", {{"key", "scope"}}).is_ok());

    auto resolved = registry.resolve_pre({"require_scoped_id", "second"});
    REQUIRE(resolved.is_ok());
    REQUIRE(resolved.value().size() == 2);
    CHECK(resolved.value()[0]->name() == "require_scoped_id");
    CHECK(resolved.value()[1]->name() == "second");

    auto missing = registry.resolve_pre({"require_scoped_id", "nope"});
    REQUIRE(missing.is_error());
    CHECK(missing.error_message() == "Unknown pre-processor 'nope'");
}

TEST_CASE("HookRegistry: a name is either pre or post", "[hooks][registry]") {
    HookRegistry registry;
    CHECK(registry.add_pre("shared", std::make_shared<AttachDataScopePreProcessor>("shared", "k")));
    CHECK_FALSE(registry.add_post("shared",
        std::make_shared<ScopeFilterPostProcessor>("shared", "/data", "id")));
    CHECK(registry.size() == 1);
}
