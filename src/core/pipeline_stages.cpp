#include "core/pipeline_stages.hpp"
#include "core/utils.hpp"
#include "hooks/hook_registry.hpp"
#include "policy/permission_evaluator.hpp"
#include "policy/policy_constants.hpp"
#include "routing/mount.hpp"
#include "server/http_constants.hpp"
#include "upstream/request_forwarder.hpp"

#include <format>

namespace rulegate {

// ============================================================================
// RuleMatchStage
// ============================================================================
IPipelineStage::Verdict RuleMatchStage::process(RequestContext& ctx) {
    const Rule* rule = ctx.mount->rules.match(ctx.request.sub_path, ctx.request.method);
    if (!rule) {
        ctx.fail(ErrorCategory::RULE_NOT_FOUND,
            std::format("No rule for {} {}{}", utils::to_upper(ctx.request.method),
                        ctx.mount->prefix, ctx.request.sub_path));
        return Verdict::REJECT;
    }

    ctx.rule = rule;
    ctx.upstream_path = RequestForwarder::resolve_upstream_path(
        *rule, ctx.request.sub_path, ctx.mount->base_path);
    return Verdict::PASS;
}

// ============================================================================
// RoleCheckStage
// ============================================================================
IPipelineStage::Verdict RoleCheckStage::process(RequestContext& ctx) {
    const auto decision = PermissionEvaluator::check_role(ctx.identity, *ctx.rule);
    if (!decision.allowed) {
        ctx.fail(ErrorCategory::ROLE_DENIED, decision.detail);
        return Verdict::REJECT;
    }
    return Verdict::PASS;
}

// ============================================================================
// PermissionCheckStage
// ============================================================================
IPipelineStage::Verdict PermissionCheckStage::process(RequestContext& ctx) {
    const auto decision = PermissionEvaluator::check_permission(ctx.identity, *ctx.rule);
    if (!decision.allowed) {
        ctx.fail(ErrorCategory::PERMISSION_DENIED, decision.detail);
        return Verdict::REJECT;
    }
    return Verdict::PASS;
}

// ============================================================================
// DataScopeStage
// ============================================================================
IPipelineStage::Verdict DataScopeStage::process(RequestContext& ctx) {
    ctx.scope = PermissionEvaluator::build_data_scope(
        ctx.identity, ctx.mount->scope_entity, ctx.mount->scope_column);
    return Verdict::PASS;
}

// ============================================================================
// PreProcessorStage
// ============================================================================
IPipelineStage::Verdict PreProcessorStage::process(RequestContext& ctx) {
    const auto& names = ctx.rule->pre_processors;
    if (names.empty()) return Verdict::PASS;

    const auto hooks = hooks_.resolve_pre(names);
    if (hooks.is_error()) {
        // Rules are validated at load, so this is a wiring bug
        ctx.fail(ErrorCategory::INTERNAL_ERROR, hooks.error_message());
        return Verdict::REJECT;
    }

    ctx.request_payload = Body::parse(ctx.request.body);
    ctx.request_payload_parsed = true;

    HookContext hook_ctx{ctx.request, *ctx.rule, ctx.identity, ctx.scope, ctx.request_payload, 0};
    for (const auto& hook : hooks.value()) {
        const auto outcome = hook->process(hook_ctx);
        if (outcome.aborted()) {
            utils::log::info(std::format("Pre-processor {} stopped {} {}: {}",
                hook->name(), ctx.request.method, ctx.request.sub_path, outcome.reason));
            ctx.fail(ErrorCategory::PRE_PROCESSOR_ABORTED, outcome.reason,
                     outcome.status != 0 ? outcome.status : 403);
            return Verdict::REJECT;
        }
        ctx.request_payload_modified |= outcome.modified;
    }

    if (ctx.request_payload_modified) {
        ctx.request.body = ctx.request_payload.serialize();
        if (ctx.request_payload.is_json()) ctx.request.content_type = http::kJsonContentType;
    }
    return Verdict::PASS;
}

} // namespace rulegate
