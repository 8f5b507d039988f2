#include "core/pipeline.hpp"
#include "core/pipeline_stages.hpp"
#include "core/utils.hpp"
#include "hooks/hook_registry.hpp"
#include "routing/mount.hpp"
#include "server/http_constants.hpp"
#include "stream/streaming_relay.hpp"
#include "upstream/header_filter.hpp"
#include "upstream/request_forwarder.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace rulegate {

Pipeline::Pipeline(PipelineComponents components)
    : c_(std::move(components)) {
    build_stage_chain();
}

void Pipeline::build_stage_chain() {
    access_stages_.push_back(std::make_unique<RuleMatchStage>());
    access_stages_.push_back(std::make_unique<RoleCheckStage>());
    access_stages_.push_back(std::make_unique<PermissionCheckStage>());
    access_stages_.push_back(std::make_unique<DataScopeStage>());
    access_stages_.push_back(std::make_unique<PreProcessorStage>(*c_.hooks));
}

GatewayResponse Pipeline::error_response(ErrorCategory category,
                                         const std::string& message,
                                         int status) {
    GatewayResponse response;
    response.status = status != 0 ? status : error_category_to_http_status(category);
    response.content_type = http::kJsonContentType;
    response.body = nlohmann::json{
        {"success", false},
        {"code", response.status},
        {"error", error_category_to_string(category)},
        {"message", message},
    }.dump();
    return response;
}

GatewayResponse Pipeline::execute(const Mount& mount, InboundRequest request, CallerIdentity identity,
                                  const std::atomic<bool>* abandoned) {
    RequestContext ctx;
    ctx.request_id = utils::generate_uuid();
    ctx.mount = &mount;
    ctx.request = std::move(request);
    ctx.identity = std::move(identity);
    ctx.abandoned = abandoned;
    ctx.received_at = utils::now();
    ctx.started_at = std::chrono::steady_clock::now();

    total_requests_.fetch_add(1, std::memory_order_relaxed);

    // Layers 1-4: access stages
    {
        utils::Timer timer;
        for (const auto& stage : access_stages_) {
            if (stage->process(ctx) != IPipelineStage::Verdict::PASS) {
                ctx.access_check_time = timer.elapsed();
                return build_response(ctx);
            }
        }
        ctx.access_check_time = timer.elapsed();
    }

    // Layer 5: upstream
    {
        utils::Timer timer;
        const bool ok = ctx.rule->streaming ? open_stream(ctx) : forward_request(ctx);
        ctx.upstream_time = timer.elapsed();
        if (!ok) return build_response(ctx);
    }

    // Layer 6: post-processors (streams never have any)
    if (!ctx.rule->streaming) {
        run_post_processors(ctx);
    }
    return build_response(ctx);
}

bool Pipeline::forward_request(RequestContext& ctx) {
    auto result = ctx.mount->forwarder->forward(*ctx.rule, ctx.request, ctx.upstream_path);
    if (result.is_error()) {
        if (result.error_category() != ErrorCategory::METHOD_NOT_ALLOWED) {
            utils::log::warn(std::format("[{}] {} {} -> {}: {}", ctx.request_id, ctx.request.method,
                ctx.upstream_path, ctx.mount->name, result.error_message()));
        }
        ctx.fail(result.error_category(), result.error_message());
        return false;
    }
    ctx.upstream_response = std::move(result.value());
    return true;
}

bool Pipeline::open_stream(RequestContext& ctx) {
    if (!ctx.mount->relay) {
        ctx.fail(ErrorCategory::INTERNAL_ERROR,
            std::format("Mount {} has no streaming relay", ctx.mount->name));
        return false;
    }

    auto prepared = ctx.mount->forwarder->prepare(*ctx.rule, ctx.request, ctx.upstream_path);
    if (prepared.is_error()) {
        ctx.fail(prepared.error_category(), prepared.error_message());
        return false;
    }

    auto opening = ctx.mount->relay->open(std::move(prepared.value()), ctx.abandoned);
    if (opening.is_error()) {
        utils::log::error(std::format("[{}] Stream {} on {} failed: {}", ctx.request_id,
            ctx.upstream_path, ctx.mount->name, opening.error_message()));
        ctx.fail(opening.error_category(), opening.error_message());
        return false;
    }

    auto& value = opening.value();
    if (value.passthrough) {
        ctx.upstream_response = std::move(*value.passthrough);
        return true;
    }

    streams_started_.fetch_add(1, std::memory_order_relaxed);
    ctx.response.stream = std::move(value.session);
    return true;
}

void Pipeline::run_post_processors(RequestContext& ctx) {
    const auto& names = ctx.rule->post_processors;
    if (names.empty() || !ctx.upstream_response) return;

    auto& upstream = *ctx.upstream_response;
    // Error responses are passed through untouched
    if (!is_success_status(upstream.status)) return;

    const auto hooks = c_.hooks->resolve_post(names);
    if (hooks.is_error()) {
        ctx.fail(ErrorCategory::INTERNAL_ERROR, hooks.error_message());
        return;
    }

    Body payload = Body::parse(upstream.body);
    HookContext hook_ctx{ctx.request, *ctx.rule, ctx.identity, ctx.scope, payload, upstream.status};
    bool modified = false;
    for (const auto& hook : hooks.value()) {
        const auto outcome = hook->process(hook_ctx);
        if (outcome.aborted()) {
            utils::log::error(std::format("[{}] Post-processor {} failed after upstream {}: {}",
                ctx.request_id, hook->name(), upstream.status, outcome.reason));
            ctx.fail(ErrorCategory::POST_PROCESSOR_FAILED, outcome.reason, 500);
            return;
        }
        modified |= outcome.modified;
    }

    if (modified) {
        upstream.body = payload.serialize();
        if (payload.is_json()) upstream.content_type = http::kJsonContentType;
    }
}

void Pipeline::count_failure(const RequestContext& ctx) {
    switch (ctx.error_category) {
        case ErrorCategory::RULE_NOT_FOUND:
        case ErrorCategory::ROLE_DENIED:
        case ErrorCategory::PERMISSION_DENIED:
            requests_denied_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ErrorCategory::PRE_PROCESSOR_ABORTED:
            requests_aborted_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ErrorCategory::UPSTREAM_UNREACHABLE:
        case ErrorCategory::CREDENTIAL_FAILED:
            upstream_errors_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ErrorCategory::POST_PROCESSOR_FAILED:
            post_processor_failures_.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            break;
    }
}

GatewayResponse Pipeline::build_response(RequestContext& ctx) {
    if (ctx.failed()) {
        count_failure(ctx);
        auto response = error_response(ctx.error_category, ctx.error_message, ctx.error_status);
        log_request(ctx, response);
        return response;
    }

    GatewayResponse& response = ctx.response;
    if (response.stream) {
        response.status = 200;
        response.content_type = http::kEventStreamContentType;
        set_header(response.headers, "Cache-Control", "no-cache");
        set_header(response.headers, "X-Accel-Buffering", "no");
    } else if (ctx.upstream_response) {
        auto& upstream = *ctx.upstream_response;
        response.status = upstream.status;
        response.content_type = upstream.content_type;
        response.body = std::move(upstream.body);
        if (ctx.rule->straightforward) {
            response.headers = header_filter::for_caller(upstream.headers);
        }
    }

    log_request(ctx, response);
    return std::move(response);
}

void Pipeline::log_request(const RequestContext& ctx, const GatewayResponse& response) const {
    if (!c_.log_requests) return;
    utils::log::info(std::format("[{}] {} {}{} user={} rule={} -> {}{} (access {}us, upstream {}us)",
        ctx.request_id,
        ctx.request.method,
        ctx.mount->prefix,
        ctx.request.sub_path,
        ctx.identity.user_name,
        ctx.rule ? ctx.rule->name : "-",
        response.status,
        response.stream ? " stream" : "",
        ctx.access_check_time.count(),
        ctx.upstream_time.count()));
}

} // namespace rulegate
