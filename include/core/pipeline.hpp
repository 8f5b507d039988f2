#pragma once

#include "core/types.hpp"
#include "core/request_context.hpp"
#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace rulegate {

struct Mount;

/**
 * @brief Pipeline coordinator - orchestrates the per-request flow
 *
 * Layers:
 * 1. Rule match (unmapped -> 403 rule_not_found)
 * 2. Role check, then permission check
 * 3. Data scope predicate
 * 4. Pre-processors (abort -> nothing is sent upstream)
 * 5. Forward, or open the streaming relay
 * 6. Post-processors on 2xx responses (failure -> 500)
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components);

    /**
     * @brief Execute request through pipeline
     * @param mount Mount whose prefix matched the request
     * @param request Caller request, mount prefix removed
     * @param identity Resolved caller
     * @param abandoned Optional flag that stops waiting on a stream's first chunk
     * @return Complete response, or one carrying a stream session
     */
    GatewayResponse execute(const Mount& mount, InboundRequest request, CallerIdentity identity,
                            const std::atomic<bool>* abandoned = nullptr);

    /**
     * @brief JSON error body: {"success":false,"code":..,"error":reason,"message":..}
     */
    [[nodiscard]] static GatewayResponse error_response(ErrorCategory category,
                                                        const std::string& message,
                                                        int status = 0);

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_denied;
        uint64_t requests_aborted;
        uint64_t upstream_errors;
        uint64_t post_processor_failures;
        uint64_t streams_started;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_denied = requests_denied_.load(std::memory_order_relaxed),
            .requests_aborted = requests_aborted_.load(std::memory_order_relaxed),
            .upstream_errors = upstream_errors_.load(std::memory_order_relaxed),
            .post_processor_failures = post_processor_failures_.load(std::memory_order_relaxed),
            .streams_started = streams_started_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] bool forward_request(RequestContext& ctx);
    [[nodiscard]] bool open_stream(RequestContext& ctx);
    void run_post_processors(RequestContext& ctx);
    [[nodiscard]] GatewayResponse build_response(RequestContext& ctx);
    void count_failure(const RequestContext& ctx);
    void log_request(const RequestContext& ctx, const GatewayResponse& response) const;

    void build_stage_chain();

    PipelineComponents c_;

    /**
     * @brief Ordered chain of access stages
     *
     * Built once in the constructor and executed in order.
     */
    std::vector<std::unique_ptr<IPipelineStage>> access_stages_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> requests_denied_{0};
    std::atomic<uint64_t> requests_aborted_{0};
    std::atomic<uint64_t> upstream_errors_{0};
    std::atomic<uint64_t> post_processor_failures_{0};
    std::atomic<uint64_t> streams_started_{0};
};

} // namespace rulegate
