#pragma once

#include "core/body.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "policy/data_scope.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace rulegate {

struct Rule;
struct Mount;
class StreamSession;

/**
 * @brief Caller request as received by the server, mount prefix removed
 */
struct InboundRequest {
    std::string method;
    std::string sub_path;           // Always starts with '/'
    QueryParams params;
    std::string raw_query;          // Query string exactly as received
    HeaderMap headers;
    std::string body;
    std::string content_type;
};

/**
 * @brief What the server writes back to the caller
 *
 * Either a complete body or a live stream session (stream != nullptr).
 */
struct GatewayResponse {
    int status = 200;
    HeaderMap headers;
    std::string body;
    std::string content_type;
    std::shared_ptr<StreamSession> stream;
};

/**
 * @brief Request context - carries state through the pipeline stages
 */
struct RequestContext {
    // Input
    std::string request_id;
    const Mount* mount = nullptr;
    InboundRequest request;
    CallerIdentity identity;
    const std::atomic<bool>* abandoned = nullptr;   // Raised when a drain gives up on us

    // Timestamps
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point started_at;

    // Stage results
    const Rule* rule = nullptr;
    DataScopePredicate scope;
    std::string upstream_path;
    Body request_payload;           // Parsed lazily for pre-processors
    bool request_payload_parsed = false;
    bool request_payload_modified = false;
    std::optional<UpstreamResponse> upstream_response;

    // Failure (set by the stage that blocks)
    ErrorCategory error_category = ErrorCategory::NONE;
    int error_status = 0;           // Overrides the category's status when set
    std::string error_message;

    GatewayResponse response;

    // Timing breakdown
    std::chrono::microseconds access_check_time{0};
    std::chrono::microseconds upstream_time{0};

    void fail(ErrorCategory category, std::string message, int status = 0) {
        error_category = category;
        error_message = std::move(message);
        error_status = status;
    }

    [[nodiscard]] bool failed() const { return error_category != ErrorCategory::NONE; }
};

} // namespace rulegate
