#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "routing/rule.hpp"
#include "upstream/iupstream_client.hpp"

#include <memory>
#include <string>

namespace rulegate {

/**
 * @brief Forwards a non-streaming request to the matched upstream
 *
 * Structured mode (rule.straightforward == false) re-issues the call from
 * its parsed parts: query parameters as a map, a JSON body when the bytes
 * parse as JSON, the raw bytes otherwise; only GET, POST, PUT and DELETE
 * are supported. Straightforward mode copies headers (filtered), query
 * string and body bytes unchanged and supports any verb.
 *
 * Non-2xx upstream answers are returned as ordinary responses.
 */
class RequestForwarder {
public:
    RequestForwarder(std::shared_ptr<IUpstreamClient> client, UpstreamTimeouts timeouts);

    /**
     * @brief Forward and wait for the complete upstream response
     * @param upstream_path Path on the upstream (see resolve_upstream_path)
     * @return Upstream response, METHOD_NOT_ALLOWED for unsupported verbs in
     *         structured mode, or UPSTREAM_UNREACHABLE on transport failure
     */
    [[nodiscard]] Result<UpstreamResponse> forward(
        const Rule& rule,
        const InboundRequest& request,
        const std::string& upstream_path) const;

    /**
     * @brief Build the upstream request without sending it
     * @return Request, or METHOD_NOT_ALLOWED for unsupported verbs in
     *         structured mode
     */
    [[nodiscard]] Result<UpstreamRequest> prepare(
        const Rule& rule,
        const InboundRequest& request,
        const std::string& upstream_path) const;

    /// Upstream path: base path + (rule override, or the caller's sub-path)
    [[nodiscard]] static std::string resolve_upstream_path(
        const Rule& rule, const std::string& sub_path, const std::string& base_path);

    [[nodiscard]] static bool is_structured_method(const std::string& method);

    [[nodiscard]] UpstreamRequest build_structured(
        const InboundRequest& request, const std::string& upstream_path) const;

    [[nodiscard]] UpstreamRequest build_straightforward(
        const InboundRequest& request, const std::string& upstream_path) const;

    [[nodiscard]] const UpstreamTimeouts& timeouts() const { return timeouts_; }

private:
    std::shared_ptr<IUpstreamClient> client_;
    UpstreamTimeouts timeouts_;
};

} // namespace rulegate
