#include "upstream/request_forwarder.hpp"
#include "upstream/header_filter.hpp"
#include "server/http_constants.hpp"
#include "core/body.hpp"
#include "core/utils.hpp"

#include <format>

namespace rulegate {

RequestForwarder::RequestForwarder(std::shared_ptr<IUpstreamClient> client,
                                   UpstreamTimeouts timeouts)
    : client_(std::move(client)), timeouts_(timeouts) {}

std::string RequestForwarder::resolve_upstream_path(const Rule& rule,
                                                    const std::string& sub_path,
                                                    const std::string& base_path) {
    const std::string& path = rule.upstream_path.has_value() ? *rule.upstream_path : sub_path;
    if (base_path.empty()) {
        return path.empty() || path.front() != '/' ? "/" + path : path;
    }
    return utils::join_path(base_path, path);
}

bool RequestForwarder::is_structured_method(const std::string& method) {
    return method == "GET" || method == "POST" || method == "PUT" || method == "DELETE";
}

UpstreamRequest RequestForwarder::build_structured(const InboundRequest& request,
                                                   const std::string& upstream_path) const {
    UpstreamRequest out;
    out.method = utils::to_upper(request.method);
    out.path = upstream_path;
    out.params = request.params;
    out.timeouts = timeouts_;

    if (out.method == "GET") return out;

    const Body body = Body::parse(request.body);
    if (body.is_json()) {
        out.body = body.json().dump();
        out.content_type = http::kJsonContentType;
    } else if (body.is_raw()) {
        // Not JSON: the bytes go out untouched with the caller's content type
        out.body = body.raw_bytes();
        out.content_type = request.content_type.empty()
            ? std::string(http::kOctetStreamContentType) : request.content_type;
    }
    return out;
}

UpstreamRequest RequestForwarder::build_straightforward(const InboundRequest& request,
                                                        const std::string& upstream_path) const {
    UpstreamRequest out;
    out.method = utils::to_upper(request.method);
    out.path = upstream_path;
    out.raw_query = request.raw_query;
    if (out.raw_query.empty()) out.params = request.params;
    out.headers = header_filter::for_upstream(request.headers);
    out.headers.erase("content-type");
    out.content_type = request.content_type;
    out.body = request.body;
    out.timeouts = timeouts_;
    return out;
}

Result<UpstreamRequest> RequestForwarder::prepare(const Rule& rule,
                                                  const InboundRequest& request,
                                                  const std::string& upstream_path) const {
    if (rule.straightforward) {
        return Result<UpstreamRequest>::ok(build_straightforward(request, upstream_path));
    }

    const std::string method = utils::to_upper(request.method);
    if (!is_structured_method(method)) {
        return Result<UpstreamRequest>::error(ErrorCategory::METHOD_NOT_ALLOWED,
            std::format("Method {} not allowed", method));
    }
    return Result<UpstreamRequest>::ok(build_structured(request, upstream_path));
}

Result<UpstreamResponse> RequestForwarder::forward(const Rule& rule,
                                                   const InboundRequest& request,
                                                   const std::string& upstream_path) const {
    auto prepared = prepare(rule, request, upstream_path);
    if (prepared.is_error()) return prepared.forward_error<UpstreamResponse>();
    return client_->send(prepared.value());
}

} // namespace rulegate
