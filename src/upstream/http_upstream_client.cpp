#include "upstream/http_upstream_client.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace rulegate {

HttpUpstreamClient::HttpUpstreamClient(Config config)
    : config_(std::move(config)) {}

Result<UpstreamResponse> HttpUpstreamClient::send(const UpstreamRequest& request) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    httplib::Client cli(config_.scheme_host_port);
    cli.set_connection_timeout(request.timeouts.connect);
    cli.set_read_timeout(request.timeouts.read);
    cli.set_write_timeout(request.timeouts.write);
    cli.set_follow_location(config_.follow_redirects);
    cli.enable_server_certificate_verification(config_.verify_tls);

    httplib::Request req;
    req.method = request.method;
    req.path = request.raw_query.empty()
        ? httplib::append_query_params(request.path, request.params)
        : request.path + "?" + request.raw_query;
    for (const auto& [name, value] : request.headers) {
        req.headers.emplace(name, value);
    }
    if (!request.content_type.empty()) {
        req.set_header("Content-Type", request.content_type);
    }
    req.body = request.body;

    const auto res = cli.send(req);
    if (!res) {
        transport_failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<UpstreamResponse>::error(ErrorCategory::UPSTREAM_UNREACHABLE,
            std::format("{} {}{}: {}", request.method, config_.scheme_host_port,
                        request.path, httplib::to_string(res.error())));
    }

    UpstreamResponse response;
    response.status = res->status;
    response.body = res->body;
    response.content_type = res->get_header_value("Content-Type");
    for (const auto& [name, value] : res->headers) {
        response.headers.emplace(name, value);
    }

    utils::log::debug(std::format("Upstream {} {} -> {}", request.method, req.path, response.status));
    return Result<UpstreamResponse>::ok(std::move(response));
}

} // namespace rulegate
