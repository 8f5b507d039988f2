#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "auth/iidentity_resolver.hpp"
#include "core/utils.hpp"
#include "credential/credential_manager.hpp"
#include "routing/mount.hpp"
#include "stream/streaming_relay.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <format>
#include <string_view>

namespace rulegate {

namespace {

InboundRequest to_inbound(const httplib::Request& req) {
    InboundRequest in;
    in.method = req.method;
    in.sub_path = req.matches.size() > 1 ? std::string(req.matches[1]) : std::string{};
    if (in.sub_path.empty()) in.sub_path = "/";
    in.params.insert(req.params.begin(), req.params.end());

    // Raw query string as received, for byte-exact forwarding
    if (const auto q = req.target.find('?'); q != std::string::npos) {
        in.raw_query = req.target.substr(q + 1);
    }

    for (const auto& [name, value] : req.headers) {
        in.headers.emplace(name, value);
    }
    in.body = req.body;
    in.content_type = req.get_header_value("Content-Type");
    return in;
}

void set_json_error(httplib::Response& res, ErrorCategory category, const std::string& message) {
    const auto error = Pipeline::error_response(category, message);
    res.status = error.status;
    res.set_content(error.body, http::kJsonContentType);
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline,
                       std::vector<std::shared_ptr<Mount>> mounts,
                       std::shared_ptr<IIdentityResolver> identity,
                       ServerConfig config)
    : pipeline_(std::move(pipeline)),
      mounts_(std::move(mounts)),
      identity_(std::move(identity)),
      config_(std::move(config)) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start() - creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr_raw = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr_raw = server_.get();
    }
    auto& svr = *svr_raw;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_health_route(svr);
    for (const auto& mount : mounts_) {
        register_mount_routes(svr, mount);
    }

    utils::log::info(std::format("Starting rulegate on {}:{} ({} mounts, {} threads)",
        config_.host, config_.port, mounts_.size(), pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        if (shutdown_coordinator_ && shutdown_coordinator_->draining()) return;
        throw std::runtime_error(std::format("Failed to listen on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) server_->stop();
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

std::string HttpServer::route_pattern(const std::string& prefix) {
    static constexpr std::string_view kRegexSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(prefix.size() + 8);
    for (const char c : prefix) {
        if (kRegexSpecial.find(c) != std::string_view::npos) escaped += '\\';
        escaped += c;
    }
    return escaped + "(/.*)?";
}

void HttpServer::register_health_route(httplib::Server& svr) {
    svr.Get(config_.health_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

void HttpServer::register_mount_routes(httplib::Server& svr, const std::shared_ptr<Mount>& mount) {
    const std::string pattern = route_pattern(mount->prefix);
    const Mount* m = mount.get();
    const auto handler = [this, m](const httplib::Request& req, httplib::Response& res) {
        handle_mount(*m, req, res);
    };
    svr.Get(pattern, handler);
    svr.Post(pattern, handler);
    svr.Put(pattern, handler);
    svr.Patch(pattern, handler);
    svr.Delete(pattern, handler);
    svr.Options(pattern, handler);
}

// ============================================================================
// Handler: GET /health
// ============================================================================

nlohmann::json HttpServer::health_json() const {
    const bool draining = shutdown_coordinator_ && shutdown_coordinator_->draining();
    bool degraded = false;

    nlohmann::json mounts = nlohmann::json::array();
    for (const auto& mount : mounts_) {
        nlohmann::json entry{
            {"name", mount->name},
            {"prefix", mount->prefix},
            {"rules", mount->rules.size()},
        };

        if (mount->relay) {
            const auto rs = mount->relay->get_stats();
            entry["streaming"] = {
                {"opened", rs.streams_opened},
                {"fallbacks", rs.fallbacks_used},
                {"failed", rs.streams_failed},
                {"passthroughs", rs.passthroughs},
            };
        }

        if (mount->credentials) {
            const auto state = mount->credentials->state();
            if (state == CredentialState::FAILED) degraded = true;
            const auto cs = mount->credentials->get_stats();
            entry["credentials"] = {
                {"identity", mount->credentials->identity()},
                {"state", credential_state_to_string(state)},
                {"logins", cs.logins},
                {"login_failures", cs.login_failures},
                {"registrations", cs.registrations},
                {"invalidations", cs.invalidations},
            };
        }
        mounts.push_back(std::move(entry));
    }

    const auto ps = pipeline_->get_stats();
    const auto hs = get_http_stats();
    return {
        {"status", draining ? "draining" : (degraded ? "degraded" : "healthy")},
        {"service", "rulegate"},
        {"in_flight", shutdown_coordinator_ ? shutdown_coordinator_->in_flight() : 0u},
        {"pipeline", {
            {"total_requests", ps.total_requests},
            {"requests_denied", ps.requests_denied},
            {"requests_aborted", ps.requests_aborted},
            {"upstream_errors", ps.upstream_errors},
            {"post_processor_failures", ps.post_processor_failures},
            {"streams_started", ps.streams_started},
        }},
        {"http", {
            {"auth_rejects", hs.auth_rejects},
            {"shutdown_rejects", hs.shutdown_rejects},
            {"streams_completed", hs.streams_completed},
            {"streams_cancelled", hs.streams_cancelled},
        }},
        {"mounts", std::move(mounts)},
    };
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto body = health_json();
    const bool draining = shutdown_coordinator_ && shutdown_coordinator_->draining();
    res.status = draining ? httplib::StatusCode::ServiceUnavailable_503 : httplib::StatusCode::OK_200;
    res.set_content(body.dump(), http::kJsonContentType);
}

// ============================================================================
// Handler: <prefix>/...
// ============================================================================

GatewayResponse HttpServer::dispatch(const Mount& mount, InboundRequest request) {
    auto identity = identity_ ? identity_->resolve(request.headers) : std::nullopt;
    if (!identity) {
        auth_rejects_.fetch_add(1, std::memory_order_relaxed);
        return Pipeline::error_response(ErrorCategory::UNAUTHENTICATED,
            "Missing or unknown caller credentials");
    }

    // Streams still waiting for their first chunk have no session yet;
    // cancel_streams() reaches them through this flag
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    ScopedCancelHook hook(shutdown_coordinator_.get(), [abandoned] { abandoned->store(true); });
    return pipeline_->execute(mount, std::move(request), std::move(*identity), abandoned.get());
}

void HttpServer::handle_mount(const Mount& mount, const httplib::Request& req, httplib::Response& res) {
    if (shutdown_coordinator_ && !shutdown_coordinator_->try_admit()) {
        shutdown_rejects_.fetch_add(1, std::memory_order_relaxed);
        set_json_error(res, ErrorCategory::SHUTTING_DOWN, "Server shutting down");
        return;
    }
    auto ticket = std::make_shared<AdmissionTicket>(shutdown_coordinator_.get());

    try {
        write_response(dispatch(mount, to_inbound(req)), res, std::move(ticket));
    } catch (const std::exception& e) {
        handler_exceptions_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Unhandled error on {} {}: {}", req.method, req.path, e.what()));
        set_json_error(res, ErrorCategory::INTERNAL_ERROR, "Internal error");
    }
}

void HttpServer::write_response(GatewayResponse response, httplib::Response& res,
                                std::shared_ptr<AdmissionTicket> ticket) {
    res.status = response.status;
    for (const auto& [name, value] : response.headers) {
        res.set_header(name, value);
    }

    if (!response.stream) {
        const std::string content_type = response.content_type.empty()
            ? std::string(http::kOctetStreamContentType) : response.content_type;
        res.set_content(std::move(response.body), content_type);
        return;
    }

    auto session = std::move(response.stream);
    auto* sc = shutdown_coordinator_.get();
    const uint64_t hook_id = sc
        ? sc->add_cancel_hook([weak = std::weak_ptr<StreamSession>(session)] {
              if (auto s = weak.lock()) s->cancel();
          })
        : 0;

    // The ticket is held by the release callback: a stream counts as in
    // flight until httplib is done with it
    res.set_chunked_content_provider(
        response.content_type,
        [this, session](size_t, httplib::DataSink& sink) {
            const StreamSink out{
                .write = [&sink](std::string_view chunk) {
                    return sink.write(chunk.data(), chunk.size());
                },
                .is_writable = [&sink] { return sink.is_writable(); },
            };
            const auto outcome = session->pump(out);

            if (outcome.reason == StreamSession::EndReason::CANCELLED) {
                streams_cancelled_.fetch_add(1, std::memory_order_relaxed);
            } else {
                streams_completed_.fetch_add(1, std::memory_order_relaxed);
            }
            const auto message = std::format("Stream via {} ended ({}): {} chunks, {} bytes{}{}",
                session->transport_name(), end_reason_to_string(outcome.reason),
                outcome.chunks, outcome.bytes,
                outcome.error.empty() ? "" : ", ", outcome.error);
            if (outcome.reason == StreamSession::EndReason::ERROR
                || outcome.reason == StreamSession::EndReason::IDLE_TIMEOUT) {
                utils::log::warn(message);
            } else {
                utils::log::debug(message);
            }

            sink.done();
            return true;
        },
        [session, ticket, sc, hook_id](bool) {
            if (sc && hook_id != 0) sc->remove_cancel_hook(hook_id);
            session->cancel();
        });
}

} // namespace rulegate
