#pragma once

#include "core/pipeline.hpp"
#include "config/config_types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace rulegate {

struct Mount;
class IIdentityResolver;
class ShutdownCoordinator;
class AdmissionTicket;

/**
 * @brief Inbound HTTP surface of the gateway
 *
 * Routes:
 * - GET  <health_path>          gateway, relay and credential status
 * - ANY  <mount prefix>[/...]   one wildcard route per mount, all verbs
 *
 * Streaming responses are written with chunked transfer encoding from the
 * handler thread that accepted the request.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<Pipeline> pipeline,
               std::vector<std::shared_ptr<Mount>> mounts,
               std::shared_ptr<IIdentityResolver> identity,
               ServerConfig config);
    ~HttpServer();

    /// Register routes and listen; blocks until stop()
    void start();
    void stop();

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    /**
     * @brief Resolve the caller and run the pipeline for one mount request
     * @return Pipeline response, or 401 when the caller is unknown
     */
    [[nodiscard]] GatewayResponse dispatch(const Mount& mount, InboundRequest request);

    /// Body of the health endpoint
    [[nodiscard]] nlohmann::json health_json() const;

    /// Route pattern for a mount prefix: the prefix itself plus any sub-path
    [[nodiscard]] static std::string route_pattern(const std::string& prefix);

    struct HttpStats {
        uint64_t auth_rejects;
        uint64_t shutdown_rejects;
        uint64_t streams_completed;
        uint64_t streams_cancelled;
        uint64_t handler_exceptions;
    };

    [[nodiscard]] HttpStats get_http_stats() const {
        return {
            auth_rejects_.load(std::memory_order_relaxed),
            shutdown_rejects_.load(std::memory_order_relaxed),
            streams_completed_.load(std::memory_order_relaxed),
            streams_cancelled_.load(std::memory_order_relaxed),
            handler_exceptions_.load(std::memory_order_relaxed),
        };
    }

private:
    // ── Route registration (called from start()) ────────────────────────
    void register_health_route(httplib::Server& svr);
    void register_mount_routes(httplib::Server& svr, const std::shared_ptr<Mount>& mount);

    // ── Handlers ────────────────────────────────────────────────────────
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_mount(const Mount& mount, const httplib::Request& req, httplib::Response& res);

    // ── Helpers ─────────────────────────────────────────────────────────
    void write_response(GatewayResponse response, httplib::Response& res,
                        std::shared_ptr<AdmissionTicket> ticket);

    // ── Members ─────────────────────────────────────────────────────────
    std::shared_ptr<Pipeline> pipeline_;
    std::vector<std::shared_ptr<Mount>> mounts_;
    std::shared_ptr<IIdentityResolver> identity_;
    const ServerConfig config_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> auth_rejects_{0};
    std::atomic<uint64_t> shutdown_rejects_{0};
    std::atomic<uint64_t> streams_completed_{0};
    std::atomic<uint64_t> streams_cancelled_{0};
    std::atomic<uint64_t> handler_exceptions_{0};
};

} // namespace rulegate
