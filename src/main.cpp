#include "auth/static_identity_resolver.hpp"
#include "config/config_loader.hpp"
#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "core/utils.hpp"
#include "hooks/hook_registry.hpp"
#include "routing/mount_builder.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#include <atomic>
#include <csignal>
#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>

#include <pthread.h>

using namespace rulegate;

namespace {

/**
 * @brief Turns SIGINT/SIGTERM into a call on an ordinary thread
 *
 * The signals are blocked process-wide before any other thread exists and
 * collected with sigwait(), so the drain runs outside signal context. The
 * destructor wakes a still-waiting thread with a directed SIGTERM that the
 * callback never sees.
 */
class SignalWaiter {
public:
    SignalWaiter() {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
    }

    ~SignalWaiter() {
        if (!thread_.joinable()) return;
        closing_.store(true);
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

    SignalWaiter(const SignalWaiter&) = delete;
    SignalWaiter& operator=(const SignalWaiter&) = delete;

    void start(std::function<void(int)> on_signal) {
        thread_ = std::thread([this, on_signal = std::move(on_signal)] {
            int signal = 0;
            if (sigwait(&signals_, &signal) != 0 || closing_.load()) return;
            on_signal(signal);
        });
    }

private:
    sigset_t signals_;
    std::atomic<bool> closing_{false};
    std::thread thread_;
};

void drain_and_stop(int signal, ShutdownCoordinator& coordinator, HttpServer& server) {
    utils::log::info(std::format("Signal {} received, draining", signal));
    coordinator.begin_drain();

    if (coordinator.await_idle()) {
        utils::log::info("In-flight requests finished");
    } else {
        const size_t cancelled = coordinator.cancel_streams();
        utils::log::warn(std::format("Drain budget spent with {} requests in flight; cancelled {} streams",
            coordinator.in_flight(), cancelled));
    }
    server.stop();
}

void print_usage(const char* argv0) {
    std::cout << std::format(
        "Usage: {} [-c|--config FILE] [--check]\n"
        "  -c, --config FILE   Configuration file (default: config/rulegate.toml)\n"
        "      --check         Validate the configuration and exit\n"
        "  -h, --help          Show this help\n", argv0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/rulegate.toml";
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--check") {
            check_only = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << std::format("Unknown argument: {}\n", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    // Before any thread is created so every thread inherits the mask
    SignalWaiter signal_waiter;
    std::signal(SIGPIPE, SIG_IGN);

    try {
        utils::log::info("rulegate starting...");

        // [1/5] Configuration
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::info(std::format("Config OK: {} upstreams, {} rules, {} users, {} hooks",
            cfg.upstreams.size(), cfg.rules.size(), cfg.users.size(), cfg.hooks.size()));

        if (check_only) {
            std::cout << "Configuration is valid\n";
            return 0;
        }

        // [2/5] Hooks
        utils::log::info("[2/5] Registering hooks");
        auto hooks = std::make_shared<HookRegistry>(HookRegistry::with_builtins());
        for (const auto& h : cfg.hooks) {
            const auto added = hooks->add_builtin(h.name, h.type, h.options);
            if (added.is_error()) {
                utils::log::error(added.error_message());
                return 1;
            }
        }

        // [3/5] Mounts (upstream clients, credentials, relays)
        utils::log::info("[3/5] Building mounts");
        auto mounts = MountBuilder(cfg).build();
        if (mounts.is_error()) {
            utils::log::error(mounts.error_message());
            return 1;
        }

        // [4/5] Pipeline
        utils::log::info("[4/5] Building pipeline");
        auto pipeline = PipelineBuilder()
            .with_hooks(hooks)
            .with_request_logging(cfg.logging.log_requests)
            .build();

        // [5/5] Server
        utils::log::info("[5/5] Starting server");
        auto identity = std::make_shared<StaticIdentityResolver>(cfg.users);
        auto coordinator = std::make_shared<ShutdownCoordinator>(ShutdownCoordinator::Settings{
            .drain_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms),
        });
        auto server = std::make_shared<HttpServer>(
            pipeline, std::move(mounts.value()), identity, cfg.server);
        server->set_shutdown_coordinator(coordinator);

        signal_waiter.start([coordinator, server](int signal) {
            drain_and_stop(signal, *coordinator, *server);
        });

        utils::log::info(std::format("Server ready on http://{}:{} ({} callers)",
            cfg.server.host, cfg.server.port, identity->size()));

        // Returns after stop()
        server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
