#pragma once

#include "auth/static_identity_resolver.hpp"
#include "core/types.hpp"
#include "credential/credential_manager.hpp"
#include "hooks/hook_registry.hpp"
#include "routing/rule.hpp"
#include "stream/streaming_relay.hpp"

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace rulegate {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    uint32_t shutdown_timeout_ms = 30000;   // Drain budget for in-flight requests
    std::string health_path = "/health";

    ServerConfig()
        : host("0.0.0.0"),
          port(8080),
          thread_pool_size(8) {}
};

struct LoggingConfig {
    std::string level = "info";
    bool log_requests = true;               // One line per handled request
};

/**
 * @brief Machine login settings of one upstream
 *
 * public_key holds the PEM text (or its bare base64 body) after loading;
 * it may come inline or from public_key_file.
 */
struct UpstreamCredentialConfig {
    CredentialConfig credential;
    std::string token_file;                 // Empty = tokens kept in memory only
};

struct UpstreamConfig {
    std::string name;
    std::string prefix;                     // Mount prefix, e.g. "/ragflow"
    std::string base_url;                   // http(s)://host[:port][/path]
    std::optional<std::string> base_path;   // Overrides the path part of base_url
    UpstreamTimeouts timeouts;
    bool follow_redirects = false;
    bool verify_tls = true;
    bool fallback_transport = true;         // libcurl transport behind httplib for streams
    std::string scope_entity;
    std::string scope_column;
    std::optional<UpstreamCredentialConfig> credentials;
};

/**
 * @brief A rule together with the upstream it belongs to
 */
struct RuleConfig {
    std::string upstream;
    Rule rule;
};

/**
 * @brief A configured instance of a built-in hook type
 */
struct HookConfig {
    std::string name;
    std::string type;
    HookOptions options;
};

struct GatewayConfig {
    ServerConfig server;
    LoggingConfig logging;
    StreamSettings streaming;
    std::vector<UpstreamConfig> upstreams;
    std::vector<RuleConfig> rules;
    std::vector<ApiKeyUser> users;
    std::vector<HookConfig> hooks;

    [[nodiscard]] const UpstreamConfig* find_upstream(const std::string& name) const {
        for (const auto& upstream : upstreams) {
            if (upstream.name == name) return &upstream;
        }
        return nullptr;
    }
};

} // namespace rulegate
