#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace rulegate {

/**
 * @brief Loads the gateway configuration from TOML
 *
 * Supported top-level keys:
 *   include = ["other.toml"]   merged underneath this file (this file wins)
 *   [server] [logging] [streaming]
 *   [[upstreams]]  with an optional [upstreams.credentials] table
 *   [[rules]] [[users]] [[hooks]]
 *
 * String values may reference environment variables as ${NAME}.
 */
class ConfigLoader {
public:
    /// Either a validated config or one message listing every problem
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            return {true, {}, std::move(cfg)};
        }
        static LoadResult error(std::string message) {
            return {false, std::move(message), {}};
        }
    };

    /// Reads config_path and its includes, expands ${NAME}, validates.
    /// Relative key and token files resolve against the file's directory.
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /// Same as load_from_file for in-memory TOML; `include` is not followed
    /// and relative paths resolve against base_dir
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const std::string& base_dir = ".");

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per problem, empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static StreamSettings extract_streaming(const toml::table& root);
    static std::vector<UpstreamConfig> extract_upstreams(const toml::table& root,
                                                         const std::string& base_dir);
    static std::vector<RuleConfig> extract_rules(const toml::table& root);
    static std::vector<ApiKeyUser> extract_users(const toml::table& root);
    static std::vector<HookConfig> extract_hooks(const toml::table& root);

    static GatewayConfig extract_all_sections(const toml::table& tbl, const std::string& base_dir);
    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace rulegate
