#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "credential/password_encryptor.hpp"
#include "hooks/hook_registry.hpp"
#include "routing/rule_registry.hpp"
#include "upstream/upstream_url.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace rulegate {

namespace {

namespace fs = std::filesystem;

constexpr size_t kMaxIncludeDepth = 8;

// ============================================================================
// ${NAME} substitution
// ============================================================================

/// Unset variables become empty; an unterminated "${" is an error
std::string substitute_env(std::string_view text) {
    std::string out;
    size_t pos = 0;
    for (;;) {
        const size_t open = text.find("${", pos);
        out.append(text.substr(pos, open == std::string_view::npos ? open : open - pos));
        if (open == std::string_view::npos) return out;

        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var reference starting at offset {}", open));
        }
        const std::string var(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(var.c_str())) out += value;
        pos = close + 1;
    }
}

void substitute_env_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) *str = substitute_env(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) substitute_env_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env_in(child);
    }
}

// ============================================================================
// include = [...]
// ============================================================================

/// Lay `top` over `base`: nested tables merge, arrays concatenate, scalars
/// from `top` replace those in `base`
void overlay(toml::table& base, const toml::table& top) {
    for (auto&& [key, node] : top) {
        toml::node* existing = base.get(key.str());
        if (existing && existing->is_table() && node.is_table()) {
            overlay(*existing->as_table(), *node.as_table());
        } else if (existing && existing->is_array() && node.is_array()) {
            auto& items = *existing->as_array();
            for (const auto& item : *node.as_array()) items.push_back(item);
        } else {
            base.insert_or_assign(key, node);
        }
    }
}

/**
 * @brief Loads a file and everything it includes, depth first
 *
 * Included files form the base layer in the order listed; the including
 * file is laid over them last. A file may be included from several places,
 * but not from inside its own include chain.
 */
class IncludeResolver {
public:
    toml::table load(const fs::path& file) {
        const fs::path path = fs::canonical(file);
        if (std::ranges::find(chain_, path) != chain_.end()) {
            throw std::runtime_error(std::format("Circular config include: {}", path.string()));
        }
        if (chain_.size() >= kMaxIncludeDepth) {
            throw std::runtime_error(
                std::format("Config includes nested deeper than {} at {}", kMaxIncludeDepth, path.string()));
        }

        chain_.push_back(path);
        toml::table own = toml::parse_file(path.string());
        const auto targets = take_include_list(own);

        toml::table merged;
        for (const auto& target : targets) {
            overlay(merged, load(path.parent_path() / target));
        }
        overlay(merged, own);
        chain_.pop_back();
        return merged;
    }

private:
    static std::vector<std::string> take_include_list(toml::table& tbl) {
        std::vector<std::string> targets;
        if (auto single = tbl["include"].value<std::string>()) {
            targets.push_back(std::move(*single));
        } else if (const auto* list = tbl["include"].as_array()) {
            for (const auto& item : *list) {
                if (auto target = item.value<std::string>()) targets.push_back(std::move(*target));
            }
        }
        tbl.erase("include");
        return targets;
    }

    std::vector<fs::path> chain_;
};

// ============================================================================
// Value readers
// ============================================================================

std::vector<std::string> string_list(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> out;
    if (const auto* arr = tbl[key].as_array()) {
        for (const auto& item : *arr) {
            if (auto s = item.value<std::string>()) out.push_back(std::move(*s));
        }
    }
    return out;
}

/**
 * @brief "permission" / "roles" value: one string or a list
 *
 * A list is any-of unless `strict_key` is true, then it is all-of.
 */
Requirement read_requirement(const toml::table& tbl, std::string_view key,
                             std::string_view strict_key) {
    if (auto single = tbl[key].value<std::string>()) {
        return Requirement::single(std::move(*single));
    }
    if (!tbl[key].is_array()) return Requirement::none();

    auto values = string_list(tbl, key);
    return tbl[strict_key].value_or(false) ? Requirement::all_of(std::move(values))
                                           : Requirement::any_of(std::move(values));
}

std::chrono::milliseconds read_millis(const toml::table& tbl, std::string_view key,
                                      std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(tbl[key].value_or(static_cast<int64_t>(fallback.count())));
}

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error(std::format("Cannot open {}", path.string()));
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::string relative_to(const std::string& base_dir, const std::string& path) {
    if (path.empty() || fs::path(path).is_absolute()) return path;
    return (fs::path(base_dir) / path).string();
}

/// Calls fn for every table in the [[key]] array of tables
template<typename Fn>
void for_each_entry(const toml::table& root, std::string_view key, Fn&& fn) {
    const auto* entries = root[key].as_array();
    if (!entries) return;
    for (const auto& entry : *entries) {
        if (const auto* tbl = entry.as_table()) fn(*tbl);
    }
}

} // anonymous namespace

// ============================================================================
// Sections
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* s = root["server"].as_table();
    if (!s) return cfg;

    cfg.host = (*s)["host"].value_or(cfg.host);
    cfg.port = static_cast<uint16_t>((*s)["port"].value_or(int64_t{cfg.port}));
    cfg.thread_pool_size = static_cast<size_t>(
        (*s)["threads"].value_or(static_cast<int64_t>(cfg.thread_pool_size)));
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(
        (*s)["shutdown_timeout_ms"].value_or(int64_t{cfg.shutdown_timeout_ms}));
    cfg.health_path = (*s)["health_path"].value_or(cfg.health_path);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or(cfg.level);
        cfg.log_requests = (*l)["log_requests"].value_or(cfg.log_requests);
    }
    return cfg;
}

StreamSettings ConfigLoader::extract_streaming(const toml::table& root) {
    StreamSettings cfg;
    const auto* s = root["streaming"].as_table();
    if (!s) return cfg;

    cfg.flush_interval = read_millis(*s, "flush_interval_ms", cfg.flush_interval);
    cfg.max_empty_reads = static_cast<size_t>(
        (*s)["max_empty_reads"].value_or(static_cast<int64_t>(cfg.max_empty_reads)));
    cfg.idle_timeout = read_millis(*s, "idle_timeout_ms", cfg.idle_timeout);
    cfg.first_chunk_timeout = read_millis(*s, "first_chunk_timeout_ms", cfg.first_chunk_timeout);
    cfg.poll_interval = read_millis(*s, "poll_interval_ms", cfg.poll_interval);
    if ((*s)["sentinels"].is_array()) cfg.sentinels = string_list(*s, "sentinels");
    return cfg;
}

std::vector<UpstreamConfig> ConfigLoader::extract_upstreams(const toml::table& root,
                                                            const std::string& base_dir) {
    std::vector<UpstreamConfig> upstreams;
    for_each_entry(root, "upstreams", [&](const toml::table& u) {
        UpstreamConfig cfg;
        cfg.name = u["name"].value_or(""s);
        cfg.prefix = u["prefix"].value_or(cfg.name.empty() ? ""s : "/" + cfg.name);
        cfg.base_url = u["base_url"].value_or(""s);
        cfg.base_path = u["base_path"].value<std::string>();
        cfg.timeouts.connect = read_millis(u, "connect_timeout_ms", cfg.timeouts.connect);
        cfg.timeouts.read = read_millis(u, "read_timeout_ms", cfg.timeouts.read);
        cfg.timeouts.write = read_millis(u, "write_timeout_ms", cfg.timeouts.write);
        cfg.follow_redirects = u["follow_redirects"].value_or(false);
        cfg.verify_tls = u["verify_tls"].value_or(true);
        cfg.fallback_transport = u["fallback_transport"].value_or(true);
        cfg.scope_entity = u["scope_entity"].value_or(""s);
        cfg.scope_column = u["scope_column"].value_or(""s);

        if (const auto* c = u["credentials"].as_table()) {
            UpstreamCredentialConfig creds;
            auto& cc = creds.credential;
            cc.identity = (*c)["identity"].value_or(""s);
            cc.password = (*c)["password"].value_or(""s);
            cc.public_key_pem = (*c)["public_key"].value_or(""s);
            if (const auto key_file = (*c)["public_key_file"].value<std::string>()) {
                cc.public_key_pem = slurp(relative_to(base_dir, *key_file));
            }
            cc.login_path = (*c)["login_path"].value_or(cc.login_path);
            cc.register_path = (*c)["register_path"].value_or(cc.register_path);
            cc.register_nickname = (*c)["nickname"].value_or(cc.register_nickname);
            cc.register_on_unauthorized = (*c)["register_on_unauthorized"].value_or(true);
            cc.expiry_window = std::chrono::hours((*c)["expiry_hours"].value_or(int64_t{24}));
            cc.timeouts = cfg.timeouts;
            creds.token_file = relative_to(base_dir, (*c)["token_file"].value_or(""s));
            cfg.credentials = std::move(creds);
        }
        upstreams.push_back(std::move(cfg));
    });
    return upstreams;
}

std::vector<RuleConfig> ConfigLoader::extract_rules(const toml::table& root) {
    std::vector<RuleConfig> rules;
    for_each_entry(root, "rules", [&](const toml::table& r) {
        RuleConfig cfg;
        cfg.upstream = r["upstream"].value_or(""s);

        Rule& rule = cfg.rule;
        rule.path_pattern = r["path"].value_or(""s);
        rule.name = r["name"].value_or(rule.path_pattern);
        rule.method = utils::to_upper(r["method"].value_or(kMethodWildcard));
        rule.permission = read_requirement(r, "permission", "permission_strict");
        rule.role = read_requirement(r, "roles", "role_strict");
        rule.straightforward = r["straightforward"].value_or(false);
        rule.streaming = r["streaming"].value_or(false);
        rule.upstream_path = r["upstream_path"].value<std::string>();
        rule.pre_processors = string_list(r, "pre");
        rule.post_processors = string_list(r, "post");
        rule.description = r["description"].value_or(""s);
        rules.push_back(std::move(cfg));
    });
    return rules;
}

std::vector<ApiKeyUser> ConfigLoader::extract_users(const toml::table& root) {
    std::vector<ApiKeyUser> users;
    for_each_entry(root, "users", [&](const toml::table& u) {
        ApiKeyUser user;
        user.api_key = u["api_key"].value_or(""s);

        CallerIdentity& id = user.identity;
        id.user_name = u["name"].value_or(""s);
        id.user_id = u["id"].value_or(id.user_name);
        for (auto& perm : string_list(u, "permissions")) id.permissions.insert(std::move(perm));
        for (auto& role : string_list(u, "roles")) id.roles.insert(std::move(role));
        id.admin = u["admin"].value_or(false);
        id.scope_ids = string_list(u, "scope_ids");
        users.push_back(std::move(user));
    });
    return users;
}

std::vector<HookConfig> ConfigLoader::extract_hooks(const toml::table& root) {
    std::vector<HookConfig> hooks;
    for_each_entry(root, "hooks", [&](const toml::table& h) {
        HookConfig cfg;
        cfg.name = h["name"].value_or(""s);
        cfg.type = h["type"].value_or(""s);

        // Options are stringly typed; builtins parse what they need
        if (const auto* opts = h["options"].as_table()) {
            for (auto&& [key, node] : *opts) {
                std::string value;
                if (auto s = node.value_exact<std::string>()) {
                    value = std::move(*s);
                } else if (auto i = node.value_exact<int64_t>()) {
                    value = std::to_string(*i);
                } else if (auto b = node.value_exact<bool>()) {
                    value = utils::booltostr(*b);
                } else {
                    throw std::runtime_error(std::format(
                        "hooks.{}.options.{} must be a string, integer or boolean", cfg.name, key.str()));
                }
                cfg.options.emplace(std::string(key.str()), std::move(value));
            }
        }
        hooks.push_back(std::move(cfg));
    });
    return hooks;
}

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& tbl, const std::string& base_dir) {
    GatewayConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.streaming = extract_streaming(tbl);
    config.upstreams = extract_upstreams(tbl, base_dir);
    config.rules = extract_rules(tbl);
    config.users = extract_users(tbl);
    config.hooks = extract_hooks(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto problems = validate_config(config);
    if (problems.empty()) return LoadResult::ok(std::move(config));

    std::string message = std::format("Config validation failed ({} problems):", problems.size());
    for (const auto& problem : problems) message += "\n  - " + problem;
    return LoadResult::error(std::move(message));
}

// ============================================================================
// Entry points
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        toml::table tbl = IncludeResolver().load(config_path);
        substitute_env_in(tbl);
        const std::string dir = fs::path(config_path).parent_path().string();
        return validate_and_return(extract_all_sections(tbl, dir.empty() ? "."s : dir));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const std::string& base_dir) {
    try {
        toml::table tbl = toml::parse(toml_content);
        substitute_env_in(tbl);
        return validate_and_return(extract_all_sections(tbl, base_dir));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ---- Validation ------------------------------------------------------------

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    const auto& st = config.streaming;
    if (st.max_empty_reads == 0) {
        errors.push_back("streaming.max_empty_reads must be > 0");
    }
    if (st.poll_interval.count() <= 0) {
        errors.push_back("streaming.poll_interval_ms must be > 0");
    }
    if (st.idle_timeout < st.poll_interval) {
        errors.push_back(std::format("streaming.idle_timeout_ms ({}) < poll_interval_ms ({})",
            st.idle_timeout.count(), st.poll_interval.count()));
    }
    if (st.first_chunk_timeout < st.poll_interval) {
        errors.push_back(std::format("streaming.first_chunk_timeout_ms ({}) < poll_interval_ms ({})",
            st.first_chunk_timeout.count(), st.poll_interval.count()));
    }
    if (st.flush_interval.count() < 0) {
        errors.push_back("streaming.flush_interval_ms must be >= 0");
    }

    // ---- Upstreams ----
    std::unordered_set<std::string> names;
    std::unordered_set<std::string> prefixes;
    for (size_t i = 0; i < config.upstreams.size(); ++i) {
        const auto& up = config.upstreams[i];
        if (up.name.empty()) {
            errors.push_back(std::format("upstreams[{}].name must not be empty", i));
        } else if (!names.insert(up.name).second) {
            errors.push_back(std::format("upstreams[{}].name '{}' is used twice", i, up.name));
        }

        if (up.prefix.size() < 2 || up.prefix.front() != '/' || up.prefix.back() == '/') {
            errors.push_back(std::format(
                "upstreams[{}].prefix '{}' must start with '/' and not end with one", i, up.prefix));
        } else if (!prefixes.insert(up.prefix).second) {
            errors.push_back(std::format("upstreams[{}].prefix '{}' is used twice", i, up.prefix));
        } else if (up.prefix == config.server.health_path) {
            errors.push_back(std::format("upstreams[{}].prefix '{}' shadows the health endpoint",
                i, up.prefix));
        }

        if (!UpstreamUrl::parse(up.base_url)) {
            errors.push_back(std::format("upstreams[{}].base_url '{}' is not an http(s) URL",
                i, up.base_url));
        }
        if (up.timeouts.connect.count() <= 0 || up.timeouts.read.count() <= 0
            || up.timeouts.write.count() <= 0) {
            errors.push_back(std::format("upstreams[{}] timeouts must be > 0", i));
        }

        if (up.credentials) {
            const auto& cc = up.credentials->credential;
            if (cc.identity.empty()) {
                errors.push_back(std::format("upstreams[{}].credentials.identity must not be empty", i));
            }
            if (cc.password.empty()) {
                errors.push_back(std::format("upstreams[{}].credentials.password must not be empty", i));
            }
            if (cc.public_key_pem.empty()) {
                errors.push_back(std::format(
                    "upstreams[{}].credentials needs public_key or public_key_file", i));
            } else if (const auto key = PasswordEncryptor::from_pem(cc.public_key_pem); key.is_error()) {
                errors.push_back(std::format("upstreams[{}].credentials: {}", i, key.error_message()));
            }
            if (cc.expiry_window.count() <= 0) {
                errors.push_back(std::format("upstreams[{}].credentials.expiry_hours must be > 0", i));
            }
        }
    }

    // ---- Hooks ----
    auto hooks = HookRegistry::with_builtins();
    for (size_t i = 0; i < config.hooks.size(); ++i) {
        const auto& h = config.hooks[i];
        if (h.name.empty()) {
            errors.push_back(std::format("hooks[{}].name must not be empty", i));
            continue;
        }
        const auto added = hooks.add_builtin(h.name, h.type, h.options);
        if (added.is_error()) {
            errors.push_back(std::format("hooks[{}]: {}", i, added.error_message()));
        }
    }

    // ---- Rules ----
    std::unordered_map<std::string, RuleRegistry> registries;
    for (size_t i = 0; i < config.rules.size(); ++i) {
        const auto& rc = config.rules[i];
        const auto& rule = rc.rule;

        if (!config.find_upstream(rc.upstream)) {
            errors.push_back(std::format("rules[{}] ({}) refers to unknown upstream '{}'",
                i, rule.name, rc.upstream));
        }
        if (rule.path_pattern.empty()) {
            errors.push_back(std::format("rules[{}].path must not be empty", i));
        } else if (const auto added = registries[rc.upstream].add(rule); added.is_error()) {
            errors.push_back(std::format("rules[{}]: {}", i, added.error_message()));
        }
        if ((rule.permission.present && rule.permission.values.empty())
            || (rule.role.present && rule.role.values.empty())) {
            errors.push_back(std::format("rules[{}] ({}) has an empty requirement list", i, rule.name));
        }
        if (rule.streaming && !rule.post_processors.empty()) {
            errors.push_back(std::format(
                "rules[{}] ({}) is streaming and cannot have post-processors", i, rule.name));
        }
        if (const auto pre = hooks.resolve_pre(rule.pre_processors); pre.is_error()) {
            errors.push_back(std::format("rules[{}] ({}): {}", i, rule.name, pre.error_message()));
        }
        if (const auto post = hooks.resolve_post(rule.post_processors); post.is_error()) {
            errors.push_back(std::format("rules[{}] ({}): {}", i, rule.name, post.error_message()));
        }
    }

    // ---- Users ----
    std::unordered_set<std::string> api_keys;
    for (size_t i = 0; i < config.users.size(); ++i) {
        const auto& user = config.users[i];
        if (user.identity.user_name.empty()) {
            errors.push_back(std::format("users[{}].name must not be empty", i));
        }
        if (user.api_key.empty()) {
            errors.push_back(std::format("users[{}] ({}) has no api_key", i, user.identity.user_name));
        } else if (!api_keys.insert(user.api_key).second) {
            errors.push_back(std::format("users[{}] ({}) reuses another user's api_key",
                i, user.identity.user_name));
        }
    }

    return errors;
}

} // namespace rulegate
