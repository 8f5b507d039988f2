#include "hooks/hook_registry.hpp"
#include "hooks/builtin_hooks.hpp"
#include "core/utils.hpp"

#include <format>

namespace rulegate {

namespace {

std::string option_or(const HookOptions& options, const std::string& key, std::string fallback) {
    const auto it = options.find(key);
    return it != options.end() ? it->second : std::move(fallback);
}

} // anonymous namespace

HookRegistry HookRegistry::with_builtins() {
    HookRegistry registry;
    for (const char* type : {ScopeFilterPostProcessor::kType,
                             RequireScopedIdPreProcessor::kType,
                             AttachDataScopePreProcessor::kType}) {
        const auto added = registry.add_builtin(type, type, {});
        if (added.is_error()) {
            utils::log::error(std::format("Built-in hook {}: {}", type, added.error_message()));
        }
    }
    return registry;
}

Result<bool> HookRegistry::add_builtin(const std::string& name,
                                       const std::string& type,
                                       const HookOptions& options) {
    if (pre_.contains(name) || post_.contains(name)) {
        return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Hook '{}' defined twice", name));
    }

    if (type == ScopeFilterPostProcessor::kType) {
        const std::string pointer = option_or(options, "list_pointer", "/data");
        if (!pointer.empty() && pointer.front() != '/') {
            return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Hook '{}': list_pointer '{}' must start with '/'", name, pointer));
        }
        try {
            add_post(name, std::make_shared<ScopeFilterPostProcessor>(
                name, pointer, option_or(options, "id_field", "id")));
        } catch (const nlohmann::json::exception& e) {
            return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Hook '{}': invalid list_pointer: {}", name, e.what()));
        }
        return Result<bool>::ok(true);
    }

    if (type == RequireScopedIdPreProcessor::kType) {
        const std::string status_str = option_or(options, "status", "403");
        const auto status = utils::try_parse_int<int>(status_str);
        if (!status || *status < 400 || *status > 599) {
            return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Hook '{}': status '{}' is not a 4xx/5xx code", name, status_str));
        }
        add_pre(name, std::make_shared<RequireScopedIdPreProcessor>(
            name, option_or(options, "field", "assistant_id"), *status));
        return Result<bool>::ok(true);
    }

    if (type == AttachDataScopePreProcessor::kType) {
        add_pre(name, std::make_shared<AttachDataScopePreProcessor>(
            name, option_or(options, "key", "data_scope")));
        return Result<bool>::ok(true);
    }

    return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
        std::format("Hook '{}': unknown type '{}'", name, type));
}

bool HookRegistry::add_pre(std::string name, std::shared_ptr<IPreProcessor> hook) {
    if (post_.contains(name)) return false;
    return pre_.emplace(std::move(name), std::move(hook)).second;
}

bool HookRegistry::add_post(std::string name, std::shared_ptr<IPostProcessor> hook) {
    if (pre_.contains(name)) return false;
    return post_.emplace(std::move(name), std::move(hook)).second;
}

std::shared_ptr<IPreProcessor> HookRegistry::find_pre(const std::string& name) const {
    const auto it = pre_.find(name);
    return it != pre_.end() ? it->second : nullptr;
}

std::shared_ptr<IPostProcessor> HookRegistry::find_post(const std::string& name) const {
    const auto it = post_.find(name);
    return it != post_.end() ? it->second : nullptr;
}

Result<std::vector<std::shared_ptr<IPreProcessor>>> HookRegistry::resolve_pre(
    const std::vector<std::string>& names) const {
    using R = Result<std::vector<std::shared_ptr<IPreProcessor>>>;
    std::vector<std::shared_ptr<IPreProcessor>> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        auto hook = find_pre(name);
        if (!hook) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("Unknown pre-processor '{}'", name));
        }
        out.push_back(std::move(hook));
    }
    return R::ok(std::move(out));
}

Result<std::vector<std::shared_ptr<IPostProcessor>>> HookRegistry::resolve_post(
    const std::vector<std::string>& names) const {
    using R = Result<std::vector<std::shared_ptr<IPostProcessor>>>;
    std::vector<std::shared_ptr<IPostProcessor>> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        auto hook = find_post(name);
        if (!hook) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("Unknown post-processor '{}'", name));
        }
        out.push_back(std::move(hook));
    }
    return R::ok(std::move(out));
}

} // namespace rulegate
