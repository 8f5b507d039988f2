#include "hooks/builtin_hooks.hpp"
#include "core/utils.hpp"

#include <format>

namespace rulegate {

std::string json_id_to_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number() || value.is_boolean()) return value.dump();
    return {};
}

// ============================================================================
// ScopeFilterPostProcessor
// ============================================================================

ScopeFilterPostProcessor::ScopeFilterPostProcessor(std::string name,
                                                   std::string list_pointer,
                                                   std::string id_field)
    : name_(std::move(name)),
      list_pointer_(list_pointer),
      id_field_(std::move(id_field)) {}

HookOutcome ScopeFilterPostProcessor::process(HookContext& ctx) {
    if (ctx.scope.kind == DataScopePredicate::Kind::ALL) return HookOutcome::proceed();

    if (!ctx.payload.is_json()) {
        utils::log::warn(std::format("{}: response of rule {} is not JSON, left unfiltered",
            name_, ctx.rule.name));
        return HookOutcome::proceed();
    }

    auto& doc = ctx.payload.json();
    if (!doc.contains(list_pointer_) || !doc.at(list_pointer_).is_array()) {
        utils::log::warn(std::format("{}: no list at {} in response of rule {}",
            name_, list_pointer_.to_string(), ctx.rule.name));
        return HookOutcome::proceed();
    }

    auto& list = doc.at(list_pointer_);
    nlohmann::json kept = nlohmann::json::array();
    size_t unidentified = 0;
    for (auto& element : list) {
        // A bare id list ("data": ["kb-1", 7]) is matched by the elements themselves
        std::string id;
        if (element.is_object()) {
            const auto field = element.find(id_field_);
            if (field != element.end()) id = json_id_to_string(*field);
        } else {
            id = json_id_to_string(element);
        }

        if (id.empty()) {
            ++unidentified;
            continue;
        }
        if (ctx.scope.admits(id)) kept.push_back(std::move(element));
    }

    if (unidentified > 0) {
        utils::log::debug(std::format("{}: dropped {} elements without a usable {} in response of rule {}",
            name_, unidentified, id_field_, ctx.rule.name));
    }
    utils::log::debug(std::format("{}: kept {} of {} elements for {}",
        name_, kept.size(), list.size(), ctx.identity.user_name));
    list = std::move(kept);
    return HookOutcome::changed();
}

// ============================================================================
// RequireScopedIdPreProcessor
// ============================================================================

RequireScopedIdPreProcessor::RequireScopedIdPreProcessor(std::string name,
                                                         std::string field,
                                                         int status)
    : name_(std::move(name)), field_(std::move(field)), status_(status) {}

HookOutcome RequireScopedIdPreProcessor::process(HookContext& ctx) {
    if (!ctx.payload.is_json() || !ctx.payload.json().is_object()) return HookOutcome::proceed();

    const auto& doc = ctx.payload.json();
    const auto it = doc.find(field_);
    if (it == doc.end() || it->is_null()) return HookOutcome::proceed();

    const std::string id = json_id_to_string(*it);
    if (ctx.scope.admits(id)) return HookOutcome::proceed();

    return HookOutcome::abort(status_,
        std::format("{} '{}' is outside the caller's scope", field_, id));
}

// ============================================================================
// AttachDataScopePreProcessor
// ============================================================================

AttachDataScopePreProcessor::AttachDataScopePreProcessor(std::string name, std::string key)
    : name_(std::move(name)), key_(std::move(key)) {}

HookOutcome AttachDataScopePreProcessor::process(HookContext& ctx) {
    if (!ctx.payload.is_json() || !ctx.payload.json().is_object()) return HookOutcome::proceed();

    ctx.payload.json()[key_] = ctx.scope.to_json();
    return HookOutcome::changed();
}

} // namespace rulegate
