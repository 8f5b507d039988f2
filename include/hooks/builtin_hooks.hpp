#pragma once

#include "hooks/hook.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rulegate {

// ============================================================================
// scope_filter (post)
// ============================================================================

/**
 * @brief Drops list elements the caller is not scoped to
 *
 * The list is located with a JSON pointer (default "/data"); an element
 * survives when its id field (default "id") is admitted by the caller's
 * data scope. Administrators see everything. Payloads without such a list
 * pass through unchanged.
 */
class ScopeFilterPostProcessor : public IPostProcessor {
public:
    static constexpr const char* kType = "scope_filter";

    ScopeFilterPostProcessor(std::string name, std::string list_pointer, std::string id_field);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] HookOutcome process(HookContext& ctx) override;

private:
    std::string name_;
    nlohmann::json::json_pointer list_pointer_;
    std::string id_field_;
};

// ============================================================================
// require_scoped_id (pre)
// ============================================================================

/**
 * @brief Rejects requests naming a resource outside the caller's scope
 *
 * Looks at one field of a JSON object body (default "assistant_id").
 * Bodies without the field are let through.
 */
class RequireScopedIdPreProcessor : public IPreProcessor {
public:
    static constexpr const char* kType = "require_scoped_id";

    RequireScopedIdPreProcessor(std::string name, std::string field, int status);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] HookOutcome process(HookContext& ctx) override;

private:
    std::string name_;
    std::string field_;
    int status_;
};

// ============================================================================
// attach_data_scope (pre)
// ============================================================================

/// Adds the rendered data-scope predicate to a JSON object body under key
class AttachDataScopePreProcessor : public IPreProcessor {
public:
    static constexpr const char* kType = "attach_data_scope";

    AttachDataScopePreProcessor(std::string name, std::string key);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] HookOutcome process(HookContext& ctx) override;

private:
    std::string name_;
    std::string key_;
};

/// Id of a JSON element as a string: strings verbatim, numbers dumped
[[nodiscard]] std::string json_id_to_string(const nlohmann::json& value);

} // namespace rulegate
