#pragma once

#include "core/pipeline_stage.hpp"

namespace rulegate {

class HookRegistry;

// Access chain, in execution order. Each stage either passes the request on
// or rejects it with the failure recorded in the context.

/// Selects the rule; unmapped requests are forbidden, never "not found"
class RuleMatchStage final : public IPipelineStage {
public:
    [[nodiscard]] Verdict process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "rule_match"; }
};

class RoleCheckStage final : public IPipelineStage {
public:
    [[nodiscard]] Verdict process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "role_check"; }
};

class PermissionCheckStage final : public IPipelineStage {
public:
    [[nodiscard]] Verdict process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "permission_check"; }
};

/// Computes the caller's data scope for the mount; always passes
class DataScopeStage final : public IPipelineStage {
public:
    [[nodiscard]] Verdict process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "data_scope"; }
};

/// Runs the rule's pre-processors in order; the first abort stops the request
class PreProcessorStage final : public IPipelineStage {
public:
    explicit PreProcessorStage(const HookRegistry& hooks) : hooks_(hooks) {}

    [[nodiscard]] Verdict process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "pre_processors"; }

private:
    const HookRegistry& hooks_;
};

} // namespace rulegate
