#pragma once

#include <memory>

namespace rulegate {

class HookRegistry;
class Pipeline;

/// Process-wide collaborators of the Pipeline. Everything that differs per
/// upstream (forwarder, relay, credentials) travels on the Mount instead.
struct PipelineComponents {
    std::shared_ptr<HookRegistry> hooks;    // required
    bool log_requests = true;               // one INFO line per finished request
};

/**
 * @brief Fluent assembly of a Pipeline
 *
 *   auto pipeline = PipelineBuilder()
 *       .with_hooks(std::make_shared<HookRegistry>(HookRegistry::with_builtins()))
 *       .with_request_logging(false)
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_hooks(std::shared_ptr<HookRegistry> hooks) {
        parts_.hooks = std::move(hooks);
        return *this;
    }

    PipelineBuilder& with_request_logging(bool enabled) {
        parts_.log_requests = enabled;
        return *this;
    }

    /// Throws std::invalid_argument when no hook registry was supplied
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents parts_;
};

} // namespace rulegate
