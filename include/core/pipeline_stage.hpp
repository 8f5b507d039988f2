#pragma once

#include "core/request_context.hpp"
#include <string_view>

namespace rulegate {

/**
 * @brief One access check in the request chain
 *
 * Stages run in a fixed order before anything reaches the upstream. A stage
 * that returns REJECT has already written the failure into the context
 * (status, error category, message); the pipeline stops there.
 */
class IPipelineStage {
public:
    enum class Verdict { PASS, REJECT };

    virtual ~IPipelineStage() = default;

    [[nodiscard]] virtual Verdict process(RequestContext& ctx) = 0;

    /// Short identifier used in debug logs
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rulegate
