#pragma once

#include "core/body.hpp"
#include "core/request_context.hpp"
#include "core/types.hpp"
#include "policy/data_scope.hpp"
#include "routing/rule.hpp"

#include <string>
#include <string_view>

namespace rulegate {

/**
 * @brief What a hook sees of the request being processed
 *
 * payload is the request body for pre-processors and the upstream
 * response body for post-processors. upstream_status is 0 before the
 * upstream was called.
 */
struct HookContext {
    const InboundRequest& request;
    const Rule& rule;
    const CallerIdentity& identity;
    const DataScopePredicate& scope;
    Body& payload;
    int upstream_status = 0;
};

struct HookOutcome {
    enum class Action { PROCEED, ABORT };

    Action action = Action::PROCEED;
    bool modified = false;          // Payload was changed and must be re-serialized
    int status = 0;                 // Abort status (0 = default for the hook kind)
    std::string reason;

    static HookOutcome proceed() { return {}; }
    static HookOutcome changed() { return {Action::PROCEED, true, 0, {}}; }
    static HookOutcome abort(int status, std::string reason) {
        return {Action::ABORT, false, status, std::move(reason)};
    }

    [[nodiscard]] bool aborted() const { return action == Action::ABORT; }
};

/**
 * @brief Runs before the upstream call; may rewrite the body or stop the request
 */
class IPreProcessor {
public:
    virtual ~IPreProcessor() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual HookOutcome process(HookContext& ctx) = 0;
};

/**
 * @brief Runs on a successful upstream response; may rewrite it or fail
 *
 * An aborted outcome turns the response into a 500; the upstream's side
 * effects are not undone.
 */
class IPostProcessor {
public:
    virtual ~IPostProcessor() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual HookOutcome process(HookContext& ctx) = 0;
};

} // namespace rulegate
