#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace rulegate {

/**
 * @brief Storage-agnostic filter restricting which records a caller sees
 *
 * ALL is the tautology handed to administrators. NONE matches nothing and is
 * what an empty scope set produces; it never degrades to "no filter".
 * IN_SET is an OR of equality tests of entity.column against the ids.
 */
struct DataScopePredicate {
    enum class Kind { ALL, NONE, IN_SET };

    Kind kind = Kind::NONE;
    std::string entity;
    std::string column;
    std::vector<std::string> ids;

    [[nodiscard]] bool admits(const std::string& id) const;

    /// SQL boolean expression, e.g. "agent.agent_id IN ('a', 'b')"
    [[nodiscard]] std::string to_sql() const;

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace rulegate
