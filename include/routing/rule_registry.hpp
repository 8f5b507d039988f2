#pragma once

#include "core/error.hpp"
#include "routing/rule.hpp"

#include <regex>
#include <string_view>
#include <vector>

namespace rulegate {

/**
 * @brief Ordered rule table with longest-prefix regex matching
 *
 * Rules are compiled once when added and never change afterwards, so
 * match() takes no locks. A rule matches when its method is compatible
 * and its pattern matches a non-empty prefix of the sub-path. Among
 * matches the longest matched prefix wins; equal lengths resolve to the
 * rule registered first.
 */
class RuleRegistry {
public:
    RuleRegistry() = default;

    /**
     * @brief Compile and append a rule
     * @return Index of the rule, or CONFIG_ERROR for an invalid pattern
     */
    [[nodiscard]] Result<size_t> add(Rule rule);

    /**
     * @brief Select the rule for a request
     * @param sub_path Path relative to the mount prefix, starting with '/'
     * @param method Request verb (any case)
     * @return Matched rule, or nullptr when nothing is mapped
     */
    [[nodiscard]] const Rule* match(std::string_view sub_path, std::string_view method) const;

    [[nodiscard]] size_t size() const { return rules_.size(); }
    [[nodiscard]] const Rule& at(size_t index) const { return rules_.at(index).rule; }

private:
    struct CompiledRule {
        Rule rule;
        std::regex pattern;
    };

    static bool method_compatible(const Rule& rule, std::string_view method);

    std::vector<CompiledRule> rules_;
};

} // namespace rulegate
