#include "routing/rule_registry.hpp"
#include "core/utils.hpp"

#include <format>

namespace rulegate {

Result<size_t> RuleRegistry::add(Rule rule) {
    if (rule.path_pattern.empty()) {
        return Result<size_t>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Rule '{}' has an empty path pattern", rule.name));
    }

    std::regex compiled;
    try {
        compiled = std::regex(rule.path_pattern,
                              std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        return Result<size_t>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Rule '{}' has an invalid pattern '{}': {}",
                        rule.name, rule.path_pattern, e.what()));
    }

    if (rule.method != kMethodWildcard) {
        rule.method = utils::to_upper(rule.method);
    }

    rules_.push_back(CompiledRule{std::move(rule), std::move(compiled)});
    return Result<size_t>::ok(rules_.size() - 1);
}

bool RuleRegistry::method_compatible(const Rule& rule, std::string_view method) {
    return rule.method == kMethodWildcard || utils::iequals(rule.method, method);
}

const Rule* RuleRegistry::match(std::string_view sub_path, std::string_view method) const {
    const Rule* best = nullptr;
    std::ptrdiff_t best_length = 0;

    for (const auto& entry : rules_) {
        if (!method_compatible(entry.rule, method)) continue;

        std::match_results<std::string_view::const_iterator> m;
        if (!std::regex_search(sub_path.begin(), sub_path.end(), m, entry.pattern,
                               std::regex_constants::match_continuous)) {
            continue;
        }

        const auto length = m.length(0);
        // Strictly greater: the first registered rule keeps equal-length ties
        if (length > best_length) {
            best = &entry.rule;
            best_length = length;
        }
    }
    return best;
}

} // namespace rulegate
