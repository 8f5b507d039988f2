#pragma once

#include "core/error.hpp"
#include "hooks/hook.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace rulegate {

/// Flat key/value options of a configured hook instance
using HookOptions = std::map<std::string, std::string>;

/**
 * @brief Named pre/post processors, filled at startup and read-only afterwards
 *
 * Rules refer to hooks by name; resolving a name that was never
 * registered is a configuration error.
 */
class HookRegistry {
public:
    /// Registry holding one default-configured instance of every built-in
    [[nodiscard]] static HookRegistry with_builtins();

    /**
     * @brief Create a built-in hook of the given type under a custom name
     * @return CONFIG_ERROR for an unknown type, invalid options or a
     *         name already taken
     */
    [[nodiscard]] Result<bool> add_builtin(const std::string& name,
                                           const std::string& type,
                                           const HookOptions& options);

    bool add_pre(std::string name, std::shared_ptr<IPreProcessor> hook);
    bool add_post(std::string name, std::shared_ptr<IPostProcessor> hook);

    [[nodiscard]] std::shared_ptr<IPreProcessor> find_pre(const std::string& name) const;
    [[nodiscard]] std::shared_ptr<IPostProcessor> find_post(const std::string& name) const;

    /// Resolve an ordered list of names, failing on the first unknown one
    [[nodiscard]] Result<std::vector<std::shared_ptr<IPreProcessor>>> resolve_pre(
        const std::vector<std::string>& names) const;
    [[nodiscard]] Result<std::vector<std::shared_ptr<IPostProcessor>>> resolve_post(
        const std::vector<std::string>& names) const;

    [[nodiscard]] size_t size() const { return pre_.size() + post_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<IPreProcessor>> pre_;
    std::unordered_map<std::string, std::shared_ptr<IPostProcessor>> post_;
};

} // namespace rulegate
