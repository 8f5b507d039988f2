#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace rulegate {

/**
 * @brief Interface for turning request headers into a caller identity
 *
 * Resolution logic (sessions, token validation, directory lookups) lives
 * behind this boundary; the gateway only consumes the result.
 */
class IIdentityResolver {
public:
    virtual ~IIdentityResolver() = default;

    /**
     * @brief Resolve the caller of a request
     * @return Identity, or nullopt when the caller is unknown (-> 401)
     */
    [[nodiscard]] virtual std::optional<CallerIdentity> resolve(const HeaderMap& headers) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rulegate
