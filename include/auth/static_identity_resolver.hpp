#pragma once

#include "auth/iidentity_resolver.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace rulegate {

/**
 * @brief A configured caller and the API key that selects it
 */
struct ApiKeyUser {
    std::string api_key;
    CallerIdentity identity;
};

/**
 * @brief Resolves "Authorization: Bearer <api key>" against a fixed user list
 *
 * The key index is built once at construction; lookups take no locks.
 */
class StaticIdentityResolver : public IIdentityResolver {
public:
    explicit StaticIdentityResolver(const std::vector<ApiKeyUser>& users);

    [[nodiscard]] std::optional<CallerIdentity> resolve(const HeaderMap& headers) const override;
    [[nodiscard]] std::string_view name() const override { return "static_api_key"; }

    [[nodiscard]] std::optional<CallerIdentity> authenticate_api_key(const std::string& api_key) const;

    [[nodiscard]] size_t size() const { return api_key_index_.size(); }

private:
    std::unordered_map<std::string, CallerIdentity> api_key_index_;
};

} // namespace rulegate
