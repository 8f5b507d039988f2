#include "auth/static_identity_resolver.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <format>

namespace rulegate {

StaticIdentityResolver::StaticIdentityResolver(const std::vector<ApiKeyUser>& users) {
    api_key_index_.reserve(users.size());
    for (const auto& user : users) {
        if (user.api_key.empty()) continue;
        if (!api_key_index_.emplace(user.api_key, user.identity).second) {
            utils::log::warn(std::format("Duplicate API key for user {}, keeping the first one",
                user.identity.user_name));
        }
    }
}

std::optional<CallerIdentity> StaticIdentityResolver::authenticate_api_key(
    const std::string& api_key) const {
    const auto it = api_key_index_.find(api_key);
    if (it == api_key_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<CallerIdentity> StaticIdentityResolver::resolve(const HeaderMap& headers) const {
    const std::string auth_header = header_value(headers, http::kAuthorizationHeader);
    if (!auth_header.starts_with(http::kBearerPrefix)) return std::nullopt;

    const std::string api_key = utils::trim(
        std::string_view(auth_header).substr(http::kBearerPrefix.size()));
    if (api_key.empty()) return std::nullopt;
    return authenticate_api_key(api_key);
}

} // namespace rulegate
