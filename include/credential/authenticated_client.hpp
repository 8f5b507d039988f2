#pragma once

#include "credential/credential_manager.hpp"
#include "upstream/iupstream_client.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace rulegate {

/**
 * @brief HTTP 401, or HTTP 200 whose body is {"code": 401, "message": "...unauthorized..."}
 *
 * Used on plain responses and on the first chunk of a streamed one.
 */
[[nodiscard]] bool is_token_rejected(int status, std::string_view body);

/**
 * @brief IUpstreamClient decorator that authenticates every call
 *
 * Sets the "authorization" header to the manager's current token. When
 * the upstream rejects the token, the token is invalidated, a new one is
 * obtained and the request is sent once more; the second response is
 * returned whatever it is.
 */
class AuthenticatedUpstreamClient : public IUpstreamClient {
public:
    AuthenticatedUpstreamClient(std::shared_ptr<IUpstreamClient> inner,
                                std::shared_ptr<CredentialManager> credentials);

    [[nodiscard]] Result<UpstreamResponse> send(const UpstreamRequest& request) override;

    [[nodiscard]] uint64_t retries() const { return retries_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<IUpstreamClient> inner_;
    std::shared_ptr<CredentialManager> credentials_;
    std::atomic<uint64_t> retries_{0};
};

} // namespace rulegate
