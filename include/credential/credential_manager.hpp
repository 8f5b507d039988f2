#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "credential/credential_store.hpp"
#include "credential/password_encryptor.hpp"
#include "upstream/iupstream_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace rulegate {

enum class CredentialState {
    NO_TOKEN,
    AUTHENTICATING,
    VALID,
    EXPIRED,
    REAUTHENTICATING,
    FAILED
};

const char* credential_state_to_string(CredentialState state);

struct CredentialConfig {
    std::string identity;                       // Login email
    std::string password;                       // Plaintext, usually from ${ENV}
    std::string public_key_pem;
    std::string login_path = "/v1/user/login";
    std::string register_path = "/v1/user/register";
    std::string register_nickname = "service";
    bool register_on_unauthorized = true;
    std::chrono::seconds expiry_window{std::chrono::hours(24)};
    UpstreamTimeouts timeouts{std::chrono::milliseconds(5000),
                              std::chrono::milliseconds(30000),
                              std::chrono::milliseconds(30000)};
};

/**
 * @brief Keeps one machine bearer token for an upstream
 *
 * Tokens are obtained by logging in with an RSA-encrypted password; the
 * token is taken from the response's Authorization header. A 401 from the
 * login endpoint triggers one registration and one more login.
 *
 * Refreshes are single-flight: however many threads find the token
 * missing, expired or invalidated at the same time, exactly one login
 * request is sent and the others wait for its outcome.
 */
class CredentialManager {
public:
    CredentialManager(CredentialConfig config,
                      std::shared_ptr<IUpstreamClient> client,
                      std::shared_ptr<ICredentialStore> store,
                      PasswordEncryptor encryptor);

    /**
     * @brief Cached token if younger than the expiry window, else a fresh one
     * @return Token, or CREDENTIAL_FAILED when login (and registration) failed
     */
    [[nodiscard]] Result<std::string> get_valid_token();

    /**
     * @brief Drop the cached token after the upstream rejected it
     *
     * No-op unless token is still the cached one, so concurrent rejections
     * of the same token cause a single re-login.
     */
    void invalidate(const std::string& token);

    [[nodiscard]] CredentialState state() const;
    [[nodiscard]] const std::string& identity() const { return config_.identity; }

    struct Stats {
        uint64_t logins;
        uint64_t login_failures;
        uint64_t registrations;
        uint64_t invalidations;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            logins_.load(std::memory_order_relaxed),
            login_failures_.load(std::memory_order_relaxed),
            registrations_.load(std::memory_order_relaxed),
            invalidations_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] bool fresh_locked(std::chrono::system_clock::time_point now) const;

    /// Network part of a refresh; runs without the lock held
    [[nodiscard]] Result<std::string> login(bool allow_register);
    [[nodiscard]] Result<UpstreamResponse> post_json(const std::string& path,
                                                     const std::string& body) const;
    [[nodiscard]] bool register_account(const std::string& encrypted_password);

    CredentialConfig config_;
    std::shared_ptr<IUpstreamClient> client_;
    std::shared_ptr<ICredentialStore> store_;
    PasswordEncryptor encryptor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string token_;
    std::chrono::system_clock::time_point refreshed_at_;
    CredentialState state_ = CredentialState::NO_TOKEN;
    bool refreshing_ = false;
    uint64_t generation_ = 0;           // Bumped when a refresh completes
    std::string last_error_;

    std::atomic<uint64_t> logins_{0};
    std::atomic<uint64_t> login_failures_{0};
    std::atomic<uint64_t> registrations_{0};
    std::atomic<uint64_t> invalidations_{0};
};

} // namespace rulegate
