#include "credential/credential_manager.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace rulegate {

const char* credential_state_to_string(CredentialState state) {
    switch (state) {
        case CredentialState::NO_TOKEN:         return "no_token";
        case CredentialState::AUTHENTICATING:   return "authenticating";
        case CredentialState::VALID:            return "valid";
        case CredentialState::EXPIRED:          return "expired";
        case CredentialState::REAUTHENTICATING: return "reauthenticating";
        case CredentialState::FAILED:           return "failed";
    }
    return "unknown";
}

CredentialManager::CredentialManager(CredentialConfig config,
                                     std::shared_ptr<IUpstreamClient> client,
                                     std::shared_ptr<ICredentialStore> store,
                                     PasswordEncryptor encryptor)
    : config_(std::move(config)),
      client_(std::move(client)),
      store_(std::move(store)),
      encryptor_(std::move(encryptor)) {
    if (!store_) return;

    // Reuse a token persisted by a previous run
    if (auto stored = store_->load(config_.identity)) {
        token_ = std::move(stored->token);
        refreshed_at_ = stored->refreshed_at;
        state_ = fresh_locked(std::chrono::system_clock::now())
            ? CredentialState::VALID : CredentialState::EXPIRED;
        utils::log::info(std::format("Loaded stored token for {} ({})",
            config_.identity, credential_state_to_string(state_)));
    }
}

bool CredentialManager::fresh_locked(std::chrono::system_clock::time_point now) const {
    return !token_.empty() && now - refreshed_at_ < config_.expiry_window;
}

CredentialState CredentialManager::state() const {
    std::lock_guard lock(mutex_);
    if (state_ == CredentialState::VALID && !fresh_locked(std::chrono::system_clock::now())) {
        return CredentialState::EXPIRED;
    }
    return state_;
}

// ============================================================================
// Token lifecycle
// ============================================================================

Result<std::string> CredentialManager::get_valid_token() {
    std::unique_lock lock(mutex_);

    if (fresh_locked(std::chrono::system_clock::now())) {
        return Result<std::string>::ok(token_);
    }

    if (refreshing_) {
        // Someone else is logging in: wait for that attempt and share its outcome
        const uint64_t observed = generation_;
        cv_.wait(lock, [this, observed] { return generation_ != observed; });
        if (fresh_locked(std::chrono::system_clock::now())) {
            return Result<std::string>::ok(token_);
        }
        return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED,
            last_error_.empty() ? "Token invalidated during refresh" : last_error_);
    }

    refreshing_ = true;
    state_ = (state_ == CredentialState::NO_TOKEN || state_ == CredentialState::FAILED)
        ? CredentialState::AUTHENTICATING
        : CredentialState::REAUTHENTICATING;
    lock.unlock();

    auto result = login(config_.register_on_unauthorized);
    const auto now = std::chrono::system_clock::now();

    if (result.is_ok() && store_ && !store_->save({config_.identity, result.value(), now})) {
        utils::log::warn(std::format("Token for {} is kept in memory only", config_.identity));
    }

    lock.lock();
    refreshing_ = false;
    ++generation_;
    if (result.is_ok()) {
        token_ = result.value();
        refreshed_at_ = now;
        state_ = CredentialState::VALID;
        last_error_.clear();
    } else {
        token_.clear();
        state_ = CredentialState::FAILED;
        last_error_ = result.error_message();
    }
    lock.unlock();
    cv_.notify_all();
    return result;
}

void CredentialManager::invalidate(const std::string& token) {
    {
        std::lock_guard lock(mutex_);
        if (token.empty() || token != token_) return;
        token_.clear();
        state_ = CredentialState::EXPIRED;
    }
    invalidations_.fetch_add(1, std::memory_order_relaxed);
    if (store_) store_->remove(config_.identity);
    utils::log::info(std::format("Upstream rejected the token for {}, dropping it", config_.identity));
}

// ============================================================================
// Login / registration
// ============================================================================

Result<UpstreamResponse> CredentialManager::post_json(const std::string& path,
                                                      const std::string& body) const {
    UpstreamRequest request;
    request.method = "POST";
    request.path = path;
    request.body = body;
    request.content_type = http::kJsonContentType;
    request.timeouts = config_.timeouts;
    return client_->send(request);
}

bool CredentialManager::register_account(const std::string& encrypted_password) {
    registrations_.fetch_add(1, std::memory_order_relaxed);

    const nlohmann::json payload = {
        {"nickname", config_.register_nickname},
        {"email", config_.identity},
        {"password", encrypted_password},
    };
    const auto res = post_json(config_.register_path, payload.dump());
    if (res.is_error()) {
        utils::log::error(std::format("Registration of {} failed: {}",
            config_.identity, res.error_message()));
        return false;
    }
    if (res.value().status != 200) {
        utils::log::error(std::format("Registration of {} rejected: {} {}",
            config_.identity, res.value().status, res.value().body));
        return false;
    }
    utils::log::info(std::format("Registered upstream account {}", config_.identity));
    return true;
}

Result<std::string> CredentialManager::login(bool allow_register) {
    const auto encrypted = encryptor_.encrypt(config_.password);
    if (encrypted.is_error()) {
        login_failures_.fetch_add(1, std::memory_order_relaxed);
        return encrypted;
    }

    logins_.fetch_add(1, std::memory_order_relaxed);
    const nlohmann::json payload = {
        {"email", config_.identity},
        {"password", encrypted.value()},
    };
    const auto res = post_json(config_.login_path, payload.dump());
    if (res.is_error()) {
        login_failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED,
            std::format("Login request for {} failed: {}", config_.identity, res.error_message()));
    }

    const auto& response = res.value();
    if (response.status == 200) {
        std::string token = header_value(response.headers, "authorization");
        if (!token.empty()) {
            utils::log::info(std::format("Logged in to upstream as {}", config_.identity));
            return Result<std::string>::ok(std::move(token));
        }
        login_failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED,
            std::format("Login for {} succeeded without an Authorization header", config_.identity));
    }

    login_failures_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Login for {} failed: {} {}",
        config_.identity, response.status, response.body));

    if (response.status == 401 && allow_register && register_account(encrypted.value())) {
        return login(false);
    }
    return Result<std::string>::error(ErrorCategory::CREDENTIAL_FAILED,
        std::format("Login for {} failed with status {}", config_.identity, response.status));
}

} // namespace rulegate
