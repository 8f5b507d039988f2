#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rulegate {

/**
 * @brief A bearer token together with the moment it was obtained
 */
struct StoredCredential {
    std::string identity;
    std::string token;
    std::chrono::system_clock::time_point refreshed_at;
};

/**
 * @brief Persistence for machine credentials, keyed by login identity
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual std::optional<StoredCredential> load(const std::string& identity) = 0;
    virtual bool save(const StoredCredential& credential) = 0;
    virtual void remove(const std::string& identity) = 0;
};

class InMemoryCredentialStore : public ICredentialStore {
public:
    [[nodiscard]] std::optional<StoredCredential> load(const std::string& identity) override;
    bool save(const StoredCredential& credential) override;
    void remove(const std::string& identity) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, StoredCredential> entries_;
};

/**
 * @brief Tokens kept in a JSON file so a restarted gateway can reuse them
 *
 * File layout: {"<identity>": {"token": "...", "refreshed_at": <unix seconds>}}.
 * Writes go to a temporary file that is renamed over the original.
 */
class JsonFileCredentialStore : public ICredentialStore {
public:
    explicit JsonFileCredentialStore(std::string path);

    [[nodiscard]] std::optional<StoredCredential> load(const std::string& identity) override;
    bool save(const StoredCredential& credential) override;
    void remove(const std::string& identity) override;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace rulegate
