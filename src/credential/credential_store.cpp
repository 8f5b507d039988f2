#include "credential/credential_store.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>

namespace rulegate {

// ============================================================================
// InMemoryCredentialStore
// ============================================================================

std::optional<StoredCredential> InMemoryCredentialStore::load(const std::string& identity) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(identity);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryCredentialStore::save(const StoredCredential& credential) {
    std::lock_guard lock(mutex_);
    entries_[credential.identity] = credential;
    return true;
}

void InMemoryCredentialStore::remove(const std::string& identity) {
    std::lock_guard lock(mutex_);
    entries_.erase(identity);
}

// ============================================================================
// JsonFileCredentialStore
// ============================================================================

namespace {

nlohmann::json read_document(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nlohmann::json::object();

    auto doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        utils::log::warn(std::format("Credential file {} is not a JSON object, ignoring it", path));
        return nlohmann::json::object();
    }
    return doc;
}

bool write_document(const std::string& path, const nlohmann::json& doc) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) return false;
        file << doc.dump(2) << '\n';
        if (!file.good()) return false;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        utils::log::error(std::format("Failed to replace {}: {}", path, ec.message()));
        return false;
    }
    return true;
}

} // anonymous namespace

JsonFileCredentialStore::JsonFileCredentialStore(std::string path)
    : path_(std::move(path)) {}

std::optional<StoredCredential> JsonFileCredentialStore::load(const std::string& identity) {
    std::lock_guard lock(mutex_);
    const auto doc = read_document(path_);
    const auto it = doc.find(identity);
    if (it == doc.end() || !it->is_object()) return std::nullopt;

    const auto token = it->value("token", std::string{});
    if (token.empty()) return std::nullopt;

    StoredCredential credential;
    credential.identity = identity;
    credential.token = token;
    credential.refreshed_at = std::chrono::system_clock::time_point(
        std::chrono::seconds(it->value("refreshed_at", int64_t{0})));
    return credential;
}

bool JsonFileCredentialStore::save(const StoredCredential& credential) {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_);
    doc[credential.identity] = {
        {"token", credential.token},
        {"refreshed_at", std::chrono::duration_cast<std::chrono::seconds>(
            credential.refreshed_at.time_since_epoch()).count()},
    };
    if (!write_document(path_, doc)) {
        utils::log::error(std::format("Failed to persist token for {} to {}", credential.identity, path_));
        return false;
    }
    return true;
}

void JsonFileCredentialStore::remove(const std::string& identity) {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_);
    if (doc.erase(identity) > 0 && !write_document(path_, doc)) {
        utils::log::error(std::format("Failed to drop token for {} from {}", identity, path_));
    }
}

} // namespace rulegate
