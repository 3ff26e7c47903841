#include "db/memory/memory_credential_repository.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace credvault {

std::optional<Credential> MemoryCredentialRepository::find_by_id(int64_t id) {
    std::shared_lock lock(mutex_);
    const auto it = rows_.find(id);
    if (it == rows_.end()) return std::nullopt;
    return it->second;
}

std::optional<Credential> MemoryCredentialRepository::find_by_hash(const std::string& connection_hash) {
    std::shared_lock lock(mutex_);
    const auto it = by_hash_.find(connection_hash);
    if (it == by_hash_.end()) return std::nullopt;
    return rows_.at(it->second);
}

std::optional<Credential> MemoryCredentialRepository::find_active_by_hash(
    const std::string& connection_hash) {
    auto row = find_by_hash(connection_hash);
    if (row && !row->is_active) return std::nullopt;
    return row;
}

Credential MemoryCredentialRepository::insert(const Credential& credential) {
    std::unique_lock lock(mutex_);
    if (by_hash_.contains(credential.connection_hash)) {
        throw UniqueViolation(std::format("credential with hash {} already exists",
            credential.connection_hash));
    }

    Credential stored = credential;
    stored.id = next_id_++;
    by_hash_.emplace(stored.connection_hash, stored.id);
    rows_.emplace(stored.id, stored);
    return stored;
}

bool MemoryCredentialRepository::reactivate(const Credential& credential) {
    std::unique_lock lock(mutex_);
    const auto it = rows_.find(credential.id);
    if (it == rows_.end() || it->second.is_active) return false;

    auto& row = it->second;
    row.name = credential.name;
    row.encrypted_secret = credential.encrypted_secret;
    row.encryption_salt = credential.encryption_salt;
    row.owner_session = credential.owner_session;
    row.updated_at = credential.updated_at;
    row.last_used = credential.last_used;
    row.is_active = true;
    return true;
}

bool MemoryCredentialRepository::touch(int64_t id, Timestamp when) {
    std::unique_lock lock(mutex_);
    const auto it = rows_.find(id);
    if (it == rows_.end()) return false;
    it->second.last_used = when;
    return true;
}

bool MemoryCredentialRepository::soft_delete(int64_t id, Timestamp when) {
    std::unique_lock lock(mutex_);
    const auto it = rows_.find(id);
    if (it == rows_.end() || !it->second.is_active) return false;
    it->second.is_active = false;
    it->second.updated_at = when;
    return true;
}

std::vector<Credential> MemoryCredentialRepository::list_active(
    const std::optional<std::string>& owner_session) {
    std::vector<Credential> result;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.is_active && row.visible_to(owner_session)) {
                result.push_back(row);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const Credential& a, const Credential& b) {
        if (a.last_used != b.last_used) return a.last_used > b.last_used;
        return a.id > b.id;
    });
    return result;
}

size_t MemoryCredentialRepository::row_count() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

} // namespace credvault
