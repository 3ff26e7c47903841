#pragma once

#include "db/icredential_repository.hpp"

#include <map>
#include <shared_mutex>
#include <unordered_map>

namespace credvault {

/**
 * @brief Process-lifetime credential store
 *
 * Rows are kept in id order; a hash index enforces one row per hash.
 * Readers take a shared lock, writers an exclusive one.
 */
class MemoryCredentialRepository : public ICredentialRepository {
public:
    MemoryCredentialRepository() = default;

    [[nodiscard]] std::optional<Credential> find_by_id(int64_t id) override;
    [[nodiscard]] std::optional<Credential> find_by_hash(const std::string& connection_hash) override;
    [[nodiscard]] std::optional<Credential> find_active_by_hash(const std::string& connection_hash) override;
    [[nodiscard]] Credential insert(const Credential& credential) override;
    [[nodiscard]] bool reactivate(const Credential& credential) override;
    bool touch(int64_t id, Timestamp when) override;
    [[nodiscard]] bool soft_delete(int64_t id, Timestamp when) override;
    [[nodiscard]] std::vector<Credential> list_active(
        const std::optional<std::string>& owner_session) override;

    /// Total rows including soft-deleted ones
    [[nodiscard]] size_t row_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<int64_t, Credential> rows_;
    std::unordered_map<std::string, int64_t> by_hash_;
    int64_t next_id_ = 1;
};

} // namespace credvault
