#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace credvault {

/**
 * @brief Persistence collaborator for credential rows
 *
 * Every method is a single atomic write or read: it either fully commits or
 * leaves the store unchanged. Failures are reported by throwing
 * PersistenceError (UniqueViolation for hash conflicts).
 *
 * At most one row exists per connection_hash. Soft-deleted rows keep their
 * slot and are brought back through reactivate().
 */
class ICredentialRepository {
public:
    virtual ~ICredentialRepository() = default;

    /// Lookup by id regardless of activity state
    [[nodiscard]] virtual std::optional<Credential> find_by_id(int64_t id) = 0;

    /// Lookup by hash regardless of activity state
    [[nodiscard]] virtual std::optional<Credential> find_by_hash(const std::string& connection_hash) = 0;

    [[nodiscard]] virtual std::optional<Credential> find_active_by_hash(
        const std::string& connection_hash) = 0;

    /**
     * @brief Insert a new row; the id field of the argument is ignored
     * @return The stored row with its assigned id
     * @throws UniqueViolation if a row with the same hash exists
     */
    [[nodiscard]] virtual Credential insert(const Credential& credential) = 0;

    /**
     * @brief Overwrite name, secret, salt, owner, timestamps and set active
     *
     * Only applies to a row that is currently inactive.
     * @return false if the row does not exist or is already active
     */
    [[nodiscard]] virtual bool reactivate(const Credential& credential) = 0;

    /// Set last_used; returns false if no such row
    virtual bool touch(int64_t id, Timestamp when) = 0;

    /// Set is_active = false and updated_at; returns false unless the row was active
    [[nodiscard]] virtual bool soft_delete(int64_t id, Timestamp when) = 0;

    /**
     * @brief Active rows visible to the session, most recently used first
     *
     * With a session: rows owned by it plus global rows. Without: all active rows.
     */
    [[nodiscard]] virtual std::vector<Credential> list_active(
        const std::optional<std::string>& owner_session) = 0;
};

} // namespace credvault
