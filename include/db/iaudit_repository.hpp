#pragma once

#include "audit/audit_entry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace credvault {

/**
 * @brief Append-only store for audit entries
 *
 * There is intentionally no update or delete.
 */
class IAuditRepository {
public:
    virtual ~IAuditRepository() = default;

    /**
     * @brief Append one entry
     * @return Assigned entry id
     * @throws PersistenceError on store failure
     */
    virtual int64_t append(const AuditEntry& entry) = 0;

    /// Newest first (timestamp desc, id desc), at most `limit` entries
    [[nodiscard]] virtual std::vector<AuditEntry> list(
        std::optional<int64_t> credential_id, size_t limit) = 0;
};

} // namespace credvault
