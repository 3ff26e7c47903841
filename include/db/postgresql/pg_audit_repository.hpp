#pragma once

#include "db/iaudit_repository.hpp"
#include "db/idb_connection.hpp"

#include <memory>

namespace credvault {

class ConnectionPool;

/// Append-only audit rows in the credential_audit_log table
class PgAuditRepository : public IAuditRepository {
public:
    explicit PgAuditRepository(std::shared_ptr<ConnectionPool> pool);

    int64_t append(const AuditEntry& entry) override;
    [[nodiscard]] std::vector<AuditEntry> list(
        std::optional<int64_t> credential_id, size_t limit) override;

private:
    static AuditEntry row_to_entry(const std::vector<DbCell>& row);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace credvault
