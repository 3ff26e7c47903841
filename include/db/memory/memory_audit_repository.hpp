#pragma once

#include "db/iaudit_repository.hpp"

#include <shared_mutex>
#include <vector>

namespace credvault {

class MemoryAuditRepository : public IAuditRepository {
public:
    MemoryAuditRepository() = default;

    int64_t append(const AuditEntry& entry) override;
    [[nodiscard]] std::vector<AuditEntry> list(
        std::optional<int64_t> credential_id, size_t limit) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<AuditEntry> entries_;   // append order == id order
};

} // namespace credvault
