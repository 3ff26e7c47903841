#include "db/memory/memory_audit_repository.hpp"

#include <algorithm>
#include <mutex>

namespace credvault {

int64_t MemoryAuditRepository::append(const AuditEntry& entry) {
    std::unique_lock lock(mutex_);
    AuditEntry stored = entry;
    stored.id = static_cast<int64_t>(entries_.size()) + 1;
    entries_.push_back(std::move(stored));
    return entries_.back().id;
}

std::vector<AuditEntry> MemoryAuditRepository::list(
    std::optional<int64_t> credential_id, size_t limit) {
    std::vector<AuditEntry> result;
    {
        std::shared_lock lock(mutex_);
        for (const auto& entry : entries_) {
            if (credential_id && entry.credential_id != credential_id) continue;
            result.push_back(entry);
        }
    }

    std::sort(result.begin(), result.end(), [](const AuditEntry& a, const AuditEntry& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.id > b.id;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

size_t MemoryAuditRepository::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace credvault
