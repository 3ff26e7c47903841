#pragma once

#include "audit/audit_entry.hpp"
#include "audit/audit_sink.hpp"
#include "db/iaudit_repository.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace credvault {

/**
 * @brief Append-only record of every vault operation
 *
 * record() writes to the audit repository, then mirrors the entry to any
 * attached sinks. It never throws: a failed write is logged and counted
 * in Stats, and the operation that produced the entry is unaffected.
 */
class AuditLog {
public:
    struct Config {
        size_t default_list_limit = 100;
        size_t max_list_limit = 1000;
    };

    AuditLog(std::shared_ptr<IAuditRepository> repository, const Config& config);
    explicit AuditLog(std::shared_ptr<IAuditRepository> repository);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    /// Attach a mirror sink. Not thread-safe; call during setup only.
    void add_sink(std::unique_ptr<IAuditSink> sink);

    /// Append one entry. A zero timestamp is replaced with now().
    void record(AuditEntry entry) noexcept;

    /**
     * @brief Newest-first snapshot, optionally filtered by credential
     *
     * A missing limit uses default_list_limit; larger limits are clamped
     * to max_list_limit.
     * @throws PersistenceError on store failure
     */
    [[nodiscard]] std::vector<AuditEntry> list(
        std::optional<int64_t> credential_id = std::nullopt,
        std::optional<size_t> limit = std::nullopt) const;

    [[nodiscard]] size_t effective_limit(std::optional<size_t> requested) const;

    void flush();
    void shutdown();

    struct Stats {
        uint64_t total_recorded;        ///< Entries appended to the repository
        uint64_t write_failures;        ///< Repository appends that failed
        uint64_t sink_write_failures;   ///< Failed mirror writes
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    std::shared_ptr<IAuditRepository> repository_;
    Config config_;
    std::vector<std::unique_ptr<IAuditSink>> sinks_;

    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> write_failures_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
};

} // namespace credvault
