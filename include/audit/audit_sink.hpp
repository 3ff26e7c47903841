#pragma once

#include "audit/audit_entry.hpp"

#include <string>

namespace credvault {

/**
 * @brief Secondary destination for recorded audit entries
 *
 * The audit repository is the record of truth. Sinks receive every entry
 * after it has been appended there, from whichever thread recorded it,
 * so implementations must be thread-safe.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write a single entry. Returns true on success.
    [[nodiscard]] virtual bool write(const AuditEntry& entry) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/credvault/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace credvault
