#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace credvault {

/**
 * @brief JSONL mirror of the audit trail with size-based rotation
 *
 * One JSON object per line. Rotated files are named with numeric
 * suffixes: audit.jsonl.1, audit.jsonl.2, etc. Files beyond max_files
 * are deleted.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "credential_audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(const AuditEntry& entry) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const;
    [[nodiscard]] size_t current_file_size() const;

private:
    void rotate_file();

    Config config_;
    mutable std::mutex mutex_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace credvault
