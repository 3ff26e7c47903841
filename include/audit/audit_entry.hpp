#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace credvault {

enum class AuditOperation {
    CREATE,
    UPDATE,
    DUPLICATE_CHECK,
    ACCESS,
    DECRYPT,
    DELETE
};

[[nodiscard]] inline const char* audit_operation_to_string(AuditOperation op) {
    switch (op) {
        case AuditOperation::CREATE:          return "create";
        case AuditOperation::UPDATE:          return "update";
        case AuditOperation::DUPLICATE_CHECK: return "duplicate_check";
        case AuditOperation::ACCESS:          return "access";
        case AuditOperation::DECRYPT:         return "decrypt";
        case AuditOperation::DELETE:          return "delete";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<AuditOperation> parse_audit_operation(std::string_view s) {
    if (s == "create")          return AuditOperation::CREATE;
    if (s == "update")          return AuditOperation::UPDATE;
    if (s == "duplicate_check") return AuditOperation::DUPLICATE_CHECK;
    if (s == "access")          return AuditOperation::ACCESS;
    if (s == "decrypt")         return AuditOperation::DECRYPT;
    if (s == "delete")          return AuditOperation::DELETE;
    return std::nullopt;
}

// ============================================================================
// Audit Entry (append-only; never mutated once recorded)
// ============================================================================

struct AuditEntry {
    int64_t id = 0;                             // assigned by the audit store
    std::optional<int64_t> credential_id;       // absent if creation failed
    std::string connection_hash;                // empty when unknown
    AuditOperation operation = AuditOperation::ACCESS;
    bool success = false;
    std::optional<std::string> error_message;

    // Request context
    std::optional<std::string> owner_session;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;

    Timestamp timestamp{};

    // Opaque key-value bag; empty means "no metadata"
    std::map<std::string, std::string> metadata;
};

} // namespace credvault
