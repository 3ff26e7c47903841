#pragma once

#include "core/engine_type.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credvault {

// ============================================================================
// Configuration Types
// ============================================================================

struct MasterKeyConfig {
    std::string provider = "env";                       // "env" | "file"
    std::string env_var = "CREDENTIAL_MASTER_KEY";
    std::string file;                                   // key file for provider = "file"
    bool generate_if_missing = false;
};

struct VaultSettings {
    uint32_t kdf_iterations = 100000;
    std::string delete_scope = "any";                   // "any" | "owner"
    std::vector<std::string> allowed_engines = default_allowed_engines();
    bool single_active_connection = true;
    size_t lock_stripes = 64;
    MasterKeyConfig master_key;
};

struct StorageConfig {
    std::string backend = "memory";                     // "memory" | "postgresql"
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds statement_timeout{30000};
    std::chrono::seconds idle_timeout{300};
    bool create_schema = true;
};

struct AuditFileConfig {
    bool enabled = false;
    std::string output_file = "credential_audit.jsonl";
    size_t max_file_size_mb = 100;
    int max_files = 10;
};

struct AuditSettings {
    size_t default_list_limit = 100;
    size_t max_list_limit = 1000;
    AuditFileConfig file;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// VaultConfig - Complete parsed configuration
// ============================================================================

struct VaultConfig {
    VaultSettings vault;
    StorageConfig storage;
    AuditSettings audit;
    LoggingConfig logging;
};

/// "any" -> ANY_SESSION, "owner" -> OWNER_ONLY
[[nodiscard]] inline std::optional<DeleteScope> parse_delete_scope(std::string_view s) {
    if (s == "any") return DeleteScope::ANY_SESSION;
    if (s == "owner") return DeleteScope::OWNER_ONLY;
    return std::nullopt;
}

} // namespace credvault
