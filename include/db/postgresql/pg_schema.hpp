#pragma once

#include "db/idb_connection.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace credvault {

class ConnectionPool;

namespace pg_schema {

inline constexpr std::string_view kCredentialsTable = "database_credentials";
inline constexpr std::string_view kAuditTable = "credential_audit_log";

/// SQLSTATE unique_violation
inline constexpr std::string_view kUniqueViolation = "23505";

// Idempotent; safe to run at every startup
inline constexpr std::array<std::string_view, 7> kSchemaStatements = {
    R"(CREATE TABLE IF NOT EXISTS database_credentials (
        id BIGSERIAL PRIMARY KEY,
        connection_hash VARCHAR(64) UNIQUE NOT NULL,
        name VARCHAR(255) NOT NULL,
        host VARCHAR(255) NOT NULL,
        port INTEGER NOT NULL,
        database VARCHAR(255) NOT NULL,
        username VARCHAR(255) NOT NULL,
        db_type VARCHAR(50) NOT NULL,
        encrypted_password TEXT NOT NULL,
        encryption_salt VARCHAR(32) NOT NULL,
        created_at TIMESTAMP WITH TIME ZONE DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP WITH TIME ZONE,
        last_used TIMESTAMP WITH TIME ZONE,
        user_session VARCHAR(255),
        is_active BOOLEAN DEFAULT TRUE
    ))",
    R"(CREATE TABLE IF NOT EXISTS credential_audit_log (
        id BIGSERIAL PRIMARY KEY,
        credential_id BIGINT,
        connection_hash VARCHAR(64) NOT NULL,
        operation VARCHAR(50) NOT NULL,
        success BOOLEAN NOT NULL,
        error_message TEXT,
        user_session VARCHAR(255),
        ip_address VARCHAR(45),
        user_agent TEXT,
        timestamp TIMESTAMP WITH TIME ZONE DEFAULT CURRENT_TIMESTAMP,
        metadata_json TEXT
    ))",
    "CREATE INDEX IF NOT EXISTS idx_connection_lookup ON database_credentials(host, port, database, username)",
    "CREATE INDEX IF NOT EXISTS idx_user_credentials ON database_credentials(user_session, is_active)",
    "CREATE INDEX IF NOT EXISTS idx_audit_connection ON credential_audit_log(connection_hash)",
    "CREATE INDEX IF NOT EXISTS idx_audit_credential ON credential_audit_log(credential_id)",
    "CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON credential_audit_log(timestamp)",
};

/// SQL expression turning bigint epoch microseconds ($n) into timestamptz
[[nodiscard]] std::string timestamp_param(int n);

/// SQL expression reading a timestamptz column as bigint epoch microseconds (NULL -> 0)
[[nodiscard]] std::string epoch_micros(std::string_view column);

/**
 * @brief Run one statement on a pooled connection
 * @throws PersistenceError if no connection is available or the statement fails
 * @throws UniqueViolation if the server reports SQLSTATE 23505
 */
DbResultSet run(ConnectionPool& pool, const std::string& sql,
                const std::vector<DbParam>& params = {});

/// Create tables and indexes if absent
/// @throws PersistenceError
void ensure_schema(ConnectionPool& pool);

[[nodiscard]] int64_t parse_int64(const DbCell& cell, std::string_view column);
[[nodiscard]] bool parse_bool(const DbCell& cell);

} // namespace pg_schema
} // namespace credvault
