#include "db/postgresql/pg_audit_repository.hpp"
#include "core/error.hpp"
#include "core/json_codec.hpp"
#include "core/utils.hpp"
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_schema.hpp"

#include <format>
#include <stdexcept>

namespace credvault {

PgAuditRepository::PgAuditRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
    if (!pool_) {
        throw std::invalid_argument("PgAuditRepository requires a connection pool");
    }
}

int64_t PgAuditRepository::append(const AuditEntry& entry) {
    const auto sql = std::format(
        "INSERT INTO credential_audit_log "
        "(credential_id, connection_hash, operation, success, error_message, "
        "user_session, ip_address, user_agent, timestamp, metadata_json) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, {}, $10) RETURNING id",
        pg_schema::timestamp_param(9));

    DbParam credential_id;
    if (entry.credential_id) {
        credential_id = std::to_string(*entry.credential_id);
    }
    DbParam metadata;
    if (!entry.metadata.empty()) {
        metadata = json_codec::metadata_to_string(entry.metadata);
    }

    const auto result = pg_schema::run(*pool_, sql, {
        credential_id,
        entry.connection_hash,
        std::string(audit_operation_to_string(entry.operation)),
        std::string(entry.success ? "true" : "false"),
        entry.error_message,
        entry.owner_session,
        entry.ip_address,
        entry.user_agent,
        std::to_string(utils::to_epoch_micros(entry.timestamp)),
        metadata,
    });
    if (result.rows.empty()) {
        throw PersistenceError("Audit INSERT did not return an id");
    }
    return pg_schema::parse_int64(result.rows.front()[0], "id");
}

std::vector<AuditEntry> PgAuditRepository::list(std::optional<int64_t> credential_id, size_t limit) {
    std::string sql = std::format(
        "SELECT id, credential_id, connection_hash, operation, success, error_message, "
        "user_session, ip_address, user_agent, {}, metadata_json FROM credential_audit_log",
        pg_schema::epoch_micros("timestamp"));

    std::vector<DbParam> params;
    if (credential_id) {
        sql += " WHERE credential_id = $1";
        params.emplace_back(std::to_string(*credential_id));
    }
    sql += std::format(" ORDER BY timestamp DESC, id DESC LIMIT ${}", params.size() + 1);
    params.emplace_back(std::to_string(limit));

    const auto result = pg_schema::run(*pool_, sql, params);
    std::vector<AuditEntry> entries;
    entries.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        entries.push_back(row_to_entry(row));
    }
    return entries;
}

AuditEntry PgAuditRepository::row_to_entry(const std::vector<DbCell>& row) {
    if (row.size() < 11) {
        throw PersistenceError(std::format("Unexpected audit row width {}", row.size()));
    }

    AuditEntry e;
    e.id = pg_schema::parse_int64(row[0], "id");
    if (row[1]) {
        e.credential_id = pg_schema::parse_int64(row[1], "credential_id");
    }
    e.connection_hash = row[2].value_or("");

    const auto op = parse_audit_operation(row[3].value_or(""));
    if (!op) {
        throw PersistenceError(std::format("Unknown audit operation '{}'", row[3].value_or("")));
    }
    e.operation = *op;
    e.success = pg_schema::parse_bool(row[4]);
    e.error_message = row[5];
    e.owner_session = row[6];
    e.ip_address = row[7];
    e.user_agent = row[8];
    e.timestamp = utils::from_epoch_micros(pg_schema::parse_int64(row[9], "timestamp"));

    if (row[10] && !row[10]->empty()) {
        try {
            e.metadata = json_codec::metadata_from_string(*row[10]);
        } catch (const std::exception& ex) {
            // Rows written by other tools may hold free text
            utils::log::debug(std::format("Audit entry {}: unparsable metadata: {}", e.id, ex.what()));
            e.metadata = {{"raw", *row[10]}};
        }
    }
    return e;
}

} // namespace credvault
