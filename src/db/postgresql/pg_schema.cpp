#include "db/postgresql/pg_schema.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_pool.hpp"

#include <format>

namespace credvault::pg_schema {

std::string timestamp_param(int n) {
    return std::format("(TIMESTAMPTZ 'epoch' + ${}::bigint * INTERVAL '1 microsecond')", n);
}

std::string epoch_micros(std::string_view column) {
    return std::format("COALESCE((EXTRACT(EPOCH FROM {})::NUMERIC * 1000000)::BIGINT, 0)", column);
}

DbResultSet run(ConnectionPool& pool, const std::string& sql, const std::vector<DbParam>& params) {
    auto conn = pool.acquire();
    if (!conn) {
        throw PersistenceError(std::format("No database connection available from pool '{}'",
                                           pool.name()));
    }

    auto result = (*conn)->execute(sql, params);
    if (!result.success) {
        const std::string message = utils::trim(result.error_message);
        if (result.sqlstate == kUniqueViolation) {
            throw UniqueViolation(message);
        }
        throw PersistenceError(message.empty() ? "statement failed" : message);
    }
    return result;
}

void ensure_schema(ConnectionPool& pool) {
    for (const auto statement : kSchemaStatements) {
        (void)run(pool, std::string(statement));
    }
    utils::log::info(std::format("PostgreSQL schema ready ({}, {})", kCredentialsTable, kAuditTable));
}

int64_t parse_int64(const DbCell& cell, std::string_view column) {
    if (!cell) return 0;
    const auto value = utils::try_parse_int<int64_t>(*cell);
    if (!value) {
        throw PersistenceError(std::format("Malformed integer in column {}: '{}'", column, *cell));
    }
    return *value;
}

bool parse_bool(const DbCell& cell) {
    return cell && (*cell == "t" || *cell == "true");
}

} // namespace credvault::pg_schema
