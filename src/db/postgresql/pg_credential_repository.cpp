#include "db/postgresql/pg_credential_repository.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_schema.hpp"

#include <format>
#include <stdexcept>

namespace credvault {

namespace {

std::string micros(Timestamp tp) {
    return std::to_string(utils::to_epoch_micros(tp));
}

const std::string& select_columns() {
    static const std::string columns = std::format(
        "id, connection_hash, name, host, port, database, username, db_type, "
        "encrypted_password, encryption_salt, {}, {}, {}, user_session, is_active",
        pg_schema::epoch_micros("created_at"),
        pg_schema::epoch_micros("updated_at"),
        pg_schema::epoch_micros("last_used"));
    return columns;
}

constexpr size_t kColumnCount = 15;

} // anonymous namespace

PgCredentialRepository::PgCredentialRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
    if (!pool_) {
        throw std::invalid_argument("PgCredentialRepository requires a connection pool");
    }
}

Credential PgCredentialRepository::row_to_credential(const std::vector<DbCell>& row) {
    if (row.size() < kColumnCount) {
        throw PersistenceError(std::format("Unexpected credential row width {}", row.size()));
    }

    Credential c;
    c.id = pg_schema::parse_int64(row[0], "id");
    c.connection_hash = row[1].value_or("");
    c.name = row[2].value_or("");
    c.host = row[3].value_or("");
    c.port = static_cast<uint16_t>(pg_schema::parse_int64(row[4], "port"));
    c.database = row[5].value_or("");
    c.username = row[6].value_or("");
    c.engine_type = row[7].value_or("");
    c.encrypted_secret = row[8].value_or("");
    c.encryption_salt = row[9].value_or("");
    c.created_at = utils::from_epoch_micros(pg_schema::parse_int64(row[10], "created_at"));
    c.updated_at = utils::from_epoch_micros(pg_schema::parse_int64(row[11], "updated_at"));
    c.last_used = utils::from_epoch_micros(pg_schema::parse_int64(row[12], "last_used"));
    c.owner_session = row[13];
    c.is_active = pg_schema::parse_bool(row[14]);
    return c;
}

std::optional<Credential> PgCredentialRepository::find_one(const std::string& where,
                                                           const std::vector<DbParam>& params) {
    const auto sql = std::format("SELECT {} FROM database_credentials WHERE {} LIMIT 1",
                                 select_columns(), where);
    const auto result = pg_schema::run(*pool_, sql, params);
    if (result.rows.empty()) {
        return std::nullopt;
    }
    return row_to_credential(result.rows.front());
}

std::optional<Credential> PgCredentialRepository::find_by_id(int64_t id) {
    return find_one("id = $1", {std::to_string(id)});
}

std::optional<Credential> PgCredentialRepository::find_by_hash(const std::string& connection_hash) {
    return find_one("connection_hash = $1", {connection_hash});
}

std::optional<Credential> PgCredentialRepository::find_active_by_hash(
    const std::string& connection_hash) {
    return find_one("connection_hash = $1 AND is_active = TRUE", {connection_hash});
}

Credential PgCredentialRepository::insert(const Credential& credential) {
    const auto sql = std::format(
        "INSERT INTO database_credentials "
        "(connection_hash, name, host, port, database, username, db_type, "
        "encrypted_password, encryption_salt, created_at, updated_at, last_used, "
        "user_session, is_active) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, {}, {}, {}, $13, $14) "
        "RETURNING id",
        pg_schema::timestamp_param(10),
        pg_schema::timestamp_param(11),
        pg_schema::timestamp_param(12));

    const auto result = pg_schema::run(*pool_, sql, {
        credential.connection_hash,
        credential.name,
        credential.host,
        std::to_string(credential.port),
        credential.database,
        credential.username,
        credential.engine_type,
        credential.encrypted_secret,
        credential.encryption_salt,
        micros(credential.created_at),
        micros(credential.updated_at),
        micros(credential.last_used),
        credential.owner_session,
        std::string(credential.is_active ? "true" : "false"),
    });
    if (result.rows.empty()) {
        throw PersistenceError("INSERT did not return an id");
    }

    Credential stored = credential;
    stored.id = pg_schema::parse_int64(result.rows.front()[0], "id");
    return stored;
}

bool PgCredentialRepository::reactivate(const Credential& credential) {
    const auto sql = std::format(
        "UPDATE database_credentials SET name = $2, encrypted_password = $3, "
        "encryption_salt = $4, user_session = $5, updated_at = {}, last_used = {}, "
        "is_active = TRUE WHERE id = $1 AND is_active = FALSE",
        pg_schema::timestamp_param(6),
        pg_schema::timestamp_param(7));

    const auto result = pg_schema::run(*pool_, sql, {
        std::to_string(credential.id),
        credential.name,
        credential.encrypted_secret,
        credential.encryption_salt,
        credential.owner_session,
        micros(credential.updated_at),
        micros(credential.last_used),
    });
    return result.affected_rows == 1;
}

bool PgCredentialRepository::touch(int64_t id, Timestamp when) {
    const auto sql = std::format("UPDATE database_credentials SET last_used = {} WHERE id = $1",
                                 pg_schema::timestamp_param(2));
    const auto result = pg_schema::run(*pool_, sql, {std::to_string(id), micros(when)});
    return result.affected_rows == 1;
}

bool PgCredentialRepository::soft_delete(int64_t id, Timestamp when) {
    const auto sql = std::format(
        "UPDATE database_credentials SET is_active = FALSE, updated_at = {} "
        "WHERE id = $1 AND is_active = TRUE",
        pg_schema::timestamp_param(2));
    const auto result = pg_schema::run(*pool_, sql, {std::to_string(id), micros(when)});
    return result.affected_rows == 1;
}

std::vector<Credential> PgCredentialRepository::list_active(
    const std::optional<std::string>& owner_session) {
    std::string sql = std::format("SELECT {} FROM database_credentials WHERE is_active = TRUE",
                                  select_columns());
    std::vector<DbParam> params;
    if (owner_session) {
        sql += " AND (user_session IS NULL OR user_session = $1)";
        params.emplace_back(*owner_session);
    }
    sql += " ORDER BY last_used DESC NULLS LAST, id DESC";

    const auto result = pg_schema::run(*pool_, sql, params);
    std::vector<Credential> credentials;
    credentials.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        credentials.push_back(row_to_credential(row));
    }
    return credentials;
}

} // namespace credvault
