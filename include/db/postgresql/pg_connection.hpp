#pragma once

#include "db/idb_connection.hpp"

#include <libpq-fe.h>

#include <string>

namespace credvault {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. Every statement goes through PQexecParams with
 * text-format parameters, so values are never spliced into SQL.
 */
class PgConnection : public IDbConnection {
public:
    /// Takes ownership of conn
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const std::vector<DbParam>& params = {}) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);
    DbResultSet process_error(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief Creates PgConnection instances using PQconnectdb
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace credvault
