#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace credvault {

/// Bound statement parameter; nullopt binds SQL NULL
using DbParam = std::optional<std::string>;

/// One result cell in text format; nullopt for SQL NULL
using DbCell = std::optional<std::string>;

/**
 * @brief Result set from a statement execution
 *
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;       // five-char SQLSTATE on failure, if the server sent one

    std::vector<std::string> column_names;
    std::vector<std::vector<DbCell>> rows;

    uint64_t affected_rows = 0;
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; thread safety comes from the pool.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one parameterized statement
     * @param sql SQL text with $1..$n placeholders
     * @param params Values bound in text format
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const std::vector<DbParam>& params = {}) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

/**
 * @brief Abstract factory for creating database connections
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace credvault
