#pragma once

#include "db/idb_connection.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace credvault {

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::seconds idle_timeout{300};
    uint32_t statement_timeout_ms = 30000;
    std::string health_check_query = "SELECT 1";
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
};

/**
 * @brief RAII wrapper for a pooled connection
 *
 * Returns the connection to its pool on destruction. Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

/**
 * @brief Bounded connection pool
 *
 * - max_connections enforced via counting_semaphore
 * - min_connections opened eagerly, the rest on demand
 * - connections idle longer than idle_timeout are health-checked on acquire
 *   and replaced if the check fails
 * - every new connection gets the configured statement_timeout
 */
class ConnectionPool {
public:
    ConnectionPool(std::string name,
                   const PoolConfig& config,
                   std::shared_ptr<IConnectionFactory> factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// nullptr if the pool is exhausted past the timeout, drained, or a connect fails
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout);
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire();

    [[nodiscard]] PoolStats get_stats() const;

    /// Close idle connections and refuse further acquires
    void drain();

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::unique_ptr<IDbConnection> create_connection();
    void discard(std::unique_ptr<IDbConnection> conn);
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace credvault
