#include <catch2/catch_test_macros.hpp>
#include "db/connection_pool.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace credvault;
using namespace std::chrono_literals;

namespace {

class MockConnection : public IDbConnection {
public:
    explicit MockConnection(std::atomic<int>& closed) : closed_(closed) {}

    DbResultSet execute(const std::string&, const std::vector<DbParam>&) override {
        DbResultSet result;
        result.success = true;
        return result;
    }
    bool is_healthy(const std::string&) override { return healthy; }
    bool is_connected() const override { return connected; }
    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_set = timeout_ms;
        return true;
    }
    void close() override {
        if (connected) closed_.fetch_add(1);
        connected = false;
    }

    bool healthy = true;
    bool connected = true;
    uint32_t timeout_set = 0;

private:
    std::atomic<int>& closed_;
};

class MockFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string&) override {
        if (!should_succeed) return nullptr;
        created.fetch_add(1);
        return std::make_unique<MockConnection>(closed);
    }

    bool should_succeed = true;
    std::atomic<int> created{0};
    std::atomic<int> closed{0};
};

PoolConfig make_config(size_t min, size_t max) {
    PoolConfig cfg;
    cfg.connection_string = "mock://";
    cfg.min_connections = min;
    cfg.max_connections = max;
    cfg.acquire_timeout = 50ms;
    return cfg;
}

} // anonymous namespace

TEST_CASE("ConnectionPool: warms min_connections at construction", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    ConnectionPool pool("test", make_config(2, 4), factory);

    const auto stats = pool.get_stats();
    CHECK(factory->created.load() == 2);
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(stats.active_connections == 0);
}

TEST_CASE("ConnectionPool: acquire reuses returned connections", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    ConnectionPool pool("test", make_config(1, 4), factory);

    IDbConnection* first = nullptr;
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        first = conn->get();
        CHECK(pool.get_stats().active_connections == 1);
    }
    auto again = pool.acquire();
    REQUIRE(again != nullptr);
    CHECK(again->get() == first);
    CHECK(factory->created.load() == 1);

    const auto stats = pool.get_stats();
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 1);
}

TEST_CASE("ConnectionPool: new connections get the statement timeout", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    auto cfg = make_config(0, 1);
    cfg.statement_timeout_ms = 1234;
    ConnectionPool pool("test", cfg, factory);

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(static_cast<MockConnection*>(conn->get())->timeout_set == 1234);
}

TEST_CASE("ConnectionPool: exhausted pool times out", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    ConnectionPool pool("test", make_config(0, 1), factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    const auto start = std::chrono::steady_clock::now();
    auto second = pool.acquire(20ms);
    CHECK(second == nullptr);
    CHECK(std::chrono::steady_clock::now() - start >= 15ms);
    CHECK(pool.get_stats().failed_acquires == 1);
}

TEST_CASE("ConnectionPool: waiter is served when a connection is returned", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    ConnectionPool pool("test", make_config(0, 1), factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        auto conn = pool.acquire(2000ms);
        got = (conn != nullptr);
    });

    std::this_thread::sleep_for(20ms);
    held.reset();
    waiter.join();
    CHECK(got.load());
}

TEST_CASE("ConnectionPool: factory failure releases the slot", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    factory->should_succeed = false;
    ConnectionPool pool("test", make_config(0, 1), factory);

    CHECK(pool.acquire() == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    factory->should_succeed = true;
    CHECK(pool.acquire() != nullptr);
}

TEST_CASE("ConnectionPool: stale unhealthy idle connection is replaced", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    auto cfg = make_config(0, 2);
    cfg.idle_timeout = std::chrono::seconds(0);
    ConnectionPool pool("test", cfg, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        static_cast<MockConnection*>(conn->get())->healthy = false;
    }
    std::this_thread::sleep_for(5ms);

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(factory->created.load() == 2);
    CHECK(factory->closed.load() == 1);
    CHECK(pool.get_stats().health_check_failures == 1);
}

TEST_CASE("ConnectionPool: disconnected connection is not returned to idle", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    ConnectionPool pool("test", make_config(0, 2), factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        conn->get()->close();
    }
    const auto stats = pool.get_stats();
    CHECK(stats.idle_connections == 0);
    CHECK(stats.total_connections == 0);
}

TEST_CASE("ConnectionPool: drain closes idle connections and refuses acquires", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    ConnectionPool pool("test", make_config(2, 4), factory);

    pool.drain();
    CHECK(factory->closed.load() == 2);
    CHECK(pool.get_stats().total_connections == 0);
    CHECK(pool.acquire() == nullptr);
}
