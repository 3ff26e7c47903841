#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_audit_repository.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_credential_repository.hpp"
#include "db/postgresql/pg_schema.hpp"
#include "security/connection_identity.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>

using namespace credvault;
using namespace std::chrono_literals;

// These tests need a live PostgreSQL server. Point CREDVAULT_TEST_PG_DSN at a
// scratch database, e.g. "host=localhost dbname=credvault_test user=postgres".

namespace {

std::shared_ptr<ConnectionPool> make_pool_or_skip() {
    const char* dsn = std::getenv("CREDVAULT_TEST_PG_DSN");
    if (!dsn || *dsn == '\0') {
        SKIP("CREDVAULT_TEST_PG_DSN not set");
    }
    PoolConfig cfg;
    cfg.connection_string = dsn;
    cfg.min_connections = 1;
    cfg.max_connections = 2;
    auto pool = std::make_shared<ConnectionPool>("pg_test", cfg,
                                                 std::make_shared<PgConnectionFactory>());
    pg_schema::ensure_schema(*pool);
    return pool;
}

/// Fresh identity per run so reruns against the same database do not collide
Credential make_row(const std::string& label, std::optional<std::string> owner = std::nullopt) {
    static const auto run_tag = std::to_string(utils::to_epoch_micros(utils::now()));
    Credential c;
    c.host = std::format("{}-{}.test", label, run_tag);
    c.port = 5432;
    c.database = "app";
    c.username = "tester";
    c.engine_type = "postgresql";
    c.connection_hash = ConnectionIdentity::fingerprint(c.identity());
    c.name = label;
    c.encrypted_secret = "ciphertext";
    c.encryption_salt = std::string(32, 'a');
    c.created_at = utils::from_epoch_micros(utils::to_epoch_micros(utils::now()));
    c.updated_at = c.created_at;
    c.last_used = c.created_at;
    c.owner_session = std::move(owner);
    return c;
}

void remove_rows(ConnectionPool& pool, const std::vector<Credential>& rows) {
    for (const auto& row : rows) {
        (void)pg_schema::run(pool, "DELETE FROM credential_audit_log WHERE connection_hash = $1",
                             {row.connection_hash});
        (void)pg_schema::run(pool, "DELETE FROM database_credentials WHERE connection_hash = $1",
                             {row.connection_hash});
    }
}

} // anonymous namespace

TEST_CASE("PgCredentialRepository: insert and lookups round-trip every column", "[pg][integration]") {
    auto pool = make_pool_or_skip();
    PgCredentialRepository repo(pool);

    const auto row = make_row("roundtrip", "session-1");
    remove_rows(*pool, {row});
    const auto stored = repo.insert(row);
    CHECK(stored.id > 0);

    const auto by_id = repo.find_by_id(stored.id);
    REQUIRE(by_id.has_value());
    CHECK(by_id->connection_hash == row.connection_hash);
    CHECK(by_id->host == row.host);
    CHECK(by_id->port == 5432);
    CHECK(by_id->engine_type == "postgresql");
    CHECK(by_id->encrypted_secret == "ciphertext");
    CHECK(by_id->owner_session == std::optional<std::string>("session-1"));
    CHECK(by_id->created_at == row.created_at);
    CHECK(by_id->last_used == row.last_used);
    CHECK(by_id->is_active);

    CHECK(repo.find_by_hash(row.connection_hash)->id == stored.id);
    CHECK(repo.find_active_by_hash(row.connection_hash)->id == stored.id);

    remove_rows(*pool, {row});
}

TEST_CASE("PgCredentialRepository: duplicate hash maps to UniqueViolation", "[pg][integration]") {
    auto pool = make_pool_or_skip();
    PgCredentialRepository repo(pool);

    const auto row = make_row("unique");
    remove_rows(*pool, {row});
    (void)repo.insert(row);
    CHECK_THROWS_AS(repo.insert(row), UniqueViolation);

    remove_rows(*pool, {row});
}

TEST_CASE("PgCredentialRepository: soft delete, reactivate and touch are guarded", "[pg][integration]") {
    auto pool = make_pool_or_skip();
    PgCredentialRepository repo(pool);

    const auto row = make_row("lifecycle");
    remove_rows(*pool, {row});
    auto stored = repo.insert(row);

    CHECK_FALSE(repo.reactivate(stored));
    CHECK(repo.soft_delete(stored.id, utils::now()));
    CHECK_FALSE(repo.soft_delete(stored.id, utils::now()));
    CHECK_FALSE(repo.find_active_by_hash(row.connection_hash).has_value());

    stored.name = "revived";
    stored.owner_session = "new-owner";
    CHECK(repo.reactivate(stored));
    const auto revived = repo.find_by_id(stored.id);
    REQUIRE(revived.has_value());
    CHECK(revived->is_active);
    CHECK(revived->name == "revived");
    CHECK(revived->owner_session == std::optional<std::string>("new-owner"));

    const auto later = utils::from_epoch_micros(utils::to_epoch_micros(utils::now() + 1h));
    CHECK(repo.touch(stored.id, later));
    CHECK(repo.find_by_id(stored.id)->last_used == later);
    CHECK_FALSE(repo.touch(-1, later));

    remove_rows(*pool, {row});
}

TEST_CASE("PgCredentialRepository: list_active applies session visibility", "[pg][integration]") {
    auto pool = make_pool_or_skip();
    PgCredentialRepository repo(pool);

    const auto global = make_row("list-global");
    const auto mine = make_row("list-mine", "pg-test-alice");
    const auto theirs = make_row("list-theirs", "pg-test-bob");
    remove_rows(*pool, {global, mine, theirs});

    const auto g = repo.insert(global);
    const auto m = repo.insert(mine);
    const auto t = repo.insert(theirs);

    const auto listed = repo.list_active(std::string("pg-test-alice"));
    const auto contains = [&](int64_t id) {
        return std::any_of(listed.begin(), listed.end(),
                           [id](const Credential& c) { return c.id == id; });
    };
    CHECK(contains(g.id));
    CHECK(contains(m.id));
    CHECK_FALSE(contains(t.id));

    remove_rows(*pool, {global, mine, theirs});
}

TEST_CASE("PgAuditRepository: append and list newest first", "[pg][integration]") {
    auto pool = make_pool_or_skip();
    PgCredentialRepository credentials(pool);
    PgAuditRepository audit(pool);

    const auto row = make_row("audit");
    remove_rows(*pool, {row});
    const auto stored = credentials.insert(row);

    const auto base = utils::from_epoch_micros(utils::to_epoch_micros(utils::now()));
    for (int i = 0; i < 3; ++i) {
        AuditEntry entry;
        entry.credential_id = stored.id;
        entry.connection_hash = row.connection_hash;
        entry.operation = i == 0 ? AuditOperation::CREATE : AuditOperation::ACCESS;
        entry.success = true;
        entry.owner_session = "auditor";
        entry.ip_address = "127.0.0.1";
        entry.timestamp = base + std::chrono::seconds(i);
        if (i == 0) entry.metadata = {{"name", "audit"}};
        CHECK(audit.append(entry) > 0);
    }

    const auto entries = audit.list(stored.id, 10);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].timestamp == base + std::chrono::seconds(2));
    CHECK(entries[2].operation == AuditOperation::CREATE);
    CHECK(entries[2].metadata.at("name") == "audit");
    CHECK(entries[2].ip_address == std::optional<std::string>("127.0.0.1"));
    CHECK(entries[0].metadata.empty());

    CHECK(audit.list(stored.id, 1).size() == 1);

    remove_rows(*pool, {row});
}
