#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/memory/memory_audit_repository.hpp"
#include "db/memory/memory_credential_repository.hpp"

#include <chrono>

using namespace credvault;
using namespace std::chrono_literals;

namespace {

Credential make_row(const std::string& hash, std::optional<std::string> owner = std::nullopt) {
    Credential c;
    c.connection_hash = hash;
    c.name = "row-" + hash;
    c.host = "localhost";
    c.port = 5432;
    c.database = "db";
    c.username = "user";
    c.engine_type = "postgresql";
    c.encrypted_secret = "ct";
    c.encryption_salt = std::string(32, '0');
    c.created_at = utils::now();
    c.updated_at = c.created_at;
    c.last_used = c.created_at;
    c.owner_session = std::move(owner);
    return c;
}

} // anonymous namespace

// ============================================================================
// MemoryCredentialRepository
// ============================================================================

TEST_CASE("MemoryCredentialRepository: insert assigns increasing ids", "[memory][credentials]") {
    MemoryCredentialRepository repo;
    const auto a = repo.insert(make_row("h1"));
    const auto b = repo.insert(make_row("h2"));

    CHECK(a.id == 1);
    CHECK(b.id == 2);
    CHECK(repo.find_by_id(1)->connection_hash == "h1");
    CHECK(repo.find_by_hash("h2")->id == 2);
    CHECK_FALSE(repo.find_by_id(3).has_value());
}

TEST_CASE("MemoryCredentialRepository: duplicate hash raises UniqueViolation", "[memory][credentials]") {
    MemoryCredentialRepository repo;
    (void)repo.insert(make_row("dup"));
    CHECK_THROWS_AS(repo.insert(make_row("dup")), UniqueViolation);
    CHECK(repo.row_count() == 1);
}

TEST_CASE("MemoryCredentialRepository: soft delete keeps the row", "[memory][credentials]") {
    MemoryCredentialRepository repo;
    const auto row = repo.insert(make_row("h"));

    CHECK(repo.soft_delete(row.id, utils::now()));
    CHECK_FALSE(repo.soft_delete(row.id, utils::now()));
    CHECK_FALSE(repo.find_active_by_hash("h").has_value());
    REQUIRE(repo.find_by_hash("h").has_value());
    CHECK_FALSE(repo.find_by_hash("h")->is_active);
    CHECK(repo.row_count() == 1);

    // The hash slot stays taken while inactive
    CHECK_THROWS_AS(repo.insert(make_row("h")), UniqueViolation);
}

TEST_CASE("MemoryCredentialRepository: reactivate only applies to inactive rows", "[memory][credentials]") {
    MemoryCredentialRepository repo;
    auto row = repo.insert(make_row("h", "old-session"));

    row.name = "renamed";
    row.encrypted_secret = "new-ct";
    row.owner_session = "new-session";
    CHECK_FALSE(repo.reactivate(row));

    REQUIRE(repo.soft_delete(row.id, utils::now()));
    CHECK(repo.reactivate(row));

    const auto stored = repo.find_by_id(row.id);
    REQUIRE(stored.has_value());
    CHECK(stored->is_active);
    CHECK(stored->name == "renamed");
    CHECK(stored->encrypted_secret == "new-ct");
    CHECK(stored->owner_session == std::optional<std::string>("new-session"));

    Credential ghost = row;
    ghost.id = 999;
    CHECK_FALSE(repo.reactivate(ghost));
}

TEST_CASE("MemoryCredentialRepository: touch updates last_used", "[memory][credentials]") {
    MemoryCredentialRepository repo;
    const auto row = repo.insert(make_row("h"));
    const auto later = row.last_used + 5s;

    CHECK(repo.touch(row.id, later));
    CHECK(repo.find_by_id(row.id)->last_used == later);
    CHECK_FALSE(repo.touch(12345, later));
}

TEST_CASE("MemoryCredentialRepository: list_active filters by session and orders by last_used",
          "[memory][credentials]") {
    MemoryCredentialRepository repo;
    const auto base = utils::now();

    auto global = make_row("global");
    global.last_used = base;
    auto mine = make_row("mine", "alice");
    mine.last_used = base + 10s;
    auto theirs = make_row("theirs", "bob");
    theirs.last_used = base + 20s;
    auto deleted = make_row("deleted", "alice");
    deleted.last_used = base + 30s;

    const auto g = repo.insert(global);
    const auto m = repo.insert(mine);
    const auto t = repo.insert(theirs);
    const auto d = repo.insert(deleted);
    REQUIRE(repo.soft_delete(d.id, utils::now()));

    const auto alice = repo.list_active(std::string("alice"));
    REQUIRE(alice.size() == 2);
    CHECK(alice[0].id == m.id);
    CHECK(alice[1].id == g.id);

    const auto everyone = repo.list_active(std::nullopt);
    REQUIRE(everyone.size() == 3);
    CHECK(everyone[0].id == t.id);
    CHECK(everyone[1].id == m.id);
    CHECK(everyone[2].id == g.id);
}

TEST_CASE("MemoryCredentialRepository: equal last_used breaks ties by id", "[memory][credentials]") {
    MemoryCredentialRepository repo;
    const auto when = utils::now();
    auto a = make_row("a");
    auto b = make_row("b");
    a.last_used = when;
    b.last_used = when;
    (void)repo.insert(a);
    (void)repo.insert(b);

    const auto rows = repo.list_active(std::nullopt);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].connection_hash == "b");
    CHECK(rows[1].connection_hash == "a");
}

// ============================================================================
// MemoryAuditRepository
// ============================================================================

TEST_CASE("MemoryAuditRepository: append assigns ids and list is newest first", "[memory][audit]") {
    MemoryAuditRepository repo;
    const auto base = utils::now();

    for (int i = 0; i < 5; ++i) {
        AuditEntry entry;
        entry.credential_id = (i % 2 == 0) ? std::optional<int64_t>(1) : std::optional<int64_t>(2);
        entry.timestamp = base + std::chrono::seconds(i);
        CHECK(repo.append(entry) == i + 1);
    }
    CHECK(repo.size() == 5);

    const auto all = repo.list(std::nullopt, 100);
    REQUIRE(all.size() == 5);
    CHECK(all.front().id == 5);
    CHECK(all.back().id == 1);

    const auto first_only = repo.list(int64_t{1}, 100);
    REQUIRE(first_only.size() == 3);
    CHECK(first_only[0].id == 5);
    CHECK(first_only[2].id == 1);

    const auto limited = repo.list(std::nullopt, 2);
    REQUIRE(limited.size() == 2);
    CHECK(limited[0].id == 5);
    CHECK(limited[1].id == 4);
}

TEST_CASE("MemoryAuditRepository: entries without a credential are excluded by the filter",
          "[memory][audit]") {
    MemoryAuditRepository repo;
    AuditEntry orphan;
    orphan.timestamp = utils::now();
    (void)repo.append(orphan);

    CHECK(repo.list(int64_t{1}, 10).empty());
    CHECK(repo.list(std::nullopt, 10).size() == 1);
}
