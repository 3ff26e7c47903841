#include <catch2/catch_test_macros.hpp>
#include "audit/audit_log.hpp"
#include "core/utils.hpp"
#include "mocks/mock_repositories.hpp"

#include <stdexcept>

using namespace credvault;
using credvault::testing::FlakyAuditRepository;
using credvault::testing::RecordingSink;

namespace {

AuditEntry make_entry(std::optional<int64_t> credential_id, AuditOperation op) {
    AuditEntry entry;
    entry.credential_id = credential_id;
    entry.connection_hash = "hash";
    entry.operation = op;
    entry.success = true;
    return entry;
}

} // anonymous namespace

TEST_CASE("AuditLog: record stamps timestamp and assigns id", "[audit]") {
    auto repo = std::make_shared<MemoryAuditRepository>();
    AuditLog log(repo);

    const auto before = utils::now();
    log.record(make_entry(1, AuditOperation::CREATE));

    const auto entries = log.list();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].id == 1);
    CHECK(entries[0].timestamp >= before);
    CHECK(log.get_stats().total_recorded == 1);
}

TEST_CASE("AuditLog: explicit timestamp is preserved", "[audit]") {
    auto repo = std::make_shared<MemoryAuditRepository>();
    AuditLog log(repo);

    auto entry = make_entry(1, AuditOperation::ACCESS);
    entry.timestamp = utils::from_epoch_micros(1000000);
    log.record(entry);

    CHECK(log.list().at(0).timestamp == utils::from_epoch_micros(1000000));
}

TEST_CASE("AuditLog: list filters by credential, newest first", "[audit]") {
    auto repo = std::make_shared<MemoryAuditRepository>();
    AuditLog log(repo);

    const auto base = utils::now();
    for (int i = 0; i < 6; ++i) {
        auto entry = make_entry(i % 2 == 0 ? 10 : 20, AuditOperation::ACCESS);
        entry.timestamp = base + std::chrono::milliseconds(i);
        log.record(entry);
    }

    const auto tenth = log.list(int64_t{10});
    REQUIRE(tenth.size() == 3);
    CHECK(tenth[0].timestamp > tenth[1].timestamp);
    CHECK(tenth[1].timestamp > tenth[2].timestamp);
    for (const auto& e : tenth) {
        CHECK(e.credential_id == std::optional<int64_t>(10));
    }
}

TEST_CASE("AuditLog: limit defaults and clamping", "[audit]") {
    auto repo = std::make_shared<MemoryAuditRepository>();
    AuditLog::Config cfg;
    cfg.default_list_limit = 3;
    cfg.max_list_limit = 5;
    AuditLog log(repo, cfg);

    for (int i = 0; i < 10; ++i) {
        log.record(make_entry(1, AuditOperation::ACCESS));
    }

    CHECK(log.effective_limit(std::nullopt) == 3);
    CHECK(log.effective_limit(4) == 4);
    CHECK(log.effective_limit(500) == 5);

    CHECK(log.list().size() == 3);
    CHECK(log.list(std::nullopt, 4).size() == 4);
    CHECK(log.list(std::nullopt, 500).size() == 5);
    CHECK(log.list(std::nullopt, 0).empty());
}

TEST_CASE("AuditLog: repository failure is counted, never thrown", "[audit]") {
    auto repo = std::make_shared<FlakyAuditRepository>();
    AuditLog log(repo);
    auto sink = std::make_unique<RecordingSink>();
    auto* sink_ptr = sink.get();
    log.add_sink(std::move(sink));

    repo->fail_append = true;
    REQUIRE_NOTHROW(log.record(make_entry(1, AuditOperation::DELETE)));

    const auto stats = log.get_stats();
    CHECK(stats.write_failures == 1);
    CHECK(stats.total_recorded == 0);
    // Mirrors only see entries the repository accepted
    CHECK(sink_ptr->entries().empty());

    repo->fail_append = false;
    log.record(make_entry(1, AuditOperation::DELETE));
    CHECK(log.get_stats().total_recorded == 1);
    CHECK(sink_ptr->entries().size() == 1);
}

TEST_CASE("AuditLog: sinks receive entries with assigned ids", "[audit][sink]") {
    auto repo = std::make_shared<MemoryAuditRepository>();
    AuditLog log(repo);
    auto good = std::make_unique<RecordingSink>();
    auto* good_ptr = good.get();
    log.add_sink(std::move(good));
    log.add_sink(std::make_unique<RecordingSink>(false));

    log.record(make_entry(5, AuditOperation::CREATE));
    log.record(make_entry(5, AuditOperation::ACCESS));

    const auto mirrored = good_ptr->entries();
    REQUIRE(mirrored.size() == 2);
    CHECK(mirrored[0].id == 1);
    CHECK(mirrored[1].id == 2);

    const auto stats = log.get_stats();
    CHECK(stats.active_sinks == 2);
    CHECK(stats.sink_write_failures == 2);

    log.flush();
    CHECK(good_ptr->flush_count == 1);
}

TEST_CASE("AuditLog: null repository is rejected", "[audit]") {
    CHECK_THROWS_AS(AuditLog(nullptr), std::invalid_argument);
}
