#include <catch2/catch_test_macros.hpp>
#include "vault/credential_store.hpp"
#include "mocks/mock_repositories.hpp"

#include <atomic>
#include <latch>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace credvault;
using credvault::testing::StaticKeyProvider;

namespace {

struct ConcurrentFixture {
    std::shared_ptr<MemoryCredentialRepository> repo = std::make_shared<MemoryCredentialRepository>();
    std::shared_ptr<MemoryAuditRepository> audit_repo = std::make_shared<MemoryAuditRepository>();
    std::shared_ptr<CredentialStore> store = std::make_shared<CredentialStore>(
        repo,
        std::make_shared<CredentialCipher>(std::make_shared<StaticKeyProvider>(),
                                           CredentialCipher::Config{}),
        std::make_shared<AuditLog>(audit_repo));
};

SaveRequest make_request(const std::string& host, const std::string& secret) {
    SaveRequest req;
    req.host = host;
    req.port = 3306;
    req.database = "shop";
    req.username = "app";
    req.secret = secret;
    req.engine_type = "mysql";
    return req;
}

} // anonymous namespace

TEST_CASE("CredentialStore concurrency: racing saves of one identity create one row",
          "[store][concurrency]") {
    ConcurrentFixture f;
    constexpr int kThreads = 8;

    std::atomic<int> created{0};
    std::atomic<int> existing{0};
    std::atomic<int> errors{0};
    std::set<int64_t> ids;
    std::mutex ids_mutex;
    std::latch start(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            start.arrive_and_wait();
            const auto result = f.store->save(make_request("shared-host", "pw" + std::to_string(t)));
            switch (result.status) {
                case SaveStatus::CREATED: created.fetch_add(1); break;
                case SaveStatus::EXISTS:  existing.fetch_add(1); break;
                default:                  errors.fetch_add(1); break;
            }
            if (result.credential) {
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.insert(result.credential->id);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(created.load() == 1);
    CHECK(existing.load() == kThreads - 1);
    CHECK(errors.load() == 0);
    CHECK(ids.size() == 1);
    CHECK(f.repo->row_count() == 1);
    CHECK(f.audit_repo->size() == static_cast<size_t>(kThreads));
}

TEST_CASE("CredentialStore concurrency: distinct identities save in parallel",
          "[store][concurrency]") {
    ConcurrentFixture f;
    constexpr int kThreads = 6;

    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const auto result = f.store->save(make_request("host-" + std::to_string(t), "pw"));
            if (result.status == SaveStatus::CREATED) created.fetch_add(1);
        });
    }
    for (auto& th : threads) th.join();

    CHECK(created.load() == kThreads);
    CHECK(f.repo->row_count() == static_cast<size_t>(kThreads));

    const auto listed = f.store->list();
    REQUIRE(listed.is_ok());
    CHECK(listed.value().size() == static_cast<size_t>(kThreads));
}

TEST_CASE("CredentialStore concurrency: readers and a deleter do not corrupt state",
          "[store][concurrency]") {
    ConcurrentFixture f;
    const auto saved = f.store->save(make_request("read-host", "secret"));
    REQUIRE(saved.status == SaveStatus::CREATED);
    const auto id = saved.credential->id;

    std::atomic<int> found{0};
    std::atomic<int> not_found{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                const auto r = f.store->get(id);
                if (r.is_ok()) found.fetch_add(1);
                else if (r.error_category() == ErrorCategory::NOT_FOUND) not_found.fetch_add(1);
            }
        });
    }
    std::thread deleter([&] { (void)f.store->remove(id); });

    for (auto& th : readers) th.join();
    deleter.join();

    CHECK(found.load() + not_found.load() == 80);
    CHECK_FALSE(f.repo->find_by_id(id)->is_active);
    // One entry per operation: save, 80 gets, one delete
    CHECK(f.audit_repo->size() == 82);
}
