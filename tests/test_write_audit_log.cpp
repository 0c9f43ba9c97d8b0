#include <catch2/catch_test_macros.hpp>
#include "audit/write_audit_log.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace sqlgate;

namespace {

WriteAuditEntry entry(const std::string& verb, uint64_t affected = 1) {
    WriteAuditEntry e;
    e.handle = "h-1";
    e.verb = verb;
    e.affected_rows = affected;
    e.duration = std::chrono::milliseconds(3);
    e.timestamp = std::chrono::system_clock::now();
    return e;
}

} // namespace

TEST_CASE("WriteAuditLog: list returns most recent first", "[audit]") {
    WriteAuditLog log;
    log.record(entry("insert", 1));
    log.record(entry("update", 2));
    log.record(entry("delete", 3));

    const auto all = log.list(10);
    REQUIRE(all.size() == 3);
    CHECK(all[0].verb == "delete");
    CHECK(all[1].verb == "update");
    CHECK(all[2].verb == "insert");

    const auto two = log.list(2);
    REQUIRE(two.size() == 2);
    CHECK(two[0].verb == "delete");
    CHECK(two[1].verb == "update");
}

TEST_CASE("WriteAuditLog: non-positive limit yields nothing", "[audit]") {
    WriteAuditLog log;
    log.record(entry("insert"));
    CHECK(log.list(0).empty());
    CHECK(log.list(-5).empty());
}

TEST_CASE("WriteAuditLog: oldest entry is evicted at capacity", "[audit][capacity]") {
    WriteAuditLog log(WriteAuditLog::Config{.enabled = true, .max_entries = 3});
    for (int i = 0; i < 5; ++i) {
        log.record(entry("v" + std::to_string(i)));
    }

    CHECK(log.size() == 3);
    const auto all = log.list(100);
    REQUIRE(all.size() == 3);
    CHECK(all[0].verb == "v4");
    CHECK(all[2].verb == "v2");
}

TEST_CASE("WriteAuditLog: clear reports discarded count", "[audit]") {
    WriteAuditLog log;
    log.record(entry("insert"));
    log.record(entry("update"));

    CHECK(log.clear() == 2);
    CHECK(log.size() == 0);
    CHECK(log.clear() == 0);
}

TEST_CASE("WriteAuditLog: disabled log records nothing", "[audit]") {
    WriteAuditLog log(WriteAuditLog::Config{.enabled = false, .max_entries = 10});
    CHECK_FALSE(log.record(entry("insert")));
    CHECK(log.size() == 0);
    CHECK(log.list(10).empty());
    CHECK(log.clear() == 0);
}

TEST_CASE("WriteAuditLog: concurrent writers never exceed capacity", "[audit][concurrency]") {
    WriteAuditLog log(WriteAuditLog::Config{.enabled = true, .max_entries = 50});

    std::atomic<size_t> max_seen{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&log, &max_seen] {
            for (int i = 0; i < 200; ++i) {
                log.record(entry("insert"));
                const size_t seen = log.list(1000).size();
                size_t prev = max_seen.load();
                while (seen > prev && !max_seen.compare_exchange_weak(prev, seen)) {}
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(max_seen.load() <= 50);
    CHECK(log.size() == 50);
}
