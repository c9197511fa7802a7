#include <catch2/catch_test_macros.hpp>
#include "idempotency/idempotency_gate.hpp"
#include "idempotency/memory_idempotency_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace hookrelay;
using namespace std::chrono_literals;

namespace {

struct GateFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryIdempotencyStore> store = std::make_shared<InMemoryIdempotencyStore>();
    IdempotencyGate gate{store, clock, IdempotencyGate::Config{}};

    const std::string scope = IdempotencyGate::make_scope("alice", "post", "/api/v1/events");
    const std::string hash_a = IdempotencyGate::fingerprint("POST", "/api/v1/events", R"({"amount":100})");
    const std::string hash_b = IdempotencyGate::fingerprint("POST", "/api/v1/events", R"({"amount":200})");
};

} // namespace

TEST_CASE("IdempotencyGate: scope and fingerprint", "[idempotency]") {
    CHECK(IdempotencyGate::make_scope("alice", "post", "/x") == "alice:POST /x");
    CHECK(IdempotencyGate::fingerprint("post", "/x", "b") == IdempotencyGate::fingerprint("POST", "/x", "b"));
    CHECK(IdempotencyGate::fingerprint("POST", "/x", "b") != IdempotencyGate::fingerprint("POST", "/y", "b"));
    CHECK(IdempotencyGate::fingerprint("POST", "/x", "b").size() == 64);
}

TEST_CASE("IdempotencyGate: first request proceeds, replay after completion", "[idempotency]") {
    GateFixture f;

    auto first = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(first.outcome == AcquireOutcome::PROCEED);
    REQUIRE(first.lock.has_value());
    CHECK_FALSE(first.stolen);

    REQUIRE(f.gate.complete(*first.lock, CachedResponse{201, R"({"id":"X"})", "application/json"}));

    auto second = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(second.outcome == AcquireOutcome::REPLAY);
    REQUIRE(second.cached.has_value());
    CHECK(second.cached->status == 201);
    CHECK(second.cached->body == R"({"id":"X"})");

    const auto stats = f.gate.get_stats();
    CHECK(stats.proceeded == 1);
    CHECK(stats.replayed == 1);
    CHECK(stats.completed == 1);
}

TEST_CASE("IdempotencyGate: same key with a different body is a conflict", "[idempotency]") {
    GateFixture f;

    auto first = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(first.outcome == AcquireOutcome::PROCEED);

    SECTION("while still locked") {
        CHECK(f.gate.acquire("K1", f.scope, f.hash_b).outcome == AcquireOutcome::CONFLICT);
    }

    SECTION("after completion") {
        REQUIRE(f.gate.complete(*first.lock, CachedResponse{201, "{}", "application/json"}));
        CHECK(f.gate.acquire("K1", f.scope, f.hash_b).outcome == AcquireOutcome::CONFLICT);
    }

    CHECK(f.gate.get_stats().conflicts == 1);
}

TEST_CASE("IdempotencyGate: concurrent duplicate is locked", "[idempotency]") {
    GateFixture f;

    auto first = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(first.outcome == AcquireOutcome::PROCEED);

    f.clock->advance(29s);
    CHECK(f.gate.acquire("K1", f.scope, f.hash_a).outcome == AcquireOutcome::LOCKED);
}

TEST_CASE("IdempotencyGate: keys are independent across scopes", "[idempotency]") {
    GateFixture f;
    const auto other_scope = IdempotencyGate::make_scope("bob", "POST", "/api/v1/events");

    CHECK(f.gate.acquire("K1", f.scope, f.hash_a).outcome == AcquireOutcome::PROCEED);
    CHECK(f.gate.acquire("K1", other_scope, f.hash_a).outcome == AcquireOutcome::PROCEED);
}

TEST_CASE("IdempotencyGate: stale lock is taken over exactly once", "[idempotency]") {
    GateFixture f;

    auto crashed = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(crashed.outcome == AcquireOutcome::PROCEED);

    f.clock->advance(31s);

    auto retry = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(retry.outcome == AcquireOutcome::PROCEED);
    CHECK(retry.stolen);
    CHECK(retry.lock->token != crashed.lock->token);

    // A third caller right after the takeover sees a fresh lock
    CHECK(f.gate.acquire("K1", f.scope, f.hash_a).outcome == AcquireOutcome::LOCKED);

    // The original holder wakes up and can no longer complete
    CHECK_FALSE(f.gate.complete(*crashed.lock, CachedResponse{200, "late", "application/json"}));
    REQUIRE(f.gate.complete(*retry.lock, CachedResponse{200, "winner", "application/json"}));

    auto replay = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(replay.outcome == AcquireOutcome::REPLAY);
    CHECK(replay.cached->body == "winner");

    const auto stats = f.gate.get_stats();
    CHECK(stats.stolen == 1);
    CHECK(stats.lost_locks == 1);
}

TEST_CASE("IdempotencyGate: release lets the same key run again", "[idempotency]") {
    GateFixture f;

    auto first = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(first.outcome == AcquireOutcome::PROCEED);
    REQUIRE(f.gate.release(*first.lock));

    auto again = f.gate.acquire("K1", f.scope, f.hash_a);
    CHECK(again.outcome == AcquireOutcome::PROCEED);
    CHECK_FALSE(again.stolen);

    // Releasing a token that no longer owns the row does nothing
    CHECK_FALSE(f.gate.release(*first.lock));
}

TEST_CASE("IdempotencyGate: expired record is treated as absent", "[idempotency]") {
    GateFixture f;

    auto first = f.gate.acquire("K1", f.scope, f.hash_a);
    REQUIRE(f.gate.complete(*first.lock, CachedResponse{201, "{}", "application/json"}));

    f.clock->advance(24h);

    // Different body would conflict if the record were still live
    auto fresh = f.gate.acquire("K1", f.scope, f.hash_b);
    CHECK(fresh.outcome == AcquireOutcome::PROCEED);
    CHECK_FALSE(fresh.stolen);
}

TEST_CASE("IdempotencyGate: sweep purges expired records only", "[idempotency]") {
    GateFixture f;

    auto old_lock = f.gate.acquire("old", f.scope, f.hash_a);
    REQUIRE(f.gate.complete(*old_lock.lock, CachedResponse{200, "{}", "application/json"}));

    f.clock->advance(23h);
    REQUIRE(f.gate.acquire("new", f.scope, f.hash_a).outcome == AcquireOutcome::PROCEED);

    f.clock->advance(1h);
    CHECK(f.gate.sweep() == 1);
    CHECK(f.store->count() == 1);
    CHECK(f.gate.get_stats().swept == 1);
}

TEST_CASE("IdempotencyGate: N concurrent identical requests, one executes", "[idempotency][concurrency]") {
    GateFixture f;
    constexpr int kThreads = 16;

    std::atomic<int> proceed{0};
    std::atomic<int> locked{0};
    std::atomic<int> other{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            const auto r = f.gate.acquire("K-race", f.scope, f.hash_a);
            switch (r.outcome) {
                case AcquireOutcome::PROCEED: ++proceed; break;
                case AcquireOutcome::LOCKED:  ++locked; break;
                default:                      ++other; break;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(proceed.load() == 1);
    CHECK(locked.load() == kThreads - 1);
    CHECK(other.load() == 0);
}

TEST_CASE("IdempotencyGate: concurrent stale takeover has one winner", "[idempotency][concurrency]") {
    GateFixture f;
    REQUIRE(f.gate.acquire("K1", f.scope, f.hash_a).outcome == AcquireOutcome::PROCEED);
    f.clock->advance(60s);

    constexpr int kThreads = 8;
    std::atomic<int> stolen{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            const auto r = f.gate.acquire("K1", f.scope, f.hash_a);
            if (r.outcome == AcquireOutcome::PROCEED) ++stolen;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(stolen.load() == 1);
}

TEST_CASE("IdempotencyGate: sweeper thread starts and stops", "[idempotency]") {
    auto clock = std::make_shared<ManualClock>();
    auto store = std::make_shared<InMemoryIdempotencyStore>();
    IdempotencyGate::Config cfg;
    cfg.sweep_interval = 1s;
    IdempotencyGate gate(store, clock, cfg);

    gate.start_sweeper();
    gate.start_sweeper();   // second start is a no-op
    gate.stop_sweeper();
    gate.stop_sweeper();
    SUCCEED();
}
