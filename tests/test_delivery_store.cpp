#include <catch2/catch_test_macros.hpp>
#include "webhook/memory_delivery_store.hpp"
#include "webhook/retry_policy.hpp"

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace hookrelay;
using namespace std::chrono_literals;

namespace {

const auto kT0 = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

WebhookDelivery make_delivery(std::string id, std::string endpoint, std::string event,
                              std::chrono::system_clock::time_point due = kT0) {
    WebhookDelivery d;
    d.id = std::move(id);
    d.endpoint_id = std::move(endpoint);
    d.event_id = std::move(event);
    d.event_type = EventType::INVOICE_PAID;
    d.payload = R"({"id":"evt_1"})";
    d.status = DeliveryStatus::PENDING;
    d.next_attempt_at = due;
    d.created_at = due;
    d.updated_at = due;
    return d;
}

AttemptRecord attempt(std::optional<int> status, std::string error = "") {
    return AttemptRecord{status, "body", std::move(error)};
}

} // namespace

TEST_CASE("InMemoryDeliveryStore: enqueue deduplicates (endpoint, event)", "[delivery][store]") {
    InMemoryDeliveryStore store;

    CHECK(store.enqueue(make_delivery("d1", "we_a", "evt_1")));
    CHECK_FALSE(store.enqueue(make_delivery("d2", "we_a", "evt_1")));
    CHECK(store.enqueue(make_delivery("d3", "we_b", "evt_1")));
    CHECK(store.enqueue(make_delivery("d4", "we_a", "evt_2")));
    CHECK_FALSE(store.enqueue(make_delivery("d1", "we_c", "evt_9")));   // id collision

    CHECK(store.list(std::nullopt, 100).size() == 3);
    CHECK_FALSE(store.get("d2").has_value());

    // The failed id collision must not leave a dedup entry behind
    CHECK(store.enqueue(make_delivery("d5", "we_c", "evt_9")));
}

TEST_CASE("InMemoryDeliveryStore: claim respects status, due time and limit", "[delivery][store]") {
    InMemoryDeliveryStore store;
    REQUIRE(store.enqueue(make_delivery("d1", "we_a", "e1", kT0)));
    REQUIRE(store.enqueue(make_delivery("d2", "we_a", "e2", kT0 + 1s)));
    REQUIRE(store.enqueue(make_delivery("d3", "we_a", "e3", kT0 + 1h)));

    auto claimed = store.claim_due(DeliveryStatus::PENDING, kT0 + 1s, 1);
    REQUIRE(claimed.size() == 1);
    CHECK(claimed[0].id == "d1");
    CHECK(claimed[0].status == DeliveryStatus::IN_FLIGHT);
    CHECK(claimed[0].claimed_at == kT0 + 1s);
    CHECK(claimed[0].version == 1);

    claimed = store.claim_due(DeliveryStatus::PENDING, kT0 + 1s, 10);
    REQUIRE(claimed.size() == 1);
    CHECK(claimed[0].id == "d2");

    CHECK(store.claim_due(DeliveryStatus::PENDING, kT0 + 1s, 10).empty());
    CHECK(store.claim_due(DeliveryStatus::PENDING_RETRY, kT0 + 2h, 10).empty());
}

TEST_CASE("InMemoryDeliveryStore: transitions are compare-and-set on version", "[delivery][store]") {
    InMemoryDeliveryStore store;
    REQUIRE(store.enqueue(make_delivery("d1", "we_a", "e1")));
    const auto claimed = store.claim_due(DeliveryStatus::PENDING, kT0, 1).at(0);

    SECTION("stale version is rejected") {
        CHECK_FALSE(store.mark_delivered("d1", claimed.version - 1, 1, attempt(200), kT0));
        CHECK(store.get("d1")->status == DeliveryStatus::IN_FLIGHT);
    }

    SECTION("delivered") {
        REQUIRE(store.mark_delivered("d1", claimed.version, 1, attempt(200), kT0 + 1s));
        const auto d = *store.get("d1");
        CHECK(d.status == DeliveryStatus::DELIVERED);
        CHECK(d.attempts == 1);
        CHECK(d.last_response_status == 200);
        CHECK(d.delivered_at == kT0 + 1s);
        CHECK_FALSE(d.claimed_at.has_value());
        // Second writer with the same version loses
        CHECK_FALSE(store.mark_retry("d1", claimed.version, 1, kT0 + 1min, attempt(500), kT0));
    }

    SECTION("retry then exhausted") {
        REQUIRE(store.mark_retry("d1", claimed.version, 1, kT0 + 1min, attempt(503), kT0));
        auto d = *store.get("d1");
        CHECK(d.status == DeliveryStatus::PENDING_RETRY);
        CHECK(d.next_attempt_at == kT0 + 1min);
        CHECK(d.last_response_status == 503);

        CHECK(store.claim_due(DeliveryStatus::PENDING_RETRY, kT0 + 59s, 10).empty());
        const auto again = store.claim_due(DeliveryStatus::PENDING_RETRY, kT0 + 1min, 10).at(0);
        REQUIRE(store.mark_exhausted("d1", again.version, 2, attempt(std::nullopt, "timeout"), kT0 + 2min));
        d = *store.get("d1");
        CHECK(d.status == DeliveryStatus::FAILED_EXHAUSTED);
        CHECK(d.attempts == 2);
        CHECK_FALSE(d.last_response_status.has_value());
        CHECK(d.last_error == "timeout");
    }

    SECTION("release keeps attempts") {
        REQUIRE(store.release_claim("d1", claimed.version, kT0 + 1min, kT0));
        const auto d = *store.get("d1");
        CHECK(d.status == DeliveryStatus::PENDING_RETRY);
        CHECK(d.attempts == 0);
        CHECK(d.next_attempt_at == kT0 + 1min);
    }
}

TEST_CASE("InMemoryDeliveryStore: cancel only from pending states", "[delivery][store]") {
    InMemoryDeliveryStore store;
    REQUIRE(store.enqueue(make_delivery("d1", "we_a", "e1")));
    REQUIRE(store.enqueue(make_delivery("d2", "we_a", "e2")));

    CHECK(store.cancel("d1", kT0));
    CHECK(store.get("d1")->status == DeliveryStatus::CANCELLED);
    CHECK_FALSE(store.cancel("d1", kT0));
    CHECK_FALSE(store.cancel("missing", kT0));

    const auto claimed = store.claim_due(DeliveryStatus::PENDING, kT0, 10);
    REQUIRE(claimed.size() == 1);   // d1 is cancelled and never claimed
    CHECK_FALSE(store.cancel("d2", kT0));
}

TEST_CASE("InMemoryDeliveryStore: stale in-flight rows are recovered", "[delivery][store]") {
    InMemoryDeliveryStore store;
    REQUIRE(store.enqueue(make_delivery("d1", "we_a", "e1")));
    REQUIRE(store.enqueue(make_delivery("d2", "we_a", "e2", kT0 + 5min)));

    const auto old_claim = store.claim_due(DeliveryStatus::PENDING, kT0, 10).at(0);
    REQUIRE(store.claim_due(DeliveryStatus::PENDING, kT0 + 5min, 10).size() == 1);

    CHECK(store.recover_stale_in_flight(kT0 + 1min, kT0 + 6min) == 1);
    const auto d1 = *store.get("d1");
    CHECK(d1.status == DeliveryStatus::PENDING_RETRY);
    CHECK(d1.next_attempt_at == kT0 + 6min);
    CHECK(d1.attempts == 0);
    CHECK(store.get("d2")->status == DeliveryStatus::IN_FLIGHT);

    // The original worker's late write is rejected
    CHECK_FALSE(store.mark_delivered("d1", old_claim.version, 1, attempt(200), kT0 + 7min));
}

TEST_CASE("InMemoryDeliveryStore: list and counts", "[delivery][store]") {
    InMemoryDeliveryStore store;
    REQUIRE(store.enqueue(make_delivery("d1", "we_a", "e1", kT0)));
    REQUIRE(store.enqueue(make_delivery("d2", "we_a", "e2", kT0 + 1s)));
    REQUIRE(store.enqueue(make_delivery("d3", "we_a", "e3", kT0 + 2s)));
    REQUIRE(store.cancel("d3", kT0));

    const auto all = store.list(std::nullopt, 10);
    REQUIRE(all.size() == 3);
    CHECK(all[0].id == "d1");
    CHECK(all[2].id == "d3");
    CHECK(store.list(DeliveryStatus::PENDING, 1).size() == 1);

    const auto counts = store.count_by_status();
    CHECK(counts.at(DeliveryStatus::PENDING) == 2);
    CHECK(counts.at(DeliveryStatus::CANCELLED) == 1);
}

TEST_CASE("InMemoryDeliveryStore: concurrent claimers never share a row", "[delivery][store][concurrency]") {
    InMemoryDeliveryStore store;
    constexpr int kRows = 200;
    for (int i = 0; i < kRows; ++i) {
        REQUIRE(store.enqueue(make_delivery("d" + std::to_string(i), "we_a", "e" + std::to_string(i))));
    }

    std::mutex seen_mutex;
    std::multiset<std::string> seen;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            while (true) {
                auto batch = store.claim_due(DeliveryStatus::PENDING, kT0, 7);
                if (batch.empty()) return;
                std::lock_guard lock(seen_mutex);
                for (const auto& d : batch) seen.insert(d.id);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(seen.size() == kRows);
    for (const auto& id : seen) {
        CHECK(seen.count(id) == 1);
    }
}

TEST_CASE("RetryPolicy: schedule and cap", "[delivery][retry]") {
    const RetryPolicy policy;
    CHECK(policy.max_attempts() == 5);
    CHECK(policy.delay_after(1) == 1min);
    CHECK(policy.delay_after(2) == 5min);
    CHECK(policy.delay_after(3) == 30min);
    CHECK(policy.delay_after(4) == 2h);
    CHECK(policy.delay_after(5) == 24h);
    CHECK(policy.delay_after(9) == 24h);

    CHECK_FALSE(policy.is_exhausted(4));
    CHECK(policy.is_exhausted(5));

    const RetryPolicy short_policy(3, {10s});
    CHECK(short_policy.delay_after(2) == 10s);
    CHECK(short_policy.is_exhausted(3));

    const RetryPolicy empty_schedule(2, {});
    CHECK(empty_schedule.schedule() == RetryPolicy::default_schedule());
}
