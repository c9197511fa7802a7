#include <catch2/catch_test_macros.hpp>
#include "mocks/scripted_sender.hpp"
#include "webhook/delivery_scheduler.hpp"
#include "webhook/memory_delivery_store.hpp"
#include "webhook/memory_endpoint_store.hpp"
#include "webhook/worker_pool.hpp"

#include <functional>
#include <thread>

using namespace hookrelay;
using namespace hookrelay::testing;
using namespace std::chrono_literals;

namespace {

bool eventually(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

struct PoolFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryDeliveryStore> deliveries = std::make_shared<InMemoryDeliveryStore>();
    std::shared_ptr<WebhookRegistry> registry = std::make_shared<WebhookRegistry>(
        std::make_shared<InMemoryEndpointStore>(), clock, WebhookRegistry::Config{});
    std::shared_ptr<DeliveryScheduler> scheduler =
        std::make_shared<DeliveryScheduler>(registry, deliveries, clock);
    std::shared_ptr<SenderScript> script = std::make_shared<SenderScript>();

    static WorkerPool::Config pool_config() {
        WorkerPool::Config cfg;
        cfg.queues = {{"fresh", DeliveryStatus::PENDING, 4},
                      {"retry", DeliveryStatus::PENDING_RETRY, 2}};
        cfg.poll_interval = 10ms;
        cfg.claim_batch_size = 8;
        cfg.in_flight_recovery = 120s;
        cfg.per_endpoint_concurrency = 0;
        return cfg;
    }

    std::unique_ptr<WorkerPool> make_pool(WorkerPool::Config cfg = pool_config()) {
        return std::make_unique<WorkerPool>(deliveries, registry, clock, scripted_factory(script),
                                            RetryPolicy{}, DeliveryWorker::Config{}, std::move(cfg));
    }

    void add_endpoint() {
        WebhookRegistry::CreateRequest req;
        req.url = "https://receiver.example/hook";
        req.subscription = EventSubscription::all();
        REQUIRE(registry->create("alice", req).is_ok());
    }

    size_t count(DeliveryStatus s) {
        const auto counts = deliveries->count_by_status();
        const auto it = counts.find(s);
        return it == counts.end() ? 0 : it->second;
    }
};

} // namespace

TEST_CASE("WorkerPool: queue names map to claimed statuses", "[worker_pool]") {
    CHECK(WorkerPool::status_for_queue("fresh") == DeliveryStatus::PENDING);
    CHECK(WorkerPool::status_for_queue("retry") == DeliveryStatus::PENDING_RETRY);
    CHECK_FALSE(WorkerPool::status_for_queue("urgent").has_value());
}

TEST_CASE("WorkerPool: delivers every published event exactly once", "[worker_pool]") {
    PoolFixture f;
    f.add_endpoint();
    f.add_endpoint();

    auto pool = f.make_pool();
    pool->start();

    constexpr int kEvents = 50;
    for (int i = 0; i < kEvents; ++i) {
        auto r = f.scheduler->publish("alice", EventType::ORDER_CREATED,
                                      "evt_" + std::to_string(i), "{}");
        REQUIRE(r.is_ok());
        pool->wake();
    }

    REQUIRE(eventually([&] { return f.count(DeliveryStatus::DELIVERED) == 2 * kEvents; }));
    pool->stop();

    CHECK(f.script->request_count() == 2 * kEvents);
    const auto stats = pool->get_stats();
    CHECK(stats.delivered == 2 * kEvents);
    CHECK(stats.claimed == 2 * kEvents);
    CHECK(stats.lost_claims == 0);
}

TEST_CASE("WorkerPool: failed delivery moves to the retry queue", "[worker_pool]") {
    PoolFixture f;
    f.add_endpoint();
    f.script->push_status(503);
    f.script->push_status(200);

    auto pool = f.make_pool();
    pool->start();

    auto published = f.scheduler->publish("alice", EventType::INVOICE_PAID, "evt_r", "{}");
    REQUIRE(published.is_ok());
    const auto id = published.value().delivery_ids.at(0);
    pool->wake();

    REQUIRE(eventually([&] { return f.deliveries->get(id)->status == DeliveryStatus::PENDING_RETRY; }));
    CHECK(f.deliveries->get(id)->attempts == 1);

    f.clock->advance(1min);
    pool->wake();
    REQUIRE(eventually([&] { return f.deliveries->get(id)->status == DeliveryStatus::DELIVERED; }));
    pool->stop();

    CHECK(f.deliveries->get(id)->attempts == 2);
    CHECK(pool->get_stats().retried == 1);
}

TEST_CASE("WorkerPool: start and stop are idempotent", "[worker_pool]") {
    PoolFixture f;
    auto pool = f.make_pool();

    pool->stop();
    pool->start();
    pool->start();
    CHECK(pool->is_running());
    pool->stop();
    pool->stop();
    CHECK_FALSE(pool->is_running());
}

TEST_CASE("WorkerPool: stop leaves no row in flight", "[worker_pool]") {
    PoolFixture f;
    f.add_endpoint();
    for (int i = 0; i < 20; ++i) {
        REQUIRE(f.scheduler->publish("alice", EventType::ORDER_CREATED,
                                     "evt_" + std::to_string(i), "{}").is_ok());
    }

    auto cfg = PoolFixture::pool_config();
    cfg.queues = {{"fresh", DeliveryStatus::PENDING, 1}};
    auto pool = f.make_pool(cfg);
    pool->start();
    REQUIRE(eventually([&] { return f.count(DeliveryStatus::DELIVERED) > 0; }));
    pool->stop();

    CHECK(f.count(DeliveryStatus::IN_FLIGHT) == 0);
    CHECK(f.count(DeliveryStatus::DELIVERED) + f.count(DeliveryStatus::PENDING)
          + f.count(DeliveryStatus::PENDING_RETRY) == 20);
}
