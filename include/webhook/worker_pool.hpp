#pragma once

#include "core/bounded_channel.hpp"
#include "core/clock.hpp"
#include "webhook/delivery_worker.hpp"
#include "webhook/endpoint_concurrency_limiter.hpp"
#include "webhook/idelivery_store.hpp"
#include "webhook/retry_policy.hpp"
#include "webhook/webhook_registry.hpp"
#include "webhook/webhook_sender.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hookrelay {

/**
 * @brief Drains the delivery store with named queues of parallel workers
 *
 *   [dispatcher "fresh"] --claim PENDING-------> [channel] --> worker x N
 *   [dispatcher "retry"] --claim PENDING_RETRY-> [channel] --> worker x M
 *   [recovery]           --recover_stale_in_flight every interval
 *
 * Dispatchers claim no more rows than their channel can hold, so a claimed
 * row waits at most one send per worker before it is processed. Workers
 * share nothing except the per-endpoint concurrency limiter; each owns its
 * own IWebhookSender.
 */
class WorkerPool {
public:
    struct QueueSpec {
        std::string name;
        DeliveryStatus claims = DeliveryStatus::PENDING;
        uint32_t concurrency = 1;
    };

    struct Config {
        std::vector<QueueSpec> queues;
        std::chrono::milliseconds poll_interval{1000};
        size_t claim_batch_size = 32;
        std::chrono::seconds in_flight_recovery{120};
        uint32_t per_endpoint_concurrency = 4;
    };

    /// "fresh" → PENDING, "retry" → PENDING_RETRY
    [[nodiscard]] static std::optional<DeliveryStatus> status_for_queue(std::string_view name);

    WorkerPool(std::shared_ptr<IDeliveryStore> deliveries,
               std::shared_ptr<const WebhookRegistry> registry,
               std::shared_ptr<Clock> clock,
               WebhookSenderFactory sender_factory,
               RetryPolicy policy,
               DeliveryWorker::Config worker_config,
               Config config);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    /**
     * @brief Stop claiming, finish sends in progress, release rows that
     * were claimed but not yet picked up, join every thread
     */
    void stop();

    /// Skip the rest of the current poll wait
    void wake();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_relaxed); }

    struct Stats {
        uint64_t claimed = 0;
        uint64_t delivered = 0;
        uint64_t retried = 0;
        uint64_t exhausted = 0;
        uint64_t skipped_disabled = 0;
        uint64_t deferred_concurrency = 0;
        uint64_t lost_claims = 0;
        uint64_t recovered = 0;
        uint64_t storage_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Lane {
        QueueSpec spec;
        std::unique_ptr<BoundedChannel<WebhookDelivery>> channel;
        std::thread dispatcher;
        std::vector<std::thread> workers;
    };

    void dispatch_loop(Lane& lane);
    void worker_loop(Lane& lane);
    void recovery_loop();
    void record(DeliveryOutcome outcome);

    /// Wait up to d unless stopped or woken. @return false when stopping
    bool wait_for(std::chrono::milliseconds d);

    std::shared_ptr<IDeliveryStore> deliveries_;
    std::shared_ptr<const WebhookRegistry> registry_;
    std::shared_ptr<Clock> clock_;
    WebhookSenderFactory sender_factory_;
    RetryPolicy policy_;
    DeliveryWorker::Config worker_config_;
    Config config_;
    std::shared_ptr<EndpointConcurrencyLimiter> limiter_;

    std::vector<std::unique_ptr<Lane>> lanes_;
    std::thread recovery_thread_;

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    uint64_t wake_generation_ = 0;

    std::atomic<uint64_t> claimed_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> retried_{0};
    std::atomic<uint64_t> exhausted_{0};
    std::atomic<uint64_t> skipped_disabled_{0};
    std::atomic<uint64_t> deferred_concurrency_{0};
    std::atomic<uint64_t> lost_claims_{0};
    std::atomic<uint64_t> recovered_{0};
    std::atomic<uint64_t> storage_errors_{0};
};

} // namespace hookrelay
