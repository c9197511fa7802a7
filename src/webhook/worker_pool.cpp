#include "webhook/worker_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace hookrelay {

std::optional<DeliveryStatus> WorkerPool::status_for_queue(std::string_view name) {
    if (name == "fresh") return DeliveryStatus::PENDING;
    if (name == "retry") return DeliveryStatus::PENDING_RETRY;
    return std::nullopt;
}

WorkerPool::WorkerPool(std::shared_ptr<IDeliveryStore> deliveries,
                       std::shared_ptr<const WebhookRegistry> registry,
                       std::shared_ptr<Clock> clock,
                       WebhookSenderFactory sender_factory,
                       RetryPolicy policy,
                       DeliveryWorker::Config worker_config,
                       Config config)
    : deliveries_(std::move(deliveries)),
      registry_(std::move(registry)),
      clock_(std::move(clock)),
      sender_factory_(std::move(sender_factory)),
      policy_(std::move(policy)),
      worker_config_(std::move(worker_config)),
      config_(std::move(config)),
      limiter_(std::make_shared<EndpointConcurrencyLimiter>(config_.per_endpoint_concurrency)) {
    if (worker_config_.concurrency_defer.count() <= 0) {
        worker_config_.concurrency_defer = config_.poll_interval;
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) return;

    for (const auto& spec : config_.queues) {
        auto lane = std::make_unique<Lane>();
        lane->spec = spec;
        lane->spec.concurrency = std::max<uint32_t>(spec.concurrency, 1);
        lane->channel = std::make_unique<BoundedChannel<WebhookDelivery>>(lane->spec.concurrency);
        lanes_.push_back(std::move(lane));
    }

    for (auto& lane : lanes_) {
        for (uint32_t i = 0; i < lane->spec.concurrency; ++i) {
            lane->workers.emplace_back([this, l = lane.get()] { worker_loop(*l); });
        }
        lane->dispatcher = std::thread([this, l = lane.get()] { dispatch_loop(*l); });
        utils::log::info(std::format("Delivery queue '{}' started: claims {}, {} workers",
                                     lane->spec.name,
                                     delivery_status_to_string(lane->spec.claims),
                                     lane->spec.concurrency));
    }

    recovery_thread_ = std::thread([this] { recovery_loop(); });
}

void WorkerPool::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard lock(wait_mutex_);
        ++wake_generation_;
    }
    wait_cv_.notify_all();

    for (auto& lane : lanes_) {
        lane->channel->close();
        if (lane->dispatcher.joinable()) lane->dispatcher.join();
    }
    if (recovery_thread_.joinable()) recovery_thread_.join();

    for (auto& lane : lanes_) {
        for (auto& w : lane->workers) {
            if (w.joinable()) w.join();
        }
        // Claimed but never handed to a worker: give them back untouched
        const auto now = clock_->now();
        for (const auto& d : lane->channel->drain()) {
            try {
                if (!deliveries_->release_claim(d.id, d.version, now, now)) {
                    lost_claims_.fetch_add(1, std::memory_order_relaxed);
                }
            } catch (const std::exception& e) {
                storage_errors_.fetch_add(1, std::memory_order_relaxed);
                utils::log::error(std::format("Failed to release delivery {} on shutdown: {}",
                                              d.id, e.what()));
            }
        }
    }
    lanes_.clear();
    utils::log::info("Delivery worker pool stopped");
}

void WorkerPool::wake() {
    {
        std::lock_guard lock(wait_mutex_);
        ++wake_generation_;
    }
    wait_cv_.notify_all();
}

bool WorkerPool::wait_for(std::chrono::milliseconds d) {
    std::unique_lock lock(wait_mutex_);
    const uint64_t gen = wake_generation_;
    wait_cv_.wait_for(lock, d, [this, gen] {
        return !running_.load(std::memory_order_relaxed) || wake_generation_ != gen;
    });
    return running_.load(std::memory_order_relaxed);
}

void WorkerPool::dispatch_loop(Lane& lane) {
    while (running_.load(std::memory_order_relaxed)) {
        const size_t room = std::min(config_.claim_batch_size, lane.channel->free_slots());
        size_t handed_off = 0;

        if (room > 0) {
            try {
                auto claimed = deliveries_->claim_due(lane.spec.claims, clock_->now(), room);
                claimed_.fetch_add(claimed.size(), std::memory_order_relaxed);
                for (auto& d : claimed) {
                    if (lane.channel->push(d)) {
                        ++handed_off;
                        continue;
                    }
                    // Channel closed by stop(): put the row back
                    const auto now = clock_->now();
                    if (!deliveries_->release_claim(d.id, d.version, now, now)) {
                        lost_claims_.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            } catch (const std::exception& e) {
                storage_errors_.fetch_add(1, std::memory_order_relaxed);
                utils::log::error(std::format("Delivery queue '{}' claim failed: {}",
                                              lane.spec.name, e.what()));
            }
        }

        // A full batch suggests more rows are due; go again without waiting
        if (handed_off > 0 && handed_off == room) continue;
        if (!wait_for(config_.poll_interval)) break;
    }
}

void WorkerPool::worker_loop(Lane& lane) {
    DeliveryWorker worker(deliveries_, registry_, clock_, limiter_,
                          sender_factory_(), policy_, worker_config_);

    while (auto claimed = lane.channel->pop()) {
        try {
            record(worker.process(*claimed));
        } catch (const std::exception& e) {
            // Row stays IN_FLIGHT and is picked up by stale recovery
            storage_errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Delivery {} failed in queue '{}': {}",
                                          claimed->id, lane.spec.name, e.what()));
        }
    }
}

void WorkerPool::recovery_loop() {
    const auto interval = std::max<std::chrono::milliseconds>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.in_flight_recovery) / 2,
        std::chrono::milliseconds(1000));

    while (wait_for(interval)) {
        try {
            const auto now = clock_->now();
            const size_t n = deliveries_->recover_stale_in_flight(now - config_.in_flight_recovery, now);
            if (n > 0) {
                recovered_.fetch_add(n, std::memory_order_relaxed);
                utils::log::warn(std::format("Recovered {} deliveries stuck in flight", n));
            }
        } catch (const std::exception& e) {
            storage_errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("In-flight recovery failed: {}", e.what()));
        }
    }
}

void WorkerPool::record(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::DELIVERED:
            delivered_.fetch_add(1, std::memory_order_relaxed); break;
        case DeliveryOutcome::RETRY_SCHEDULED:
            retried_.fetch_add(1, std::memory_order_relaxed); break;
        case DeliveryOutcome::EXHAUSTED:
            exhausted_.fetch_add(1, std::memory_order_relaxed); break;
        case DeliveryOutcome::SKIPPED_DISABLED:
            skipped_disabled_.fetch_add(1, std::memory_order_relaxed); break;
        case DeliveryOutcome::DEFERRED_CONCURRENCY:
            deferred_concurrency_.fetch_add(1, std::memory_order_relaxed); break;
        case DeliveryOutcome::LOST_CLAIM:
            lost_claims_.fetch_add(1, std::memory_order_relaxed); break;
    }
}

WorkerPool::Stats WorkerPool::get_stats() const {
    return {
        claimed_.load(std::memory_order_relaxed),
        delivered_.load(std::memory_order_relaxed),
        retried_.load(std::memory_order_relaxed),
        exhausted_.load(std::memory_order_relaxed),
        skipped_disabled_.load(std::memory_order_relaxed),
        deferred_concurrency_.load(std::memory_order_relaxed),
        lost_claims_.load(std::memory_order_relaxed),
        recovered_.load(std::memory_order_relaxed),
        storage_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace hookrelay
