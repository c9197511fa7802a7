#pragma once

#include "core/bounded_channel.hpp"
#include "core/clock.hpp"
#include "core/error.hpp"
#include "incoming/event_processor.hpp"
#include "incoming/iincoming_event_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hookrelay {

enum class ReceiveOutcome {
    ACCEPTED,    // First arrival, stored as RECEIVED
    DUPLICATE    // (source, event_id) seen before; nothing changed
};

/**
 * @brief Verify, deduplicate and hand off inbound webhooks
 *
 * receive() never waits on processing: the acknowledgment depends only on
 * the signature check and the dedup insert. Processing runs on a bounded
 * pool of threads owned by the gateway.
 *
 * An accepted event that never reached the queue (queue full, shutdown,
 * crash) stays RECEIVED in the store. The recovery thread re-enqueues such
 * rows when the gateway starts and every recovery_interval afterwards, and
 * returns rows stuck in PROCESSING past processing_stale_after to RECEIVED.
 */
class IncomingWebhookGateway {
public:
    struct Config {
        std::chrono::seconds tolerance{300};
        uint32_t processing_threads = 2;
        size_t queue_capacity = 1024;
        std::chrono::seconds recovery_interval{30};
        std::chrono::seconds processing_stale_after{300};
        size_t recovery_batch_size = 256;
    };

    IncomingWebhookGateway(std::vector<IncomingSource> sources,
                           std::shared_ptr<IIncomingEventStore> store,
                           std::shared_ptr<IEventProcessor> processor,
                           std::shared_ptr<Clock> clock,
                           Config config);

    ~IncomingWebhookGateway();

    IncomingWebhookGateway(const IncomingWebhookGateway&) = delete;
    IncomingWebhookGateway& operator=(const IncomingWebhookGateway&) = delete;

    /**
     * @brief Errors: NOT_FOUND (unknown source), SIGNATURE (bad/expired MAC),
     * VALIDATION (no event id in a correctly signed body)
     */
    [[nodiscard]] Result<ReceiveOutcome> receive(const std::string& source,
                                                 const std::string& raw_body,
                                                 const std::string& signature_header);

    /**
     * @brief Operator retry: ERROR → RECEIVED, then re-enqueue
     *
     * A RECEIVED event is re-enqueued as is.
     * Errors: NOT_FOUND (no such event), CONFLICT (PROCESSING or PROCESSED)
     */
    [[nodiscard]] Result<bool> retry(const std::string& source, const std::string& event_id);

    [[nodiscard]] const IncomingSource* find_source(std::string_view name) const;

    /**
     * @brief Pull the event id out of a JSON body by dotted path
     *
     * String and integer values are accepted; anything else yields nullopt.
     */
    [[nodiscard]] static std::optional<std::string> extract_event_id(std::string_view body,
                                                                     std::string_view field_path);

    void start();

    /// Stop processing; events still queued stay RECEIVED for the next start()
    void stop();

    /// Block until the processing queue is empty and no event is mid-flight
    bool wait_idle(std::chrono::milliseconds timeout);

    struct Stats {
        uint64_t accepted = 0;
        uint64_t duplicates = 0;
        uint64_t signature_failures = 0;
        uint64_t processed = 0;
        uint64_t processing_errors = 0;
        uint64_t queue_full = 0;
        uint64_t recovered = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    using EventKey = std::pair<std::string, std::string>;

    bool enqueue(const std::string& source, const std::string& event_id);
    void processing_loop();
    void recovery_loop();

    /**
     * @brief Re-enqueue RECEIVED rows idle for at least min_idle
     *
     * Blocks while the queue is full. @return events handed to the queue
     */
    size_t recover(std::chrono::seconds min_idle);
    void process_one(const EventKey& key);

    std::unordered_map<std::string, IncomingSource> sources_;
    std::shared_ptr<IIncomingEventStore> store_;
    std::shared_ptr<IEventProcessor> processor_;
    std::shared_ptr<Clock> clock_;
    Config config_;

    BoundedChannel<EventKey> queue_;
    std::vector<std::thread> threads_;
    std::thread recovery_thread_;
    std::atomic<bool> running_{false};
    std::mutex recovery_mutex_;
    std::condition_variable recovery_cv_;
    std::atomic<uint64_t> busy_{0};

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> signature_failures_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> processing_errors_{0};
    std::atomic<uint64_t> queue_full_{0};
    std::atomic<uint64_t> recovered_{0};
};

} // namespace hookrelay
