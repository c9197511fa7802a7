#pragma once

#include "webhook/idelivery_store.hpp"

#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>

namespace hookrelay {

/**
 * @brief In-memory delivery queue. Each method runs under one mutex, which
 * stands in for the row-level atomicity of the SQL backend.
 */
class InMemoryDeliveryStore : public IDeliveryStore {
public:
    bool enqueue(const WebhookDelivery& delivery) override;
    std::optional<WebhookDelivery> get(const std::string& id) override;

    std::vector<WebhookDelivery> claim_due(
        DeliveryStatus status,
        std::chrono::system_clock::time_point now,
        size_t limit) override;

    bool mark_delivered(const std::string& id, uint64_t expected_version,
                        uint32_t attempts, const AttemptRecord& attempt,
                        std::chrono::system_clock::time_point now) override;

    bool mark_retry(const std::string& id, uint64_t expected_version,
                    uint32_t attempts, std::chrono::system_clock::time_point next_attempt_at,
                    const AttemptRecord& attempt,
                    std::chrono::system_clock::time_point now) override;

    bool mark_exhausted(const std::string& id, uint64_t expected_version,
                        uint32_t attempts, const AttemptRecord& attempt,
                        std::chrono::system_clock::time_point now) override;

    bool release_claim(const std::string& id, uint64_t expected_version,
                       std::chrono::system_clock::time_point next_attempt_at,
                       std::chrono::system_clock::time_point now) override;

    bool cancel(const std::string& id, std::chrono::system_clock::time_point now) override;

    size_t recover_stale_in_flight(
        std::chrono::system_clock::time_point claimed_before,
        std::chrono::system_clock::time_point now) override;

    std::vector<WebhookDelivery> list(std::optional<DeliveryStatus> status, size_t limit) override;

    std::map<DeliveryStatus, size_t> count_by_status() override;

private:
    /// Row in IN_FLIGHT at expected_version, or nullptr. Caller holds mutex_.
    WebhookDelivery* find_claimed(const std::string& id, uint64_t expected_version);

    static void apply_attempt(WebhookDelivery& d, uint32_t attempts,
                              const AttemptRecord& attempt,
                              std::chrono::system_clock::time_point now);

    std::unordered_map<std::string, WebhookDelivery> deliveries_;
    std::set<std::pair<std::string, std::string>> dedup_;   // (endpoint_id, event_id)
    std::mutex mutex_;
};

} // namespace hookrelay
