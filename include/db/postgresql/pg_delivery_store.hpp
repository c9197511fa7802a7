#pragma once

#include "db/iconnection_pool.hpp"
#include "webhook/idelivery_store.hpp"

#include <memory>

namespace hookrelay {

/**
 * @brief webhook_deliveries table
 *
 * claim_due uses FOR UPDATE SKIP LOCKED so concurrent relays sharing the
 * database never claim the same row.
 */
class PgDeliveryStore : public IDeliveryStore {
public:
    explicit PgDeliveryStore(std::shared_ptr<IConnectionPool> pool);

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

    size_t recover_stale_in_flight(std::chrono::system_clock::time_point claimed_before,
                                   std::chrono::system_clock::time_point now) override;

    std::vector<WebhookDelivery> list(std::optional<DeliveryStatus> status,
                                      size_t limit) override;

    std::map<DeliveryStatus, size_t> count_by_status() override;

private:
    /// Shared CAS transition out of IN_FLIGHT
    bool finish(const std::string& id, uint64_t expected_version, DeliveryStatus to,
                uint32_t attempts,
                std::optional<std::chrono::system_clock::time_point> next_attempt_at,
                const AttemptRecord& attempt,
                std::chrono::system_clock::time_point now);

    std::shared_ptr<IConnectionPool> pool_;
};

} // namespace hookrelay
