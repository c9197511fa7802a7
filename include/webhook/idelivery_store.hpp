#pragma once

#include "webhook/webhook_types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hookrelay {

/**
 * @brief Durable outbound delivery queue (webhook_deliveries)
 *
 * Every transition out of IN_FLIGHT is a compare-and-set on
 * (id, expected_version, status = IN_FLIGHT) and bumps version. A false
 * return means another actor moved the row first; the caller must drop it.
 *
 * Backend failures throw StorageError.
 */
class IDeliveryStore {
public:
    virtual ~IDeliveryStore() = default;

    /**
     * @brief Insert a new delivery
     * @return false if (endpoint_id, event_id) already exists
     */
    [[nodiscard]] virtual bool enqueue(const WebhookDelivery& delivery) = 0;

    [[nodiscard]] virtual std::optional<WebhookDelivery> get(const std::string& id) = 0;

    /**
     * @brief Atomically move up to limit due rows in `status` to IN_FLIGHT
     *
     * Due means next_attempt_at <= now. Rows come back already claimed, with
     * their new version; no other caller can receive the same row until it
     * leaves IN_FLIGHT.
     */
    [[nodiscard]] virtual std::vector<WebhookDelivery> claim_due(
        DeliveryStatus status,
        std::chrono::system_clock::time_point now,
        size_t limit) = 0;

    [[nodiscard]] virtual bool mark_delivered(
        const std::string& id, uint64_t expected_version,
        uint32_t attempts, const AttemptRecord& attempt,
        std::chrono::system_clock::time_point now) = 0;

    [[nodiscard]] virtual bool mark_retry(
        const std::string& id, uint64_t expected_version,
        uint32_t attempts, std::chrono::system_clock::time_point next_attempt_at,
        const AttemptRecord& attempt,
        std::chrono::system_clock::time_point now) = 0;

    [[nodiscard]] virtual bool mark_exhausted(
        const std::string& id, uint64_t expected_version,
        uint32_t attempts, const AttemptRecord& attempt,
        std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief IN_FLIGHT → PENDING_RETRY without consuming an attempt
     */
    [[nodiscard]] virtual bool release_claim(
        const std::string& id, uint64_t expected_version,
        std::chrono::system_clock::time_point next_attempt_at,
        std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief PENDING or PENDING_RETRY → CANCELLED
     */
    [[nodiscard]] virtual bool cancel(const std::string& id,
                                      std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief Return rows stuck IN_FLIGHT since before claimed_before to
     * PENDING_RETRY, due immediately, attempts unchanged
     * @return Number of rows recovered
     */
    virtual size_t recover_stale_in_flight(
        std::chrono::system_clock::time_point claimed_before,
        std::chrono::system_clock::time_point now) = 0;

    /// Oldest first; no filter when status is unset
    [[nodiscard]] virtual std::vector<WebhookDelivery> list(
        std::optional<DeliveryStatus> status, size_t limit) = 0;

    [[nodiscard]] virtual std::map<DeliveryStatus, size_t> count_by_status() = 0;
};

} // namespace hookrelay
