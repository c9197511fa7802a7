#pragma once

#include "webhook/event_type.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hookrelay {

// ============================================================================
// Endpoint
// ============================================================================

/**
 * @brief Outbound webhook target owned by one user
 *
 * secret is returned to the owner only on creation and rotation.
 */
struct WebhookEndpoint {
    std::string id;
    std::string owner_id;
    std::string url;
    std::string secret;
    EventSubscription subscription;
    bool enabled = true;
    std::string description;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};
};

// ============================================================================
// Delivery
// ============================================================================

enum class DeliveryStatus : uint8_t {
    PENDING,
    IN_FLIGHT,
    DELIVERED,
    PENDING_RETRY,
    FAILED_EXHAUSTED,
    CANCELLED
};

[[nodiscard]] inline constexpr std::string_view delivery_status_to_string(DeliveryStatus s) {
    switch (s) {
        case DeliveryStatus::PENDING:          return "pending";
        case DeliveryStatus::IN_FLIGHT:        return "in_flight";
        case DeliveryStatus::DELIVERED:        return "delivered";
        case DeliveryStatus::PENDING_RETRY:    return "pending_retry";
        case DeliveryStatus::FAILED_EXHAUSTED: return "failed_exhausted";
        case DeliveryStatus::CANCELLED:        return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<DeliveryStatus> parse_delivery_status(std::string_view s) {
    if (s == "pending")          return DeliveryStatus::PENDING;
    if (s == "in_flight")        return DeliveryStatus::IN_FLIGHT;
    if (s == "delivered")        return DeliveryStatus::DELIVERED;
    if (s == "pending_retry")    return DeliveryStatus::PENDING_RETRY;
    if (s == "failed_exhausted") return DeliveryStatus::FAILED_EXHAUSTED;
    if (s == "cancelled")        return DeliveryStatus::CANCELLED;
    return std::nullopt;
}

[[nodiscard]] inline constexpr bool is_terminal(DeliveryStatus s) {
    return s == DeliveryStatus::DELIVERED
        || s == DeliveryStatus::FAILED_EXHAUSTED
        || s == DeliveryStatus::CANCELLED;
}

/**
 * @brief One attempt sequence for an (endpoint, event) pair
 *
 * attempts never decreases. next_attempt_at only has meaning while the row
 * is PENDING or PENDING_RETRY. version increments on every transition and is
 * the compare-and-set guard.
 */
struct WebhookDelivery {
    std::string id;
    std::string endpoint_id;
    std::string event_id;
    EventType event_type = EventType::WEBHOOK_TEST;
    std::string payload;
    DeliveryStatus status = DeliveryStatus::PENDING;
    uint32_t attempts = 0;
    std::chrono::system_clock::time_point next_attempt_at{};
    std::optional<int> last_response_status;
    std::string last_response_body;
    std::string last_error;
    uint64_t version = 0;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};
    std::optional<std::chrono::system_clock::time_point> claimed_at;
    std::optional<std::chrono::system_clock::time_point> delivered_at;
};

/**
 * @brief Outcome of one HTTP attempt, recorded on the delivery row
 */
struct AttemptRecord {
    std::optional<int> response_status;   // Unset on timeout / network error
    std::string response_body;            // Already truncated
    std::string error;
};

} // namespace hookrelay
