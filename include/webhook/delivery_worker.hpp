#pragma once

#include "core/clock.hpp"
#include "webhook/endpoint_concurrency_limiter.hpp"
#include "webhook/idelivery_store.hpp"
#include "webhook/retry_policy.hpp"
#include "webhook/webhook_registry.hpp"
#include "webhook/webhook_sender.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace hookrelay {

enum class DeliveryOutcome {
    DELIVERED,
    RETRY_SCHEDULED,
    EXHAUSTED,
    SKIPPED_DISABLED,       // Endpoint disabled or removed; claim released
    DEFERRED_CONCURRENCY,   // Per-endpoint cap reached; claim released
    LOST_CLAIM              // Row changed under us; nothing written
};

[[nodiscard]] const char* delivery_outcome_to_string(DeliveryOutcome outcome);

/**
 * @brief Runs one attempt for one claimed delivery
 *
 * Input rows must be IN_FLIGHT and carry the version returned by
 * IDeliveryStore::claim_due. The worker signs, sends, and records the
 * outcome with a compare-and-set; it never throws for HTTP failures.
 * Storage failures propagate as StorageError.
 */
class DeliveryWorker {
public:
    struct Config {
        std::chrono::milliseconds request_timeout{30000};
        size_t response_body_max_bytes = 1024;
        std::chrono::seconds disabled_recheck{60};
        std::chrono::milliseconds concurrency_defer{1000};
        std::string user_agent = "hook-relay/1.0";
    };

    DeliveryWorker(std::shared_ptr<IDeliveryStore> deliveries,
                   std::shared_ptr<const WebhookRegistry> registry,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<EndpointConcurrencyLimiter> limiter,
                   std::unique_ptr<IWebhookSender> sender,
                   RetryPolicy policy,
                   Config config);

    DeliveryOutcome process(const WebhookDelivery& claimed);

    /// Outbound request for attempt number `attempt` (1-based)
    [[nodiscard]] OutboundRequest build_request(const WebhookDelivery& delivery,
                                                const WebhookEndpoint& endpoint,
                                                uint32_t attempt) const;

private:
    DeliveryOutcome release(const WebhookDelivery& claimed,
                            std::chrono::system_clock::time_point next_attempt_at,
                            DeliveryOutcome outcome);

    std::shared_ptr<IDeliveryStore> deliveries_;
    std::shared_ptr<const WebhookRegistry> registry_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EndpointConcurrencyLimiter> limiter_;
    std::unique_ptr<IWebhookSender> sender_;
    RetryPolicy policy_;
    Config config_;
};

} // namespace hookrelay
