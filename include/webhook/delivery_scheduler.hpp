#pragma once

#include "core/clock.hpp"
#include "core/error.hpp"
#include "webhook/idelivery_store.hpp"
#include "webhook/webhook_registry.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hookrelay {

/**
 * @brief Fan-out of one business event into per-endpoint deliveries
 */
class DeliveryScheduler {
public:
    struct PublishResult {
        std::string event_id;
        std::vector<std::string> delivery_ids;   // Newly created only
        size_t matched_endpoints = 0;
        size_t duplicates = 0;                   // (endpoint, event) already queued
    };

    DeliveryScheduler(std::shared_ptr<const WebhookRegistry> registry,
                      std::shared_ptr<IDeliveryStore> deliveries,
                      std::shared_ptr<Clock> clock);

    /**
     * @brief Create one PENDING delivery per enabled, subscribed endpoint
     *
     * Re-publishing the same event_id creates nothing new.
     */
    [[nodiscard]] Result<PublishResult> publish(const std::string& owner_id,
                                                EventType type,
                                                const std::string& event_id,
                                                const std::string& payload);

    /// Invoked after new deliveries are queued (worker pool wake-up)
    void set_on_enqueued(std::function<void()> callback) { on_enqueued_ = std::move(callback); }

private:
    std::shared_ptr<const WebhookRegistry> registry_;
    std::shared_ptr<IDeliveryStore> deliveries_;
    std::shared_ptr<Clock> clock_;
    std::function<void()> on_enqueued_;
};

} // namespace hookrelay
