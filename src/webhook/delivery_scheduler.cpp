#include "webhook/delivery_scheduler.hpp"
#include "core/utils.hpp"

#include <format>

namespace hookrelay {

DeliveryScheduler::DeliveryScheduler(std::shared_ptr<const WebhookRegistry> registry,
                                     std::shared_ptr<IDeliveryStore> deliveries,
                                     std::shared_ptr<Clock> clock)
    : registry_(std::move(registry)),
      deliveries_(std::move(deliveries)),
      clock_(std::move(clock)) {}

Result<DeliveryScheduler::PublishResult> DeliveryScheduler::publish(const std::string& owner_id,
                                                                    EventType type,
                                                                    const std::string& event_id,
                                                                    const std::string& payload) {
    if (event_id.empty()) {
        return Result<PublishResult>::error(ErrorCategory::VALIDATION, "event id is required");
    }

    PublishResult result;
    result.event_id = event_id;

    const auto endpoints = registry_->matching_endpoints(owner_id, type);
    result.matched_endpoints = endpoints.size();

    const auto now = clock_->now();
    for (const auto& ep : endpoints) {
        WebhookDelivery d;
        d.id = utils::generate_id("dlv");
        d.endpoint_id = ep.id;
        d.event_id = event_id;
        d.event_type = type;
        d.payload = payload;
        d.status = DeliveryStatus::PENDING;
        d.attempts = 0;
        d.next_attempt_at = now;
        d.created_at = now;
        d.updated_at = now;

        if (deliveries_->enqueue(d)) {
            result.delivery_ids.push_back(std::move(d.id));
        } else {
            ++result.duplicates;
        }
    }

    utils::log::debug(std::format("Event {} ({}) for {}: {} matched, {} queued, {} duplicate",
                                  event_id, event_type_to_string(type), owner_id,
                                  result.matched_endpoints, result.delivery_ids.size(),
                                  result.duplicates));

    if (!result.delivery_ids.empty() && on_enqueued_) {
        on_enqueued_();
    }
    return Result<PublishResult>::ok(std::move(result));
}

} // namespace hookrelay
