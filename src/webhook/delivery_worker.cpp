#include "webhook/delivery_worker.hpp"
#include "core/utils.hpp"
#include "security/signature_engine.hpp"
#include "server/http_constants.hpp"

#include <format>

namespace hookrelay {

const char* delivery_outcome_to_string(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::DELIVERED:            return "delivered";
        case DeliveryOutcome::RETRY_SCHEDULED:      return "retry_scheduled";
        case DeliveryOutcome::EXHAUSTED:            return "exhausted";
        case DeliveryOutcome::SKIPPED_DISABLED:     return "skipped_disabled";
        case DeliveryOutcome::DEFERRED_CONCURRENCY: return "deferred_concurrency";
        case DeliveryOutcome::LOST_CLAIM:           return "lost_claim";
    }
    return "unknown";
}

DeliveryWorker::DeliveryWorker(std::shared_ptr<IDeliveryStore> deliveries,
                               std::shared_ptr<const WebhookRegistry> registry,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<EndpointConcurrencyLimiter> limiter,
                               std::unique_ptr<IWebhookSender> sender,
                               RetryPolicy policy,
                               Config config)
    : deliveries_(std::move(deliveries)),
      registry_(std::move(registry)),
      clock_(std::move(clock)),
      limiter_(std::move(limiter)),
      sender_(std::move(sender)),
      policy_(std::move(policy)),
      config_(std::move(config)) {}

OutboundRequest DeliveryWorker::build_request(const WebhookDelivery& delivery,
                                              const WebhookEndpoint& endpoint,
                                              uint32_t attempt) const {
    const int64_t ts = utils::to_unix_seconds(clock_->now());

    OutboundRequest req;
    req.url = endpoint.url;
    req.body = delivery.payload;
    req.timeout = config_.request_timeout;
    req.headers = {
        {http::kContentTypeHeader, http::kJsonContentType},
        {http::kUserAgentHeader, config_.user_agent},
        {http::kWebhookEventTypeHeader, std::string(event_type_to_string(delivery.event_type))},
        {http::kWebhookEventIdHeader, delivery.event_id},
        {http::kWebhookDeliveryIdHeader, delivery.id},
        {http::kWebhookAttemptHeader, std::to_string(attempt)},
        {http::kWebhookSignatureHeader, SignatureEngine::sign(delivery.payload, endpoint.secret, ts)},
    };
    return req;
}

DeliveryOutcome DeliveryWorker::process(const WebhookDelivery& claimed) {
    const auto endpoint = registry_->find_for_delivery(claimed.endpoint_id);
    if (!endpoint || !endpoint->enabled) {
        utils::log::info(std::format(
            "Delivery {} skipped: endpoint {} is {}", claimed.id, claimed.endpoint_id,
            endpoint ? "disabled" : "removed"));
        return release(claimed, clock_->now() + config_.disabled_recheck,
                       DeliveryOutcome::SKIPPED_DISABLED);
    }

    EndpointConcurrencyLimiter::Slot slot(*limiter_, endpoint->id);
    if (!slot.acquired()) {
        return release(claimed, clock_->now() + config_.concurrency_defer,
                       DeliveryOutcome::DEFERRED_CONCURRENCY);
    }

    const uint32_t attempt = claimed.attempts + 1;
    const auto request = build_request(claimed, *endpoint, attempt);
    const SendResult sent = sender_->send(request);
    const auto now = clock_->now();

    AttemptRecord record;
    record.response_status = sent.status;
    record.response_body = utils::truncate_utf8(sent.body, config_.response_body_max_bytes);
    record.error = sent.error;

    if (sent.is_success()) {
        if (!deliveries_->mark_delivered(claimed.id, claimed.version, attempt, record, now)) {
            utils::log::warn(std::format("Delivery {}: claim lost before recording success", claimed.id));
            return DeliveryOutcome::LOST_CLAIM;
        }
        utils::log::debug(std::format("Delivery {} delivered on attempt {} (HTTP {})",
                                      claimed.id, attempt, *sent.status));
        return DeliveryOutcome::DELIVERED;
    }

    if (record.error.empty()) {
        record.error = sent.status ? std::format("HTTP {}", *sent.status) : "no response";
    }

    if (policy_.is_exhausted(attempt)) {
        if (!deliveries_->mark_exhausted(claimed.id, claimed.version, attempt, record, now)) {
            utils::log::warn(std::format("Delivery {}: claim lost before recording exhaustion", claimed.id));
            return DeliveryOutcome::LOST_CLAIM;
        }
        utils::log::warn(std::format(
            "Delivery {} to {} exhausted after {} attempts: {}",
            claimed.id, endpoint->url, attempt, record.error));
        return DeliveryOutcome::EXHAUSTED;
    }

    const auto delay = policy_.delay_after(attempt);
    if (!deliveries_->mark_retry(claimed.id, claimed.version, attempt, now + delay, record, now)) {
        utils::log::warn(std::format("Delivery {}: claim lost before scheduling retry", claimed.id));
        return DeliveryOutcome::LOST_CLAIM;
    }
    utils::log::info(std::format("Delivery {} attempt {} failed ({}), retry in {}s",
                                 claimed.id, attempt, record.error, delay.count()));
    return DeliveryOutcome::RETRY_SCHEDULED;
}

DeliveryOutcome DeliveryWorker::release(const WebhookDelivery& claimed,
                                        std::chrono::system_clock::time_point next_attempt_at,
                                        DeliveryOutcome outcome) {
    if (!deliveries_->release_claim(claimed.id, claimed.version, next_attempt_at, clock_->now())) {
        return DeliveryOutcome::LOST_CLAIM;
    }
    return outcome;
}

} // namespace hookrelay
