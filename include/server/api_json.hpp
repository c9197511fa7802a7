#pragma once

#include "core/error.hpp"
#include "incoming/incoming_types.hpp"
#include "webhook/event_type.hpp"
#include "webhook/webhook_registry.hpp"
#include "webhook/webhook_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace hookrelay {

// ============================================================================
// Request bodies
// ============================================================================

/// PATCH /api/v1/webhook-endpoints/:id; at least one field is set
struct EndpointUpdate {
    std::optional<EventSubscription> subscription;
    std::optional<bool> enabled;
};

/// POST /api/v1/events
struct PublishRequest {
    EventType type = EventType::WEBHOOK_TEST;
    std::string type_name;
    std::optional<std::string> event_id;    // Caller generates one when absent
    nlohmann::json data = nlohmann::json::object();
};

/**
 * @brief Parse {"url", "events", "description"?, "enabled"?}
 *
 * A field of the wrong JSON type is a VALIDATION error, never an exception.
 * URL and secret rules are left to WebhookRegistry.
 */
[[nodiscard]] Result<WebhookRegistry::CreateRequest> parse_create_endpoint(const std::string& body);

/// Parse {"events"?, "enabled"?}; an empty object is a VALIDATION error
[[nodiscard]] Result<EndpointUpdate> parse_update_endpoint(const std::string& body);

/// Parse {"type", "id"?, "data"?}
[[nodiscard]] Result<PublishRequest> parse_publish_event(const std::string& body);

// ============================================================================
// Response views
// ============================================================================

[[nodiscard]] nlohmann::json endpoint_to_json(const WebhookEndpoint& ep, bool include_secret);

/// next_attempt_at is null once the delivery is terminal
[[nodiscard]] nlohmann::json delivery_to_json(const WebhookDelivery& d);

[[nodiscard]] nlohmann::json incoming_to_json(const IncomingWebhookEvent& ev);

} // namespace hookrelay
