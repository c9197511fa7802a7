#include "server/api_json.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>
#include <vector>

namespace hookrelay {

namespace {

using json = nlohmann::json;

template <typename T>
Result<T> invalid(std::string message) {
    return Result<T>::error(ErrorCategory::VALIDATION, std::move(message));
}

std::optional<json> parse_object(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

/// "events": ["invoice.paid", ...] or ["*"]
std::optional<std::string> parse_events_field(const json& body, EventSubscription& out) {
    const auto it = body.find("events");
    if (it == body.end() || !it->is_array()) {
        return "events must be an array of event names";
    }
    std::vector<std::string> names;
    for (const auto& e : *it) {
        if (!e.is_string()) return "events must be an array of event names";
        names.push_back(e.get<std::string>());
    }
    std::string unknown;
    if (!parse_subscription(names, out, &unknown)) {
        return std::format("unknown event type '{}'", unknown);
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Request bodies
// ============================================================================

Result<WebhookRegistry::CreateRequest> parse_create_endpoint(const std::string& body) {
    using Create = WebhookRegistry::CreateRequest;
    const auto doc = parse_object(body);
    if (!doc) return invalid<Create>("Body must be a JSON object");

    Create create;
    const auto url = doc->find("url");
    if (url == doc->end() || !url->is_string()) {
        return invalid<Create>("url is required");
    }
    create.url = url->get<std::string>();

    if (const auto err = parse_events_field(*doc, create.subscription)) {
        return invalid<Create>(*err);
    }

    // null description reads as absent
    if (const auto it = doc->find("description"); it != doc->end() && !it->is_null()) {
        if (!it->is_string()) return invalid<Create>("description must be a string");
        create.description = it->get<std::string>();
    }
    if (const auto it = doc->find("enabled"); it != doc->end()) {
        if (!it->is_boolean()) return invalid<Create>("enabled must be a boolean");
        create.enabled = it->get<bool>();
    }
    return Result<Create>::ok(std::move(create));
}

Result<EndpointUpdate> parse_update_endpoint(const std::string& body) {
    const auto doc = parse_object(body);
    if (!doc) return invalid<EndpointUpdate>("Body must be a JSON object");

    const auto events_it = doc->find("events");
    const auto enabled_it = doc->find("enabled");
    if (events_it == doc->end() && enabled_it == doc->end()) {
        return invalid<EndpointUpdate>("Nothing to update: expected events and/or enabled");
    }

    EndpointUpdate update;
    if (enabled_it != doc->end()) {
        if (!enabled_it->is_boolean()) return invalid<EndpointUpdate>("enabled must be a boolean");
        update.enabled = enabled_it->get<bool>();
    }
    if (events_it != doc->end()) {
        EventSubscription sub;
        if (const auto err = parse_events_field(*doc, sub)) {
            return invalid<EndpointUpdate>(*err);
        }
        update.subscription = std::move(sub);
    }
    return Result<EndpointUpdate>::ok(std::move(update));
}

Result<PublishRequest> parse_publish_event(const std::string& body) {
    const auto doc = parse_object(body);
    if (!doc) return invalid<PublishRequest>("Body must be a JSON object");

    PublishRequest publish;
    const auto type_it = doc->find("type");
    if (type_it == doc->end() || !type_it->is_string()) {
        return invalid<PublishRequest>("type is required");
    }
    publish.type_name = type_it->get<std::string>();
    const auto type = parse_event_type(publish.type_name);
    if (!type) {
        return invalid<PublishRequest>(std::format("unknown event type '{}'", publish.type_name));
    }
    publish.type = *type;

    if (const auto id_it = doc->find("id"); id_it != doc->end()) {
        if (!id_it->is_string() || id_it->get<std::string>().empty()) {
            return invalid<PublishRequest>("id must be a non-empty string");
        }
        publish.event_id = id_it->get<std::string>();
    }
    if (const auto data_it = doc->find("data"); data_it != doc->end()) {
        publish.data = *data_it;
    }
    return Result<PublishRequest>::ok(std::move(publish));
}

// ============================================================================
// Response views
// ============================================================================

json endpoint_to_json(const WebhookEndpoint& ep, bool include_secret) {
    json j = {
        {"id", ep.id},
        {"url", ep.url},
        {"events", subscription_to_strings(ep.subscription)},
        {"enabled", ep.enabled},
        {"description", ep.description},
        {"created_at", utils::format_timestamp(ep.created_at)},
        {"updated_at", utils::format_timestamp(ep.updated_at)}
    };
    if (include_secret) {
        j["secret"] = ep.secret;
    }
    return j;
}

json delivery_to_json(const WebhookDelivery& d) {
    json j = {
        {"id", d.id},
        {"endpoint_id", d.endpoint_id},
        {"event_id", d.event_id},
        {"event_type", std::string(event_type_to_string(d.event_type))},
        {"status", std::string(delivery_status_to_string(d.status))},
        {"attempts", d.attempts},
        {"next_attempt_at", nullptr},
        {"last_response_status", nullptr},
        {"last_response_body", d.last_response_body},
        {"last_error", d.last_error},
        {"created_at", utils::format_timestamp(d.created_at)},
        {"updated_at", utils::format_timestamp(d.updated_at)},
        {"delivered_at", nullptr}
    };
    // Terminal rows keep their last schedule internally but are never attempted again
    if (!is_terminal(d.status)) j["next_attempt_at"] = utils::format_timestamp(d.next_attempt_at);
    if (d.last_response_status) j["last_response_status"] = *d.last_response_status;
    if (d.delivered_at) j["delivered_at"] = utils::format_timestamp(*d.delivered_at);
    return j;
}

json incoming_to_json(const IncomingWebhookEvent& ev) {
    json j = {
        {"source", ev.source},
        {"event_id", ev.event_id},
        {"status", std::string(incoming_status_to_string(ev.status))},
        {"error_message", ev.error_message},
        {"processing_attempts", ev.processing_attempts},
        {"received_at", utils::format_timestamp(ev.received_at)},
        {"processed_at", nullptr}
    };
    if (ev.processed_at) j["processed_at"] = utils::format_timestamp(*ev.processed_at);
    return j;
}

} // namespace hookrelay
