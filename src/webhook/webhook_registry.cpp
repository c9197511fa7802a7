#include "webhook/webhook_registry.hpp"
#include "core/utils.hpp"
#include "security/signature_engine.hpp"

#include <format>

namespace hookrelay {

WebhookRegistry::WebhookRegistry(std::shared_ptr<IEndpointStore> store,
                                 std::shared_ptr<Clock> clock,
                                 Config config)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      config_(config) {}

Result<bool> WebhookRegistry::validate_url(const std::string& url, bool require_https) {
    std::string_view rest(url);
    if (rest.starts_with("https://")) {
        rest.remove_prefix(8);
    } else if (rest.starts_with("http://")) {
        if (require_https) {
            return Result<bool>::error(ErrorCategory::VALIDATION,
                                       "Webhook URL must use https");
        }
        rest.remove_prefix(7);
    } else {
        return Result<bool>::error(ErrorCategory::VALIDATION,
                                   "Webhook URL must start with https://");
    }

    const auto host_end = rest.find_first_of(":/?#");
    const auto host = rest.substr(0, host_end);
    if (host.empty()) {
        return Result<bool>::error(ErrorCategory::VALIDATION, "Webhook URL has no host");
    }
    if (url.find_first_of(" \t\r\n") != std::string::npos) {
        return Result<bool>::error(ErrorCategory::VALIDATION,
                                   "Webhook URL contains whitespace");
    }
    return Result<bool>::ok(true);
}

Result<WebhookEndpoint> WebhookRegistry::create(const std::string& owner_id,
                                                const CreateRequest& request) {
    auto valid = validate_url(request.url, config_.require_https);
    if (valid.is_error()) {
        return Result<WebhookEndpoint>::error(valid.error_category(), valid.error_message());
    }
    if (request.subscription.empty()) {
        return Result<WebhookEndpoint>::error(ErrorCategory::VALIDATION,
                                              "At least one event type (or \"*\") is required");
    }

    const auto now = clock_->now();
    WebhookEndpoint ep;
    ep.id = utils::generate_id("we");
    ep.owner_id = owner_id;
    ep.url = request.url;
    ep.secret = SignatureEngine::generate_secret();
    ep.subscription = request.subscription;
    ep.enabled = request.enabled;
    ep.description = request.description;
    ep.created_at = now;
    ep.updated_at = now;

    if (!store_->insert(ep)) {
        return Result<WebhookEndpoint>::error(ErrorCategory::INTERNAL_ERROR,
                                              "Endpoint id collision");
    }
    utils::log::info(std::format("Webhook endpoint {} created for {} -> {}",
                                 ep.id, owner_id, ep.url));
    return Result<WebhookEndpoint>::ok(std::move(ep));
}

Result<WebhookEndpoint> WebhookRegistry::get(const std::string& owner_id,
                                             const std::string& id) const {
    auto loaded = load_owned(owner_id, id);
    if (loaded.is_error()) return loaded;
    return Result<WebhookEndpoint>::ok(redacted(loaded.value()));
}

std::vector<WebhookEndpoint> WebhookRegistry::list(const std::string& owner_id) const {
    auto endpoints = store_->list_by_owner(owner_id);
    for (auto& ep : endpoints) {
        ep.secret.clear();
    }
    return endpoints;
}

Result<std::string> WebhookRegistry::rotate_secret(const std::string& owner_id,
                                                   const std::string& id) {
    auto loaded = load_owned(owner_id, id);
    if (loaded.is_error()) {
        return Result<std::string>::error(loaded.error_category(), loaded.error_message());
    }
    auto ep = loaded.value();
    ep.secret = SignatureEngine::generate_secret();
    std::string secret = ep.secret;

    auto saved = save(std::move(ep));
    if (saved.is_error()) {
        return Result<std::string>::error(saved.error_category(), saved.error_message());
    }
    utils::log::info(std::format("Webhook endpoint {} secret rotated", id));
    return Result<std::string>::ok(std::move(secret));
}

Result<WebhookEndpoint> WebhookRegistry::update_subscriptions(const std::string& owner_id,
                                                              const std::string& id,
                                                              const EventSubscription& subscription) {
    if (subscription.empty()) {
        return Result<WebhookEndpoint>::error(ErrorCategory::VALIDATION,
                                              "At least one event type (or \"*\") is required");
    }
    auto loaded = load_owned(owner_id, id);
    if (loaded.is_error()) return loaded;

    auto ep = loaded.value();
    ep.subscription = subscription;
    auto saved = save(std::move(ep));
    if (saved.is_error()) return saved;
    return Result<WebhookEndpoint>::ok(redacted(saved.value()));
}

Result<WebhookEndpoint> WebhookRegistry::set_enabled(const std::string& owner_id,
                                                     const std::string& id,
                                                     bool enabled) {
    auto loaded = load_owned(owner_id, id);
    if (loaded.is_error()) return loaded;

    auto ep = loaded.value();
    ep.enabled = enabled;
    auto saved = save(std::move(ep));
    if (saved.is_error()) return saved;
    utils::log::info(std::format("Webhook endpoint {} {}", id, enabled ? "enabled" : "disabled"));
    return Result<WebhookEndpoint>::ok(redacted(saved.value()));
}

Result<bool> WebhookRegistry::remove(const std::string& owner_id, const std::string& id) {
    auto loaded = load_owned(owner_id, id);
    if (loaded.is_error()) {
        return Result<bool>::error(loaded.error_category(), loaded.error_message());
    }
    if (!store_->remove(id)) {
        return Result<bool>::error(ErrorCategory::NOT_FOUND,
                                   std::format("Webhook endpoint {} not found", id));
    }
    utils::log::info(std::format("Webhook endpoint {} removed", id));
    return Result<bool>::ok(true);
}

std::vector<WebhookEndpoint> WebhookRegistry::matching_endpoints(const std::string& owner_id,
                                                                 EventType type) const {
    std::vector<WebhookEndpoint> matches;
    for (auto& ep : store_->list_enabled(owner_id)) {
        if (subscription_matches(ep.subscription, type)) {
            matches.push_back(std::move(ep));
        }
    }
    return matches;
}

std::optional<WebhookEndpoint> WebhookRegistry::find_for_delivery(const std::string& id) const {
    return store_->get(id);
}

Result<WebhookEndpoint> WebhookRegistry::load_owned(const std::string& owner_id,
                                                    const std::string& id) const {
    auto ep = store_->get(id);
    // Foreign endpoints look exactly like missing ones
    if (!ep || ep->owner_id != owner_id) {
        return Result<WebhookEndpoint>::error(ErrorCategory::NOT_FOUND,
                                              std::format("Webhook endpoint {} not found", id));
    }
    return Result<WebhookEndpoint>::ok(std::move(*ep));
}

Result<WebhookEndpoint> WebhookRegistry::save(WebhookEndpoint endpoint) {
    endpoint.updated_at = clock_->now();
    if (!store_->update(endpoint)) {
        return Result<WebhookEndpoint>::error(ErrorCategory::NOT_FOUND,
                                              std::format("Webhook endpoint {} not found", endpoint.id));
    }
    return Result<WebhookEndpoint>::ok(std::move(endpoint));
}

WebhookEndpoint WebhookRegistry::redacted(WebhookEndpoint endpoint) {
    endpoint.secret.clear();
    return endpoint;
}

} // namespace hookrelay
