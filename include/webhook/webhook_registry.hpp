#pragma once

#include "core/clock.hpp"
#include "core/error.hpp"
#include "webhook/iendpoint_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hookrelay {

/**
 * @brief Owner-facing management of outbound webhook endpoints
 *
 * Every owner-facing call checks that the endpoint belongs to owner_id and
 * answers NOT_FOUND otherwise. Listing and lookups strip the secret; only
 * create() and rotate_secret() ever return it.
 */
class WebhookRegistry {
public:
    struct Config {
        bool require_https = true;
    };

    struct CreateRequest {
        std::string url;
        EventSubscription subscription;
        std::string description;
        bool enabled = true;
    };

    WebhookRegistry(std::shared_ptr<IEndpointStore> store,
                    std::shared_ptr<Clock> clock,
                    Config config);

    /// @return the new endpoint including its secret
    [[nodiscard]] Result<WebhookEndpoint> create(const std::string& owner_id,
                                                 const CreateRequest& request);

    [[nodiscard]] Result<WebhookEndpoint> get(const std::string& owner_id,
                                              const std::string& id) const;

    [[nodiscard]] std::vector<WebhookEndpoint> list(const std::string& owner_id) const;

    /// @return the new secret
    [[nodiscard]] Result<std::string> rotate_secret(const std::string& owner_id,
                                                    const std::string& id);

    [[nodiscard]] Result<WebhookEndpoint> update_subscriptions(const std::string& owner_id,
                                                               const std::string& id,
                                                               const EventSubscription& subscription);

    [[nodiscard]] Result<WebhookEndpoint> set_enabled(const std::string& owner_id,
                                                      const std::string& id,
                                                      bool enabled);

    /// Existing deliveries stay and are skipped at send time
    [[nodiscard]] Result<bool> remove(const std::string& owner_id, const std::string& id);

    /// Enabled endpoints of owner_id subscribed to type (secrets included)
    [[nodiscard]] std::vector<WebhookEndpoint> matching_endpoints(const std::string& owner_id,
                                                                  EventType type) const;

    /// Internal lookup for the delivery worker (secret included)
    [[nodiscard]] std::optional<WebhookEndpoint> find_for_delivery(const std::string& id) const;

    /**
     * @brief URL admission rule: http(s) scheme, https unless disabled,
     * non-empty host
     */
    [[nodiscard]] static Result<bool> validate_url(const std::string& url, bool require_https);

private:
    Result<WebhookEndpoint> load_owned(const std::string& owner_id, const std::string& id) const;
    Result<WebhookEndpoint> save(WebhookEndpoint endpoint);
    static WebhookEndpoint redacted(WebhookEndpoint endpoint);

    std::shared_ptr<IEndpointStore> store_;
    std::shared_ptr<Clock> clock_;
    Config config_;
};

} // namespace hookrelay
