#pragma once

#include "webhook/iendpoint_store.hpp"

#include <map>
#include <shared_mutex>

namespace hookrelay {

class InMemoryEndpointStore : public IEndpointStore {
public:
    bool insert(const WebhookEndpoint& endpoint) override;
    std::optional<WebhookEndpoint> get(const std::string& id) override;
    std::vector<WebhookEndpoint> list_by_owner(const std::string& owner_id) override;
    std::vector<WebhookEndpoint> list_enabled(const std::string& owner_id) override;
    bool update(const WebhookEndpoint& endpoint) override;
    bool remove(const std::string& id) override;

private:
    // Ordered by id so listings are stable
    std::map<std::string, WebhookEndpoint> endpoints_;
    mutable std::shared_mutex mutex_;
};

} // namespace hookrelay
