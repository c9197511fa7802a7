#include "webhook/memory_endpoint_store.hpp"

#include <mutex>

namespace hookrelay {

bool InMemoryEndpointStore::insert(const WebhookEndpoint& endpoint) {
    std::unique_lock lock(mutex_);
    return endpoints_.try_emplace(endpoint.id, endpoint).second;
}

std::optional<WebhookEndpoint> InMemoryEndpointStore::get(const std::string& id) {
    std::shared_lock lock(mutex_);
    const auto it = endpoints_.find(id);
    if (it == endpoints_.end()) return std::nullopt;
    return it->second;
}

std::vector<WebhookEndpoint> InMemoryEndpointStore::list_by_owner(const std::string& owner_id) {
    std::shared_lock lock(mutex_);
    std::vector<WebhookEndpoint> result;
    for (const auto& [_, ep] : endpoints_) {
        if (ep.owner_id == owner_id) result.push_back(ep);
    }
    return result;
}

std::vector<WebhookEndpoint> InMemoryEndpointStore::list_enabled(const std::string& owner_id) {
    std::shared_lock lock(mutex_);
    std::vector<WebhookEndpoint> result;
    for (const auto& [_, ep] : endpoints_) {
        if (ep.enabled && ep.owner_id == owner_id) result.push_back(ep);
    }
    return result;
}

bool InMemoryEndpointStore::update(const WebhookEndpoint& endpoint) {
    std::unique_lock lock(mutex_);
    const auto it = endpoints_.find(endpoint.id);
    if (it == endpoints_.end()) return false;
    it->second = endpoint;
    return true;
}

bool InMemoryEndpointStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    return endpoints_.erase(id) > 0;
}

} // namespace hookrelay
