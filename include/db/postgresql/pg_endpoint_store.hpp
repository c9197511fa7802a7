#pragma once

#include "db/iconnection_pool.hpp"
#include "webhook/iendpoint_store.hpp"

#include <memory>

namespace hookrelay {

class PgEndpointStore : public IEndpointStore {
public:
    explicit PgEndpointStore(std::shared_ptr<IConnectionPool> pool);

    bool insert(const WebhookEndpoint& endpoint) override;
    std::optional<WebhookEndpoint> get(const std::string& id) override;
    std::vector<WebhookEndpoint> list_by_owner(const std::string& owner_id) override;
    std::vector<WebhookEndpoint> list_enabled(const std::string& owner_id) override;
    bool update(const WebhookEndpoint& endpoint) override;
    bool remove(const std::string& id) override;

private:
    std::shared_ptr<IConnectionPool> pool_;
};

} // namespace hookrelay
