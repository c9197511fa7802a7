#pragma once

#include "webhook/webhook_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hookrelay {

/**
 * @brief Durable table of outbound endpoints (webhook_endpoints)
 *
 * Backend failures throw StorageError.
 */
class IEndpointStore {
public:
    virtual ~IEndpointStore() = default;

    /// @return false if the id already exists
    [[nodiscard]] virtual bool insert(const WebhookEndpoint& endpoint) = 0;

    [[nodiscard]] virtual std::optional<WebhookEndpoint> get(const std::string& id) = 0;

    [[nodiscard]] virtual std::vector<WebhookEndpoint> list_by_owner(const std::string& owner_id) = 0;

    /// Enabled endpoints of one owner; subscription filtering is the caller's
    [[nodiscard]] virtual std::vector<WebhookEndpoint> list_enabled(const std::string& owner_id) = 0;

    /// Replace every mutable column; @return false if the id is unknown
    [[nodiscard]] virtual bool update(const WebhookEndpoint& endpoint) = 0;

    [[nodiscard]] virtual bool remove(const std::string& id) = 0;
};

} // namespace hookrelay
