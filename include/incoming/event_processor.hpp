#pragma once

#include "core/error.hpp"
#include "incoming/incoming_types.hpp"

namespace hookrelay {

/**
 * @brief Downstream handler for accepted inbound events
 *
 * Runs on the gateway's processing threads. A Result error or a thrown
 * exception both leave the event in ERROR with the message recorded.
 */
class IEventProcessor {
public:
    virtual ~IEventProcessor() = default;

    [[nodiscard]] virtual Result<bool> process(const IncomingWebhookEvent& event) = 0;
};

/**
 * @brief Default processor: records receipt in the log and succeeds
 */
class LoggingEventProcessor : public IEventProcessor {
public:
    [[nodiscard]] Result<bool> process(const IncomingWebhookEvent& event) override;
};

} // namespace hookrelay
