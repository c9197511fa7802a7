#pragma once

#include "incoming/incoming_types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hookrelay {

/**
 * @brief Inbound dedup table (webhook_events)
 *
 * Status changes are compare-and-set on the current status. Backend
 * failures throw StorageError.
 */
class IIncomingEventStore {
public:
    virtual ~IIncomingEventStore() = default;

    /// @return false if (source, event_id) already exists; the row is untouched
    [[nodiscard]] virtual bool insert_if_absent(const IncomingWebhookEvent& event) = 0;

    [[nodiscard]] virtual std::optional<IncomingWebhookEvent> get(
        const std::string& source, const std::string& event_id) = 0;

    /// RECEIVED → PROCESSING, bumps processing_attempts
    [[nodiscard]] virtual bool mark_processing(
        const std::string& source, const std::string& event_id,
        std::chrono::system_clock::time_point now) = 0;

    /// PROCESSING → PROCESSED
    [[nodiscard]] virtual bool mark_processed(
        const std::string& source, const std::string& event_id,
        std::chrono::system_clock::time_point now) = 0;

    /// PROCESSING → ERROR
    [[nodiscard]] virtual bool mark_error(
        const std::string& source, const std::string& event_id,
        const std::string& error_message,
        std::chrono::system_clock::time_point now) = 0;

    /// ERROR → RECEIVED (operator retry); error_message cleared
    [[nodiscard]] virtual bool reset_for_retry(
        const std::string& source, const std::string& event_id,
        std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief RECEIVED rows not touched since updated_before, oldest first
     *
     * Feeds the recovery pass: accepted events whose hand-off to the
     * processing queue was lost (queue full, shutdown, crash).
     */
    [[nodiscard]] virtual std::vector<IncomingWebhookEvent> list_unprocessed(
        std::chrono::system_clock::time_point updated_before, size_t limit) = 0;

    /// PROCESSING rows not touched since updated_before → RECEIVED. @return rows moved
    virtual size_t recover_stale_processing(
        std::chrono::system_clock::time_point updated_before,
        std::chrono::system_clock::time_point now) = 0;

    /// Oldest first; no filter when status is unset
    [[nodiscard]] virtual std::vector<IncomingWebhookEvent> list(
        std::optional<IncomingStatus> status, size_t limit) = 0;

    [[nodiscard]] virtual std::map<IncomingStatus, size_t> count_by_status() = 0;
};

} // namespace hookrelay
