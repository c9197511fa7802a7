#pragma once

#include "db/iconnection_pool.hpp"
#include "incoming/iincoming_event_store.hpp"

#include <memory>

namespace hookrelay {

class PgIncomingEventStore : public IIncomingEventStore {
public:
    explicit PgIncomingEventStore(std::shared_ptr<IConnectionPool> pool);

    bool insert_if_absent(const IncomingWebhookEvent& event) override;
    std::optional<IncomingWebhookEvent> get(const std::string& source,
                                            const std::string& event_id) override;
    bool mark_processing(const std::string& source, const std::string& event_id,
                         std::chrono::system_clock::time_point now) override;
    bool mark_processed(const std::string& source, const std::string& event_id,
                        std::chrono::system_clock::time_point now) override;
    bool mark_error(const std::string& source, const std::string& event_id,
                    const std::string& error_message,
                    std::chrono::system_clock::time_point now) override;
    bool reset_for_retry(const std::string& source, const std::string& event_id,
                         std::chrono::system_clock::time_point now) override;
    std::vector<IncomingWebhookEvent> list_unprocessed(
        std::chrono::system_clock::time_point updated_before, size_t limit) override;
    size_t recover_stale_processing(std::chrono::system_clock::time_point updated_before,
                                    std::chrono::system_clock::time_point now) override;
    std::vector<IncomingWebhookEvent> list(std::optional<IncomingStatus> status,
                                           size_t limit) override;
    std::map<IncomingStatus, size_t> count_by_status() override;

private:
    std::shared_ptr<IConnectionPool> pool_;
};

} // namespace hookrelay
