#include "db/postgresql/pg_incoming_event_store.hpp"
#include "db/postgresql/pg_store_support.hpp"

#include <format>

namespace hookrelay {

namespace {

constexpr const char* kColumns =
    "source, event_id, payload, status, error_message, processing_attempts, "
    "received_at_ms, updated_at_ms, processed_at_ms";

IncomingWebhookEvent event_from_row(const DbRow& row) {
    IncomingWebhookEvent ev;
    ev.source = pg::text_col(row, 0);
    ev.event_id = pg::text_col(row, 1);
    ev.payload = pg::text_col(row, 2);
    ev.status = parse_incoming_status(pg::text_col(row, 3)).value_or(IncomingStatus::RECEIVED);
    ev.error_message = pg::text_col(row, 4);
    ev.processing_attempts = static_cast<uint32_t>(pg::int_col(row, 5));
    ev.received_at = pg::time_col(row, 6);
    ev.updated_at = pg::time_col(row, 7);
    ev.processed_at = pg::opt_time_col(row, 8);
    return ev;
}

} // namespace

PgIncomingEventStore::PgIncomingEventStore(std::shared_ptr<IConnectionPool> pool)
    : pool_(std::move(pool)) {}

bool PgIncomingEventStore::insert_if_absent(const IncomingWebhookEvent& ev) {
    const auto res = pg::run(*pool_,
        "INSERT INTO webhook_events (source, event_id, payload, status, error_message, "
        "processing_attempts, received_at_ms, updated_at_ms) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) ON CONFLICT (source, event_id) DO NOTHING",
        {ev.source, ev.event_id, ev.payload, std::string(incoming_status_to_string(ev.status)),
         ev.error_message, std::to_string(ev.processing_attempts),
         pg::ms_param(ev.received_at), pg::ms_param(ev.updated_at)});
    return res.affected_rows == 1;
}

std::optional<IncomingWebhookEvent> PgIncomingEventStore::get(const std::string& source,
                                                              const std::string& event_id) {
    const auto res = pg::run(*pool_,
        std::format("SELECT {} FROM webhook_events WHERE source = $1 AND event_id = $2", kColumns),
        {source, event_id});
    if (res.rows.empty()) return std::nullopt;
    return event_from_row(res.rows.front());
}

bool PgIncomingEventStore::mark_processing(const std::string& source, const std::string& event_id,
                                           std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_events SET status = 'processing', "
        "processing_attempts = processing_attempts + 1, updated_at_ms = $3 "
        "WHERE source = $1 AND event_id = $2 AND status = 'received'",
        {source, event_id, pg::ms_param(now)});
    return res.affected_rows == 1;
}

bool PgIncomingEventStore::mark_processed(const std::string& source, const std::string& event_id,
                                          std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_events SET status = 'processed', error_message = '', "
        "updated_at_ms = $3, processed_at_ms = $3 "
        "WHERE source = $1 AND event_id = $2 AND status = 'processing'",
        {source, event_id, pg::ms_param(now)});
    return res.affected_rows == 1;
}

bool PgIncomingEventStore::mark_error(const std::string& source, const std::string& event_id,
                                      const std::string& error_message,
                                      std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_events SET status = 'error', error_message = $3, updated_at_ms = $4 "
        "WHERE source = $1 AND event_id = $2 AND status = 'processing'",
        {source, event_id, error_message, pg::ms_param(now)});
    return res.affected_rows == 1;
}

bool PgIncomingEventStore::reset_for_retry(const std::string& source, const std::string& event_id,
                                           std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_events SET status = 'received', error_message = '', updated_at_ms = $3 "
        "WHERE source = $1 AND event_id = $2 AND status = 'error'",
        {source, event_id, pg::ms_param(now)});
    return res.affected_rows == 1;
}

std::vector<IncomingWebhookEvent> PgIncomingEventStore::list_unprocessed(
    std::chrono::system_clock::time_point updated_before, size_t limit) {
    const auto res = pg::run(*pool_, std::format(
        "SELECT {} FROM webhook_events WHERE status = 'received' AND updated_at_ms <= $1 "
        "ORDER BY received_at_ms, source, event_id LIMIT $2", kColumns),
        {pg::ms_param(updated_before), std::to_string(limit)});

    std::vector<IncomingWebhookEvent> out;
    out.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        out.push_back(event_from_row(row));
    }
    return out;
}

size_t PgIncomingEventStore::recover_stale_processing(
    std::chrono::system_clock::time_point updated_before,
    std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_events SET status = 'received', updated_at_ms = $2 "
        "WHERE status = 'processing' AND updated_at_ms < $1",
        {pg::ms_param(updated_before), pg::ms_param(now)});
    return static_cast<size_t>(res.affected_rows);
}

std::vector<IncomingWebhookEvent> PgIncomingEventStore::list(std::optional<IncomingStatus> status,
                                                             size_t limit) {
    const std::optional<std::string> status_filter = status
        ? std::optional<std::string>(std::string(incoming_status_to_string(*status)))
        : std::nullopt;
    const auto res = pg::run(*pool_, std::format(
        "SELECT {} FROM webhook_events WHERE ($1::text IS NULL OR status = $1) "
        "ORDER BY received_at_ms, source, event_id LIMIT $2", kColumns),
        {status_filter, std::to_string(limit)});

    std::vector<IncomingWebhookEvent> out;
    out.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        out.push_back(event_from_row(row));
    }
    return out;
}

std::map<IncomingStatus, size_t> PgIncomingEventStore::count_by_status() {
    const auto res = pg::run(*pool_,
        "SELECT status, COUNT(*) FROM webhook_events GROUP BY status");
    std::map<IncomingStatus, size_t> counts;
    for (const auto& row : res.rows) {
        if (const auto s = parse_incoming_status(pg::text_col(row, 0))) {
            counts[*s] = static_cast<size_t>(pg::int_col(row, 1));
        }
    }
    return counts;
}

} // namespace hookrelay
