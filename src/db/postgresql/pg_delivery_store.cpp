#include "db/postgresql/pg_delivery_store.hpp"
#include "db/postgresql/pg_store_support.hpp"
#include "core/utils.hpp"

#include <format>

namespace hookrelay {

namespace {

constexpr const char* kColumns =
    "id, endpoint_id, event_id, event_type, payload, status, attempts, next_attempt_at_ms, "
    "last_response_status, last_response_body, last_error, version, created_at_ms, "
    "updated_at_ms, claimed_at_ms, delivered_at_ms";

std::string status_param(DeliveryStatus s) {
    return std::string(delivery_status_to_string(s));
}

WebhookDelivery delivery_from_row(const DbRow& row) {
    WebhookDelivery d;
    d.id = pg::text_col(row, 0);
    d.endpoint_id = pg::text_col(row, 1);
    d.event_id = pg::text_col(row, 2);

    const auto type_name = pg::text_col(row, 3);
    if (const auto type = parse_event_type(type_name)) {
        d.event_type = *type;
    } else {
        utils::log::warn(std::format("Delivery {} has unknown event type '{}'", d.id, type_name));
    }

    d.payload = pg::text_col(row, 4);
    d.status = parse_delivery_status(pg::text_col(row, 5)).value_or(DeliveryStatus::PENDING);
    d.attempts = static_cast<uint32_t>(pg::int_col(row, 6));
    d.next_attempt_at = pg::time_col(row, 7);
    d.last_response_status = pg::opt_int_col(row, 8);
    d.last_response_body = pg::text_col(row, 9);
    d.last_error = pg::text_col(row, 10);
    d.version = static_cast<uint64_t>(pg::int_col(row, 11));
    d.created_at = pg::time_col(row, 12);
    d.updated_at = pg::time_col(row, 13);
    d.claimed_at = pg::opt_time_col(row, 14);
    d.delivered_at = pg::opt_time_col(row, 15);
    return d;
}

std::vector<WebhookDelivery> deliveries_from(const DbResultSet& res) {
    std::vector<WebhookDelivery> out;
    out.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        out.push_back(delivery_from_row(row));
    }
    return out;
}

std::optional<std::string> opt_status_param(const std::optional<int>& status) {
    if (!status) return std::nullopt;
    return std::to_string(*status);
}

} // namespace

PgDeliveryStore::PgDeliveryStore(std::shared_ptr<IConnectionPool> pool)
    : pool_(std::move(pool)) {}

bool PgDeliveryStore::enqueue(const WebhookDelivery& d) {
    const auto res = pg::run(*pool_,
        "INSERT INTO webhook_deliveries (id, endpoint_id, event_id, event_type, payload, status, "
        "attempts, next_attempt_at_ms, version, created_at_ms, updated_at_ms) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11) "
        "ON CONFLICT DO NOTHING",
        {d.id, d.endpoint_id, d.event_id, std::string(event_type_to_string(d.event_type)),
         d.payload, status_param(d.status), std::to_string(d.attempts),
         pg::ms_param(d.next_attempt_at), std::to_string(d.version),
         pg::ms_param(d.created_at), pg::ms_param(d.updated_at)});
    return res.affected_rows == 1;
}

std::optional<WebhookDelivery> PgDeliveryStore::get(const std::string& id) {
    const auto res = pg::run(*pool_,
        std::format("SELECT {} FROM webhook_deliveries WHERE id = $1", kColumns), {id});
    if (res.rows.empty()) return std::nullopt;
    return delivery_from_row(res.rows.front());
}

std::vector<WebhookDelivery> PgDeliveryStore::claim_due(DeliveryStatus status,
                                                        std::chrono::system_clock::time_point now,
                                                        size_t limit) {
    if (limit == 0) return {};

    // RETURNING order is unspecified; callers do not depend on it
    return deliveries_from(pg::run(*pool_, std::format(
        "UPDATE webhook_deliveries d SET status = 'in_flight', claimed_at_ms = $2, "
        "updated_at_ms = $2, version = d.version + 1 "
        "FROM (SELECT id AS due_id FROM webhook_deliveries "
        "      WHERE status = $1 AND next_attempt_at_ms <= $2 "
        "      ORDER BY next_attempt_at_ms LIMIT $3 FOR UPDATE SKIP LOCKED) due "
        "WHERE d.id = due.due_id RETURNING {}", kColumns),
        {status_param(status), pg::ms_param(now), std::to_string(limit)}));
}

bool PgDeliveryStore::finish(const std::string& id, uint64_t expected_version, DeliveryStatus to,
                             uint32_t attempts,
                             std::optional<std::chrono::system_clock::time_point> next_attempt_at,
                             const AttemptRecord& attempt,
                             std::chrono::system_clock::time_point now) {
    const auto delivered_at = to == DeliveryStatus::DELIVERED
        ? std::optional<std::string>(pg::ms_param(now)) : std::nullopt;

    const auto res = pg::run(*pool_,
        "UPDATE webhook_deliveries SET status = $3, attempts = $4, "
        "next_attempt_at_ms = COALESCE($5::bigint, next_attempt_at_ms), "
        "last_response_status = $6::integer, last_response_body = $7, last_error = $8, "
        "updated_at_ms = $9, claimed_at_ms = NULL, delivered_at_ms = COALESCE($10::bigint, delivered_at_ms), "
        "version = version + 1 "
        "WHERE id = $1 AND version = $2 AND status = 'in_flight'",
        {id, std::to_string(expected_version), status_param(to), std::to_string(attempts),
         pg::ms_param(next_attempt_at), opt_status_param(attempt.response_status),
         attempt.response_body, attempt.error, pg::ms_param(now), delivered_at});
    return res.affected_rows == 1;
}

bool PgDeliveryStore::mark_delivered(const std::string& id, uint64_t expected_version,
                                     uint32_t attempts, const AttemptRecord& attempt,
                                     std::chrono::system_clock::time_point now) {
    return finish(id, expected_version, DeliveryStatus::DELIVERED, attempts,
                  std::nullopt, attempt, now);
}

bool PgDeliveryStore::mark_retry(const std::string& id, uint64_t expected_version,
                                 uint32_t attempts,
                                 std::chrono::system_clock::time_point next_attempt_at,
                                 const AttemptRecord& attempt,
                                 std::chrono::system_clock::time_point now) {
    return finish(id, expected_version, DeliveryStatus::PENDING_RETRY, attempts,
                  next_attempt_at, attempt, now);
}

bool PgDeliveryStore::mark_exhausted(const std::string& id, uint64_t expected_version,
                                     uint32_t attempts, const AttemptRecord& attempt,
                                     std::chrono::system_clock::time_point now) {
    return finish(id, expected_version, DeliveryStatus::FAILED_EXHAUSTED, attempts,
                  std::nullopt, attempt, now);
}

bool PgDeliveryStore::release_claim(const std::string& id, uint64_t expected_version,
                                    std::chrono::system_clock::time_point next_attempt_at,
                                    std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_deliveries SET status = 'pending_retry', next_attempt_at_ms = $3, "
        "updated_at_ms = $4, claimed_at_ms = NULL, version = version + 1 "
        "WHERE id = $1 AND version = $2 AND status = 'in_flight'",
        {id, std::to_string(expected_version), pg::ms_param(next_attempt_at),
         pg::ms_param(now)});
    return res.affected_rows == 1;
}

bool PgDeliveryStore::cancel(const std::string& id, std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_deliveries SET status = 'cancelled', updated_at_ms = $2, "
        "version = version + 1 "
        "WHERE id = $1 AND status IN ('pending', 'pending_retry')",
        {id, pg::ms_param(now)});
    return res.affected_rows == 1;
}

size_t PgDeliveryStore::recover_stale_in_flight(std::chrono::system_clock::time_point claimed_before,
                                                std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_deliveries SET status = 'pending_retry', next_attempt_at_ms = $2, "
        "updated_at_ms = $2, claimed_at_ms = NULL, version = version + 1 "
        "WHERE status = 'in_flight' AND claimed_at_ms < $1",
        {pg::ms_param(claimed_before), pg::ms_param(now)});
    return static_cast<size_t>(res.affected_rows);
}

std::vector<WebhookDelivery> PgDeliveryStore::list(std::optional<DeliveryStatus> status,
                                                   size_t limit) {
    const std::optional<std::string> status_filter = status
        ? std::optional<std::string>(status_param(*status)) : std::nullopt;
    return deliveries_from(pg::run(*pool_, std::format(
        "SELECT {} FROM webhook_deliveries WHERE ($1::text IS NULL OR status = $1) "
        "ORDER BY created_at_ms, id LIMIT $2", kColumns),
        {status_filter, std::to_string(limit)}));
}

std::map<DeliveryStatus, size_t> PgDeliveryStore::count_by_status() {
    const auto res = pg::run(*pool_,
        "SELECT status, COUNT(*) FROM webhook_deliveries GROUP BY status");
    std::map<DeliveryStatus, size_t> counts;
    for (const auto& row : res.rows) {
        if (const auto s = parse_delivery_status(pg::text_col(row, 0))) {
            counts[*s] = static_cast<size_t>(pg::int_col(row, 1));
        }
    }
    return counts;
}

} // namespace hookrelay
