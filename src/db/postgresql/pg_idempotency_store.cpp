#include "db/postgresql/pg_idempotency_store.hpp"
#include "db/postgresql/pg_store_support.hpp"

namespace hookrelay {

namespace {

constexpr const char* kColumns =
    "scope, key, request_hash, status, lock_token, response_status, response_body, "
    "response_content_type, created_at_ms, locked_at_ms, completed_at_ms, expires_at_ms";

IdempotencyRecord record_from_row(const DbRow& row) {
    IdempotencyRecord rec;
    rec.scope = pg::text_col(row, 0);
    rec.key = pg::text_col(row, 1);
    rec.request_hash = pg::text_col(row, 2);
    rec.status = pg::text_col(row, 3) == "completed"
        ? IdempotencyStatus::COMPLETED : IdempotencyStatus::LOCKED;
    rec.lock_token = pg::text_col(row, 4);
    if (rec.status == IdempotencyStatus::COMPLETED) {
        CachedResponse resp;
        resp.status = pg::opt_int_col(row, 5).value_or(200);
        resp.body = pg::text_col(row, 6);
        resp.content_type = pg::text_col(row, 7);
        rec.response = std::move(resp);
    }
    rec.created_at = pg::time_col(row, 8);
    rec.locked_at = pg::time_col(row, 9);
    rec.completed_at = pg::opt_time_col(row, 10);
    rec.expires_at = pg::time_col(row, 11);
    return rec;
}

} // namespace

PgIdempotencyStore::PgIdempotencyStore(std::shared_ptr<IConnectionPool> pool)
    : pool_(std::move(pool)) {}

IIdempotencyStore::InsertResult PgIdempotencyStore::insert_if_absent(const IdempotencyRecord& record) {
    const auto inserted = pg::run(*pool_,
        "INSERT INTO idempotency_keys (scope, key, request_hash, status, lock_token, "
        "created_at_ms, locked_at_ms, expires_at_ms) "
        "VALUES ($1, $2, $3, 'locked', $4, $5, $6, $7) "
        "ON CONFLICT (scope, key) DO NOTHING RETURNING key",
        {record.scope, record.key, record.request_hash, record.lock_token,
         pg::ms_param(record.created_at), pg::ms_param(record.locked_at),
         pg::ms_param(record.expires_at)});

    if (!inserted.rows.empty()) {
        return {true, std::nullopt};
    }
    // Lost the race; existing may be empty if the winner was deleted meanwhile
    return {false, find(record.scope, record.key)};
}

std::optional<IdempotencyRecord> PgIdempotencyStore::find(const std::string& scope,
                                                          const std::string& key) {
    const auto res = pg::run(*pool_,
        std::string("SELECT ") + kColumns + " FROM idempotency_keys WHERE scope = $1 AND key = $2",
        {scope, key});
    if (res.rows.empty()) return std::nullopt;
    return record_from_row(res.rows.front());
}

bool PgIdempotencyStore::complete(const std::string& scope, const std::string& key,
                                  const std::string& lock_token,
                                  const CachedResponse& response,
                                  std::chrono::system_clock::time_point completed_at) {
    const auto res = pg::run(*pool_,
        "UPDATE idempotency_keys SET status = 'completed', response_status = $4, "
        "response_body = $5, response_content_type = $6, completed_at_ms = $7 "
        "WHERE scope = $1 AND key = $2 AND status = 'locked' AND lock_token = $3",
        {scope, key, lock_token, std::to_string(response.status), response.body,
         response.content_type, pg::ms_param(completed_at)});
    return res.affected_rows == 1;
}

bool PgIdempotencyStore::release(const std::string& scope, const std::string& key,
                                 const std::string& lock_token) {
    const auto res = pg::run(*pool_,
        "DELETE FROM idempotency_keys "
        "WHERE scope = $1 AND key = $2 AND status = 'locked' AND lock_token = $3",
        {scope, key, lock_token});
    return res.affected_rows == 1;
}

bool PgIdempotencyStore::steal_lock(const std::string& scope, const std::string& key,
                                    const std::string& expected_token,
                                    const std::string& new_token,
                                    std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "UPDATE idempotency_keys SET lock_token = $4, locked_at_ms = $5 "
        "WHERE scope = $1 AND key = $2 AND status = 'locked' AND lock_token = $3",
        {scope, key, expected_token, new_token, pg::ms_param(now)});
    return res.affected_rows == 1;
}

bool PgIdempotencyStore::remove_if_expired(const std::string& scope, const std::string& key,
                                           std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "DELETE FROM idempotency_keys WHERE scope = $1 AND key = $2 AND expires_at_ms <= $3",
        {scope, key, pg::ms_param(now)});
    return res.affected_rows == 1;
}

size_t PgIdempotencyStore::purge_expired(std::chrono::system_clock::time_point now) {
    const auto res = pg::run(*pool_,
        "DELETE FROM idempotency_keys WHERE expires_at_ms <= $1",
        {pg::ms_param(now)});
    return static_cast<size_t>(res.affected_rows);
}

size_t PgIdempotencyStore::count() {
    const auto res = pg::run(*pool_, "SELECT COUNT(*) FROM idempotency_keys");
    return res.rows.empty() ? 0 : static_cast<size_t>(pg::int_col(res.rows.front(), 0));
}

} // namespace hookrelay
