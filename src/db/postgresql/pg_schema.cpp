#include "db/postgresql/pg_schema.hpp"
#include "db/postgresql/pg_store_support.hpp"
#include "core/utils.hpp"

#include <array>
#include <string_view>

namespace hookrelay {

namespace {

constexpr std::array<std::string_view, 8> kStatements = {
    R"SQL(
CREATE TABLE IF NOT EXISTS idempotency_keys (
    scope                  TEXT    NOT NULL,
    key                    TEXT    NOT NULL,
    request_hash           TEXT    NOT NULL,
    status                 TEXT    NOT NULL,
    lock_token             TEXT    NOT NULL,
    response_status        INTEGER,
    response_body          TEXT,
    response_content_type  TEXT,
    created_at_ms          BIGINT  NOT NULL,
    locked_at_ms           BIGINT  NOT NULL,
    completed_at_ms        BIGINT,
    expires_at_ms          BIGINT  NOT NULL,
    PRIMARY KEY (scope, key)
))SQL",
    "CREATE INDEX IF NOT EXISTS idx_idempotency_keys_expires ON idempotency_keys (expires_at_ms)",

    R"SQL(
CREATE TABLE IF NOT EXISTS webhook_endpoints (
    id             TEXT     PRIMARY KEY,
    owner_id       TEXT     NOT NULL,
    url            TEXT     NOT NULL,
    secret         TEXT     NOT NULL,
    events         TEXT     NOT NULL,
    enabled        BOOLEAN  NOT NULL DEFAULT TRUE,
    description    TEXT     NOT NULL DEFAULT '',
    created_at_ms  BIGINT   NOT NULL,
    updated_at_ms  BIGINT   NOT NULL
))SQL",
    "CREATE INDEX IF NOT EXISTS idx_webhook_endpoints_owner ON webhook_endpoints (owner_id)",

    // No foreign key: deliveries outlive a removed endpoint
    R"SQL(
CREATE TABLE IF NOT EXISTS webhook_deliveries (
    id                    TEXT     PRIMARY KEY,
    endpoint_id           TEXT     NOT NULL,
    event_id              TEXT     NOT NULL,
    event_type            TEXT     NOT NULL,
    payload               TEXT     NOT NULL,
    status                TEXT     NOT NULL,
    attempts              INTEGER  NOT NULL DEFAULT 0,
    next_attempt_at_ms    BIGINT   NOT NULL,
    last_response_status  INTEGER,
    last_response_body    TEXT     NOT NULL DEFAULT '',
    last_error            TEXT     NOT NULL DEFAULT '',
    version               BIGINT   NOT NULL DEFAULT 0,
    created_at_ms         BIGINT   NOT NULL,
    updated_at_ms         BIGINT   NOT NULL,
    claimed_at_ms         BIGINT,
    delivered_at_ms       BIGINT,
    UNIQUE (endpoint_id, event_id)
))SQL",
    "CREATE INDEX IF NOT EXISTS idx_webhook_deliveries_due ON webhook_deliveries (status, next_attempt_at_ms)",

    R"SQL(
CREATE TABLE IF NOT EXISTS webhook_events (
    source               TEXT     NOT NULL,
    event_id             TEXT     NOT NULL,
    payload              TEXT     NOT NULL,
    status               TEXT     NOT NULL,
    error_message        TEXT     NOT NULL DEFAULT '',
    processing_attempts  INTEGER  NOT NULL DEFAULT 0,
    received_at_ms       BIGINT   NOT NULL,
    updated_at_ms        BIGINT   NOT NULL,
    processed_at_ms      BIGINT,
    PRIMARY KEY (source, event_id)
))SQL",
    "CREATE INDEX IF NOT EXISTS idx_webhook_events_status ON webhook_events (status)",
};

} // namespace

void PgSchema::migrate(IConnectionPool& pool) {
    for (const auto stmt : kStatements) {
        (void)pg::run(pool, std::string(stmt));
    }
    utils::log::info("PostgreSQL schema is up to date");
}

} // namespace hookrelay
