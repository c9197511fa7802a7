#include "db/postgresql/pg_endpoint_store.hpp"
#include "db/postgresql/pg_store_support.hpp"
#include "core/utils.hpp"

#include <format>

namespace hookrelay {

namespace {

constexpr const char* kColumns =
    "id, owner_id, url, secret, events, enabled, description, created_at_ms, updated_at_ms";

// events column: comma-joined wire names, or "*"
std::string events_to_column(const EventSubscription& sub) {
    std::string out;
    for (const auto& name : subscription_to_strings(sub)) {
        if (!out.empty()) out += ',';
        out += name;
    }
    return out;
}

EventSubscription events_from_column(const std::string& column, const std::string& endpoint_id) {
    EventSubscription sub;
    std::string unknown;
    if (!parse_subscription(utils::split(column, ','), sub, &unknown)) {
        utils::log::warn(std::format("Endpoint {} has unknown event '{}' stored; ignored",
                                     endpoint_id, unknown));
    }
    return sub;
}

WebhookEndpoint endpoint_from_row(const DbRow& row) {
    WebhookEndpoint ep;
    ep.id = pg::text_col(row, 0);
    ep.owner_id = pg::text_col(row, 1);
    ep.url = pg::text_col(row, 2);
    ep.secret = pg::text_col(row, 3);
    ep.subscription = events_from_column(pg::text_col(row, 4), ep.id);
    ep.enabled = pg::bool_col(row, 5);
    ep.description = pg::text_col(row, 6);
    ep.created_at = pg::time_col(row, 7);
    ep.updated_at = pg::time_col(row, 8);
    return ep;
}

std::vector<WebhookEndpoint> endpoints_from(const DbResultSet& res) {
    std::vector<WebhookEndpoint> out;
    out.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        out.push_back(endpoint_from_row(row));
    }
    return out;
}

} // namespace

PgEndpointStore::PgEndpointStore(std::shared_ptr<IConnectionPool> pool)
    : pool_(std::move(pool)) {}

bool PgEndpointStore::insert(const WebhookEndpoint& endpoint) {
    const auto res = pg::run(*pool_,
        "INSERT INTO webhook_endpoints (id, owner_id, url, secret, events, enabled, "
        "description, created_at_ms, updated_at_ms) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) ON CONFLICT (id) DO NOTHING",
        {endpoint.id, endpoint.owner_id, endpoint.url, endpoint.secret,
         events_to_column(endpoint.subscription), std::string(utils::booltostr(endpoint.enabled)),
         endpoint.description, pg::ms_param(endpoint.created_at),
         pg::ms_param(endpoint.updated_at)});
    return res.affected_rows == 1;
}

std::optional<WebhookEndpoint> PgEndpointStore::get(const std::string& id) {
    const auto res = pg::run(*pool_,
        std::format("SELECT {} FROM webhook_endpoints WHERE id = $1", kColumns), {id});
    if (res.rows.empty()) return std::nullopt;
    return endpoint_from_row(res.rows.front());
}

std::vector<WebhookEndpoint> PgEndpointStore::list_by_owner(const std::string& owner_id) {
    return endpoints_from(pg::run(*pool_,
        std::format("SELECT {} FROM webhook_endpoints WHERE owner_id = $1 "
                    "ORDER BY created_at_ms, id", kColumns),
        {owner_id}));
}

std::vector<WebhookEndpoint> PgEndpointStore::list_enabled(const std::string& owner_id) {
    return endpoints_from(pg::run(*pool_,
        std::format("SELECT {} FROM webhook_endpoints WHERE owner_id = $1 AND enabled "
                    "ORDER BY created_at_ms, id", kColumns),
        {owner_id}));
}

bool PgEndpointStore::update(const WebhookEndpoint& endpoint) {
    const auto res = pg::run(*pool_,
        "UPDATE webhook_endpoints SET url = $2, secret = $3, events = $4, enabled = $5, "
        "description = $6, updated_at_ms = $7 WHERE id = $1",
        {endpoint.id, endpoint.url, endpoint.secret, events_to_column(endpoint.subscription),
         std::string(utils::booltostr(endpoint.enabled)), endpoint.description,
         pg::ms_param(endpoint.updated_at)});
    return res.affected_rows == 1;
}

bool PgEndpointStore::remove(const std::string& id) {
    const auto res = pg::run(*pool_, "DELETE FROM webhook_endpoints WHERE id = $1", {id});
    return res.affected_rows == 1;
}

} // namespace hookrelay
