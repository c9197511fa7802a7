#include "server/http_server.hpp"
#include "server/api_json.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/clock.hpp"
#include "core/utils.hpp"
#include "idempotency/idempotency_gate.hpp"
#include "incoming/iincoming_event_store.hpp"
#include "incoming/incoming_webhook_gateway.hpp"
#include "security/signature_engine.hpp"
#include "webhook/delivery_scheduler.hpp"
#include "webhook/idelivery_store.hpp"
#include "webhook/webhook_registry.hpp"
#include "webhook/worker_pool.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <string_view>

namespace hookrelay {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

using json = nlohmann::json;

constexpr size_t kDefaultListLimit = 100;
constexpr size_t kMaxListLimit = 1000;

// ---- Response writing ------------------------------------------------------

RouteResponse json_response(int status, const json& body) {
    RouteResponse r;
    r.status = status;
    r.body = body.dump();
    r.content_type = http::kJsonContentType;
    return r;
}

template <typename T>
RouteResponse error_from(const Result<T>& result) {
    return IdempotentHandler::error_response(result.error_category(), result.error_message());
}

RouteResponse validation_error(const std::string& message) {
    return IdempotentHandler::error_response(ErrorCategory::VALIDATION, message);
}

void write(httplib::Response& res, const RouteResponse& r) {
    res.status = r.status;
    if (r.replayed) {
        res.set_header(http::kIdempotentReplayedHeader, "true");
    }
    res.set_content(r.body, r.content_type);
}

void write_error(httplib::Response& res, ErrorCategory category, const std::string& message) {
    write(res, IdempotentHandler::error_response(category, message));
}

size_t parse_limit(const httplib::Request& req) {
    if (!req.has_param("limit")) return kDefaultListLimit;
    const auto parsed = utils::try_parse_int<int64_t>(req.get_param_value("limit"));
    if (!parsed || *parsed <= 0) return kDefaultListLimit;
    return std::min(static_cast<size_t>(*parsed), kMaxListLimit);
}

std::string bearer_token(const httplib::Request& req) {
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix) {
        return {};
    }
    return auth.substr(http::kBearerPrefix.size());
}

/// Leaves the shutdown coordinator on scope exit
class RequestScope {
public:
    explicit RequestScope(ShutdownCoordinator* sc) : sc_(sc) {}
    ~RequestScope() { if (sc_) sc_->leave_request(); }
    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;
private:
    ShutdownCoordinator* sc_;
};

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

HttpServer::HttpServer(Services services,
                       ServerConfig config,
                       const std::vector<UserConfig>& users)
    : services_(std::move(services)),
      config_(std::move(config)),
      idempotent_(services_.gate) {
    api_key_index_.reserve(users.size());
    for (const auto& user : users) {
        api_key_index_[user.api_key] = user.name;
    }
}

HttpServer::~HttpServer() = default;

// ============================================================================
// Authentication
// ============================================================================

std::optional<std::string> HttpServer::authenticate_owner(const httplib::Request& req,
                                                          httplib::Response& res) {
    const auto token = bearer_token(req);
    if (!token.empty()) {
        const auto it = api_key_index_.find(token);
        if (it != api_key_index_.end()) return it->second;
    }
    auth_rejects_.fetch_add(1, std::memory_order_relaxed);
    res.status = httplib::StatusCode::Unauthorized_401;
    res.set_content(R"({"error":{"code":"unauthorized","message":"Missing or invalid API key"}})",
                    http::kJsonContentType);
    return std::nullopt;
}

bool HttpServer::require_admin(const httplib::Request& req, httplib::Response& res) {
    // Operator routes stay closed when no admin token is configured
    const auto token = bearer_token(req);
    if (!config_.admin_token.empty() && !token.empty() &&
        SignatureEngine::constant_time_equals(token, config_.admin_token)) {
        return true;
    }
    auth_rejects_.fetch_add(1, std::memory_order_relaxed);
    res.status = httplib::StatusCode::Unauthorized_401;
    res.set_content(R"({"error":{"code":"unauthorized","message":"Admin token required"}})",
                    http::kJsonContentType);
    return false;
}

// ============================================================================
// start(): create server, register routes, listen
// ============================================================================

void HttpServer::start() {
    server_ = std::make_unique<httplib::Server>();
    auto& svr = *server_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_body_bytes);

    register_core_routes(svr);
    register_endpoint_routes(svr);
    register_event_routes(svr);
    register_operator_routes(svr);
    register_incoming_routes(svr);

    utils::log::info(std::format("Starting hook-relay on {}:{} ({} threads)",
        config_.host, config_.port, config_.thread_pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        throw std::runtime_error(
            std::format("Failed to start HTTP server on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
    utils::log::info("HTTP server stopped");
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        auth_rejects_.load(std::memory_order_relaxed),
        server_errors_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Route registration groups
// ============================================================================

void HttpServer::register_core_routes(httplib::Server& svr) {
    // Health stays reachable during drain so load balancers see 503
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_metrics, req, res);
    });
}

void HttpServer::register_endpoint_routes(httplib::Server& svr) {
    svr.Post("/api/v1/webhook-endpoints", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_create_endpoint, req, res);
    });
    svr.Get("/api/v1/webhook-endpoints", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_list_endpoints, req, res);
    });
    svr.Patch(R"(/api/v1/webhook-endpoints/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_update_endpoint, req, res);
    });
    svr.Delete(R"(/api/v1/webhook-endpoints/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_delete_endpoint, req, res);
    });
    svr.Post(R"(/api/v1/webhook-endpoints/([^/]+)/rotate-secret)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_rotate_secret, req, res);
    });
}

void HttpServer::register_event_routes(httplib::Server& svr) {
    svr.Post("/api/v1/events", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_publish_event, req, res);
    });
}

void HttpServer::register_operator_routes(httplib::Server& svr) {
    svr.Get("/api/v1/webhook-deliveries", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_list_deliveries, req, res);
    });
    svr.Get(R"(/api/v1/webhook-deliveries/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_get_delivery, req, res);
    });
    svr.Post(R"(/api/v1/webhook-deliveries/([^/]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_cancel_delivery, req, res);
    });
    svr.Get("/api/v1/incoming-events", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_list_incoming, req, res);
    });
    svr.Post(R"(/api/v1/incoming-events/([^/]+)/([^/]+)/retry)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_retry_incoming, req, res);
    });
}

void HttpServer::register_incoming_routes(httplib::Server& svr) {
    svr.Post(R"(/webhooks/incoming/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(&HttpServer::handle_incoming_webhook, req, res);
    });
}

// ============================================================================
// Request plumbing
// ============================================================================

void HttpServer::guarded(Handler handler, const httplib::Request& req, httplib::Response& res) {
    if (shutdown_coordinator_ && !shutdown_coordinator_->try_enter_request()) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"error":{"code":"shutting_down","message":"Server shutting down"}})",
                        http::kJsonContentType);
        return;
    }
    RequestScope scope(shutdown_coordinator_.get());
    requests_.fetch_add(1, std::memory_order_relaxed);

    try {
        (this->*handler)(req, res);
    } catch (const StorageError& e) {
        server_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {}: storage failure: {}", req.method, req.path, e.what()));
        write_error(res, ErrorCategory::STORAGE, "Storage unavailable");
    } catch (const std::exception& e) {
        server_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {}: {}", req.method, req.path, e.what()));
        write_error(res, ErrorCategory::INTERNAL_ERROR, "Internal error");
    }
}

void HttpServer::run_idempotent(const httplib::Request& req, httplib::Response& res,
                                const std::string& owner, const IdempotentHandler::Route& route) {
    RouteRequest request;
    request.owner = owner;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;
    if (req.has_header(http::kIdempotencyKeyHeader)) {
        request.idempotency_key = req.get_header_value(http::kIdempotencyKeyHeader);
    }
    write(res, idempotent_.handle(request, route));
}

// ============================================================================
// Endpoint handlers
// ============================================================================

void HttpServer::handle_create_endpoint(const httplib::Request& req, httplib::Response& res) {
    const auto owner = authenticate_owner(req, res);
    if (!owner) return;

    run_idempotent(req, res, *owner, [this](const RouteRequest& r) {
        const auto create = parse_create_endpoint(r.body);
        if (create.is_error()) return error_from(create);

        const auto created = services_.registry->create(r.owner, create.value());
        if (created.is_error()) return error_from(created);
        return json_response(httplib::StatusCode::Created_201,
                             endpoint_to_json(created.value(), true));
    });
}

void HttpServer::handle_list_endpoints(const httplib::Request& req, httplib::Response& res) {
    const auto owner = authenticate_owner(req, res);
    if (!owner) return;

    json items = json::array();
    for (const auto& ep : services_.registry->list(*owner)) {
        items.push_back(endpoint_to_json(ep, false));
    }
    write(res, json_response(httplib::StatusCode::OK_200, {{"endpoints", items}}));
}

void HttpServer::handle_update_endpoint(const httplib::Request& req, httplib::Response& res) {
    const auto owner = authenticate_owner(req, res);
    if (!owner) return;
    const std::string id = req.matches[1];

    run_idempotent(req, res, *owner, [this, id](const RouteRequest& r) {
        const auto parsed = parse_update_endpoint(r.body);
        if (parsed.is_error()) return error_from(parsed);
        const auto& update = parsed.value();

        std::optional<Result<WebhookEndpoint>> updated;
        if (update.subscription) {
            updated = services_.registry->update_subscriptions(r.owner, id, *update.subscription);
            if (updated->is_error()) return error_from(*updated);
        }
        if (update.enabled) {
            updated = services_.registry->set_enabled(r.owner, id, *update.enabled);
            if (updated->is_error()) return error_from(*updated);
        }
        return json_response(httplib::StatusCode::OK_200, endpoint_to_json(updated->value(), false));
    });
}

void HttpServer::handle_delete_endpoint(const httplib::Request& req, httplib::Response& res) {
    const auto owner = authenticate_owner(req, res);
    if (!owner) return;
    const std::string id = req.matches[1];

    run_idempotent(req, res, *owner, [this, id](const RouteRequest& r) {
        const auto removed = services_.registry->remove(r.owner, id);
        if (removed.is_error()) return error_from(removed);
        return json_response(httplib::StatusCode::OK_200, {{"id", id}, {"deleted", true}});
    });
}

void HttpServer::handle_rotate_secret(const httplib::Request& req, httplib::Response& res) {
    const auto owner = authenticate_owner(req, res);
    if (!owner) return;
    const std::string id = req.matches[1];

    run_idempotent(req, res, *owner, [this, id](const RouteRequest& r) {
        const auto rotated = services_.registry->rotate_secret(r.owner, id);
        if (rotated.is_error()) return error_from(rotated);
        return json_response(httplib::StatusCode::OK_200, {{"id", id}, {"secret", rotated.value()}});
    });
}

// ============================================================================
// Event publishing
// ============================================================================

void HttpServer::handle_publish_event(const httplib::Request& req, httplib::Response& res) {
    const auto owner = authenticate_owner(req, res);
    if (!owner) return;

    run_idempotent(req, res, *owner, [this](const RouteRequest& r) {
        const auto parsed = parse_publish_event(r.body);
        if (parsed.is_error()) return error_from(parsed);
        const auto& publish = parsed.value();
        const std::string event_id = publish.event_id ? *publish.event_id : utils::generate_id("evt");

        // Envelope delivered to every subscribed endpoint
        const json envelope = {
            {"id", event_id},
            {"type", publish.type_name},
            {"created_at", utils::to_unix_seconds(services_.clock->now())},
            {"data", publish.data}
        };

        const auto published = services_.scheduler->publish(r.owner, publish.type, event_id, envelope.dump());
        if (published.is_error()) return error_from(published);

        const auto& p = published.value();
        return json_response(httplib::StatusCode::Created_201, {
            {"event_id", p.event_id},
            {"deliveries", p.delivery_ids},
            {"matched_endpoints", p.matched_endpoints},
            {"duplicates", p.duplicates}
        });
    });
}

// ============================================================================
// Operator handlers
// ============================================================================

void HttpServer::handle_list_deliveries(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    std::optional<DeliveryStatus> status;
    if (req.has_param("status")) {
        const auto name = req.get_param_value("status");
        status = parse_delivery_status(name);
        if (!status) {
            write(res, validation_error(std::format("unknown delivery status '{}'", name)));
            return;
        }
    }

    json items = json::array();
    for (const auto& d : services_.deliveries->list(status, parse_limit(req))) {
        items.push_back(delivery_to_json(d));
    }
    json counts = json::object();
    for (const auto& [s, n] : services_.deliveries->count_by_status()) {
        counts[std::string(delivery_status_to_string(s))] = n;
    }
    write(res, json_response(httplib::StatusCode::OK_200, {{"deliveries", items}, {"counts", counts}}));
}

void HttpServer::handle_get_delivery(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    const std::string id = req.matches[1];
    const auto d = services_.deliveries->get(id);
    if (!d) {
        write_error(res, ErrorCategory::NOT_FOUND, std::format("Delivery {} not found", id));
        return;
    }
    write(res, json_response(httplib::StatusCode::OK_200, delivery_to_json(*d)));
}

void HttpServer::handle_cancel_delivery(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    const std::string id = req.matches[1];
    if (services_.deliveries->cancel(id, services_.clock->now())) {
        utils::log::info(std::format("Delivery {} cancelled by operator", id));
        write(res, json_response(httplib::StatusCode::OK_200, {{"id", id}, {"status", "cancelled"}}));
        return;
    }

    const auto d = services_.deliveries->get(id);
    if (!d) {
        write_error(res, ErrorCategory::NOT_FOUND, std::format("Delivery {} not found", id));
        return;
    }
    write_error(res, ErrorCategory::CONFLICT, std::format(
        "Delivery {} is {}; only pending deliveries can be cancelled",
        id, delivery_status_to_string(d->status)));
}

void HttpServer::handle_list_incoming(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    std::optional<IncomingStatus> status;
    if (req.has_param("status")) {
        const auto name = req.get_param_value("status");
        status = parse_incoming_status(name);
        if (!status) {
            write(res, validation_error(std::format("unknown incoming status '{}'", name)));
            return;
        }
    }

    json items = json::array();
    for (const auto& ev : services_.incoming_events->list(status, parse_limit(req))) {
        items.push_back(incoming_to_json(ev));
    }
    write(res, json_response(httplib::StatusCode::OK_200, {{"events", items}}));
}

void HttpServer::handle_retry_incoming(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    const std::string source = req.matches[1];
    const std::string event_id = req.matches[2];
    const auto retried = services_.gateway->retry(source, event_id);
    if (retried.is_error()) {
        write(res, error_from(retried));
        return;
    }
    write(res, json_response(httplib::StatusCode::OK_200,
                             {{"source", source}, {"event_id", event_id}, {"status", "received"}}));
}

// ============================================================================
// Inbound gateway
// ============================================================================

void HttpServer::handle_incoming_webhook(const httplib::Request& req, httplib::Response& res) {
    const std::string source = req.matches[1];
    const auto* src = services_.gateway->find_source(source);
    const std::string signature = src ? req.get_header_value(src->signature_header) : std::string{};

    const auto received = services_.gateway->receive(source, req.body, signature);
    if (received.is_error()) {
        write(res, error_from(received));
        return;
    }
    const bool duplicate = received.value() == ReceiveOutcome::DUPLICATE;
    write(res, json_response(httplib::StatusCode::OK_200,
                             {{"received", true}, {"duplicate", duplicate}}));
}

// ============================================================================
// Health / metrics
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    if (shutdown_coordinator_ && shutdown_coordinator_->is_shutting_down()) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"status":"shutting_down","service":"hook-relay"})", http::kJsonContentType);
        return;
    }
    res.set_content(R"({"status":"healthy","service":"hook-relay"})", http::kJsonContentType);
}

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) {
    res.set_content(build_metrics_output(), http::kMetricsContentType);
}

std::string HttpServer::build_metrics_output() {
    std::string output;

    const auto hs = get_http_stats();
    output += std::format(
        "# HELP hook_relay_http_requests_total HTTP requests handled\n"
        "# TYPE hook_relay_http_requests_total counter\n"
        "hook_relay_http_requests_total {}\n\n"
        "# HELP hook_relay_http_auth_rejects_total Requests rejected for missing or bad credentials\n"
        "# TYPE hook_relay_http_auth_rejects_total counter\n"
        "hook_relay_http_auth_rejects_total {}\n\n"
        "# HELP hook_relay_http_server_errors_total Requests answered with 5xx by the exception boundary\n"
        "# TYPE hook_relay_http_server_errors_total counter\n"
        "hook_relay_http_server_errors_total {}\n\n",
        hs.requests, hs.auth_rejects, hs.server_errors);

    const auto gs = services_.gate->get_stats();
    output += std::format(
        "# HELP hook_relay_idempotency_total Idempotency gate decisions\n"
        "# TYPE hook_relay_idempotency_total counter\n"
        "hook_relay_idempotency_total{{outcome=\"proceed\"}} {}\n"
        "hook_relay_idempotency_total{{outcome=\"replay\"}} {}\n"
        "hook_relay_idempotency_total{{outcome=\"conflict\"}} {}\n"
        "hook_relay_idempotency_total{{outcome=\"locked\"}} {}\n\n"
        "# HELP hook_relay_idempotency_lock_steals_total Stale locks taken over\n"
        "# TYPE hook_relay_idempotency_lock_steals_total counter\n"
        "hook_relay_idempotency_lock_steals_total {}\n\n"
        "# HELP hook_relay_idempotency_swept_total Expired records removed by the sweeper\n"
        "# TYPE hook_relay_idempotency_swept_total counter\n"
        "hook_relay_idempotency_swept_total {}\n\n",
        gs.proceeded, gs.replayed, gs.conflicts, gs.locked, gs.stolen, gs.swept);

    if (services_.workers) {
        const auto ws = services_.workers->get_stats();
        output += std::format(
            "# HELP hook_relay_deliveries_total Outbound delivery outcomes\n"
            "# TYPE hook_relay_deliveries_total counter\n"
            "hook_relay_deliveries_total{{outcome=\"delivered\"}} {}\n"
            "hook_relay_deliveries_total{{outcome=\"retry_scheduled\"}} {}\n"
            "hook_relay_deliveries_total{{outcome=\"exhausted\"}} {}\n"
            "hook_relay_deliveries_total{{outcome=\"skipped_disabled\"}} {}\n"
            "hook_relay_deliveries_total{{outcome=\"deferred_concurrency\"}} {}\n"
            "hook_relay_deliveries_total{{outcome=\"lost_claim\"}} {}\n\n"
            "# HELP hook_relay_deliveries_claimed_total Rows claimed by dispatchers\n"
            "# TYPE hook_relay_deliveries_claimed_total counter\n"
            "hook_relay_deliveries_claimed_total {}\n\n"
            "# HELP hook_relay_deliveries_recovered_total Stale in-flight rows returned to the queue\n"
            "# TYPE hook_relay_deliveries_recovered_total counter\n"
            "hook_relay_deliveries_recovered_total {}\n\n",
            ws.delivered, ws.retried, ws.exhausted, ws.skipped_disabled,
            ws.deferred_concurrency, ws.lost_claims, ws.claimed, ws.recovered);
    }

    try {
        const auto counts = services_.deliveries->count_by_status();
        output += "# HELP hook_relay_delivery_rows Delivery rows by status\n"
                  "# TYPE hook_relay_delivery_rows gauge\n";
        for (const auto& [status, n] : counts) {
            output += std::format("hook_relay_delivery_rows{{status=\"{}\"}} {}\n",
                                  delivery_status_to_string(status), n);
        }
        output += "\n";
    } catch (const StorageError& e) {
        utils::log::warn(std::format("Metrics: delivery counts unavailable: {}", e.what()));
    }

    const auto is = services_.gateway->get_stats();
    output += std::format(
        "# HELP hook_relay_incoming_total Inbound webhook outcomes\n"
        "# TYPE hook_relay_incoming_total counter\n"
        "hook_relay_incoming_total{{outcome=\"accepted\"}} {}\n"
        "hook_relay_incoming_total{{outcome=\"duplicate\"}} {}\n"
        "hook_relay_incoming_total{{outcome=\"signature_failure\"}} {}\n\n"
        "# HELP hook_relay_incoming_processed_total Inbound events processed\n"
        "# TYPE hook_relay_incoming_processed_total counter\n"
        "hook_relay_incoming_processed_total{{result=\"ok\"}} {}\n"
        "hook_relay_incoming_processed_total{{result=\"error\"}} {}\n\n"
        "# HELP hook_relay_incoming_queue_full_total Inbound events left RECEIVED on a full queue\n"
        "# TYPE hook_relay_incoming_queue_full_total counter\n"
        "hook_relay_incoming_queue_full_total {}\n\n"
        "# HELP hook_relay_incoming_recovered_total Unprocessed inbound events re-enqueued by recovery\n"
        "# TYPE hook_relay_incoming_recovered_total counter\n"
        "hook_relay_incoming_recovered_total {}\n",
        is.accepted, is.duplicates, is.signature_failures,
        is.processed, is.processing_errors, is.queue_full, is.recovered);

    return output;
}

} // namespace hookrelay
