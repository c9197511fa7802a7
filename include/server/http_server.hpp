#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "server/idempotent_handler.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace hookrelay {

class Clock;
class DeliveryScheduler;
class IDeliveryStore;
class IIncomingEventStore;
class IdempotencyGate;
class IncomingWebhookGateway;
class ShutdownCoordinator;
class WebhookRegistry;
class WorkerPool;

/**
 * @brief HTTP surface of the relay
 *
 * Handler methods are grouped by domain: endpoints, events, operator,
 * incoming, core. Owner routes authenticate with a user API key; operator
 * routes with the admin token. Mutating owner routes run through
 * IdempotentHandler.
 */
class HttpServer {
public:
    struct Services {
        std::shared_ptr<WebhookRegistry> registry;
        std::shared_ptr<DeliveryScheduler> scheduler;
        std::shared_ptr<IDeliveryStore> deliveries;
        std::shared_ptr<WorkerPool> workers;
        std::shared_ptr<IncomingWebhookGateway> gateway;
        std::shared_ptr<IIncomingEventStore> incoming_events;
        std::shared_ptr<IdempotencyGate> gate;
        std::shared_ptr<Clock> clock;
    };

    HttpServer(Services services,
               ServerConfig config,
               const std::vector<UserConfig>& users);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Registers routes and blocks in listen() until stop()
    void start();
    void stop();

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    struct HttpStats {
        uint64_t requests;
        uint64_t auth_rejects;
        uint64_t server_errors;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

private:
    // ── Authentication ──────────────────────────────────────────────────
    std::optional<std::string> authenticate_owner(const httplib::Request& req,
                                                  httplib::Response& res);
    bool require_admin(const httplib::Request& req, httplib::Response& res);

    // ── Route registration (called from start()) ────────────────────────
    void register_core_routes(httplib::Server& svr);
    void register_endpoint_routes(httplib::Server& svr);
    void register_event_routes(httplib::Server& svr);
    void register_operator_routes(httplib::Server& svr);
    void register_incoming_routes(httplib::Server& svr);

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_create_endpoint(const httplib::Request& req, httplib::Response& res);
    void handle_list_endpoints(const httplib::Request& req, httplib::Response& res);
    void handle_update_endpoint(const httplib::Request& req, httplib::Response& res);
    void handle_delete_endpoint(const httplib::Request& req, httplib::Response& res);
    void handle_rotate_secret(const httplib::Request& req, httplib::Response& res);
    void handle_publish_event(const httplib::Request& req, httplib::Response& res);
    void handle_list_deliveries(const httplib::Request& req, httplib::Response& res);
    void handle_get_delivery(const httplib::Request& req, httplib::Response& res);
    void handle_cancel_delivery(const httplib::Request& req, httplib::Response& res);
    void handle_list_incoming(const httplib::Request& req, httplib::Response& res);
    void handle_retry_incoming(const httplib::Request& req, httplib::Response& res);
    void handle_incoming_webhook(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);

    // ── Helpers ─────────────────────────────────────────────────────────
    using Handler = void (HttpServer::*)(const httplib::Request&, httplib::Response&);

    /// Shutdown gate + per-request exception boundary
    void guarded(Handler handler, const httplib::Request& req, httplib::Response& res);

    /// Run route through the idempotency gate and write the result
    void run_idempotent(const httplib::Request& req, httplib::Response& res,
                        const std::string& owner, const IdempotentHandler::Route& route);

    std::string build_metrics_output();

    // ── Members ─────────────────────────────────────────────────────────
    Services services_;
    const ServerConfig config_;
    std::unordered_map<std::string, std::string> api_key_index_;   // api_key → owner
    IdempotentHandler idempotent_;

    std::unique_ptr<httplib::Server> server_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> auth_rejects_{0};
    std::atomic<uint64_t> server_errors_{0};
};

} // namespace hookrelay
