#include "config/config_loader.hpp"
#include "core/clock.hpp"
#include "core/utils.hpp"
#include "idempotency/idempotency_gate.hpp"
#include "idempotency/memory_idempotency_store.hpp"
#include "incoming/event_processor.hpp"
#include "incoming/incoming_webhook_gateway.hpp"
#include "incoming/memory_incoming_event_store.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "webhook/delivery_scheduler.hpp"
#include "webhook/memory_delivery_store.hpp"
#include "webhook/memory_endpoint_store.hpp"
#include "webhook/webhook_registry.hpp"
#include "webhook/webhook_sender.hpp"
#include "webhook/worker_pool.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_delivery_store.hpp"
#include "db/postgresql/pg_endpoint_store.hpp"
#include "db/postgresql/pg_idempotency_store.hpp"
#include "db/postgresql/pg_incoming_event_store.hpp"
#include "db/postgresql/pg_schema.hpp"
#endif

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>
#include <pthread.h>
#include <thread>

using namespace hookrelay;

namespace {

struct Stores {
    std::shared_ptr<IIdempotencyStore> idempotency;
    std::shared_ptr<IEndpointStore> endpoints;
    std::shared_ptr<IDeliveryStore> deliveries;
    std::shared_ptr<IIncomingEventStore> incoming;
};

Stores make_stores(const StorageConfig& cfg) {
    if (cfg.backend == "postgresql") {
#ifdef ENABLE_POSTGRESQL
        PoolConfig pool_cfg;
        pool_cfg.connection_string = cfg.connection_string;
        pool_cfg.min_connections = cfg.min_connections;
        pool_cfg.max_connections = cfg.max_connections;
        pool_cfg.acquire_timeout = cfg.connection_timeout;

        auto pool = std::make_shared<ConnectionPool>(
            "relay", pool_cfg, connect_postgres);
        PgSchema::migrate(*pool);

        utils::log::info(std::format("Storage: postgresql (pool {}-{})",
                                     cfg.min_connections, cfg.max_connections));
        return {
            std::make_shared<PgIdempotencyStore>(pool),
            std::make_shared<PgEndpointStore>(pool),
            std::make_shared<PgDeliveryStore>(pool),
            std::make_shared<PgIncomingEventStore>(pool)
        };
#else
        throw std::runtime_error("storage.backend = postgresql but built without ENABLE_POSTGRESQL");
#endif
    }

    utils::log::warn("Storage: memory (single node, state is lost on restart)");
    return {
        std::make_shared<InMemoryIdempotencyStore>(),
        std::make_shared<InMemoryEndpointStore>(),
        std::make_shared<InMemoryDeliveryStore>(),
        std::make_shared<InMemoryIncomingEventStore>()
    };
}

RetryPolicy make_retry_policy(const DeliveryConfig& cfg) {
    std::vector<std::chrono::seconds> schedule;
    schedule.reserve(cfg.backoff_seconds.size());
    for (const auto s : cfg.backoff_seconds) {
        schedule.emplace_back(s);
    }
    return RetryPolicy(cfg.max_attempts, std::move(schedule));
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Signals are taken synchronously by a dedicated thread; block them
        // before any other thread is spawned so every thread inherits the mask
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        std::string config_file = "config/relay.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        const RelayConfig cfg = std::move(loaded.config);
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::info(std::format("Loaded configuration from {}", config_file));

        auto clock = make_system_clock();
        const auto stores = make_stores(cfg.storage);

        // ---- Idempotency ----
        IdempotencyGate::Config gate_cfg;
        gate_cfg.ttl = std::chrono::hours(cfg.idempotency.ttl_hours);
        gate_cfg.stale_lock = std::chrono::seconds(cfg.idempotency.stale_lock_seconds);
        gate_cfg.sweep_interval = std::chrono::seconds(cfg.idempotency.sweep_interval_seconds);
        auto gate = std::make_shared<IdempotencyGate>(stores.idempotency, clock, gate_cfg);

        // ---- Outbound ----
        auto registry = std::make_shared<WebhookRegistry>(
            stores.endpoints, clock, WebhookRegistry::Config{cfg.delivery.require_https});
        auto scheduler = std::make_shared<DeliveryScheduler>(registry, stores.deliveries, clock);

        DeliveryWorker::Config worker_cfg;
        worker_cfg.request_timeout = cfg.delivery.request_timeout;
        worker_cfg.response_body_max_bytes = cfg.delivery.response_body_max_bytes;
        worker_cfg.disabled_recheck = std::chrono::seconds(cfg.delivery.disabled_recheck_seconds);
        worker_cfg.concurrency_defer = cfg.delivery.poll_interval;
        worker_cfg.user_agent = cfg.delivery.user_agent;

        WorkerPool::Config pool_cfg;
        for (const auto& q : cfg.delivery.queues) {
            pool_cfg.queues.push_back({q.name, *WorkerPool::status_for_queue(q.name), q.concurrency});
        }
        pool_cfg.poll_interval = cfg.delivery.poll_interval;
        pool_cfg.claim_batch_size = cfg.delivery.claim_batch_size;
        pool_cfg.in_flight_recovery = std::chrono::seconds(cfg.delivery.in_flight_recovery_seconds);
        pool_cfg.per_endpoint_concurrency = cfg.delivery.per_endpoint_concurrency;

        auto workers = std::make_shared<WorkerPool>(
            stores.deliveries, registry, clock,
            [] { return std::make_unique<HttpWebhookSender>(); },
            make_retry_policy(cfg.delivery), worker_cfg, pool_cfg);
        scheduler->set_on_enqueued([w = std::weak_ptr<WorkerPool>(workers)] {
            if (auto pool = w.lock()) pool->wake();
        });

        // ---- Inbound ----
        IncomingWebhookGateway::Config gateway_cfg;
        gateway_cfg.tolerance = std::chrono::seconds(cfg.incoming.tolerance_seconds);
        gateway_cfg.processing_threads = cfg.incoming.processing_threads;
        gateway_cfg.queue_capacity = cfg.incoming.queue_capacity;
        gateway_cfg.recovery_interval = std::chrono::seconds(cfg.incoming.recovery_interval_seconds);
        gateway_cfg.processing_stale_after = std::chrono::seconds(cfg.incoming.processing_stale_seconds);
        auto gateway = std::make_shared<IncomingWebhookGateway>(
            cfg.incoming.sources, stores.incoming,
            std::make_shared<LoggingEventProcessor>(), clock, gateway_cfg);

        // ---- HTTP ----
        HttpServer::Services services;
        services.registry = registry;
        services.scheduler = scheduler;
        services.deliveries = stores.deliveries;
        services.workers = workers;
        services.gateway = gateway;
        services.incoming_events = stores.incoming;
        services.gate = gate;
        services.clock = clock;
        auto server = std::make_shared<HttpServer>(services, cfg.server, cfg.users);

        ShutdownCoordinator::Config sc_cfg;
        sc_cfg.drain_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms);
        auto shutdown = std::make_shared<ShutdownCoordinator>(sc_cfg);
        server->set_shutdown_coordinator(shutdown);

        // Stop order: HTTP intake, outbound workers, inbound processing, sweeper
        shutdown->add_stop_hook("http server", [server] { server->stop(); });
        shutdown->add_stop_hook("worker pool", [workers] { workers->stop(); });
        shutdown->add_stop_hook("incoming gateway", [gateway] { gateway->stop(); });
        shutdown->add_stop_hook("idempotency sweeper", [gate] { gate->stop_sweeper(); });

        gate->start_sweeper();
        workers->start();
        gateway->start();

        std::thread signal_thread([signals, shutdown] {
            int sig = 0;
            if (sigwait(&signals, &sig) == 0) {
                utils::log::info(std::format("Received signal {}, shutting down...", sig));
            }
            shutdown->initiate_shutdown();
        });

        try {
            server->start();   // Blocks until the http server stop hook runs
        } catch (const std::exception& e) {
            utils::log::error(e.what());
            // Wake the signal thread so shutdown still runs the other hooks
            pthread_kill(signal_thread.native_handle(), SIGTERM);
            signal_thread.join();
            return EXIT_FAILURE;
        }

        signal_thread.join();
        utils::log::info("hook-relay stopped");
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return EXIT_FAILURE;
    }
}
