#pragma once

#include "incoming/incoming_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hookrelay {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 4;
    std::string admin_token;              // Bearer token for operator routes (empty = disabled)
    size_t max_body_bytes = 1024 * 1024;
    uint32_t shutdown_timeout_ms = 30000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct StorageConfig {
    std::string backend = "memory";       // memory | postgresql
    std::string connection_string;
    size_t min_connections = 2;
    size_t max_connections = 10;
    std::chrono::milliseconds connection_timeout{5000};
};

struct IdempotencyConfig {
    uint32_t ttl_hours = 24;
    uint32_t stale_lock_seconds = 30;
    uint32_t sweep_interval_seconds = 60;
};

struct QueueConfig {
    std::string name;                     // fresh | retry
    uint32_t concurrency = 4;
};

struct DeliveryConfig {
    uint32_t max_attempts = 5;
    std::vector<int64_t> backoff_seconds = {60, 300, 1800, 7200, 86400};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds poll_interval{1000};
    size_t claim_batch_size = 32;
    uint32_t per_endpoint_concurrency = 4;
    size_t response_body_max_bytes = 1024;
    uint32_t disabled_recheck_seconds = 60;
    uint32_t in_flight_recovery_seconds = 120;
    bool require_https = true;
    std::string user_agent = "hook-relay/1.0";
    std::vector<QueueConfig> queues = {{"fresh", 4}, {"retry", 2}};
};

struct IncomingConfig {
    uint32_t tolerance_seconds = 300;
    uint32_t processing_threads = 2;
    size_t queue_capacity = 1024;
    uint32_t recovery_interval_seconds = 30;
    uint32_t processing_stale_seconds = 300;
    std::vector<IncomingSource> sources;
};

/// API key → owner mapping
struct UserConfig {
    std::string name;
    std::string api_key;
};

// ============================================================================
// RelayConfig - Complete parsed configuration
// ============================================================================

struct RelayConfig {
    ServerConfig server;
    LoggingConfig logging;
    StorageConfig storage;
    IdempotencyConfig idempotency;
    DeliveryConfig delivery;
    IncomingConfig incoming;
    std::vector<UserConfig> users;
};

} // namespace hookrelay
