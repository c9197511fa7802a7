#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace hookrelay {

class PooledConnection;

/// [storage] pool settings; one pool is shared by every PostgreSQL store
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 2;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};   // Health-check a connection idle this long
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};          // 0 = never recycle
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t failed_acquires = 0;          // Timed out, drained, or factory refused
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Source of database connections for the storage layer
 *
 * A store acquires one connection per statement and hands it back when the
 * PooledConnection goes out of scope. nullptr means the store must fail the
 * operation with a StorageError.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /// Waits at most PoolConfig::acquire_timeout
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire() = 0;

    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /// Close idle connections; every later acquire returns nullptr
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace hookrelay
