#pragma once

#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace hookrelay {

/// Opens one connection from a connection string; nullptr when the backend refuses
using ConnectionFactory =
    std::function<std::unique_ptr<IDbConnection>(const std::string& connection_string)>;

/**
 * @brief Bounded pool of IDbConnection
 *
 * - max_connections enforced with a counting_semaphore
 * - connections created lazily up to max, min_connections pre-warmed
 * - connections idle longer than idle_timeout are health-checked on acquire
 * - connections older than max_lifetime are recycled on acquire
 * - a connection handed back closed (PooledConnection::discard) is dropped
 */
class ConnectionPool : public IConnectionPool {
public:
    ConnectionPool(std::string name,
                   const PoolConfig& config,
                   ConnectionFactory factory);

    ~ConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire() override;
    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    struct Slot {
        std::unique_ptr<IDbConnection> conn;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> create_connection();
    void return_connection(std::unique_ptr<IDbConnection> conn,
                           std::chrono::steady_clock::time_point created_at);
    void close_connection(IDbConnection& conn);

    std::string name_;
    PoolConfig config_;
    ConnectionFactory factory_;

    std::deque<Slot> idle_;
    mutable std::mutex mutex_;
    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<bool> shutdown_{false};
};

} // namespace hookrelay
