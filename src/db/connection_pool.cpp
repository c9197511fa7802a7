#include "db/connection_pool.hpp"
#include "core/utils.hpp"

#include <cstddef>
#include <format>
#include <optional>

namespace hookrelay {

ConnectionPool::ConnectionPool(std::string name,
                               const PoolConfig& config,
                               ConnectionFactory factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections && i < config_.max_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Failed to pre-warm connection {} for pool '{}'", i + 1, name_));
            continue;
        }
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        idle_.push_back({std::move(conn), now, now});
    }

    utils::log::info(std::format("Connection pool '{}' initialized: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

ConnectionPool::~ConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire() {
    return acquire(config_.acquire_timeout);
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // drain() may have run while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Slot> slot;
    {
        std::lock_guard lock(mutex_);
        if (!idle_.empty()) {
            slot = std::move(idle_.front());
            idle_.pop_front();
        }
    }

    const auto now = std::chrono::steady_clock::now();

    if (slot && config_.max_lifetime.count() > 0 && now - slot->created_at > config_.max_lifetime) {
        close_connection(*slot->conn);
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        slot.reset();
    }

    if (slot && now - slot->last_used > config_.idle_timeout &&
        !slot->conn->is_healthy(config_.health_check_query)) {
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        close_connection(*slot->conn);
        slot.reset();
    }

    if (!slot) {
        auto conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        slot = Slot{std::move(conn), now, now};
    }

    const auto created_at = slot->created_at;
    return std::make_unique<PooledConnection>(
        std::move(slot->conn),
        [this, created_at](std::unique_ptr<IDbConnection> c) {
            return_connection(std::move(c), created_at);
        });
}

PoolStats ConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.idle_connections = idle_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void ConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) return;

    std::lock_guard lock(mutex_);
    for (auto& slot : idle_) {
        if (slot.conn) close_connection(*slot.conn);
    }
    idle_.clear();

    utils::log::info(std::format("Connection pool '{}' drained", name_));
}

std::unique_ptr<IDbConnection> ConnectionPool::create_connection() {
    auto conn = factory_(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void ConnectionPool::close_connection(IDbConnection& conn) {
    conn.close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void ConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn,
                                       std::chrono::steady_clock::time_point created_at) {
    if (!conn) {
        semaphore_.release();
        return;
    }

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        close_connection(*conn);
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        idle_.push_back({std::move(conn), created_at, std::chrono::steady_clock::now()});
    }
    semaphore_.release();
}

} // namespace hookrelay
