#pragma once

#include "core/clock.hpp"
#include "idempotency/iidempotency_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace hookrelay {

enum class AcquireOutcome {
    PROCEED,    // Caller holds the lock and must complete() or release()
    REPLAY,     // Cached response available
    CONFLICT,   // Same key, different request fingerprint
    LOCKED      // Another holder is executing and its lock is not stale
};

[[nodiscard]] inline const char* acquire_outcome_to_string(AcquireOutcome o) {
    switch (o) {
        case AcquireOutcome::PROCEED:  return "proceed";
        case AcquireOutcome::REPLAY:   return "replay";
        case AcquireOutcome::CONFLICT: return "conflict";
        case AcquireOutcome::LOCKED:   return "locked";
    }
    return "unknown";
}

/**
 * @brief Proof of lock ownership handed to the caller on PROCEED
 */
struct LockToken {
    std::string scope;
    std::string key;
    std::string token;
};

struct AcquireResult {
    AcquireOutcome outcome = AcquireOutcome::LOCKED;
    std::optional<LockToken> lock;          // Set on PROCEED
    std::optional<CachedResponse> cached;   // Set on REPLAY
    bool stolen = false;                    // PROCEED via stale-lock takeover
};

/**
 * @brief Exactly-once execution guard keyed on (scope, idempotency key)
 *
 * Decision order for an existing record:
 *   1. expired                   → treated as absent (removed, insert retried)
 *   2. request_hash differs      → CONFLICT
 *   3. COMPLETED                 → REPLAY
 *   4. LOCKED, not stale         → LOCKED
 *   5. LOCKED, stale             → compare-and-set takeover → PROCEED
 *
 * All cross-process mutual exclusion comes from the store's atomic
 * operations; the gate holds no lock of its own across a store call.
 */
class IdempotencyGate {
public:
    struct Config {
        std::chrono::seconds ttl{std::chrono::hours(24)};
        std::chrono::seconds stale_lock{30};
        std::chrono::seconds sweep_interval{60};
    };

    IdempotencyGate(std::shared_ptr<IIdempotencyStore> store,
                    std::shared_ptr<Clock> clock,
                    Config config);

    ~IdempotencyGate();

    IdempotencyGate(const IdempotencyGate&) = delete;
    IdempotencyGate& operator=(const IdempotencyGate&) = delete;

    [[nodiscard]] AcquireResult acquire(const std::string& key,
                                        const std::string& scope,
                                        const std::string& request_hash);

    /**
     * @brief Store the response and move LOCKED → COMPLETED
     * @return false if the lock was lost (stolen or expired); the response
     *         is then not cached
     */
    bool complete(const LockToken& lock, const CachedResponse& response);

    /**
     * @brief Drop the lock so a retry with the same key can run
     */
    bool release(const LockToken& lock);

    /**
     * @brief Delete expired records regardless of status
     * @return Number of records removed
     */
    size_t sweep();

    /**
     * @brief Hex SHA-256 over METHOD "\n" path "\n" body
     */
    [[nodiscard]] static std::string fingerprint(std::string_view method,
                                                 std::string_view path,
                                                 std::string_view body);

    /**
     * @brief Keys are unique per owner and endpoint: "owner:METHOD path"
     */
    [[nodiscard]] static std::string make_scope(std::string_view owner,
                                                std::string_view method,
                                                std::string_view path);

    void start_sweeper();
    void stop_sweeper();

    struct Stats {
        uint64_t proceeded = 0;
        uint64_t replayed = 0;
        uint64_t conflicts = 0;
        uint64_t locked = 0;
        uint64_t stolen = 0;
        uint64_t completed = 0;
        uint64_t lost_locks = 0;
        uint64_t released = 0;
        uint64_t swept = 0;
        uint64_t sweep_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    void sweep_loop();

    std::shared_ptr<IIdempotencyStore> store_;
    std::shared_ptr<Clock> clock_;
    Config config_;

    std::thread sweep_thread_;
    std::atomic<bool> running_{false};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;

    std::atomic<uint64_t> proceeded_{0};
    std::atomic<uint64_t> replayed_{0};
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> locked_{0};
    std::atomic<uint64_t> stolen_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> lost_locks_{0};
    std::atomic<uint64_t> released_{0};
    std::atomic<uint64_t> swept_{0};
    std::atomic<uint64_t> sweep_errors_{0};
};

} // namespace hookrelay
