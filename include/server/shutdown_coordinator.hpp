#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hookrelay {

/**
 * @brief Orders graceful shutdown of the relay
 *
 * Request handlers bracket their work with try_enter_request() /
 * leave_request(). initiate_shutdown() closes the gate, waits for
 * in-flight requests to drain, then runs the registered stop hooks in
 * registration order on the calling thread. Not async-signal-safe.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds drain_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Hooks run once, in order, from initiate_shutdown()
    void add_stop_hook(std::string name, std::function<void()> hook);

    /// Blocks for the drain; only the first call does anything
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when request completes.
    void leave_request();

    /// Blocks until all in-flight requests complete or the drain timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    struct StopHook {
        std::string name;
        std::function<void()> hook;
    };

    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;

    std::mutex hooks_mutex_;
    std::vector<StopHook> hooks_;
};

} // namespace hookrelay
