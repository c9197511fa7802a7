#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"

#include <format>

namespace hookrelay {

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

void ShutdownCoordinator::add_stop_hook(std::string name, std::function<void()> hook) {
    std::lock_guard lock(hooks_mutex_);
    hooks_.push_back({std::move(name), std::move(hook)});
}

void ShutdownCoordinator::initiate_shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    utils::log::info(std::format("Shutdown initiated ({} requests in flight)",
                                 in_flight_.load(std::memory_order_relaxed)));

    if (!wait_for_drain()) {
        utils::log::warn(std::format("Drain timed out after {}ms with {} requests in flight",
                                     config_.drain_timeout.count(),
                                     in_flight_.load(std::memory_order_relaxed)));
    }

    std::vector<StopHook> hooks;
    {
        std::lock_guard lock(hooks_mutex_);
        hooks.swap(hooks_);
    }
    for (auto& h : hooks) {
        try {
            h.hook();
            utils::log::debug(std::format("Stopped {}", h.name));
        } catch (const std::exception& e) {
            utils::log::error(std::format("Stopping {} failed: {}", h.name, e.what()));
        }
    }
}

bool ShutdownCoordinator::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_relaxed);
    // Re-check after increment (race with initiate_shutdown)
    if (shutting_down_.load(std::memory_order_acquire)) {
        leave_request();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_request() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1 && shutting_down_.load(std::memory_order_acquire)) {
        std::lock_guard lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

bool ShutdownCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.drain_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

} // namespace hookrelay
