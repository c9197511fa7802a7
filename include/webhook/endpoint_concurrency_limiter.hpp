#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hookrelay {

/**
 * @brief Caps simultaneous in-flight sends per endpoint within this process
 *
 * limit == 0 disables the cap.
 */
class EndpointConcurrencyLimiter {
public:
    explicit EndpointConcurrencyLimiter(uint32_t limit) : limit_(limit) {}

    [[nodiscard]] bool try_acquire(const std::string& endpoint_id) {
        if (limit_ == 0) return true;
        std::lock_guard lock(mutex_);
        auto& count = active_[endpoint_id];
        if (count >= limit_) return false;
        ++count;
        return true;
    }

    void release(const std::string& endpoint_id) {
        if (limit_ == 0) return;
        std::lock_guard lock(mutex_);
        const auto it = active_.find(endpoint_id);
        if (it == active_.end()) return;
        if (--it->second == 0) active_.erase(it);
    }

    [[nodiscard]] uint32_t active(const std::string& endpoint_id) const {
        std::lock_guard lock(mutex_);
        const auto it = active_.find(endpoint_id);
        return it == active_.end() ? 0 : it->second;
    }

    [[nodiscard]] uint32_t limit() const { return limit_; }

    /**
     * @brief RAII slot holder
     */
    class Slot {
    public:
        Slot(EndpointConcurrencyLimiter& limiter, std::string endpoint_id)
            : limiter_(&limiter), endpoint_id_(std::move(endpoint_id)),
              acquired_(limiter.try_acquire(endpoint_id_)) {}

        ~Slot() {
            if (acquired_) limiter_->release(endpoint_id_);
        }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        [[nodiscard]] bool acquired() const { return acquired_; }

    private:
        EndpointConcurrencyLimiter* limiter_;
        std::string endpoint_id_;
        bool acquired_;
    };

private:
    const uint32_t limit_;
    std::unordered_map<std::string, uint32_t> active_;
    mutable std::mutex mutex_;
};

} // namespace hookrelay
