#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <vector>

namespace hookrelay {

/**
 * @brief Fixed backoff schedule with an attempt cap
 *
 * After the n-th failed attempt (n = attempts after increment) the next
 * attempt waits backoff[n - 1]; the last entry repeats if the cap exceeds
 * the schedule length.
 */
class RetryPolicy {
public:
    static std::vector<std::chrono::seconds> default_schedule() {
        using namespace std::chrono_literals;
        return {1min, 5min, 30min, 2h, 24h};
    }

    RetryPolicy() : RetryPolicy(5, default_schedule()) {}

    RetryPolicy(uint32_t max_attempts, std::vector<std::chrono::seconds> schedule)
        : max_attempts_(max_attempts == 0 ? 1 : max_attempts),
          schedule_(std::move(schedule)) {
        if (schedule_.empty()) schedule_ = default_schedule();
    }

    [[nodiscard]] bool is_exhausted(uint32_t attempts) const {
        return attempts >= max_attempts_;
    }

    [[nodiscard]] std::chrono::seconds delay_after(uint32_t attempts) const {
        if (attempts == 0) return schedule_.front();
        const size_t idx = std::min<size_t>(attempts - 1, schedule_.size() - 1);
        return schedule_[idx];
    }

    [[nodiscard]] uint32_t max_attempts() const { return max_attempts_; }
    [[nodiscard]] const std::vector<std::chrono::seconds>& schedule() const { return schedule_; }

private:
    uint32_t max_attempts_;
    std::vector<std::chrono::seconds> schedule_;
};

} // namespace hookrelay
