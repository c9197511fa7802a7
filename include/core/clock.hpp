#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace hookrelay {

/**
 * @brief Wall-clock source injected into every component that compares
 * against stored timestamps (expiry, staleness, backoff, replay window).
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Manually advanced clock for tests. Thread-safe.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start =
                             std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)))
        : now_ms_(to_ms(start)) {}

    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::time_point(
            std::chrono::milliseconds(now_ms_.load(std::memory_order_acquire)));
    }

    void set(std::chrono::system_clock::time_point tp) {
        now_ms_.store(to_ms(tp), std::memory_order_release);
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        now_ms_.fetch_add(
            std::chrono::duration_cast<std::chrono::milliseconds>(d).count(),
            std::memory_order_acq_rel);
    }

private:
    static int64_t to_ms(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    std::atomic<int64_t> now_ms_;
};

[[nodiscard]] inline std::shared_ptr<Clock> make_system_clock() {
    return std::make_shared<SystemClock>();
}

} // namespace hookrelay
