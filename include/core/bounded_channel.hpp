#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace hookrelay {

/**
 * @brief Fixed-capacity multi-producer / multi-consumer hand-off queue
 *
 * push() blocks while full, try_push() does not. Once close() is called,
 * push fails, pop returns nullopt immediately and any items still queued
 * are left for drain().
 */
template<typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    bool push(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    [[nodiscard]] bool try_push(T item) {
        std::lock_guard lock(mutex_);
        if (closed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    [[nodiscard]] std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// Items still queued; meant to be called after close()
    [[nodiscard]] std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> rest;
        rest.reserve(items_.size());
        for (auto& item : items_) rest.push_back(std::move(item));
        items_.clear();
        return rest;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t free_slots() const {
        std::lock_guard lock(mutex_);
        return items_.size() >= capacity_ ? 0 : capacity_ - items_.size();
    }

    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace hookrelay
