#include "webhook/memory_delivery_store.hpp"

#include <algorithm>

namespace hookrelay {

bool InMemoryDeliveryStore::enqueue(const WebhookDelivery& delivery) {
    std::lock_guard lock(mutex_);
    if (!dedup_.emplace(delivery.endpoint_id, delivery.event_id).second) {
        return false;
    }
    if (!deliveries_.try_emplace(delivery.id, delivery).second) {
        dedup_.erase({delivery.endpoint_id, delivery.event_id});
        return false;
    }
    return true;
}

std::optional<WebhookDelivery> InMemoryDeliveryStore::get(const std::string& id) {
    std::lock_guard lock(mutex_);
    const auto it = deliveries_.find(id);
    if (it == deliveries_.end()) return std::nullopt;
    return it->second;
}

std::vector<WebhookDelivery> InMemoryDeliveryStore::claim_due(
    DeliveryStatus status,
    std::chrono::system_clock::time_point now,
    size_t limit) {
    std::lock_guard lock(mutex_);

    std::vector<WebhookDelivery*> due;
    for (auto& [_, d] : deliveries_) {
        if (d.status == status && d.next_attempt_at <= now) {
            due.push_back(&d);
        }
    }
    std::sort(due.begin(), due.end(), [](const auto* a, const auto* b) {
        return a->next_attempt_at < b->next_attempt_at;
    });
    if (due.size() > limit) due.resize(limit);

    std::vector<WebhookDelivery> claimed;
    claimed.reserve(due.size());
    for (auto* d : due) {
        d->status = DeliveryStatus::IN_FLIGHT;
        d->claimed_at = now;
        d->updated_at = now;
        ++d->version;
        claimed.push_back(*d);
    }
    return claimed;
}

WebhookDelivery* InMemoryDeliveryStore::find_claimed(const std::string& id,
                                                     uint64_t expected_version) {
    const auto it = deliveries_.find(id);
    if (it == deliveries_.end()) return nullptr;
    auto& d = it->second;
    if (d.status != DeliveryStatus::IN_FLIGHT || d.version != expected_version) {
        return nullptr;
    }
    return &d;
}

void InMemoryDeliveryStore::apply_attempt(WebhookDelivery& d, uint32_t attempts,
                                          const AttemptRecord& attempt,
                                          std::chrono::system_clock::time_point now) {
    d.attempts = std::max(d.attempts, attempts);
    d.last_response_status = attempt.response_status;
    d.last_response_body = attempt.response_body;
    d.last_error = attempt.error;
    d.claimed_at.reset();
    d.updated_at = now;
    ++d.version;
}

bool InMemoryDeliveryStore::mark_delivered(const std::string& id, uint64_t expected_version,
                                           uint32_t attempts, const AttemptRecord& attempt,
                                           std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* d = find_claimed(id, expected_version);
    if (!d) return false;
    d->status = DeliveryStatus::DELIVERED;
    d->delivered_at = now;
    apply_attempt(*d, attempts, attempt, now);
    return true;
}

bool InMemoryDeliveryStore::mark_retry(const std::string& id, uint64_t expected_version,
                                       uint32_t attempts,
                                       std::chrono::system_clock::time_point next_attempt_at,
                                       const AttemptRecord& attempt,
                                       std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* d = find_claimed(id, expected_version);
    if (!d) return false;
    d->status = DeliveryStatus::PENDING_RETRY;
    d->next_attempt_at = next_attempt_at;
    apply_attempt(*d, attempts, attempt, now);
    return true;
}

bool InMemoryDeliveryStore::mark_exhausted(const std::string& id, uint64_t expected_version,
                                           uint32_t attempts, const AttemptRecord& attempt,
                                           std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* d = find_claimed(id, expected_version);
    if (!d) return false;
    d->status = DeliveryStatus::FAILED_EXHAUSTED;
    apply_attempt(*d, attempts, attempt, now);
    return true;
}

bool InMemoryDeliveryStore::release_claim(const std::string& id, uint64_t expected_version,
                                          std::chrono::system_clock::time_point next_attempt_at,
                                          std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* d = find_claimed(id, expected_version);
    if (!d) return false;
    d->status = DeliveryStatus::PENDING_RETRY;
    d->next_attempt_at = next_attempt_at;
    d->claimed_at.reset();
    d->updated_at = now;
    ++d->version;
    return true;
}

bool InMemoryDeliveryStore::cancel(const std::string& id,
                                   std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    const auto it = deliveries_.find(id);
    if (it == deliveries_.end()) return false;
    auto& d = it->second;
    if (d.status != DeliveryStatus::PENDING && d.status != DeliveryStatus::PENDING_RETRY) {
        return false;
    }
    d.status = DeliveryStatus::CANCELLED;
    d.updated_at = now;
    ++d.version;
    return true;
}

size_t InMemoryDeliveryStore::recover_stale_in_flight(
    std::chrono::system_clock::time_point claimed_before,
    std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    size_t recovered = 0;
    for (auto& [_, d] : deliveries_) {
        if (d.status == DeliveryStatus::IN_FLIGHT &&
            d.claimed_at && *d.claimed_at < claimed_before) {
            d.status = DeliveryStatus::PENDING_RETRY;
            d.next_attempt_at = now;
            d.claimed_at.reset();
            d.updated_at = now;
            ++d.version;
            ++recovered;
        }
    }
    return recovered;
}

std::vector<WebhookDelivery> InMemoryDeliveryStore::list(std::optional<DeliveryStatus> status,
                                                         size_t limit) {
    std::lock_guard lock(mutex_);
    std::vector<WebhookDelivery> result;
    for (const auto& [_, d] : deliveries_) {
        if (!status || d.status == *status) result.push_back(d);
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.id < b.id);
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

std::map<DeliveryStatus, size_t> InMemoryDeliveryStore::count_by_status() {
    std::lock_guard lock(mutex_);
    std::map<DeliveryStatus, size_t> counts;
    for (const auto& [_, d] : deliveries_) {
        ++counts[d.status];
    }
    return counts;
}

} // namespace hookrelay
