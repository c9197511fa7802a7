#include "incoming/memory_incoming_event_store.hpp"

#include <algorithm>

namespace hookrelay {

bool InMemoryIncomingEventStore::insert_if_absent(const IncomingWebhookEvent& event) {
    std::lock_guard lock(mutex_);
    return events_.try_emplace(Key{event.source, event.event_id}, event).second;
}

std::optional<IncomingWebhookEvent> InMemoryIncomingEventStore::get(
    const std::string& source, const std::string& event_id) {
    std::lock_guard lock(mutex_);
    const auto it = events_.find(Key{source, event_id});
    if (it == events_.end()) return std::nullopt;
    return it->second;
}

IncomingWebhookEvent* InMemoryIncomingEventStore::find_in(const std::string& source,
                                                          const std::string& event_id,
                                                          IncomingStatus expected) {
    const auto it = events_.find(Key{source, event_id});
    if (it == events_.end() || it->second.status != expected) return nullptr;
    return &it->second;
}

bool InMemoryIncomingEventStore::mark_processing(const std::string& source,
                                                 const std::string& event_id,
                                                 std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* ev = find_in(source, event_id, IncomingStatus::RECEIVED);
    if (!ev) return false;
    ev->status = IncomingStatus::PROCESSING;
    ++ev->processing_attempts;
    ev->updated_at = now;
    return true;
}

bool InMemoryIncomingEventStore::mark_processed(const std::string& source,
                                                const std::string& event_id,
                                                std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* ev = find_in(source, event_id, IncomingStatus::PROCESSING);
    if (!ev) return false;
    ev->status = IncomingStatus::PROCESSED;
    ev->error_message.clear();
    ev->processed_at = now;
    ev->updated_at = now;
    return true;
}

bool InMemoryIncomingEventStore::mark_error(const std::string& source,
                                            const std::string& event_id,
                                            const std::string& error_message,
                                            std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* ev = find_in(source, event_id, IncomingStatus::PROCESSING);
    if (!ev) return false;
    ev->status = IncomingStatus::ERROR;
    ev->error_message = error_message;
    ev->updated_at = now;
    return true;
}

bool InMemoryIncomingEventStore::reset_for_retry(const std::string& source,
                                                 const std::string& event_id,
                                                 std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto* ev = find_in(source, event_id, IncomingStatus::ERROR);
    if (!ev) return false;
    ev->status = IncomingStatus::RECEIVED;
    ev->error_message.clear();
    ev->updated_at = now;
    return true;
}

std::vector<IncomingWebhookEvent> InMemoryIncomingEventStore::list_unprocessed(
    std::chrono::system_clock::time_point updated_before, size_t limit) {
    std::lock_guard lock(mutex_);
    std::vector<IncomingWebhookEvent> result;
    for (const auto& [_, ev] : events_) {
        if (ev.status == IncomingStatus::RECEIVED && ev.updated_at <= updated_before) {
            result.push_back(ev);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.received_at < b.received_at;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

size_t InMemoryIncomingEventStore::recover_stale_processing(
    std::chrono::system_clock::time_point updated_before,
    std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    size_t moved = 0;
    for (auto& [_, ev] : events_) {
        if (ev.status == IncomingStatus::PROCESSING && ev.updated_at < updated_before) {
            ev.status = IncomingStatus::RECEIVED;
            ev.updated_at = now;
            ++moved;
        }
    }
    return moved;
}

std::vector<IncomingWebhookEvent> InMemoryIncomingEventStore::list(
    std::optional<IncomingStatus> status, size_t limit) {
    std::lock_guard lock(mutex_);
    std::vector<IncomingWebhookEvent> result;
    for (const auto& [_, ev] : events_) {
        if (!status || ev.status == *status) result.push_back(ev);
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.received_at < b.received_at;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

std::map<IncomingStatus, size_t> InMemoryIncomingEventStore::count_by_status() {
    std::lock_guard lock(mutex_);
    std::map<IncomingStatus, size_t> counts;
    for (const auto& [_, ev] : events_) {
        ++counts[ev.status];
    }
    return counts;
}

} // namespace hookrelay
