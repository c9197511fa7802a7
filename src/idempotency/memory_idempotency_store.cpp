#include "idempotency/memory_idempotency_store.hpp"

namespace hookrelay {

std::string InMemoryIdempotencyStore::make_key(const std::string& scope, const std::string& key) {
    std::string composite;
    composite.reserve(scope.size() + 1 + key.size());
    composite.append(scope);
    composite.push_back('\x1f');
    composite.append(key);
    return composite;
}

IIdempotencyStore::InsertResult InMemoryIdempotencyStore::insert_if_absent(
    const IdempotencyRecord& record) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = records_.try_emplace(make_key(record.scope, record.key), record);
    if (inserted) {
        return {true, std::nullopt};
    }
    return {false, it->second};
}

std::optional<IdempotencyRecord> InMemoryIdempotencyStore::find(
    const std::string& scope, const std::string& key) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(make_key(scope, key));
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryIdempotencyStore::complete(const std::string& scope, const std::string& key,
                                        const std::string& lock_token,
                                        const CachedResponse& response,
                                        std::chrono::system_clock::time_point completed_at) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(make_key(scope, key));
    if (it == records_.end()) return false;

    auto& rec = it->second;
    if (rec.status != IdempotencyStatus::LOCKED || rec.lock_token != lock_token) {
        return false;
    }
    rec.status = IdempotencyStatus::COMPLETED;
    rec.response = response;
    rec.completed_at = completed_at;
    return true;
}

bool InMemoryIdempotencyStore::release(const std::string& scope, const std::string& key,
                                       const std::string& lock_token) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(make_key(scope, key));
    if (it == records_.end()) return false;

    if (it->second.status != IdempotencyStatus::LOCKED || it->second.lock_token != lock_token) {
        return false;
    }
    records_.erase(it);
    return true;
}

bool InMemoryIdempotencyStore::steal_lock(const std::string& scope, const std::string& key,
                                          const std::string& expected_token,
                                          const std::string& new_token,
                                          std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(make_key(scope, key));
    if (it == records_.end()) return false;

    auto& rec = it->second;
    if (rec.status != IdempotencyStatus::LOCKED || rec.lock_token != expected_token) {
        return false;
    }
    rec.lock_token = new_token;
    rec.locked_at = now;
    return true;
}

bool InMemoryIdempotencyStore::remove_if_expired(const std::string& scope, const std::string& key,
                                                 std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(make_key(scope, key));
    if (it == records_.end() || it->second.expires_at > now) {
        return false;
    }
    records_.erase(it);
    return true;
}

size_t InMemoryIdempotencyStore::purge_expired(std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    return std::erase_if(records_, [now](const auto& entry) {
        return entry.second.expires_at <= now;
    });
}

size_t InMemoryIdempotencyStore::count() {
    std::lock_guard lock(mutex_);
    return records_.size();
}

} // namespace hookrelay
