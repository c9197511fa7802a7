#pragma once

#include "idempotency/iidempotency_store.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace hookrelay {

/**
 * @brief In-memory idempotency table for single-node deployments and tests.
 *
 * The internal mutex plays the role of the database's row atomicity; callers
 * never hold it across operations.
 */
class InMemoryIdempotencyStore : public IIdempotencyStore {
public:
    InMemoryIdempotencyStore() = default;

    InsertResult insert_if_absent(const IdempotencyRecord& record) override;

    std::optional<IdempotencyRecord> find(
        const std::string& scope, const std::string& key) override;

    bool complete(const std::string& scope, const std::string& key,
                  const std::string& lock_token,
                  const CachedResponse& response,
                  std::chrono::system_clock::time_point completed_at) override;

    bool release(const std::string& scope, const std::string& key,
                 const std::string& lock_token) override;

    bool steal_lock(const std::string& scope, const std::string& key,
                    const std::string& expected_token,
                    const std::string& new_token,
                    std::chrono::system_clock::time_point now) override;

    bool remove_if_expired(const std::string& scope, const std::string& key,
                           std::chrono::system_clock::time_point now) override;

    size_t purge_expired(std::chrono::system_clock::time_point now) override;

    size_t count() override;

private:
    static std::string make_key(const std::string& scope, const std::string& key);

    std::unordered_map<std::string, IdempotencyRecord> records_;
    std::mutex mutex_;
};

} // namespace hookrelay
