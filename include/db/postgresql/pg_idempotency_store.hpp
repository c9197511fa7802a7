#pragma once

#include "db/iconnection_pool.hpp"
#include "idempotency/iidempotency_store.hpp"

#include <memory>

namespace hookrelay {

/**
 * @brief idempotency_keys table. Each method is one statement; the primary
 * key on (scope, key) provides insert-if-absent.
 */
class PgIdempotencyStore : public IIdempotencyStore {
public:
    explicit PgIdempotencyStore(std::shared_ptr<IConnectionPool> pool);

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
    std::shared_ptr<IConnectionPool> pool_;
};

} // namespace hookrelay
