#pragma once

#include "idempotency/idempotency_types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace hookrelay {

/**
 * @brief Durable idempotency key table
 *
 * Every method is a single atomic operation against the backing store
 * (one SQL statement for PostgreSQL). Guarded transitions are
 * compare-and-set: they return false when the expected state no longer
 * holds, and never block waiting for another holder.
 *
 * Backend failures throw StorageError.
 */
class IIdempotencyStore {
public:
    virtual ~IIdempotencyStore() = default;

    struct InsertResult {
        bool inserted = false;
        std::optional<IdempotencyRecord> existing;  // Set when !inserted
    };

    /**
     * @brief Insert the record unless (scope, key) already exists
     * @return inserted=true, or the row that won
     */
    [[nodiscard]] virtual InsertResult insert_if_absent(const IdempotencyRecord& record) = 0;

    [[nodiscard]] virtual std::optional<IdempotencyRecord> find(
        const std::string& scope, const std::string& key) = 0;

    /**
     * @brief LOCKED → COMPLETED, only if lock_token still holds the lock
     */
    [[nodiscard]] virtual bool complete(
        const std::string& scope, const std::string& key,
        const std::string& lock_token,
        const CachedResponse& response,
        std::chrono::system_clock::time_point completed_at) = 0;

    /**
     * @brief Delete a LOCKED row held by lock_token
     */
    [[nodiscard]] virtual bool release(
        const std::string& scope, const std::string& key,
        const std::string& lock_token) = 0;

    /**
     * @brief Take over a LOCKED row still held by expected_token
     */
    [[nodiscard]] virtual bool steal_lock(
        const std::string& scope, const std::string& key,
        const std::string& expected_token,
        const std::string& new_token,
        std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief Delete the row if its expires_at is at or before now
     */
    [[nodiscard]] virtual bool remove_if_expired(
        const std::string& scope, const std::string& key,
        std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief Delete every row with expires_at at or before now, any status
     * @return Number of rows removed
     */
    virtual size_t purge_expired(std::chrono::system_clock::time_point now) = 0;

    [[nodiscard]] virtual size_t count() = 0;
};

} // namespace hookrelay
