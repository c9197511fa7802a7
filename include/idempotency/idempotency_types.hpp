#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace hookrelay {

enum class IdempotencyStatus {
    LOCKED,
    COMPLETED
};

[[nodiscard]] inline const char* idempotency_status_to_string(IdempotencyStatus s) {
    return s == IdempotencyStatus::COMPLETED ? "completed" : "locked";
}

/**
 * @brief Response captured when the guarded operation finished
 */
struct CachedResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

/**
 * @brief One row per (scope, key)
 *
 * request_hash never changes after the first insert. response is set exactly
 * once, on the LOCKED → COMPLETED transition, and is immutable afterwards.
 * lock_token identifies the current holder; a stolen lock gets a new token.
 */
struct IdempotencyRecord {
    std::string scope;
    std::string key;
    std::string request_hash;
    IdempotencyStatus status = IdempotencyStatus::LOCKED;
    std::string lock_token;
    std::optional<CachedResponse> response;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point locked_at{};
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::chrono::system_clock::time_point expires_at{};
};

} // namespace hookrelay
