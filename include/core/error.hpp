#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hookrelay {

/**
 * @brief Error categories surfaced by the delivery and idempotency core
 *
 * CONFLICT, LOCKED and SIGNATURE are reported synchronously to the caller.
 * TRANSIENT_DELIVERY and EXHAUSTED are recorded on the delivery row and never
 * raised to the event producer.
 */
enum class ErrorCategory {
    NONE,
    CONFLICT,            // Idempotency key reused with a different request
    LOCKED,              // Same idempotency key currently executing
    SIGNATURE,           // Missing, invalid or expired webhook signature
    TRANSIENT_DELIVERY,  // Timeout, network failure or non-2xx response
    EXHAUSTED,           // Delivery failed after the attempt cap
    VALIDATION,
    NOT_FOUND,
    STORAGE,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr int http_status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:               return 200;
        case ErrorCategory::CONFLICT:           return 422;
        case ErrorCategory::LOCKED:             return 409;
        case ErrorCategory::SIGNATURE:          return 400;
        case ErrorCategory::VALIDATION:         return 400;
        case ErrorCategory::NOT_FOUND:          return 404;
        case ErrorCategory::STORAGE:            return 503;
        case ErrorCategory::TRANSIENT_DELIVERY: return 502;
        case ErrorCategory::EXHAUSTED:          return 502;
        case ErrorCategory::INTERNAL_ERROR:     return 500;
    }
    return 500;
}

/**
 * @brief Stable machine-readable code placed in {"error":{"code":...}} bodies
 */
[[nodiscard]] inline constexpr std::string_view error_code_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:               return "none";
        case ErrorCategory::CONFLICT:           return "idempotency_key_reused";
        case ErrorCategory::LOCKED:             return "idempotency_key_locked";
        case ErrorCategory::SIGNATURE:          return "invalid_signature";
        case ErrorCategory::TRANSIENT_DELIVERY: return "delivery_failed";
        case ErrorCategory::EXHAUSTED:          return "delivery_exhausted";
        case ErrorCategory::VALIDATION:         return "validation_failed";
        case ErrorCategory::NOT_FOUND:          return "not_found";
        case ErrorCategory::STORAGE:            return "storage_unavailable";
        case ErrorCategory::INTERNAL_ERROR:     return "internal_error";
    }
    return "internal_error";
}

/**
 * @brief Thrown by store backends when the durable store itself fails
 * (connection lost, statement error). Expected outcomes such as a
 * uniqueness conflict or a lost compare-and-set are return values instead.
 */
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace hookrelay
