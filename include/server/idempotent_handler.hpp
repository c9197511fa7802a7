#pragma once

#include "core/error.hpp"
#include "idempotency/idempotency_gate.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hookrelay {

/**
 * @brief Transport-neutral request/response pair for an idempotent route
 */
struct RouteRequest {
    std::string owner;                              // Authenticated caller
    std::string method;
    std::string path;
    std::string body;
    std::optional<std::string> idempotency_key;     // Unset when header absent
};

struct RouteResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    bool replayed = false;                          // Served from the idempotency cache
};

/**
 * @brief Wraps a mutating route with the idempotency gate
 *
 * - GET/HEAD/OPTIONS and requests without a key run the route directly.
 * - Keys longer than 255 bytes (or empty) are rejected with 400.
 * - Replays return the cached response with replayed = true.
 * - Responses with status < 500 are cached; a 5xx or a thrown exception
 *   releases the lock so the client can retry with the same key.
 */
class IdempotentHandler {
public:
    using Route = std::function<RouteResponse(const RouteRequest&)>;

    explicit IdempotentHandler(std::shared_ptr<IdempotencyGate> gate);

    [[nodiscard]] RouteResponse handle(const RouteRequest& request, const Route& route);

    struct Stats {
        uint64_t bypassed;
        uint64_t rejected_keys;
        uint64_t executed;
        uint64_t released_on_failure;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            bypassed_.load(std::memory_order_relaxed),
            rejected_keys_.load(std::memory_order_relaxed),
            executed_.load(std::memory_order_relaxed),
            released_on_failure_.load(std::memory_order_relaxed)
        };
    }

    [[nodiscard]] static bool is_safe_method(std::string_view method);

    /// {"error":{"code":"...","message":"..."}}
    [[nodiscard]] static RouteResponse error_response(ErrorCategory category,
                                                      const std::string& message);

private:
    std::shared_ptr<IdempotencyGate> gate_;

    std::atomic<uint64_t> bypassed_{0};
    std::atomic<uint64_t> rejected_keys_{0};
    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> released_on_failure_{0};
};

} // namespace hookrelay
