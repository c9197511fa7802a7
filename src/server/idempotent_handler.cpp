#include "server/idempotent_handler.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace hookrelay {

IdempotentHandler::IdempotentHandler(std::shared_ptr<IdempotencyGate> gate)
    : gate_(std::move(gate)) {}

bool IdempotentHandler::is_safe_method(std::string_view method) {
    const auto upper = utils::to_upper(method);
    return upper == "GET" || upper == "HEAD" || upper == "OPTIONS";
}

RouteResponse IdempotentHandler::error_response(ErrorCategory category, const std::string& message) {
    const nlohmann::json body = {
        {"error", {
            {"code", std::string(error_code_for(category))},
            {"message", message}
        }}
    };
    RouteResponse res;
    res.status = http_status_for(category);
    res.body = body.dump();
    res.content_type = http::kJsonContentType;
    return res;
}

RouteResponse IdempotentHandler::handle(const RouteRequest& request, const Route& route) {
    if (is_safe_method(request.method) || !request.idempotency_key) {
        bypassed_.fetch_add(1, std::memory_order_relaxed);
        return route(request);
    }

    const auto& key = *request.idempotency_key;
    if (key.empty() || key.size() > http::kMaxIdempotencyKeyLength) {
        rejected_keys_.fetch_add(1, std::memory_order_relaxed);
        return error_response(ErrorCategory::VALIDATION, std::format(
            "{} must be 1-{} bytes", http::kIdempotencyKeyHeader, http::kMaxIdempotencyKeyLength));
    }

    const auto scope = IdempotencyGate::make_scope(request.owner, request.method, request.path);
    const auto hash = IdempotencyGate::fingerprint(request.method, request.path, request.body);
    auto acquired = gate_->acquire(key, scope, hash);

    switch (acquired.outcome) {
        case AcquireOutcome::REPLAY: {
            RouteResponse res;
            res.status = acquired.cached->status;
            res.body = acquired.cached->body;
            res.content_type = acquired.cached->content_type;
            res.replayed = true;
            return res;
        }
        case AcquireOutcome::CONFLICT:
            return error_response(ErrorCategory::CONFLICT,
                "Idempotency-Key was already used with a different request");
        case AcquireOutcome::LOCKED:
            return error_response(ErrorCategory::LOCKED,
                "A request with this Idempotency-Key is still being processed");
        case AcquireOutcome::PROCEED:
            break;
    }

    const LockToken lock = *acquired.lock;
    executed_.fetch_add(1, std::memory_order_relaxed);

    RouteResponse res;
    try {
        res = route(request);
    } catch (const std::exception& e) {
        gate_->release(lock);
        released_on_failure_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {} failed under key '{}': {}",
                                      request.method, request.path, key, e.what()));
        throw;
    }

    if (res.status >= 500) {
        gate_->release(lock);
        released_on_failure_.fetch_add(1, std::memory_order_relaxed);
        return res;
    }

    gate_->complete(lock, CachedResponse{res.status, res.body, res.content_type});
    return res;
}

} // namespace hookrelay
