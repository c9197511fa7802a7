#include "idempotency/idempotency_gate.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "security/signature_engine.hpp"

#include <format>

namespace hookrelay {

namespace {

// Bounded so a pathological expire/insert race cannot spin forever
constexpr int kMaxAcquireRounds = 4;

} // namespace

IdempotencyGate::IdempotencyGate(std::shared_ptr<IIdempotencyStore> store,
                                 std::shared_ptr<Clock> clock,
                                 Config config)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      config_(config) {}

IdempotencyGate::~IdempotencyGate() {
    stop_sweeper();
}

AcquireResult IdempotencyGate::acquire(const std::string& key,
                                       const std::string& scope,
                                       const std::string& request_hash) {
    for (int round = 0; round < kMaxAcquireRounds; ++round) {
        const auto now = clock_->now();

        IdempotencyRecord candidate;
        candidate.scope = scope;
        candidate.key = key;
        candidate.request_hash = request_hash;
        candidate.status = IdempotencyStatus::LOCKED;
        candidate.lock_token = utils::generate_uuid();
        candidate.created_at = now;
        candidate.locked_at = now;
        candidate.expires_at = now + config_.ttl;

        auto inserted = store_->insert_if_absent(candidate);
        if (inserted.inserted) {
            proceeded_.fetch_add(1, std::memory_order_relaxed);
            return {AcquireOutcome::PROCEED,
                    LockToken{scope, key, candidate.lock_token},
                    std::nullopt, false};
        }

        if (!inserted.existing) {
            // Row vanished between the conflicting insert and the read-back
            continue;
        }
        const auto& existing = *inserted.existing;

        if (existing.expires_at <= now) {
            (void)store_->remove_if_expired(scope, key, now);
            continue;
        }

        if (existing.request_hash != request_hash) {
            conflicts_.fetch_add(1, std::memory_order_relaxed);
            return {AcquireOutcome::CONFLICT, std::nullopt, std::nullopt, false};
        }

        if (existing.status == IdempotencyStatus::COMPLETED) {
            replayed_.fetch_add(1, std::memory_order_relaxed);
            return {AcquireOutcome::REPLAY, std::nullopt, existing.response, false};
        }

        if (now - existing.locked_at < config_.stale_lock) {
            locked_.fetch_add(1, std::memory_order_relaxed);
            return {AcquireOutcome::LOCKED, std::nullopt, std::nullopt, false};
        }

        const std::string new_token = utils::generate_uuid();
        if (store_->steal_lock(scope, key, existing.lock_token, new_token, now)) {
            utils::log::warn(std::format(
                "Idempotency: took over stale lock for key '{}' in scope '{}'", key, scope));
            stolen_.fetch_add(1, std::memory_order_relaxed);
            proceeded_.fetch_add(1, std::memory_order_relaxed);
            return {AcquireOutcome::PROCEED, LockToken{scope, key, new_token},
                    std::nullopt, true};
        }
        // Someone else completed, released or stole first: re-evaluate
    }

    locked_.fetch_add(1, std::memory_order_relaxed);
    return {AcquireOutcome::LOCKED, std::nullopt, std::nullopt, false};
}

bool IdempotencyGate::complete(const LockToken& lock, const CachedResponse& response) {
    if (store_->complete(lock.scope, lock.key, lock.token, response, clock_->now())) {
        completed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    lost_locks_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format(
        "Idempotency: lock for key '{}' was lost before completion, response not cached",
        lock.key));
    return false;
}

bool IdempotencyGate::release(const LockToken& lock) {
    if (store_->release(lock.scope, lock.key, lock.token)) {
        released_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    return false;
}

size_t IdempotencyGate::sweep() {
    const size_t removed = store_->purge_expired(clock_->now());
    swept_.fetch_add(removed, std::memory_order_relaxed);
    if (removed > 0) {
        utils::log::debug(std::format("Idempotency: swept {} expired keys", removed));
    }
    return removed;
}

std::string IdempotencyGate::fingerprint(std::string_view method,
                                         std::string_view path,
                                         std::string_view body) {
    std::string material;
    material.reserve(method.size() + path.size() + body.size() + 2);
    material.append(utils::to_upper(method));
    material.push_back('\n');
    material.append(path);
    material.push_back('\n');
    material.append(body);
    return SignatureEngine::sha256_hex(material);
}

std::string IdempotencyGate::make_scope(std::string_view owner,
                                        std::string_view method,
                                        std::string_view path) {
    return std::format("{}:{} {}", owner, utils::to_upper(method), path);
}

void IdempotencyGate::start_sweeper() {
    if (running_.exchange(true)) return;
    sweep_thread_ = std::thread([this] { sweep_loop(); });
}

void IdempotencyGate::stop_sweeper() {
    if (!running_.exchange(false)) return;
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

IdempotencyGate::Stats IdempotencyGate::get_stats() const {
    return {
        proceeded_.load(std::memory_order_relaxed),
        replayed_.load(std::memory_order_relaxed),
        conflicts_.load(std::memory_order_relaxed),
        locked_.load(std::memory_order_relaxed),
        stolen_.load(std::memory_order_relaxed),
        completed_.load(std::memory_order_relaxed),
        lost_locks_.load(std::memory_order_relaxed),
        released_.load(std::memory_order_relaxed),
        swept_.load(std::memory_order_relaxed),
        sweep_errors_.load(std::memory_order_relaxed)
    };
}

void IdempotencyGate::sweep_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        std::unique_lock lock(sweep_mutex_);
        sweep_cv_.wait_for(lock, config_.sweep_interval,
            [this] { return !running_.load(std::memory_order_relaxed); });

        if (!running_.load(std::memory_order_relaxed)) break;

        try {
            (void)sweep();
        } catch (const std::exception& e) {
            sweep_errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Idempotency sweep failed: {}", e.what()));
        }
    }
}

} // namespace hookrelay
