#include "incoming/incoming_webhook_gateway.hpp"
#include "core/utils.hpp"
#include "security/signature_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>

namespace hookrelay {

// ============================================================================
// Default processor
// ============================================================================

Result<bool> LoggingEventProcessor::process(const IncomingWebhookEvent& event) {
    utils::log::info(std::format("Incoming event {}/{} processed ({} bytes)",
                                 event.source, event.event_id, event.payload.size()));
    return Result<bool>::ok(true);
}

// ============================================================================
// Gateway
// ============================================================================

IncomingWebhookGateway::IncomingWebhookGateway(std::vector<IncomingSource> sources,
                                               std::shared_ptr<IIncomingEventStore> store,
                                               std::shared_ptr<IEventProcessor> processor,
                                               std::shared_ptr<Clock> clock,
                                               Config config)
    : store_(std::move(store)),
      processor_(std::move(processor)),
      clock_(std::move(clock)),
      config_(config),
      queue_(config.queue_capacity) {
    for (auto& src : sources) {
        auto name = src.name;
        sources_.emplace(std::move(name), std::move(src));
    }
}

IncomingWebhookGateway::~IncomingWebhookGateway() {
    stop();
}

const IncomingSource* IncomingWebhookGateway::find_source(std::string_view name) const {
    const auto it = sources_.find(std::string(name));
    return it == sources_.end() ? nullptr : &it->second;
}

std::optional<std::string> IncomingWebhookGateway::extract_event_id(std::string_view body,
                                                                    std::string_view field_path) {
    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    const nlohmann::json* node = &doc;
    for (const auto& part : utils::split(std::string(field_path), '.')) {
        if (!node->is_object()) return std::nullopt;
        const auto it = node->find(part);
        if (it == node->end()) return std::nullopt;
        node = &*it;
    }

    if (node->is_string()) {
        auto id = node->get<std::string>();
        if (id.empty()) return std::nullopt;
        return id;
    }
    if (node->is_number_integer()) {
        return std::to_string(node->get<int64_t>());
    }
    return std::nullopt;
}

Result<ReceiveOutcome> IncomingWebhookGateway::receive(const std::string& source,
                                                       const std::string& raw_body,
                                                       const std::string& signature_header) {
    const auto* src = find_source(source);
    if (!src) {
        return Result<ReceiveOutcome>::error(ErrorCategory::NOT_FOUND,
                                             std::format("Unknown webhook source '{}'", source));
    }

    const auto outcome = SignatureEngine::verify_with_scheme(
        src->scheme, signature_header, raw_body, src->secret,
        clock_->now(), config_.tolerance);
    if (outcome != VerifyOutcome::VALID) {
        signature_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Incoming webhook from '{}' rejected: signature {}",
                                     source, verify_outcome_to_string(outcome)));
        return Result<ReceiveOutcome>::error(
            ErrorCategory::SIGNATURE,
            std::format("Signature verification failed: {}", verify_outcome_to_string(outcome)));
    }

    auto event_id = extract_event_id(raw_body, src->event_id_field);
    if (!event_id) {
        return Result<ReceiveOutcome>::error(
            ErrorCategory::VALIDATION,
            std::format("Payload has no event id at '{}'", src->event_id_field));
    }

    const auto now = clock_->now();
    IncomingWebhookEvent ev;
    ev.source = source;
    ev.event_id = *event_id;
    ev.payload = raw_body;
    ev.status = IncomingStatus::RECEIVED;
    ev.received_at = now;
    ev.updated_at = now;

    if (!store_->insert_if_absent(ev)) {
        duplicates_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Incoming event {}/{} already received", source, *event_id));
        return Result<ReceiveOutcome>::ok(ReceiveOutcome::DUPLICATE);
    }

    accepted_.fetch_add(1, std::memory_order_relaxed);
    (void)enqueue(source, *event_id);
    return Result<ReceiveOutcome>::ok(ReceiveOutcome::ACCEPTED);
}

Result<bool> IncomingWebhookGateway::retry(const std::string& source, const std::string& event_id) {
    const auto ev = store_->get(source, event_id);
    if (!ev) {
        return Result<bool>::error(ErrorCategory::NOT_FOUND,
                                   std::format("Incoming event {}/{} not found", source, event_id));
    }
    if (ev->status == IncomingStatus::RECEIVED) {
        utils::log::info(std::format("Incoming event {}/{} re-enqueued by operator", source, event_id));
        return Result<bool>::ok(enqueue(source, event_id));
    }
    if (!store_->reset_for_retry(source, event_id, clock_->now())) {
        return Result<bool>::error(
            ErrorCategory::CONFLICT,
            std::format("Incoming event {}/{} is {}, only error or received events can be retried",
                        source, event_id, incoming_status_to_string(ev->status)));
    }
    utils::log::info(std::format("Incoming event {}/{} reset for retry", source, event_id));
    return Result<bool>::ok(enqueue(source, event_id));
}

bool IncomingWebhookGateway::enqueue(const std::string& source, const std::string& event_id) {
    busy_.fetch_add(1, std::memory_order_acq_rel);
    if (queue_.try_push(EventKey{source, event_id})) {
        return true;
    }
    busy_.fetch_sub(1, std::memory_order_acq_rel);
    queue_full_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format(
        "Incoming processing queue full, event {}/{} left in received state", source, event_id));
    return false;
}

void IncomingWebhookGateway::start() {
    if (running_.exchange(true)) return;
    const uint32_t n = std::max<uint32_t>(config_.processing_threads, 1);
    threads_.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        threads_.emplace_back([this] { processing_loop(); });
    }
    recovery_thread_ = std::thread([this] { recovery_loop(); });
}

void IncomingWebhookGateway::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard lock(recovery_mutex_);
    }
    recovery_cv_.notify_all();
    queue_.close();
    if (recovery_thread_.joinable()) recovery_thread_.join();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    const auto left = queue_.drain();
    busy_.fetch_sub(left.size(), std::memory_order_acq_rel);
    if (!left.empty()) {
        utils::log::info(std::format("{} incoming events left in received state at shutdown",
                                     left.size()));
    }
}

bool IncomingWebhookGateway::wait_idle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (busy_.load(std::memory_order_acquire) > 0) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

void IncomingWebhookGateway::processing_loop() {
    while (auto key = queue_.pop()) {
        try {
            process_one(*key);
        } catch (const std::exception& e) {
            // Storage failure: a row left PROCESSING is returned by recovery
            processing_errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Incoming event {}/{} processing aborted: {}",
                                          key->first, key->second, e.what()));
        }
        busy_.fetch_sub(1, std::memory_order_acq_rel);
    }
}

void IncomingWebhookGateway::recovery_loop() {
    // First pass takes every RECEIVED row: nothing queued survives a restart
    std::chrono::seconds min_idle{0};
    while (running_.load(std::memory_order_relaxed)) {
        try {
            const auto now = clock_->now();
            const size_t reset = store_->recover_stale_processing(
                now - config_.processing_stale_after, now);
            if (reset > 0) {
                utils::log::warn(std::format("Recovered {} incoming events stuck in processing",
                                             reset));
            }
            const size_t n = recover(min_idle);
            if (n > 0) {
                utils::log::info(std::format("Re-enqueued {} unprocessed incoming events", n));
            }
        } catch (const std::exception& e) {
            utils::log::error(std::format("Incoming event recovery failed: {}", e.what()));
        }
        min_idle = config_.recovery_interval;

        std::unique_lock lock(recovery_mutex_);
        recovery_cv_.wait_for(lock, config_.recovery_interval, [this] {
            return !running_.load(std::memory_order_relaxed);
        });
    }
}

size_t IncomingWebhookGateway::recover(std::chrono::seconds min_idle) {
    const auto rows = store_->list_unprocessed(clock_->now() - min_idle,
                                               std::max<size_t>(config_.recovery_batch_size, 1));
    size_t handed_off = 0;
    for (const auto& ev : rows) {
        busy_.fetch_add(1, std::memory_order_acq_rel);
        if (!queue_.push(EventKey{ev.source, ev.event_id})) {
            // Closed by stop(): the rest stay RECEIVED for the next start()
            busy_.fetch_sub(1, std::memory_order_acq_rel);
            break;
        }
        ++handed_off;
    }
    recovered_.fetch_add(handed_off, std::memory_order_relaxed);
    return handed_off;
}

void IncomingWebhookGateway::process_one(const EventKey& key) {
    const auto& [source, event_id] = key;
    if (!store_->mark_processing(source, event_id, clock_->now())) {
        return;
    }
    const auto ev = store_->get(source, event_id);
    if (!ev) return;

    std::string error;
    try {
        const auto result = processor_->process(*ev);
        if (result.is_error()) {
            error = result.error_message().empty() ? "processing failed" : result.error_message();
        }
    } catch (const std::exception& e) {
        error = e.what();
    }

    const auto now = clock_->now();
    if (error.empty()) {
        if (store_->mark_processed(source, event_id, now)) {
            processed_.fetch_add(1, std::memory_order_relaxed);
        }
        return;
    }

    processing_errors_.fetch_add(1, std::memory_order_relaxed);
    utils::log::error(std::format("Incoming event {}/{} failed: {}", source, event_id, error));
    if (!store_->mark_error(source, event_id, error, now)) {
        utils::log::warn(std::format("Incoming event {}/{} changed state before error was recorded",
                                     source, event_id));
    }
}

IncomingWebhookGateway::Stats IncomingWebhookGateway::get_stats() const {
    return {
        accepted_.load(std::memory_order_relaxed),
        duplicates_.load(std::memory_order_relaxed),
        signature_failures_.load(std::memory_order_relaxed),
        processed_.load(std::memory_order_relaxed),
        processing_errors_.load(std::memory_order_relaxed),
        queue_full_.load(std::memory_order_relaxed),
        recovered_.load(std::memory_order_relaxed)
    };
}

} // namespace hookrelay
