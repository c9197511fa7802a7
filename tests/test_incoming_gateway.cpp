#include <catch2/catch_test_macros.hpp>
#include "incoming/incoming_webhook_gateway.hpp"
#include "incoming/memory_incoming_event_store.hpp"
#include "security/signature_engine.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <format>
#include <functional>
#include <optional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace hookrelay;
using namespace std::chrono_literals;

namespace {

const std::string kSecret = "whsec_inbound_test";

/// Fails every event whose id is in fail_ids; throws for throw_ids
class ScriptedProcessor : public IEventProcessor {
public:
    Result<bool> process(const IncomingWebhookEvent& event) override {
        ++calls;
        std::lock_guard lock(mutex);
        if (throw_ids.contains(event.event_id)) {
            throw std::runtime_error("processor exploded");
        }
        if (fail_ids.contains(event.event_id)) {
            return Result<bool>::error(ErrorCategory::INTERNAL_ERROR, "downstream rejected");
        }
        return Result<bool>::ok(true);
    }

    std::mutex mutex;
    std::set<std::string> fail_ids;
    std::set<std::string> throw_ids;
    std::atomic<int> calls{0};
};

struct GatewayFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryIncomingEventStore> store = std::make_shared<InMemoryIncomingEventStore>();
    std::shared_ptr<ScriptedProcessor> processor = std::make_shared<ScriptedProcessor>();
    IncomingWebhookGateway gateway;

    explicit GatewayFixture(IncomingWebhookGateway::Config cfg = {})
        : gateway(sources(), store, processor, clock, cfg) {}

    static std::vector<IncomingSource> sources() {
        IncomingSource stripe;
        stripe.name = "billing";
        stripe.secret = kSecret;

        IncomingSource github;
        github.name = "git";
        github.secret = kSecret;
        github.scheme = SignatureScheme::HEX_SHA256;
        github.signature_header = "X-Hub-Signature-256";
        github.event_id_field = "delivery.guid";
        return {stripe, github};
    }

    std::string sign(const std::string& body) const {
        return SignatureEngine::sign(body, kSecret, now_seconds());
    }

    int64_t now_seconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            clock->now().time_since_epoch()).count();
    }

    Result<ReceiveOutcome> post(const std::string& body) {
        return gateway.receive("billing", body, sign(body));
    }
};

bool eventually(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

std::optional<IncomingStatus> status_of(IIncomingEventStore& store, const std::string& event_id) {
    const auto ev = store.get("billing", event_id);
    if (!ev) return std::nullopt;
    return ev->status;
}

} // namespace

TEST_CASE("IncomingWebhookGateway: event id extraction", "[incoming]") {
    using G = IncomingWebhookGateway;
    CHECK(G::extract_event_id(R"({"id":"evt_1"})", "id") == "evt_1");
    CHECK(G::extract_event_id(R"({"id":42})", "id") == "42");
    CHECK(G::extract_event_id(R"({"data":{"object":{"id":"x"}}})", "data.object.id") == "x");

    CHECK_FALSE(G::extract_event_id(R"({"id":""})", "id").has_value());
    CHECK_FALSE(G::extract_event_id(R"({"id":1.5})", "id").has_value());
    CHECK_FALSE(G::extract_event_id(R"({"id":null})", "id").has_value());
    CHECK_FALSE(G::extract_event_id(R"({"other":"x"})", "id").has_value());
    CHECK_FALSE(G::extract_event_id(R"({"data":"flat"})", "data.id").has_value());
    CHECK_FALSE(G::extract_event_id(R"(["id"])", "id").has_value());
    CHECK_FALSE(G::extract_event_id("not json", "id").has_value());
}

TEST_CASE("IncomingWebhookGateway: accepted event is processed once", "[incoming]") {
    GatewayFixture f;
    f.gateway.start();

    const std::string body = R"({"id":"evt_100","type":"invoice.paid"})";
    auto first = f.post(body);
    REQUIRE(first.is_ok());
    CHECK(first.value() == ReceiveOutcome::ACCEPTED);

    REQUIRE(f.gateway.wait_idle(5000ms));
    auto ev = f.store->get("billing", "evt_100");
    REQUIRE(ev.has_value());
    CHECK(ev->status == IncomingStatus::PROCESSED);
    CHECK(ev->processing_attempts == 1);
    CHECK(ev->payload == body);
    CHECK(ev->processed_at.has_value());

    // Provider redelivers the same event, possibly re-signed later
    f.clock->advance(30s);
    auto again = f.post(body);
    REQUIRE(again.is_ok());
    CHECK(again.value() == ReceiveOutcome::DUPLICATE);
    REQUIRE(f.gateway.wait_idle(5000ms));

    CHECK(f.processor->calls.load() == 1);
    const auto stats = f.gateway.get_stats();
    CHECK(stats.accepted == 1);
    CHECK(stats.duplicates == 1);
    CHECK(stats.processed == 1);
    f.gateway.stop();
}

TEST_CASE("IncomingWebhookGateway: concurrent duplicates accept exactly one", "[incoming][concurrency]") {
    GatewayFixture f;
    f.gateway.start();

    const std::string body = R"({"id":"evt_race"})";
    const auto sig = f.sign(body);
    std::atomic<int> accepted{0};
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&] {
            auto r = f.gateway.receive("billing", body, sig);
            if (r.is_ok() && r.value() == ReceiveOutcome::ACCEPTED) ++accepted;
            if (r.is_ok() && r.value() == ReceiveOutcome::DUPLICATE) ++duplicates;
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(f.gateway.wait_idle(5000ms));

    CHECK(accepted.load() == 1);
    CHECK(duplicates.load() == 9);
    CHECK(f.processor->calls.load() == 1);
    f.gateway.stop();
}

TEST_CASE("IncomingWebhookGateway: signature failures store nothing", "[incoming]") {
    GatewayFixture f;
    const std::string body = R"({"id":"evt_bad"})";

    SECTION("wrong secret") {
        const auto sig = SignatureEngine::sign(body, "whsec_wrong", f.now_seconds());
        auto r = f.gateway.receive("billing", body, sig);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::SIGNATURE);
    }

    SECTION("tampered body") {
        auto r = f.gateway.receive("billing", R"({"id":"evt_bad","x":1})", f.sign(body));
        CHECK(r.error_category() == ErrorCategory::SIGNATURE);
    }

    SECTION("outside replay window") {
        const auto sig = f.sign(body);
        f.clock->advance(301s);
        auto r = f.gateway.receive("billing", body, sig);
        CHECK(r.error_category() == ErrorCategory::SIGNATURE);
    }

    SECTION("missing header") {
        auto r = f.gateway.receive("billing", body, "");
        CHECK(r.error_category() == ErrorCategory::SIGNATURE);
    }

    CHECK_FALSE(f.store->get("billing", "evt_bad").has_value());
    CHECK(f.gateway.get_stats().signature_failures == 1);
}

TEST_CASE("IncomingWebhookGateway: unknown source and missing id", "[incoming]") {
    GatewayFixture f;

    auto unknown = f.gateway.receive("nobody", "{}", "");
    CHECK(unknown.error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.gateway.find_source("billing") != nullptr);
    CHECK(f.gateway.find_source("nobody") == nullptr);

    auto no_id = f.post(R"({"type":"ping"})");
    REQUIRE(no_id.is_error());
    CHECK(no_id.error_category() == ErrorCategory::VALIDATION);
    CHECK(f.store->list(std::nullopt, 10).empty());
}

TEST_CASE("IncomingWebhookGateway: body-hex scheme and nested id", "[incoming]") {
    GatewayFixture f;
    f.gateway.start();

    const std::string body = R"({"delivery":{"guid":"g-1"},"action":"opened"})";
    const auto sig = "sha256=" + SignatureEngine::hmac_sha256_hex(kSecret, body);

    auto r = f.gateway.receive("git", body, sig);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ReceiveOutcome::ACCEPTED);
    REQUIRE(f.gateway.wait_idle(5000ms));
    CHECK(f.store->get("git", "g-1")->status == IncomingStatus::PROCESSED);

    // Same event id under another source is a different event
    auto other = f.post(R"({"id":"g-1"})");
    REQUIRE(other.is_ok());
    CHECK(other.value() == ReceiveOutcome::ACCEPTED);
    f.gateway.stop();
}

TEST_CASE("IncomingWebhookGateway: processing failure and operator retry", "[incoming]") {
    GatewayFixture f;
    {
        std::lock_guard lock(f.processor->mutex);
        f.processor->fail_ids.insert("evt_fail");
        f.processor->throw_ids.insert("evt_throw");
    }
    f.gateway.start();

    REQUIRE(f.post(R"({"id":"evt_fail"})").is_ok());
    REQUIRE(f.post(R"({"id":"evt_throw"})").is_ok());
    REQUIRE(f.gateway.wait_idle(5000ms));

    auto failed = *f.store->get("billing", "evt_fail");
    CHECK(failed.status == IncomingStatus::ERROR);
    CHECK(failed.error_message == "downstream rejected");
    auto thrown = *f.store->get("billing", "evt_throw");
    CHECK(thrown.status == IncomingStatus::ERROR);
    CHECK(thrown.error_message == "processor exploded");
    CHECK(f.gateway.get_stats().processing_errors == 2);

    // A redelivery of a failed event is still a duplicate
    auto dup = f.post(R"({"id":"evt_fail"})");
    REQUIRE(dup.is_ok());
    CHECK(dup.value() == ReceiveOutcome::DUPLICATE);

    {
        std::lock_guard lock(f.processor->mutex);
        f.processor->fail_ids.clear();
    }
    auto retried = f.gateway.retry("billing", "evt_fail");
    REQUIRE(retried.is_ok());
    CHECK(retried.value());
    REQUIRE(f.gateway.wait_idle(5000ms));

    failed = *f.store->get("billing", "evt_fail");
    CHECK(failed.status == IncomingStatus::PROCESSED);
    CHECK(failed.processing_attempts == 2);
    CHECK(failed.error_message.empty());

    SECTION("retrying a processed event is a conflict") {
        CHECK(f.gateway.retry("billing", "evt_fail").error_category() == ErrorCategory::CONFLICT);
    }

    SECTION("retrying an unknown event is not found") {
        CHECK(f.gateway.retry("billing", "evt_missing").error_category() == ErrorCategory::NOT_FOUND);
    }

    f.gateway.stop();
}

TEST_CASE("IncomingWebhookGateway: event accepted on a full queue is processed after start", "[incoming][recovery]") {
    IncomingWebhookGateway::Config cfg;
    cfg.queue_capacity = 1;
    GatewayFixture f(cfg);   // Not started yet: nothing drains the queue

    REQUIRE(f.post(R"({"id":"a"})").is_ok());
    auto second = f.post(R"({"id":"b"})");
    REQUIRE(second.is_ok());
    CHECK(second.value() == ReceiveOutcome::ACCEPTED);
    CHECK(f.store->get("billing", "b")->status == IncomingStatus::RECEIVED);
    CHECK(f.gateway.get_stats().queue_full == 1);

    f.gateway.start();
    REQUIRE(eventually([&] { return status_of(*f.store, "b") == IncomingStatus::PROCESSED; }));
    REQUIRE(eventually([&] { return status_of(*f.store, "a") == IncomingStatus::PROCESSED; }));
    CHECK(f.store->get("billing", "b")->processing_attempts == 1);
    CHECK(f.gateway.get_stats().recovered >= 1);
    f.gateway.stop();
}

TEST_CASE("IncomingWebhookGateway: received rows survive a restart", "[incoming][recovery]") {
    auto store = std::make_shared<InMemoryIncomingEventStore>();
    auto clock = std::make_shared<ManualClock>();
    auto processor = std::make_shared<ScriptedProcessor>();

    {
        // First instance acknowledges and goes away before processing anything
        IncomingWebhookGateway first(GatewayFixture::sources(), store, processor, clock, {});
        for (const auto* id : {"r1", "r2", "r3"}) {
            const std::string body = std::format(R"({{"id":"{}"}})", id);
            const auto header = SignatureEngine::sign(body, kSecret, utils::to_unix_seconds(clock->now()));
            REQUIRE(first.receive("billing", body, header).is_ok());
        }
    }
    CHECK(processor->calls.load() == 0);

    IncomingWebhookGateway second(GatewayFixture::sources(), store, processor, clock, {});
    second.start();
    for (const auto* id : {"r1", "r2", "r3"}) {
        REQUIRE(eventually([&] { return status_of(*store, id) == IncomingStatus::PROCESSED; }));
    }
    CHECK(processor->calls.load() == 3);
    second.stop();
}

TEST_CASE("IncomingWebhookGateway: abandoned processing rows are recovered", "[incoming][recovery]") {
    GatewayFixture f;

    IncomingWebhookEvent stuck;
    stuck.source = "billing";
    stuck.event_id = "stuck";
    stuck.payload = R"({"id":"stuck"})";
    stuck.received_at = f.clock->now();
    stuck.updated_at = f.clock->now();
    REQUIRE(f.store->insert_if_absent(stuck));
    REQUIRE(f.store->mark_processing("billing", "stuck", f.clock->now()));

    IncomingWebhookEvent busy = stuck;
    busy.event_id = "busy";
    busy.payload = R"({"id":"busy"})";
    f.clock->advance(301s);
    busy.received_at = f.clock->now();
    busy.updated_at = f.clock->now();
    REQUIRE(f.store->insert_if_absent(busy));
    REQUIRE(f.store->mark_processing("billing", "busy", f.clock->now()));

    f.gateway.start();
    REQUIRE(eventually([&] { return status_of(*f.store, "stuck") == IncomingStatus::PROCESSED; }));
    CHECK(f.store->get("billing", "stuck")->processing_attempts == 2);

    // Still inside the staleness window: left to its current owner
    CHECK(status_of(*f.store, "busy") == IncomingStatus::PROCESSING);
    f.gateway.stop();
}

TEST_CASE("IncomingWebhookGateway: operator retry re-enqueues a received event", "[incoming][recovery]") {
    GatewayFixture f;

    IncomingWebhookEvent ev;
    ev.source = "billing";
    ev.event_id = "parked";
    ev.payload = R"({"id":"parked"})";
    ev.received_at = f.clock->now();
    ev.updated_at = f.clock->now();
    REQUIRE(f.store->insert_if_absent(ev));

    auto retried = f.gateway.retry("billing", "parked");
    REQUIRE(retried.is_ok());
    CHECK(retried.value());

    f.gateway.start();
    REQUIRE(eventually([&] { return status_of(*f.store, "parked") == IncomingStatus::PROCESSED; }));
    CHECK(f.processor->calls.load() == 1);
    f.gateway.stop();
}

TEST_CASE("IncomingStatus: names", "[incoming]") {
    for (const auto s : {IncomingStatus::RECEIVED, IncomingStatus::PROCESSING,
                         IncomingStatus::PROCESSED, IncomingStatus::ERROR}) {
        CHECK(parse_incoming_status(incoming_status_to_string(s)) == s);
    }
    CHECK_FALSE(parse_incoming_status("done").has_value());
}
