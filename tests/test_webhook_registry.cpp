#include <catch2/catch_test_macros.hpp>
#include "webhook/memory_endpoint_store.hpp"
#include "webhook/webhook_registry.hpp"

using namespace hookrelay;
using namespace std::chrono_literals;

namespace {

struct RegistryFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryEndpointStore> store = std::make_shared<InMemoryEndpointStore>();
    WebhookRegistry registry{store, clock, WebhookRegistry::Config{}};

    static WebhookRegistry::CreateRequest request(std::string url,
                                                  std::vector<std::string> events = {"invoice.paid"}) {
        WebhookRegistry::CreateRequest req;
        req.url = std::move(url);
        REQUIRE(parse_subscription(events, req.subscription));
        return req;
    }
};

} // namespace

TEST_CASE("WebhookRegistry: URL validation", "[webhook][registry]") {
    CHECK(WebhookRegistry::validate_url("https://example.com/hook", true).is_ok());
    CHECK(WebhookRegistry::validate_url("https://example.com:8443", true).is_ok());
    CHECK(WebhookRegistry::validate_url("http://localhost:9000/x", false).is_ok());

    CHECK(WebhookRegistry::validate_url("http://example.com", true).is_error());
    CHECK(WebhookRegistry::validate_url("ftp://example.com", false).is_error());
    CHECK(WebhookRegistry::validate_url("https://", true).is_error());
    CHECK(WebhookRegistry::validate_url("https:///path", true).is_error());
    CHECK(WebhookRegistry::validate_url("https://exa mple.com", true).is_error());
    CHECK(WebhookRegistry::validate_url("example.com", false).error_category()
          == ErrorCategory::VALIDATION);
}

TEST_CASE("WebhookRegistry: create returns the secret once", "[webhook][registry]") {
    RegistryFixture f;

    auto created = f.registry.create("alice", RegistryFixture::request("https://a.example/hook"));
    REQUIRE(created.is_ok());
    const auto& ep = created.value();
    CHECK(ep.id.starts_with("we_"));
    CHECK(ep.owner_id == "alice");
    CHECK(ep.secret.starts_with("whsec_"));
    CHECK(ep.enabled);

    auto fetched = f.registry.get("alice", ep.id);
    REQUIRE(fetched.is_ok());
    CHECK(fetched.value().secret.empty());

    const auto listed = f.registry.list("alice");
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].secret.empty());

    // Internal lookup keeps the secret for signing
    auto internal = f.registry.find_for_delivery(ep.id);
    REQUIRE(internal.has_value());
    CHECK(internal->secret == ep.secret);
}

TEST_CASE("WebhookRegistry: create rejects bad input", "[webhook][registry]") {
    RegistryFixture f;

    CHECK(f.registry.create("alice", RegistryFixture::request("http://a.example")).is_error());
    auto no_events = f.registry.create("alice", RegistryFixture::request("https://a.example", {}));
    REQUIRE(no_events.is_error());
    CHECK(no_events.error_category() == ErrorCategory::VALIDATION);
    CHECK(f.registry.list("alice").empty());
}

TEST_CASE("WebhookRegistry: owners cannot see each other's endpoints", "[webhook][registry]") {
    RegistryFixture f;
    auto created = f.registry.create("alice", RegistryFixture::request("https://a.example"));
    REQUIRE(created.is_ok());
    const auto id = created.value().id;

    CHECK(f.registry.get("bob", id).error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.registry.rotate_secret("bob", id).error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.registry.set_enabled("bob", id, false).error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.registry.remove("bob", id).error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.registry.list("bob").empty());

    CHECK(f.registry.get("alice", id).is_ok());
}

TEST_CASE("WebhookRegistry: rotate secret replaces it", "[webhook][registry]") {
    RegistryFixture f;
    auto created = f.registry.create("alice", RegistryFixture::request("https://a.example"));
    REQUIRE(created.is_ok());
    const auto old_secret = created.value().secret;

    f.clock->advance(5s);
    auto rotated = f.registry.rotate_secret("alice", created.value().id);
    REQUIRE(rotated.is_ok());
    CHECK(rotated.value() != old_secret);

    const auto stored = f.registry.find_for_delivery(created.value().id);
    REQUIRE(stored.has_value());
    CHECK(stored->secret == rotated.value());
    CHECK(stored->updated_at > stored->created_at);
}

TEST_CASE("WebhookRegistry: matching endpoints respect subscription and enabled flag", "[webhook][registry]") {
    RegistryFixture f;

    auto paid = f.registry.create("alice", RegistryFixture::request("https://paid.example", {"invoice.paid"}));
    auto all = f.registry.create("alice", RegistryFixture::request("https://all.example", {"*"}));
    auto orders = f.registry.create("alice", RegistryFixture::request("https://o.example", {"order.created"}));
    auto foreign = f.registry.create("bob", RegistryFixture::request("https://b.example", {"*"}));
    REQUIRE(paid.is_ok());
    REQUIRE(all.is_ok());
    REQUIRE(orders.is_ok());
    REQUIRE(foreign.is_ok());

    auto matches = f.registry.matching_endpoints("alice", EventType::INVOICE_PAID);
    CHECK(matches.size() == 2);

    REQUIRE(f.registry.set_enabled("alice", all.value().id, false).is_ok());
    matches = f.registry.matching_endpoints("alice", EventType::INVOICE_PAID);
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].id == paid.value().id);
    CHECK_FALSE(matches[0].secret.empty());

    EventSubscription both;
    REQUIRE(parse_subscription({"order.created", "invoice.paid"}, both));
    REQUIRE(f.registry.update_subscriptions("alice", orders.value().id, both).is_ok());
    CHECK(f.registry.matching_endpoints("alice", EventType::INVOICE_PAID).size() == 2);

    CHECK(f.registry.update_subscriptions("alice", orders.value().id, EventSubscription{})
              .error_category() == ErrorCategory::VALIDATION);
}

TEST_CASE("WebhookRegistry: remove", "[webhook][registry]") {
    RegistryFixture f;
    auto created = f.registry.create("alice", RegistryFixture::request("https://a.example"));
    REQUIRE(created.is_ok());

    REQUIRE(f.registry.remove("alice", created.value().id).is_ok());
    CHECK(f.registry.get("alice", created.value().id).is_error());
    CHECK_FALSE(f.registry.find_for_delivery(created.value().id).has_value());
    CHECK(f.registry.remove("alice", created.value().id).is_error());
}
