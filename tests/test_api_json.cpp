#include <catch2/catch_test_macros.hpp>
#include "server/api_json.hpp"

#include <chrono>

using namespace hookrelay;

TEST_CASE("ApiJson: create endpoint body", "[server][json]") {
    SECTION("minimal body takes defaults") {
        const auto r = parse_create_endpoint(R"({"url":"https://example.com/hook","events":["invoice.paid"]})");
        REQUIRE(r.is_ok());
        CHECK(r.value().url == "https://example.com/hook");
        CHECK(subscription_matches(r.value().subscription, EventType::INVOICE_PAID));
        CHECK(r.value().description.empty());
        CHECK(r.value().enabled);
    }

    SECTION("optional fields are read") {
        const auto r = parse_create_endpoint(
            R"({"url":"https://example.com/hook","events":["*"],"description":"billing","enabled":false})");
        REQUIRE(r.is_ok());
        CHECK(r.value().subscription.wildcard);
        CHECK(r.value().description == "billing");
        CHECK_FALSE(r.value().enabled);
    }

    SECTION("null description reads as absent") {
        const auto r = parse_create_endpoint(
            R"({"url":"https://example.com/hook","events":["*"],"description":null})");
        REQUIRE(r.is_ok());
        CHECK(r.value().description.empty());
    }

    SECTION("missing url or events") {
        CHECK(parse_create_endpoint(R"({"events":["*"]})").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_create_endpoint(R"({"url":42,"events":["*"]})").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_create_endpoint(R"({"url":"https://example.com/hook"})").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_create_endpoint(R"([1,2])").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_create_endpoint("not json").error_category() == ErrorCategory::VALIDATION);
    }

    SECTION("unknown event type is named") {
        const auto r = parse_create_endpoint(R"({"url":"https://example.com/hook","events":["invoice.refunded"]})");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION);
        CHECK(r.error_message() == "unknown event type 'invoice.refunded'");
    }
}

TEST_CASE("ApiJson: wrong-typed create fields are validation errors", "[server][json]") {
    SECTION("enabled as a string") {
        const auto r = parse_create_endpoint(
            R"({"url":"https://example.com/hook","events":["*"],"enabled":"yes"})");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION);
        CHECK(r.error_message() == "enabled must be a boolean");
    }

    SECTION("enabled as a number") {
        const auto r = parse_create_endpoint(
            R"({"url":"https://example.com/hook","events":["*"],"enabled":1})");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION);
    }

    SECTION("description as an object") {
        const auto r = parse_create_endpoint(
            R"({"url":"https://example.com/hook","events":["*"],"description":{"a":1}})");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION);
        CHECK(r.error_message() == "description must be a string");
    }

    SECTION("description as a number") {
        const auto r = parse_create_endpoint(
            R"({"url":"https://example.com/hook","events":["*"],"description":7})");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION);
    }
}

TEST_CASE("ApiJson: update endpoint body", "[server][json]") {
    SECTION("empty object") {
        const auto r = parse_update_endpoint("{}");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION);
    }

    SECTION("enabled only") {
        const auto r = parse_update_endpoint(R"({"enabled":false})");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().enabled.has_value());
        CHECK_FALSE(*r.value().enabled);
        CHECK_FALSE(r.value().subscription.has_value());
    }

    SECTION("events only") {
        const auto r = parse_update_endpoint(R"({"events":["order.created"]})");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().subscription.has_value());
        CHECK(subscription_matches(*r.value().subscription, EventType::ORDER_CREATED));
        CHECK_FALSE(r.value().enabled.has_value());
    }

    SECTION("wrong-typed enabled") {
        CHECK(parse_update_endpoint(R"({"enabled":"false"})").error_category() == ErrorCategory::VALIDATION);
    }
}

TEST_CASE("ApiJson: publish event body", "[server][json]") {
    SECTION("type, id and data") {
        const auto r = parse_publish_event(R"({"type":"order.created","id":"evt_1","data":{"n":3}})");
        REQUIRE(r.is_ok());
        CHECK(r.value().type == EventType::ORDER_CREATED);
        CHECK(r.value().type_name == "order.created");
        REQUIRE(r.value().event_id.has_value());
        CHECK(*r.value().event_id == "evt_1");
        CHECK(r.value().data["n"] == 3);
    }

    SECTION("id and data are optional") {
        const auto r = parse_publish_event(R"({"type":"webhook.test"})");
        REQUIRE(r.is_ok());
        CHECK_FALSE(r.value().event_id.has_value());
        CHECK(r.value().data.is_object());
        CHECK(r.value().data.empty());
    }

    SECTION("invalid bodies") {
        CHECK(parse_publish_event(R"({"id":"evt_1"})").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_publish_event(R"({"type":"order.shipped"})").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_publish_event(R"({"type":"order.created","id":""})").error_category() == ErrorCategory::VALIDATION);
        CHECK(parse_publish_event(R"({"type":"order.created","id":5})").error_category() == ErrorCategory::VALIDATION);
    }
}

TEST_CASE("ApiJson: next_attempt_at is null for terminal deliveries", "[server][json]") {
    WebhookDelivery d;
    d.id = "dlv_1";
    d.endpoint_id = "ep_1";
    d.event_id = "evt_1";
    d.event_type = EventType::INVOICE_PAID;
    d.attempts = 2;
    d.next_attempt_at = std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}};

    SECTION("scheduled states carry the time") {
        for (const auto status : {DeliveryStatus::PENDING, DeliveryStatus::PENDING_RETRY}) {
            d.status = status;
            const auto j = delivery_to_json(d);
            CHECK(j["next_attempt_at"].is_string());
        }
    }

    SECTION("terminal states emit null") {
        for (const auto status : {DeliveryStatus::DELIVERED, DeliveryStatus::FAILED_EXHAUSTED,
                                  DeliveryStatus::CANCELLED}) {
            d.status = status;
            const auto j = delivery_to_json(d);
            CHECK(j["next_attempt_at"].is_null());
            CHECK(j["status"] == std::string(delivery_status_to_string(status)));
        }
    }

    SECTION("delivered_at follows the row") {
        d.status = DeliveryStatus::DELIVERED;
        CHECK(delivery_to_json(d)["delivered_at"].is_null());
        d.delivered_at = d.next_attempt_at;
        CHECK(delivery_to_json(d)["delivered_at"].is_string());
    }
}
