#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hookrelay {

/**
 * @brief Business events an endpoint can subscribe to
 *
 * Wire names are dotted lower-case ("invoice.payment_failed").
 */
enum class EventType : uint8_t {
    ACCOUNT_CREATED,
    ACCOUNT_UPDATED,
    ACCOUNT_DELETED,
    SUBSCRIPTION_CREATED,
    SUBSCRIPTION_UPDATED,
    SUBSCRIPTION_CANCELED,
    INVOICE_CREATED,
    INVOICE_PAID,
    INVOICE_PAYMENT_FAILED,
    ORDER_CREATED,
    ORDER_UPDATED,
    ORDER_CANCELED,
    WEBHOOK_TEST
};

inline constexpr std::string_view kWildcardEvent = "*";

[[nodiscard]] std::string_view event_type_to_string(EventType type);
[[nodiscard]] std::optional<EventType> parse_event_type(std::string_view name);
[[nodiscard]] const std::vector<EventType>& all_event_types();

/**
 * @brief What an endpoint listens to: everything, or an explicit set
 */
struct EventSubscription {
    bool wildcard = false;
    std::set<EventType> events;

    [[nodiscard]] bool empty() const { return !wildcard && events.empty(); }

    [[nodiscard]] static EventSubscription all() { return {true, {}}; }
};

[[nodiscard]] bool subscription_matches(const EventSubscription& sub, EventType type);

/**
 * @brief Parse wire names; "*" sets the wildcard flag
 * @param unknown receives the first unrecognised name, if any
 * @return false if any name was not recognised
 */
[[nodiscard]] bool parse_subscription(const std::vector<std::string>& names,
                                      EventSubscription& out,
                                      std::string* unknown = nullptr);

/**
 * @brief Wire form: ["*"] or the sorted list of event names
 */
[[nodiscard]] std::vector<std::string> subscription_to_strings(const EventSubscription& sub);

} // namespace hookrelay
