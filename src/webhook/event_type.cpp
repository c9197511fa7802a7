#include "webhook/event_type.hpp"

#include <array>
#include <utility>

namespace hookrelay {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 13> kEventNames = {{
    {EventType::ACCOUNT_CREATED,        "account.created"},
    {EventType::ACCOUNT_UPDATED,        "account.updated"},
    {EventType::ACCOUNT_DELETED,        "account.deleted"},
    {EventType::SUBSCRIPTION_CREATED,   "subscription.created"},
    {EventType::SUBSCRIPTION_UPDATED,   "subscription.updated"},
    {EventType::SUBSCRIPTION_CANCELED,  "subscription.canceled"},
    {EventType::INVOICE_CREATED,        "invoice.created"},
    {EventType::INVOICE_PAID,           "invoice.paid"},
    {EventType::INVOICE_PAYMENT_FAILED, "invoice.payment_failed"},
    {EventType::ORDER_CREATED,          "order.created"},
    {EventType::ORDER_UPDATED,          "order.updated"},
    {EventType::ORDER_CANCELED,         "order.canceled"},
    {EventType::WEBHOOK_TEST,           "webhook.test"},
}};

} // namespace

std::string_view event_type_to_string(EventType type) {
    for (const auto& [t, name] : kEventNames) {
        if (t == type) return name;
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(std::string_view name) {
    for (const auto& [t, n] : kEventNames) {
        if (n == name) return t;
    }
    return std::nullopt;
}

const std::vector<EventType>& all_event_types() {
    static const std::vector<EventType> types = [] {
        std::vector<EventType> v;
        v.reserve(kEventNames.size());
        for (const auto& [t, _] : kEventNames) v.push_back(t);
        return v;
    }();
    return types;
}

bool subscription_matches(const EventSubscription& sub, EventType type) {
    return sub.wildcard || sub.events.contains(type);
}

bool parse_subscription(const std::vector<std::string>& names,
                        EventSubscription& out,
                        std::string* unknown) {
    EventSubscription parsed;
    for (const auto& name : names) {
        if (name == kWildcardEvent) {
            parsed.wildcard = true;
            continue;
        }
        const auto type = parse_event_type(name);
        if (!type) {
            if (unknown) *unknown = name;
            return false;
        }
        parsed.events.insert(*type);
    }
    // Wildcard subsumes any explicit names
    if (parsed.wildcard) parsed.events.clear();
    out = std::move(parsed);
    return true;
}

std::vector<std::string> subscription_to_strings(const EventSubscription& sub) {
    if (sub.wildcard) return {std::string(kWildcardEvent)};
    std::vector<std::string> names;
    names.reserve(sub.events.size());
    for (const auto type : sub.events) {
        names.emplace_back(event_type_to_string(type));
    }
    return names;
}

} // namespace hookrelay
