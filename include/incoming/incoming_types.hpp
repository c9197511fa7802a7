#pragma once

#include "security/signature_engine.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hookrelay {

enum class IncomingStatus : uint8_t {
    RECEIVED,
    PROCESSING,
    PROCESSED,
    ERROR
};

[[nodiscard]] inline constexpr std::string_view incoming_status_to_string(IncomingStatus s) {
    switch (s) {
        case IncomingStatus::RECEIVED:   return "received";
        case IncomingStatus::PROCESSING: return "processing";
        case IncomingStatus::PROCESSED:  return "processed";
        case IncomingStatus::ERROR:      return "error";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<IncomingStatus> parse_incoming_status(std::string_view s) {
    if (s == "received")   return IncomingStatus::RECEIVED;
    if (s == "processing") return IncomingStatus::PROCESSING;
    if (s == "processed")  return IncomingStatus::PROCESSED;
    if (s == "error")      return IncomingStatus::ERROR;
    return std::nullopt;
}

/**
 * @brief One row per (source, event_id); the pair is the dedup key
 */
struct IncomingWebhookEvent {
    std::string source;
    std::string event_id;
    std::string payload;
    IncomingStatus status = IncomingStatus::RECEIVED;
    std::string error_message;
    uint32_t processing_attempts = 0;
    std::chrono::system_clock::time_point received_at{};
    std::chrono::system_clock::time_point updated_at{};
    std::optional<std::chrono::system_clock::time_point> processed_at;
};

/**
 * @brief A third party allowed to call POST /webhooks/incoming/<name>
 */
struct IncomingSource {
    std::string name;
    std::string secret;
    SignatureScheme scheme = SignatureScheme::TIMESTAMPED_V1;
    std::string signature_header = "X-Webhook-Signature";
    std::string event_id_field = "id";     // Dotted path into the JSON body
};

} // namespace hookrelay
