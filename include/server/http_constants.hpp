#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace hookrelay::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kContentTypeHeader = "Content-Type";
inline const std::string kUserAgentHeader = "User-Agent";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kTextContentType = "text/plain";
inline constexpr const char* kMetricsContentType = "text/plain; version=0.0.4; charset=utf-8";

// Idempotency
inline const std::string kIdempotencyKeyHeader = "Idempotency-Key";
inline const std::string kIdempotentReplayedHeader = "Idempotent-Replayed";
inline constexpr size_t kMaxIdempotencyKeyLength = 255;

// Outbound webhook headers
inline const std::string kWebhookSignatureHeader = "X-Webhook-Signature";
inline const std::string kWebhookEventTypeHeader = "X-Webhook-Event-Type";
inline const std::string kWebhookEventIdHeader = "X-Webhook-Event-Id";
inline const std::string kWebhookDeliveryIdHeader = "X-Webhook-Delivery-Id";
inline const std::string kWebhookAttemptHeader = "X-Webhook-Attempt";

} // namespace hookrelay::http
