#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hookrelay {

/**
 * @brief How a webhook source authenticates its payloads
 *
 * TIMESTAMPED_V1: header "t=<unix_ts>,v1=<hex>" where the MAC covers
 *                 "<ts>.<payload>"; replay window enforced.
 * HEX_SHA256:     header "sha256=<hex>" where the MAC covers the raw body only.
 */
enum class SignatureScheme {
    TIMESTAMPED_V1,
    HEX_SHA256
};

[[nodiscard]] const char* signature_scheme_to_string(SignatureScheme scheme);
[[nodiscard]] bool parse_signature_scheme(std::string_view name, SignatureScheme& out);

enum class VerifyOutcome {
    VALID,
    MALFORMED,   // Header missing or not parseable
    MISMATCH,    // No MAC in the header matches
    EXPIRED      // MAC matches but |now - t| exceeds the tolerance
};

[[nodiscard]] const char* verify_outcome_to_string(VerifyOutcome outcome);

/**
 * @brief HMAC-SHA256 signing and verification for webhook payloads
 *
 * Stateless; every method is safe to call from any thread.
 */
class SignatureEngine {
public:
    static constexpr std::chrono::seconds kDefaultTolerance{300};

    /**
     * @brief Produce "t=<ts>,v1=<hex(HMAC-SHA256(secret, "<ts>.<payload>"))>"
     */
    [[nodiscard]] static std::string sign(
        std::string_view payload,
        std::string_view secret,
        int64_t unix_timestamp);

    /**
     * @brief Verify a "t=..,v1=.." header
     *
     * Several v1 entries may be present (secret rotation); any match suffices.
     * A valid MAC outside the tolerance window is still rejected as EXPIRED.
     */
    [[nodiscard]] static VerifyOutcome verify(
        std::string_view header,
        std::string_view payload,
        std::string_view secret,
        std::chrono::system_clock::time_point now,
        std::chrono::seconds tolerance = kDefaultTolerance);

    /**
     * @brief Verify a "sha256=<hex>" body signature (no timestamp)
     */
    [[nodiscard]] static VerifyOutcome verify_body_hex(
        std::string_view header,
        std::string_view payload,
        std::string_view secret);

    /**
     * @brief Scheme dispatch used by the inbound gateway
     */
    [[nodiscard]] static VerifyOutcome verify_with_scheme(
        SignatureScheme scheme,
        std::string_view header,
        std::string_view payload,
        std::string_view secret,
        std::chrono::system_clock::time_point now,
        std::chrono::seconds tolerance = kDefaultTolerance);

    /// Lowercase hex HMAC-SHA256
    [[nodiscard]] static std::string hmac_sha256_hex(
        std::string_view key,
        std::string_view message);

    /// Lowercase hex SHA-256
    [[nodiscard]] static std::string sha256_hex(std::string_view data);

    /// "whsec_" + 64 hex chars from a CSPRNG
    [[nodiscard]] static std::string generate_secret(size_t byte_count = 32);

    /// Length-checked constant-time comparison
    [[nodiscard]] static bool constant_time_equals(std::string_view a, std::string_view b);

    struct ParsedHeader {
        int64_t timestamp = 0;
        bool has_timestamp = false;
        std::vector<std::string> v1_signatures;
    };

    [[nodiscard]] static ParsedHeader parse_header(std::string_view header);
};

} // namespace hookrelay
