#include "security/signature_engine.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <format>
#include <stdexcept>

namespace hookrelay {

// ============================================================================
// Enum helpers
// ============================================================================

const char* signature_scheme_to_string(SignatureScheme scheme) {
    switch (scheme) {
        case SignatureScheme::TIMESTAMPED_V1: return "timestamped_v1";
        case SignatureScheme::HEX_SHA256:     return "hex_sha256";
    }
    return "timestamped_v1";
}

bool parse_signature_scheme(std::string_view name, SignatureScheme& out) {
    const std::string lower = utils::to_lower(name);
    if (lower == "timestamped_v1" || lower == "v1") {
        out = SignatureScheme::TIMESTAMPED_V1;
        return true;
    }
    if (lower == "hex_sha256" || lower == "sha256") {
        out = SignatureScheme::HEX_SHA256;
        return true;
    }
    return false;
}

const char* verify_outcome_to_string(VerifyOutcome outcome) {
    switch (outcome) {
        case VerifyOutcome::VALID:     return "valid";
        case VerifyOutcome::MALFORMED: return "malformed";
        case VerifyOutcome::MISMATCH:  return "mismatch";
        case VerifyOutcome::EXPIRED:   return "expired";
    }
    return "malformed";
}

// ============================================================================
// Primitives
// ============================================================================

std::string SignatureEngine::hmac_sha256_hex(std::string_view key, std::string_view message) {
    uint8_t result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const uint8_t*>(message.data()),
              message.size(),
              result, &len)) {
        throw std::runtime_error("HMAC failed");
    }
    return utils::bytes_to_hex(result, len);
}

std::string SignatureEngine::sha256_hex(std::string_view data) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const uint8_t*>(data.data()), data.size(), digest);
    return utils::bytes_to_hex(digest, SHA256_DIGEST_LENGTH);
}

std::string SignatureEngine::generate_secret(size_t byte_count) {
    std::vector<uint8_t> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return "whsec_" + utils::bytes_to_hex(bytes);
}

bool SignatureEngine::constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Timestamped v1 scheme
// ============================================================================

std::string SignatureEngine::sign(std::string_view payload, std::string_view secret,
                                  int64_t unix_timestamp) {
    std::string signed_content = std::to_string(unix_timestamp);
    signed_content.push_back('.');
    signed_content.append(payload);
    return std::format("t={},v1={}", unix_timestamp, hmac_sha256_hex(secret, signed_content));
}

SignatureEngine::ParsedHeader SignatureEngine::parse_header(std::string_view header) {
    ParsedHeader parsed;
    size_t pos = 0;
    while (pos <= header.size()) {
        size_t comma = header.find(',', pos);
        if (comma == std::string_view::npos) comma = header.size();
        const std::string_view item = utils::trim(header.substr(pos, comma - pos));
        pos = comma + 1;

        const size_t eq = item.find('=');
        if (eq == std::string_view::npos) continue;
        const std::string_view key = item.substr(0, eq);
        const std::string_view value = item.substr(eq + 1);

        if (key == "t") {
            if (const auto ts = utils::try_parse_int<int64_t>(value)) {
                parsed.timestamp = *ts;
                parsed.has_timestamp = true;
            }
        } else if (key == "v1" && !value.empty()) {
            parsed.v1_signatures.emplace_back(utils::to_lower(value));
        }
        // Unknown schemes (v0, future versions) are ignored
    }
    return parsed;
}

VerifyOutcome SignatureEngine::verify(std::string_view header, std::string_view payload,
                                      std::string_view secret,
                                      std::chrono::system_clock::time_point now,
                                      std::chrono::seconds tolerance) {
    if (header.empty() || secret.empty()) {
        return VerifyOutcome::MALFORMED;
    }

    const auto parsed = parse_header(header);
    if (!parsed.has_timestamp || parsed.v1_signatures.empty()) {
        return VerifyOutcome::MALFORMED;
    }

    std::string signed_content = std::to_string(parsed.timestamp);
    signed_content.push_back('.');
    signed_content.append(payload);
    const std::string expected = hmac_sha256_hex(secret, signed_content);

    bool matched = false;
    for (const auto& candidate : parsed.v1_signatures) {
        // Evaluate every candidate so timing does not reveal which one matched
        matched = constant_time_equals(candidate, expected) || matched;
    }
    if (!matched) {
        return VerifyOutcome::MISMATCH;
    }

    // Window bounds come from the local clock; t itself never enters arithmetic
    const int64_t now_s = utils::to_unix_seconds(now);
    if (parsed.timestamp < now_s - tolerance.count() || parsed.timestamp > now_s + tolerance.count()) {
        return VerifyOutcome::EXPIRED;
    }
    return VerifyOutcome::VALID;
}

// ============================================================================
// Raw body scheme
// ============================================================================

VerifyOutcome SignatureEngine::verify_body_hex(std::string_view header, std::string_view payload,
                                               std::string_view secret) {
    static constexpr std::string_view kPrefix = "sha256=";
    const std::string_view value = utils::trim(header);
    if (secret.empty() || !value.starts_with(kPrefix) || value.size() == kPrefix.size()) {
        return VerifyOutcome::MALFORMED;
    }
    const std::string provided = utils::to_lower(value.substr(kPrefix.size()));
    const std::string expected = hmac_sha256_hex(secret, payload);
    return constant_time_equals(provided, expected) ? VerifyOutcome::VALID : VerifyOutcome::MISMATCH;
}

VerifyOutcome SignatureEngine::verify_with_scheme(SignatureScheme scheme, std::string_view header,
                                                  std::string_view payload, std::string_view secret,
                                                  std::chrono::system_clock::time_point now,
                                                  std::chrono::seconds tolerance) {
    switch (scheme) {
        case SignatureScheme::TIMESTAMPED_V1:
            return verify(header, payload, secret, now, tolerance);
        case SignatureScheme::HEX_SHA256:
            return verify_body_hex(header, payload, secret);
    }
    return VerifyOutcome::MALFORMED;
}

} // namespace hookrelay
