#include <catch2/catch_test_macros.hpp>
#include "security/signature_engine.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using namespace hookrelay;

namespace {

const auto kNow = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

} // namespace

TEST_CASE("SignatureEngine: HMAC and SHA-256 known vectors", "[signature]") {
    CHECK(SignatureEngine::hmac_sha256_hex("key", "The quick brown fox jumps over the lazy dog")
          == "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
    CHECK(SignatureEngine::sha256_hex("abc")
          == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SignatureEngine: sign produces t= and v1= over timestamp.payload", "[signature]") {
    const auto header = SignatureEngine::sign(R"({"a":1})", "whsec_test", 1700000000);
    const auto expected_mac = SignatureEngine::hmac_sha256_hex("whsec_test", R"(1700000000.{"a":1})");
    CHECK(header == "t=1700000000,v1=" + expected_mac);
}

TEST_CASE("SignatureEngine: verify accepts its own signature", "[signature]") {
    const std::string payload = R"({"id":"evt_1"})";
    const auto header = SignatureEngine::sign(payload, "s3cret", 1700000000);
    CHECK(SignatureEngine::verify(header, payload, "s3cret", kNow) == VerifyOutcome::VALID);
}

TEST_CASE("SignatureEngine: verify outcomes", "[signature]") {
    const std::string payload = R"({"id":"evt_1"})";

    SECTION("tampered payload is a mismatch") {
        const auto header = SignatureEngine::sign(payload, "s3cret", 1700000000);
        CHECK(SignatureEngine::verify(header, payload + " ", "s3cret", kNow) == VerifyOutcome::MISMATCH);
    }

    SECTION("wrong secret is a mismatch") {
        const auto header = SignatureEngine::sign(payload, "s3cret", 1700000000);
        CHECK(SignatureEngine::verify(header, payload, "other", kNow) == VerifyOutcome::MISMATCH);
    }

    SECTION("timestamp outside tolerance is expired") {
        const auto header = SignatureEngine::sign(payload, "s3cret", 1700000000 - 301);
        CHECK(SignatureEngine::verify(header, payload, "s3cret", kNow) == VerifyOutcome::EXPIRED);
    }

    SECTION("timestamp at tolerance edge is valid, both directions") {
        const auto past = SignatureEngine::sign(payload, "s3cret", 1700000000 - 300);
        const auto future = SignatureEngine::sign(payload, "s3cret", 1700000000 + 300);
        CHECK(SignatureEngine::verify(past, payload, "s3cret", kNow) == VerifyOutcome::VALID);
        CHECK(SignatureEngine::verify(future, payload, "s3cret", kNow) == VerifyOutcome::VALID);
    }

    SECTION("custom tolerance") {
        const auto header = SignatureEngine::sign(payload, "s3cret", 1700000000 - 10);
        CHECK(SignatureEngine::verify(header, payload, "s3cret", kNow, std::chrono::seconds(5))
              == VerifyOutcome::EXPIRED);
    }

    SECTION("missing pieces are malformed") {
        CHECK(SignatureEngine::verify("", payload, "s3cret", kNow) == VerifyOutcome::MALFORMED);
        CHECK(SignatureEngine::verify("v1=abcd", payload, "s3cret", kNow) == VerifyOutcome::MALFORMED);
        CHECK(SignatureEngine::verify("t=1700000000", payload, "s3cret", kNow) == VerifyOutcome::MALFORMED);
        CHECK(SignatureEngine::verify("t=abc,v1=abcd", payload, "s3cret", kNow) == VerifyOutcome::MALFORMED);
        CHECK(SignatureEngine::verify("garbage", payload, "s3cret", kNow) == VerifyOutcome::MALFORMED);
    }
}

TEST_CASE("SignatureEngine: extreme timestamps are expired, not wrapped", "[signature]") {
    const std::string payload = R"({"id":"evt_edge"})";
    for (const int64_t ts : {std::numeric_limits<int64_t>::min(),
                             std::numeric_limits<int64_t>::min() + 1,
                             std::numeric_limits<int64_t>::max()}) {
        const auto header = SignatureEngine::sign(payload, "s3cret", ts);
        CHECK(SignatureEngine::verify(header, payload, "s3cret", kNow) == VerifyOutcome::EXPIRED);
    }

    const std::string literal = "t=-9223372036854775808,v1="
        + SignatureEngine::hmac_sha256_hex("s3cret", "-9223372036854775808." + payload);
    CHECK(SignatureEngine::verify(literal, payload, "s3cret", kNow) == VerifyOutcome::EXPIRED);
}

TEST_CASE("SignatureEngine: any of several v1 entries may match", "[signature]") {
    const std::string payload = "body";
    const auto mac = SignatureEngine::hmac_sha256_hex("new_secret", "1700000000.body");
    const std::string header = "t=1700000000, v1=deadbeef, v0=ignored, v1=" + mac;
    CHECK(SignatureEngine::verify(header, payload, "new_secret", kNow) == VerifyOutcome::VALID);
}

TEST_CASE("SignatureEngine: uppercase hex is accepted", "[signature]") {
    const auto mac = SignatureEngine::hmac_sha256_hex("k", "1700000000.p");
    const std::string header = "t=1700000000,v1=" + utils::to_upper(mac);
    CHECK(SignatureEngine::verify(header, "p", "k", kNow) == VerifyOutcome::VALID);
}

TEST_CASE("SignatureEngine: sha256= body scheme", "[signature]") {
    const std::string payload = R"({"x":true})";
    const auto header = "sha256=" + SignatureEngine::hmac_sha256_hex("k", payload);

    CHECK(SignatureEngine::verify_body_hex(header, payload, "k") == VerifyOutcome::VALID);
    CHECK(SignatureEngine::verify_body_hex(header, payload, "wrong") == VerifyOutcome::MISMATCH);
    CHECK(SignatureEngine::verify_body_hex("sha256=", payload, "k") == VerifyOutcome::MALFORMED);
    CHECK(SignatureEngine::verify_body_hex("md5=abc", payload, "k") == VerifyOutcome::MALFORMED);

    // No replay window for this scheme
    CHECK(SignatureEngine::verify_with_scheme(SignatureScheme::HEX_SHA256, header, payload, "k",
                                              kNow + std::chrono::hours(48)) == VerifyOutcome::VALID);
}

TEST_CASE("SignatureEngine: generate_secret", "[signature]") {
    const auto a = SignatureEngine::generate_secret();
    const auto b = SignatureEngine::generate_secret();
    CHECK(a.starts_with("whsec_"));
    CHECK(a.size() == 6 + 64);
    CHECK(a != b);
}

TEST_CASE("SignatureEngine: constant_time_equals", "[signature]") {
    CHECK(SignatureEngine::constant_time_equals("abc", "abc"));
    CHECK_FALSE(SignatureEngine::constant_time_equals("abc", "abd"));
    CHECK_FALSE(SignatureEngine::constant_time_equals("abc", "abcd"));
    CHECK(SignatureEngine::constant_time_equals("", ""));
}

TEST_CASE("SignatureEngine: scheme names", "[signature]") {
    SignatureScheme s{};
    REQUIRE(parse_signature_scheme("hex_sha256", s));
    CHECK(s == SignatureScheme::HEX_SHA256);
    REQUIRE(parse_signature_scheme("TIMESTAMPED_V1", s));
    CHECK(s == SignatureScheme::TIMESTAMPED_V1);
    CHECK_FALSE(parse_signature_scheme("md5", s));
}
