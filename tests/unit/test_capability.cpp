// Tether Capability URL Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/capability.hpp"
#include "../../src/core/encoding.hpp"

using namespace tether::core;

namespace {

constexpr int64_t kNow = 1700000000;

}  // namespace

TEST_CASE("Base64 codecs", "[capability][encoding]") {
    SECTION("standard alphabet with padding") {
        REQUIRE(base64_encode("") == "");
        REQUIRE(base64_encode("f") == "Zg==");
        REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
        REQUIRE(base64_decode("Zm9vYg==") == "foob");
        REQUIRE(base64_decode("") == "");
    }

    SECTION("binary payloads survive") {
        std::string binary("\x00\xff\x10\n\r", 5);
        REQUIRE(base64_decode(base64_encode(binary)) == binary);
    }

    SECTION("garbage is rejected") {
        REQUIRE_FALSE(base64_decode("Zm9").has_value());
        REQUIRE_FALSE(base64_decode("Zm9v!mFy").has_value());
        REQUIRE_FALSE(base64_decode("Z=9v").has_value());
    }

    SECTION("url-safe alphabet without padding") {
        std::string raw("\xfb\xff", 2);
        REQUIRE(base64_encode(raw) == "+/8=");
        REQUIRE(base64url_encode(raw) == "-_8");
        REQUIRE(base64url_decode("-_8") == raw);
        REQUIRE_FALSE(base64url_decode("+/8=").has_value());
        REQUIRE_FALSE(base64url_decode("A").has_value());
    }
}

TEST_CASE("Stream ID generation", "[capability][encoding]") {
    auto a = generate_stream_id();
    auto b = generate_stream_id();
    REQUIRE(a.size() == 36);
    REQUIRE(a[14] == '4');
    REQUIRE(a != b);
}

TEST_CASE("Capability signing", "[capability][sign]") {
    CapabilitySigner signer("test-secret");

    SECTION("signatures are deterministic base64url HMAC-SHA256") {
        auto sig = signer.sign("stream-1", kNow);
        REQUIRE(sig == signer.sign("stream-1", kNow));
        REQUIRE(sig.size() == 43);
        REQUIRE(sig.find_first_of("+/=") == std::string::npos);
    }

    SECTION("every input changes the signature") {
        auto sig = signer.sign("stream-1", kNow);
        REQUIRE(sig != signer.sign("stream-2", kNow));
        REQUIRE(sig != signer.sign("stream-1", kNow + 1));
        REQUIRE(sig != CapabilitySigner("other-secret").sign("stream-1", kNow));
    }

    SECTION("mint sets the expiry from the TTL") {
        auto token = signer.mint("abc", 3600, kNow);
        REQUIRE(token.stream_id == "abc");
        REQUIRE(token.expires_at == kNow + 3600);
        REQUIRE(token.signature == signer.sign("abc", kNow + 3600));
    }
}

TEST_CASE("Capability verification", "[capability][verify]") {
    CapabilitySigner signer("test-secret");
    auto token = signer.mint("stream-1", 60, kNow);
    std::string expires = std::to_string(token.expires_at);

    SECTION("valid before expiry") {
        auto result = signer.verify("stream-1", expires, token.signature, kNow);
        REQUIRE(result);
        REQUIRE(result.stream_id == "stream-1");
    }

    SECTION("expired at the expiry instant") {
        auto result = signer.verify("stream-1", expires, token.signature, kNow + 60);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == CapabilityError::SignatureExpired);
        REQUIRE(to_code(result.error) == "SIGNATURE_EXPIRED");
        REQUIRE(result.stream_id == "stream-1");
    }

    SECTION("signature checked before expiry") {
        auto result = signer.verify("stream-1", expires, "forged", kNow + 3600);
        REQUIRE(result.error == CapabilityError::SignatureInvalid);
    }

    SECTION("signature only check ignores expiry") {
        REQUIRE(signer.verify_signature("stream-1", expires, token.signature));
        REQUIRE_FALSE(signer.verify_signature("stream-2", expires, token.signature));
    }

    SECTION("missing and malformed parameters") {
        REQUIRE(signer.verify("stream-1", std::nullopt, token.signature, kNow).error ==
                CapabilityError::MissingExpires);
        REQUIRE(signer.verify("stream-1", expires, std::nullopt, kNow).error ==
                CapabilityError::MissingSignature);
        REQUIRE(signer.verify("stream-1", "", token.signature, kNow).error ==
                CapabilityError::MissingExpires);
        REQUIRE(signer.verify("stream-1", "12abc", token.signature, kNow).error ==
                CapabilityError::InvalidExpires);
        REQUIRE(signer.verify("stream-1", "-5", token.signature, kNow).error ==
                CapabilityError::InvalidExpires);
    }

    SECTION("tampered expiry fails") {
        auto later = std::to_string(token.expires_at + 1000);
        REQUIRE(signer.verify("stream-1", later, token.signature, kNow).error ==
                CapabilityError::SignatureInvalid);
    }
}

TEST_CASE("Capability URLs", "[capability][url]") {
    CapabilitySigner signer("test-secret");

    SECTION("mint and parse agree") {
        auto url = signer.mint_url("http://127.0.0.1:4440", "chat/1", 300, {{"live", "sse"}}, kNow);
        REQUIRE(url.starts_with("http://127.0.0.1:4440/v1/proxy/chat%2F1?expires="));

        auto parsed = parse_stream_url(url);
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->origin == "http://127.0.0.1:4440");
        REQUIRE(parsed->stream_id == "chat/1");
        REQUIRE(parsed->expires == std::to_string(kNow + 300));
        REQUIRE(parsed->extra_params.size() == 1);
        REQUIRE(parsed->extra_params[0].first == "live");

        REQUIRE(signer.verify(parsed->stream_id, parsed->expires, parsed->signature, kNow));
    }

    SECTION("non-stream URLs are rejected") {
        REQUIRE_FALSE(parse_stream_url("http://host/v1/other/abc").has_value());
        REQUIRE_FALSE(parse_stream_url("http://host/v1/proxy/").has_value());
        REQUIRE_FALSE(parse_stream_url("http://host/v1/proxy/a/b").has_value());
        REQUIRE_FALSE(parse_stream_url("ftp://host/v1/proxy/abc").has_value());
        REQUIRE_FALSE(parse_stream_url("garbage").has_value());
    }
}

TEST_CASE("Service secret comparison", "[capability][secret]") {
    CapabilitySigner signer("s3cret");
    REQUIRE(signer.check_service_secret("s3cret"));
    REQUIRE_FALSE(signer.check_service_secret("s3cre"));
    REQUIRE_FALSE(signer.check_service_secret(""));
    REQUIRE_FALSE(CapabilitySigner("").check_service_secret(""));

    REQUIRE(constant_time_equals("abc", "abc"));
    REQUIRE_FALSE(constant_time_equals("abc", "abd"));
}
