/*
 * Copyright 2025 Tether Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tether Capability URLs - Header
// HMAC-SHA256 signed, time-limited stream URLs
//
// Token:    (stream_id, expires_at) signed as HMAC-SHA256(secret, "{stream_id}:{expires_at}")
// URL form: {origin}/v1/proxy/{stream_id}?expires={expires_at}&signature={base64url(mac)}

#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include "../http/url.hpp"

namespace tether::core {

/// Path prefix under which every stream lives
inline constexpr std::string_view kProxyPathPrefix = "/v1/proxy/";

/// Capability verification failures
enum class CapabilityError : uint8_t {
    None,
    MissingExpires,
    MissingSignature,
    InvalidExpires,
    SignatureInvalid,
    SignatureExpired,
    MalformedStreamUrl,
};

/// Wire error code ("SIGNATURE_EXPIRED", ...)
[[nodiscard]] std::string_view to_code(CapabilityError error) noexcept;

/// Human readable message for an error
[[nodiscard]] std::string_view to_message(CapabilityError error) noexcept;

/// Signed token
struct CapabilityToken {
    std::string stream_id;
    int64_t expires_at = 0;
    std::string signature;
};

/// Verification result
struct VerifyResult {
    bool valid = false;
    CapabilityError error = CapabilityError::None;
    std::string stream_id;

    [[nodiscard]] static VerifyResult success(std::string stream_id) {
        return {true, CapabilityError::None, std::move(stream_id)};
    }

    [[nodiscard]] static VerifyResult failure(CapabilityError error, std::string stream_id = {}) {
        return {false, error, std::move(stream_id)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Components of a capability URL
struct StreamUrl {
    std::string origin;
    std::string stream_id;
    std::optional<std::string> expires;
    std::optional<std::string> signature;
    http::QueryParams extra_params;  // Anything besides expires/signature
};

/// Parse "{origin}/v1/proxy/{stream_id}?..." (nullopt if not a stream URL)
[[nodiscard]] std::optional<StreamUrl> parse_stream_url(std::string_view url);

/// Signs and verifies capability tokens. Immutable after construction, safe to share.
class CapabilitySigner {
public:
    explicit CapabilitySigner(std::string secret);

    /// base64url(HMAC-SHA256(secret, "{stream_id}:{expires_at}"))
    [[nodiscard]] std::string sign(std::string_view stream_id, int64_t expires_at) const;

    /// Check signature first, then expiry (now < expires_at)
    [[nodiscard]] VerifyResult verify(std::string_view stream_id,
                                      std::optional<std::string_view> expires,
                                      std::optional<std::string_view> signature,
                                      int64_t now = std::time(nullptr)) const;

    /// Signature only; used by write paths where expiry is not enforced
    [[nodiscard]] VerifyResult verify_signature(std::string_view stream_id,
                                                std::optional<std::string_view> expires,
                                                std::optional<std::string_view> signature) const;

    [[nodiscard]] CapabilityToken mint(std::string_view stream_id, uint32_t ttl_seconds,
                                       int64_t now = std::time(nullptr)) const;

    /// Fresh capability URL; extra query parameters are appended after the signature
    [[nodiscard]] std::string mint_url(std::string_view origin, std::string_view stream_id,
                                       uint32_t ttl_seconds, const http::QueryParams& extra = {},
                                       int64_t now = std::time(nullptr)) const;

    /// Constant-time comparison against the configured service secret
    [[nodiscard]] bool check_service_secret(std::string_view candidate) const noexcept;

private:
    std::string secret_;
};

/// Constant-time string equality (length is not hidden)
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace tether::core
