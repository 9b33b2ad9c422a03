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

// Tether Capability URLs - Implementation

#include "capability.hpp"

#include <charconv>

#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "encoding.hpp"

namespace tether::core {

std::string_view to_code(CapabilityError error) noexcept {
    switch (error) {
        case CapabilityError::None:
            return "OK";
        case CapabilityError::MissingExpires:
            return "MISSING_EXPIRES";
        case CapabilityError::MissingSignature:
            return "MISSING_SIGNATURE";
        case CapabilityError::InvalidExpires:
            return "INVALID_EXPIRES";
        case CapabilityError::SignatureInvalid:
            return "SIGNATURE_INVALID";
        case CapabilityError::SignatureExpired:
            return "SIGNATURE_EXPIRED";
        case CapabilityError::MalformedStreamUrl:
            return "MALFORMED_STREAM_URL";
    }
    return "SIGNATURE_INVALID";
}

std::string_view to_message(CapabilityError error) noexcept {
    switch (error) {
        case CapabilityError::None:
            return "OK";
        case CapabilityError::MissingExpires:
            return "Missing expires parameter";
        case CapabilityError::MissingSignature:
            return "Missing signature parameter";
        case CapabilityError::InvalidExpires:
            return "Invalid expires parameter";
        case CapabilityError::SignatureInvalid:
            return "Invalid signature";
        case CapabilityError::SignatureExpired:
            return "Signed URL has expired";
        case CapabilityError::MalformedStreamUrl:
            return "Malformed stream URL";
    }
    return "Invalid signature";
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<StreamUrl> parse_stream_url(std::string_view url) {
    auto parsed = http::parse_url(url);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
        return std::nullopt;
    }

    std::string_view path = parsed->path;
    if (path.substr(0, kProxyPathPrefix.size()) != kProxyPathPrefix) {
        return std::nullopt;
    }
    std::string_view encoded_id = path.substr(kProxyPathPrefix.size());
    if (encoded_id.empty() || encoded_id.find('/') != std::string_view::npos) {
        return std::nullopt;
    }
    auto stream_id = http::url::decode(encoded_id);
    if (!stream_id || stream_id->empty()) {
        return std::nullopt;
    }

    StreamUrl result;
    result.origin = parsed->origin();
    result.stream_id = std::move(*stream_id);
    for (auto& [key, value] : http::parse_query(parsed->query)) {
        if (key == "expires") {
            result.expires = std::move(value);
        } else if (key == "signature") {
            result.signature = std::move(value);
        } else {
            result.extra_params.emplace_back(std::move(key), std::move(value));
        }
    }
    return result;
}

CapabilitySigner::CapabilitySigner(std::string secret) : secret_(std::move(secret)) {}

std::string CapabilitySigner::sign(std::string_view stream_id, int64_t expires_at) const {
    std::string message = fmt::format("{}:{}", stream_id, expires_at);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(), digest,
         &digest_len);

    return base64url_encode(
        std::string_view(reinterpret_cast<const char*>(digest), digest_len));
}

VerifyResult CapabilitySigner::verify_signature(std::string_view stream_id,
                                                std::optional<std::string_view> expires,
                                                std::optional<std::string_view> signature) const {
    if (!expires || expires->empty()) {
        return VerifyResult::failure(CapabilityError::MissingExpires, std::string(stream_id));
    }
    if (!signature || signature->empty()) {
        return VerifyResult::failure(CapabilityError::MissingSignature, std::string(stream_id));
    }

    int64_t expires_at = 0;
    auto [ptr, ec] = std::from_chars(expires->data(), expires->data() + expires->size(),
                                     expires_at);
    if (ec != std::errc() || ptr != expires->data() + expires->size() || expires_at < 0) {
        return VerifyResult::failure(CapabilityError::InvalidExpires, std::string(stream_id));
    }

    if (!constant_time_equals(sign(stream_id, expires_at), *signature)) {
        return VerifyResult::failure(CapabilityError::SignatureInvalid, std::string(stream_id));
    }

    return VerifyResult::success(std::string(stream_id));
}

VerifyResult CapabilitySigner::verify(std::string_view stream_id,
                                      std::optional<std::string_view> expires,
                                      std::optional<std::string_view> signature,
                                      int64_t now) const {
    auto result = verify_signature(stream_id, expires, signature);
    if (!result) {
        return result;
    }

    // Parsed successfully by verify_signature
    int64_t expires_at = 0;
    std::from_chars(expires->data(), expires->data() + expires->size(), expires_at);
    if (now >= expires_at) {
        return VerifyResult::failure(CapabilityError::SignatureExpired, std::string(stream_id));
    }

    return result;
}

CapabilityToken CapabilitySigner::mint(std::string_view stream_id, uint32_t ttl_seconds,
                                       int64_t now) const {
    CapabilityToken token;
    token.stream_id = std::string(stream_id);
    token.expires_at = now + static_cast<int64_t>(ttl_seconds);
    token.signature = sign(stream_id, token.expires_at);
    return token;
}

std::string CapabilitySigner::mint_url(std::string_view origin, std::string_view stream_id,
                                       uint32_t ttl_seconds, const http::QueryParams& extra,
                                       int64_t now) const {
    auto token = mint(stream_id, ttl_seconds, now);

    http::QueryParams params;
    params.emplace_back("expires", std::to_string(token.expires_at));
    params.emplace_back("signature", token.signature);
    params.insert(params.end(), extra.begin(), extra.end());

    return fmt::format("{}{}{}?{}", origin, kProxyPathPrefix, http::url::encode(stream_id),
                       http::build_query(params));
}

bool CapabilitySigner::check_service_secret(std::string_view candidate) const noexcept {
    if (secret_.empty()) {
        return false;
    }
    return constant_time_equals(secret_, candidate);
}

}  // namespace tether::core
