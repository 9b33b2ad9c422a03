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

// Tether Proxy Errors - Header
// Error results returned by proxy handlers and their JSON rendering

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../core/capability.hpp"

namespace tether::proxy {

/// Error codes reported in {"error": {"code": ...}}
namespace code {
inline constexpr std::string_view kMissingSecret = "MISSING_SECRET";
inline constexpr std::string_view kInvalidSecret = "INVALID_SECRET";
inline constexpr std::string_view kMissingUpstreamUrl = "MISSING_UPSTREAM_URL";
inline constexpr std::string_view kMissingUpstreamMethod = "MISSING_UPSTREAM_METHOD";
inline constexpr std::string_view kInvalidUpstreamMethod = "INVALID_UPSTREAM_METHOD";
inline constexpr std::string_view kInvalidUpstreamUrl = "INVALID_UPSTREAM_URL";
inline constexpr std::string_view kUpstreamNotAllowed = "UPSTREAM_NOT_ALLOWED";
inline constexpr std::string_view kUpstreamError = "UPSTREAM_ERROR";
inline constexpr std::string_view kUpstreamTimeout = "UPSTREAM_TIMEOUT";
inline constexpr std::string_view kRedirectNotAllowed = "REDIRECT_NOT_ALLOWED";
inline constexpr std::string_view kStreamNotFound = "STREAM_NOT_FOUND";
inline constexpr std::string_view kStreamClosed = "STREAM_CLOSED";
inline constexpr std::string_view kStreamIdMismatch = "STREAM_ID_MISMATCH";
inline constexpr std::string_view kStorageError = "STORAGE_ERROR";
inline constexpr std::string_view kConnectRejected = "CONNECT_REJECTED";
inline constexpr std::string_view kRenewalRejected = "RENEWAL_REJECTED";
inline constexpr std::string_view kMissingUseStreamUrl = "MISSING_USE_STREAM_URL";
inline constexpr std::string_view kInvalidAction = "INVALID_ACTION";
inline constexpr std::string_view kInvalidResponseId = "INVALID_RESPONSE_ID";
inline constexpr std::string_view kInvalidLiveMode = "INVALID_LIVE_MODE";
inline constexpr std::string_view kInvalidStreamId = "INVALID_STREAM_ID";
inline constexpr std::string_view kNotFound = "NOT_FOUND";
inline constexpr std::string_view kMethodNotAllowed = "METHOD_NOT_ALLOWED";
inline constexpr std::string_view kPayloadTooLarge = "PAYLOAD_TOO_LARGE";
inline constexpr std::string_view kInternalError = "INTERNAL_ERROR";

// In-band Error frame codes
inline constexpr std::string_view kResponseTooLarge = "RESPONSE_TOO_LARGE";
inline constexpr std::string_view kIdleTimeout = "IDLE_TIMEOUT";
inline constexpr std::string_view kStreamError = "STREAM_ERROR";
}  // namespace code

/// Failed request: HTTP status plus a machine-readable code
struct ProxyError {
    int status = 500;
    std::string code;
    std::string message;
    std::optional<std::string> stream_id;  // Set for SIGNATURE_EXPIRED
    bool renewable = false;

    [[nodiscard]] static ProxyError make(int status, std::string_view code, std::string message) {
        return {status, std::string(code), std::move(message), std::nullopt, false};
    }

    /// Map a capability failure; expiry carries the stream ID and is renewable
    [[nodiscard]] static ProxyError from_capability(core::CapabilityError error,
                                                    std::string_view stream_id);
};

/// {"error": {"code", "message"[, "streamId", "renewable"]}}
[[nodiscard]] std::string error_body(const ProxyError& error);

}  // namespace tether::proxy
