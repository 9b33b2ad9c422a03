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

// Tether Client Errors - Header
// Exceptions thrown by the durable-stream client

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether::client {

/// A proxy request failed; carries the proxy's error code and HTTP status
class ProxyError : public std::runtime_error {
public:
    ProxyError(std::string code, std::string message, int status = 0, bool renewable = false,
               std::optional<std::string> stream_id = std::nullopt)
        : std::runtime_error(message),
          code_(std::move(code)),
          status_(status),
          renewable_(renewable),
          stream_id_(std::move(stream_id)) {}

    [[nodiscard]] const std::string& code() const noexcept { return code_; }
    [[nodiscard]] int status() const noexcept { return status_; }

    /// Expired capability: reconnect and retry
    [[nodiscard]] bool renewable() const noexcept { return renewable_; }

    [[nodiscard]] const std::optional<std::string>& stream_id() const noexcept {
        return stream_id_;
    }

    /// Build from a non-2xx proxy response ({"error": {...}} body when present)
    [[nodiscard]] static ProxyError from_response(int status, std::string_view body,
                                                  std::string_view context);

private:
    std::string code_;
    int status_;
    bool renewable_;
    std::optional<std::string> stream_id_;
};

/// The caller's stop token fired before the operation finished
class Cancelled : public std::runtime_error {
public:
    Cancelled() : std::runtime_error("operation cancelled") {}
};

// Client-side codes (no proxy response to carry one)
namespace code {
inline constexpr std::string_view kNetworkError = "NETWORK_ERROR";
inline constexpr std::string_view kProtocolError = "PROTOCOL_ERROR";
inline constexpr std::string_view kResumeTimeout = "RESUME_TIMEOUT";
inline constexpr std::string_view kSessionClosed = "SESSION_CLOSED";
inline constexpr std::string_view kStorageError = "STORAGE_ERROR";
}  // namespace code

}  // namespace tether::client
