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

// Tether HTTP Protocol - Header
// Methods and the header vocabulary of the durable-stream protocol

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    UNKNOWN
};

/// Protocol header names (lowercase; compare with header_name_equals)
namespace header {
inline constexpr std::string_view kUpstreamUrl = "upstream-url";
inline constexpr std::string_view kUpstreamMethod = "upstream-method";
inline constexpr std::string_view kUpstreamAuthorization = "upstream-authorization";
inline constexpr std::string_view kUpstreamContentType = "upstream-content-type";
inline constexpr std::string_view kUpstreamStatus = "upstream-status";
inline constexpr std::string_view kUseStreamUrl = "use-stream-url";
inline constexpr std::string_view kSignedUrlTtl = "stream-signed-url-ttl";
inline constexpr std::string_view kStreamId = "stream-id";
inline constexpr std::string_view kResponseId = "stream-response-id";
inline constexpr std::string_view kSessionId = "session-id";
inline constexpr std::string_view kNextOffset = "stream-next-offset";
inline constexpr std::string_view kUpToDate = "stream-up-to-date";
inline constexpr std::string_view kCursor = "stream-cursor";
inline constexpr std::string_view kStreamTtl = "stream-ttl";
inline constexpr std::string_view kStreamClosed = "stream-closed";
inline constexpr std::string_view kSseDataEncoding = "stream-sse-data-encoding";
inline constexpr std::string_view kLocation = "location";
inline constexpr std::string_view kAuthorization = "authorization";
inline constexpr std::string_view kContentType = "content-type";
inline constexpr std::string_view kSetCookie = "set-cookie";
inline constexpr std::string_view kHost = "host";
}  // namespace header

/// Ordered, case-preserving header list
using HeaderList = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Case-sensitive, as on the wire; UNKNOWN otherwise
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// First value of a header in a list (case-insensitive name match)
[[nodiscard]] std::optional<std::string> find_header(const HeaderList& headers,
                                                     std::string_view name);

/// Connection-scoped headers plus those the forwarder rewrites itself
[[nodiscard]] bool is_hop_by_hop(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_success(int status) noexcept {
    return status >= 200 && status < 300;
}

[[nodiscard]] constexpr bool is_redirect(int status) noexcept {
    return status >= 300 && status < 400;
}

}  // namespace tether::http
