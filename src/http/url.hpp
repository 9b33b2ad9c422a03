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

// Tether URL Handling - Header
// Absolute URL parsing, query strings and percent-encoding

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::http {

/// Parsed absolute URL (scheme and host are lowercased)
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;  // IPv6 literals keep their brackets
    uint16_t port = 0;
    bool explicit_port = false;
    std::string path = "/";
    std::string query;  // Without leading '?'

    /// scheme://host[:port], port omitted when it is the scheme default
    [[nodiscard]] std::string origin() const;

    /// Value suitable for a Host header
    [[nodiscard]] std::string authority() const;

    [[nodiscard]] std::string path_and_query() const;
};

/// Parse an absolute http(s)-style URL. Fragments are discarded.
[[nodiscard]] std::optional<Url> parse_url(std::string_view input);

/// 80 for http, 443 for https, 0 otherwise
[[nodiscard]] uint16_t default_port(std::string_view scheme) noexcept;

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Decode a query string into ordered key/value pairs (undecodable pairs are skipped)
[[nodiscard]] QueryParams parse_query(std::string_view query);

[[nodiscard]] std::string build_query(const QueryParams& params);

[[nodiscard]] std::optional<std::string> find_param(const QueryParams& params,
                                                    std::string_view key);

// Percent-encoding helpers
namespace url {

// URL encode a string (percent-encoding)
[[nodiscard]] std::string encode(std::string_view str);

// URL decode a string (percent-decoding)
// Returns nullopt if invalid encoding (e.g., incomplete % sequence)
[[nodiscard]] std::optional<std::string> decode(std::string_view str);

}  // namespace url

}  // namespace tether::http
