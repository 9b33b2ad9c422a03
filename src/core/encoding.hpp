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

// Tether Encoding Utilities - Header
// Base64 / base64url codecs (OpenSSL BIO) and random identifiers

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tether::core {

/// Standard base64 with padding (RFC 4648 section 4)
[[nodiscard]] std::string base64_encode(std::string_view input);

/// Returns nullopt on malformed input
[[nodiscard]] std::optional<std::string> base64_decode(std::string_view input);

/// URL-safe base64 without padding (RFC 4648 section 5)
[[nodiscard]] std::string base64url_encode(std::string_view input);

[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Random UUID v4 from the OpenSSL CSPRNG, used for generated stream IDs
[[nodiscard]] std::string generate_stream_id();

}  // namespace tether::core
