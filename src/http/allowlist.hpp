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

// Tether Upstream Allowlist - Header
// Decides which upstream URLs may be proxied (SSRF guard)
//
// Pattern syntax:
//   [scheme://]host[:port][/path]
//   host   exact name, or *.domain (subdomains only, not the apex)
//   port   number or * (omitted = scheme default)
//   path   omitted = any path; * matches one segment, ** any suffix
//
// Examples:
//   https://api.openai.com/v1/**
//   *.anthropic.com
//   http://localhost:*/**

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "regex.hpp"
#include "url.hpp"

namespace tether::http {

enum class UrlVerdict : uint8_t { Allowed, Malformed, NotAllowed };

struct AllowlistResult {
    UrlVerdict verdict = UrlVerdict::Malformed;
    std::optional<Url> url;  // Set unless Malformed

    [[nodiscard]] bool allowed() const noexcept { return verdict == UrlVerdict::Allowed; }
};

/// Translate one allowlist pattern into an anchored regular expression over
/// "scheme://host:port/path" (port always explicit)
[[nodiscard]] std::optional<std::string> pattern_to_regex(std::string_view pattern,
                                                          std::string& error);

class Allowlist {
public:
    Allowlist() = default;

    /// nullopt if any pattern is invalid; `error` names it
    [[nodiscard]] static std::optional<Allowlist> compile(const std::vector<std::string>& patterns,
                                                          std::string& error);

    /// Parse and match a candidate upstream URL. An empty allowlist allows nothing.
    [[nodiscard]] AllowlistResult check(std::string_view url) const;

    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

private:
    std::vector<Regex> rules_;
};

}  // namespace tether::http
