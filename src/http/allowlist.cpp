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

// Tether Upstream Allowlist - Implementation

#include "allowlist.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace tether::http {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string host_to_regex(std::string_view host) {
    if (host == "*") {
        return R"([^:/]+)";
    }
    if (host.substr(0, 2) == "*.") {
        // One or more labels in front of the domain, never the apex itself
        return R"((?:[^.:/]+\.)+)" + regex_escape(host.substr(2));
    }
    return regex_escape(host);
}

std::string path_to_regex(std::string_view path) {
    if (path.empty()) {
        return "/.*";
    }

    std::string out;
    size_t i = 0;
    while (i < path.size()) {
        if (path.compare(i, 3, "/**") == 0 && i + 3 == path.size()) {
            out += "(?:/.*)?";  // "/x/**" also matches "/x"
            i += 3;
        } else if (path.compare(i, 2, "**") == 0) {
            out += ".*";
            i += 2;
        } else if (path[i] == '*') {
            out += "[^/]*";
            ++i;
        } else {
            out += regex_escape(path.substr(i, 1));
            ++i;
        }
    }
    return out;
}

bool is_valid_port(std::string_view port) {
    if (port == "*") {
        return true;
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    return ec == std::errc() && ptr == port.data() + port.size() && value > 0 && value <= 65535;
}

}  // namespace

std::optional<std::string> pattern_to_regex(std::string_view pattern, std::string& error) {
    if (pattern.empty()) {
        error = "empty allowlist pattern";
        return std::nullopt;
    }

    std::vector<std::string> schemes;
    std::string_view rest = pattern;
    if (auto sep = rest.find("://"); sep != std::string_view::npos) {
        std::string scheme = to_lower(rest.substr(0, sep));
        if (scheme != "http" && scheme != "https") {
            error = fmt::format("unsupported scheme in allowlist pattern '{}'", pattern);
            return std::nullopt;
        }
        schemes.push_back(std::move(scheme));
        rest = rest.substr(sep + 3);
    } else {
        schemes = {"http", "https"};
    }

    auto path_start = rest.find('/');
    std::string_view authority = rest.substr(0, path_start);
    std::string_view path =
        path_start == std::string_view::npos ? std::string_view{} : rest.substr(path_start);

    std::string_view host = authority;
    std::optional<std::string_view> port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            error = fmt::format("unterminated IPv6 literal in allowlist pattern '{}'", pattern);
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                error = fmt::format("invalid authority in allowlist pattern '{}'", pattern);
                return std::nullopt;
            }
            port = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) {
        error = fmt::format("missing host in allowlist pattern '{}'", pattern);
        return std::nullopt;
    }
    if (port && !is_valid_port(*port)) {
        error = fmt::format("invalid port in allowlist pattern '{}'", pattern);
        return std::nullopt;
    }

    std::string host_re = host_to_regex(to_lower(host));
    std::string path_re = path_to_regex(path);

    std::string alternatives;
    for (const auto& scheme : schemes) {
        std::string port_re;
        if (!port) {
            port_re = std::to_string(default_port(scheme));
        } else if (*port == "*") {
            port_re = R"(\d+)";
        } else {
            port_re = std::string(*port);
        }

        if (!alternatives.empty()) {
            alternatives += '|';
        }
        alternatives += fmt::format("{}://{}:{}", scheme, host_re, port_re);
    }

    return fmt::format("(?:{}){}", alternatives, path_re);
}

std::optional<Allowlist> Allowlist::compile(const std::vector<std::string>& patterns,
                                            std::string& error) {
    Allowlist allowlist;
    for (const auto& pattern : patterns) {
        auto regex_source = pattern_to_regex(pattern, error);
        if (!regex_source) {
            return std::nullopt;
        }

        std::string regex_error;
        // Candidates arrive with scheme and host lowercased; paths stay case-sensitive
        auto regex = Regex::compile(*regex_source, {.case_insensitive = false, .anchored = true},
                                          regex_error);
        if (!regex) {
            error = fmt::format("allowlist pattern '{}': {}", pattern, regex_error);
            return std::nullopt;
        }
        allowlist.rules_.push_back(std::move(*regex));
    }
    return allowlist;
}

AllowlistResult Allowlist::check(std::string_view url) const {
    AllowlistResult result;

    auto parsed = parse_url(url);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https") ||
        !parsed->userinfo.empty()) {
        result.verdict = UrlVerdict::Malformed;
        return result;
    }

    std::string candidate =
        fmt::format("{}://{}:{}{}", parsed->scheme, parsed->host, parsed->port, parsed->path);

    bool allowed = std::any_of(rules_.begin(), rules_.end(),
                               [&](const Regex& rule) { return rule.matches(candidate); });

    result.verdict = allowed ? UrlVerdict::Allowed : UrlVerdict::NotAllowed;
    result.url = std::move(parsed);
    return result;
}

}  // namespace tether::http
