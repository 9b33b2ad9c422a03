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

// Tether URL Handling - Implementation

#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace tether::http {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool is_valid_host(std::string_view host) {
    if (host.empty()) {
        return false;
    }
    if (host.front() == '[') {
        return host.size() > 2 && host.back() == ']';
    }
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == '_';
    });
}

}  // namespace

std::string Url::origin() const {
    std::string result = scheme + "://" + host;
    if (port != 0 && port != default_port(scheme)) {
        result += ":" + std::to_string(port);
    }
    return result;
}

std::string Url::authority() const {
    if (port != 0 && port != default_port(scheme)) {
        return host + ":" + std::to_string(port);
    }
    return host;
}

std::string Url::path_and_query() const {
    if (query.empty()) {
        return path;
    }
    return path + "?" + query;
}

uint16_t default_port(std::string_view scheme) noexcept {
    if (scheme == "http") {
        return 80;
    }
    if (scheme == "https") {
        return 443;
    }
    return 0;
}

std::optional<Url> parse_url(std::string_view input) {
    auto scheme_end = input.find("://");
    if (scheme_end == std::string_view::npos || !is_valid_scheme(input.substr(0, scheme_end))) {
        return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(input.substr(0, scheme_end));

    std::string_view rest = input.substr(scheme_end + 3);
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail =
        authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        url.userinfo = std::string(authority.substr(0, at));
        authority = authority.substr(at + 1);
    }

    // Split host and port, honouring IPv6 brackets
    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port = after.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (!is_valid_host(host)) {
        return std::nullopt;
    }
    url.host = to_lower(host);

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 ||
            value > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(value);
        url.explicit_port = true;
    } else if (authority.size() > host.size()) {
        return std::nullopt;  // "host:" with empty port
    } else {
        url.port = default_port(url.scheme);
    }

    auto query_start = tail.find('?');
    std::string_view path = tail.substr(0, query_start);
    url.path = path.empty() ? "/" : std::string(path);
    if (query_start != std::string_view::npos) {
        url.query = std::string(tail.substr(query_start + 1));
    }

    return url;
}

QueryParams parse_query(std::string_view query) {
    QueryParams params;
    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string_view pair =
            query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            auto key = url::decode(pair.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::optional<std::string>(std::string())
                                                      : url::decode(pair.substr(eq + 1));
            if (key && value) {
                params.emplace_back(std::move(*key), std::move(*value));
            }
        }
        if (amp == std::string_view::npos) {
            break;
        }
        pos = amp + 1;
    }
    return params;
}

std::string build_query(const QueryParams& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out += '&';
        }
        out += url::encode(key);
        out += '=';
        out += url::encode(value);
    }
    return out;
}

std::optional<std::string> find_param(const QueryParams& params, std::string_view key) {
    for (const auto& [k, v] : params) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

namespace url {

std::string encode(std::string_view str) {
    std::ostringstream encoded;

    for (unsigned char c : str) {
        // Unreserved characters: A-Z a-z 0-9 - _ . ~
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%';
            encoded << "0123456789ABCDEF"[c >> 4];
            encoded << "0123456789ABCDEF"[c & 0x0F];
        }
    }

    return encoded.str();
}

static int hex_digit_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::optional<std::string> decode(std::string_view str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%') {
            if (i + 2 >= str.size()) {
                return std::nullopt;  // Incomplete percent sequence
            }

            int high = hex_digit_value(str[i + 1]);
            int low = hex_digit_value(str[i + 2]);

            if (high < 0 || low < 0) {
                return std::nullopt;
            }

            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        } else if (str[i] == '+') {
            // application/x-www-form-urlencoded space
            decoded += ' ';
        } else {
            decoded += str[i];
        }
    }

    return decoded;
}

}  // namespace url

}  // namespace tether::http
