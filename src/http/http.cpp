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

// Tether HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace tether::http {

namespace {

constexpr std::array<std::pair<Method, std::string_view>, 7> kMethodNames = {{
    {Method::GET, "GET"},
    {Method::POST, "POST"},
    {Method::PUT, "PUT"},
    {Method::DELETE, "DELETE"},
    {Method::HEAD, "HEAD"},
    {Method::OPTIONS, "OPTIONS"},
    {Method::PATCH, "PATCH"},
}};

}  // namespace

std::string_view to_string(Method method) noexcept {
    for (const auto& [value, name] : kMethodNames) {
        if (value == method) {
            return name;
        }
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    for (const auto& [value, name] : kMethodNames) {
        if (name == str) {
            return value;
        }
    }
    return Method::UNKNOWN;
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

std::optional<std::string> find_header(const HeaderList& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (header_name_equals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_hop_by_hop(std::string_view name) noexcept {
    static constexpr std::array<std::string_view, 12> kStripped = {
        "connection", "keep-alive",        "proxy-authenticate", "proxy-authorization",
        "te",         "trailer",           "transfer-encoding",  "upgrade",
        "host",       "authorization",     "accept-encoding",    "content-length",
    };
    return std::any_of(kStripped.begin(), kStripped.end(),
                       [name](std::string_view h) { return header_name_equals(h, name); });
}

}  // namespace tether::http
