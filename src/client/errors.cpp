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

// Tether Client Errors - Implementation

#include "errors.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace tether::client {

ProxyError ProxyError::from_response(int status, std::string_view body, std::string_view context) {
    auto fallback = [&] {
        return ProxyError(fmt::format("HTTP_{}", status), fmt::format("{}: {}", context, status),
                          status);
    };

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error") || !j["error"].is_object()) {
        return fallback();
    }

    const auto& e = j["error"];
    auto code = e.value("code", std::string());
    if (code.empty()) {
        return fallback();
    }

    std::optional<std::string> stream_id;
    if (e.contains("streamId") && e["streamId"].is_string()) {
        stream_id = e["streamId"].get<std::string>();
    }
    return ProxyError(std::move(code),
                      fmt::format("{}: {} {}", context, status, e.value("message", std::string())),
                      status, e.value("renewable", false), std::move(stream_id));
}

}  // namespace tether::client
