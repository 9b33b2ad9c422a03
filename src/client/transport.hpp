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

// Tether Client Transport - Header
// One HTTP exchange with the proxy, interruptible through a stop token

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "../http/http.hpp"
#include "../http/url.hpp"

namespace tether::client {

struct TransportRequest {
    std::string method = "GET";
    std::string url;  // Absolute
    http::HeaderList headers;
    std::string body;
    std::string content_type;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};

    /// When set, body bytes are streamed here instead of buffered; return false to stop
    std::function<bool(std::string_view)> on_chunk;
};

struct TransportResponse {
    int status = 0;  // 0 = no response (see error)
    http::HeaderList headers;
    std::string body;
    std::string error;
    bool cancelled = false;

    [[nodiscard]] bool ok() const noexcept { return http::is_success(status); }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return http::find_header(headers, name);
    }
};

/// Perform the request. Never throws for network failures; they surface in `error`.
[[nodiscard]] TransportResponse perform(const TransportRequest& request,
                                        std::stop_token stop = {});

/// Throws Cancelled, or ProxyError for a transport failure or non-2xx status
void throw_on_failure(const TransportResponse& response, std::string_view context);

/// Resolve a Location header against the proxy base URL
[[nodiscard]] std::string resolve_location(std::string_view base_url, std::string_view location);

/// Replace or add query parameters on an absolute URL
[[nodiscard]] std::string with_params(std::string_view url, const http::QueryParams& params);

}  // namespace tether::client
