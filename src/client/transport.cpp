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

// Tether Client Transport - Implementation

#include "transport.hpp"

#include <algorithm>

#include <httplib.h>

#include <fmt/format.h>

#include "errors.hpp"

namespace tether::client {

TransportResponse perform(const TransportRequest& request, std::stop_token stop) {
    TransportResponse response;

    auto url = http::parse_url(request.url);
    if (!url) {
        response.error = fmt::format("invalid URL: {}", request.url);
        return response;
    }

    httplib::Client client(url->origin());
    client.set_connection_timeout(request.connect_timeout);
    client.set_read_timeout(request.read_timeout);
    client.set_write_timeout(request.connect_timeout);

    if (stop.stop_requested()) {
        response.cancelled = true;
        return response;
    }
    std::stop_callback on_stop(stop, [&client] { client.stop(); });

    httplib::Request req;
    req.method = request.method;
    req.path = url->path_and_query();
    for (const auto& [name, value] : request.headers) {
        req.set_header(name, value);
    }
    if (!request.body.empty() || !request.content_type.empty()) {
        req.body = request.body;
        req.set_header("Content-Type", request.content_type.empty() ? "application/octet-stream"
                                                                    : request.content_type);
    }
    // Streamed bodies reach on_chunk only for 2xx; error bodies are buffered
    int head_status = 0;
    std::string error_body;
    if (request.on_chunk) {
        req.response_handler = [&head_status](const httplib::Response& res) {
            head_status = res.status;
            return true;
        };
        req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            if (!http::is_success(head_status)) {
                error_body.append(data, len);
                return true;
            }
            return request.on_chunk(std::string_view(data, len));
        };
    }

    auto result = client.send(req);
    if (!result) {
        response.cancelled = stop.stop_requested();
        response.error = httplib::to_string(result.error());
        return response;
    }

    response.status = result->status;
    for (const auto& [name, value] : result->headers) {
        response.headers.emplace_back(name, value);
    }
    response.body = request.on_chunk ? std::move(error_body) : std::move(result->body);
    return response;
}

void throw_on_failure(const TransportResponse& response, std::string_view context) {
    if (response.cancelled) {
        throw Cancelled();
    }
    if (response.status == 0) {
        throw ProxyError(std::string(code::kNetworkError),
                         fmt::format("{}: {}", context, response.error));
    }
    if (!response.ok()) {
        throw ProxyError::from_response(response.status, response.body, context);
    }
}

std::string resolve_location(std::string_view base_url, std::string_view location) {
    if (!location.starts_with("/")) {
        return std::string(location);
    }
    auto base = http::parse_url(base_url);
    if (!base) {
        return std::string(location);
    }
    return base->origin() + std::string(location);
}

std::string with_params(std::string_view url, const http::QueryParams& params) {
    auto query_start = url.find('?');
    auto query = query_start == std::string_view::npos
                     ? http::QueryParams{}
                     : http::parse_query(url.substr(query_start + 1));

    for (const auto& [key, value] : params) {
        auto it = std::find_if(query.begin(), query.end(),
                               [&key](const auto& entry) { return entry.first == key; });
        if (it != query.end()) {
            it->second = value;
        } else {
            query.emplace_back(key, value);
        }
    }
    return fmt::format("{}?{}", url.substr(0, query_start), http::build_query(query));
}

}  // namespace tether::client
