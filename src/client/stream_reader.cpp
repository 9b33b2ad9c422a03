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

// Tether Stream Reader - Implementation

#include "stream_reader.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../core/encoding.hpp"
#include "../core/logging.hpp"
#include "../http/sse.hpp"
#include "errors.hpp"
#include "transport.hpp"

namespace tether::client {

bool StreamReader::read(const std::string& stream_url, ReadPosition& position,
                        const ByteSink& sink, std::stop_token stop) const {
    if (options_.mode == ReadMode::Sse) {
        return read_sse(stream_url, position, sink, stop);
    }
    return read_polled(stream_url, position, sink, true, stop);
}

bool StreamReader::read_once(const std::string& stream_url, ReadPosition& position,
                             const ByteSink& sink, std::stop_token stop) const {
    return read_polled(stream_url, position, sink, false, stop);
}

bool StreamReader::read_polled(const std::string& stream_url, ReadPosition& position,
                               const ByteSink& sink, bool live, std::stop_token stop) const {
    http::QueryParams params = {{"offset", position.offset}};
    if (live) {
        params.emplace_back("live", "long-poll");
    }
    if (!position.cursor.empty()) {
        params.emplace_back("cursor", position.cursor);
    }

    TransportRequest request;
    request.url = with_params(stream_url, params);
    request.connect_timeout = options_.connect_timeout;
    request.read_timeout = options_.read_timeout;

    auto response = perform(request, stop);
    if (response.cancelled) {
        return false;
    }
    throw_on_failure(response, "Read request failed");

    if (!response.body.empty()) {
        sink(response.body);
    }
    if (auto next = response.header("Stream-Next-Offset"); next && !next->empty()) {
        position.offset = *next;
    }
    if (auto cursor = response.header("Stream-Cursor"); cursor && !cursor->empty()) {
        position.cursor = *cursor;
    }
    position.up_to_date =
        response.status == 204 || response.header("Stream-Up-To-Date").value_or("") == "true";
    return true;
}

bool StreamReader::read_sse(const std::string& stream_url, ReadPosition& position,
                            const ByteSink& sink, std::stop_token stop) const {
    http::QueryParams params = {{"offset", position.offset}, {"live", "sse"}};
    if (!position.cursor.empty()) {
        params.emplace_back("cursor", position.cursor);
    }

    http::SseParser parser;
    std::optional<ProxyError> failure;
    // Data is delivered only once a control event confirms the offset it ends at;
    // a connection dropped in between re-reads it from the old offset
    std::string pending;

    TransportRequest request;
    request.url = with_params(stream_url, params);
    request.connect_timeout = options_.connect_timeout;
    request.read_timeout = options_.read_timeout;
    request.headers.emplace_back("Accept", "text/event-stream");
    request.on_chunk = [&](std::string_view chunk) {
        for (auto& event : parser.feed(chunk)) {
            if (event.event == "data") {
                auto bytes = core::base64_decode(event.data);
                if (!bytes) {
                    failure = ProxyError(std::string(code::kProtocolError),
                                         "SSE data event is not valid base64");
                    return false;
                }
                pending += *bytes;
            } else if (event.event == "control") {
                auto control = nlohmann::json::parse(event.data, nullptr, false);
                if (control.is_discarded() || !control.is_object()) {
                    LOG_WARNING(logging::logger(), "Ignoring malformed SSE control event");
                    continue;
                }
                if (!pending.empty()) {
                    sink(pending);
                    pending.clear();
                }
                position.offset = control.value("streamNextOffset", position.offset);
                position.cursor = control.value("streamCursor", position.cursor);
                position.up_to_date = control.value("upToDate", false);
            } else if (event.event == "error") {
                auto detail = nlohmann::json::parse(event.data, nullptr, false);
                auto error_code = detail.is_object()
                                      ? detail.value("code", std::string(code::kStorageError))
                                      : std::string(code::kStorageError);
                auto message = detail.is_object() ? detail.value("message", std::string())
                                                  : std::string();
                failure = ProxyError(std::move(error_code),
                                     fmt::format("SSE read failed: {}", message));
                return false;
            }
        }
        return true;
    };

    auto response = perform(request, stop);
    if (!pending.empty()) {
        LOG_DEBUG(logging::logger(), "Discarding {} SSE bytes without a control event",
                  pending.size());
    }
    if (response.cancelled) {
        return false;
    }
    if (failure) {
        throw *failure;
    }
    throw_on_failure(response, "SSE read failed");
    return true;
}

}  // namespace tether::client
