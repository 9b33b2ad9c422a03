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

// Tether Stream Reader - Header
// Tails a stream's frame log through the proxy (long-poll or SSE)

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace tether::client {

enum class ReadMode : uint8_t { LongPoll, Sse };

struct ReadPosition {
    std::string offset = "-1";
    std::string cursor;
    bool up_to_date = false;
};

struct StreamReaderOptions {
    ReadMode mode = ReadMode::LongPoll;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{65000};  // Above the proxy's long-poll window
};

/// Receives raw frame bytes in log order
using ByteSink = std::function<void(std::string_view)>;

class StreamReader {
public:
    explicit StreamReader(StreamReaderOptions options = {}) : options_(options) {}

    /// One read cycle from `position` against the capability URL `stream_url`.
    /// Long-poll: a single request. SSE: one event-stream session until the proxy ends it.
    /// Advances `position`; returns false if `stop` fired.
    /// Throws ProxyError on a non-2xx response or a transport failure.
    bool read(const std::string& stream_url, ReadPosition& position, const ByteSink& sink,
              std::stop_token stop = {}) const;

    /// Non-live snapshot read (no live parameter)
    bool read_once(const std::string& stream_url, ReadPosition& position, const ByteSink& sink,
                   std::stop_token stop = {}) const;

    [[nodiscard]] const StreamReaderOptions& options() const noexcept { return options_; }

private:
    bool read_polled(const std::string& stream_url, ReadPosition& position, const ByteSink& sink,
                     bool live, std::stop_token stop) const;
    bool read_sse(const std::string& stream_url, ReadPosition& position, const ByteSink& sink,
                  std::stop_token stop) const;

    StreamReaderOptions options_;
};

}  // namespace tether::client
