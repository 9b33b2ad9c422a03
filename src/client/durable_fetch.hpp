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

// Tether Durable Fetch - Header
// Single-shot durable requests: each call creates its own stream, and a call
// repeating a known requestId resumes the response it already started

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "../wire/demuxer.hpp"
#include "durable_session.hpp"
#include "request_store.hpp"
#include "stream_reader.hpp"

namespace tether::client {

/// Follows one stream until a target response terminates; keeps its body flowing
class StreamFollower {
public:
    StreamFollower(std::string stream_url, StreamReaderOptions reader,
                   wire::DemuxerOptions demuxer, std::chrono::milliseconds poll_backoff);
    ~StreamFollower();

    StreamFollower(const StreamFollower&) = delete;
    StreamFollower& operator=(const StreamFollower&) = delete;

    /// Start reading and wait for the Start frame of `response_id`.
    /// Throws ProxyError (RESUME_TIMEOUT) or the demuxer's error.
    [[nodiscard]] wire::ResponsePtr follow(uint32_t response_id,
                                           std::optional<std::chrono::milliseconds> timeout,
                                           std::stop_token stop);

    void stop();

private:
    void read_loop(std::stop_token stop);

    std::string stream_url_;
    StreamReader reader_;
    wire::FrameDemuxer demuxer_;
    std::chrono::milliseconds poll_backoff_;

    std::mutex mutex_;
    wire::ResponsePtr target_;
    std::condition_variable_any sleep_cv_;
    std::jthread thread_;
};

struct DurableFetchOptions {
    std::string proxy_url;
    std::string service_secret;

    std::shared_ptr<RequestStore> store;  // Defaults to a MemoryRequestStore
    std::string store_prefix = std::string(kDefaultStorePrefix);
    std::optional<uint32_t> signed_url_ttl;

    StreamReaderOptions reader;
    wire::DemuxerOptions demuxer;

    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds resume_timeout{4000};
    std::chrono::milliseconds poll_backoff{75};
};

struct DurableResult {
    wire::ResponsePtr response;
    std::string stream_url;
    std::string stream_id;
    bool was_resumed = false;

    std::shared_ptr<StreamFollower> follower;  // Reads until the response terminates
};

class DurableFetch {
public:
    explicit DurableFetch(DurableFetchOptions options);

    [[nodiscard]] DurableResult operator()(const std::string& upstream_url,
                                           FetchOptions options = {});

    /// PATCH ?action=abort on a stream URL (optionally one response)
    void abort(const std::string& stream_url, std::optional<uint32_t> response_id = std::nullopt);

private:
    [[nodiscard]] std::optional<DurableResult> resume(const std::string& key,
                                                      const RequestMapping& mapping,
                                                      std::stop_token stop);
    [[nodiscard]] DurableResult open(const std::string& stream_url, uint32_t response_id,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::stop_token stop);

    DurableFetchOptions options_;
    std::string proxy_url_;
};

/// Last path segment of a capability URL, percent-decoded
[[nodiscard]] std::string stream_id_from_url(std::string_view stream_url);

}  // namespace tether::client
