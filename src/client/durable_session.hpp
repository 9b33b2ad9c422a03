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

// Tether Durable Session - Header
// Multiplexes many proxied requests over one durable stream, with a single
// background reader feeding a FrameDemuxer

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "../http/http.hpp"
#include "../wire/demuxer.hpp"
#include "request_store.hpp"
#include "stream_reader.hpp"

namespace tether::client {

inline constexpr std::string_view kDefaultStorePrefix = "durable-streams:";

struct SessionOptions {
    std::string proxy_url;       // e.g. https://proxy.example.com/v1/proxy
    std::string service_secret;  // Sent as ?secret=
    std::string session_id;      // Also the stream ID

    std::optional<std::string> connect_url;  // Connect handler (Upstream-URL)
    std::optional<uint32_t> signed_url_ttl;  // Stream-Signed-URL-TTL

    std::shared_ptr<RequestStore> store;  // Defaults to a MemoryRequestStore
    std::string store_prefix = std::string(kDefaultStorePrefix);

    StreamReaderOptions reader;
    wire::DemuxerOptions demuxer;

    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds poll_backoff{75};

    // Transient STORAGE_ERROR reads
    int storage_retries = 3;
    std::chrono::milliseconds retry_base{100};
    std::chrono::milliseconds retry_cap{2000};
};

struct FetchOptions {
    std::string method = "POST";
    http::HeaderList headers;  // Authorization is relabelled Upstream-Authorization
    std::string body;
    std::optional<std::string> request_id;
    std::stop_token stop;
};

class DurableSession {
public:
    explicit DurableSession(SessionOptions options);
    ~DurableSession();

    DurableSession(const DurableSession&) = delete;
    DurableSession& operator=(const DurableSession&) = delete;

    /// Establish or refresh the stream URL. Concurrent callers share one attempt.
    void connect();

    /// Send one upstream request through the session and wait for its Start frame
    [[nodiscard]] wire::ResponsePtr fetch(const std::string& upstream_url,
                                          FetchOptions options = {});

    /// Abort one response, or the latest one when `response_id` is empty
    void abort(std::optional<uint32_t> response_id = std::nullopt);

    /// Next response in log order (including ones started elsewhere); nullopt once closed
    [[nodiscard]] std::optional<wire::ResponsePtr> next_response();

    /// Stop the reader and reject everything still pending
    void close();

    [[nodiscard]] std::optional<std::string> stream_url() const;
    [[nodiscard]] std::optional<std::string> stream_id() const;
    [[nodiscard]] const std::string& session_id() const noexcept { return options_.session_id; }
    [[nodiscard]] bool closed() const;

private:
    void do_connect();
    void ensure_connected();
    void ensure_reader();
    void read_loop(std::stop_token stop);
    bool sleep_for(std::chrono::milliseconds duration, std::stop_token stop);
    [[nodiscard]] wire::ResponsePtr wait_for(uint32_t response_id, std::stop_token stop);
    [[nodiscard]] std::string request_key(const std::string& request_id) const;

    SessionOptions options_;
    std::string proxy_url_;  // Without trailing '/'
    StreamReader reader_;
    wire::FrameDemuxer demuxer_;

    mutable std::mutex mutex_;
    std::optional<std::string> stream_url_;
    std::optional<std::string> stream_id_;
    std::optional<std::shared_future<void>> connecting_;
    bool closed_ = false;

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;
    std::jthread read_thread_;
};

}  // namespace tether::client
