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

// Tether Upstream Forwarder - Header
// Executes proxied HTTP calls on background threads (cpp-httplib client).
//
// Lifecycle of one call:
//   start() -> await_head() -> commit(sink) | collect_error_body() | reject()
// The transfer thread blocks after the response head until the caller decides,
// so no body byte is read before a Start frame exists for it.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "../http/http.hpp"
#include "../http/url.hpp"
#include "registry.hpp"

namespace httplib {
class Client;
struct Response;
class Result;
}  // namespace httplib

namespace tether::proxy {

struct ForwardRequest {
    http::Url url;
    std::string method = "POST";
    http::HeaderList headers;
    std::string body;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds idle_timeout{300000};  // Max gap between body chunks
    uint64_t max_response_bytes = 104857600;
    size_t max_error_body_bytes = 65536;
};

enum class HeadOutcome : uint8_t { Received, ConnectFailed, TimedOut, Cancelled };

struct UpstreamHead {
    HeadOutcome outcome = HeadOutcome::ConnectFailed;
    int status = 0;
    http::HeaderList headers;
    std::string error;
};

/// How a committed body transfer ended
enum class BodyEnd : uint8_t { Complete, Aborted, TooLarge, IdleTimeout, Failed };

[[nodiscard]] std::string_view to_string(BodyEnd end) noexcept;

/// Receives a committed upstream body, called on the transfer thread
class BodySink {
public:
    virtual ~BodySink() = default;

    /// Returning false stops the transfer (ends as Failed)
    virtual bool on_data(std::string_view chunk) = 0;

    /// Called exactly once per committed call
    virtual void on_end(BodyEnd end, std::string_view message) = 0;
};

class UpstreamCall final : public Cancellable {
public:
    explicit UpstreamCall(ForwardRequest request);

    /// Wait for the response head. On timeout the call is abandoned.
    [[nodiscard]] UpstreamHead await_head(std::chrono::milliseconds timeout);

    /// Stream the body into `sink`. If the call was cancelled meanwhile, the sink
    /// immediately sees on_end(Aborted).
    void commit(std::shared_ptr<BodySink> sink);

    /// Read up to max_error_body_bytes of the body, then drop the connection.
    /// Past `timeout` the transfer is stopped and whatever arrived is returned.
    [[nodiscard]] std::string collect_error_body(std::chrono::milliseconds timeout);

    /// Drop the response without reading its body
    void reject();

    void cancel() override;

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    /// Block until the transfer thread is done with the connection
    void wait_finished();

    [[nodiscard]] const ForwardRequest& request() const noexcept { return request_; }

private:
    friend class UpstreamForwarder;

    enum class Decision : uint8_t { Pending, Commit, CollectError, Reject };

    void run();
    void finish_without_transfer();
    bool on_head(const httplib::Response& response);
    bool on_body(std::string_view chunk);
    void finish(const httplib::Result& result);
    void touch() noexcept;

    ForwardRequest request_;

    std::mutex mutex_;
    std::condition_variable cv_;
    httplib::Client* client_ = nullptr;  // Valid while run() is inside send()
    bool head_ready_ = false;
    bool finished_ = false;
    Decision decision_ = Decision::Pending;
    UpstreamHead head_;
    std::shared_ptr<BodySink> sink_;
    std::atomic<bool> cancelled_{false};

    // Transfer thread only
    std::atomic<int64_t> last_activity_ns_{0};
    uint64_t received_ = 0;
    std::optional<BodyEnd> forced_end_;
    std::string forced_message_;
    std::string error_body_;
};

/// Owns the background transfer threads
class UpstreamForwarder {
public:
    UpstreamForwarder() = default;
    ~UpstreamForwarder();

    UpstreamForwarder(const UpstreamForwarder&) = delete;
    UpstreamForwarder& operator=(const UpstreamForwarder&) = delete;

    [[nodiscard]] std::shared_ptr<UpstreamCall> start(ForwardRequest request);

    /// Cancel every call and wait for their threads to exit
    void shutdown();

    [[nodiscard]] size_t active() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable drained_;
    std::unordered_map<const UpstreamCall*, std::shared_ptr<UpstreamCall>> calls_;
    bool shutting_down_ = false;
};

/// Fully buffered response from a connect or renew handler
struct HandlerResponse {
    HeadOutcome outcome = HeadOutcome::ConnectFailed;
    int status = 0;
    http::HeaderList headers;
    std::string body;
    std::string error;
};

/// Synchronous handler round trip (redirects are not followed)
[[nodiscard]] HandlerResponse call_handler(const ForwardRequest& request,
                                           std::chrono::milliseconds timeout);

/// Caller headers minus hop-by-hop and proxy protocol headers, with Upstream-Authorization
/// remapped to Authorization and Host set to the target authority
[[nodiscard]] http::HeaderList filter_upstream_headers(const http::HeaderList& incoming,
                                                       const http::Url& target);

}  // namespace tether::proxy
