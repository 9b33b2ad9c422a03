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

// Tether Upstream Forwarder - Implementation

#include "forwarder.hpp"

#include <httplib.h>

#include <array>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace tether::proxy {

namespace {

// Request headers the proxy consumes itself
constexpr std::array<std::string_view, 5> kProtocolHeaders = {
    http::header::kUpstreamUrl, http::header::kUpstreamMethod,
    http::header::kUpstreamAuthorization, http::header::kUseStreamUrl,
    http::header::kSignedUrlTtl};

bool is_protocol_header(std::string_view name) {
    for (auto protocol : kProtocolHeaders) {
        if (http::header_name_equals(name, protocol)) {
            return true;
        }
    }
    return false;
}

int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

httplib::Request make_request(const ForwardRequest& request) {
    httplib::Request req;
    req.method = request.method;
    req.path = request.url.path_and_query();
    for (const auto& [name, value] : request.headers) {
        req.headers.emplace(name, value);
    }
    req.body = request.body;
    return req;
}

http::HeaderList to_header_list(const httplib::Headers& headers) {
    http::HeaderList list;
    list.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        list.emplace_back(name, value);
    }
    return list;
}

}  // namespace

std::string_view to_string(BodyEnd end) noexcept {
    switch (end) {
        case BodyEnd::Complete:
            return "complete";
        case BodyEnd::Aborted:
            return "aborted";
        case BodyEnd::TooLarge:
            return "too_large";
        case BodyEnd::IdleTimeout:
            return "idle_timeout";
        case BodyEnd::Failed:
            return "failed";
    }
    return "unknown";
}

http::HeaderList filter_upstream_headers(const http::HeaderList& incoming,
                                         const http::Url& target) {
    http::HeaderList out;
    out.reserve(incoming.size() + 2);

    std::optional<std::string> upstream_auth;
    for (const auto& [name, value] : incoming) {
        if (http::header_name_equals(name, http::header::kUpstreamAuthorization)) {
            upstream_auth = value;
            continue;
        }
        if (http::is_hop_by_hop(name) || is_protocol_header(name)) {
            continue;
        }
        out.emplace_back(name, value);
    }

    if (upstream_auth) {
        out.emplace_back("Authorization", *upstream_auth);
    }
    out.emplace_back("Host", target.authority());
    return out;
}

// UpstreamCall

UpstreamCall::UpstreamCall(ForwardRequest request) : request_(std::move(request)) {}

void UpstreamCall::touch() noexcept {
    last_activity_ns_.store(now_ns());
}

void UpstreamCall::run() {
    httplib::Client client(request_.url.origin());
    client.set_connection_timeout(request_.connect_timeout);
    client.set_read_timeout(request_.idle_timeout);
    client.set_write_timeout(request_.connect_timeout);
    client.set_follow_location(false);

    {
        std::lock_guard lock(mutex_);
        if (cancelled_.load() || head_ready_) {
            finished_ = true;
            cv_.notify_all();
            return;
        }
        client_ = &client;
    }

    auto req = make_request(request_);
    req.response_handler = [this](const httplib::Response& response) {
        return on_head(response);
    };
    req.content_receiver = [this](const char* data, size_t length, uint64_t /*offset*/,
                                  uint64_t /*total*/) {
        return on_body(std::string_view(data, length));
    };

    touch();
    auto result = client.send(req);

    {
        std::lock_guard lock(mutex_);
        client_ = nullptr;
    }
    finish(result);
}

void UpstreamCall::finish_without_transfer() {
    std::lock_guard lock(mutex_);
    if (!head_ready_) {
        head_ready_ = true;
        head_.outcome = HeadOutcome::Cancelled;
        head_.error = "forwarder is shutting down";
    }
    finished_ = true;
    cv_.notify_all();
}

bool UpstreamCall::on_head(const httplib::Response& response) {
    std::unique_lock lock(mutex_);
    if (head_ready_) {
        return false;  // Timed out or cancelled while connecting
    }

    head_ready_ = true;
    head_.outcome = HeadOutcome::Received;
    head_.status = response.status;
    head_.headers = to_header_list(response.headers);
    cv_.notify_all();

    cv_.wait(lock, [this] { return decision_ != Decision::Pending; });
    touch();
    return decision_ == Decision::Commit || decision_ == Decision::CollectError;
}

bool UpstreamCall::on_body(std::string_view chunk) {
    touch();
    if (cancelled_.load()) {
        return false;
    }

    // decision_ was fixed before on_head() returned on this thread
    if (decision_ == Decision::CollectError) {
        std::lock_guard lock(mutex_);
        size_t room = request_.max_error_body_bytes - error_body_.size();
        error_body_.append(chunk.substr(0, room));
        return error_body_.size() < request_.max_error_body_bytes;
    }

    received_ += chunk.size();
    if (received_ > request_.max_response_bytes) {
        forced_end_ = BodyEnd::TooLarge;
        forced_message_ = fmt::format("Response exceeded {} bytes", request_.max_response_bytes);
        return false;
    }

    if (!sink_->on_data(chunk)) {
        forced_end_ = BodyEnd::Failed;
        forced_message_ = "Failed to persist response data";
        return false;
    }
    return true;
}

void UpstreamCall::finish(const httplib::Result& result) {
    std::shared_ptr<BodySink> sink;
    BodyEnd end = BodyEnd::Complete;
    std::string message;

    {
        std::lock_guard lock(mutex_);
        if (!head_ready_) {
            head_ready_ = true;
            head_.outcome = cancelled_.load() ? HeadOutcome::Cancelled : HeadOutcome::ConnectFailed;
            head_.error = httplib::to_string(result.error());
        }
        finished_ = true;
        cv_.notify_all();

        if (decision_ != Decision::Commit) {
            return;
        }
        sink = sink_;

        if (cancelled_.load()) {
            end = BodyEnd::Aborted;
            message = "Response aborted";
        } else if (forced_end_) {
            end = *forced_end_;
            message = forced_message_;
        } else if (!result) {
            auto idle = std::chrono::nanoseconds(now_ns() - last_activity_ns_.load());
            if (idle >= request_.idle_timeout * 9 / 10) {
                end = BodyEnd::IdleTimeout;
                message = "Idle timeout exceeded";
            } else {
                end = BodyEnd::Failed;
                message = httplib::to_string(result.error());
            }
        }
    }

    sink->on_end(end, message);
}

UpstreamHead UpstreamCall::await_head(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return head_ready_; })) {
        head_ready_ = true;
        head_.outcome = HeadOutcome::TimedOut;
        head_.error = "Upstream did not respond in time";
        decision_ = Decision::Reject;
        if (client_ != nullptr) {
            client_->stop();
        }
        cv_.notify_all();
    }
    return head_;
}

void UpstreamCall::commit(std::shared_ptr<BodySink> sink) {
    {
        std::lock_guard lock(mutex_);
        sink_ = sink;
        if (decision_ == Decision::Pending && !cancelled_.load()) {
            decision_ = Decision::Commit;
            cv_.notify_all();
            return;
        }
        decision_ = Decision::Reject;
        cv_.notify_all();
    }
    sink->on_end(BodyEnd::Aborted, "Response aborted");
}

std::string UpstreamCall::collect_error_body(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (decision_ == Decision::Pending) {
        decision_ = Decision::CollectError;
        cv_.notify_all();
    }
    if (!cv_.wait_for(lock, timeout, [this] { return finished_; })) {
        LOG_WARNING(logging::logger(),
                    "Upstream error body not finished after {}ms, keeping {} bytes",
                    timeout.count(), error_body_.size());
        cancelled_.store(true);
        if (client_ != nullptr) {
            client_->stop();
        }
    }
    return error_body_;
}

void UpstreamCall::reject() {
    std::lock_guard lock(mutex_);
    if (decision_ == Decision::Pending) {
        decision_ = Decision::Reject;
        cv_.notify_all();
    }
}

void UpstreamCall::cancel() {
    std::lock_guard lock(mutex_);
    cancelled_.store(true);
    if (!head_ready_) {
        head_ready_ = true;
        head_.outcome = HeadOutcome::Cancelled;
        head_.error = "Request cancelled";
    }
    if (decision_ == Decision::Pending) {
        decision_ = Decision::Reject;
    }
    if (client_ != nullptr) {
        client_->stop();
    }
    cv_.notify_all();
}

void UpstreamCall::wait_finished() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return finished_; });
}

// UpstreamForwarder

UpstreamForwarder::~UpstreamForwarder() {
    shutdown();
}

std::shared_ptr<UpstreamCall> UpstreamForwarder::start(ForwardRequest request) {
    auto call = std::make_shared<UpstreamCall>(std::move(request));
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) {
            call->finish_without_transfer();
            return call;
        }
        calls_.emplace(call.get(), call);
    }

    std::thread([this, call] {
        call->run();

        std::lock_guard lock(mutex_);
        calls_.erase(call.get());
        drained_.notify_all();
    }).detach();

    return call;
}

void UpstreamForwarder::shutdown() {
    std::vector<std::shared_ptr<UpstreamCall>> calls;
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
        for (const auto& [key, call] : calls_) {
            calls.push_back(call);
        }
    }

    if (!calls.empty()) {
        LOG_INFO(logging::logger(), "Cancelling {} in-flight upstream calls", calls.size());
    }
    for (auto& call : calls) {
        call->cancel();
    }

    std::unique_lock lock(mutex_);
    drained_.wait(lock, [this] { return calls_.empty(); });
}

size_t UpstreamForwarder::active() const {
    std::lock_guard lock(mutex_);
    return calls_.size();
}

// Handler round trip

HandlerResponse call_handler(const ForwardRequest& request, std::chrono::milliseconds timeout) {
    httplib::Client client(request.url.origin());
    client.set_connection_timeout(request.connect_timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_follow_location(false);

    auto started = std::chrono::steady_clock::now();
    auto result = client.send(make_request(request));

    HandlerResponse response;
    if (!result) {
        auto elapsed = std::chrono::steady_clock::now() - started;
        response.outcome = elapsed >= timeout * 9 / 10 ? HeadOutcome::TimedOut
                                                       : HeadOutcome::ConnectFailed;
        response.error = httplib::to_string(result.error());
        return response;
    }

    response.outcome = HeadOutcome::Received;
    response.status = result->status;
    response.headers = to_header_list(result->headers);
    response.body = result->body;
    return response;
}

}  // namespace tether::proxy
