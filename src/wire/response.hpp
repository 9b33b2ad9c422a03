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

// Tether Demultiplexed Responses - Header
// Push-driven response bodies reconstructed from frames

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "frame.hpp"

namespace tether::wire {

enum class TerminalState : uint8_t { None, Complete, Aborted, Errored };

[[nodiscard]] std::string_view to_string(TerminalState state) noexcept;

/// Thrown by body reads when a response ended with Abort or Error
class StreamError : public std::runtime_error {
public:
    StreamError(std::string message, std::optional<std::string> code, TerminalState state)
        : std::runtime_error(std::move(message)), code_(std::move(code)), state_(state) {}

    [[nodiscard]] const std::optional<std::string>& code() const noexcept { return code_; }
    [[nodiscard]] TerminalState state() const noexcept { return state_; }

private:
    std::optional<std::string> code_;
    TerminalState state_;
};

/// Byte accounting shared by every body of one demuxer
class BufferBudget {
public:
    void add(size_t bytes) noexcept { used_.fetch_add(bytes, std::memory_order_relaxed); }
    void release(size_t bytes) noexcept { used_.fetch_sub(bytes, std::memory_order_relaxed); }
    [[nodiscard]] size_t used() const noexcept { return used_.load(std::memory_order_relaxed); }

private:
    std::atomic<size_t> used_{0};
};

/// Single-producer byte channel. The demuxer pushes, any thread reads.
/// Bytes count against a budget only once a consumer has claimed the body.
class ResponseBody {
public:
    ResponseBody() = default;
    ~ResponseBody();

    ResponseBody(const ResponseBody&) = delete;
    ResponseBody& operator=(const ResponseBody&) = delete;

    // Producer side
    void push(std::string chunk);
    void finish(TerminalState state, std::string message = {},
                std::optional<std::string> code = std::nullopt);

    /// Charge queued and future bytes to `budget`. Later calls are no-ops.
    void charge(std::shared_ptr<BufferBudget> budget);

    /// Drop queued bytes and end the body as Errored, even if it had completed
    void evict(std::string message, std::string code);

    [[nodiscard]] size_t queued_bytes() const;

    /// Next chunk; nullopt once the body completed cleanly.
    /// Throws StreamError if it ended aborted or errored.
    [[nodiscard]] std::optional<std::string> read();

    /// As read(), giving up after `timeout`; `timed_out` reports which happened
    [[nodiscard]] std::optional<std::string> read_for(std::chrono::milliseconds timeout,
                                                      bool& timed_out);

    /// Drain everything (blocks until terminal)
    [[nodiscard]] std::string read_all();

    /// Block until the body is terminal, without consuming data
    TerminalState wait_terminal();

    [[nodiscard]] TerminalState terminal_state() const;

private:
    // Caller holds mutex_
    std::optional<std::string> take_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    TerminalState state_ = TerminalState::None;
    std::string error_message_;
    std::optional<std::string> error_code_;
    std::shared_ptr<BufferBudget> budget_;
    size_t queued_bytes_ = 0;
};

/// One logical upstream response carried on a stream
class ProxyResponse {
public:
    ProxyResponse(uint32_t id, int status, http::HeaderList headers);

    [[nodiscard]] uint32_t id() const noexcept { return id_; }
    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] bool ok() const noexcept { return http::is_success(status_); }
    [[nodiscard]] const http::HeaderList& headers() const noexcept { return headers_; }
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    [[nodiscard]] ResponseBody& body() noexcept { return body_; }

    /// Whole body as a string; throws StreamError on abort/error
    [[nodiscard]] std::string text() { return body_.read_all(); }

    [[nodiscard]] TerminalState terminal_state() const { return body_.terminal_state(); }

private:
    uint32_t id_;
    int status_;
    http::HeaderList headers_;
    ResponseBody body_;
};

using ResponsePtr = std::shared_ptr<ProxyResponse>;

}  // namespace tether::wire
