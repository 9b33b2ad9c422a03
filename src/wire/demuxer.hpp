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

// Tether Frame Demuxer - Header
// Reconstructs logical responses from an interleaved frame byte stream

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include "frame.hpp"
#include "response.hpp"

namespace tether::wire {

/// What to do with a frame that breaks the per-response ordering contract
enum class DuplicatePolicy : uint8_t {
    Tolerate,  // Drop it (replay after resumption re-delivers old frames)
    Strict,    // Fatal demuxer error
};

struct DemuxerOptions {
    size_t max_buffer_bytes = 4 * 1024 * 1024;  // Undecoded + unread bytes of claimed bodies
    DuplicatePolicy policy = DuplicatePolicy::Tolerate;
    size_t retain_terminated = 256;  // Terminated responses kept for late waiters
    // Body bytes held for responses nobody has asked for yet. Past this the
    // oldest unclaimed bodies are evicted instead of failing the demuxer.
    size_t replay_window_bytes = 4 * 1024 * 1024;
};

/// Rejection delivered to waiters once the demuxer is terminal
class DemuxerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FrameDemuxer {
public:
    explicit FrameDemuxer(DemuxerOptions options = {});
    ~FrameDemuxer();

    FrameDemuxer(const FrameDemuxer&) = delete;
    FrameDemuxer& operator=(const FrameDemuxer&) = delete;

    /// Feed raw log bytes. Returns false once the demuxer is terminal.
    bool push(std::string_view bytes);

    /// Resolves when response `id` has started (or already terminated);
    /// carries DemuxerError if the demuxer closes first. Claims the response.
    [[nodiscard]] std::shared_future<ResponsePtr> wait_for_response(uint32_t id);

    /// Next started response in log order. Blocks; nullopt once the demuxer
    /// is terminal and every queued response has been handed out.
    /// The first call queues the responses still retained; responses started
    /// before any call are otherwise not queued.
    [[nodiscard]] std::optional<ResponsePtr> next_response();

    /// Clean shutdown: pending waiters and unfinished bodies are rejected
    void close();

    /// Fatal shutdown with a reason
    void error(std::string message);

    [[nodiscard]] bool is_terminal() const;

    /// Reason for a fatal error, if any
    [[nodiscard]] std::optional<std::string> failure() const;

    [[nodiscard]] size_t buffered_bytes() const;

    /// Body bytes held for unclaimed responses
    [[nodiscard]] size_t unclaimed_bytes() const;

private:
    struct Waiter {
        std::promise<ResponsePtr> promise;
        std::shared_future<ResponsePtr> future;
    };

    void dispatch_locked(Frame&& frame);
    void handle_violation_locked(const Frame& frame, SequenceViolation violation);
    void retire_locked(uint32_t id);
    void claim_locked(const ResponsePtr& response);
    void forget_unclaimed_locked(uint32_t id);
    void evict_unclaimed_locked();
    void terminate_locked(std::string reason, bool is_error);
    [[nodiscard]] ResponsePtr find_locked(uint32_t id) const;

    DemuxerOptions options_;
    std::shared_ptr<BufferBudget> budget_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;

    FrameDecoder decoder_;
    SequenceTracker tracker_;
    std::unordered_map<uint32_t, ResponsePtr> active_;
    std::unordered_map<uint32_t, ResponsePtr> terminated_;
    std::deque<uint32_t> terminated_order_;
    std::unordered_map<uint32_t, Waiter> waiters_;
    std::deque<ResponsePtr> queue_;
    bool iterating_ = false;

    std::unordered_map<uint32_t, size_t> unclaimed_;  // Response ID -> body bytes
    std::deque<uint32_t> unclaimed_order_;
    size_t unclaimed_bytes_ = 0;

    bool terminal_ = false;
    std::optional<std::string> failure_;
};

}  // namespace tether::wire
