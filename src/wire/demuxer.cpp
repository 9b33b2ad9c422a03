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

// Tether Frame Demuxer - Implementation

#include "demuxer.hpp"

#include <algorithm>
#include <vector>

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace tether::wire {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

std::shared_future<ResponsePtr> ready_future(ResponsePtr response) {
    std::promise<ResponsePtr> promise;
    promise.set_value(std::move(response));
    return promise.get_future().share();
}

std::shared_future<ResponsePtr> rejected_future(const std::string& reason) {
    std::promise<ResponsePtr> promise;
    promise.set_exception(std::make_exception_ptr(DemuxerError(reason)));
    return promise.get_future().share();
}

}  // namespace

FrameDemuxer::FrameDemuxer(DemuxerOptions options)
    : options_(options),
      budget_(std::make_shared<BufferBudget>()),
      decoder_(options.max_buffer_bytes) {}

FrameDemuxer::~FrameDemuxer() {
    close();
}

bool FrameDemuxer::push(std::string_view bytes) {
    std::lock_guard lock(mutex_);
    if (terminal_) {
        return false;
    }

    decoder_.feed(bytes);
    while (!terminal_) {
        auto result = decoder_.next();
        if (result.error) {
            terminate_locked(fmt::format("Frame decode error at offset {}: {}",
                                         result.error->offset, result.error->message),
                             true);
            break;
        }
        if (!result.frame) {
            break;
        }
        dispatch_locked(std::move(*result.frame));
    }
    if (terminal_) {
        return false;
    }

    // Partial frame plus unread bytes of claimed bodies
    size_t pending = decoder_.buffered() + budget_->used();
    if (pending > options_.max_buffer_bytes) {
        terminate_locked(fmt::format("Demuxer buffer limit exceeded ({} > {} bytes)", pending,
                                     options_.max_buffer_bytes),
                         true);
        return false;
    }
    return true;
}

void FrameDemuxer::dispatch_locked(Frame&& frame) {
    auto violation = tracker_.apply(frame);
    if (violation != SequenceViolation::None) {
        handle_violation_locked(frame, violation);
        return;
    }

    std::visit(overloaded{
                   [this](StartFrame& f) {
                       auto response = std::make_shared<ProxyResponse>(
                           f.response_id, f.status, std::move(f.headers));
                       active_[f.response_id] = response;
                       unclaimed_[f.response_id] = 0;
                       unclaimed_order_.push_back(f.response_id);
                       if (iterating_) {
                           queue_.push_back(response);
                           queue_cv_.notify_all();
                       }

                       auto waiter = waiters_.find(f.response_id);
                       if (waiter != waiters_.end()) {
                           claim_locked(response);
                           waiter->second.promise.set_value(response);
                           waiters_.erase(waiter);
                       }
                   },
                   [this](DataFrame& f) {
                       size_t size = f.payload.size();
                       active_.at(f.response_id)->body().push(std::move(f.payload));
                       if (auto it = unclaimed_.find(f.response_id); it != unclaimed_.end()) {
                           it->second += size;
                           unclaimed_bytes_ += size;
                           evict_unclaimed_locked();
                       }
                   },
                   [this](CompleteFrame& f) {
                       active_.at(f.response_id)->body().finish(TerminalState::Complete);
                       retire_locked(f.response_id);
                   },
                   [this](AbortFrame& f) {
                       active_.at(f.response_id)
                           ->body()
                           .finish(TerminalState::Aborted, "Response aborted by remote",
                                   std::string("ABORTED"));
                       retire_locked(f.response_id);
                   },
                   [this](ErrorFrame& f) {
                       active_.at(f.response_id)
                           ->body()
                           .finish(TerminalState::Errored, std::move(f.message),
                                   std::move(f.code));
                       retire_locked(f.response_id);
                   },
               },
               frame);
}

void FrameDemuxer::handle_violation_locked(const Frame& frame, SequenceViolation violation) {
    uint32_t id = response_id_of(frame);
    auto type = static_cast<char>(type_of(frame));

    if (options_.policy == DuplicatePolicy::Strict) {
        terminate_locked(fmt::format("Frame sequence violation for response {}: '{}' {}", id,
                                     type, to_string(violation)),
                         true);
        return;
    }

    LOG_WARNING(logging::logger(), "Dropping '{}' frame for response {}: {}", type, id,
                to_string(violation));
}

void FrameDemuxer::retire_locked(uint32_t id) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }
    terminated_[id] = std::move(it->second);
    active_.erase(it);
    terminated_order_.push_back(id);

    while (terminated_order_.size() > options_.retain_terminated) {
        forget_unclaimed_locked(terminated_order_.front());
        terminated_.erase(terminated_order_.front());
        terminated_order_.pop_front();
    }
}

void FrameDemuxer::claim_locked(const ResponsePtr& response) {
    auto it = unclaimed_.find(response->id());
    if (it == unclaimed_.end()) {
        return;
    }
    unclaimed_bytes_ -= it->second;
    unclaimed_.erase(it);
    response->body().charge(budget_);

    while (!unclaimed_order_.empty() && !unclaimed_.contains(unclaimed_order_.front())) {
        unclaimed_order_.pop_front();
    }
}

void FrameDemuxer::forget_unclaimed_locked(uint32_t id) {
    if (auto it = unclaimed_.find(id); it != unclaimed_.end()) {
        unclaimed_bytes_ -= it->second;
        unclaimed_.erase(it);
    }
}

void FrameDemuxer::evict_unclaimed_locked() {
    while (unclaimed_bytes_ > options_.replay_window_bytes && !unclaimed_order_.empty()) {
        uint32_t id = unclaimed_order_.front();
        unclaimed_order_.pop_front();
        auto it = unclaimed_.find(id);
        if (it == unclaimed_.end()) {
            continue;
        }
        size_t bytes = it->second;
        unclaimed_bytes_ -= bytes;
        unclaimed_.erase(it);

        if (auto response = find_locked(id)) {
            response->body().evict(
                fmt::format("Response {} body evicted before it was read", id),
                "REPLAY_EVICTED");
        }
        LOG_DEBUG(logging::logger(), "Evicted {} unclaimed bytes of response {}", bytes, id);
    }
}

ResponsePtr FrameDemuxer::find_locked(uint32_t id) const {
    if (auto it = active_.find(id); it != active_.end()) {
        return it->second;
    }
    if (auto it = terminated_.find(id); it != terminated_.end()) {
        return it->second;
    }
    return nullptr;
}

std::shared_future<ResponsePtr> FrameDemuxer::wait_for_response(uint32_t id) {
    std::lock_guard lock(mutex_);

    if (auto response = find_locked(id)) {
        claim_locked(response);
        return ready_future(std::move(response));
    }
    if (terminal_) {
        return rejected_future(failure_.value_or("Demuxer closed"));
    }
    if (tracker_.state(id) != ResponseState::Absent) {
        return rejected_future(fmt::format("Response {} is no longer retained", id));
    }

    auto [it, inserted] = waiters_.try_emplace(id);
    if (inserted) {
        it->second.future = it->second.promise.get_future().share();
    }
    return it->second.future;
}

std::optional<ResponsePtr> FrameDemuxer::next_response() {
    std::unique_lock lock(mutex_);
    if (!iterating_) {
        iterating_ = true;
        std::vector<ResponsePtr> retained;
        retained.reserve(active_.size() + terminated_.size());
        for (const auto& [id, response] : active_) {
            retained.push_back(response);
        }
        for (const auto& [id, response] : terminated_) {
            retained.push_back(response);
        }
        std::sort(retained.begin(), retained.end(),
                  [](const ResponsePtr& a, const ResponsePtr& b) { return a->id() < b->id(); });
        queue_.insert(queue_.end(), retained.begin(), retained.end());
    }

    queue_cv_.wait(lock, [this] { return !queue_.empty() || terminal_; });

    if (queue_.empty()) {
        return std::nullopt;
    }
    ResponsePtr response = std::move(queue_.front());
    queue_.pop_front();
    claim_locked(response);
    return response;
}

void FrameDemuxer::close() {
    std::lock_guard lock(mutex_);
    terminate_locked("Demuxer closed", false);
}

void FrameDemuxer::error(std::string message) {
    std::lock_guard lock(mutex_);
    terminate_locked(std::move(message), true);
}

void FrameDemuxer::terminate_locked(std::string reason, bool is_error) {
    if (terminal_) {
        return;
    }
    terminal_ = true;

    if (is_error) {
        LOG_ERROR(logging::logger(), "Demuxer failed: {}", reason);
        failure_ = reason;
    }

    for (auto& [id, waiter] : waiters_) {
        waiter.promise.set_exception(std::make_exception_ptr(DemuxerError(reason)));
    }
    waiters_.clear();

    // Bodies that never saw a terminal frame must not block their readers forever
    std::string code = is_error ? "DEMUXER_ERROR" : "SESSION_CLOSED";
    for (auto& [id, response] : active_) {
        response->body().finish(TerminalState::Errored, reason, code);
    }

    queue_cv_.notify_all();
}

bool FrameDemuxer::is_terminal() const {
    std::lock_guard lock(mutex_);
    return terminal_;
}

std::optional<std::string> FrameDemuxer::failure() const {
    std::lock_guard lock(mutex_);
    return failure_;
}

size_t FrameDemuxer::buffered_bytes() const {
    std::lock_guard lock(mutex_);
    return decoder_.buffered() + budget_->used();
}

size_t FrameDemuxer::unclaimed_bytes() const {
    std::lock_guard lock(mutex_);
    return unclaimed_bytes_;
}

}  // namespace tether::wire
