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

// Tether Demultiplexed Responses - Implementation

#include "response.hpp"

namespace tether::wire {

std::string_view to_string(TerminalState state) noexcept {
    switch (state) {
        case TerminalState::None:
            return "none";
        case TerminalState::Complete:
            return "complete";
        case TerminalState::Aborted:
            return "aborted";
        case TerminalState::Errored:
            return "errored";
    }
    return "none";
}

// ============================================================================
// ResponseBody
// ============================================================================

ResponseBody::~ResponseBody() {
    // Unread bytes no longer count against the shared budget
    if (budget_ && queued_bytes_ > 0) {
        budget_->release(queued_bytes_);
    }
}

void ResponseBody::push(std::string chunk) {
    if (chunk.empty()) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        if (state_ != TerminalState::None) {
            return;
        }
        queued_bytes_ += chunk.size();
        if (budget_) {
            budget_->add(chunk.size());
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_all();
}

void ResponseBody::finish(TerminalState state, std::string message,
                          std::optional<std::string> code) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != TerminalState::None) {
            return;
        }
        state_ = state;
        error_message_ = std::move(message);
        error_code_ = std::move(code);
    }
    cv_.notify_all();
}

void ResponseBody::charge(std::shared_ptr<BufferBudget> budget) {
    std::lock_guard lock(mutex_);
    if (budget_ || !budget) {
        return;
    }
    budget_ = std::move(budget);
    budget_->add(queued_bytes_);
}

void ResponseBody::evict(std::string message, std::string code) {
    {
        std::lock_guard lock(mutex_);
        if (budget_) {
            budget_->release(queued_bytes_);
        }
        chunks_.clear();
        queued_bytes_ = 0;
        state_ = TerminalState::Errored;
        error_message_ = std::move(message);
        error_code_ = std::move(code);
    }
    cv_.notify_all();
}

size_t ResponseBody::queued_bytes() const {
    std::lock_guard lock(mutex_);
    return queued_bytes_;
}

std::optional<std::string> ResponseBody::take_locked() {
    if (!chunks_.empty()) {
        std::string chunk = std::move(chunks_.front());
        chunks_.pop_front();
        queued_bytes_ -= chunk.size();
        if (budget_) {
            budget_->release(chunk.size());
        }
        return chunk;
    }

    switch (state_) {
        case TerminalState::Complete:
            return std::nullopt;
        case TerminalState::Aborted:
            throw StreamError(error_message_.empty() ? "Response aborted by remote"
                                                     : error_message_,
                              error_code_, TerminalState::Aborted);
        case TerminalState::Errored:
            throw StreamError(error_message_, error_code_, TerminalState::Errored);
        case TerminalState::None:
            break;
    }
    return std::nullopt;
}

std::optional<std::string> ResponseBody::read() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !chunks_.empty() || state_ != TerminalState::None; });
    return take_locked();
}

std::optional<std::string> ResponseBody::read_for(std::chrono::milliseconds timeout,
                                                  bool& timed_out) {
    std::unique_lock lock(mutex_);
    timed_out = !cv_.wait_for(
        lock, timeout, [this] { return !chunks_.empty() || state_ != TerminalState::None; });
    if (timed_out) {
        return std::nullopt;
    }
    return take_locked();
}

std::string ResponseBody::read_all() {
    std::string out;
    while (auto chunk = read()) {
        out += *chunk;
    }
    return out;
}

TerminalState ResponseBody::wait_terminal() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return state_ != TerminalState::None; });
    return state_;
}

TerminalState ResponseBody::terminal_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

// ============================================================================
// ProxyResponse
// ============================================================================

ProxyResponse::ProxyResponse(uint32_t id, int status, http::HeaderList headers)
    : id_(id), status_(status), headers_(std::move(headers)) {}

std::optional<std::string> ProxyResponse::header(std::string_view name) const {
    return http::find_header(headers_, name);
}

}  // namespace tether::wire
