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

// Tether Session Registry - Implementation

#include "registry.hpp"

#include <algorithm>

namespace tether::proxy {

// StreamState

void StreamState::activate(uint32_t recovered_last_id) {
    last_response_id_ = std::max(last_response_id_, recovered_last_id);
    phase_ = StreamPhase::Active;
}

void StreamState::track(uint32_t response_id, std::shared_ptr<Cancellable> call) {
    std::lock_guard lock(calls_mutex_);
    calls_[response_id] = std::move(call);
}

void StreamState::untrack(uint32_t response_id) {
    std::lock_guard lock(calls_mutex_);
    calls_.erase(response_id);
}

bool StreamState::cancel(uint32_t response_id) {
    std::shared_ptr<Cancellable> call;
    {
        std::lock_guard lock(calls_mutex_);
        auto it = calls_.find(response_id);
        if (it == calls_.end()) {
            return false;
        }
        call = it->second;
    }
    // Outside the lock: the call tears itself down through untrack()
    call->cancel();
    return true;
}

bool StreamState::cancel_latest() {
    std::shared_ptr<Cancellable> call;
    {
        std::lock_guard lock(calls_mutex_);
        if (calls_.empty()) {
            return false;
        }
        call = calls_.rbegin()->second;
    }
    call->cancel();
    return true;
}

size_t StreamState::cancel_all() {
    std::vector<std::shared_ptr<Cancellable>> calls;
    {
        std::lock_guard lock(calls_mutex_);
        calls.reserve(calls_.size());
        for (auto& [id, call] : calls_) {
            calls.push_back(call);
        }
    }
    for (auto& call : calls) {
        call->cancel();
    }
    return calls.size();
}

size_t StreamState::in_flight() const {
    std::lock_guard lock(calls_mutex_);
    return calls_.size();
}

void StreamState::set_content_type(std::string content_type) {
    std::lock_guard lock(calls_mutex_);
    content_type_ = std::move(content_type);
}

std::string StreamState::content_type() const {
    std::lock_guard lock(calls_mutex_);
    return content_type_;
}

// InProcessSessionRegistry

StreamStatePtr InProcessSessionRegistry::lookup(std::string_view stream_id) const {
    std::shared_lock lock(mutex_);
    auto it = streams_.find(std::string(stream_id));
    return it == streams_.end() ? nullptr : it->second;
}

StreamStatePtr InProcessSessionRegistry::insert(std::string_view stream_id) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = streams_.try_emplace(std::string(stream_id));
    if (inserted) {
        it->second = std::make_shared<StreamState>(std::string(stream_id));
    }
    return it->second;
}

bool InProcessSessionRegistry::remove(std::string_view stream_id) {
    std::unique_lock lock(mutex_);
    return streams_.erase(std::string(stream_id)) > 0;
}

size_t InProcessSessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return streams_.size();
}

}  // namespace tether::proxy
