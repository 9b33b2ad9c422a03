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

// Tether Session Registry - Header
// Per-process map of stream ID -> response counter and in-flight upstream calls

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tether::proxy {

/// Something that can be told to stop (an in-flight upstream call)
class Cancellable {
public:
    virtual ~Cancellable() = default;
    virtual void cancel() = 0;
};

enum class StreamPhase : uint8_t {
    Creating,  // Registered, storage not yet ensured or counter not recovered
    Active,
};

/// Mutable per-stream state. `mutex` serializes response ID allocation together with
/// the Start-frame append so Start frames land in the log in ID order.
class StreamState {
public:
    explicit StreamState(std::string stream_id) : stream_id_(std::move(stream_id)) {}

    [[nodiscard]] const std::string& stream_id() const noexcept { return stream_id_; }

    std::mutex& mutex() noexcept { return mutex_; }

    // Require mutex() held
    [[nodiscard]] StreamPhase phase() const noexcept { return phase_; }
    void activate(uint32_t recovered_last_id);
    [[nodiscard]] uint32_t allocate_response_id() noexcept { return ++last_response_id_; }
    [[nodiscard]] uint32_t last_response_id() const noexcept { return last_response_id_; }

    // In-flight tracking (internally synchronized)
    void track(uint32_t response_id, std::shared_ptr<Cancellable> call);
    void untrack(uint32_t response_id);
    /// Cancel one response; false if it is not in flight
    bool cancel(uint32_t response_id);
    /// Cancel the most recently allocated response still in flight
    bool cancel_latest();
    size_t cancel_all();
    [[nodiscard]] size_t in_flight() const;

    void set_content_type(std::string content_type);
    [[nodiscard]] std::string content_type() const;

private:
    std::string stream_id_;
    std::mutex mutex_;
    StreamPhase phase_ = StreamPhase::Creating;
    uint32_t last_response_id_ = 0;

    mutable std::mutex calls_mutex_;
    std::map<uint32_t, std::shared_ptr<Cancellable>> calls_;
    std::string content_type_;
};

using StreamStatePtr = std::shared_ptr<StreamState>;

/// Registry seam; a distributed deployment swaps this out without touching framing
class SessionRegistry {
public:
    virtual ~SessionRegistry() = default;

    [[nodiscard]] virtual StreamStatePtr lookup(std::string_view stream_id) const = 0;

    /// Returns the existing state when one is already registered
    [[nodiscard]] virtual StreamStatePtr insert(std::string_view stream_id) = 0;

    virtual bool remove(std::string_view stream_id) = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

/// Single-process registry
class InProcessSessionRegistry final : public SessionRegistry {
public:
    [[nodiscard]] StreamStatePtr lookup(std::string_view stream_id) const override;
    [[nodiscard]] StreamStatePtr insert(std::string_view stream_id) override;
    bool remove(std::string_view stream_id) override;
    [[nodiscard]] size_t size() const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, StreamStatePtr> streams_;
};

}  // namespace tether::proxy
