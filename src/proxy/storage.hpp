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

// Tether Log Storage - Header
// Client for the append-only log storage service that holds frame bytes

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "../http/url.hpp"

namespace tether::proxy {

/// Outcome of one storage call
struct StorageResult {
    int status = 0;  // HTTP status from storage, 0 = transport failure
    std::string error;
    std::string body;
    std::string next_offset;
    std::string cursor;
    std::string content_type;
    bool up_to_date = false;
    bool closed = false;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
    [[nodiscard]] bool not_found() const noexcept { return status == 404; }
};

struct ReadOptions {
    std::string offset = "-1";  // -1 replays from the start
    bool long_poll = false;
    std::string cursor;
};

/// Append-only byte log per stream ID
class LogStorage {
public:
    virtual ~LogStorage() = default;

    /// Idempotent create
    [[nodiscard]] virtual StorageResult create(std::string_view stream_id,
                                               std::string_view content_type,
                                               uint64_t ttl_seconds) = 0;

    /// Atomic append; next_offset is set on success
    [[nodiscard]] virtual StorageResult append(std::string_view stream_id,
                                               std::string_view bytes) = 0;

    /// Offset read; a long-poll that times out returns ok() with an empty body
    [[nodiscard]] virtual StorageResult read(std::string_view stream_id,
                                             const ReadOptions& options) = 0;

    [[nodiscard]] virtual StorageResult head(std::string_view stream_id) = 0;

    [[nodiscard]] virtual StorageResult remove(std::string_view stream_id) = 0;
};

struct HttpStorageOptions {
    std::string base_url;  // e.g. http://127.0.0.1:4437/v1/stream
    std::chrono::milliseconds timeout{10000};
    std::chrono::milliseconds long_poll_timeout{30000};
};

/// LogStorage over the storage service's HTTP protocol (cpp-httplib)
class HttpLogStorage final : public LogStorage {
public:
    explicit HttpLogStorage(HttpStorageOptions options);

    [[nodiscard]] StorageResult create(std::string_view stream_id, std::string_view content_type,
                                       uint64_t ttl_seconds) override;
    [[nodiscard]] StorageResult append(std::string_view stream_id,
                                       std::string_view bytes) override;
    [[nodiscard]] StorageResult read(std::string_view stream_id,
                                     const ReadOptions& options) override;
    [[nodiscard]] StorageResult head(std::string_view stream_id) override;
    [[nodiscard]] StorageResult remove(std::string_view stream_id) override;

    [[nodiscard]] bool valid() const noexcept { return valid_; }

private:
    [[nodiscard]] std::string stream_path(std::string_view stream_id) const;

    HttpStorageOptions options_;
    http::Url base_;
    std::string base_path_;
    bool valid_ = false;
};

}  // namespace tether::proxy
