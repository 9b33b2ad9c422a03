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

// Tether Request Store - Header
// Persists requestId -> (response ID, stream URL) so a retried request resumes
// the response it already started instead of calling the upstream again

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tether::client {

struct RequestMapping {
    uint32_t response_id = 0;
    std::string stream_url;  // Empty for session mappings (the session owns the URL)
};

class RequestStore {
public:
    virtual ~RequestStore() = default;

    [[nodiscard]] virtual std::optional<RequestMapping> load(const std::string& key) = 0;
    virtual void save(const std::string& key, const RequestMapping& mapping) = 0;
    virtual void remove(const std::string& key) = 0;
};

/// "{prefix}{proxy_url}:[{session_id}:]{request_id}"
[[nodiscard]] std::string mapping_key(std::string_view prefix, std::string_view proxy_url,
                                      std::string_view request_id,
                                      std::string_view session_id = {});

class MemoryRequestStore final : public RequestStore {
public:
    [[nodiscard]] std::optional<RequestMapping> load(const std::string& key) override;
    void save(const std::string& key, const RequestMapping& mapping) override;
    void remove(const std::string& key) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, RequestMapping> entries_;
};

/// JSON object on disk, rewritten atomically (temp file + rename) on every change
class FileRequestStore final : public RequestStore {
public:
    /// Throws std::runtime_error if an existing file cannot be parsed
    explicit FileRequestStore(std::filesystem::path path);

    [[nodiscard]] std::optional<RequestMapping> load(const std::string& key) override;
    void save(const std::string& key, const RequestMapping& mapping) override;
    void remove(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void flush_locked();

    std::filesystem::path path_;
    std::mutex mutex_;
    std::unordered_map<std::string, RequestMapping> entries_;
};

}  // namespace tether::client
