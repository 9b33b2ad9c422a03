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

// Tether Request Store - Implementation

#include "request_store.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../core/logging.hpp"

namespace tether::client {

std::string mapping_key(std::string_view prefix, std::string_view proxy_url,
                        std::string_view request_id, std::string_view session_id) {
    if (session_id.empty()) {
        return fmt::format("{}{}:{}", prefix, proxy_url, request_id);
    }
    return fmt::format("{}{}:{}:{}", prefix, proxy_url, session_id, request_id);
}

// MemoryRequestStore

std::optional<RequestMapping> MemoryRequestStore::load(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryRequestStore::save(const std::string& key, const RequestMapping& mapping) {
    std::lock_guard lock(mutex_);
    entries_[key] = mapping;
}

void MemoryRequestStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    entries_.erase(key);
}

// FileRequestStore

FileRequestStore::FileRequestStore(std::filesystem::path path) : path_(std::move(path)) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (buffer.str().empty()) {
        return;
    }

    try {
        auto j = nlohmann::json::parse(buffer.str());
        for (const auto& [key, value] : j.items()) {
            RequestMapping mapping;
            mapping.response_id = value.at("responseId").get<uint32_t>();
            mapping.stream_url = value.value("streamUrl", std::string());
            entries_.emplace(key, std::move(mapping));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(
            fmt::format("Cannot parse request store {}: {}", path_.string(), e.what()));
    }
}

std::optional<RequestMapping> FileRequestStore::load(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileRequestStore::save(const std::string& key, const RequestMapping& mapping) {
    std::lock_guard lock(mutex_);
    entries_[key] = mapping;
    flush_locked();
}

void FileRequestStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (entries_.erase(key) > 0) {
        flush_locked();
    }
}

void FileRequestStore::flush_locked() {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, mapping] : entries_) {
        nlohmann::json entry = {{"responseId", mapping.response_id}};
        if (!mapping.stream_url.empty()) {
            entry["streamUrl"] = mapping.stream_url;
        }
        j[key] = std::move(entry);
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("Cannot write {}", tmp.string()));
        }
        file << j.dump(2);
        if (!file.good()) {
            throw std::runtime_error(fmt::format("Short write to {}", tmp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        throw std::runtime_error(
            fmt::format("Cannot replace {}: {}", path_.string(), ec.message()));
    }
    LOG_DEBUG(logging::logger(), "Request store {} rewritten ({} entries)", path_.string(),
              entries_.size());
}

}  // namespace tether::client
