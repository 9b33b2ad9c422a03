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

// Tether Log Storage - Implementation

#include "storage.hpp"

#include <httplib.h>

#include <fmt/format.h>

namespace tether::proxy {

namespace {

void set_timeouts(httplib::Client& client, std::chrono::milliseconds connect,
                  std::chrono::milliseconds read) {
    client.set_connection_timeout(connect);
    client.set_read_timeout(read);
    client.set_write_timeout(connect);
}

StorageResult to_result(const httplib::Result& res, std::string_view operation) {
    StorageResult result;
    if (!res) {
        result.error = fmt::format("storage {} failed: {}", operation,
                                   httplib::to_string(res.error()));
        return result;
    }

    result.status = res->status;
    result.body = res->body;
    result.next_offset = res->get_header_value("Stream-Next-Offset");
    result.cursor = res->get_header_value("Stream-Cursor");
    result.content_type = res->get_header_value("Content-Type");
    result.up_to_date = res->get_header_value("Stream-Up-To-Date") == "true";
    result.closed = res->get_header_value("Stream-Closed") == "true";

    if (!result.ok()) {
        result.error = fmt::format("storage {} returned {}", operation, res->status);
        if (!res->body.empty()) {
            result.error += fmt::format(": {}", res->body.substr(0, 256));
        }
    }
    return result;
}

}  // namespace

HttpLogStorage::HttpLogStorage(HttpStorageOptions options) : options_(std::move(options)) {
    auto parsed = http::parse_url(options_.base_url);
    if (parsed && (parsed->scheme == "http" || parsed->scheme == "https")) {
        base_ = std::move(*parsed);
        base_path_ = base_.path;
        while (!base_path_.empty() && base_path_.back() == '/') {
            base_path_.pop_back();
        }
        valid_ = true;
    }
}

std::string HttpLogStorage::stream_path(std::string_view stream_id) const {
    return fmt::format("{}/{}", base_path_, http::url::encode(stream_id));
}

StorageResult HttpLogStorage::create(std::string_view stream_id, std::string_view content_type,
                                     uint64_t ttl_seconds) {
    httplib::Client client(base_.origin());
    set_timeouts(client, options_.timeout, options_.timeout);

    httplib::Headers headers = {{"Stream-TTL", std::to_string(ttl_seconds)}};
    auto res = client.Put(stream_path(stream_id), headers, std::string(), std::string(content_type));
    return to_result(res, "create");
}

StorageResult HttpLogStorage::append(std::string_view stream_id, std::string_view bytes) {
    httplib::Client client(base_.origin());
    set_timeouts(client, options_.timeout, options_.timeout);

    auto res = client.Post(stream_path(stream_id), httplib::Headers{}, bytes.data(), bytes.size(),
                           "application/octet-stream");
    return to_result(res, "append");
}

StorageResult HttpLogStorage::read(std::string_view stream_id, const ReadOptions& options) {
    httplib::Client client(base_.origin());
    auto read_timeout =
        options.long_poll ? options_.long_poll_timeout + options_.timeout : options_.timeout;
    set_timeouts(client, options_.timeout, read_timeout);

    http::QueryParams query = {{"offset", options.offset}};
    if (options.long_poll) {
        query.emplace_back("live", "long-poll");
    }
    if (!options.cursor.empty()) {
        query.emplace_back("cursor", options.cursor);
    }

    auto res = client.Get(fmt::format("{}?{}", stream_path(stream_id), http::build_query(query)));
    auto result = to_result(res, "read");

    // Long-poll timeout: nothing new, caller is up to date
    if (result.status == 204) {
        result.up_to_date = true;
        if (result.next_offset.empty()) {
            result.next_offset = options.offset;
        }
    }
    return result;
}

StorageResult HttpLogStorage::head(std::string_view stream_id) {
    httplib::Client client(base_.origin());
    set_timeouts(client, options_.timeout, options_.timeout);
    return to_result(client.Head(stream_path(stream_id)), "head");
}

StorageResult HttpLogStorage::remove(std::string_view stream_id) {
    httplib::Client client(base_.origin());
    set_timeouts(client, options_.timeout, options_.timeout);
    return to_result(client.Delete(stream_path(stream_id)), "delete");
}

}  // namespace tether::proxy
