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

// Tether Durable Session - Implementation

#include "durable_session.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../http/url.hpp"
#include "errors.hpp"
#include "transport.hpp"

namespace tether::client {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};

std::string trim_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::optional<uint32_t> parse_response_id(std::string_view value) {
    uint32_t id = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), id);
    if (ec != std::errc() || ptr != value.data() + value.size() || id == 0) {
        return std::nullopt;
    }
    return id;
}

}  // namespace

DurableSession::DurableSession(SessionOptions options)
    : options_(std::move(options)),
      proxy_url_(trim_trailing_slashes(options_.proxy_url)),
      reader_(options_.reader),
      demuxer_(options_.demuxer) {
    if (!options_.store) {
        options_.store = std::make_shared<MemoryRequestStore>();
    }
}

DurableSession::~DurableSession() {
    close();
}

// ============================================================================
// Connect
// ============================================================================

void DurableSession::connect() {
    std::promise<void> promise;
    std::shared_future<void> attempt;
    bool owner = false;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            throw ProxyError(std::string(code::kSessionClosed), "Session is closed");
        }
        if (connecting_) {
            attempt = *connecting_;
        } else {
            attempt = promise.get_future().share();
            connecting_ = attempt;
            owner = true;
        }
    }

    if (owner) {
        try {
            do_connect();
            promise.set_value();
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        std::lock_guard lock(mutex_);
        connecting_.reset();
    }

    attempt.get();
}

void DurableSession::do_connect() {
    auto url = with_params(
        fmt::format("{}/{}", proxy_url_, http::url::encode(options_.session_id)),
        {{"action", "connect"}, {"secret", options_.service_secret}});

    TransportRequest request;
    request.method = "POST";
    request.url = std::move(url);
    request.read_timeout = options_.request_timeout;
    request.connect_timeout = options_.reader.connect_timeout;
    request.headers.emplace_back("Session-Id", options_.session_id);
    if (options_.connect_url) {
        request.headers.emplace_back("Upstream-URL", *options_.connect_url);
    }
    if (options_.signed_url_ttl) {
        request.headers.emplace_back("Stream-Signed-URL-TTL",
                                     std::to_string(*options_.signed_url_ttl));
    }

    auto response = perform(request);
    throw_on_failure(response, "Session connect failed");

    auto location = response.header("Location");
    if (!location || location->empty()) {
        throw ProxyError(std::string(code::kProtocolError), "Connect response missing Location");
    }

    std::lock_guard lock(mutex_);
    stream_url_ = resolve_location(proxy_url_, *location);
    stream_id_ = response.header("Stream-Id").value_or(options_.session_id);
    LOG_INFO(logging::logger(), "Session {} connected to stream {}", options_.session_id,
             *stream_id_);
}

void DurableSession::ensure_connected() {
    if (!stream_url()) {
        connect();
    }
}

// ============================================================================
// Reader
// ============================================================================

void DurableSession::ensure_reader() {
    std::lock_guard lock(mutex_);
    if (closed_ || read_thread_.joinable() || !stream_url_) {
        return;
    }
    read_thread_ = std::jthread([this](std::stop_token stop) { read_loop(stop); });
}

void DurableSession::read_loop(std::stop_token stop) {
    ReadPosition position;
    int storage_failures = 0;
    auto push = [this](std::string_view bytes) { demuxer_.push(bytes); };

    while (!stop.stop_requested()) {
        auto url = stream_url();
        if (!url) {
            break;
        }

        try {
            if (!reader_.read(*url, position, push, stop)) {
                break;
            }
            storage_failures = 0;
            if (demuxer_.is_terminal()) {
                break;
            }
            if (position.up_to_date && !sleep_for(options_.poll_backoff, stop)) {
                break;
            }
        } catch (const ProxyError& e) {
            if (stop.stop_requested()) {
                break;
            }

            if (e.renewable()) {
                LOG_INFO(logging::logger(), "Stream URL for session {} expired, reconnecting",
                         options_.session_id);
                try {
                    connect();
                } catch (const ProxyError& reconnect_error) {
                    demuxer_.error(reconnect_error.what());
                    break;
                }
                continue;
            }

            if (e.code() == code::kStorageError && storage_failures < options_.storage_retries) {
                ++storage_failures;
                auto delay = std::min(options_.retry_base * (1 << (storage_failures - 1)),
                                      options_.retry_cap);
                LOG_WARNING(logging::logger(), "Read for session {} failed ({}), retry {} in {}ms",
                            options_.session_id, e.what(), storage_failures, delay.count());
                if (!sleep_for(delay, stop)) {
                    break;
                }
                continue;
            }

            TETHER_LOG_ERROR_CTX(logging::logger(), "Session read failed", options_.session_id,
                                 e.code(), e.what());
            demuxer_.error(e.what());
            break;
        }
    }
}

bool DurableSession::sleep_for(std::chrono::milliseconds duration, std::stop_token stop) {
    std::unique_lock lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

wire::ResponsePtr DurableSession::wait_for(uint32_t response_id, std::stop_token stop) {
    auto future = demuxer_.wait_for_response(response_id);
    while (future.wait_for(kWaitSlice) != std::future_status::ready) {
        if (stop.stop_requested()) {
            throw Cancelled();
        }
    }
    return future.get();
}

// ============================================================================
// Fetch / abort
// ============================================================================

std::string DurableSession::request_key(const std::string& request_id) const {
    return mapping_key(options_.store_prefix, proxy_url_, request_id, options_.session_id);
}

wire::ResponsePtr DurableSession::fetch(const std::string& upstream_url, FetchOptions options) {
    if (closed()) {
        throw ProxyError(std::string(code::kSessionClosed), "Session is closed");
    }
    ensure_connected();

    if (options.request_id) {
        if (auto existing = options_.store->load(request_key(*options.request_id))) {
            LOG_DEBUG(logging::logger(), "Request {} resumes response {}", *options.request_id,
                      existing->response_id);
            ensure_reader();
            return wait_for(existing->response_id, options.stop);
        }
    }

    auto current_url = stream_url();
    if (!current_url) {
        throw ProxyError(std::string(code::kSessionClosed), "Session has no stream URL");
    }

    TransportRequest request;
    request.method = "POST";
    request.url = with_params(proxy_url_, {{"secret", options_.service_secret}});
    request.read_timeout = options_.request_timeout;
    request.connect_timeout = options_.reader.connect_timeout;
    request.body = std::move(options.body);
    request.headers.emplace_back("Upstream-URL", upstream_url);
    request.headers.emplace_back("Upstream-Method", options.method);
    request.headers.emplace_back("Use-Stream-URL", *current_url);
    for (auto& [name, value] : options.headers) {
        if (http::header_name_equals(name, http::header::kAuthorization)) {
            request.headers.emplace_back("Upstream-Authorization", std::move(value));
        } else if (http::header_name_equals(name, http::header::kContentType)) {
            request.content_type = std::move(value);
        } else {
            request.headers.emplace_back(std::move(name), std::move(value));
        }
    }
    if (options_.signed_url_ttl) {
        request.headers.emplace_back("Stream-Signed-URL-TTL",
                                     std::to_string(*options_.signed_url_ttl));
    }

    auto response = perform(request, options.stop);
    throw_on_failure(response, "Session append failed");

    auto id_header = response.header("Stream-Response-Id");
    auto response_id = id_header ? parse_response_id(*id_header) : std::nullopt;
    if (!response_id) {
        throw ProxyError(std::string(code::kProtocolError),
                         "Append response missing Stream-Response-Id");
    }

    if (auto location = response.header("Location")) {
        std::lock_guard lock(mutex_);
        stream_url_ = resolve_location(proxy_url_, *location);
        stream_id_ = response.header("Stream-Id").value_or(stream_id_.value_or(options_.session_id));
    }

    if (options.request_id) {
        try {
            options_.store->save(request_key(*options.request_id),
                                 RequestMapping{*response_id, {}});
        } catch (const std::exception& e) {
            LOG_WARNING(logging::logger(), "Could not record request {} as response {}: {}",
                        *options.request_id, *response_id, e.what());
        }
    }

    ensure_reader();
    return wait_for(*response_id, options.stop);
}

void DurableSession::abort(std::optional<uint32_t> response_id) {
    auto url = stream_url();
    if (!url) {
        return;
    }

    http::QueryParams params = {{"action", "abort"}};
    if (response_id) {
        params.emplace_back("response", std::to_string(*response_id));
    }

    TransportRequest request;
    request.method = "PATCH";
    request.url = with_params(*url, params);
    request.read_timeout = options_.request_timeout;
    request.connect_timeout = options_.reader.connect_timeout;

    throw_on_failure(perform(request), "Abort failed");
}

std::optional<wire::ResponsePtr> DurableSession::next_response() {
    ensure_connected();
    ensure_reader();
    return demuxer_.next_response();
}

// ============================================================================
// Lifecycle
// ============================================================================

void DurableSession::close() {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }

    read_thread_.request_stop();
    demuxer_.close();
    if (read_thread_.joinable()) {
        read_thread_.join();
    }
}

std::optional<std::string> DurableSession::stream_url() const {
    std::lock_guard lock(mutex_);
    return stream_url_;
}

std::optional<std::string> DurableSession::stream_id() const {
    std::lock_guard lock(mutex_);
    return stream_id_;
}

bool DurableSession::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace tether::client
