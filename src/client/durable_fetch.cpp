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

// Tether Durable Fetch - Implementation

#include "durable_fetch.hpp"

#include <charconv>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../http/url.hpp"
#include "errors.hpp"
#include "transport.hpp"

namespace tether::client {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};

}  // namespace

std::string stream_id_from_url(std::string_view stream_url) {
    auto url = http::parse_url(stream_url);
    std::string_view path = url ? std::string_view(url->path) : stream_url;
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto segment = path.substr(path.rfind('/') + 1);
    return http::url::decode(segment).value_or(std::string(segment));
}

// ============================================================================
// StreamFollower
// ============================================================================

StreamFollower::StreamFollower(std::string stream_url, StreamReaderOptions reader,
                               wire::DemuxerOptions demuxer,
                               std::chrono::milliseconds poll_backoff)
    : stream_url_(std::move(stream_url)),
      reader_(reader),
      demuxer_(demuxer),
      poll_backoff_(poll_backoff) {}

StreamFollower::~StreamFollower() {
    stop();
}

void StreamFollower::stop() {
    thread_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    demuxer_.close();
}

wire::ResponsePtr StreamFollower::follow(uint32_t response_id,
                                         std::optional<std::chrono::milliseconds> timeout,
                                         std::stop_token stop) {
    auto future = demuxer_.wait_for_response(response_id);
    {
        std::lock_guard lock(mutex_);
        if (!thread_.joinable()) {
            thread_ = std::jthread([this](std::stop_token token) { read_loop(token); });
        }
    }

    auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                            : std::chrono::steady_clock::time_point::max();
    while (future.wait_for(kWaitSlice) != std::future_status::ready) {
        if (stop.stop_requested()) {
            throw Cancelled();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ProxyError(std::string(code::kResumeTimeout),
                             fmt::format("Response {} did not start within {}ms", response_id,
                                         timeout->count()));
        }
    }

    auto response = future.get();
    std::lock_guard lock(mutex_);
    target_ = response;
    return response;
}

void StreamFollower::read_loop(std::stop_token stop) {
    ReadPosition position;
    auto push = [this](std::string_view bytes) { demuxer_.push(bytes); };

    while (!stop.stop_requested()) {
        {
            std::lock_guard lock(mutex_);
            if (target_ && target_->terminal_state() != wire::TerminalState::None) {
                break;
            }
        }

        try {
            if (!reader_.read(stream_url_, position, push, stop)) {
                break;
            }
        } catch (const ProxyError& e) {
            LOG_WARNING(logging::logger(), "Following {} failed: {}", stream_url_, e.what());
            demuxer_.error(e.what());
            break;
        }

        if (demuxer_.is_terminal()) {
            break;
        }
        if (position.up_to_date) {
            std::unique_lock lock(mutex_);
            sleep_cv_.wait_for(lock, stop, poll_backoff_, [] { return false; });
        }
    }
}

// ============================================================================
// DurableFetch
// ============================================================================

DurableFetch::DurableFetch(DurableFetchOptions options) : options_(std::move(options)) {
    proxy_url_ = options_.proxy_url;
    while (!proxy_url_.empty() && proxy_url_.back() == '/') {
        proxy_url_.pop_back();
    }
    if (!options_.store) {
        options_.store = std::make_shared<MemoryRequestStore>();
    }
}

DurableResult DurableFetch::operator()(const std::string& upstream_url, FetchOptions options) {
    std::string key;
    if (options.request_id) {
        key = mapping_key(options_.store_prefix, proxy_url_, *options.request_id);
        auto existing = options_.store->load(key);
        if (existing && !existing->stream_url.empty()) {
            if (auto resumed = resume(key, *existing, options.stop)) {
                return std::move(*resumed);
            }
        }
    }

    TransportRequest request;
    request.method = "POST";
    request.url = with_params(proxy_url_, {{"secret", options_.service_secret}});
    request.read_timeout = options_.request_timeout;
    request.connect_timeout = options_.reader.connect_timeout;
    request.body = std::move(options.body);
    request.headers.emplace_back("Upstream-URL", upstream_url);
    request.headers.emplace_back("Upstream-Method", options.method);
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
    throw_on_failure(response, "Create request failed");

    auto location = response.header("Location");
    auto id_header = response.header("Stream-Response-Id");
    uint32_t response_id = 0;
    if (id_header) {
        auto [ptr, ec] =
            std::from_chars(id_header->data(), id_header->data() + id_header->size(), response_id);
        if (ec != std::errc() || ptr != id_header->data() + id_header->size()) {
            response_id = 0;
        }
    }
    if (!location || response_id == 0) {
        throw ProxyError(std::string(code::kProtocolError),
                         "Create response missing Location or Stream-Response-Id");
    }

    auto stream_url = resolve_location(proxy_url_, *location);
    if (options.request_id) {
        try {
            options_.store->save(key, RequestMapping{response_id, stream_url});
        } catch (const std::exception& e) {
            LOG_WARNING(logging::logger(), "Could not record request {} as response {}: {}",
                        *options.request_id, response_id, e.what());
        }
    }

    return open(stream_url, response_id, options_.request_timeout, options.stop);
}

std::optional<DurableResult> DurableFetch::resume(const std::string& key,
                                                  const RequestMapping& mapping,
                                                  std::stop_token stop) {
    try {
        auto result = open(mapping.stream_url, mapping.response_id, options_.resume_timeout, stop);
        result.was_resumed = true;
        LOG_INFO(logging::logger(), "Resumed response {} on {}", mapping.response_id,
                 result.stream_id);
        return result;
    } catch (const ProxyError& e) {
        LOG_WARNING(logging::logger(), "Resume of response {} failed, sending a fresh request: {}",
                    mapping.response_id, e.what());
    } catch (const wire::DemuxerError& e) {
        LOG_WARNING(logging::logger(), "Resume of response {} failed, sending a fresh request: {}",
                    mapping.response_id, e.what());
    }

    options_.store->remove(key);
    return std::nullopt;
}

DurableResult DurableFetch::open(const std::string& stream_url, uint32_t response_id,
                                 std::optional<std::chrono::milliseconds> timeout,
                                 std::stop_token stop) {
    auto follower = std::make_shared<StreamFollower>(stream_url, options_.reader,
                                                     options_.demuxer, options_.poll_backoff);

    DurableResult result;
    result.response = follower->follow(response_id, timeout, stop);
    result.stream_url = stream_url;
    result.stream_id = stream_id_from_url(stream_url);
    result.follower = std::move(follower);
    return result;
}

void DurableFetch::abort(const std::string& stream_url, std::optional<uint32_t> response_id) {
    http::QueryParams params = {{"action", "abort"}};
    if (response_id) {
        params.emplace_back("response", std::to_string(*response_id));
    }

    TransportRequest request;
    request.method = "PATCH";
    request.url = with_params(stream_url, params);
    request.read_timeout = options_.request_timeout;
    request.connect_timeout = options_.reader.connect_timeout;
    throw_on_failure(perform(request), "Abort request failed");
}

}  // namespace tether::client
