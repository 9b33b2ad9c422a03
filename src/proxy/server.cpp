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

// Tether Proxy Server - Implementation

#include "server.hpp"

#include <algorithm>
#include <chrono>

#include <httplib.h>

#include "../core/logging.hpp"
#include "../http/url.hpp"

namespace tether::proxy {

namespace {

constexpr std::string_view kCorrelationHeader = "X-Correlation-Id";

size_t worker_count(uint32_t configured) {
    if (configured > 0) {
        return configured;
    }
    // Long-polls and SSE sessions each pin a worker
    size_t cores = std::max(1u, std::thread::hardware_concurrency());
    return std::max<size_t>(16, cores * 8);
}

ServiceRequest to_service_request(const httplib::Request& req) {
    ServiceRequest out;
    out.method = http::parse_method(req.method);

    // Route on the raw target so an encoded '/' inside a stream ID survives
    std::string_view target = req.target;
    auto query_start = target.find('?');
    out.path = std::string(target.substr(0, query_start));
    if (query_start != std::string_view::npos) {
        out.query = http::parse_query(target.substr(query_start + 1));
    }

    out.headers.reserve(req.headers.size());
    for (const auto& [name, value] : req.headers) {
        out.headers.emplace_back(name, value);
    }
    out.body = req.body;
    return out;
}

void write_response(ServiceResponse&& response, httplib::Response& res) {
    res.status = response.status;

    std::string content_type;
    for (const auto& [name, value] : response.headers) {
        if (http::header_name_equals(name, http::header::kContentType)) {
            content_type = value;
            continue;
        }
        res.set_header(name, value);
    }

    if (response.stream) {
        auto stream = std::move(response.stream);
        res.set_chunked_content_provider(
            content_type.empty() ? "text/event-stream" : content_type,
            [stream](size_t, httplib::DataSink& sink) {
                ChunkWriter write = [&sink](std::string_view chunk) {
                    return sink.is_writable() && sink.write(chunk.data(), chunk.size());
                };
                stream(write);
                sink.done();
                return true;
            });
        return;
    }

    if (!content_type.empty() || !response.body.empty()) {
        res.set_content(std::move(response.body),
                        content_type.empty() ? std::string("application/octet-stream")
                                             : content_type);
    }
}

}  // namespace

ProxyServer::ProxyServer(control::ServerConfig config, std::shared_ptr<ProxyService> service)
    : config_(std::move(config)), service_(std::move(service)) {}

ProxyServer::~ProxyServer() {
    stop();
}

void ProxyServer::configure_routes(httplib::Server& server) {
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        auto started = std::chrono::steady_clock::now();
        auto correlation_id = logging::generate_correlation_id();

        auto request = to_service_request(req);
        auto response = service_->handle(request);
        auto status = response.status;
        auto stream_id = response.header(http::header::kStreamId).value_or("-");

        write_response(std::move(response), res);
        res.set_header(std::string(kCorrelationHeader), correlation_id);

        auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();
        TETHER_LOG_REQUEST(logging::logger(), req.method, request.path, status, duration_us,
                           stream_id, correlation_id);
    };

    // HEAD is served by the GET handler (cpp-httplib drops the body)
    server.Get(".*", handler);
    server.Post(".*", handler);
    server.Put(".*", handler);
    server.Patch(".*", handler);
    server.Delete(".*", handler);
    server.Options(".*", handler);

    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        if (res.status == 413) {
            auto error = ProxyError::make(413, code::kPayloadTooLarge, "Request body too large");
            res.set_content(error_body(error), "application/json");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });
}

std::error_code ProxyServer::start() {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    server_ = std::make_unique<httplib::Server>();
    auto workers = worker_count(config_.worker_threads);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    server_->set_read_timeout(std::chrono::milliseconds(config_.read_timeout));
    server_->set_write_timeout(std::chrono::milliseconds(config_.write_timeout));
    server_->set_keep_alive_timeout(
        std::max<time_t>(1, static_cast<time_t>(config_.keep_alive_timeout / 1000)));
    server_->set_payload_max_length(config_.max_request_size);
    configure_routes(*server_);

    int port = config_.listen_port;
    if (port == 0) {
        port = server_->bind_to_any_port(config_.listen_address);
        if (port < 0) {
            server_.reset();
            return std::make_error_code(std::errc::address_not_available);
        }
    } else if (!server_->bind_to_port(config_.listen_address, port)) {
        server_.reset();
        return std::make_error_code(std::errc::address_in_use);
    }

    bound_port_ = static_cast<uint16_t>(port);
    running_.store(true);
    listener_ = std::thread([this] {
        if (!server_->listen_after_bind()) {
            LOG_ERROR(logging::logger(), "Listener on port {} exited with an error", bound_port_);
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();

    LOG_INFO(logging::logger(), "Tether listening on {}:{} ({} workers)", config_.listen_address,
             bound_port_, workers);
    return {};
}

void ProxyServer::stop() {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    if (listener_.joinable()) {
        listener_.join();
    }
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

}  // namespace tether::proxy
