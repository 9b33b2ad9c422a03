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

// Tether Proxy Service - Header
// Route handlers for the durable-stream proxy, independent of the HTTP server
//
// Routes:
//   POST   /v1/proxy                      create a stream with a generated ID
//   POST   /v1/proxy/{id}                 create or append
//   POST   /v1/proxy/{id}?action=connect  session bootstrap through a connect handler
//   POST   /v1/proxy/renew                refresh a capability URL through a renew handler
//   GET    /v1/proxy/{id}                 read (offset, live=long-poll|sse, cursor)
//   HEAD   /v1/proxy/{id}                 stream metadata
//   PATCH  /v1/proxy/{id}?action=abort     abort one (response=N) or the latest response
//   DELETE /v1/proxy/{id}                  abort everything and delete the stream
//   GET    /health

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../control/config.hpp"
#include "../core/capability.hpp"
#include "../http/allowlist.hpp"
#include "../http/http.hpp"
#include "../http/url.hpp"
#include "errors.hpp"
#include "forwarder.hpp"
#include "registry.hpp"
#include "storage.hpp"

namespace tether::proxy {

struct ServiceRequest {
    http::Method method = http::Method::GET;
    std::string path;
    http::QueryParams query;
    http::HeaderList headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return http::find_header(headers, name);
    }

    [[nodiscard]] std::optional<std::string> param(std::string_view key) const {
        return http::find_param(query, key);
    }
};

/// Writes one chunk of a streamed response; false once the client has gone away
using ChunkWriter = std::function<bool(std::string_view)>;

struct ServiceResponse {
    int status = 200;
    http::HeaderList headers;
    std::string body;

    /// Set for streamed (text/event-stream) responses; runs on the server thread
    std::function<void(const ChunkWriter&)> stream;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return http::find_header(headers, name);
    }

    [[nodiscard]] static ServiceResponse from_error(const ProxyError& error);
};

class ProxyService {
public:
    ProxyService(std::shared_ptr<const control::Config> config,
                 std::shared_ptr<LogStorage> storage,
                 std::shared_ptr<SessionRegistry> registry);
    ~ProxyService();

    ProxyService(const ProxyService&) = delete;
    ProxyService& operator=(const ProxyService&) = delete;

    /// Route and handle one request
    [[nodiscard]] ServiceResponse handle(const ServiceRequest& request);

    /// Apply a reloaded configuration to subsequent requests
    void update_config(std::shared_ptr<const control::Config> config);

    /// Abort every in-flight upstream call (Abort frames are appended)
    void shutdown();

    [[nodiscard]] SessionRegistry& registry() noexcept { return *registry_; }
    [[nodiscard]] size_t active_upstreams() const { return forwarder_.active(); }

private:
    /// Immutable per-config view shared by in-flight requests
    struct Settings {
        std::shared_ptr<const control::Config> config;
        http::Allowlist allowlist;
        core::CapabilitySigner signer;

        [[nodiscard]] const control::ProxyConfig& proxy() const noexcept {
            return config->proxy;
        }
    };
    using SettingsPtr = std::shared_ptr<const Settings>;

    struct Admission {
        std::optional<ProxyError> error;
        uint32_t response_id = 0;
        bool created = false;
    };

    struct EnsureResult {
        std::optional<ProxyError> error;
        bool created = false;
        uint32_t last_response_id = 0;
    };

    [[nodiscard]] SettingsPtr settings() const;
    [[nodiscard]] static SettingsPtr make_settings(std::shared_ptr<const control::Config> config);

    // Handlers
    ServiceResponse create_or_append(const Settings& s, const ServiceRequest& req,
                                     std::optional<std::string> path_stream_id);
    ServiceResponse connect(const Settings& s, const ServiceRequest& req,
                            const std::string& stream_id);
    ServiceResponse renew(const Settings& s, const ServiceRequest& req);
    ServiceResponse read(const Settings& s, const ServiceRequest& req,
                         const std::string& stream_id);
    ServiceResponse read_sse(const Settings& s, const ServiceRequest& req,
                             const std::string& stream_id);
    ServiceResponse head(const Settings& s, const ServiceRequest& req,
                         const std::string& stream_id);
    ServiceResponse abort(const Settings& s, const ServiceRequest& req,
                          const std::string& stream_id);
    ServiceResponse remove(const Settings& s, const ServiceRequest& req,
                           const std::string& stream_id);

    // Authentication
    [[nodiscard]] static std::optional<ProxyError> check_service_auth(const Settings& s,
                                                                      const ServiceRequest& req);
    [[nodiscard]] static bool has_service_credentials(const ServiceRequest& req);
    [[nodiscard]] static std::optional<ProxyError> check_stream_auth(const Settings& s,
                                                                     const ServiceRequest& req,
                                                                     const std::string& stream_id,
                                                                     bool enforce_expiry);

    // Stream bookkeeping
    Admission admit_response(const Settings& s, const std::string& stream_id,
                             const UpstreamHead& head, const std::shared_ptr<UpstreamCall>& call,
                             const std::string& upstream_host);
    EnsureResult ensure_stream(const Settings& s, const std::string& stream_id);
    [[nodiscard]] std::optional<uint32_t> recover_last_response_id(const std::string& stream_id);
    [[nodiscard]] std::optional<ProxyError> verify_stream_writable(const std::string& stream_id);

    // URL minting
    [[nodiscard]] static std::string request_origin(const Settings& s, const ServiceRequest& req);
    [[nodiscard]] static uint32_t url_ttl(const Settings& s, const ServiceRequest& req);

    SettingsPtr settings_;
    std::shared_ptr<LogStorage> storage_;
    std::shared_ptr<SessionRegistry> registry_;
    UpstreamForwarder forwarder_;
};

/// Stream IDs are 1-256 printable characters (percent-encoded in paths)
[[nodiscard]] bool is_valid_stream_id(std::string_view stream_id) noexcept;

}  // namespace tether::proxy
