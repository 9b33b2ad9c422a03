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

// Tether Proxy Service - Implementation

#include "service.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <limits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../core/encoding.hpp"
#include "../core/logging.hpp"
#include "../http/sse.hpp"
#include "../wire/frame.hpp"

namespace tether::proxy {

namespace {

using std::chrono::milliseconds;

constexpr std::array<std::string_view, 5> kAllowedMethods = {"GET", "POST", "PUT", "PATCH",
                                                             "DELETE"};

constexpr std::string_view kProxyRoot = "/v1/proxy";
constexpr std::string_view kStreamContentType = "application/octet-stream";
constexpr int kMaxRecoveryPages = 100000;

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> bearer_token(const ServiceRequest& req) {
    auto auth = req.header(http::header::kAuthorization);
    constexpr std::string_view kPrefix = "Bearer ";
    if (!auth || auth->size() <= kPrefix.size() ||
        !http::header_name_equals(std::string_view(*auth).substr(0, kPrefix.size()), kPrefix)) {
        return std::nullopt;
    }
    return auth->substr(kPrefix.size());
}

/// Upstream response headers recorded in the Start frame
http::HeaderList start_headers(const http::HeaderList& upstream) {
    http::HeaderList out;
    out.reserve(upstream.size());
    for (const auto& [name, value] : upstream) {
        if (!http::is_hop_by_hop(name)) {
            out.emplace_back(name, value);
        }
    }
    return out;
}

ServiceResponse error(int status, std::string_view code, std::string message) {
    return ServiceResponse::from_error(ProxyError::make(status, code, std::move(message)));
}

ServiceResponse storage_error(const StorageResult& result) {
    return error(502, code::kStorageError, result.error.empty() ? "Storage request failed"
                                                                : result.error);
}

/// Appends one response's body to the log as Data frames, then its terminal frame
class FrameSink final : public BodySink {
public:
    FrameSink(std::shared_ptr<LogStorage> storage, StreamStatePtr state, uint32_t response_id,
              std::string upstream_host)
        : storage_(std::move(storage)),
          state_(std::move(state)),
          response_id_(response_id),
          upstream_host_(std::move(upstream_host)) {}

    bool on_data(std::string_view chunk) override {
        while (!chunk.empty()) {
            auto piece = chunk.substr(0, wire::kMaxFramePayload);
            auto result = storage_->append(state_->stream_id(), wire::encode_data(response_id_, piece));
            if (!result.ok()) {
                TETHER_LOG_ERROR_CTX(logging::logger(), "Data append failed", state_->stream_id(),
                                     code::kStorageError, result.error);
                return false;
            }
            chunk.remove_prefix(piece.size());
        }
        return true;
    }

    void on_end(BodyEnd end, std::string_view message) override {
        std::string frame;
        switch (end) {
            case BodyEnd::Complete:
                frame = wire::encode_complete(response_id_);
                break;
            case BodyEnd::Aborted:
                frame = wire::encode_abort(response_id_);
                break;
            case BodyEnd::TooLarge:
                frame = wire::encode_error(response_id_, message, code::kResponseTooLarge);
                break;
            case BodyEnd::IdleTimeout:
                frame = wire::encode_error(response_id_, message, code::kIdleTimeout);
                break;
            case BodyEnd::Failed:
                frame = wire::encode_error(response_id_, message, code::kStreamError);
                break;
        }

        auto result = storage_->append(state_->stream_id(), frame);
        if (!result.ok()) {
            TETHER_LOG_ERROR_CTX(logging::logger(), "Terminal frame append failed",
                                 state_->stream_id(), code::kStorageError, result.error);
        }

        state_->untrack(response_id_);
        TETHER_LOG_UPSTREAM(logging::logger(), to_string(end), state_->stream_id(), response_id_,
                            upstream_host_);
    }

private:
    std::shared_ptr<LogStorage> storage_;
    StreamStatePtr state_;
    uint32_t response_id_;
    std::string upstream_host_;
};

}  // namespace

bool is_valid_stream_id(std::string_view stream_id) noexcept {
    if (stream_id.empty() || stream_id.size() > 256) {
        return false;
    }
    return std::none_of(stream_id.begin(), stream_id.end(), [](unsigned char c) {
        return std::iscntrl(c) || c == ' ';
    });
}

ServiceResponse ServiceResponse::from_error(const ProxyError& error) {
    ServiceResponse response;
    response.status = error.status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = error_body(error);
    return response;
}

// ============================================================================
// Construction and configuration
// ============================================================================

ProxyService::ProxyService(std::shared_ptr<const control::Config> config,
                           std::shared_ptr<LogStorage> storage,
                           std::shared_ptr<SessionRegistry> registry)
    : settings_(make_settings(std::move(config))),
      storage_(std::move(storage)),
      registry_(std::move(registry)) {}

ProxyService::~ProxyService() {
    shutdown();
}

ProxyService::SettingsPtr ProxyService::make_settings(
    std::shared_ptr<const control::Config> config) {
    std::string error;
    auto allowlist = http::Allowlist::compile(config->proxy.allowlist, error);
    if (!allowlist) {
        LOG_ERROR(logging::logger(), "Invalid allowlist, blocking all upstreams: {}", error);
        allowlist = http::Allowlist{};
    }

    core::CapabilitySigner signer(config->proxy.secret);
    return std::make_shared<const Settings>(
        Settings{std::move(config), std::move(*allowlist), std::move(signer)});
}

ProxyService::SettingsPtr ProxyService::settings() const {
    return std::atomic_load(&settings_);
}

void ProxyService::update_config(std::shared_ptr<const control::Config> config) {
    auto next = make_settings(std::move(config));
    LOG_INFO(logging::logger(), "Proxy settings updated: {} allowlist patterns",
             next->allowlist.size());
    std::atomic_store(&settings_, std::move(next));
}

void ProxyService::shutdown() {
    forwarder_.shutdown();
}

// ============================================================================
// Routing
// ============================================================================

ServiceResponse ProxyService::handle(const ServiceRequest& req) {
    auto s = settings();
    std::string_view path = req.path;

    try {
        if (path == "/health") {
            if (req.method != http::Method::GET && req.method != http::Method::HEAD) {
                return error(405, code::kMethodNotAllowed, "Method not allowed");
            }
            ServiceResponse response;
            response.headers.emplace_back("Content-Type", "application/json");
            response.body = R"({"status":"ok"})";
            return response;
        }

        if (path == kProxyRoot || path == core::kProxyPathPrefix) {
            if (req.method != http::Method::POST) {
                return error(405, code::kMethodNotAllowed, "Method not allowed");
            }
            return create_or_append(*s, req, std::nullopt);
        }

        if (!path.starts_with(core::kProxyPathPrefix)) {
            return error(404, code::kNotFound, "Not found");
        }

        std::string_view raw_id = path.substr(core::kProxyPathPrefix.size());
        if (raw_id == "renew" && req.method == http::Method::POST) {
            return renew(*s, req);
        }

        auto stream_id = http::url::decode(raw_id);
        if (!stream_id || !is_valid_stream_id(*stream_id)) {
            return error(400, code::kInvalidStreamId, "Invalid stream ID");
        }

        auto action = req.param("action");
        switch (req.method) {
            case http::Method::POST:
                if (!action) {
                    return create_or_append(*s, req, *stream_id);
                }
                if (*action == "connect") {
                    return connect(*s, req, *stream_id);
                }
                return error(400, code::kInvalidAction, "Query parameter action must be \"connect\"");
            case http::Method::GET:
                return read(*s, req, *stream_id);
            case http::Method::HEAD:
                return head(*s, req, *stream_id);
            case http::Method::PATCH:
                if (action == "abort") {
                    return abort(*s, req, *stream_id);
                }
                return error(400, code::kInvalidAction, "Query parameter action must be \"abort\"");
            case http::Method::DELETE:
                return remove(*s, req, *stream_id);
            default:
                return error(405, code::kMethodNotAllowed, "Method not allowed");
        }
    } catch (const std::exception& e) {
        TETHER_LOG_ERROR_CTX(logging::logger(), "Request handler failed", req.path,
                             code::kInternalError, e.what());
        return error(500, code::kInternalError, "Internal error");
    }
}

// ============================================================================
// Authentication
// ============================================================================

bool ProxyService::has_service_credentials(const ServiceRequest& req) {
    return req.param("secret").has_value() || bearer_token(req).has_value();
}

std::optional<ProxyError> ProxyService::check_service_auth(const Settings& s,
                                                           const ServiceRequest& req) {
    auto candidate = req.param("secret");
    if (!candidate) {
        candidate = bearer_token(req);
    }

    if (!candidate || candidate->empty()) {
        return ProxyError::make(401, code::kMissingSecret, "Service authentication required");
    }
    if (!s.signer.check_service_secret(*candidate)) {
        return ProxyError::make(401, code::kInvalidSecret, "Invalid service credentials");
    }
    return std::nullopt;
}

std::optional<ProxyError> ProxyService::check_stream_auth(const Settings& s,
                                                          const ServiceRequest& req,
                                                          const std::string& stream_id,
                                                          bool enforce_expiry) {
    if (has_service_credentials(req)) {
        return check_service_auth(s, req);
    }

    auto expires = req.param("expires");
    auto signature = req.param("signature");
    std::optional<std::string_view> expires_view;
    std::optional<std::string_view> signature_view;
    if (expires) {
        expires_view = *expires;
    }
    if (signature) {
        signature_view = *signature;
    }

    auto result = enforce_expiry ? s.signer.verify(stream_id, expires_view, signature_view)
                                 : s.signer.verify_signature(stream_id, expires_view, signature_view);
    if (!result) {
        return ProxyError::from_capability(result.error, stream_id);
    }
    return std::nullopt;
}

// ============================================================================
// URL minting
// ============================================================================

std::string ProxyService::request_origin(const Settings& s, const ServiceRequest& req) {
    std::string origin = s.proxy().public_origin;
    if (!origin.empty()) {
        while (origin.back() == '/') {
            origin.pop_back();
        }
        return origin;
    }

    auto proto = req.header("x-forwarded-proto").value_or("http");
    auto host = req.header(http::header::kHost).value_or("localhost");
    return fmt::format("{}://{}", proto, host);
}

uint32_t ProxyService::url_ttl(const Settings& s, const ServiceRequest& req) {
    constexpr uint64_t kMax = std::numeric_limits<uint32_t>::max();
    if (auto header = req.header(http::header::kSignedUrlTtl)) {
        auto ttl = parse_unsigned<uint64_t>(*header);
        if (ttl && *ttl > 0) {
            return static_cast<uint32_t>(std::min(*ttl, kMax));
        }
    }
    return static_cast<uint32_t>(std::min(s.proxy().url_expiration_seconds, kMax));
}

// ============================================================================
// Stream bookkeeping
// ============================================================================

std::optional<ProxyError> ProxyService::verify_stream_writable(const std::string& stream_id) {
    auto head = storage_->head(stream_id);
    if (head.not_found()) {
        return ProxyError::make(404, code::kStreamNotFound, "Stream does not exist");
    }
    if (!head.ok()) {
        return ProxyError::make(502, code::kStorageError,
                                fmt::format("Failed to verify stream: {}", head.error));
    }
    if (head.closed) {
        return ProxyError::make(409, code::kStreamClosed, "Stream is closed");
    }
    return std::nullopt;
}

ProxyService::EnsureResult ProxyService::ensure_stream(const Settings& s,
                                                       const std::string& stream_id) {
    EnsureResult result;

    auto head = storage_->head(stream_id);
    if (head.not_found()) {
        auto created =
            storage_->create(stream_id, kStreamContentType, s.proxy().stream_ttl_seconds);
        if (!created.ok()) {
            result.error = ProxyError::make(
                502, code::kStorageError, fmt::format("Failed to create stream: {}", created.error));
            return result;
        }
        LOG_INFO(logging::logger(), "Created stream {}", stream_id);
        result.created = true;
        return result;
    }

    if (!head.ok()) {
        result.error = ProxyError::make(502, code::kStorageError,
                                        fmt::format("Failed to check stream: {}", head.error));
        return result;
    }
    if (head.closed) {
        result.error = ProxyError::make(409, code::kStreamClosed, "Stream is closed");
        return result;
    }

    auto last = recover_last_response_id(stream_id);
    if (!last) {
        result.error = ProxyError::make(502, code::kStorageError,
                                        "Failed to recover response counter");
        return result;
    }
    result.last_response_id = *last;
    return result;
}

std::optional<uint32_t> ProxyService::recover_last_response_id(const std::string& stream_id) {
    wire::FrameDecoder decoder;
    std::string offset = "-1";
    uint32_t max_id = 0;

    for (int page = 0; page < kMaxRecoveryPages; ++page) {
        auto result = storage_->read(stream_id, ReadOptions{offset, false, {}});
        if (!result.ok()) {
            TETHER_LOG_ERROR_CTX(logging::logger(), "Counter recovery read failed", stream_id,
                                 code::kStorageError, result.error);
            return std::nullopt;
        }

        decoder.feed(result.body);
        while (true) {
            auto decoded = decoder.next();
            if (decoded.error) {
                LOG_WARNING(logging::logger(),
                            "Counter recovery for stream {} stopped at offset {}: {}", stream_id,
                            decoded.error->offset, decoded.error->message);
                return max_id;
            }
            if (!decoded.frame) {
                break;
            }
            max_id = std::max(max_id, wire::response_id_of(*decoded.frame));
        }

        if (result.up_to_date || result.body.empty() || result.next_offset.empty() ||
            result.next_offset == offset) {
            break;
        }
        offset = result.next_offset;
    }

    if (max_id > 0) {
        LOG_INFO(logging::logger(), "Recovered response counter for stream {} at {}", stream_id,
                 max_id);
    }
    return max_id;
}

ProxyService::Admission ProxyService::admit_response(const Settings& s,
                                                     const std::string& stream_id,
                                                     const UpstreamHead& head,
                                                     const std::shared_ptr<UpstreamCall>& call,
                                                     const std::string& upstream_host) {
    Admission admission;
    auto state = registry_->insert(stream_id);

    std::lock_guard lock(state->mutex());
    if (state->phase() == StreamPhase::Creating) {
        auto ensured = ensure_stream(s, stream_id);
        if (ensured.error) {
            admission.error = std::move(ensured.error);
            return admission;
        }
        admission.created = ensured.created;
        state->activate(ensured.last_response_id);
    }

    uint32_t response_id = state->allocate_response_id();
    auto appended = storage_->append(
        stream_id, wire::encode_start(response_id, head.status, start_headers(head.headers)));
    if (!appended.ok()) {
        admission.error =
            ProxyError::make(appended.not_found() ? 404 : 502,
                             appended.not_found() ? code::kStreamNotFound : code::kStorageError,
                             fmt::format("Failed to append Start frame: {}", appended.error));
        return admission;
    }

    state->track(response_id, call);
    state->set_content_type(
        http::find_header(head.headers, http::header::kContentType).value_or(std::string(kStreamContentType)));
    admission.response_id = response_id;

    TETHER_LOG_UPSTREAM(logging::logger(), "start", stream_id, response_id, upstream_host);
    return admission;
}

// ============================================================================
// Create / append
// ============================================================================

ServiceResponse ProxyService::create_or_append(const Settings& s, const ServiceRequest& req,
                                               std::optional<std::string> path_stream_id) {
    if (auto auth = check_service_auth(s, req)) {
        return ServiceResponse::from_error(*auth);
    }

    // Append through a capability URL: HMAC only, expiry is not enforced on writes
    std::optional<std::string> reuse_id;
    if (auto use_stream_url = req.header(http::header::kUseStreamUrl)) {
        auto parsed = core::parse_stream_url(*use_stream_url);
        if (!parsed) {
            return error(400, core::to_code(core::CapabilityError::MalformedStreamUrl),
                         "Use-Stream-URL header is malformed");
        }

        std::optional<std::string_view> expires;
        std::optional<std::string_view> signature;
        if (parsed->expires) {
            expires = *parsed->expires;
        }
        if (parsed->signature) {
            signature = *parsed->signature;
        }
        auto verified = s.signer.verify_signature(parsed->stream_id, expires, signature);
        if (!verified) {
            return ServiceResponse::from_error(
                ProxyError::from_capability(verified.error, parsed->stream_id));
        }

        if (path_stream_id && *path_stream_id != parsed->stream_id) {
            return error(400, code::kStreamIdMismatch,
                         "Use-Stream-URL does not match the stream in the path");
        }
        if (auto unusable = verify_stream_writable(parsed->stream_id)) {
            return ServiceResponse::from_error(*unusable);
        }
        reuse_id = parsed->stream_id;
    }

    auto upstream_url = req.header(http::header::kUpstreamUrl);
    if (!upstream_url || upstream_url->empty()) {
        return error(400, code::kMissingUpstreamUrl, "Upstream-URL header is required");
    }

    auto upstream_method = req.header(http::header::kUpstreamMethod);
    if (!upstream_method || upstream_method->empty()) {
        return error(400, code::kMissingUpstreamMethod, "Upstream-Method header is required");
    }
    std::string method = to_upper(*upstream_method);
    if (std::find(kAllowedMethods.begin(), kAllowedMethods.end(), method) == kAllowedMethods.end()) {
        return error(400, code::kInvalidUpstreamMethod,
                     "Upstream-Method must be one of: GET, POST, PUT, PATCH, DELETE");
    }

    auto verdict = s.allowlist.check(*upstream_url);
    if (verdict.verdict == http::UrlVerdict::Malformed) {
        return error(400, code::kInvalidUpstreamUrl, "Invalid upstream URL");
    }
    if (verdict.verdict == http::UrlVerdict::NotAllowed) {
        return error(403, code::kUpstreamNotAllowed, "Upstream URL is not in allowlist");
    }
    const http::Url& target = *verdict.url;

    std::string stream_id = reuse_id ? *reuse_id
                            : path_stream_id ? *path_stream_id
                                             : core::generate_stream_id();

    const auto& proxy = s.proxy();
    ForwardRequest forward;
    forward.url = target;
    forward.method = method;
    forward.headers = filter_upstream_headers(req.headers, target);
    forward.body = req.body;
    forward.connect_timeout = milliseconds(proxy.upstream_connect_timeout);
    forward.idle_timeout = milliseconds(proxy.idle_timeout);
    forward.max_response_bytes = proxy.max_response_bytes;
    forward.max_error_body_bytes = proxy.max_error_body_bytes;

    auto upstream_host = target.authority();
    TETHER_LOG_UPSTREAM(logging::logger(), "open", stream_id, "-", upstream_host);

    auto call = forwarder_.start(std::move(forward));
    auto head = call->await_head(milliseconds(proxy.forward_timeout));

    switch (head.outcome) {
        case HeadOutcome::Received:
            break;
        case HeadOutcome::TimedOut:
            return error(502, code::kUpstreamTimeout, "Upstream server did not respond in time");
        case HeadOutcome::ConnectFailed:
        case HeadOutcome::Cancelled:
            TETHER_LOG_ERROR_CTX(logging::logger(), "Upstream request failed", stream_id,
                                 code::kUpstreamError, head.error);
            return error(502, code::kUpstreamError, head.error);
    }

    if (http::is_redirect(head.status)) {
        call->reject();
        return error(400, code::kRedirectNotAllowed, "Proxy cannot follow redirects");
    }

    if (!http::is_success(head.status)) {
        ServiceResponse response;
        response.status = 502;
        response.headers.emplace_back(
            "Content-Type",
            http::find_header(head.headers, http::header::kContentType).value_or("text/plain"));
        response.headers.emplace_back("Upstream-Status", std::to_string(head.status));
        response.body = call->collect_error_body(milliseconds(proxy.forward_timeout));
        return response;
    }

    auto admission = admit_response(s, stream_id, head, call, upstream_host);
    if (admission.error) {
        call->reject();
        return ServiceResponse::from_error(*admission.error);
    }

    auto state = registry_->lookup(stream_id);
    if (!state) {
        // Deleted between admission and commit: the Start frame still needs a terminal frame
        state = std::make_shared<StreamState>(stream_id);
    }
    call->commit(std::make_shared<FrameSink>(storage_, std::move(state), admission.response_id,
                                             upstream_host));

    ServiceResponse response;
    response.status = admission.created ? 201 : 200;
    response.headers.emplace_back(
        "Location", s.signer.mint_url(request_origin(s, req), stream_id, url_ttl(s, req)));
    response.headers.emplace_back("Stream-Id", stream_id);
    response.headers.emplace_back("Stream-Response-Id", std::to_string(admission.response_id));
    response.headers.emplace_back(
        "Upstream-Content-Type",
        http::find_header(head.headers, http::header::kContentType).value_or(std::string(kStreamContentType)));
    return response;
}

// ============================================================================
// Connect / renew
// ============================================================================

ServiceResponse ProxyService::connect(const Settings& s, const ServiceRequest& req,
                                      const std::string& stream_id) {
    if (auto auth = check_service_auth(s, req)) {
        return ServiceResponse::from_error(*auth);
    }

    const auto& proxy = s.proxy();
    std::optional<HandlerResponse> handler;
    if (auto handler_url = req.header(http::header::kUpstreamUrl)) {
        auto verdict = s.allowlist.check(*handler_url);
        if (verdict.verdict == http::UrlVerdict::Malformed) {
            return error(400, code::kInvalidUpstreamUrl, "Invalid upstream URL");
        }
        if (verdict.verdict == http::UrlVerdict::NotAllowed) {
            return error(403, code::kUpstreamNotAllowed, "Upstream URL is not in allowlist");
        }

        ForwardRequest forward;
        forward.url = *verdict.url;
        forward.method = "POST";
        forward.headers = filter_upstream_headers(req.headers, forward.url);
        forward.headers.emplace_back("Stream-Id", stream_id);
        forward.body = req.body;
        forward.connect_timeout = milliseconds(proxy.upstream_connect_timeout);

        handler = call_handler(forward, milliseconds(proxy.connect_timeout));
        switch (handler->outcome) {
            case HeadOutcome::Received:
                break;
            case HeadOutcome::TimedOut:
                return error(502, code::kUpstreamTimeout, "Connect handler did not respond in time");
            case HeadOutcome::ConnectFailed:
            case HeadOutcome::Cancelled:
                return error(502, code::kUpstreamError, handler->error);
        }
        if (!http::is_success(handler->status)) {
            LOG_WARNING(logging::logger(), "Connect handler rejected stream {} with {}", stream_id,
                        handler->status);
            return error(401, code::kConnectRejected, "Auth endpoint rejected session access");
        }
    }

    bool created = false;
    {
        auto state = registry_->insert(stream_id);
        std::lock_guard lock(state->mutex());
        if (state->phase() == StreamPhase::Creating) {
            auto ensured = ensure_stream(s, stream_id);
            if (ensured.error) {
                return ServiceResponse::from_error(*ensured.error);
            }
            created = ensured.created;
            state->activate(ensured.last_response_id);
        } else {
            auto existing = storage_->head(stream_id);
            if (existing.not_found()) {
                auto made = storage_->create(stream_id, kStreamContentType, proxy.stream_ttl_seconds);
                if (!made.ok()) {
                    return storage_error(made);
                }
                created = true;
            } else if (!existing.ok()) {
                return storage_error(existing);
            }
        }
    }

    http::QueryParams extra;
    for (const auto& [key, value] : req.query) {
        if (key != "action" && key != "secret" && key != "expires" && key != "signature") {
            extra.emplace_back(key, value);
        }
    }

    ServiceResponse response;
    response.status = created ? 201 : 200;
    response.headers.emplace_back(
        "Location", s.signer.mint_url(request_origin(s, req), stream_id, url_ttl(s, req), extra));
    response.headers.emplace_back("Stream-Id", stream_id);

    if (handler) {
        if (auto content_type = http::find_header(handler->headers, http::header::kContentType)) {
            response.headers.emplace_back("Content-Type", *content_type);
        }
        if (auto offset = http::find_header(handler->headers, http::header::kNextOffset)) {
            response.headers.emplace_back("Stream-Next-Offset", *offset);
        }
        response.body = std::move(handler->body);
    }

    LOG_INFO(logging::logger(), "Session connected: stream_id={}, created={}", stream_id, created);
    return response;
}

ServiceResponse ProxyService::renew(const Settings& s, const ServiceRequest& req) {
    if (auto auth = check_service_auth(s, req)) {
        return ServiceResponse::from_error(*auth);
    }

    auto use_stream_url = req.header(http::header::kUseStreamUrl);
    if (!use_stream_url) {
        return error(400, code::kMissingUseStreamUrl, "Use-Stream-URL header is required");
    }
    auto parsed = core::parse_stream_url(*use_stream_url);
    if (!parsed) {
        return error(400, core::to_code(core::CapabilityError::MalformedStreamUrl),
                     "Use-Stream-URL header is malformed");
    }

    std::optional<std::string_view> expires;
    std::optional<std::string_view> signature;
    if (parsed->expires) {
        expires = *parsed->expires;
    }
    if (parsed->signature) {
        signature = *parsed->signature;
    }
    auto verified = s.signer.verify_signature(parsed->stream_id, expires, signature);
    if (!verified) {
        return ServiceResponse::from_error(
            ProxyError::from_capability(verified.error, parsed->stream_id));
    }

    auto exists = storage_->head(parsed->stream_id);
    if (exists.not_found()) {
        return error(404, code::kStreamNotFound, "Stream does not exist");
    }
    if (!exists.ok()) {
        return storage_error(exists);
    }

    auto renew_url = req.header(http::header::kUpstreamUrl);
    if (!renew_url || renew_url->empty()) {
        return error(400, code::kMissingUpstreamUrl, "Upstream-URL header is required");
    }
    auto verdict = s.allowlist.check(*renew_url);
    if (verdict.verdict == http::UrlVerdict::Malformed) {
        return error(400, code::kInvalidUpstreamUrl, "Invalid upstream URL");
    }
    if (verdict.verdict == http::UrlVerdict::NotAllowed) {
        return error(403, code::kUpstreamNotAllowed, "Upstream URL is not in allowlist");
    }

    const auto& proxy = s.proxy();
    ForwardRequest forward;
    forward.url = *verdict.url;
    forward.method = "POST";
    forward.headers = filter_upstream_headers(req.headers, forward.url);
    forward.headers.emplace_back("Stream-Id", parsed->stream_id);
    forward.body = req.body;
    forward.connect_timeout = milliseconds(proxy.upstream_connect_timeout);

    auto handler = call_handler(forward, milliseconds(proxy.connect_timeout));
    switch (handler.outcome) {
        case HeadOutcome::Received:
            break;
        case HeadOutcome::TimedOut:
            return error(502, code::kUpstreamTimeout, "Renew handler did not respond in time");
        case HeadOutcome::ConnectFailed:
        case HeadOutcome::Cancelled:
            return error(502, code::kUpstreamError, handler.error);
    }
    if (!http::is_success(handler.status)) {
        return error(401, code::kRenewalRejected, "Upstream rejected the renewal request");
    }

    ServiceResponse response;
    response.headers.emplace_back(
        "Location", s.signer.mint_url(request_origin(s, req), parsed->stream_id, url_ttl(s, req),
                                      parsed->extra_params));
    response.headers.emplace_back("Stream-Id", parsed->stream_id);
    return response;
}

// ============================================================================
// Read / head
// ============================================================================

ServiceResponse ProxyService::read(const Settings& s, const ServiceRequest& req,
                                   const std::string& stream_id) {
    if (auto auth = check_stream_auth(s, req, stream_id, true)) {
        return ServiceResponse::from_error(*auth);
    }

    auto live = req.param("live");
    if (live == "sse") {
        return read_sse(s, req, stream_id);
    }
    if (live && *live != "long-poll") {
        return error(400, code::kInvalidLiveMode, "live must be long-poll or sse");
    }

    ReadOptions options;
    options.offset = req.param("offset").value_or("-1");
    options.long_poll = live.has_value();
    options.cursor = req.param("cursor").value_or("");

    auto result = storage_->read(stream_id, options);
    if (result.not_found()) {
        return error(404, code::kStreamNotFound, "Stream does not exist");
    }
    if (!result.ok()) {
        return storage_error(result);
    }

    ServiceResponse response;
    response.status = result.status == 204 ? 204 : 200;
    response.headers.emplace_back("Content-Type", std::string(kStreamContentType));
    if (!result.next_offset.empty()) {
        response.headers.emplace_back("Stream-Next-Offset", result.next_offset);
    }
    if (result.up_to_date) {
        response.headers.emplace_back("Stream-Up-To-Date", "true");
    }
    if (!result.cursor.empty()) {
        response.headers.emplace_back("Stream-Cursor", result.cursor);
    }
    if (result.closed) {
        response.headers.emplace_back("Stream-Closed", "true");
    }
    if (auto state = registry_->lookup(stream_id)) {
        if (auto content_type = state->content_type(); !content_type.empty()) {
            response.headers.emplace_back("Upstream-Content-Type", content_type);
        }
    }
    response.body = std::move(result.body);
    return response;
}

ServiceResponse ProxyService::read_sse(const Settings& s, const ServiceRequest& req,
                                       const std::string& stream_id) {
    auto exists = storage_->head(stream_id);
    if (exists.not_found()) {
        return error(404, code::kStreamNotFound, "Stream does not exist");
    }
    if (!exists.ok()) {
        return storage_error(exists);
    }

    ServiceResponse response;
    response.headers.emplace_back("Content-Type", "text/event-stream");
    response.headers.emplace_back("Cache-Control", "no-cache");
    response.headers.emplace_back("Stream-SSE-Data-Encoding", "base64");
    if (auto state = registry_->lookup(stream_id)) {
        if (auto content_type = state->content_type(); !content_type.empty()) {
            response.headers.emplace_back("Upstream-Content-Type", content_type);
        }
    }

    auto storage = storage_;
    auto lifetime = milliseconds(s.proxy().sse_session_timeout);
    std::string offset = req.param("offset").value_or("-1");
    std::string cursor = req.param("cursor").value_or("");

    response.stream = [storage, stream_id, lifetime, offset,
                       cursor](const ChunkWriter& write) mutable {
        auto deadline = std::chrono::steady_clock::now() + lifetime;
        while (std::chrono::steady_clock::now() < deadline) {
            auto result = storage->read(stream_id, ReadOptions{offset, true, cursor});
            if (!result.ok()) {
                nlohmann::json failure = {
                    {"code", std::string(result.not_found() ? code::kStreamNotFound
                                                                : code::kStorageError)},
                    {"message", result.error}};
                (void)write(http::format_sse_event("error", failure.dump()));
                return;
            }

            if (!result.body.empty() &&
                !write(http::format_sse_event("data", core::base64_encode(result.body)))) {
                return;
            }
            if (!result.next_offset.empty()) {
                offset = result.next_offset;
            }
            if (!result.cursor.empty()) {
                cursor = result.cursor;
            }

            nlohmann::json control = {{"streamNextOffset", offset}};
            if (!cursor.empty()) {
                control["streamCursor"] = cursor;
            }
            if (result.up_to_date) {
                control["upToDate"] = true;
            }
            if (!write(http::format_sse_event("control", control.dump()))) {
                return;
            }
            if (result.closed) {
                return;
            }
        }
    };
    return response;
}

ServiceResponse ProxyService::head(const Settings& s, const ServiceRequest& req,
                                   const std::string& stream_id) {
    if (auto auth = check_stream_auth(s, req, stream_id, true)) {
        return ServiceResponse::from_error(*auth);
    }

    auto result = storage_->head(stream_id);
    if (result.not_found()) {
        return error(404, code::kStreamNotFound, "Stream does not exist");
    }
    if (!result.ok()) {
        return storage_error(result);
    }

    ServiceResponse response;
    response.headers.emplace_back("Content-Type", std::string(kStreamContentType));
    if (!result.next_offset.empty()) {
        response.headers.emplace_back("Stream-Next-Offset", result.next_offset);
    }
    if (result.closed) {
        response.headers.emplace_back("Stream-Closed", "true");
    }
    if (auto state = registry_->lookup(stream_id)) {
        if (auto content_type = state->content_type(); !content_type.empty()) {
            response.headers.emplace_back("Upstream-Content-Type", content_type);
        }
    }
    return response;
}

// ============================================================================
// Abort / delete
// ============================================================================

ServiceResponse ProxyService::abort(const Settings& s, const ServiceRequest& req,
                                    const std::string& stream_id) {
    if (auto auth = check_stream_auth(s, req, stream_id, false)) {
        return ServiceResponse::from_error(*auth);
    }

    std::optional<uint32_t> response_id;
    if (auto param = req.param("response")) {
        response_id = parse_unsigned<uint32_t>(*param);
        if (!response_id || *response_id == 0) {
            return error(400, code::kInvalidResponseId, "response must be a positive integer");
        }
    }

    if (auto state = registry_->lookup(stream_id)) {
        bool cancelled = response_id ? state->cancel(*response_id) : state->cancel_latest();
        LOG_INFO(logging::logger(), "Abort stream_id={}, response={}, cancelled={}", stream_id,
                 response_id ? std::to_string(*response_id) : std::string("latest"), cancelled);
    }

    ServiceResponse response;
    response.status = 204;
    return response;
}

ServiceResponse ProxyService::remove(const Settings& s, const ServiceRequest& req,
                                     const std::string& stream_id) {
    if (auto auth = check_service_auth(s, req)) {
        return ServiceResponse::from_error(*auth);
    }

    if (auto state = registry_->lookup(stream_id)) {
        size_t cancelled = state->cancel_all();
        if (cancelled > 0) {
            LOG_INFO(logging::logger(), "Cancelled {} responses on deleted stream {}", cancelled,
                     stream_id);
        }
    }
    registry_->remove(stream_id);

    auto result = storage_->remove(stream_id);
    if (!result.ok() && !result.not_found()) {
        return storage_error(result);
    }

    ServiceResponse response;
    response.status = 204;
    return response;
}

}  // namespace tether::proxy
