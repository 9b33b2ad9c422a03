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

// Tether Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::control {

/// HTTP listener configuration
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 4440;
    uint32_t worker_threads = 0;  // 0 = auto-detect CPU count

    // Timeouts (milliseconds)
    uint32_t read_timeout = 60000;
    uint32_t write_timeout = 60000;
    uint32_t keep_alive_timeout = 5000;

    uint32_t max_request_size = 10485760;  // 10MB
};

/// Proxy behaviour: secrets, storage collaborator, allowlist, limits
struct ProxyConfig {
    std::string secret;  // HMAC key and service secret
    std::string storage_url = "http://127.0.0.1:4437/v1/stream";
    std::string public_origin;  // Origin for minted URLs; empty = derive from Host
    std::vector<std::string> allowlist;

    // Lifetimes (seconds)
    uint64_t url_expiration_seconds = 604800;  // 7 days
    uint64_t stream_ttl_seconds = 86400;       // 1 day

    // Timeouts (milliseconds)
    uint32_t upstream_connect_timeout = 10000;
    uint32_t forward_timeout = 60000;  // Until upstream headers arrive
    uint32_t connect_timeout = 30000;  // Connect/renew handler round trip
    uint32_t idle_timeout = 300000;    // Between upstream body chunks
    uint32_t storage_timeout = 10000;
    uint32_t long_poll_timeout = 30000;
    uint32_t sse_session_timeout = 60000;

    // Limits
    uint64_t max_response_bytes = 104857600;  // 100MB
    uint32_t max_error_body_bytes = 65536;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";    // debug, info, warning, error
    std::string format = "json";   // json, text
    std::string output = "stdout";  // "stdout" or a log directory (tether.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Tether configuration
struct Config {
    ServerConfig server;
    ProxyConfig proxy;
    LogConfig logging;

    std::string version = "1.0";
};

// ============================================================================
// from_json functions
// ============================================================================

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(4440));
    s.worker_threads = j.value("worker_threads", 0u);
    s.read_timeout = j.value("read_timeout", 60000u);
    s.write_timeout = j.value("write_timeout", 60000u);
    s.keep_alive_timeout = j.value("keep_alive_timeout", 5000u);
    s.max_request_size = j.value("max_request_size", 10485760u);
}

inline void from_json(const nlohmann::json& j, ProxyConfig& p) {
    p.secret = j.value("secret", std::string());
    p.storage_url = j.value("storage_url", std::string("http://127.0.0.1:4437/v1/stream"));
    p.public_origin = j.value("public_origin", std::string());
    p.allowlist = j.value("allowlist", std::vector<std::string>{});
    p.url_expiration_seconds = j.value("url_expiration_seconds", uint64_t(604800));
    p.stream_ttl_seconds = j.value("stream_ttl_seconds", uint64_t(86400));
    p.upstream_connect_timeout = j.value("upstream_connect_timeout", 10000u);
    p.forward_timeout = j.value("forward_timeout", 60000u);
    p.connect_timeout = j.value("connect_timeout", 30000u);
    p.idle_timeout = j.value("idle_timeout", 300000u);
    p.storage_timeout = j.value("storage_timeout", 10000u);
    p.long_poll_timeout = j.value("long_poll_timeout", 30000u);
    p.sse_session_timeout = j.value("sse_session_timeout", 60000u);
    p.max_response_bytes = j.value("max_response_bytes", uint64_t(104857600));
    p.max_error_body_bytes = j.value("max_error_body_bytes", 65536u);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("stdout"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("proxy")) {
        j.at("proxy").get_to(c.proxy);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
}

// ============================================================================
// to_json functions
// ============================================================================

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"worker_threads", s.worker_threads},
                       {"read_timeout", s.read_timeout},
                       {"write_timeout", s.write_timeout},
                       {"keep_alive_timeout", s.keep_alive_timeout},
                       {"max_request_size", s.max_request_size}};
}

inline void to_json(nlohmann::json& j, const ProxyConfig& p) {
    j = nlohmann::json{{"secret", p.secret},
                       {"storage_url", p.storage_url},
                       {"public_origin", p.public_origin},
                       {"allowlist", p.allowlist},
                       {"url_expiration_seconds", p.url_expiration_seconds},
                       {"stream_ttl_seconds", p.stream_ttl_seconds},
                       {"upstream_connect_timeout", p.upstream_connect_timeout},
                       {"forward_timeout", p.forward_timeout},
                       {"connect_timeout", p.connect_timeout},
                       {"idle_timeout", p.idle_timeout},
                       {"storage_timeout", p.storage_timeout},
                       {"long_poll_timeout", p.long_poll_timeout},
                       {"sse_session_timeout", p.sse_session_timeout},
                       {"max_response_bytes", p.max_response_bytes},
                       {"max_error_body_bytes", p.max_error_body_bytes}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["proxy"] = c.proxy;
    j["logging"] = c.logging;
    j["version"] = c.version;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Re-read the file; the previous snapshot stays live on failure
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    [[nodiscard]] bool load_and_swap();

    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace tether::control
