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

// Tether Configuration - Implementation

#include "config.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "../http/allowlist.hpp"
#include "../http/url.hpp"

namespace tether::control {

namespace {

void require_nonzero(uint64_t value, std::string_view name, ValidationResult& result) {
    if (value == 0) {
        result.add_error(fmt::format("{} must be > 0", name));
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open config file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Config error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }
    if (config.server.listen_address.empty()) {
        result.add_error("Server listen_address must not be empty");
    }
    require_nonzero(config.server.read_timeout, "server.read_timeout", result);
    require_nonzero(config.server.write_timeout, "server.write_timeout", result);
    require_nonzero(config.server.max_request_size, "server.max_request_size", result);

    // Proxy
    const auto& proxy = config.proxy;
    if (proxy.secret.empty()) {
        result.add_error("proxy.secret must not be empty");
    } else if (proxy.secret.size() < 16) {
        result.add_warning("proxy.secret is shorter than 16 bytes");
    }

    if (proxy.storage_url.empty()) {
        result.add_error("proxy.storage_url must not be empty");
    } else {
        auto storage = http::parse_url(proxy.storage_url);
        if (!storage || (storage->scheme != "http" && storage->scheme != "https")) {
            result.add_error(
                fmt::format("proxy.storage_url '{}' is not an http(s) URL", proxy.storage_url));
        }
    }

    if (!proxy.public_origin.empty() && !http::parse_url(proxy.public_origin)) {
        result.add_error(
            fmt::format("proxy.public_origin '{}' is not a valid URL", proxy.public_origin));
    }

    if (proxy.allowlist.empty()) {
        result.add_warning("proxy.allowlist is empty; every upstream will be rejected");
    } else {
        std::string error;
        if (!http::Allowlist::compile(proxy.allowlist, error)) {
            result.add_error(fmt::format("proxy.allowlist: {}", error));
        }
    }

    require_nonzero(proxy.url_expiration_seconds, "proxy.url_expiration_seconds", result);
    require_nonzero(proxy.stream_ttl_seconds, "proxy.stream_ttl_seconds", result);
    require_nonzero(proxy.upstream_connect_timeout, "proxy.upstream_connect_timeout", result);
    require_nonzero(proxy.forward_timeout, "proxy.forward_timeout", result);
    require_nonzero(proxy.connect_timeout, "proxy.connect_timeout", result);
    require_nonzero(proxy.idle_timeout, "proxy.idle_timeout", result);
    require_nonzero(proxy.storage_timeout, "proxy.storage_timeout", result);
    require_nonzero(proxy.long_poll_timeout, "proxy.long_poll_timeout", result);
    require_nonzero(proxy.sse_session_timeout, "proxy.sse_session_timeout", result);
    require_nonzero(proxy.max_response_bytes, "proxy.max_response_bytes", result);
    require_nonzero(proxy.max_error_body_bytes, "proxy.max_error_body_bytes", result);

    // Logging
    const auto& logging = config.logging;
    if (logging.level != "debug" && logging.level != "info" && logging.level != "warning" &&
        logging.level != "error") {
        result.add_error(fmt::format("logging.level '{}' is not one of debug, info, warning, error",
                                     logging.level));
    }
    if (logging.format != "json" && logging.format != "text") {
        result.add_error(fmt::format("logging.format '{}' must be json or text", logging.format));
    }
    if (logging.output.empty()) {
        result.add_error("logging.output must be 'stdout' or a directory");
    }
    require_nonzero(logging.rotation.max_size_mb, "logging.rotation.max_size_mb", result);
    require_nonzero(logging.rotation.max_files, "logging.rotation.max_files", result);

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;
    return load_and_swap();
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }
    return load_and_swap();
}

bool ConfigManager::load_and_swap() {
    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        last_validation_ = ValidationResult{};
        last_validation_.add_error(fmt::format("Failed to load {}", config_path_));
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU: readers holding the old snapshot keep it alive until they release it
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, new_config);
    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace tether::control
