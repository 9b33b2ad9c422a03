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

// Tether Durable Streaming Proxy - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "proxy/registry.hpp"
#include "proxy/server.hpp"
#include "proxy/service.hpp"
#include "proxy/storage.hpp"

namespace {
std::atomic<bool> g_server_running{true};
std::atomic<bool> g_reload_requested{false};

// Global ConfigManager for hot-reload support
std::unique_ptr<tether::control::ConfigManager> g_config_manager;

void print_validation(const tether::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
}

void reload_config(tether::proxy::ProxyService& service) {
    printf("Reloading configuration from %s...\n",
           std::string(g_config_manager->config_path()).c_str());

    if (!g_config_manager->reload()) {
        fprintf(stderr, "ERROR: Failed to reload configuration, keeping previous settings\n");
        print_validation(g_config_manager->last_validation());
        return;
    }

    print_validation(g_config_manager->last_validation());
    service.update_config(g_config_manager->get());
    printf("SUCCESS: Configuration reloaded (storage_url changes apply on restart)\n");
}
}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_server_running = false;
    } else if (signal == SIGHUP) {
        // Reload runs on the main thread; only flag it here
        g_reload_requested = true;
    }
}

int main(int argc, char* argv[]) {
    printf("Tether durable-streaming proxy v0.1.0\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];

    printf("Loading configuration from %s...\n", config_path.c_str());
    g_config_manager = std::make_unique<tether::control::ConfigManager>();

    if (!g_config_manager->load(config_path)) {
        fprintf(stderr, "Failed to load configuration\n");
        print_validation(g_config_manager->last_validation());
        return EXIT_FAILURE;
    }
    print_validation(g_config_manager->last_validation());

    auto config = g_config_manager->get();
    if (!config) {
        fprintf(stderr, "Failed to get configuration\n");
        return EXIT_FAILURE;
    }

    tether::logging::init_logging_system();
    tether::logging::init_logger(config->logging);

    tether::proxy::HttpStorageOptions storage_options;
    storage_options.base_url = config->proxy.storage_url;
    storage_options.timeout = std::chrono::milliseconds(config->proxy.storage_timeout);
    storage_options.long_poll_timeout = std::chrono::milliseconds(config->proxy.long_poll_timeout);
    auto storage = std::make_shared<tether::proxy::HttpLogStorage>(storage_options);
    if (!storage->valid()) {
        fprintf(stderr, "Invalid storage_url: %s\n", config->proxy.storage_url.c_str());
        tether::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    auto registry = std::make_shared<tether::proxy::InProcessSessionRegistry>();
    auto service = std::make_shared<tether::proxy::ProxyService>(config, storage, registry);
    tether::proxy::ProxyServer server(config->server, service);

    // Install signal handlers for graceful shutdown and config reload
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGHUP, signal_handler);   // Config reload

    if (auto ec = server.start()) {
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        tether::logging::shutdown_logging();
        return EXIT_FAILURE;
    }
    printf("Listening on %s:%u\n", config->server.listen_address.c_str(), server.port());

    while (g_server_running && server.running()) {
        if (g_reload_requested.exchange(false)) {
            reload_config(*service);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    printf("\nShutting down: aborting in-flight responses...\n");
    server.stop();
    service->shutdown();

    printf("Tether stopped.\n");
    tether::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
