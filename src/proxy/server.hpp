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

// Tether Proxy Server - Header
// Binds ProxyService to an HTTP/1.1 listener (cpp-httplib)

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "../control/config.hpp"
#include "service.hpp"

namespace httplib {
class Server;
}  // namespace httplib

namespace tether::proxy {

class ProxyServer {
public:
    ProxyServer(control::ServerConfig config, std::shared_ptr<ProxyService> service);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    /// Bind and start accepting on a background thread. Port 0 binds any free port.
    [[nodiscard]] std::error_code start();

    /// Stop accepting and join the listener thread
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    /// Port actually bound (valid after start())
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }

    [[nodiscard]] ProxyService& service() noexcept { return *service_; }

private:
    void configure_routes(httplib::Server& server);

    control::ServerConfig config_;
    std::shared_ptr<ProxyService> service_;

    std::mutex mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;
};

}  // namespace tether::proxy
