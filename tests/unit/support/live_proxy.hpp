// In-process proxy over HTTP (ephemeral port) backed by MemoryLogStorage, for client tests

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "../../../src/proxy/server.hpp"
#include "../../../src/proxy/service.hpp"
#include "memory_storage.hpp"
#include "scripted_upstream.hpp"

namespace tether::testing {

inline constexpr const char* kLiveSecret = "client-test-secret-value";

class LiveProxy {
public:
    explicit LiveProxy(uint64_t url_expiration_seconds = 3600) {
        control::Config config;
        config.proxy.secret = kLiveSecret;
        config.proxy.allowlist = {"http://127.0.0.1:*/**"};
        config.proxy.url_expiration_seconds = url_expiration_seconds;
        config.proxy.forward_timeout = 3000;
        config.proxy.connect_timeout = 3000;
        config.proxy.idle_timeout = 3000;
        config.proxy.sse_session_timeout = 400;

        control::ServerConfig server_config;
        server_config.listen_address = "127.0.0.1";
        server_config.listen_port = 0;
        server_config.worker_threads = 8;

        service_ = std::make_shared<proxy::ProxyService>(
            std::make_shared<const control::Config>(std::move(config)), storage_,
            std::make_shared<proxy::InProcessSessionRegistry>());
        server_ = std::make_unique<proxy::ProxyServer>(server_config, service_);
        if (auto ec = server_->start()) {
            throw std::runtime_error("live proxy failed to start: " + ec.message());
        }
    }

    ~LiveProxy() { server_->stop(); }

    LiveProxy(const LiveProxy&) = delete;
    LiveProxy& operator=(const LiveProxy&) = delete;

    [[nodiscard]] std::string proxy_url() const {
        return "http://127.0.0.1:" + std::to_string(server_->port()) + "/v1/proxy";
    }

    [[nodiscard]] MemoryLogStorage& storage() noexcept { return *storage_; }
    [[nodiscard]] ScriptedUpstream& upstream() noexcept { return upstream_; }

private:
    std::shared_ptr<MemoryLogStorage> storage_ = std::make_shared<MemoryLogStorage>();
    std::shared_ptr<proxy::ProxyService> service_;
    std::unique_ptr<proxy::ProxyServer> server_;
    ScriptedUpstream upstream_;
};

}  // namespace tether::testing
