// Scripted upstream HTTP server for proxy tests (cpp-httplib on an ephemeral port)

#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace tether::testing {

class ScriptedUpstream {
public:
    ScriptedUpstream() {
        server_.Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
            ++requests_;
            {
                std::lock_guard lock(mutex_);
                last_authorization_ = req.get_header_value("Authorization");
            }
            res.set_content("hello " + req.body, "text/plain");
        });

        server_.Get("/json", [this](const httplib::Request&, httplib::Response& res) {
            ++requests_;
            res.set_content(R"({"ok":true})", "application/json");
        });

        server_.Get("/redirect", [this](const httplib::Request&, httplib::Response& res) {
            ++requests_;
            res.set_redirect("/json");
        });

        server_.Get("/fail", [this](const httplib::Request&, httplib::Response& res) {
            ++requests_;
            res.status = 500;
            res.set_content("boom", "text/plain");
        });

        // Ticks until the client goes away (or about 5 seconds pass)
        server_.Get("/slow", [this](const httplib::Request&, httplib::Response& res) {
            ++requests_;
            res.set_chunked_content_provider("text/plain", [](size_t, httplib::DataSink& sink) {
                for (int i = 0; i < 250 && sink.is_writable(); ++i) {
                    if (!sink.write("tick", 4)) {
                        return false;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                }
                sink.done();
                return true;
            });
        });

        // Error status whose body trickles for about 10 seconds
        server_.Get("/slow-fail", [this](const httplib::Request&, httplib::Response& res) {
            ++requests_;
            res.status = 500;
            res.set_chunked_content_provider("text/plain", [](size_t, httplib::DataSink& sink) {
                for (int i = 0; i < 500 && sink.is_writable(); ++i) {
                    if (!sink.write("err", 3)) {
                        return false;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                }
                sink.done();
                return true;
            });
        });

        server_.Post("/connect", [this](const httplib::Request& req, httplib::Response& res) {
            ++requests_;
            {
                std::lock_guard lock(mutex_);
                last_stream_id_ = req.get_header_value("Stream-Id");
            }
            res.set_header("Stream-Next-Offset", "0");
            res.set_content(R"({"session":"ok"})", "application/json");
        });

        server_.Post("/deny", [this](const httplib::Request&, httplib::Response& res) {
            ++requests_;
            res.status = 403;
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~ScriptedUpstream() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ScriptedUpstream(const ScriptedUpstream&) = delete;
    ScriptedUpstream& operator=(const ScriptedUpstream&) = delete;

    [[nodiscard]] std::string url(std::string_view path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + std::string(path);
    }

    [[nodiscard]] int requests() const noexcept { return requests_.load(); }
    [[nodiscard]] std::string last_authorization() const {
        std::lock_guard lock(mutex_);
        return last_authorization_;
    }
    [[nodiscard]] std::string last_stream_id() const {
        std::lock_guard lock(mutex_);
        return last_stream_id_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::atomic<int> requests_{0};
    mutable std::mutex mutex_;
    std::string last_authorization_;
    std::string last_stream_id_;
};

}  // namespace tether::testing
