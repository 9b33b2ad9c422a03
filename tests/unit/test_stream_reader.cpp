// Tether Stream Reader Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <httplib.h>

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../../src/client/stream_reader.hpp"
#include "../../src/core/encoding.hpp"
#include "../../src/http/sse.hpp"

using namespace tether;
using namespace tether::client;

namespace {

std::string data_event(std::string_view bytes) {
    return http::format_sse_event("data", core::base64_encode(bytes));
}

std::string control_event(std::string_view next_offset) {
    return http::format_sse_event(
        "control", R"({"streamNextOffset":")" + std::string(next_offset) + R"(","upToDate":true})");
}

// Serves one scripted event-stream body per request, in order, then ends the response
class EventStreamServer {
public:
    explicit EventStreamServer(std::vector<std::string> bodies) : bodies_(std::move(bodies)) {
        server_.Get("/stream", [this](const httplib::Request& req, httplib::Response& res) {
            std::string body;
            {
                std::lock_guard lock(mutex_);
                offsets_.push_back(req.get_param_value("offset"));
                if (served_ < bodies_.size()) {
                    body = bodies_[served_++];
                }
            }
            res.set_chunked_content_provider(
                "text/event-stream", [body](size_t, httplib::DataSink& sink) {
                    if (!body.empty() && !sink.write(body.data(), body.size())) {
                        return false;
                    }
                    sink.done();
                    return true;
                });
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~EventStreamServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/stream";
    }

    [[nodiscard]] std::vector<std::string> offsets() const {
        std::lock_guard lock(mutex_);
        return offsets_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    mutable std::mutex mutex_;
    std::vector<std::string> bodies_;
    size_t served_ = 0;
    std::vector<std::string> offsets_;
};

StreamReader sse_reader() {
    StreamReaderOptions options;
    options.mode = ReadMode::Sse;
    options.read_timeout = std::chrono::milliseconds(3000);
    return StreamReader(options);
}

}  // namespace

TEST_CASE("SSE data waits for its control event", "[client][reader][sse]") {
    auto reader = sse_reader();
    std::string received;
    auto sink = [&](std::string_view bytes) { received.append(bytes); };

    SECTION("data confirmed by control is delivered and advances the offset") {
        EventStreamServer server({data_event("abc") + data_event("def") + control_event("6")});
        ReadPosition position;

        REQUIRE(reader.read(server.url(), position, sink));
        REQUIRE(received == "abcdef");
        REQUIRE(position.offset == "6");
        REQUIRE(position.up_to_date);
    }

    SECTION("connection cut after a data event is re-read from the old offset") {
        EventStreamServer server({control_event("3") + data_event("def"),
                                  data_event("def") + control_event("6")});
        ReadPosition position;

        REQUIRE(reader.read(server.url(), position, sink));
        REQUIRE(received.empty());
        REQUIRE(position.offset == "3");

        REQUIRE(reader.read(server.url(), position, sink));
        REQUIRE(received == "def");
        REQUIRE(position.offset == "6");

        auto offsets = server.offsets();
        REQUIRE(offsets.size() == 2);
        REQUIRE(offsets[0] == "-1");
        REQUIRE(offsets[1] == "3");
    }
}
