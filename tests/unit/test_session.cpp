// Tether Durable Session Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "../../src/client/durable_session.hpp"
#include "../../src/client/errors.hpp"
#include "support/live_proxy.hpp"
#include "support/unwritable_store.hpp"

using namespace tether;
using namespace tether::client;
using tether::testing::kLiveSecret;
using tether::testing::LiveProxy;

namespace {

SessionOptions session_options(const LiveProxy& proxy, std::string session_id,
                               std::shared_ptr<RequestStore> store = nullptr) {
    SessionOptions options;
    options.proxy_url = proxy.proxy_url();
    options.service_secret = kLiveSecret;
    options.session_id = std::move(session_id);
    options.store = std::move(store);
    options.reader.read_timeout = std::chrono::milliseconds(5000);
    options.poll_backoff = std::chrono::milliseconds(20);
    return options;
}

FetchOptions post(std::string body, std::optional<std::string> request_id = std::nullopt) {
    FetchOptions options;
    options.body = std::move(body);
    options.headers = {{"Content-Type", "text/plain"}};
    options.request_id = std::move(request_id);
    return options;
}

}  // namespace

TEST_CASE("Session connect", "[client][session]") {
    LiveProxy proxy;

    SECTION("Connect mints a stream URL for the session") {
        DurableSession session(session_options(proxy, "session-a"));
        REQUIRE_FALSE(session.stream_url().has_value());

        session.connect();
        auto url = session.stream_url();
        REQUIRE(url.has_value());
        REQUIRE(url->find("/v1/proxy/session-a?") != std::string::npos);
        REQUIRE(url->find("expires=") != std::string::npos);
        REQUIRE(url->find("signature=") != std::string::npos);
        REQUIRE(session.stream_id() == "session-a");
        REQUIRE(proxy.storage().bytes("session-a").has_value());
    }

    SECTION("Connect handler sees the session's stream ID") {
        auto options = session_options(proxy, "with-handler");
        options.connect_url = proxy.upstream().url("/connect");
        DurableSession session(std::move(options));

        session.connect();
        REQUIRE(session.stream_url().has_value());
        REQUIRE(proxy.upstream().last_stream_id() == "with-handler");
    }

    SECTION("Rejected connect surfaces the proxy error") {
        auto options = session_options(proxy, "denied");
        options.connect_url = proxy.upstream().url("/deny");
        DurableSession session(std::move(options));

        try {
            session.connect();
            FAIL("connect should have been rejected");
        } catch (const ProxyError& e) {
            REQUIRE(e.code() == "CONNECT_REJECTED");
            REQUIRE(e.status() == 401);
        }
        REQUIRE_FALSE(session.stream_url().has_value());
    }

    SECTION("Wrong secret") {
        auto options = session_options(proxy, "bad-secret");
        options.service_secret = "not-the-secret";
        DurableSession session(std::move(options));

        try {
            session.connect();
            FAIL("connect should have failed");
        } catch (const ProxyError& e) {
            REQUIRE(e.status() == 401);
        }
    }

    SECTION("Concurrent connects share one attempt") {
        DurableSession session(session_options(proxy, "racing"));
        std::vector<std::thread> threads;
        std::atomic<int> failures{0};
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&] {
                try {
                    session.connect();
                } catch (const ProxyError&) {
                    ++failures;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(failures.load() == 0);
        REQUIRE(session.stream_url().has_value());
    }
}

TEST_CASE("Session fetch", "[client][session]") {
    LiveProxy proxy;
    auto store = std::make_shared<MemoryRequestStore>();
    DurableSession session(session_options(proxy, "chat-1", store));

    auto first = session.fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
    REQUIRE(first->id() == 1);
    REQUIRE(first->status() == 200);
    REQUIRE(first->header("content-type").value_or("").starts_with("text/plain"));
    REQUIRE(first->text() == "hello abc");

    auto second = session.fetch(proxy.upstream().url("/chat"), post("def"));
    REQUIRE(second->id() == 2);
    REQUIRE(second->text() == "hello def");

    SECTION("Request IDs are recorded against the session") {
        auto key = mapping_key(kDefaultStorePrefix, proxy.proxy_url(), "req-1", "chat-1");
        auto mapping = store->load(key);
        REQUIRE(mapping.has_value());
        REQUIRE(mapping->response_id == 1);
        REQUIRE(mapping->stream_url.empty());
    }

    SECTION("Repeating a request ID resumes instead of calling upstream") {
        DurableSession resumed(session_options(proxy, "chat-1", store));
        auto again = resumed.fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
        REQUIRE(again->id() == 1);
        REQUIRE(again->text() == "hello abc");
        REQUIRE(proxy.upstream().requests() == 2);
    }

    SECTION("Responses are observable in log order") {
        DurableSession observer(session_options(proxy, "chat-1"));
        auto a = observer.next_response();
        auto b = observer.next_response();
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE((*a)->id() == 1);
        REQUIRE((*b)->id() == 2);
        REQUIRE((*b)->text() == "hello def");
        observer.close();
        REQUIRE_FALSE(observer.next_response().has_value());
    }

    SECTION("Authorization is relabelled for the upstream") {
        auto options = post("auth");
        options.headers.emplace_back("Authorization", "Bearer upstream-token");
        auto response = session.fetch(proxy.upstream().url("/chat"), std::move(options));
        REQUIRE(response->text() == "hello auth");
        REQUIRE(proxy.upstream().last_authorization() == "Bearer upstream-token");
    }

    SECTION("Upstream failures are reported without touching the stream") {
        FetchOptions options;
        options.method = "GET";
        try {
            (void)session.fetch(proxy.upstream().url("/fail"), std::move(options));
            FAIL("fetch should have failed");
        } catch (const ProxyError& e) {
            REQUIRE(e.status() == 502);
        }
        auto third = session.fetch(proxy.upstream().url("/chat"), post("ghi"));
        REQUIRE(third->id() == 3);
    }

    SECTION("A request store that cannot record the mapping does not fail the fetch") {
        auto unwritable = std::make_shared<tether::testing::UnwritableRequestStore>();
        DurableSession forgetful(session_options(proxy, "chat-1", unwritable));
        auto response = forgetful.fetch(proxy.upstream().url("/chat"), post("kept", "req-9"));
        REQUIRE(response->id() == 3);
        REQUIRE(response->text() == "hello kept");
        REQUIRE(unwritable->save_attempts() == 1);
    }

    SECTION("Closed sessions refuse new requests") {
        int before = proxy.upstream().requests();
        session.close();
        REQUIRE(session.closed());
        try {
            (void)session.fetch(proxy.upstream().url("/chat"), post("late"));
            FAIL("fetch after close should fail");
        } catch (const ProxyError& e) {
            REQUIRE(e.code() == "SESSION_CLOSED");
        }
        REQUIRE(proxy.upstream().requests() == before);
    }
}

TEST_CASE("Session replays history larger than the buffer limit", "[client][session][replay]") {
    LiveProxy proxy;

    // Five finished 1 MiB responses nobody on the new session asks for
    const std::string large(1024 * 1024, 'x');
    std::string history;
    for (uint32_t id = 1; id <= 5; ++id) {
        history += wire::encode_start(id, 200, {{"content-type", "text/plain"}}) +
                   wire::encode_data(id, large) + wire::encode_complete(id);
    }
    proxy.storage().inject("long-history", history);
    REQUIRE(history.size() > wire::DemuxerOptions{}.max_buffer_bytes);

    DurableSession session(session_options(proxy, "long-history"));
    auto fresh = session.fetch(proxy.upstream().url("/chat"), post("fresh"));
    REQUIRE(fresh->id() == 6);
    REQUIRE(fresh->text() == "hello fresh");

    auto second = session.fetch(proxy.upstream().url("/chat"), post("again"));
    REQUIRE(second->id() == 7);
    REQUIRE(second->text() == "hello again");
}

namespace {

bool wait_for_read_failures(LiveProxy& proxy, int remaining) {
    for (int i = 0; i < 250; ++i) {
        if (proxy.storage().failing_live_reads() <= remaining) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

}  // namespace

TEST_CASE("Session retries transient storage read failures", "[client][session][storage]") {
    LiveProxy proxy;
    auto options = session_options(proxy, "flaky-reads");
    options.storage_retries = 2;
    options.retry_base = std::chrono::milliseconds(10);

    SECTION("failures within the retry limit are absorbed") {
        DurableSession session(std::move(options));
        REQUIRE(session.fetch(proxy.upstream().url("/chat"), post("one"))->text() == "hello one");

        proxy.storage().set_failing_live_reads(2);
        REQUIRE(wait_for_read_failures(proxy, 0));

        auto second = session.fetch(proxy.upstream().url("/chat"), post("two"));
        REQUIRE(second->id() == 2);
        REQUIRE(second->text() == "hello two");
    }

    SECTION("failures past the retry limit fail the session's demuxer") {
        DurableSession session(std::move(options));
        REQUIRE(session.fetch(proxy.upstream().url("/chat"), post("one"))->text() == "hello one");

        // Initial attempt plus two retries
        proxy.storage().set_failing_live_reads(100);
        REQUIRE(wait_for_read_failures(proxy, 97));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        REQUIRE_THROWS_AS(session.fetch(proxy.upstream().url("/chat"), post("two")),
                          wire::DemuxerError);
        REQUIRE(proxy.storage().failing_live_reads() == 97);
    }
}

TEST_CASE("Session over SSE", "[client][session][sse]") {
    LiveProxy proxy;
    auto options = session_options(proxy, "sse-session");
    options.reader.mode = ReadMode::Sse;
    DurableSession session(std::move(options));

    auto first = session.fetch(proxy.upstream().url("/chat"), post("one"));
    REQUIRE(first->text() == "hello one");

    // Outlives the proxy's SSE session window, so the reader reconnects in between
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    auto second = session.fetch(proxy.upstream().url("/chat"), post("two"));
    REQUIRE(second->id() == 2);
    REQUIRE(second->text() == "hello two");
}

TEST_CASE("Session abort", "[client][session]") {
    LiveProxy proxy;
    DurableSession session(session_options(proxy, "aborting"));

    FetchOptions options;
    options.method = "GET";
    auto response = session.fetch(proxy.upstream().url("/slow"), std::move(options));
    REQUIRE(response->status() == 200);

    session.abort(response->id());
    try {
        (void)response->text();
        FAIL("aborted body should throw");
    } catch (const wire::StreamError& e) {
        REQUIRE(e.state() == wire::TerminalState::Aborted);
    }
}

TEST_CASE("Session cancellation", "[client][session]") {
    LiveProxy proxy;
    DurableSession session(session_options(proxy, "cancelled"));
    session.connect();

    std::stop_source source;
    source.request_stop();
    auto options = post("never");
    options.stop = source.get_token();

    REQUIRE_THROWS_AS(session.fetch(proxy.upstream().url("/chat"), std::move(options)), Cancelled);
    REQUIRE(proxy.upstream().requests() == 0);
}

TEST_CASE("Session renews an expired stream URL", "[client][session]") {
    LiveProxy proxy;
    auto store = std::make_shared<MemoryRequestStore>();

    {
        DurableSession writer(session_options(proxy, "renewing", store));
        auto response = writer.fetch(proxy.upstream().url("/chat"), post("kept", "req-r"));
        REQUIRE(response->text() == "hello kept");
    }

    auto options = session_options(proxy, "renewing", store);
    options.signed_url_ttl = 1;
    DurableSession reader(std::move(options));
    reader.connect();
    auto initial = reader.stream_url();
    REQUIRE(initial.has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(2100));

    auto resumed = reader.fetch(proxy.upstream().url("/chat"), post("kept", "req-r"));
    REQUIRE(resumed->id() == 1);
    REQUIRE(resumed->text() == "hello kept");
    REQUIRE(reader.stream_url() != initial);
    REQUIRE(proxy.upstream().requests() == 1);
}

TEST_CASE("Concurrent fetches on one session", "[client][session][concurrency]") {
    LiveProxy proxy;
    DurableSession session(session_options(proxy, "fan-out"));
    session.connect();

    constexpr int kRequests = 5;
    std::vector<uint32_t> ids(kRequests, 0);
    std::vector<std::string> bodies(kRequests);
    std::vector<std::thread> threads;
    for (int i = 0; i < kRequests; ++i) {
        threads.emplace_back([&, i] {
            try {
                auto response =
                    session.fetch(proxy.upstream().url("/chat"), post(std::to_string(i)));
                ids[i] = response->id();
                bodies[i] = response->text();
            } catch (const std::exception& e) {
                bodies[i] = e.what();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::sort(ids.begin(), ids.end());
    for (int i = 0; i < kRequests; ++i) {
        REQUIRE(ids[i] == static_cast<uint32_t>(i + 1));
        REQUIRE(bodies[i] == "hello " + std::to_string(i));
    }
}
