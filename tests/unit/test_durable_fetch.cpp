// Tether Durable Fetch Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "../../src/client/durable_fetch.hpp"
#include "../../src/client/errors.hpp"
#include "support/live_proxy.hpp"
#include "support/unwritable_store.hpp"

using namespace tether;
using namespace tether::client;
using tether::testing::kLiveSecret;
using tether::testing::LiveProxy;

namespace {

DurableFetchOptions fetch_options(const LiveProxy& proxy, std::shared_ptr<RequestStore> store) {
    DurableFetchOptions options;
    options.proxy_url = proxy.proxy_url() + "/";
    options.service_secret = kLiveSecret;
    options.store = std::move(store);
    options.reader.read_timeout = std::chrono::milliseconds(5000);
    options.poll_backoff = std::chrono::milliseconds(20);
    options.resume_timeout = std::chrono::milliseconds(400);
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

TEST_CASE("Stream ID from a capability URL", "[client][fetch]") {
    REQUIRE(stream_id_from_url("http://p.example/v1/proxy/abc?expires=1&signature=x") == "abc");
    REQUIRE(stream_id_from_url("http://p.example/v1/proxy/chat%2F1?expires=1&signature=x") ==
            "chat/1");
    REQUIRE(stream_id_from_url("http://p.example/v1/proxy/abc/") == "abc");
}

TEST_CASE("Durable fetch", "[client][fetch]") {
    LiveProxy proxy;
    auto store = std::make_shared<MemoryRequestStore>();
    DurableFetch fetch(fetch_options(proxy, store));
    auto key = mapping_key(kDefaultStorePrefix, proxy.proxy_url(), "req-1");

    auto first = fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
    REQUIRE_FALSE(first.was_resumed);
    REQUIRE(first.stream_id.size() == 36);
    REQUIRE(first.stream_url.find(first.stream_id) != std::string::npos);
    REQUIRE(first.response->id() == 1);
    REQUIRE(first.response->text() == "hello abc");
    REQUIRE(proxy.upstream().requests() == 1);

    auto mapping = store->load(key);
    REQUIRE(mapping.has_value());
    REQUIRE(mapping->response_id == 1);
    REQUIRE(mapping->stream_url == first.stream_url);

    SECTION("Repeating the request ID resumes the recorded response") {
        auto again = fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
        REQUIRE(again.was_resumed);
        REQUIRE(again.stream_id == first.stream_id);
        REQUIRE(again.response->id() == 1);
        REQUIRE(again.response->text() == "hello abc");
        REQUIRE(proxy.upstream().requests() == 1);
    }

    SECTION("A fresh instance resumes through a shared store") {
        DurableFetch other(fetch_options(proxy, store));
        auto again = other(proxy.upstream().url("/chat"), post("abc", "req-1"));
        REQUIRE(again.was_resumed);
        REQUIRE(again.response->text() == "hello abc");
        REQUIRE(proxy.upstream().requests() == 1);
    }

    SECTION("Requests without an ID always go upstream") {
        auto a = fetch(proxy.upstream().url("/chat"), post("x"));
        auto b = fetch(proxy.upstream().url("/chat"), post("x"));
        REQUIRE(a.stream_id != b.stream_id);
        REQUIRE(a.response->text() == "hello x");
        REQUIRE(b.response->text() == "hello x");
        REQUIRE(proxy.upstream().requests() == 3);
    }

    SECTION("A response that never starts falls back to a fresh request") {
        store->save(key, RequestMapping{9, first.stream_url});

        auto retried = fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
        REQUIRE_FALSE(retried.was_resumed);
        REQUIRE(retried.stream_id != first.stream_id);
        REQUIRE(retried.response->text() == "hello abc");
        REQUIRE(proxy.upstream().requests() == 2);

        auto replaced = store->load(key);
        REQUIRE(replaced.has_value());
        REQUIRE(replaced->stream_url == retried.stream_url);
    }

    SECTION("A deleted stream falls back to a fresh request") {
        REQUIRE(proxy.storage().remove(first.stream_id).status == 204);

        auto retried = fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
        REQUIRE_FALSE(retried.was_resumed);
        REQUIRE(retried.response->text() == "hello abc");
        REQUIRE(proxy.upstream().requests() == 2);
    }
}

TEST_CASE("Durable fetch with a store that cannot record mappings", "[client][fetch][store]") {
    LiveProxy proxy;
    auto store = std::make_shared<tether::testing::UnwritableRequestStore>();
    DurableFetch fetch(fetch_options(proxy, store));

    auto result = fetch(proxy.upstream().url("/chat"), post("abc", "req-1"));
    REQUIRE_FALSE(result.was_resumed);
    REQUIRE(result.response->id() == 1);
    REQUIRE(result.response->text() == "hello abc");
    REQUIRE(store->save_attempts() == 1);
}

TEST_CASE("Durable fetch errors", "[client][fetch]") {
    LiveProxy proxy;
    DurableFetch fetch(fetch_options(proxy, nullptr));

    SECTION("Disallowed upstream") {
        try {
            (void)fetch("http://example.invalid/chat", post("x"));
            FAIL("fetch should have been rejected");
        } catch (const ProxyError& e) {
            REQUIRE(e.code() == "UPSTREAM_NOT_ALLOWED");
            REQUIRE(e.status() == 403);
        }
    }

    SECTION("Unreachable proxy") {
        auto options = fetch_options(proxy, nullptr);
        options.proxy_url = "http://127.0.0.1:1/v1/proxy";
        options.reader.connect_timeout = std::chrono::milliseconds(500);
        DurableFetch offline(std::move(options));
        try {
            (void)offline(proxy.upstream().url("/chat"), post("x"));
            FAIL("fetch should have failed");
        } catch (const ProxyError& e) {
            REQUIRE(e.code() == "NETWORK_ERROR");
        }
    }
}

TEST_CASE("Durable fetch abort", "[client][fetch]") {
    LiveProxy proxy;
    DurableFetch fetch(fetch_options(proxy, nullptr));

    FetchOptions options;
    options.method = "GET";
    auto result = fetch(proxy.upstream().url("/slow"), std::move(options));
    REQUIRE(result.response->status() == 200);

    fetch.abort(result.stream_url, result.response->id());
    try {
        (void)result.response->text();
        FAIL("aborted body should throw");
    } catch (const wire::StreamError& e) {
        REQUIRE(e.state() == wire::TerminalState::Aborted);
        REQUIRE(e.code() == "ABORTED");
    }
}
