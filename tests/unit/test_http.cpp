// Tether HTTP Utilities Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/http/http.hpp"
#include "../../src/http/sse.hpp"
#include "../../src/http/url.hpp"

using namespace tether::http;

TEST_CASE("URL parsing", "[http][url]") {
    SECTION("defaults the port from the scheme") {
        auto url = parse_url("HTTPS://Api.Example.com/v1/chat?stream=true#frag");
        REQUIRE(url.has_value());
        REQUIRE(url->scheme == "https");
        REQUIRE(url->host == "api.example.com");
        REQUIRE(url->port == 443);
        REQUIRE_FALSE(url->explicit_port);
        REQUIRE(url->path == "/v1/chat");
        REQUIRE(url->query == "stream=true");
        REQUIRE(url->origin() == "https://api.example.com");
        REQUIRE(url->path_and_query() == "/v1/chat?stream=true");
    }

    SECTION("keeps explicit non-default ports") {
        auto url = parse_url("http://127.0.0.1:8080");
        REQUIRE(url.has_value());
        REQUIRE(url->port == 8080);
        REQUIRE(url->path == "/");
        REQUIRE(url->origin() == "http://127.0.0.1:8080");
        REQUIRE(url->authority() == "127.0.0.1:8080");
    }

    SECTION("handles IPv6 literals") {
        auto url = parse_url("http://[::1]:9000/x");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "[::1]");
        REQUIRE(url->port == 9000);
    }

    SECTION("rejects malformed input") {
        REQUIRE_FALSE(parse_url("").has_value());
        REQUIRE_FALSE(parse_url("not a url").has_value());
        REQUIRE_FALSE(parse_url("http://").has_value());
        REQUIRE_FALSE(parse_url("http://host:/x").has_value());
        REQUIRE_FALSE(parse_url("http://host:99999/").has_value());
        REQUIRE_FALSE(parse_url("http://bad host/").has_value());
    }
}

TEST_CASE("Query strings", "[http][url]") {
    SECTION("parse keeps order and decodes") {
        auto params = parse_query("a=1&b=hello%20world&c&d=x+y");
        REQUIRE(params.size() == 4);
        REQUIRE(params[0] == std::pair<std::string, std::string>{"a", "1"});
        REQUIRE(params[1].second == "hello world");
        REQUIRE(params[2].second.empty());
        REQUIRE(params[3].second == "x y");
    }

    SECTION("undecodable pairs are skipped") {
        auto params = parse_query("bad=%zz&ok=1");
        REQUIRE(params.size() == 1);
        REQUIRE(find_param(params, "ok") == "1");
        REQUIRE_FALSE(find_param(params, "bad").has_value());
    }

    SECTION("build encodes reserved characters") {
        QueryParams params{{"offset", "-1"}, {"sig", "a/b+c="}};
        REQUIRE(build_query(params) == "offset=-1&sig=a%2Fb%2Bc%3D");
    }
}

TEST_CASE("Percent encoding", "[http][url]") {
    REQUIRE(url::encode("chat/1 a") == "chat%2F1%20a");
    REQUIRE(url::encode("A-z_0.~") == "A-z_0.~");
    REQUIRE(url::decode("chat%2F1%20a") == "chat/1 a");
    REQUIRE_FALSE(url::decode("%4").has_value());
    REQUIRE_FALSE(url::decode("%G0").has_value());
}

TEST_CASE("Header helpers", "[http][headers]") {
    HeaderList headers{{"Content-Type", "application/json"}, {"Stream-Id", "abc"}};

    REQUIRE(find_header(headers, header::kContentType) == "application/json");
    REQUIRE(find_header(headers, "STREAM-ID") == "abc");
    REQUIRE_FALSE(find_header(headers, header::kLocation).has_value());

    REQUIRE(header_name_equals("Upstream-URL", header::kUpstreamUrl));
    REQUIRE(is_hop_by_hop("Connection"));
    REQUIRE(is_hop_by_hop("transfer-encoding"));
    REQUIRE_FALSE(is_hop_by_hop("Content-Type"));
}

TEST_CASE("Method and status helpers", "[http][method]") {
    REQUIRE(parse_method("POST") == Method::POST);
    REQUIRE(parse_method("BREW") == Method::UNKNOWN);
    REQUIRE(to_string(Method::DELETE) == "DELETE");

    STATIC_REQUIRE(is_success(204));
    STATIC_REQUIRE_FALSE(is_success(302));
    STATIC_REQUIRE(is_redirect(307));
    STATIC_REQUIRE_FALSE(is_redirect(404));
}

TEST_CASE("SSE formatting", "[http][sse]") {
    SECTION("single line") {
        REQUIRE(format_sse_event("data", "aGk=") == "event: data\ndata: aGk=\n\n");
    }

    SECTION("multi-line data is split") {
        REQUIRE(format_sse_event("control", "a\nb") == "event: control\ndata: a\ndata: b\n\n");
    }
}

TEST_CASE("SSE parsing", "[http][sse]") {
    SECTION("events split across chunks") {
        SseParser parser;
        REQUIRE(parser.feed("event: control\nda").empty());
        auto events = parser.feed("ta: {\"x\":1}\n\n");
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].event == "control");
        REQUIRE(events[0].data == "{\"x\":1}");
    }

    SECTION("CRLF endings, comments and default event name") {
        SseParser parser;
        auto events = parser.feed(": keepalive\r\ndata: one\r\ndata: two\r\nid: 7\r\n\r\n");
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].event == "message");
        REQUIRE(events[0].data == "one\ntwo");
        REQUIRE(events[0].id == "7");
    }

    SECTION("blank line without data dispatches nothing") {
        SseParser parser;
        REQUIRE(parser.feed("event: data\n\n").empty());
        auto events = parser.feed(format_sse_event("data", "x"));
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].event == "data");
    }
}
