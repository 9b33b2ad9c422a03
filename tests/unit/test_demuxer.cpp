// Tether Frame Demuxer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include "../../src/wire/demuxer.hpp"

using namespace tether::wire;
using namespace std::chrono_literals;

namespace {

bool is_ready(const std::shared_future<ResponsePtr>& future) {
    return future.wait_for(0s) == std::future_status::ready;
}

}  // namespace

TEST_CASE("Demuxer routes interleaved responses", "[demuxer][routing]") {
    FrameDemuxer demuxer;

    auto second = demuxer.wait_for_response(2);
    REQUIRE_FALSE(is_ready(second));

    REQUIRE(demuxer.push(encode_start(1, 200, {{"content-type", "text/plain"}}) +
                         encode_start(2, 404, {}) + encode_data(1, "hel") + encode_data(2, "nf")));
    REQUIRE(is_ready(second));

    // Split a frame across pushes
    auto tail = encode_data(1, "lo") + encode_complete(1) + encode_complete(2);
    REQUIRE(demuxer.push(tail.substr(0, 4)));
    REQUIRE(demuxer.push(tail.substr(4)));

    auto first = demuxer.wait_for_response(1).get();
    REQUIRE(first->status() == 200);
    REQUIRE(first->header("Content-Type") == "text/plain");
    REQUIRE(first->text() == "hello");
    REQUIRE(first->terminal_state() == TerminalState::Complete);

    auto not_found = second.get();
    REQUIRE(not_found->id() == 2);
    REQUIRE_FALSE(not_found->ok());
    REQUIRE(not_found->text() == "nf");
}

TEST_CASE("Demuxer terminal frames", "[demuxer][terminal]") {
    FrameDemuxer demuxer;

    SECTION("abort surfaces after buffered data") {
        REQUIRE(demuxer.push(encode_start(1, 200, {}) + encode_data(1, "part") +
                             encode_abort(1)));
        auto response = demuxer.wait_for_response(1).get();
        REQUIRE(response->body().read() == "part");
        try {
            (void)response->body().read();
            FAIL("expected StreamError");
        } catch (const StreamError& e) {
            REQUIRE(e.state() == TerminalState::Aborted);
            REQUIRE(e.code() == "ABORTED");
        }
    }

    SECTION("error frame carries message and code") {
        REQUIRE(demuxer.push(encode_start(3, 200, {}) +
                             encode_error(3, "Upstream idle", "IDLE_TIMEOUT")));
        auto response = demuxer.wait_for_response(3).get();
        try {
            (void)response->text();
            FAIL("expected StreamError");
        } catch (const StreamError& e) {
            REQUIRE(std::string(e.what()) == "Upstream idle");
            REQUIRE(e.code() == "IDLE_TIMEOUT");
            REQUIRE(e.state() == TerminalState::Errored);
        }
    }
}

TEST_CASE("Demuxer duplicate handling", "[demuxer][policy]") {
    auto replay = encode_start(1, 200, {}) + encode_data(1, "x") + encode_complete(1);

    SECTION("tolerate drops replayed frames") {
        FrameDemuxer demuxer;
        REQUIRE(demuxer.push(replay));
        REQUIRE(demuxer.push(replay));
        REQUIRE(demuxer.push(encode_data(9, "orphan")));
        REQUIRE_FALSE(demuxer.is_terminal());
        REQUIRE(demuxer.wait_for_response(1).get()->text() == "x");
    }

    SECTION("strict treats reuse as fatal") {
        FrameDemuxer demuxer({.policy = DuplicatePolicy::Strict});
        auto pending = demuxer.wait_for_response(2);
        REQUIRE(demuxer.push(replay));
        REQUIRE_FALSE(demuxer.push(encode_start(1, 200, {})));

        REQUIRE(demuxer.is_terminal());
        REQUIRE(demuxer.failure().has_value());
        REQUIRE(demuxer.failure()->find("sequence violation") != std::string::npos);
        REQUIRE_THROWS_AS(pending.get(), DemuxerError);
    }
}

TEST_CASE("Demuxer fatal conditions", "[demuxer][errors]") {
    SECTION("decode error fails open responses") {
        FrameDemuxer demuxer;
        REQUIRE(demuxer.push(encode_start(1, 200, {})));
        auto response = demuxer.wait_for_response(1).get();

        REQUIRE_FALSE(demuxer.push("Z"));
        REQUIRE(demuxer.is_terminal());
        REQUIRE(response->body().wait_terminal() == TerminalState::Errored);
        REQUIRE_THROWS_AS(response->text(), StreamError);
        REQUIRE_FALSE(demuxer.push(encode_complete(1)));
    }

    SECTION("unread bytes beyond the budget") {
        FrameDemuxer demuxer({.max_buffer_bytes = 100});
        auto claimed = demuxer.wait_for_response(1);
        REQUIRE(demuxer.push(encode_start(1, 200, {}) + encode_data(1, std::string(50, 'a'))));
        REQUIRE(demuxer.buffered_bytes() == 50);
        REQUIRE_FALSE(demuxer.push(encode_data(1, std::string(60, 'b'))));
        REQUIRE(demuxer.failure()->find("buffer limit") != std::string::npos);
    }

    SECTION("unclaimed bodies do not count against the budget") {
        FrameDemuxer demuxer({.max_buffer_bytes = 100});
        REQUIRE(demuxer.push(encode_start(1, 200, {}) + encode_data(1, std::string(80, 'a'))));
        REQUIRE(demuxer.push(encode_data(1, std::string(80, 'b'))));
        REQUIRE(demuxer.buffered_bytes() == 0);
        REQUIRE(demuxer.unclaimed_bytes() == 160);

        // Claiming charges what is already queued
        auto response = demuxer.wait_for_response(1).get();
        REQUIRE(demuxer.unclaimed_bytes() == 0);
        REQUIRE(demuxer.buffered_bytes() == 160);
        REQUIRE_FALSE(demuxer.push(encode_data(1, "c")));
    }

    SECTION("reading frees budget") {
        FrameDemuxer demuxer({.max_buffer_bytes = 100});
        REQUIRE(demuxer.push(encode_start(1, 200, {}) + encode_data(1, std::string(50, 'a'))));
        auto response = demuxer.wait_for_response(1).get();
        REQUIRE(response->body().read()->size() == 50);
        REQUIRE(demuxer.buffered_bytes() == 0);
        REQUIRE(demuxer.push(encode_data(1, std::string(50, 'b'))));
    }

    SECTION("explicit error") {
        FrameDemuxer demuxer;
        REQUIRE(demuxer.push(encode_start(1, 200, {})));
        auto response = demuxer.wait_for_response(1).get();
        demuxer.error("storage gone");
        REQUIRE(demuxer.failure() == "storage gone");
        REQUIRE_THROWS_AS(demuxer.wait_for_response(5).get(), DemuxerError);
        try {
            (void)response->text();
            FAIL("expected StreamError");
        } catch (const StreamError& e) {
            REQUIRE(e.code() == "DEMUXER_ERROR");
        }
    }
}

TEST_CASE("Demuxer close", "[demuxer][close]") {
    FrameDemuxer demuxer;
    REQUIRE(demuxer.push(encode_start(1, 200, {}) + encode_start(2, 200, {}) + encode_complete(2)));
    auto open = demuxer.wait_for_response(1).get();
    auto waiting = demuxer.wait_for_response(3);

    demuxer.close();

    REQUIRE(demuxer.is_terminal());
    REQUIRE_FALSE(demuxer.failure().has_value());
    REQUIRE_THROWS_AS(waiting.get(), DemuxerError);

    try {
        (void)open->text();
        FAIL("expected StreamError");
    } catch (const StreamError& e) {
        REQUIRE(e.code() == "SESSION_CLOSED");
    }

    // Completed responses stay readable
    REQUIRE(demuxer.wait_for_response(2).get()->terminal_state() == TerminalState::Complete);
}

TEST_CASE("Demuxer response queue", "[demuxer][queue]") {
    FrameDemuxer demuxer;

    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        (void)demuxer.push(encode_start(7, 200, {}) + encode_start(8, 200, {}));
        std::this_thread::sleep_for(20ms);
        demuxer.close();
    });

    auto first = demuxer.next_response();
    REQUIRE(first.has_value());
    REQUIRE((*first)->id() == 7);

    auto second = demuxer.next_response();
    REQUIRE(second.has_value());
    REQUIRE((*second)->id() == 8);

    REQUIRE_FALSE(demuxer.next_response().has_value());
    producer.join();
}

TEST_CASE("Demuxer replay beyond the buffer limit", "[demuxer][replay]") {
    FrameDemuxer demuxer({.max_buffer_bytes = 100, .replay_window_bytes = 200});
    auto fresh = demuxer.wait_for_response(6);

    std::string history;
    for (uint32_t id = 1; id <= 5; ++id) {
        history += encode_start(id, 200, {}) + encode_data(id, std::string(80, 'h')) +
                   encode_complete(id);
    }
    REQUIRE(demuxer.push(history + encode_start(6, 200, {}) + encode_data(6, "new") +
                         encode_complete(6)));
    REQUIRE_FALSE(demuxer.is_terminal());
    REQUIRE(demuxer.unclaimed_bytes() <= 200);

    REQUIRE(fresh.get()->text() == "new");

    SECTION("recent history is still readable") {
        REQUIRE(demuxer.wait_for_response(5).get()->text() == std::string(80, 'h'));
    }

    SECTION("oldest unclaimed bodies were evicted") {
        auto oldest = demuxer.wait_for_response(1).get();
        try {
            (void)oldest->text();
            FAIL("expected StreamError");
        } catch (const StreamError& e) {
            REQUIRE(e.code() == "REPLAY_EVICTED");
            REQUIRE(e.state() == TerminalState::Errored);
        }
    }
}

TEST_CASE("Demuxer queue before the first consumer", "[demuxer][queue]") {
    FrameDemuxer demuxer({.retain_terminated = 2});
    std::string bytes;
    for (uint32_t id = 1; id <= 5; ++id) {
        bytes += encode_start(id, 200, {}) + encode_complete(id);
    }
    REQUIRE(demuxer.push(bytes));

    // Only retained responses are handed out; the rest were never queued
    auto first = demuxer.next_response();
    REQUIRE(first.has_value());
    REQUIRE((*first)->id() == 4);
    REQUIRE((*demuxer.next_response())->id() == 5);

    REQUIRE(demuxer.push(encode_start(6, 200, {})));
    REQUIRE((*demuxer.next_response())->id() == 6);

    demuxer.close();
    REQUIRE_FALSE(demuxer.next_response().has_value());
}

TEST_CASE("Demuxer retention of terminated responses", "[demuxer][retention]") {
    FrameDemuxer demuxer({.retain_terminated = 2});
    std::string bytes;
    for (uint32_t id = 1; id <= 3; ++id) {
        bytes += encode_start(id, 200, {}) + encode_complete(id);
    }
    REQUIRE(demuxer.push(bytes));

    REQUIRE_THROWS_AS(demuxer.wait_for_response(1).get(), DemuxerError);
    REQUIRE(demuxer.wait_for_response(2).get()->id() == 2);
    REQUIRE(demuxer.wait_for_response(3).get()->id() == 3);
}
