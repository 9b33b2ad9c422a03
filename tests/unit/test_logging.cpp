// Tether Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace tether::logging;

TEST_CASE("Correlation IDs", "[logging][correlation_id]") {
    SECTION("generated IDs validate") {
        for (int i = 0; i < 50; ++i) {
            REQUIRE(is_valid_uuid(generate_correlation_id()));
        }
    }

    SECTION("same thread shares the UUID and advances the counter") {
        std::string first = generate_correlation_id();
        std::string second = generate_correlation_id();

        REQUIRE(first != second);
        REQUIRE(first.substr(0, 36) == second.substr(0, 36));
        REQUIRE(std::stoull(second.substr(37)) > std::stoull(first.substr(37)));
    }

    SECTION("different threads get different UUIDs") {
        std::string here = generate_correlation_id();
        std::string there;
        std::thread worker([&] { there = generate_correlation_id(); });
        worker.join();

        REQUIRE(is_valid_uuid(there));
        REQUIRE(here.substr(0, 36) != there.substr(0, 36));
    }
}

TEST_CASE("UUID validation", "[logging][validation]") {
    SECTION("accepts v4 UUIDs with a numeric counter") {
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-BBCD-EF0123456789#42"));
    }

    SECTION("rejects malformed IDs") {
        REQUIRE_FALSE(is_valid_uuid(""));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#1x"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));  // v3
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));  // variant c
        REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#4#2"));
    }
}

TEST_CASE("Logger access", "[logging][logger]") {
    // Configured by the global test fixture
    REQUIRE(logger() != nullptr);
    REQUIRE(logger() == logger());
}
