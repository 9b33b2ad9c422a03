// Tether Request Store Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "../../src/client/request_store.hpp"

using namespace tether::client;

namespace {

std::filesystem::path temp_store_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("tether_store_" + name + ".json");
    std::filesystem::remove(path);
    return path;
}

}  // namespace

TEST_CASE("Mapping keys", "[client][store]") {
    SECTION("Standalone requests") {
        REQUIRE(mapping_key("durable-streams:", "https://p.example/v1/proxy", "req-1") ==
                "durable-streams:https://p.example/v1/proxy:req-1");
    }

    SECTION("Session requests include the session ID") {
        REQUIRE(mapping_key("durable-streams:", "https://p.example/v1/proxy", "req-1", "chat") ==
                "durable-streams:https://p.example/v1/proxy:chat:req-1");
    }

    SECTION("Sessions do not collide with standalone requests") {
        REQUIRE(mapping_key("p:", "u", "r", "s") != mapping_key("p:", "u", "r"));
    }
}

TEST_CASE("Memory request store", "[client][store]") {
    MemoryRequestStore store;

    REQUIRE_FALSE(store.load("k").has_value());

    store.save("k", RequestMapping{3, "http://proxy/v1/proxy/s?expires=1&signature=x"});
    auto loaded = store.load("k");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->response_id == 3);
    REQUIRE(loaded->stream_url == "http://proxy/v1/proxy/s?expires=1&signature=x");

    store.save("k", RequestMapping{4, {}});
    REQUIRE(store.load("k")->response_id == 4);
    REQUIRE(store.load("k")->stream_url.empty());

    store.remove("k");
    REQUIRE_FALSE(store.load("k").has_value());
    store.remove("k");
}

TEST_CASE("File request store persists across instances", "[client][store]") {
    auto path = temp_store_path("persist");

    {
        FileRequestStore store(path);
        REQUIRE_FALSE(store.load("a").has_value());
        store.save("a", RequestMapping{1, "http://proxy/v1/proxy/a"});
        store.save("b", RequestMapping{7, {}});
        REQUIRE(std::filesystem::exists(path));
    }

    {
        FileRequestStore store(path);
        auto a = store.load("a");
        REQUIRE(a.has_value());
        REQUIRE(a->response_id == 1);
        REQUIRE(a->stream_url == "http://proxy/v1/proxy/a");

        auto b = store.load("b");
        REQUIRE(b.has_value());
        REQUIRE(b->response_id == 7);
        REQUIRE(b->stream_url.empty());

        store.remove("a");
    }

    {
        FileRequestStore store(path);
        REQUIRE_FALSE(store.load("a").has_value());
        REQUIRE(store.load("b").has_value());
    }

    auto tmp = path;
    tmp += ".tmp";
    REQUIRE_FALSE(std::filesystem::exists(tmp));
    std::filesystem::remove(path);
}

TEST_CASE("File request store edge cases", "[client][store]") {
    SECTION("Empty file is an empty store") {
        auto path = temp_store_path("empty");
        std::ofstream(path).close();
        FileRequestStore store(path);
        REQUIRE_FALSE(store.load("x").has_value());
        std::filesystem::remove(path);
    }

    SECTION("Corrupt file is rejected") {
        auto path = temp_store_path("corrupt");
        std::ofstream(path) << "{ not json";
        REQUIRE_THROWS_AS(FileRequestStore{path}, std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("Entry without a response ID is rejected") {
        auto path = temp_store_path("missing_id");
        std::ofstream(path) << R"({"k": {"streamUrl": "http://proxy/s"}})";
        REQUIRE_THROWS_AS(FileRequestStore{path}, std::runtime_error);
        std::filesystem::remove(path);
    }
}
