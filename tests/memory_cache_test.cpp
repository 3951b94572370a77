// ─────────────────────────────────────────────────────────────────────────────
// MemoryCache Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "meshgate/cache/response_cache.hpp"

#include <chrono>
#include <thread>

using namespace meshgate;
using namespace std::chrono_literals;

TEST_CASE("MemoryCache stores and returns values", "[cache]") {
    MemoryCache cache;

    REQUIRE_FALSE(cache.get("users:GET:/users/1").has_value());

    cache.set("users:GET:/users/1", "{\"id\":1}", 1min);
    const auto value = cache.get("users:GET:/users/1");
    REQUIRE(value.has_value());
    REQUIRE(*value == "{\"id\":1}");

    const auto stats = cache.stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.keys == 1);
}

TEST_CASE("MemoryCache expires entries after their TTL", "[cache]") {
    MemoryCache cache;

    cache.set("k", "v", 20ms);
    REQUIRE(cache.get("k").has_value());

    std::this_thread::sleep_for(40ms);

    REQUIRE_FALSE(cache.get("k").has_value());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("MemoryCache ignores non-positive TTLs", "[cache]") {
    MemoryCache cache;

    cache.set("zero", "v", 0ms);
    cache.set("negative", "v", -5ms);

    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.get("zero").has_value());
}

TEST_CASE("MemoryCache overwrite refreshes value and TTL", "[cache]") {
    MemoryCache cache;

    cache.set("k", "old", 20ms);
    cache.set("k", "new", 1min);
    std::this_thread::sleep_for(40ms);

    REQUIRE(cache.get("k") == std::optional<std::string>("new"));
    REQUIRE(cache.size() == 1);
}

TEST_CASE("MemoryCache evicts the oldest write when full", "[cache]") {
    MemoryCache cache(2);

    cache.set("a", "1", 1min);
    cache.set("b", "2", 1min);
    cache.set("a", "1b", 1min);  // rewrite moves a to the back
    cache.set("c", "3", 1min);

    REQUIRE(cache.size() == 2);
    REQUIRE_FALSE(cache.get("b").has_value());
    REQUIRE(cache.get("a").has_value());
    REQUIRE(cache.get("c").has_value());
}

TEST_CASE("MemoryCache del and flush", "[cache]") {
    MemoryCache cache;
    cache.set("a", "1", 1min);
    cache.set("b", "2", 1min);

    cache.del("a");
    cache.del("missing");
    REQUIRE(cache.size() == 1);

    cache.flush();
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.get("b").has_value());
}
