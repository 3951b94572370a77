// ─────────────────────────────────────────────────────────────────────────────
// Metrics Collector Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "meshgate/metrics/metrics_collector.hpp"

#include <thread>
#include <vector>

using namespace meshgate;
using Catch::Matchers::WithinAbs;

TEST_CASE("MetricsCollector has no sample for unknown services", "[metrics]") {
    MetricsCollector collector;

    REQUIRE_FALSE(collector.snapshot("users").has_value());
    REQUIRE(collector.latencies("users").empty());
    REQUIRE(collector.services().empty());
}

TEST_CASE("MetricsCollector keeps an exact running mean", "[metrics]") {
    MetricsCollector collector;

    collector.record_request("users", 10.0, true);
    collector.record_request("users", 20.0, true);
    collector.record_request("users", 60.0, false);

    const auto sample = collector.snapshot("users");
    REQUIRE(sample.has_value());
    REQUIRE(sample->request_count == 3);
    REQUIRE(sample->error_count == 1);
    REQUIRE_THAT(sample->avg_response_time, WithinAbs(30.0, 1e-9));
}

TEST_CASE("MetricsCollector computes p95 over 1..100", "[metrics]") {
    MetricsCollector collector;

    for (int i = 1; i <= 100; ++i) {
        collector.record_request("users", static_cast<double>(i), true);
    }

    const auto sample = collector.snapshot("users");
    REQUIRE(sample.has_value());
    REQUIRE_THAT(sample->p95_response_time, WithinAbs(96.0, 1e-9));
    REQUIRE_THAT(sample->avg_response_time, WithinAbs(50.5, 1e-9));
}

TEST_CASE("MetricsCollector leaves p95 at zero until enough samples", "[metrics]") {
    MetricsCollector collector;

    for (int i = 0; i < 10; ++i) {
        collector.record_request("users", 100.0, true);
    }
    REQUIRE(collector.snapshot("users")->p95_response_time == 0.0);

    collector.record_request("users", 100.0, true);
    REQUIRE(collector.snapshot("users")->p95_response_time == 100.0);
}

TEST_CASE("MetricsCollector buffers only the most recent latencies", "[metrics]") {
    MetricsCollector collector;

    for (int i = 1; i <= 150; ++i) {
        collector.record_request("users", static_cast<double>(i), true);
    }

    const auto buffered = collector.latencies("users");
    REQUIRE(buffered.size() == MetricsCollector::kLatencyWindow);
    REQUIRE(buffered.front() == 51.0);
    REQUIRE(buffered.back() == 150.0);

    // p95 reflects the window only: sorted[95] of 51..150
    REQUIRE(collector.snapshot("users")->p95_response_time == 146.0);
}

TEST_CASE("MetricsCollector availability counts one phantom success", "[metrics]") {
    MetricsCollector collector;

    collector.record_request("users", 1.0, false);
    REQUIRE_THAT(collector.snapshot("users")->availability_percentage, WithinAbs(50.0, 1e-9));

    for (int i = 0; i < 3; ++i) {
        collector.record_request("users", 1.0, true);
    }
    // (4 + 1 - 1) / (4 + 1)
    REQUIRE_THAT(collector.snapshot("users")->availability_percentage, WithinAbs(80.0, 1e-9));
}

TEST_CASE("MetricsCollector tracks cache hits and degraded dispatch separately", "[metrics]") {
    MetricsCollector collector;

    collector.record_cache_hit("users");
    collector.record_cache_hit("users");
    collector.record_degraded_dispatch("users");

    const auto sample = collector.snapshot("users");
    REQUIRE(sample.has_value());
    REQUIRE(sample->cache_hits == 2);
    REQUIRE(sample->degraded_dispatches == 1);
    REQUIRE(sample->request_count == 0);
    REQUIRE(sample->availability_percentage == 100.0);
}

TEST_CASE("MetricsCollector remove drops a service", "[metrics]") {
    MetricsCollector collector;
    collector.record_request("users", 1.0, true);
    collector.record_request("orders", 1.0, true);

    REQUIRE(collector.services() == std::vector<std::string>{"orders", "users"});

    collector.remove("users");
    REQUIRE_FALSE(collector.snapshot("users").has_value());
    REQUIRE(collector.services() == std::vector<std::string>{"orders"});
}

TEST_CASE("MetricsCollector is safe under concurrent recording", "[metrics][concurrency]") {
    MetricsCollector collector;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&collector] {
            for (int i = 0; i < 250; ++i) {
                collector.record_request("users", 5.0, i % 5 != 0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto sample = collector.snapshot("users");
    REQUIRE(sample->request_count == 2000);
    REQUIRE(sample->error_count == 400);
    REQUIRE_THAT(sample->avg_response_time, WithinAbs(5.0, 1e-9));
}
