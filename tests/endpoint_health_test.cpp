// ─────────────────────────────────────────────────────────────────────────────
// EndpointHealth Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "meshgate/health/endpoint_health.hpp"

using namespace meshgate;

TEST_CASE("EndpointHealth starts registered and serving", "[health]") {
    EndpointHealth health;

    REQUIRE(health.state() == EndpointState::Registered);
    REQUIRE(health.is_healthy());
    REQUIRE(health.consecutive_failures() == 0);
    REQUIRE_FALSE(health.last_check().has_value());
}

TEST_CASE("EndpointHealth marks unhealthy at the failure threshold", "[health]") {
    EndpointHealth health(3);

    REQUIRE_FALSE(health.record_failure().has_value());
    REQUIRE_FALSE(health.record_failure().has_value());
    REQUIRE(health.is_healthy());

    const auto transition = health.record_failure();
    REQUIRE(transition.has_value());
    REQUIRE(transition->from == EndpointState::Registered);
    REQUIRE(transition->to == EndpointState::Unhealthy);
    REQUIRE_FALSE(health.is_healthy());
    REQUIRE(health.consecutive_failures() == 3);

    // Further failures do not re-announce
    REQUIRE_FALSE(health.record_failure().has_value());
    REQUIRE(health.consecutive_failures() == 4);
}

TEST_CASE("EndpointHealth success resets the failure streak", "[health]") {
    EndpointHealth health(3);

    health.record_failure();
    health.record_failure();
    const auto promoted = health.record_success();

    REQUIRE(promoted.has_value());
    REQUIRE(promoted->to == EndpointState::Healthy);
    REQUIRE(health.consecutive_failures() == 0);

    health.record_failure();
    health.record_failure();
    REQUIRE(health.is_healthy());
}

TEST_CASE("EndpointHealth live success restores an unhealthy endpoint", "[health]") {
    EndpointHealth health(3);
    health.record_failure();
    health.record_failure();
    health.record_failure();
    REQUIRE(health.state() == EndpointState::Unhealthy);

    const auto restored = health.record_success();
    REQUIRE(restored.has_value());
    REQUIRE(restored->from == EndpointState::Unhealthy);
    REQUIRE(restored->to == EndpointState::Healthy);
    REQUIRE(health.is_healthy());
    REQUIRE(health.consecutive_failures() == 0);

    // Already healthy: no further transition
    REQUIRE_FALSE(health.record_success().has_value());
}

TEST_CASE("EndpointHealth live success clears a probe error state", "[health]") {
    EndpointHealth health(3);
    health.record_probe_error("probe crashed");
    REQUIRE(health.state() == EndpointState::Error);

    health.record_success();
    REQUIRE(health.state() == EndpointState::Healthy);
}

TEST_CASE("EndpointHealth probe success recovers", "[health]") {
    EndpointHealth health(1);
    health.record_failure();

    const auto transition = health.record_probe_success();
    REQUIRE(transition.has_value());
    REQUIRE(transition->from == EndpointState::Unhealthy);
    REQUIRE(transition->to == EndpointState::Healthy);
    REQUIRE(health.is_healthy());
}

TEST_CASE("EndpointHealth probe error moves to Error and keeps the message", "[health]") {
    EndpointHealth health(5);

    const auto transition = health.record_probe_error("connection reset");
    REQUIRE(transition.has_value());
    REQUIRE(transition->to == EndpointState::Error);
    REQUIRE_FALSE(health.is_healthy());
    REQUIRE(health.last_error() == "connection reset");
    REQUIRE(health.last_check().has_value());

    health.record_probe_success();
    REQUIRE(health.last_error().empty());
}

TEST_CASE("EndpointHealth clamps a zero threshold to one", "[health]") {
    EndpointHealth health(0);

    REQUIRE(health.failure_threshold() == 1);
    REQUIRE(health.record_failure().has_value());
}

TEST_CASE("EndpointState names and serving predicate", "[health]") {
    REQUIRE(to_string(EndpointState::Registered) == "registered");
    REQUIRE(to_string(EndpointState::Unhealthy) == "unhealthy");
    REQUIRE(is_serving(EndpointState::Registered));
    REQUIRE(is_serving(EndpointState::Healthy));
    REQUIRE_FALSE(is_serving(EndpointState::Unhealthy));
    REQUIRE_FALSE(is_serving(EndpointState::Error));
}
