#ifndef MESHGATE_REGISTRY_SERVICE_CONFIG_HPP
#define MESHGATE_REGISTRY_SERVICE_CONFIG_HPP

#include "meshgate/gateway/request.hpp"
#include "meshgate/resilience/circuit_breaker.hpp"
#include "meshgate/routing/load_balancer.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// EndpointConfig
// ─────────────────────────────────────────────────────────────────────────────

struct EndpointConfig {
    /// Target identifier and route prefix. An absolute http(s) URL without a
    /// handler is served through the gateway's HTTP client.
    std::string path;

    /// Used only by the weighted strategy. Must be >= 0.
    double weight{1.0};

    EndpointHandler handler;

    /// Endpoint-level probe. A service-level probe takes precedence.
    HealthProbe health_probe;
};

// ─────────────────────────────────────────────────────────────────────────────
// ServiceConfig
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   ServiceConfig users;
//   users.name = "users";
//   users.with_endpoint({.path = "/users", .handler = users_handler})
//        .with_route("/api/users")
//        .with_tag("core");

struct ServiceConfig {
    std::string name;
    std::vector<EndpointConfig> endpoints;

    /// Path prefixes resolved to this service. Empty = the endpoint paths.
    std::vector<std::string> routes;

    /// Per-attempt dispatch timeout
    std::chrono::milliseconds timeout{5000};

    /// Total dispatch attempts per routed call. 0 is treated as 1.
    std::size_t max_retries{3};

    LoadBalancingStrategy strategy{LoadBalancingStrategy::RoundRobin};

    /// TTL of cached GET responses. 0 disables caching for the service.
    std::chrono::seconds cache_ttl{300};

    /// Ordered pre-request hooks
    std::vector<Middleware> middleware;

    HealthProbe health_probe;

    std::vector<std::string> tags;
    std::string version{"1.0.0"};

    /// Overrides the gateway's default breaker settings
    std::optional<CircuitBreakerConfig> circuit_breaker;

    ServiceConfig& with_endpoint(EndpointConfig endpoint) {
        endpoints.push_back(std::move(endpoint));
        return *this;
    }

    ServiceConfig& with_route(std::string prefix) {
        routes.push_back(std::move(prefix));
        return *this;
    }

    ServiceConfig& with_middleware(Middleware hook) {
        middleware.push_back(std::move(hook));
        return *this;
    }

    ServiceConfig& with_tag(std::string tag) {
        tags.push_back(std::move(tag));
        return *this;
    }
};

}  // namespace meshgate

#endif  // MESHGATE_REGISTRY_SERVICE_CONFIG_HPP
