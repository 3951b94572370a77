#pragma once

#include "meshgate/gateway/gateway_error.hpp"
#include "meshgate/health/endpoint_health.hpp"
#include "meshgate/registry/service_config.hpp"
#include "meshgate/resilience/circuit_breaker.hpp"
#include "meshgate/routing/load_balancer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────────────────────────────────────
// Owned by its Service. The list of endpoints is fixed at registration; only
// weights (under the service lock), health and connection counts change.

struct Endpoint {
    std::string path;
    EndpointHandler handler;
    HealthProbe probe;          ///< Effective probe (service probe wins), may be empty
    std::shared_ptr<EndpointHealth> health;
    std::atomic<std::int64_t> active_connections{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionGuard
// ─────────────────────────────────────────────────────────────────────────────
// RAII increment/decrement of Endpoint::active_connections. release() drops
// the slot early and is a no-op once the slot is gone.

class ConnectionGuard {
public:
    explicit ConnectionGuard(Endpoint& endpoint) noexcept
        : endpoint_(&endpoint)
    {
        endpoint_->active_connections.fetch_add(1);
    }

    ~ConnectionGuard() {
        release();
    }

    void release() noexcept {
        if (endpoint_ != nullptr) {
            endpoint_->active_connections.fetch_sub(1);
            endpoint_ = nullptr;
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    ConnectionGuard(ConnectionGuard&& other) noexcept
        : endpoint_(other.endpoint_)
    {
        other.endpoint_ = nullptr;
    }

    ConnectionGuard& operator=(ConnectionGuard&&) = delete;

private:
    Endpoint* endpoint_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Service
// ─────────────────────────────────────────────────────────────────────────────
// Composes one CircuitBreaker, one LoadBalancer (with its cursor) and the
// endpoint health of a registered service. Lifetime is shared: in-flight
// requests keep a Service alive after it is unregistered.

class Service {
public:
    Service(
        ServiceConfig config,
        CircuitBreakerConfig breaker_config,
        std::size_t failure_threshold,
        std::optional<std::uint32_t> seed = std::nullopt
    );

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }

    /// Prefixes used for path resolution (routes, or endpoint paths if none)
    [[nodiscard]] std::vector<std::string> route_prefixes() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Endpoints
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t endpoint_count() const noexcept { return endpoints_.size(); }
    [[nodiscard]] Endpoint& endpoint(std::size_t index) { return *endpoints_.at(index); }
    [[nodiscard]] const Endpoint& endpoint(std::size_t index) const { return *endpoints_.at(index); }

    [[nodiscard]] double weight(std::size_t index) const;

    /// Load-balanced pick among healthy endpoints.
    [[nodiscard]] std::optional<std::size_t> select_endpoint();

    /// Uniform pick among all endpoints regardless of health.
    [[nodiscard]] std::optional<std::size_t> select_any_endpoint();

    /// Replace weights by endpoint path. All-or-nothing: an unknown path or a
    /// negative weight rejects the whole update.
    GatewayResult<void> update_weights(const std::unordered_map<std::string, double>& weights);

    [[nodiscard]] std::size_t healthy_count() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Breaker and Activity
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitBreaker& breaker() noexcept { return breaker_; }
    [[nodiscard]] const CircuitBreaker& breaker() const noexcept { return breaker_; }

    /// Derived: at least one healthy endpoint and the breaker is not Open.
    [[nodiscard]] bool is_active() const;

    /// Recompute activity; returns the new value only if it changed since the
    /// previous call.
    std::optional<bool> refresh_activity();

private:
    ServiceConfig config_;
    CircuitBreaker breaker_;
    std::vector<std::unique_ptr<Endpoint>> endpoints_;

    mutable std::mutex mutex_;
    std::vector<double> weights_;
    LoadBalancer balancer_;
    bool last_active_{true};
};

/// Shared ownership handle returned by registration.
using ServiceHandle = std::shared_ptr<Service>;

}  // namespace meshgate
