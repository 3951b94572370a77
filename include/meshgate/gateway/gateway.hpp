#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Gateway
// ═══════════════════════════════════════════════════════════════════════════
// Explicitly constructed facade over the registry, health monitor, router and
// metrics collector. Each instance is fully isolated; the caller owns its
// lifecycle (start()/stop() of the health sweeps).
//
// Usage:
//   Gateway gateway(GatewayOptions{});
//
//   ServiceConfig users;
//   users.name = "users";
//   users.with_endpoint({.path = "/users", .handler = handle_users});
//   auto handle = gateway.register_service(std::move(users));
//
//   gateway.start();
//   auto response = gateway.route(GatewayRequest{.method = HttpMethod::Get, .path = "/users/42"});
//   if (response.has_value() == false) {
//       reply(to_http_status(response.error()), response.error().message);
//   }

#include "meshgate/cache/response_cache.hpp"
#include "meshgate/gateway/events.hpp"
#include "meshgate/gateway/request.hpp"
#include "meshgate/gateway/request_router.hpp"
#include "meshgate/health/health_monitor.hpp"
#include "meshgate/metrics/metrics_collector.hpp"
#include "meshgate/metrics/metrics_sink.hpp"
#include "meshgate/registry/service_registry.hpp"
#include "meshgate/resilience/backoff_policy.hpp"
#include "meshgate/resilience/circuit_breaker.hpp"
#include "meshgate/transport/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Options and Collaborators
// ─────────────────────────────────────────────────────────────────────────────

struct GatewayOptions {
    HealthConfig health{};
    BackoffConfig backoff{};

    /// Breaker settings for services that do not override them
    CircuitBreakerConfig default_circuit_breaker{};

    /// Route cache is emptied at most this long after its last clear
    std::chrono::milliseconds route_cache_ttl{60000};

    std::size_t dispatch_threads{8};

    /// Dispatch once to an arbitrary endpoint when none is healthy
    bool degraded_fallback{true};

    /// Seeds load balancers and backoff jitter for reproducible runs
    std::optional<std::uint32_t> random_seed;

    /// Bound of the default in-memory response cache. 0 = unbounded.
    std::size_t cache_max_entries{10000};

    /// Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

/// Optional replacements for the default collaborators. Empty members get the
/// defaults: MemoryCache, NullMetricsSink, ExponentialBackoff, cpr client.
struct GatewayDependencies {
    std::shared_ptr<ICache> cache;
    std::shared_ptr<IMetricsSink> metrics_sink;
    std::shared_ptr<IBackoffPolicy> backoff;
    std::shared_ptr<IHttpClient> http_client;
};

// ─────────────────────────────────────────────────────────────────────────────
// Views
// ─────────────────────────────────────────────────────────────────────────────

struct EndpointHealthView {
    std::string path;
    EndpointState state{EndpointState::Registered};
    bool healthy{true};
    std::size_t consecutive_failures{0};
    std::int64_t active_connections{0};
    double weight{1.0};
    std::optional<std::chrono::milliseconds> since_last_check;
};

struct ServiceHealth {
    bool is_active{false};
    double health_percentage{0.0};
    CircuitState breaker_state{CircuitState::Closed};
    std::vector<EndpointHealthView> endpoints;
};

struct ServiceMetrics {
    std::size_t success{0};
    std::size_t failure{0};
    std::size_t timeout{0};
    std::size_t rejected{0};
    CircuitState circuit_state{CircuitState::Closed};
    std::size_t healthy_endpoints{0};
    std::size_t total_endpoints{0};
    MetricsSample sample{};
};

struct ServiceInfo {
    std::string name;
    std::string version;
    std::vector<std::string> tags;
    bool active{false};
    std::size_t endpoint_count{0};
};

struct DiscoveryFilter {
    std::optional<std::string> tag;
    std::optional<bool> active;
};

// ─────────────────────────────────────────────────────────────────────────────
// Gateway
// ─────────────────────────────────────────────────────────────────────────────

class Gateway {
public:
    explicit Gateway(GatewayOptions options = {}, GatewayDependencies dependencies = {});
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Registration
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] GatewayResult<ServiceHandle> register_service(ServiceConfig config);

    /// Idempotent. Cascades to health tracking and collected metrics.
    bool unregister_service(const std::string& name);

    // ─────────────────────────────────────────────────────────────────────────
    // Traffic
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] GatewayResult<GatewayResponse> route(GatewayRequest request);

    // ─────────────────────────────────────────────────────────────────────────
    // Operator Surface
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::map<std::string, ServiceHealth> get_health() const;
    [[nodiscard]] std::map<std::string, ServiceMetrics> get_metrics() const;

    /// Force the service's breaker Closed.
    GatewayResult<void> reset_circuit_breaker(const std::string& name);

    GatewayResult<void> update_endpoint_weights(
        const std::string& name,
        const std::unordered_map<std::string, double>& weights
    );

    [[nodiscard]] std::vector<ServiceInfo> services_by_tag(const std::string& tag) const;
    [[nodiscard]] std::vector<ServiceInfo> discover(const DiscoveryFilter& filter = {}) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Events and Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    EventBus::SubscriptionId subscribe(EventCallback callback);
    bool unsubscribe(EventBus::SubscriptionId id);

    /// Start periodic health checks and auto-recovery.
    void start();
    void stop();

    [[nodiscard]] HealthMonitor& health_monitor() noexcept { return health_; }
    [[nodiscard]] const ServiceRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const GatewayOptions& options() const noexcept { return options_; }

private:
    /// Give URL endpoints the HTTP handler and default /health probe.
    void attach_http_defaults(ServiceConfig& config);

    void wire_breaker_events(const ServiceHandle& service);

    void on_endpoint_transition(
        const std::string& service,
        const std::string& endpoint,
        HealthTransition transition
    );

    [[nodiscard]] ServiceInfo describe(const Service& service) const;

    GatewayOptions options_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<IHttpClient> http_client_;
    std::shared_ptr<ICache> cache_;

    MetricsCollector metrics_;
    ServiceRegistry registry_;
    HealthMonitor health_;
    std::unique_ptr<RequestRouter> router_;
};

}  // namespace meshgate
