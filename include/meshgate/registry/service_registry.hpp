#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Service Registry
// ═══════════════════════════════════════════════════════════════════════════
// Owns the registered services by name and resolves request paths to them.
//
// Path resolution is a longest-prefix match over every service's route
// prefixes. Results are memoized in a route cache that is emptied whenever the
// service set changes and, lazily, once route_cache_ttl has elapsed since the
// last clear. Equal-length matches resolve to the alphabetically first name.

#include "meshgate/gateway/gateway_error.hpp"
#include "meshgate/registry/service.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshgate {

struct RegistryOptions {
    CircuitBreakerConfig default_circuit_breaker{};
    std::size_t failure_threshold{3};
    std::chrono::milliseconds route_cache_ttl{60000};
    std::optional<std::uint32_t> random_seed;
};

class ServiceRegistry {
public:
    explicit ServiceRegistry(RegistryOptions options = {});

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /// Reject configurations that cannot be served (empty names, bad weights,
    /// non-positive timeouts, endpoints with nothing to dispatch to).
    [[nodiscard]] static GatewayResult<void> validate(const ServiceConfig& config);

    /// Build and add a service. Fails with DuplicateService or InvalidConfig.
    [[nodiscard]] GatewayResult<ServiceHandle> register_service(ServiceConfig config);

    /// Remove a service. Idempotent: returns nullptr when nothing was removed.
    ServiceHandle unregister_service(const std::string& name);

    [[nodiscard]] GatewayResult<ServiceHandle> lookup(const std::string& name) const;

    [[nodiscard]] std::optional<std::string> resolve_by_path(const std::string& path);

    /// All services ordered by name
    [[nodiscard]] std::vector<ServiceHandle> services() const;

    [[nodiscard]] std::size_t size() const;

    void clear_route_cache();
    [[nodiscard]] std::size_t route_cache_size() const;

    [[nodiscard]] const RegistryOptions& options() const noexcept { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] std::optional<std::string> longest_prefix_match(const std::string& path) const;

    RegistryOptions options_;

    mutable std::shared_mutex services_mutex_;
    std::map<std::string, ServiceHandle> services_;
    std::uint32_t next_seed_offset_{0};

    mutable std::mutex route_mutex_;
    std::unordered_map<std::string, std::string> route_cache_;
    Clock::time_point route_cache_cleared_at_{Clock::now()};
};

}  // namespace meshgate
