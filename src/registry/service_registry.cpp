#include "meshgate/registry/service_registry.hpp"

namespace meshgate {

ServiceRegistry::ServiceRegistry(RegistryOptions options)
    : options_(std::move(options))
{}

GatewayResult<void> ServiceRegistry::validate(const ServiceConfig& config) {
    if (config.name.empty()) {
        return tl::unexpected(GatewayError::invalid_config("", "Service name must not be empty"));
    }

    if (config.timeout.count() <= 0) {
        return tl::unexpected(GatewayError::invalid_config(
            config.name, "Service timeout must be positive"));
    }

    for (const auto& endpoint : config.endpoints) {
        if (endpoint.path.empty()) {
            return tl::unexpected(GatewayError::invalid_config(
                config.name, "Endpoint path must not be empty"));
        }
        if (endpoint.weight < 0.0) {
            return tl::unexpected(GatewayError::invalid_config(
                config.name, "Negative weight for endpoint " + endpoint.path));
        }
        const bool dispatchable = static_cast<bool>(endpoint.handler) || is_http_url(endpoint.path);
        if (dispatchable == false) {
            return tl::unexpected(GatewayError::invalid_config(
                config.name, "Endpoint " + endpoint.path + " has no handler and is not an http(s) URL"));
        }
    }

    for (const auto& route : config.routes) {
        if (route.empty()) {
            return tl::unexpected(GatewayError::invalid_config(
                config.name, "Route prefix must not be empty"));
        }
    }

    return {};
}

GatewayResult<ServiceHandle> ServiceRegistry::register_service(ServiceConfig config) {
    auto valid = validate(config);
    if (valid.has_value() == false) {
        return tl::unexpected(valid.error());
    }

    ServiceHandle service;
    {
        std::unique_lock<std::shared_mutex> lock(services_mutex_);

        const bool exists = services_.contains(config.name);
        if (exists) {
            return tl::unexpected(GatewayError::duplicate_service(config.name));
        }

        auto breaker_config = config.circuit_breaker.value_or(options_.default_circuit_breaker);
        breaker_config.name = config.name;

        std::optional<std::uint32_t> seed;
        if (options_.random_seed.has_value()) {
            seed = *options_.random_seed + next_seed_offset_++;
        }

        const auto name = config.name;
        service = std::make_shared<Service>(
            std::move(config),
            std::move(breaker_config),
            options_.failure_threshold,
            seed
        );
        services_.emplace(name, service);
    }

    clear_route_cache();
    return service;
}

ServiceHandle ServiceRegistry::unregister_service(const std::string& name) {
    ServiceHandle removed;
    {
        std::unique_lock<std::shared_mutex> lock(services_mutex_);
        const auto it = services_.find(name);
        if (it == services_.end()) {
            return nullptr;
        }
        removed = std::move(it->second);
        services_.erase(it);
    }

    clear_route_cache();
    return removed;
}

GatewayResult<ServiceHandle> ServiceRegistry::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(services_mutex_);
    const auto it = services_.find(name);
    if (it == services_.end()) {
        return tl::unexpected(GatewayError::service_not_found(name));
    }
    return it->second;
}

std::optional<std::string> ServiceRegistry::resolve_by_path(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(route_mutex_);

        const auto now = Clock::now();
        const bool stale = (now - route_cache_cleared_at_) >= options_.route_cache_ttl;
        if (stale) {
            route_cache_.clear();
            route_cache_cleared_at_ = now;
        }

        const auto it = route_cache_.find(path);
        if (it != route_cache_.end()) {
            return it->second;
        }
    }

    auto match = longest_prefix_match(path);
    if (match.has_value()) {
        std::lock_guard<std::mutex> lock(route_mutex_);
        route_cache_[path] = *match;
    }
    return match;
}

std::optional<std::string> ServiceRegistry::longest_prefix_match(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(services_mutex_);

    std::optional<std::string> best;
    std::size_t best_length = 0;

    for (const auto& [name, service] : services_) {
        for (const auto& prefix : service->route_prefixes()) {
            const bool matches = path.starts_with(prefix);
            if (matches && (best.has_value() == false || prefix.size() > best_length)) {
                best = name;
                best_length = prefix.size();
            }
        }
    }
    return best;
}

std::vector<ServiceHandle> ServiceRegistry::services() const {
    std::shared_lock<std::shared_mutex> lock(services_mutex_);
    std::vector<ServiceHandle> result;
    result.reserve(services_.size());
    for (const auto& [name, service] : services_) {
        result.push_back(service);
    }
    return result;
}

std::size_t ServiceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(services_mutex_);
    return services_.size();
}

void ServiceRegistry::clear_route_cache() {
    std::lock_guard<std::mutex> lock(route_mutex_);
    route_cache_.clear();
    route_cache_cleared_at_ = Clock::now();
}

std::size_t ServiceRegistry::route_cache_size() const {
    std::lock_guard<std::mutex> lock(route_mutex_);
    return route_cache_.size();
}

}  // namespace meshgate
