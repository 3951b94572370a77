#include "meshgate/registry/service.hpp"

namespace meshgate {

Service::Service(
    ServiceConfig config,
    CircuitBreakerConfig breaker_config,
    std::size_t failure_threshold,
    std::optional<std::uint32_t> seed
)
    : config_(std::move(config))
    , breaker_(std::move(breaker_config))
    , balancer_(config_.strategy, seed)
{
    endpoints_.reserve(config_.endpoints.size());
    weights_.reserve(config_.endpoints.size());

    for (const auto& endpoint_config : config_.endpoints) {
        auto endpoint = std::make_unique<Endpoint>();
        endpoint->path = endpoint_config.path;
        endpoint->handler = endpoint_config.handler;
        endpoint->probe = config_.health_probe ? config_.health_probe : endpoint_config.health_probe;
        endpoint->health = std::make_shared<EndpointHealth>(failure_threshold);
        endpoints_.push_back(std::move(endpoint));
        weights_.push_back(endpoint_config.weight);
    }

    last_active_ = (endpoints_.empty() == false);
}

std::vector<std::string> Service::route_prefixes() const {
    if (config_.routes.empty() == false) {
        return config_.routes;
    }
    std::vector<std::string> prefixes;
    prefixes.reserve(endpoints_.size());
    for (const auto& endpoint : endpoints_) {
        prefixes.push_back(endpoint->path);
    }
    return prefixes;
}

double Service::weight(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.at(index);
}

std::optional<std::size_t> Service::select_endpoint() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Candidate> candidates;
    candidates.reserve(endpoints_.size());
    for (std::size_t i = 0; i < endpoints_.size(); ++i) {
        const auto& endpoint = *endpoints_[i];
        if (endpoint.health->is_healthy()) {
            candidates.push_back(Candidate{
                i,
                weights_[i],
                endpoint.active_connections.load()
            });
        }
    }
    return balancer_.select(candidates);
}

std::optional<std::size_t> Service::select_any_endpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    return balancer_.pick_any(endpoints_.size());
}

GatewayResult<void> Service::update_weights(const std::unordered_map<std::string, double>& weights) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<double> updated = weights_;
    for (const auto& [path, value] : weights) {
        if (value < 0.0) {
            return tl::unexpected(GatewayError::invalid_config(
                config_.name, "Negative weight for endpoint " + path));
        }

        bool found = false;
        for (std::size_t i = 0; i < endpoints_.size(); ++i) {
            if (endpoints_[i]->path == path) {
                updated[i] = value;
                found = true;
            }
        }
        if (found == false) {
            return tl::unexpected(GatewayError::invalid_config(
                config_.name, "Unknown endpoint " + path));
        }
    }

    weights_ = std::move(updated);
    return {};
}

std::size_t Service::healthy_count() const {
    std::size_t healthy = 0;
    for (const auto& endpoint : endpoints_) {
        if (endpoint->health->is_healthy()) {
            healthy++;
        }
    }
    return healthy;
}

bool Service::is_active() const {
    return healthy_count() > 0 && breaker_.is_open() == false;
}

std::optional<bool> Service::refresh_activity() {
    const bool active = is_active();
    std::lock_guard<std::mutex> lock(mutex_);
    if (active == last_active_) {
        return std::nullopt;
    }
    last_active_ = active;
    return active;
}

}  // namespace meshgate
