#include "meshgate/gateway/gateway.hpp"

#include "meshgate/log/logger.hpp"
#include "meshgate/transport/http_endpoint.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace meshgate {

namespace {

// Publish ServiceActivityChanged if the derived activity flipped
void publish_activity(EventBus& events, Service& service) {
    const auto changed = service.refresh_activity();
    if (changed.has_value() == false) {
        return;
    }

    const LogFields fields{{"service", service.name()}};
    if (*changed) {
        get_logger().info("Service active", fields);
    } else {
        get_logger().warn("Service inactive", fields);
    }
    events.publish(events::ServiceActivityChanged{service.name(), *changed});
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// GatewayOptions
// ─────────────────────────────────────────────────────────────────────────────

void GatewayOptions::validate() const {
    if (dispatch_threads == 0) {
        throw std::invalid_argument("dispatch_threads must be at least 1");
    }
    if (health.failure_threshold == 0) {
        throw std::invalid_argument("health.failure_threshold must be at least 1");
    }
    const auto& breaker = default_circuit_breaker;
    const bool percentage_valid = (breaker.error_threshold_percentage >= 1)
                               && (breaker.error_threshold_percentage <= 100);
    if (percentage_valid == false) {
        throw std::invalid_argument("circuit_breaker.error_threshold_percentage must be within [1, 100]");
    }
    if (breaker.rolling_window.count() <= 0 || breaker.rolling_buckets == 0) {
        throw std::invalid_argument("circuit_breaker rolling window must be non-empty");
    }
    if (backoff.multiplier < 1.0) {
        throw std::invalid_argument("backoff.multiplier must be >= 1");
    }
    if (backoff.base.count() < 0 || backoff.cap.count() < 0 || backoff.jitter.count() < 0) {
        throw std::invalid_argument("backoff durations must not be negative");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

namespace {

const GatewayOptions& validated(const GatewayOptions& options) {
    options.validate();
    return options;
}

std::shared_ptr<IBackoffPolicy> default_backoff(const GatewayOptions& options) {
    if (options.random_seed.has_value()) {
        return std::make_shared<ExponentialBackoff>(options.backoff, *options.random_seed);
    }
    return std::make_shared<ExponentialBackoff>(options.backoff);
}

}  // namespace

Gateway::Gateway(GatewayOptions options, GatewayDependencies dependencies)
    : options_(validated(options))
    , events_(std::make_shared<EventBus>())
    , http_client_(dependencies.http_client ? std::move(dependencies.http_client) : make_http_client())
    , cache_(dependencies.cache ? std::move(dependencies.cache)
                                : std::make_shared<MemoryCache>(options_.cache_max_entries))
    , registry_(RegistryOptions{
          options_.default_circuit_breaker,
          options_.health.failure_threshold,
          options_.route_cache_ttl,
          options_.random_seed
      })
    , health_(options_.health)
{
    router_ = std::make_unique<RequestRouter>(
        registry_,
        health_,
        metrics_,
        cache_,
        std::move(dependencies.metrics_sink),
        dependencies.backoff ? std::move(dependencies.backoff) : default_backoff(options_),
        RouterOptions{options_.dispatch_threads, options_.degraded_fallback}
    );

    health_.on_transition([this](const std::string& service, const std::string& endpoint, HealthTransition t) {
        on_endpoint_transition(service, endpoint, t);
    });
}

Gateway::~Gateway() {
    stop();
    // Join dispatch workers before the registry and monitor go away
    router_.reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

GatewayResult<ServiceHandle> Gateway::register_service(ServiceConfig config) {
    attach_http_defaults(config);

    auto registered = registry_.register_service(std::move(config));
    if (registered.has_value() == false) {
        const auto& error = registered.error();
        get_logger().warn("Service registration rejected", {
            {"service", error.service},
            {"code", std::string(to_string(error.code))},
            {"message", error.message}
        });
        return registered;
    }

    const ServiceHandle& service = *registered;
    wire_breaker_events(service);

    for (std::size_t i = 0; i < service->endpoint_count(); ++i) {
        auto& endpoint = service->endpoint(i);
        health_.watch(service->name(), endpoint.path, endpoint.health, endpoint.probe);
    }

    get_logger().info("Service registered", {
        {"service", service->name()},
        {"endpoints", std::to_string(service->endpoint_count())},
        {"strategy", std::string(to_string(service->config().strategy))},
        {"version", service->config().version}
    });
    events_->publish(events::ServiceRegistered{service->name()});
    return registered;
}

bool Gateway::unregister_service(const std::string& name) {
    const auto removed = registry_.unregister_service(name);
    if (removed == nullptr) {
        return false;
    }

    health_.unwatch(name);
    metrics_.remove(name);

    get_logger().info("Service unregistered", {{"service", name}});
    events_->publish(events::ServiceUnregistered{name});
    return true;
}

void Gateway::attach_http_defaults(ServiceConfig& config) {
    for (auto& endpoint : config.endpoints) {
        const bool is_url = is_http_url(endpoint.path);
        if (is_url == false) {
            continue;
        }

        if (static_cast<bool>(endpoint.handler) == false) {
            endpoint.handler = HttpEndpointHandler(http_client_, endpoint.path);
        }

        const bool has_probe = static_cast<bool>(endpoint.health_probe)
                            || static_cast<bool>(config.health_probe);
        if (has_probe == false) {
            endpoint.health_probe = make_http_health_probe(
                http_client_, endpoint.path, options_.health.probe_timeout);
        }
    }
}

void Gateway::wire_breaker_events(const ServiceHandle& service) {
    std::weak_ptr<EventBus> weak_events = events_;
    std::weak_ptr<Service> weak_service = service;
    const std::string name = service->name();

    service->breaker().on_state_change(
        [weak_events, weak_service, name](CircuitState old_state, CircuitState new_state) {
            const LogFields fields{
                {"service", name},
                {"from", std::string(to_string(old_state))},
                {"to", std::string(to_string(new_state))}
            };

            auto events = weak_events.lock();
            switch (new_state) {
                case CircuitState::Open:
                    get_logger().warn("Circuit breaker opened", fields);
                    if (events) events->publish(events::CircuitOpened{name});
                    break;
                case CircuitState::HalfOpen:
                    get_logger().info("Circuit breaker half-open", fields);
                    if (events) events->publish(events::CircuitHalfOpened{name});
                    break;
                case CircuitState::Closed:
                    get_logger().info("Circuit breaker closed", fields);
                    if (events) events->publish(events::CircuitClosed{name});
                    break;
            }

            auto owner = weak_service.lock();
            if (events && owner) {
                publish_activity(*events, *owner);
            }
        });
}

void Gateway::on_endpoint_transition(
    const std::string& service,
    const std::string& endpoint,
    HealthTransition transition
) {
    events_->publish(events::EndpointMarked{
        service,
        endpoint,
        is_serving(transition.to),
        transition.to
    });

    auto found = registry_.lookup(service);
    if (found.has_value()) {
        publish_activity(*events_, **found);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Traffic
// ─────────────────────────────────────────────────────────────────────────────

GatewayResult<GatewayResponse> Gateway::route(GatewayRequest request) {
    return router_->route(std::move(request));
}

// ─────────────────────────────────────────────────────────────────────────────
// Operator Surface
// ─────────────────────────────────────────────────────────────────────────────

std::map<std::string, ServiceHealth> Gateway::get_health() const {
    std::map<std::string, ServiceHealth> report;
    const auto now = EndpointHealth::Clock::now();

    for (const auto& service : registry_.services()) {
        ServiceHealth health;
        health.is_active = service->is_active();
        health.breaker_state = service->breaker().state();

        const std::size_t total = service->endpoint_count();
        std::size_t healthy = 0;
        for (std::size_t i = 0; i < total; ++i) {
            const auto& endpoint = std::as_const(*service).endpoint(i);

            EndpointHealthView view;
            view.path = endpoint.path;
            view.state = endpoint.health->state();
            view.healthy = is_serving(view.state);
            view.consecutive_failures = endpoint.health->consecutive_failures();
            view.active_connections = endpoint.active_connections.load();
            view.weight = service->weight(i);
            const auto last = endpoint.health->last_check();
            if (last.has_value()) {
                view.since_last_check = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last);
            }

            if (view.healthy) {
                healthy++;
            }
            health.endpoints.push_back(std::move(view));
        }

        health.health_percentage = (total > 0)
            ? static_cast<double>(healthy) / static_cast<double>(total) * 100.0
            : 0.0;
        report.emplace(service->name(), std::move(health));
    }
    return report;
}

std::map<std::string, ServiceMetrics> Gateway::get_metrics() const {
    std::map<std::string, ServiceMetrics> report;

    for (const auto& service : registry_.services()) {
        const auto stats = service->breaker().stats();

        ServiceMetrics metrics;
        metrics.success = stats.lifetime.successes;
        metrics.failure = stats.lifetime.failures;
        metrics.timeout = stats.lifetime.timeouts;
        metrics.rejected = stats.lifetime.rejections;
        metrics.circuit_state = stats.current_state;
        metrics.healthy_endpoints = service->healthy_count();
        metrics.total_endpoints = service->endpoint_count();
        metrics.sample = metrics_.snapshot(service->name()).value_or(MetricsSample{});
        report.emplace(service->name(), metrics);
    }
    return report;
}

GatewayResult<void> Gateway::reset_circuit_breaker(const std::string& name) {
    auto service = registry_.lookup(name);
    if (service.has_value() == false) {
        return tl::unexpected(service.error());
    }

    (*service)->breaker().force_close();
    get_logger().info("Circuit breaker reset", {{"service", name}});
    return {};
}

GatewayResult<void> Gateway::update_endpoint_weights(
    const std::string& name,
    const std::unordered_map<std::string, double>& weights
) {
    auto service = registry_.lookup(name);
    if (service.has_value() == false) {
        return tl::unexpected(service.error());
    }

    auto updated = (*service)->update_weights(weights);
    if (updated.has_value() == false) {
        get_logger().warn("Endpoint weight update rejected", {
            {"service", name},
            {"message", updated.error().message}
        });
        return updated;
    }

    get_logger().info("Endpoint weights updated", {
        {"service", name},
        {"count", std::to_string(weights.size())}
    });
    return {};
}

ServiceInfo Gateway::describe(const Service& service) const {
    return ServiceInfo{
        service.name(),
        service.config().version,
        service.config().tags,
        service.is_active(),
        service.endpoint_count()
    };
}

std::vector<ServiceInfo> Gateway::services_by_tag(const std::string& tag) const {
    return discover(DiscoveryFilter{tag, std::nullopt});
}

std::vector<ServiceInfo> Gateway::discover(const DiscoveryFilter& filter) const {
    std::vector<ServiceInfo> found;
    for (const auto& service : registry_.services()) {
        auto info = describe(*service);

        if (filter.tag.has_value()) {
            const bool tagged = std::ranges::find(info.tags, *filter.tag) != info.tags.end();
            if (tagged == false) {
                continue;
            }
        }
        if (filter.active.has_value() && info.active != *filter.active) {
            continue;
        }
        found.push_back(std::move(info));
    }
    return found;
}

// ─────────────────────────────────────────────────────────────────────────────
// Events and Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

EventBus::SubscriptionId Gateway::subscribe(EventCallback callback) {
    return events_->subscribe(std::move(callback));
}

bool Gateway::unsubscribe(EventBus::SubscriptionId id) {
    return events_->unsubscribe(id);
}

void Gateway::start() {
    health_.start();
}

void Gateway::stop() {
    health_.stop();
}

}  // namespace meshgate
