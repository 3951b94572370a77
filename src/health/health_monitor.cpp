#include "meshgate/health/health_monitor.hpp"

#include "meshgate/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <exception>

namespace meshgate {

HealthMonitor::HealthMonitor(HealthConfig config)
    : config_(config)
{}

HealthMonitor::~HealthMonitor() {
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Targets
// ─────────────────────────────────────────────────────────────────────────────

void HealthMonitor::watch(
    std::string service,
    std::string endpoint,
    std::shared_ptr<EndpointHealth> health,
    HealthProbe probe
) {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    targets_.push_back(Target{
        std::move(service),
        std::move(endpoint),
        std::move(health),
        std::move(probe)
    });
}

void HealthMonitor::unwatch(const std::string& service) {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    std::erase_if(targets_, [&service](const Target& target) {
        return target.service == service;
    });
}

std::size_t HealthMonitor::watched_count() const {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    return targets_.size();
}

std::vector<HealthMonitor::Target> HealthMonitor::snapshot_targets() const {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    return targets_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reactive Updates
// ─────────────────────────────────────────────────────────────────────────────

void HealthMonitor::record_outcome(
    const std::string& service,
    const std::string& endpoint,
    EndpointHealth& health,
    bool success
) {
    const auto transition = success ? health.record_success() : health.record_failure();
    if (transition.has_value()) {
        notify(service, endpoint, *transition);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Sweeps
// ─────────────────────────────────────────────────────────────────────────────

std::size_t HealthMonitor::check_all() {
    const auto now = EndpointHealth::Clock::now();
    std::size_t probed = 0;

    for (const auto& target : snapshot_targets()) {
        const auto last = target.health->last_check();
        const bool recently_checked =
            last.has_value() && (now - *last) < config_.recent_check_skip;
        if (recently_checked) {
            continue;
        }

        const auto transition = probe(target);
        probed++;

        get_logger().debug("Health check", {
            {"service", target.service},
            {"endpoint", target.endpoint},
            {"state", std::string(to_string(target.health->state()))}
        });

        if (transition.has_value()) {
            notify(target.service, target.endpoint, *transition);
        }
    }
    return probed;
}

std::size_t HealthMonitor::recover_all() {
    std::size_t recovered = 0;

    for (const auto& target : snapshot_targets()) {
        const bool needs_recovery = (is_serving(target.health->state()) == false);
        if (needs_recovery == false) {
            continue;
        }

        const auto transition = probe(target);
        const bool back = transition.has_value() && (transition->to == EndpointState::Healthy);
        if (back) {
            recovered++;
            get_logger().info("Endpoint auto-recovered", {
                {"service", target.service},
                {"endpoint", target.endpoint}
            });
        }

        if (transition.has_value()) {
            notify(target.service, target.endpoint, *transition);
        }
    }
    return recovered;
}

std::optional<HealthTransition> HealthMonitor::probe(const Target& target) {
    auto& health = *target.health;

    const bool has_probe = static_cast<bool>(target.probe);
    if (has_probe == false) {
        return health.record_probe_success();
    }

    try {
        const bool healthy = target.probe();
        return healthy ? health.record_probe_success() : health.record_failure();
    } catch (const std::exception& e) {
        get_logger().warn("Health probe raised", {
            {"service", target.service},
            {"endpoint", target.endpoint},
            {"error", e.what()}
        });
        return health.record_probe_error(e.what());
    } catch (...) {
        get_logger().warn("Health probe raised", {
            {"service", target.service},
            {"endpoint", target.endpoint},
            {"error", "non-standard exception"}
        });
        return health.record_probe_error("non-standard exception");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

void HealthMonitor::start() {
    const bool already_running = running_.exchange(true);
    if (already_running) {
        return;
    }

    io_.restart();
    const auto generation = generation_.load();
    asio::co_spawn(io_, sweep_loop(Sweep::Check, config_.check_interval, generation), asio::detached);
    if (config_.auto_recovery_enabled) {
        asio::co_spawn(io_, sweep_loop(Sweep::Recovery, config_.auto_recovery_interval, generation), asio::detached);
    }

    worker_ = std::thread([this]() { io_.run(); });

    get_logger().info("Health monitor started", {
        {"check_interval_ms", std::to_string(config_.check_interval.count())},
        {"auto_recovery", config_.auto_recovery_enabled ? "on" : "off"}
    });
}

void HealthMonitor::stop() {
    const bool was_running = running_.exchange(false);
    if (was_running == false) {
        return;
    }

    generation_.fetch_add(1);
    io_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }

    get_logger().info("Health monitor stopped");
}

asio::awaitable<void> HealthMonitor::sweep_loop(
    Sweep kind,
    std::chrono::milliseconds interval,
    std::uint64_t generation
) {
    auto executor = co_await asio::this_coro::executor;
    asio::steady_timer timer(executor);
    const auto period = std::max(interval, std::chrono::milliseconds{1});

    const auto current = [this, generation]() {
        return running_.load() && generation_.load() == generation;
    };

    while (current()) {
        timer.expires_after(period);

        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || current() == false) {
            break;
        }

        if (kind == Sweep::Check) {
            check_all();
        } else {
            recover_all();
        }
    }
}

void HealthMonitor::on_transition(TransitionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void HealthMonitor::notify(
    const std::string& service,
    const std::string& endpoint,
    HealthTransition transition
) {
    const LogFields fields{
        {"service", service},
        {"endpoint", endpoint},
        {"from", std::string(to_string(transition.from))},
        {"to", std::string(to_string(transition.to))}
    };
    if (is_serving(transition.to)) {
        get_logger().info("Endpoint healthy", fields);
    } else {
        get_logger().warn("Endpoint marked unhealthy", fields);
    }

    std::vector<TransitionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(service, endpoint, transition);
    }
}

}  // namespace meshgate
