#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Health Monitor
// ═══════════════════════════════════════════════════════════════════════════
// Tracks every watched endpoint's EndpointHealth and runs two periodic sweeps
// on a private asio io_context thread:
//
//   check sweep    every check_interval: probe endpoints whose last outcome is
//                  older than recent_check_skip
//   recovery sweep every auto_recovery_interval: re-probe Unhealthy/Error
//                  endpoints; a passing probe is the only way back to Healthy
//
// Sweeps never hold a lock while a probe runs, so they neither block nor are
// blocked by in-flight requests. Both sweeps are public so callers (and tests)
// can drive them without the timer thread.
//
// Usage:
//   HealthMonitor monitor(HealthConfig{.failure_threshold = 3});
//   monitor.on_transition([](const auto& svc, const auto& ep, HealthTransition t) { ... });
//   monitor.watch("users", "/users", health, probe);
//   monitor.start();

#include "meshgate/gateway/request.hpp"
#include "meshgate/health/endpoint_health.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meshgate {

class HealthMonitor {
public:
    using TransitionCallback = std::function<void(
        const std::string& service,
        const std::string& endpoint,
        HealthTransition transition
    )>;

    explicit HealthMonitor(HealthConfig config = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Targets
    // ─────────────────────────────────────────────────────────────────────────

    /// Start tracking an endpoint. A null probe means "always healthy".
    void watch(
        std::string service,
        std::string endpoint,
        std::shared_ptr<EndpointHealth> health,
        HealthProbe probe
    );

    /// Forget every endpoint of a service.
    void unwatch(const std::string& service);

    [[nodiscard]] std::size_t watched_count() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Reactive Updates
    // ─────────────────────────────────────────────────────────────────────────

    /// Apply the outcome of a live request to an endpoint.
    void record_outcome(
        const std::string& service,
        const std::string& endpoint,
        EndpointHealth& health,
        bool success
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Sweeps
    // ─────────────────────────────────────────────────────────────────────────

    /// One health-check sweep. Returns the number of endpoints probed.
    std::size_t check_all();

    /// One recovery sweep. Returns the number of endpoints brought back.
    std::size_t recover_all();

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start the sweep timers on a background thread. Idempotent.
    void start();

    /// Cancel the timers and join the thread. Idempotent.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    void on_transition(TransitionCallback callback);

    [[nodiscard]] const HealthConfig& config() const noexcept { return config_; }

private:
    struct Target {
        std::string service;
        std::string endpoint;
        std::shared_ptr<EndpointHealth> health;
        HealthProbe probe;
    };

    enum class Sweep { Check, Recovery };

    [[nodiscard]] std::vector<Target> snapshot_targets() const;

    /// Run the target's probe and apply the result.
    std::optional<HealthTransition> probe(const Target& target);

    asio::awaitable<void> sweep_loop(Sweep kind, std::chrono::milliseconds interval, std::uint64_t generation);

    void notify(const std::string& service, const std::string& endpoint, HealthTransition transition);

    HealthConfig config_;

    mutable std::mutex targets_mutex_;
    std::vector<Target> targets_;

    std::mutex callbacks_mutex_;
    std::vector<TransitionCallback> callbacks_;

    asio::io_context io_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> generation_{0};  // bumped by stop(); stale loops exit
};

}  // namespace meshgate
