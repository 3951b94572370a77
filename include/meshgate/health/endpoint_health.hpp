#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Endpoint Health
// ═══════════════════════════════════════════════════════════════════════════
// Per-endpoint health state machine.
//
//   REGISTERED ──success──▶ HEALTHY
//       │                     │
//       └──── failures >= failure_threshold ───▶ UNHEALTHY
//
//   any state ──probe throws──▶ ERROR
//   any state ──live success or probe success──▶ HEALTHY
//
// Any success resets the failure counter.

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace meshgate {

enum class EndpointState {
    Registered,  ///< Never probed, no outcome yet. Eligible for traffic.
    Healthy,
    Unhealthy,   ///< Backend reported or caused consecutive failures
    Error        ///< The health check itself failed to run
};

[[nodiscard]] constexpr std::string_view to_string(EndpointState state) noexcept {
    switch (state) {
        case EndpointState::Registered: return "registered";
        case EndpointState::Healthy:    return "healthy";
        case EndpointState::Unhealthy:  return "unhealthy";
        case EndpointState::Error:      return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_serving(EndpointState state) noexcept {
    return state == EndpointState::Registered || state == EndpointState::Healthy;
}

// ─────────────────────────────────────────────────────────────────────────────
// Health Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HealthConfig {
    /// Consecutive failures before an endpoint is marked Unhealthy
    std::size_t failure_threshold{3};

    /// Period of the health-check sweep
    std::chrono::milliseconds check_interval{30000};

    /// The sweep skips endpoints with an outcome more recent than this
    std::chrono::milliseconds recent_check_skip{10000};

    bool auto_recovery_enabled{true};

    /// Period of the re-probe sweep over Unhealthy/Error endpoints
    std::chrono::milliseconds auto_recovery_interval{60000};

    /// Timeout handed to the default HTTP probe
    std::chrono::milliseconds probe_timeout{5000};
};

// ─────────────────────────────────────────────────────────────────────────────
// EndpointHealth
// ─────────────────────────────────────────────────────────────────────────────

struct HealthTransition {
    EndpointState from;
    EndpointState to;
};

class EndpointHealth {
public:
    using Clock = std::chrono::steady_clock;

    explicit EndpointHealth(std::size_t failure_threshold = 3);

    EndpointHealth(const EndpointHealth&) = delete;
    EndpointHealth& operator=(const EndpointHealth&) = delete;

    // Each recorder returns the transition it caused, if any.

    /// Live request succeeded
    std::optional<HealthTransition> record_success();

    /// Live request or probe reported failure
    std::optional<HealthTransition> record_failure();

    /// Probe returned healthy
    std::optional<HealthTransition> record_probe_success();

    /// Probe threw
    std::optional<HealthTransition> record_probe_error(std::string message);

    [[nodiscard]] EndpointState state() const;
    [[nodiscard]] bool is_healthy() const;
    [[nodiscard]] std::size_t consecutive_failures() const;
    [[nodiscard]] std::optional<Clock::time_point> last_check() const;
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] std::size_t failure_threshold() const noexcept { return failure_threshold_; }

private:
    // Caller must hold mutex_
    std::optional<HealthTransition> move_to(EndpointState next);

    const std::size_t failure_threshold_;

    mutable std::mutex mutex_;
    EndpointState state_{EndpointState::Registered};
    std::size_t consecutive_failures_{0};
    std::optional<Clock::time_point> last_check_;
    std::string last_error_;
};

}  // namespace meshgate
