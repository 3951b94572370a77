#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// One breaker per service. Trip decisions are made over a rolling window of
// call outcomes split into time buckets.
//
// State Machine:
//
//   ┌─────────┐  window volume >= volume_threshold   ┌────────┐
//   │ CLOSED  │  and failure% >= error_threshold      │  OPEN  │
//   │         │ ─────────────────────────────────────▶│        │
//   └────┬────┘  (or timeouts >= timeout_threshold)   └────┬───┘
//        ▲                                                 │ reset_timeout
//        │                                                 ▼
//        │        probe succeeds                    ┌──────────┐
//        └──────────────────────────────────────────│HALF_OPEN │
//                                                   └────┬─────┘
//                                                        │ probe fails
//                                                        ▼
//                                                      OPEN
//
// While Open every call is rejected without invoking the wrapped action. In
// HalfOpen exactly one probe call is admitted at a time.
//
// Usage:
//   CircuitBreaker breaker(CircuitBreakerConfig{.volume_threshold = 10, .name = "users"});
//
//   auto result = breaker.call([&]() -> GatewayResult<GatewayResponse> {
//       return dispatch_with_retries(request);
//   });

#include "meshgate/gateway/gateway_error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker State
// ─────────────────────────────────────────────────────────────────────────────

enum class CircuitState {
    Closed,    ///< Normal operation, requests pass through
    Open,      ///< Circuit tripped, requests rejected immediately
    HalfOpen   ///< One probe call allowed to test recovery
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half-open";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerConfig {
    /// Budget for one wrapped call (routing plus retries). 0 = no budget.
    std::chrono::milliseconds timeout{3000};

    /// Failure percentage within the window that trips the breaker
    std::size_t error_threshold_percentage{50};

    /// Time spent Open before a probe is allowed
    std::chrono::milliseconds reset_timeout{30000};

    /// Minimum calls in the window before the percentage is considered
    std::size_t volume_threshold{10};

    /// Timed-out calls within the window that trip the breaker. 0 = disabled.
    std::size_t timeout_threshold{0};

    /// Length of the rolling statistics window and its bucket count
    std::chrono::milliseconds rolling_window{10000};
    std::size_t rolling_buckets{10};

    /// Owning service name (used in errors and logs)
    std::string name{"default"};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Statistics
// ─────────────────────────────────────────────────────────────────────────────

struct OutcomeCounts {
    std::size_t successes{0};
    std::size_t failures{0};    ///< Failed calls, timeouts excluded
    std::size_t timeouts{0};
    std::size_t rejections{0};  ///< Calls refused without dispatch

    /// Calls that were actually executed
    [[nodiscard]] std::size_t executed() const noexcept {
        return successes + failures + timeouts;
    }
};

struct CircuitBreakerStats {
    OutcomeCounts lifetime;        ///< Since creation
    OutcomeCounts window;          ///< Current rolling window
    std::size_t state_transitions{0};
    CircuitState current_state{CircuitState::Closed};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using StateChangeCallback = std::function<void(CircuitState old_state, CircuitState new_state)>;

    CircuitBreaker() : CircuitBreaker(CircuitBreakerConfig{}) {}
    explicit CircuitBreaker(CircuitBreakerConfig config);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Core Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Admission check. Moves Open -> HalfOpen once reset_timeout has elapsed.
    /// A false return has already been counted as a rejection.
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();
    void record_timeout();

    /// Run `action` under the breaker. The action returns GatewayResult<T>;
    /// UpstreamTimeout errors count as timeouts, other errors as failures.
    /// Rejected calls return CircuitOpen without invoking `action`.
    /// An action that throws is recorded as a failure before the exception
    /// propagates, so a half-open probe is never left in flight.
    template <typename Fn>
    auto call(Fn&& action) -> std::invoke_result_t<Fn> {
        if (allow_request() == false) {
            return tl::unexpected(GatewayError::circuit_open(config_.name));
        }

        std::optional<std::invoke_result_t<Fn>> outcome;
        try {
            outcome.emplace(std::forward<Fn>(action)());
        } catch (...) {
            record_failure();
            throw;
        }
        auto result = std::move(*outcome);

        const bool succeeded = result.has_value();
        if (succeeded) {
            record_success();
        } else if (result.error().code == GatewayError::Code::UpstreamTimeout) {
            record_timeout();
        } else {
            record_failure();
        }
        return result;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Operator Control
    // ─────────────────────────────────────────────────────────────────────────

    /// Force Closed and clear the rolling window (ResetCircuitBreaker).
    void force_close();

    void on_state_change(StateChangeCallback callback);

private:
    enum class Outcome { Success, Failure, Timeout };

    struct Bucket {
        std::int64_t id{-1};
        OutcomeCounts counts;
    };

    using Clock = std::chrono::steady_clock;

    void record(Outcome outcome);

    // Caller must hold mutex_
    Bucket& current_bucket(Clock::time_point now);
    [[nodiscard]] OutcomeCounts window_counts(Clock::time_point now) const;
    [[nodiscard]] bool should_trip(Clock::time_point now) const;
    void transition_to(CircuitState next, Clock::time_point now);
    void clear_window();

    void fire(CircuitState old_state, CircuitState new_state,
              const std::vector<StateChangeCallback>& callbacks) const;

    CircuitBreakerConfig config_;
    Clock::time_point epoch_{Clock::now()};
    std::chrono::milliseconds bucket_width_{1000};

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    Clock::time_point opened_at_{};
    bool probe_in_flight_{false};
    std::vector<Bucket> buckets_;
    OutcomeCounts lifetime_;
    std::size_t state_transitions_{0};

    std::vector<StateChangeCallback> state_change_callbacks_;
};

}  // namespace meshgate
