#ifndef MESHGATE_RESILIENCE_BACKOFF_POLICY_HPP
#define MESHGATE_RESILIENCE_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy - Strategy Pattern Interface
// ─────────────────────────────────────────────────────────────────────────────
// Defines how long the router sleeps between retry attempts. Tests inject
// NoBackoff so retry loops run without real delays.
//
// Implementations must be safe to call from concurrent requests: one policy
// instance is shared by every service of a gateway.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // Delay before the next retry attempt.
    // attempt: 0-indexed retry number (0 = first retry after initial failure)
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// BackoffConfig
// ─────────────────────────────────────────────────────────────────────────────

struct BackoffConfig {
    /// Delay before the first retry
    std::chrono::milliseconds base{100};

    /// Growth factor per attempt
    double multiplier{2.0};

    /// Upper bound on the exponential part. 0 = unbounded.
    std::chrono::milliseconds cap{5000};

    /// Additive jitter, drawn uniformly from [0, jitter)
    std::chrono::milliseconds jitter{100};
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff - Concrete Strategy
// ─────────────────────────────────────────────────────────────────────────────
// Formula: delay = min(cap, base * multiplier^attempt) + uniform(0, jitter)
//
// With the defaults (base=100ms, x2, cap=5s, jitter=100ms):
//   Attempt 0: 100ms  + [0,100)ms
//   Attempt 1: 200ms  + [0,100)ms
//   Attempt 2: 400ms  + [0,100)ms
//   Attempt 6+: 5000ms + [0,100)ms

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(BackoffConfig{})
    {}

    explicit ExponentialBackoff(BackoffConfig config)
        : config_(config)
        , rng_(std::random_device{}())
    {}

    ExponentialBackoff(BackoffConfig config, std::uint32_t seed)
        : config_(config)
        , rng_(seed)
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double exponent = static_cast<double>(attempt);
        const double base_ms = static_cast<double>(config_.base.count());
        double delay_ms = base_ms * std::pow(config_.multiplier, exponent);

        const bool has_cap = (config_.cap.count() > 0);
        if (has_cap) {
            delay_ms = std::min(delay_ms, static_cast<double>(config_.cap.count()));
        }

        delay_ms += draw_jitter();

        const auto result_ms = static_cast<std::int64_t>(std::max(0.0, delay_ms));
        return std::chrono::milliseconds{result_ms};
    }

    [[nodiscard]] const BackoffConfig& config() const noexcept { return config_; }

private:
    double draw_jitter() {
        const bool has_jitter = (config_.jitter.count() > 0);
        if (has_jitter == false) {
            return 0.0;
        }

        std::uniform_real_distribution<double> dist(
            0.0,
            static_cast<double>(config_.jitter.count())
        );
        std::lock_guard<std::mutex> lock(rng_mutex_);
        return dist(rng_);
    }

    BackoffConfig config_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - Testing Helper
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace meshgate

#endif  // MESHGATE_RESILIENCE_BACKOFF_POLICY_HPP
