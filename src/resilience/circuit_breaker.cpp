#include "meshgate/resilience/circuit_breaker.hpp"

#include <algorithm>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config))
{
    config_.rolling_buckets = std::max<std::size_t>(1, config_.rolling_buckets);
    const auto width = config_.rolling_window / static_cast<std::int64_t>(config_.rolling_buckets);
    bucket_width_ = std::max(width, std::chrono::milliseconds{1});
    buckets_.resize(config_.rolling_buckets);
}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────

bool CircuitBreaker::allow_request() {
    std::vector<StateChangeCallback> callbacks_to_fire;
    CircuitState old_state{CircuitState::Open};
    bool should_fire_callbacks = false;
    bool result = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();

        switch (state_) {
            case CircuitState::Closed:
                result = true;
                break;

            case CircuitState::Open: {
                const bool cooled_down = (now - opened_at_) >= config_.reset_timeout;
                if (cooled_down) {
                    old_state = state_;
                    transition_to(CircuitState::HalfOpen, now);
                    probe_in_flight_ = true;
                    callbacks_to_fire = state_change_callbacks_;
                    should_fire_callbacks = true;
                    result = true;
                }
                break;
            }

            case CircuitState::HalfOpen:
                if (probe_in_flight_ == false) {
                    probe_in_flight_ = true;
                    result = true;
                }
                break;
        }

        if (result == false) {
            current_bucket(now).counts.rejections++;
            lifetime_.rejections++;
        }
    }

    if (should_fire_callbacks) {
        fire(old_state, CircuitState::HalfOpen, callbacks_to_fire);
    }

    return result;
}

void CircuitBreaker::record_success() {
    record(Outcome::Success);
}

void CircuitBreaker::record_failure() {
    record(Outcome::Failure);
}

void CircuitBreaker::record_timeout() {
    record(Outcome::Timeout);
}

void CircuitBreaker::record(Outcome outcome) {
    std::vector<StateChangeCallback> callbacks_to_fire;
    CircuitState old_state{CircuitState::Closed};
    CircuitState new_state{CircuitState::Closed};
    bool should_fire_callbacks = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();

        auto& counts = current_bucket(now).counts;
        switch (outcome) {
            case Outcome::Success:
                counts.successes++;
                lifetime_.successes++;
                break;
            case Outcome::Failure:
                counts.failures++;
                lifetime_.failures++;
                break;
            case Outcome::Timeout:
                counts.timeouts++;
                lifetime_.timeouts++;
                break;
        }

        const bool failed = (outcome != Outcome::Success);

        switch (state_) {
            case CircuitState::Closed:
                if (failed && should_trip(now)) {
                    old_state = state_;
                    new_state = CircuitState::Open;
                    transition_to(new_state, now);
                    should_fire_callbacks = true;
                }
                break;

            case CircuitState::HalfOpen:
                probe_in_flight_ = false;
                old_state = state_;
                new_state = failed ? CircuitState::Open : CircuitState::Closed;
                transition_to(new_state, now);
                if (new_state == CircuitState::Closed) {
                    clear_window();
                }
                should_fire_callbacks = true;
                break;

            case CircuitState::Open:
                // Late result of a call admitted before the trip
                break;
        }

        if (should_fire_callbacks) {
            callbacks_to_fire = state_change_callbacks_;
        }
    }

    if (should_fire_callbacks) {
        fire(old_state, new_state, callbacks_to_fire);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Open;
}

bool CircuitBreaker::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Closed;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CircuitBreakerStats{
        .lifetime = lifetime_,
        .window = window_counts(Clock::now()),
        .state_transitions = state_transitions_,
        .current_state = state_
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Operator Control
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::force_close() {
    std::vector<StateChangeCallback> callbacks_to_fire;
    CircuitState old_state{CircuitState::Closed};
    bool should_fire_callbacks = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = state_;
        probe_in_flight_ = false;
        clear_window();
        if (state_ != CircuitState::Closed) {
            transition_to(CircuitState::Closed, Clock::now());
            callbacks_to_fire = state_change_callbacks_;
            should_fire_callbacks = true;
        }
    }

    if (should_fire_callbacks) {
        fire(old_state, CircuitState::Closed, callbacks_to_fire);
    }
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::Bucket& CircuitBreaker::current_bucket(Clock::time_point now) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - epoch_);
    const std::int64_t id = elapsed.count() / bucket_width_.count();
    auto& bucket = buckets_[static_cast<std::size_t>(id) % buckets_.size()];
    if (bucket.id != id) {
        bucket.id = id;
        bucket.counts = OutcomeCounts{};
    }
    return bucket;
}

OutcomeCounts CircuitBreaker::window_counts(Clock::time_point now) const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - epoch_);
    const std::int64_t current_id = elapsed.count() / bucket_width_.count();
    const auto oldest_id = current_id - static_cast<std::int64_t>(buckets_.size()) + 1;

    OutcomeCounts total;
    for (const auto& bucket : buckets_) {
        const bool in_window = (bucket.id >= oldest_id) && (bucket.id <= current_id);
        if (in_window == false) {
            continue;
        }
        total.successes += bucket.counts.successes;
        total.failures += bucket.counts.failures;
        total.timeouts += bucket.counts.timeouts;
        total.rejections += bucket.counts.rejections;
    }
    return total;
}

bool CircuitBreaker::should_trip(Clock::time_point now) const {
    const auto window = window_counts(now);

    const bool timeout_trip_enabled = (config_.timeout_threshold > 0);
    if (timeout_trip_enabled && window.timeouts >= config_.timeout_threshold) {
        return true;
    }

    const std::size_t volume = window.executed();
    if (volume < config_.volume_threshold || volume == 0) {
        return false;
    }

    const std::size_t failed = window.failures + window.timeouts;
    return failed * 100 >= config_.error_threshold_percentage * volume;
}

void CircuitBreaker::transition_to(CircuitState next, Clock::time_point now) {
    state_ = next;
    state_transitions_++;
    if (next == CircuitState::Open) {
        opened_at_ = now;
    }
}

void CircuitBreaker::clear_window() {
    for (auto& bucket : buckets_) {
        bucket = Bucket{};
    }
}

void CircuitBreaker::fire(
    CircuitState old_state,
    CircuitState new_state,
    const std::vector<StateChangeCallback>& callbacks
) const {
    // Always invoked without mutex_ held so callbacks may query the breaker
    for (const auto& callback : callbacks) {
        callback(old_state, new_state);
    }
}

}  // namespace meshgate
