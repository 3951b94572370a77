#include "meshgate/health/endpoint_health.hpp"

#include <algorithm>

namespace meshgate {

EndpointHealth::EndpointHealth(std::size_t failure_threshold)
    : failure_threshold_(std::max<std::size_t>(1, failure_threshold))
{}

std::optional<HealthTransition> EndpointHealth::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_check_ = Clock::now();
    consecutive_failures_ = 0;
    return move_to(EndpointState::Healthy);
}

std::optional<HealthTransition> EndpointHealth::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_check_ = Clock::now();
    consecutive_failures_++;

    const bool threshold_reached = (consecutive_failures_ >= failure_threshold_);
    if (threshold_reached && is_serving(state_)) {
        return move_to(EndpointState::Unhealthy);
    }
    return std::nullopt;
}

std::optional<HealthTransition> EndpointHealth::record_probe_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_check_ = Clock::now();
    consecutive_failures_ = 0;
    last_error_.clear();
    return move_to(EndpointState::Healthy);
}

std::optional<HealthTransition> EndpointHealth::record_probe_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_check_ = Clock::now();
    consecutive_failures_++;
    last_error_ = std::move(message);
    return move_to(EndpointState::Error);
}

EndpointState EndpointHealth::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool EndpointHealth::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_serving(state_);
}

std::size_t EndpointHealth::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

std::optional<EndpointHealth::Clock::time_point> EndpointHealth::last_check() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_check_;
}

std::string EndpointHealth::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::optional<HealthTransition> EndpointHealth::move_to(EndpointState next) {
    if (state_ == next) {
        return std::nullopt;
    }
    HealthTransition transition{state_, next};
    state_ = next;
    return transition;
}

}  // namespace meshgate
