#ifndef MESHGATE_RESILIENCE_RETRY_POLICY_HPP
#define MESHGATE_RESILIENCE_RETRY_POLICY_HPP

#include "meshgate/gateway/gateway_error.hpp"

#include <algorithm>
#include <cstddef>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides *whether* a failed attempt is retried; IBackoffPolicy decides how
// long to wait first.
//
// Retried: UpstreamTimeout, UpstreamError.
// Never retried: ServiceNotFound, CircuitOpen, MiddlewareRejected and the
// management errors. NoHealthyEndpoint ends the loop because there is nothing
// left to dispatch to.
//
// Usage:
//   RetryPolicy policy;
//   policy.with_max_attempts(config.max_retries);
//
//   if (policy.should_retry(error, attempt)) { ... }

class RetryPolicy {
public:
    RetryPolicy() = default;

    /// Total attempts including the first dispatch. 0 is treated as 1.
    RetryPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = attempts;
        return *this;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return std::max<std::size_t>(1, max_attempts_);
    }

    /// @param error   Outcome of the attempt that just failed
    /// @param attempt 1-based number of the attempt that just failed
    [[nodiscard]] bool should_retry(const GatewayError& error, std::size_t attempt) const {
        const bool within_limit = (attempt < max_attempts());
        if (within_limit == false) {
            return false;
        }
        return is_retryable(error);
    }

    [[nodiscard]] bool is_retryable(const GatewayError& error) const {
        switch (error.code) {
            case GatewayError::Code::UpstreamTimeout:
            case GatewayError::Code::UpstreamError:
                return true;

            case GatewayError::Code::ServiceNotFound:
            case GatewayError::Code::DuplicateService:
            case GatewayError::Code::InvalidConfig:
            case GatewayError::Code::NoHealthyEndpoint:
            case GatewayError::Code::CircuitOpen:
            case GatewayError::Code::MiddlewareRejected:
                return false;
        }
        return false;
    }

private:
    std::size_t max_attempts_{3};
};

}  // namespace meshgate

#endif  // MESHGATE_RESILIENCE_RETRY_POLICY_HPP
