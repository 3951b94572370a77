#ifndef MESHGATE_GATEWAY_GATEWAY_ERROR_HPP
#define MESHGATE_GATEWAY_GATEWAY_ERROR_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Error
// ═══════════════════════════════════════════════════════════════════════════
// Single error type for every fallible gateway operation. Routing errors carry
// the service and endpoint they happened on so they can be logged with context
// before being mapped to a caller-visible HTTP status.

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace meshgate {

struct GatewayError {
    enum class Code {
        ServiceNotFound,     ///< No service registered under the name / path
        DuplicateService,    ///< Register called with a name already in use
        InvalidConfig,       ///< Registration or weight update rejected
        NoHealthyEndpoint,   ///< Healthy set empty and degraded fallback exhausted
        CircuitOpen,         ///< Breaker rejected the call without dispatch
        UpstreamTimeout,     ///< Dispatch exceeded the per-call or per-route timeout
        UpstreamError,       ///< Backend failed or answered with a failure status
        MiddlewareRejected   ///< A pre-request hook aborted the call
    };

    Code code;
    std::string message;
    std::string service;
    std::string endpoint;
    std::optional<int> upstream_status;  ///< Backend status code if one was received

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static GatewayError service_not_found(std::string service) {
        std::string msg = "Service " + service + " not found";
        return {Code::ServiceNotFound, std::move(msg), std::move(service), {}, std::nullopt};
    }

    [[nodiscard]] static GatewayError duplicate_service(std::string service) {
        std::string msg = "Service " + service + " is already registered";
        return {Code::DuplicateService, std::move(msg), std::move(service), {}, std::nullopt};
    }

    [[nodiscard]] static GatewayError invalid_config(std::string service, std::string msg) {
        return {Code::InvalidConfig, std::move(msg), std::move(service), {}, std::nullopt};
    }

    [[nodiscard]] static GatewayError no_healthy_endpoint(std::string service) {
        std::string msg = "No healthy endpoints available for " + service;
        return {Code::NoHealthyEndpoint, std::move(msg), std::move(service), {}, std::nullopt};
    }

    [[nodiscard]] static GatewayError circuit_open(std::string service) {
        std::string msg = "Circuit breaker is open for " + service;
        return {Code::CircuitOpen, std::move(msg), std::move(service), {}, std::nullopt};
    }

    [[nodiscard]] static GatewayError upstream_timeout(std::string service, std::string endpoint) {
        std::string msg = "Request timed out for " + service;
        return {Code::UpstreamTimeout, std::move(msg), std::move(service), std::move(endpoint), std::nullopt};
    }

    [[nodiscard]] static GatewayError upstream_error(
        std::string service,
        std::string endpoint,
        std::string msg,
        std::optional<int> status = std::nullopt
    ) {
        return {Code::UpstreamError, std::move(msg), std::move(service), std::move(endpoint), status};
    }

    [[nodiscard]] static GatewayError middleware_rejected(std::string service, std::string msg) {
        return {Code::MiddlewareRejected, std::move(msg), std::move(service), {}, std::nullopt};
    }
};

template <typename T>
using GatewayResult = tl::expected<T, GatewayError>;

/// Convert error code to string for logging
[[nodiscard]] constexpr std::string_view to_string(GatewayError::Code code) noexcept {
    switch (code) {
        case GatewayError::Code::ServiceNotFound:    return "ServiceNotFound";
        case GatewayError::Code::DuplicateService:   return "DuplicateService";
        case GatewayError::Code::InvalidConfig:      return "InvalidConfig";
        case GatewayError::Code::NoHealthyEndpoint:  return "NoHealthyEndpoint";
        case GatewayError::Code::CircuitOpen:        return "CircuitOpen";
        case GatewayError::Code::UpstreamTimeout:    return "UpstreamTimeout";
        case GatewayError::Code::UpstreamError:      return "UpstreamError";
        case GatewayError::Code::MiddlewareRejected: return "MiddlewareRejected";
    }
    return "Unknown";
}

/// Caller-visible status for an error: 404 for unknown services, 503 when the
/// gateway refused to dispatch, 504 on timeouts, 502 for everything upstream.
[[nodiscard]] constexpr int to_http_status(GatewayError::Code code) noexcept {
    switch (code) {
        case GatewayError::Code::ServiceNotFound:    return 404;
        case GatewayError::Code::DuplicateService:   return 409;
        case GatewayError::Code::InvalidConfig:      return 400;
        case GatewayError::Code::NoHealthyEndpoint:  return 503;
        case GatewayError::Code::CircuitOpen:        return 503;
        case GatewayError::Code::UpstreamTimeout:    return 504;
        case GatewayError::Code::UpstreamError:      return 502;
        case GatewayError::Code::MiddlewareRejected: return 502;
    }
    return 502;
}

[[nodiscard]] constexpr int to_http_status(const GatewayError& error) noexcept {
    return to_http_status(error.code);
}

}  // namespace meshgate

#endif  // MESHGATE_GATEWAY_GATEWAY_ERROR_HPP
