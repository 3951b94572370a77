#ifndef MESHGATE_GATEWAY_REQUEST_HPP
#define MESHGATE_GATEWAY_REQUEST_HPP

#include "meshgate/gateway/gateway_error.hpp"
#include "meshgate/transport/http_types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// GatewayRequest
// ─────────────────────────────────────────────────────────────────────────────

struct GatewayRequest {
    HttpMethod method{HttpMethod::Get};
    std::string path;
    HeaderMap headers;
    std::string body;

    /// Explicit target service. When unset the service is resolved from `path`.
    std::optional<std::string> service;

    /// Set by the router on each dispatched copy: time left for this attempt.
    std::chrono::milliseconds attempt_timeout{0};

    GatewayRequest& with_service(std::string name) {
        service = std::move(name);
        return *this;
    }

    GatewayRequest& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    GatewayRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// GatewayResponse
// ─────────────────────────────────────────────────────────────────────────────

struct GatewayResponse {
    int status{200};
    HeaderMap headers;
    std::string body;

    bool from_cache{false};
    std::string endpoint;      ///< Endpoint that produced the response (empty on cache hit)
    std::size_t attempts{0};   ///< Dispatch attempts used (0 on cache hit)
};

// ─────────────────────────────────────────────────────────────────────────────
// Collaborator Signatures
// ─────────────────────────────────────────────────────────────────────────────

/// Serves a request on one endpoint. May return an error or throw; a thrown
/// std::exception is reported as UpstreamError.
using EndpointHandler = std::function<GatewayResult<GatewayResponse>(const GatewayRequest&)>;

/// Health probe: true = healthy, false = unhealthy, throw = probe failure (Error).
using HealthProbe = std::function<bool()>;

/// Pre-request hook. May rewrite the request. An error string aborts the call.
using Middleware = std::function<tl::expected<void, std::string>(GatewayRequest&)>;

}  // namespace meshgate

#endif  // MESHGATE_GATEWAY_REQUEST_HPP
