#pragma once

#include "meshgate/gateway/request.hpp"
#include "meshgate/transport/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// HttpEndpointHandler
// ─────────────────────────────────────────────────────────────────────────────
// EndpointHandler for endpoints whose target is an http(s) URL. Forwards the
// method, headers and body to <base_url><request.path>.
//
//   2xx              -> GatewayResponse
//   other status     -> UpstreamError carrying the status
//   client timeout   -> UpstreamTimeout
//   transport error  -> UpstreamError

class HttpEndpointHandler {
public:
    HttpEndpointHandler(std::shared_ptr<IHttpClient> client, std::string base_url);

    GatewayResult<GatewayResponse> operator()(const GatewayRequest& request) const;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    std::shared_ptr<IHttpClient> client_;
    std::string base_url_;
};

/// Default probe: GET <base_url>/health, healthy iff the status is 200.
/// Transport failures report unhealthy rather than throwing.
[[nodiscard]] HealthProbe make_http_health_probe(
    std::shared_ptr<IHttpClient> client,
    std::string base_url,
    std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}
);

}  // namespace meshgate
