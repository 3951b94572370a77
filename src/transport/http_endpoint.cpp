#include "meshgate/transport/http_endpoint.hpp"

#include "meshgate/log/logger.hpp"

namespace meshgate {

HttpEndpointHandler::HttpEndpointHandler(std::shared_ptr<IHttpClient> client, std::string base_url)
    : client_(std::move(client))
    , base_url_(std::move(base_url))
{}

GatewayResult<GatewayResponse> HttpEndpointHandler::operator()(const GatewayRequest& request) const {
    HttpClientRequest outbound;
    outbound.method = request.method;
    outbound.url = join_url(base_url_, request.path);
    outbound.headers = request.headers;
    outbound.body = request.body;
    outbound.timeout = request.attempt_timeout;

    auto result = client_->send(outbound);
    if (result.has_value() == false) {
        const auto& err = result.error();
        if (err.code == HttpClientError::Code::Timeout) {
            return tl::unexpected(GatewayError::upstream_timeout(
                request.service.value_or(""), base_url_));
        }
        return tl::unexpected(GatewayError::upstream_error(
            request.service.value_or(""), base_url_, err.message));
    }

    auto& response = *result;
    const bool ok = response.is_success();
    if (ok == false) {
        return tl::unexpected(GatewayError::upstream_error(
            request.service.value_or(""),
            base_url_,
            "Upstream responded with status " + std::to_string(response.status_code),
            response.status_code
        ));
    }

    GatewayResponse out;
    out.status = response.status_code;
    out.headers = std::move(response.headers);
    out.body = std::move(response.body);
    return out;
}

HealthProbe make_http_health_probe(
    std::shared_ptr<IHttpClient> client,
    std::string base_url,
    std::chrono::milliseconds timeout
) {
    return [client = std::move(client), url = join_url(base_url, "/health"), timeout]() {
        auto result = client->get(url, timeout);
        if (result.has_value() == false) {
            get_logger().debug("Health probe transport failure",
                {{"url", url}, {"error", result.error().message}});
            return false;
        }
        return result->status_code == 200;
    };
}

}  // namespace meshgate
