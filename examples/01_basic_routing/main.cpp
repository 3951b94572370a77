// Example 01: Basic Routing
//
// Registers two in-process services and routes requests to them by path.
// Shows response caching, tracking headers and the metrics report.

#include <meshgate/gateway/gateway.hpp>
#include <meshgate/gateway/gateway_json.hpp>
#include <meshgate/log/spdlog_logger.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace meshgate;
using Json = nlohmann::json;

int main() {
    std::cout << "=== Basic Routing Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Create the gateway
    GatewayOptions options;
    options.random_seed = 42;
    Gateway gateway(options);

    // 2. Register services
    ServiceConfig users;
    users.name = "users";
    users.with_endpoint({
            .path = "/users",
            .handler = [](const GatewayRequest& request) -> GatewayResult<GatewayResponse> {
                GatewayResponse response;
                response.body = Json{
                    {"user", request.path},
                    {"requestId", get_header(request.headers, kRequestIdHeader).value_or("")}
                }.dump();
                return response;
            },
        })
        .with_tag("core");

    ServiceConfig orders;
    orders.name = "orders";
    orders.with_endpoint({
            .path = "/orders",
            .handler = [](const GatewayRequest& request) -> GatewayResult<GatewayResponse> {
                GatewayResponse response;
                response.status = request.method == HttpMethod::Post ? 201 : 200;
                response.body = R"({"orders":[]})";
                return response;
            },
        })
        .with_route("/api/orders")
        .with_tag("core");

    for (auto* config : {&users, &orders}) {
        auto registered = gateway.register_service(std::move(*config));
        if (!registered) {
            std::cerr << "Failed to register: " << registered.error().message << "\n";
            return 1;
        }
    }

    // 3. Route a few requests
    const GatewayRequest requests[] = {
        {.method = HttpMethod::Get, .path = "/users/42"},
        {.method = HttpMethod::Get, .path = "/users/42"},   // served from cache
        {.method = HttpMethod::Post, .path = "/api/orders"},
        {.method = HttpMethod::Get, .path = "/inventory"},  // no service
    };

    for (const auto& request : requests) {
        auto response = gateway.route(request);
        std::cout << to_string(request.method) << " " << request.path << " -> ";
        if (response) {
            std::cout << response->status << (response->from_cache ? " (cache)" : "")
                      << " endpoint=" << (response->endpoint.empty() ? "-" : response->endpoint)
                      << " body=" << response->body << "\n";
        } else {
            std::cout << to_http_status(response.error()) << " " << response.error().message << "\n";
        }
    }

    // 4. Inspect metrics
    std::cout << "\n=== Metrics ===\n";
    std::cout << metrics_report_json(gateway.get_metrics()).dump(2) << "\n";

    std::cout << "\n=== Services tagged 'core' ===\n";
    std::cout << services_json(gateway.services_by_tag("core")).dump(2) << "\n";

    return 0;
}
