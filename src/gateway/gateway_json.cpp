#include "meshgate/gateway/gateway_json.hpp"

namespace meshgate {

Json to_json(const ServiceHealth& health) {
    Json endpoints = Json::array();
    for (const auto& endpoint : health.endpoints) {
        Json entry = {
            {"path", endpoint.path},
            {"state", std::string(to_string(endpoint.state))},
            {"isHealthy", endpoint.healthy},
            {"consecutiveFailures", endpoint.consecutive_failures},
            {"activeConnections", endpoint.active_connections},
            {"weight", endpoint.weight}
        };
        if (endpoint.since_last_check.has_value()) {
            entry["msSinceLastCheck"] = endpoint.since_last_check->count();
        } else {
            entry["msSinceLastCheck"] = nullptr;
        }
        endpoints.push_back(std::move(entry));
    }

    return Json{
        {"isActive", health.is_active},
        {"healthPercentage", health.health_percentage},
        {"breakerState", std::string(to_string(health.breaker_state))},
        {"endpoints", std::move(endpoints)}
    };
}

Json to_json(const ServiceMetrics& metrics) {
    const auto& sample = metrics.sample;
    return Json{
        {"success", metrics.success},
        {"failure", metrics.failure},
        {"timeout", metrics.timeout},
        {"rejected", metrics.rejected},
        {"circuitState", std::string(to_string(metrics.circuit_state))},
        {"healthyEndpoints", metrics.healthy_endpoints},
        {"totalEndpoints", metrics.total_endpoints},
        {"requestCount", sample.request_count},
        {"errorCount", sample.error_count},
        {"cacheHits", sample.cache_hits},
        {"degradedDispatches", sample.degraded_dispatches},
        {"avgResponseTime", sample.avg_response_time},
        {"p95ResponseTime", sample.p95_response_time},
        {"availabilityPercentage", sample.availability_percentage}
    };
}

Json to_json(const ServiceInfo& info) {
    return Json{
        {"name", info.name},
        {"version", info.version},
        {"tags", info.tags},
        {"status", info.active ? "active" : "inactive"},
        {"endpoints", info.endpoint_count}
    };
}

Json to_json(const GatewayError& error) {
    Json j = {
        {"error", std::string(to_string(error.code))},
        {"status", to_http_status(error)},
        {"message", error.message}
    };
    if (error.service.empty() == false) {
        j["service"] = error.service;
    }
    if (error.endpoint.empty() == false) {
        j["endpoint"] = error.endpoint;
    }
    if (error.upstream_status.has_value()) {
        j["upstreamStatus"] = *error.upstream_status;
    }
    return j;
}

Json to_json(const GatewayResponse& response) {
    return Json{
        {"status", response.status},
        {"headers", response.headers},
        {"body", response.body},
        {"fromCache", response.from_cache},
        {"endpoint", response.endpoint},
        {"attempts", response.attempts}
    };
}

Json health_report_json(const std::map<std::string, ServiceHealth>& report) {
    Json j = Json::object();
    for (const auto& [name, health] : report) {
        j[name] = to_json(health);
    }
    return j;
}

Json metrics_report_json(const std::map<std::string, ServiceMetrics>& report) {
    Json j = Json::object();
    for (const auto& [name, metrics] : report) {
        j[name] = to_json(metrics);
    }
    return j;
}

Json services_json(const std::vector<ServiceInfo>& services) {
    Json j = Json::array();
    for (const auto& info : services) {
        j.push_back(to_json(info));
    }
    return j;
}

}  // namespace meshgate
