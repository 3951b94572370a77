#ifndef MESHGATE_GATEWAY_GATEWAY_JSON_HPP
#define MESHGATE_GATEWAY_GATEWAY_JSON_HPP

#include "meshgate/gateway/gateway.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace meshgate {

using Json = nlohmann::json;

// JSON views of the operator surface (camelCase keys)

[[nodiscard]] Json to_json(const ServiceHealth& health);
[[nodiscard]] Json to_json(const ServiceMetrics& metrics);
[[nodiscard]] Json to_json(const ServiceInfo& info);
[[nodiscard]] Json to_json(const GatewayError& error);
[[nodiscard]] Json to_json(const GatewayResponse& response);

[[nodiscard]] Json health_report_json(const std::map<std::string, ServiceHealth>& report);
[[nodiscard]] Json metrics_report_json(const std::map<std::string, ServiceMetrics>& report);
[[nodiscard]] Json services_json(const std::vector<ServiceInfo>& services);

}  // namespace meshgate

#endif  // MESHGATE_GATEWAY_GATEWAY_JSON_HPP
