#pragma once

#include "meshgate/gateway/gateway.hpp"
#include "meshgate/log/spdlog_logger.hpp"
#include "meshgate/registry/service_config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshgate {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// ConfigError
// ─────────────────────────────────────────────────────────────────────────────

class ConfigError : public std::runtime_error {
public:
    ConfigError(std::string field, const std::string& message)
        : std::runtime_error(field.empty() ? message : field + ": " + message)
        , field_(std::move(field))
    {}

    /// Dotted path of the offending field, e.g. "services[1].timeout"
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// ─────────────────────────────────────────────────────────────────────────────
// GatewayConfig
// ─────────────────────────────────────────────────────────────────────────────
// Document layout (durations in milliseconds, cacheTTL in seconds):
//
//   {
//     "gateway": {
//       "dispatchThreads": 8, "degradedFallback": true, "routeCacheTTL": 60000,
//       "randomSeed": 7, "cacheMaxEntries": 10000,
//       "health":  { "failureThreshold": 3, "checkInterval": 30000, ... },
//       "backoff": { "base": 100, "multiplier": 2.0, "cap": 5000, "jitter": 100 },
//       "circuitBreaker": { "timeout": 3000, "errorThresholdPercentage": 50, ... }
//     },
//     "logging": { "level": "info", "file": "gateway.log", "maxFileSize": 1048576,
//                  "maxFiles": 3, "console": true, "async": false },
//     "services": [
//       { "name": "users", "routes": ["/api/users"],
//         "endpoints": [ { "path": "http://10.0.0.5:8080", "weight": 2 } ],
//         "timeout": 5000, "maxRetries": 3, "cacheTTL": 300,
//         "loadBalancingStrategy": "weighted", "tags": ["core"], "version": "2.1.0" }
//     ]
//   }
//
// Handlers, probes and middleware cannot be expressed in JSON; endpoints loaded
// this way are http(s) URLs served by the gateway's HTTP client.

struct GatewayConfig {
    GatewayOptions options;

    /// Present only when the document has a "logging" section
    std::optional<LoggingConfig> logging;

    std::vector<ServiceConfig> services;
};

/// Throws ConfigError on malformed input.
[[nodiscard]] GatewayConfig parse_gateway_config(const Json& document);

/// Parse JSON text. Throws ConfigError on syntax or schema errors.
[[nodiscard]] GatewayConfig parse_gateway_config_text(const std::string& text);

/// Read and parse a file. Throws ConfigError when unreadable or malformed.
[[nodiscard]] GatewayConfig load_gateway_config(const std::string& path);

}  // namespace meshgate
