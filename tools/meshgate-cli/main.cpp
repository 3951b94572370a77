// ─────────────────────────────────────────────────────────────────────────────
// meshgate-cli - Gateway Configuration Runner
// ─────────────────────────────────────────────────────────────────────────────
// Loads a gateway configuration, registers its services and pushes requests
// through the routing engine.
//
// Usage:
//   # Validate a configuration and list the registered services
//   meshgate-cli --config gateway.json
//
//   # Route requests (METHOD:PATH, repeatable) and print the responses
//   meshgate-cli --config gateway.json --request GET:/users/42 --request POST:/orders
//
//   # Target a service explicitly and dump health and metrics afterwards
//   meshgate-cli --config gateway.json --service users --request GET:/profile \
//                --health --metrics --json
//
// Features:
//   - Service registration straight from a JSON document
//   - Optional background health sweeps (--start-health)
//   - Circuit breaker reset by service name
//   - Health, metrics and discovery reports as text or JSON

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "meshgate/config/gateway_config.hpp"
#include "meshgate/gateway/gateway.hpp"
#include "meshgate/gateway/gateway_json.hpp"
#include "meshgate/log/logger.hpp"
#include "meshgate/log/spdlog_logger.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace meshgate;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

const char* state_color(CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return color::green;
        case CircuitState::HalfOpen: return color::yellow;
        case CircuitState::Open:     return color::red;
    }
    return color::reset;
}

// ═══════════════════════════════════════════════════════════════════════════
// Request Parsing
// ═══════════════════════════════════════════════════════════════════════════

// "GET:/users/42" -> {Get, "/users/42"}. A bare path is a GET.
std::optional<GatewayRequest> parse_request_spec(const std::string& spec) {
    GatewayRequest request;

    const auto colon_pos = spec.find(':');
    const bool has_method = (colon_pos != std::string::npos) && (spec.front() != '/');
    if (has_method == false) {
        request.path = spec;
        return request;
    }

    const auto method = parse_http_method(spec.substr(0, colon_pos));
    if (method.has_value() == false) {
        return std::nullopt;
    }
    request.method = *method;
    request.path = spec.substr(colon_pos + 1);
    return request;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_route(Gateway& gateway, const std::vector<std::string>& specs,
              const std::optional<std::string>& service, bool json_output) {
    int exit_code = 0;
    Json results = Json::array();

    if (json_output == false) {
        print_header("Requests");
    }

    for (const auto& spec : specs) {
        auto request = parse_request_spec(spec);
        if (request.has_value() == false) {
            print_error("Invalid request '" + spec + "' (expected METHOD:PATH)");
            exit_code = 1;
            continue;
        }
        if (service.has_value()) {
            request->with_service(*service);
        }

        const auto method = std::string(to_string(request->method));
        const auto path = request->path;
        const auto started = std::chrono::steady_clock::now();
        auto response = gateway.route(std::move(*request));
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        );

        if (json_output) {
            Json entry = {{"request", method + " " + path}, {"elapsedMs", elapsed.count()}};
            if (response.has_value()) {
                entry["response"] = to_json(*response);
            } else {
                entry["error"] = to_json(response.error());
            }
            results.push_back(std::move(entry));
        } else if (response.has_value()) {
            std::cout << color::c(color::green) << response->status << color::c(color::reset)
                      << "  " << method << " " << path
                      << color::c(color::dim) << "  (" << elapsed.count() << " ms";
            if (response->from_cache) {
                std::cout << ", cached";
            } else {
                std::cout << ", " << response->endpoint << ", attempts=" << response->attempts;
            }
            std::cout << ")" << color::c(color::reset) << "\n";
            if (response->body.empty() == false) {
                std::cout << "    " << response->body << "\n";
            }
        } else {
            const auto& error = response.error();
            std::cout << color::c(color::red) << to_http_status(error) << color::c(color::reset)
                      << "  " << method << " " << path
                      << color::c(color::dim) << "  (" << to_string(error.code) << ")"
                      << color::c(color::reset) << "\n"
                      << "    " << error.message << "\n";
        }

        if (response.has_value() == false) {
            exit_code = 1;
        }
    }

    if (json_output) {
        print_json(results);
    }
    return exit_code;
}

void cmd_services(const Gateway& gateway, bool json_output) {
    const auto services = gateway.discover();
    if (json_output) {
        print_json(services_json(services));
        return;
    }

    print_header("Services (" + std::to_string(services.size()) + ")");
    for (const auto& info : services) {
        std::cout << "  " << color::c(color::yellow) << info.name << color::c(color::reset)
                  << color::c(color::dim) << " v" << info.version
                  << ", " << info.endpoint_count << " endpoint(s)" << color::c(color::reset);
        if (info.tags.empty() == false) {
            std::cout << "  [";
            for (std::size_t i = 0; i < info.tags.size(); ++i) {
                std::cout << (i > 0 ? ", " : "") << info.tags[i];
            }
            std::cout << "]";
        }
        std::cout << (info.active ? "" : "  (inactive)") << "\n";
    }
}

void cmd_health(const Gateway& gateway, bool json_output) {
    const auto report = gateway.get_health();
    if (json_output) {
        print_json(health_report_json(report));
        return;
    }

    print_header("Health");
    for (const auto& [name, health] : report) {
        std::cout << "  " << color::c(color::bold) << name << color::c(color::reset)
                  << "  " << health.health_percentage << "% healthy, breaker "
                  << color::c(state_color(health.breaker_state))
                  << to_string(health.breaker_state) << color::c(color::reset) << "\n";
        for (const auto& endpoint : health.endpoints) {
            std::cout << "    " << (endpoint.healthy ? color::c(color::green) : color::c(color::red))
                      << to_string(endpoint.state) << color::c(color::reset)
                      << "  " << endpoint.path
                      << color::c(color::dim) << "  failures=" << endpoint.consecutive_failures
                      << " weight=" << endpoint.weight << color::c(color::reset) << "\n";
        }
    }
}

void cmd_metrics(const Gateway& gateway, bool json_output) {
    const auto report = gateway.get_metrics();
    if (json_output) {
        print_json(metrics_report_json(report));
        return;
    }

    print_header("Metrics");
    for (const auto& [name, metrics] : report) {
        const auto& sample = metrics.sample;
        std::cout << "  " << color::c(color::bold) << name << color::c(color::reset) << "\n"
                  << "    requests=" << sample.request_count
                  << " errors=" << sample.error_count
                  << " cacheHits=" << sample.cache_hits
                  << " availability=" << sample.availability_percentage << "%\n"
                  << "    avg=" << sample.avg_response_time << "ms"
                  << " p95=" << sample.p95_response_time << "ms\n"
                  << "    breaker: success=" << metrics.success
                  << " failure=" << metrics.failure
                  << " timeout=" << metrics.timeout
                  << " rejected=" << metrics.rejected << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("meshgate-cli", "Service Gateway Runner");

    options.add_options()
        ("c,config", "Gateway configuration file (JSON)", cxxopts::value<std::string>())

        // Traffic
        ("r,request", "Request to route, METHOD:PATH (can be repeated)", cxxopts::value<std::vector<std::string>>())
        ("s,service", "Route every request to this service instead of resolving by path", cxxopts::value<std::string>())
        ("start-health", "Run background health sweeps while routing")
        ("settle", "Milliseconds to wait after start before routing", cxxopts::value<int>()->default_value("0"))

        // Operations
        ("reset-breaker", "Force a service's circuit breaker closed", cxxopts::value<std::string>())
        ("health", "Print the health report")
        ("metrics", "Print the metrics report")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error or off (overrides the config)", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file (overrides the config)", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    meshgate-cli -c gateway.json\n";
            std::cout << "    meshgate-cli -c gateway.json -r GET:/users/42 -r GET:/users/42 --metrics\n";
            std::cout << "    meshgate-cli -c gateway.json -s orders -r POST:/orders --health --json\n";
            return 0;
        }

        // Setup
        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        if (result.count("config") == 0) {
            print_error("Must specify --config");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        GatewayConfig config;
        try {
            config = load_gateway_config(result["config"].as<std::string>());
        } catch (const ConfigError& e) {
            print_error(std::string("Invalid configuration: ") + e.what());
            return 1;
        }

        // Quiet unless the config or the command line asks for more
        LoggingConfig logging;
        logging.level = LogLevel::Warn;
        if (config.logging.has_value()) {
            logging = *config.logging;
        }
        if (result.count("log-level")) {
            logging.level = parse_log_level(result["log-level"].as<std::string>());
        }
        if (result.count("log-file")) {
            logging.file = result["log-file"].as<std::string>();
        }
        try {
            set_logger(make_spdlog_logger(logging));
        } catch (const spdlog::spdlog_ex& e) {
            print_error(std::string("Cannot set up logging: ") + e.what());
            return 1;
        }

        Gateway gateway(config.options);

        for (auto& service : config.services) {
            const auto name = service.name;
            auto registered = gateway.register_service(std::move(service));
            if (registered.has_value() == false) {
                print_error("Cannot register '" + name + "': " + registered.error().message);
                return 1;
            }
        }

        if (result.count("start-health")) {
            gateway.start();
            const auto settle = result["settle"].as<int>();
            if (settle > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(settle));
            }
        }

        if (result.count("reset-breaker")) {
            const auto name = result["reset-breaker"].as<std::string>();
            auto reset = gateway.reset_circuit_breaker(name);
            if (reset.has_value() == false) {
                print_error(reset.error().message);
                return 1;
            }
            if (json_output == false) {
                std::cout << color::c(color::green) << "✓ " << color::c(color::reset)
                          << "Circuit breaker reset for " << name << "\n";
            }
        }

        int exit_code = 0;
        if (result.count("request")) {
            std::optional<std::string> service;
            if (result.count("service")) {
                service = result["service"].as<std::string>();
            }
            exit_code = cmd_route(
                gateway, result["request"].as<std::vector<std::string>>(), service, json_output
            );
        } else if (result.count("health") == 0 && result.count("metrics") == 0) {
            cmd_services(gateway, json_output);
        }

        if (result.count("health")) {
            cmd_health(gateway, json_output);
        }
        if (result.count("metrics")) {
            cmd_metrics(gateway, json_output);
        }

        gateway.stop();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
