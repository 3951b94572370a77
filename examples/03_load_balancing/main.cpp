// Example 03: Load Balancing
//
// Spreads traffic over three replicas with the weighted strategy, then
// rebalances the weights at runtime and marks one replica unhealthy through
// its health probe.

#include <meshgate/gateway/gateway.hpp>
#include <meshgate/gateway/gateway_json.hpp>
#include <meshgate/log/spdlog_logger.hpp>

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

using namespace meshgate;

int main() {
    std::cout << "=== Load Balancing Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    GatewayOptions options;
    options.random_seed = 7;
    options.health.failure_threshold = 1;
    options.health.recent_check_skip = std::chrono::milliseconds(0);
    Gateway gateway(options);

    std::mutex hits_mutex;
    std::map<std::string, int> hits;
    std::atomic<bool> replica_c_healthy{true};

    auto replica = [&](std::string name) {
        return [&, name](const GatewayRequest&) -> GatewayResult<GatewayResponse> {
            std::lock_guard<std::mutex> lock(hits_mutex);
            hits[name]++;
            return GatewayResponse{.body = name};
        };
    };

    ServiceConfig search;
    search.name = "search";
    search.strategy = LoadBalancingStrategy::Weighted;
    search.cache_ttl = std::chrono::seconds(0);
    search.with_route("/search")
          .with_endpoint({.path = "/replica-a", .weight = 1.0, .handler = replica("a")})
          .with_endpoint({.path = "/replica-b", .weight = 2.0, .handler = replica("b")})
          .with_endpoint({
              .path = "/replica-c",
              .weight = 1.0,
              .handler = replica("c"),
              .health_probe = [&] { return replica_c_healthy.load(); },
          });

    if (!gateway.register_service(std::move(search))) {
        std::cerr << "Failed to register service\n";
        return 1;
    }

    auto run = [&](const char* title, int count) {
        {
            std::lock_guard<std::mutex> lock(hits_mutex);
            hits.clear();
        }
        for (int i = 0; i < count; ++i) {
            auto response = gateway.route(GatewayRequest{.path = "/search?q=" + std::to_string(i)});
            if (!response) {
                std::cerr << "Request failed: " << response.error().message << "\n";
            }
        }
        std::lock_guard<std::mutex> lock(hits_mutex);
        std::cout << title << "\n";
        for (const auto& [name, count_for] : hits) {
            std::cout << "  replica " << name << ": " << count_for << "\n";
        }
        std::cout << "\n";
    };

    // 1. Weights 1:2:1
    run("=== Weights a=1 b=2 c=1 ===", 1000);

    // 2. Rebalance at runtime
    auto updated = gateway.update_endpoint_weights("search", {
        {"/replica-a", 3.0},
        {"/replica-b", 1.0},
        {"/replica-c", 0.0},
    });
    if (!updated) {
        std::cerr << "Weight update failed: " << updated.error().message << "\n";
        return 1;
    }
    run("=== Weights a=3 b=1 c=0 ===", 1000);

    // 3. Replica c fails its probe and drops out of rotation
    if (!gateway.update_endpoint_weights("search", {{"/replica-c", 1.0}})) {
        return 1;
    }
    replica_c_healthy = false;
    gateway.health_monitor().check_all();
    run("=== Replica c unhealthy ===", 1000);

    std::cout << "=== Health ===\n";
    std::cout << health_report_json(gateway.get_health()).dump(2) << "\n";

    return 0;
}
