// Example 02: Circuit Breaker
//
// Drives a flaky service until its breaker opens, shows that further calls
// are rejected without touching the backend, then waits out the reset
// timeout and lets a probe close the circuit again.

#include <meshgate/gateway/gateway.hpp>
#include <meshgate/log/spdlog_logger.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>

using namespace meshgate;

int main() {
    std::cout << "=== Circuit Breaker Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Warn));

    // 1. Breaker that trips quickly and recovers after two seconds
    GatewayOptions options;
    options.default_circuit_breaker.volume_threshold = 4;
    options.default_circuit_breaker.error_threshold_percentage = 50;
    options.default_circuit_breaker.reset_timeout = std::chrono::seconds(2);
    options.backoff.base = std::chrono::milliseconds(10);
    options.backoff.jitter = std::chrono::milliseconds(0);
    options.health.failure_threshold = 100;

    std::cout << "Circuit Breaker Configuration:\n";
    std::cout << "  Volume threshold: " << options.default_circuit_breaker.volume_threshold << "\n";
    std::cout << "  Error threshold: " << options.default_circuit_breaker.error_threshold_percentage << "%\n";
    std::cout << "  Reset timeout: 2 seconds\n\n";

    Gateway gateway(options);

    // 2. Backend that fails until told otherwise
    std::atomic<bool> backend_up{false};
    std::atomic<int> dispatches{0};

    ServiceConfig payments;
    payments.name = "payments";
    payments.max_retries = 1;
    payments.cache_ttl = std::chrono::seconds(0);
    payments.with_endpoint({
        .path = "/payments",
        .handler = [&](const GatewayRequest&) -> GatewayResult<GatewayResponse> {
            dispatches++;
            if (!backend_up) {
                return tl::unexpected(GatewayError::upstream_error(
                    "payments", "/payments", "backend unavailable", 500));
            }
            return GatewayResponse{};
        },
    });

    if (!gateway.register_service(std::move(payments))) {
        std::cerr << "Failed to register service\n";
        return 1;
    }

    // 3. Watch breaker transitions
    gateway.subscribe([](const GatewayEvent& event) {
        std::visit([](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::CircuitOpened>) {
                std::cout << "\n*** Circuit opened for " << e.service << " ***\n\n";
            } else if constexpr (std::is_same_v<T, events::CircuitHalfOpened>) {
                std::cout << "\n*** Circuit half-open for " << e.service << " ***\n\n";
            } else if constexpr (std::is_same_v<T, events::CircuitClosed>) {
                std::cout << "\n*** Circuit closed for " << e.service << " ***\n\n";
            }
        }, event);
    });

    auto call = [&](int i) {
        auto result = gateway.route(GatewayRequest{.method = HttpMethod::Post, .path = "/payments"});
        std::cout << "Call " << i << ": "
                  << (result ? "OK" : std::string(to_string(result.error().code)))
                  << "  (dispatches so far: " << dispatches.load() << ")\n";
    };

    // 4. Fail until the breaker trips, then keep calling
    std::cout << "=== Backend down ===\n";
    for (int i = 1; i <= 8; ++i) {
        call(i);
    }

    auto metrics = gateway.get_metrics().at("payments");
    std::cout << "\nState: " << to_string(metrics.circuit_state)
              << ", rejected: " << metrics.rejected << "\n";

    // 5. Bring the backend back and wait for the reset timeout
    std::cout << "\n=== Backend restored, waiting for reset timeout ===\n";
    backend_up = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2100));

    for (int i = 9; i <= 11; ++i) {
        call(i);
    }

    metrics = gateway.get_metrics().at("payments");
    std::cout << "\nFinal state: " << to_string(metrics.circuit_state) << "\n";
    std::cout << "Successes: " << metrics.success
              << ", failures: " << metrics.failure
              << ", rejected: " << metrics.rejected << "\n";

    return 0;
}
