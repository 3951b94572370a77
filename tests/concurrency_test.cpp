// ═══════════════════════════════════════════════════════════════════════════
// Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════
// Routing, registration and health sweeps running against one Gateway from
// several threads at once.

#include <catch2/catch_test_macros.hpp>

#include "meshgate/gateway/gateway.hpp"
#include "meshgate/log/logger.hpp"

#include "mocks/mock_http_client.hpp"
#include "mocks/scripted_endpoint.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace meshgate;
using namespace meshgate::testing;
using namespace std::chrono_literals;

namespace {

// Counts log calls from every thread
class CountingLogger : public ILogger {
public:
    explicit CountingLogger(std::atomic<std::size_t>& counter)
        : counter_(counter)
    {}

    void log(const LogRecord& /*record*/) override {
        counter_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }

private:
    std::atomic<std::size_t>& counter_;
};

GatewayDependencies test_dependencies() {
    GatewayDependencies deps;
    deps.backoff = std::make_shared<NoBackoff>();
    deps.http_client = std::make_shared<MockHttpClient>();
    return deps;
}

GatewayOptions busy_options() {
    GatewayOptions options;
    options.dispatch_threads = 4;
    options.health.failure_threshold = 1000;
    options.default_circuit_breaker.volume_threshold = 100000;
    return options;
}

GatewayRequest get(std::string path) {
    GatewayRequest request;
    request.path = std::move(path);
    return request;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Concurrent routing spreads load and keeps counts exact", "[concurrency][gateway]") {
    Gateway gateway(busy_options(), test_dependencies());

    std::vector<std::shared_ptr<ScriptedEndpoint>> replicas;
    ServiceConfig config;
    config.name = "users";
    config.cache_ttl = 0s;
    config.max_retries = 1;
    for (int i = 0; i < 3; ++i) {
        auto replica = std::make_shared<ScriptedEndpoint>("/users-" + std::to_string(i));
        replica->set_default({.action = ScriptedEndpoint::Action::Succeed, .delay = 1ms});
        config.with_endpoint({.path = "/users-" + std::to_string(i), .handler = replica->handler()});
        replicas.push_back(replica);
    }
    config.with_route("/users");
    REQUIRE(gateway.register_service(std::move(config)).has_value());

    constexpr int kThreads = 8;
    constexpr int kPerThread = 30;
    std::atomic<int> succeeded{0};

    std::vector<std::future<void>> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.push_back(std::async(std::launch::async, [&gateway, &succeeded, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto response = gateway.route(get("/users/" + std::to_string(t * 100 + i)));
                if (response.has_value()) {
                    succeeded.fetch_add(1);
                }
            }
        }));
    }
    for (auto& worker : workers) {
        worker.get();
    }

    REQUIRE(succeeded.load() == kThreads * kPerThread);

    std::size_t dispatched = 0;
    for (const auto& replica : replicas) {
        REQUIRE(replica->dispatch_count() > 0);
        dispatched += replica->dispatch_count();
    }
    REQUIRE(dispatched == static_cast<std::size_t>(kThreads * kPerThread));

    const auto metrics = gateway.get_metrics().at("users");
    REQUIRE(metrics.sample.request_count == static_cast<std::size_t>(kThreads * kPerThread));
    REQUIRE(metrics.sample.error_count == 0);
    REQUIRE(metrics.success == static_cast<std::size_t>(kThreads * kPerThread));

    // Connection guards are all released
    for (const auto& endpoint : gateway.get_health().at("users").endpoints) {
        REQUIRE(endpoint.active_connections == 0);
    }
}

TEST_CASE("Concurrent routing with mixed failures", "[concurrency][gateway]") {
    Gateway gateway(busy_options(), test_dependencies());

    auto flaky = std::make_shared<ScriptedEndpoint>("/flaky");
    for (int i = 0; i < 100; ++i) {
        flaky->push({.action = (i % 4 == 0) ? ScriptedEndpoint::Action::Fail
                                            : ScriptedEndpoint::Action::Succeed});
    }

    ServiceConfig config;
    config.name = "flaky";
    config.cache_ttl = 0s;
    config.max_retries = 1;
    config.with_endpoint({.path = "/flaky", .handler = flaky->handler()});
    REQUIRE(gateway.register_service(std::move(config)).has_value());

    std::atomic<int> ok{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                auto response = gateway.route(get("/flaky"));
                if (response.has_value()) {
                    ok++;
                } else {
                    failed++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(ok.load() == 75);
    REQUIRE(failed.load() == 25);

    const auto metrics = gateway.get_metrics().at("flaky");
    REQUIRE(metrics.success == 75);
    REQUIRE(metrics.failure == 25);
    REQUIRE(metrics.sample.error_count == 25);
    REQUIRE(metrics.sample.availability_percentage > 70.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Registration and Sweeps
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registration races with routing", "[concurrency][registry]") {
    Gateway gateway(busy_options(), test_dependencies());

    auto backend = std::make_shared<ScriptedEndpoint>("/svc");
    std::atomic<bool> done{false};

    std::thread churn([&]() {
        for (int i = 0; i < 50; ++i) {
            ServiceConfig config;
            config.name = "svc";
            config.cache_ttl = 0s;
            config.with_endpoint({.path = "/svc", .handler = backend->handler()});
            (void)gateway.register_service(std::move(config));
            std::this_thread::yield();
            gateway.unregister_service("svc");
        }
        done = true;
    });

    std::size_t found = 0;
    std::size_t missing = 0;
    while (done.load() == false) {
        auto response = gateway.route(get("/svc"));
        if (response.has_value()) {
            found++;
        } else if (response.error().code == GatewayError::Code::ServiceNotFound) {
            missing++;
        }
    }
    churn.join();

    // Every outcome is either a dispatch or a clean not-found
    REQUIRE(found == backend->dispatch_count());
    REQUIRE(gateway.registry().size() == 0);
    (void)missing;
}

TEST_CASE("Background sweeps run alongside traffic", "[concurrency][health]") {
    auto options = busy_options();
    options.health.check_interval = 5ms;
    options.health.recent_check_skip = 0ms;
    options.health.auto_recovery_interval = 5ms;
    Gateway gateway(options, test_dependencies());

    std::atomic<int> probes{0};
    auto backend = std::make_shared<ScriptedEndpoint>("/svc");

    ServiceConfig config;
    config.name = "svc";
    config.cache_ttl = 0s;
    config.health_probe = [&probes]() {
        probes++;
        return true;
    };
    config.with_endpoint({.path = "/svc", .handler = backend->handler()});
    REQUIRE(gateway.register_service(std::move(config)).has_value());

    gateway.start();
    for (int i = 0; i < 50; ++i) {
        REQUIRE(gateway.route(get("/svc")).has_value());
        std::this_thread::sleep_for(1ms);
    }
    gateway.stop();

    REQUIRE(probes.load() > 0);
    REQUIRE(gateway.get_health().at("svc").health_percentage == 100.0);

    // Stopped sweeps no longer probe
    const int after_stop = probes.load();
    std::this_thread::sleep_for(30ms);
    REQUIRE(probes.load() == after_stop);
}

TEST_CASE("Logger is safe to use from dispatch threads", "[concurrency][logger]") {
    std::atomic<std::size_t> count{0};
    set_logger(std::make_unique<CountingLogger>(count));

    {
        Gateway gateway(busy_options(), test_dependencies());
        auto backend = std::make_shared<ScriptedEndpoint>("/svc");
        backend->always_fail();

        ServiceConfig config;
        config.name = "svc";
        config.cache_ttl = 0s;
        config.max_retries = 2;
        config.with_endpoint({.path = "/svc", .handler = backend->handler()});
        REQUIRE(gateway.register_service(std::move(config)).has_value());

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&gateway]() {
                for (int i = 0; i < 10; ++i) {
                    (void)gateway.route(get("/svc"));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    set_logger(nullptr);
    REQUIRE(count.load() > 40);
}
