// ─────────────────────────────────────────────────────────────────────────────
// Gateway Config Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "meshgate/config/gateway_config.hpp"

#include <filesystem>
#include <fstream>

using namespace meshgate;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

std::string field_of(const std::string& text) {
    try {
        (void)parse_gateway_config_text(text);
    } catch (const ConfigError& e) {
        return e.field();
    }
    return "<no error>";
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Empty document yields defaults", "[config]") {
    auto config = parse_gateway_config(Json::object());

    REQUIRE(config.services.empty());
    REQUIRE(config.options.dispatch_threads == GatewayOptions{}.dispatch_threads);
    REQUIRE(config.options.degraded_fallback);
    REQUIRE(config.options.health.failure_threshold == 3);
    REQUIRE(config.options.default_circuit_breaker.timeout == 3000ms);
    REQUIRE(config.options.backoff.base == 100ms);
    REQUIRE_FALSE(config.options.random_seed.has_value());
}

TEST_CASE("Gateway section is parsed", "[config]") {
    auto config = parse_gateway_config_text(R"({
        "gateway": {
            "dispatchThreads": 4,
            "degradedFallback": false,
            "routeCacheTTL": 1000,
            "randomSeed": 99,
            "cacheMaxEntries": 50,
            "health": { "failureThreshold": 5, "checkInterval": 2000, "autoRecovery": false },
            "backoff": { "base": 10, "multiplier": 3, "cap": 200, "jitter": 0 },
            "circuitBreaker": { "volumeThreshold": 4, "errorThresholdPercentage": 25, "resetTimeout": 500 }
        }
    })");

    const auto& options = config.options;
    REQUIRE(options.dispatch_threads == 4);
    REQUIRE(options.degraded_fallback == false);
    REQUIRE(options.route_cache_ttl == 1000ms);
    REQUIRE(options.random_seed == 99u);
    REQUIRE(options.cache_max_entries == 50);

    REQUIRE(options.health.failure_threshold == 5);
    REQUIRE(options.health.check_interval == 2000ms);
    REQUIRE(options.health.auto_recovery_enabled == false);
    REQUIRE(options.health.recent_check_skip == HealthConfig{}.recent_check_skip);

    REQUIRE(options.backoff.base == 10ms);
    REQUIRE(options.backoff.multiplier == 3.0);
    REQUIRE(options.backoff.cap == 200ms);
    REQUIRE(options.backoff.jitter == 0ms);

    REQUIRE(options.default_circuit_breaker.volume_threshold == 4);
    REQUIRE(options.default_circuit_breaker.error_threshold_percentage == 25);
    REQUIRE(options.default_circuit_breaker.reset_timeout == 500ms);
    REQUIRE(options.default_circuit_breaker.timeout == 3000ms);

    REQUIRE_NOTHROW(options.validate());
}

TEST_CASE("Services are parsed", "[config]") {
    auto config = parse_gateway_config_text(R"({
        "gateway": { "circuitBreaker": { "volumeThreshold": 4 } },
        "services": [
            {
                "name": "users",
                "routes": ["/api/users"],
                "endpoints": [
                    { "path": "http://10.0.0.5:8080", "weight": 2 },
                    "http://10.0.0.6:8080"
                ],
                "timeout": 1500,
                "maxRetries": 2,
                "cacheTTL": 30,
                "loadBalancingStrategy": "weighted",
                "tags": ["core", "public"],
                "version": "2.1.0",
                "circuitBreaker": { "errorThresholdPercentage": 80 }
            },
            { "name": "audit", "endpoints": ["http://audit:9000"] }
        ]
    })");

    REQUIRE(config.services.size() == 2);

    const auto& users = config.services[0];
    REQUIRE(users.name == "users");
    REQUIRE(users.routes == std::vector<std::string>{"/api/users"});
    REQUIRE(users.endpoints.size() == 2);
    REQUIRE(users.endpoints[0].path == "http://10.0.0.5:8080");
    REQUIRE(users.endpoints[0].weight == 2.0);
    REQUIRE(users.endpoints[1].path == "http://10.0.0.6:8080");
    REQUIRE(users.endpoints[1].weight == 1.0);
    REQUIRE(users.timeout == 1500ms);
    REQUIRE(users.max_retries == 2);
    REQUIRE(users.cache_ttl == 30s);
    REQUIRE(users.strategy == LoadBalancingStrategy::Weighted);
    REQUIRE(users.tags == std::vector<std::string>{"core", "public"});
    REQUIRE(users.version == "2.1.0");

    // Service override inherits the gateway defaults it does not name
    REQUIRE(users.circuit_breaker.has_value());
    REQUIRE(users.circuit_breaker->error_threshold_percentage == 80);
    REQUIRE(users.circuit_breaker->volume_threshold == 4);

    const auto& audit = config.services[1];
    REQUIRE(audit.timeout == 5000ms);
    REQUIRE(audit.max_retries == 3);
    REQUIRE(audit.cache_ttl == 300s);
    REQUIRE(audit.strategy == LoadBalancingStrategy::RoundRobin);
    REQUIRE(audit.version == "1.0.0");
    REQUIRE_FALSE(audit.circuit_breaker.has_value());
}

TEST_CASE("Logging section is parsed", "[config][logging]") {
    SECTION("absent section leaves logging unset") {
        auto config = parse_gateway_config_text(R"({"services": []})");
        REQUIRE_FALSE(config.logging.has_value());
    }

    SECTION("all fields") {
        auto config = parse_gateway_config_text(R"({
            "logging": {
                "level": "Debug",
                "file": "/var/log/meshgate.log",
                "maxFileSize": 1048576,
                "maxFiles": 5,
                "console": false,
                "async": true,
                "pattern": "%l %v"
            }
        })");

        REQUIRE(config.logging.has_value());
        const auto& logging = *config.logging;
        REQUIRE(logging.level == LogLevel::Debug);
        REQUIRE(logging.file == "/var/log/meshgate.log");
        REQUIRE(logging.max_file_size == 1048576);
        REQUIRE(logging.max_files == 5);
        REQUIRE(logging.console == false);
        REQUIRE(logging.async);
        REQUIRE(logging.pattern == "%l %v");
    }

    SECTION("defaults") {
        auto config = parse_gateway_config_text(R"({"logging": {}})");
        REQUIRE(config.logging.has_value());
        REQUIRE(config.logging->level == LogLevel::Info);
        REQUIRE(config.logging->console);
        REQUIRE_FALSE(config.logging->file.has_value());
        REQUIRE(config.logging->pattern == kDefaultLogPattern);
    }

    SECTION("errors") {
        REQUIRE(field_of(R"({"logging": {"level": "verbose"}})") == "logging.level");
        REQUIRE(field_of(R"({"logging": {"console": false}})") == "logging.console");
        REQUIRE(field_of(R"({"logging": {"file": ""}})") == "logging.file");
        REQUIRE(field_of(R"({"logging": []})") == "logging");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConfigError names the offending field", "[config][errors]") {
    REQUIRE(field_of(R"({"services": [{"name": "a"}, {"name": "b", "timeout": "slow"}]})")
            == "services[1].timeout");
    REQUIRE(field_of(R"({"services": [{"name": "a", "endpoints": [{"path": "x", "weight": -1}]}]})")
            == "services[0].endpoints[0].weight");
    REQUIRE(field_of(R"({"services": [{"endpoints": []}]})") == "services[0].name");
    REQUIRE(field_of(R"({"services": [{"name": "a", "loadBalancingStrategy": "fastest"}]})")
            == "services[0].loadBalancingStrategy");
    REQUIRE(field_of(R"({"gateway": {"health": {"failureThreshold": 0}}})")
            == "gateway.health.failureThreshold");
    REQUIRE(field_of(R"({"gateway": {"circuitBreaker": {"errorThresholdPercentage": 0}}})")
            == "gateway.circuitBreaker.errorThresholdPercentage");
    REQUIRE(field_of(R"({"gateway": {"backoff": {"multiplier": 0.5}}})") == "gateway.backoff.multiplier");
    REQUIRE(field_of(R"({"gateway": {"dispatchThreads": 0}})") == "gateway.dispatchThreads");
    REQUIRE(field_of(R"({"gateway": {"degradedFallback": "yes"}})") == "gateway.degradedFallback");
    REQUIRE(field_of(R"({"services": {}})") == "services");
    REQUIRE(field_of(R"({"services": [{"name": "a", "tags": [1]}]})") == "services[0].tags");
}

TEST_CASE("ConfigError message includes the field", "[config][errors]") {
    try {
        (void)parse_gateway_config_text(R"({"services": [{"name": "a", "maxRetries": -2}]})");
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        REQUIRE(e.field() == "services[0].maxRetries");
        REQUIRE_THAT(e.what(), ContainsSubstring("services[0].maxRetries"));
        REQUIRE_THAT(e.what(), ContainsSubstring("non-negative"));
    }
}

TEST_CASE("Malformed JSON is a ConfigError", "[config][errors]") {
    REQUIRE_THROWS_AS(parse_gateway_config_text("{ not json"), ConfigError);
    REQUIRE_THROWS_AS(parse_gateway_config_text("[1, 2]"), ConfigError);
}

// ═══════════════════════════════════════════════════════════════════════════
// Files
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Config is loaded from a file", "[config][file]") {
    const auto path = std::filesystem::temp_directory_path() / "meshgate_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"services": [{"name": "users", "endpoints": ["http://users:80"]}]})";
    }

    auto config = load_gateway_config(path.string());
    REQUIRE(config.services.size() == 1);
    REQUIRE(config.services[0].name == "users");

    std::filesystem::remove(path);
}

TEST_CASE("Missing config file is a ConfigError", "[config][file]") {
    REQUIRE_THROWS_WITH(
        load_gateway_config("/nonexistent/meshgate.json"),
        ContainsSubstring("cannot open config file")
    );
}
