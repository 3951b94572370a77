#include "meshgate/config/gateway_config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace meshgate {

namespace {

std::string join(const std::string& scope, const std::string& key) {
    return scope.empty() ? key : scope + "." + key;
}

const Json* find(const Json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

void require_object(const Json& value, const std::string& field) {
    if (value.is_object() == false) {
        throw ConfigError(field, "expected an object");
    }
}

bool read_bool(const Json& object, const char* key, bool fallback, const std::string& scope) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return fallback;
    }
    if (value->is_boolean() == false) {
        throw ConfigError(join(scope, key), "expected a boolean");
    }
    return value->get<bool>();
}

std::uint64_t read_unsigned(const Json& object, const char* key, std::uint64_t fallback, const std::string& scope) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return fallback;
    }
    const bool non_negative_integer = value->is_number_unsigned()
                                   || (value->is_number_integer() && value->get<std::int64_t>() >= 0);
    if (non_negative_integer == false) {
        throw ConfigError(join(scope, key), "expected a non-negative integer");
    }
    return value->get<std::uint64_t>();
}

double read_number(const Json& object, const char* key, double fallback, const std::string& scope) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return fallback;
    }
    if (value->is_number() == false) {
        throw ConfigError(join(scope, key), "expected a number");
    }
    return value->get<double>();
}

std::string read_string(const Json& object, const char* key, const std::string& fallback, const std::string& scope) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return fallback;
    }
    if (value->is_string() == false) {
        throw ConfigError(join(scope, key), "expected a string");
    }
    return value->get<std::string>();
}

std::vector<std::string> read_strings(const Json& object, const char* key, const std::string& scope) {
    const auto* value = find(object, key);
    if (value == nullptr) {
        return {};
    }
    if (value->is_array() == false) {
        throw ConfigError(join(scope, key), "expected an array of strings");
    }
    std::vector<std::string> result;
    for (const auto& item : *value) {
        if (item.is_string() == false) {
            throw ConfigError(join(scope, key), "expected an array of strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::chrono::milliseconds read_ms(
    const Json& object,
    const char* key,
    std::chrono::milliseconds fallback,
    const std::string& scope
) {
    const auto count = read_unsigned(object, key, static_cast<std::uint64_t>(fallback.count()), scope);
    return std::chrono::milliseconds{static_cast<std::int64_t>(count)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Sections
// ─────────────────────────────────────────────────────────────────────────────

HealthConfig parse_health(const Json& j, const std::string& scope) {
    require_object(j, scope);
    HealthConfig defaults;
    HealthConfig health;
    health.failure_threshold = read_unsigned(j, "failureThreshold", defaults.failure_threshold, scope);
    health.check_interval = read_ms(j, "checkInterval", defaults.check_interval, scope);
    health.recent_check_skip = read_ms(j, "recentCheckSkip", defaults.recent_check_skip, scope);
    health.auto_recovery_enabled = read_bool(j, "autoRecovery", defaults.auto_recovery_enabled, scope);
    health.auto_recovery_interval = read_ms(j, "autoRecoveryInterval", defaults.auto_recovery_interval, scope);
    health.probe_timeout = read_ms(j, "probeTimeout", defaults.probe_timeout, scope);
    if (health.failure_threshold == 0) {
        throw ConfigError(join(scope, "failureThreshold"), "must be at least 1");
    }
    return health;
}

BackoffConfig parse_backoff(const Json& j, const std::string& scope) {
    require_object(j, scope);
    BackoffConfig defaults;
    BackoffConfig backoff;
    backoff.base = read_ms(j, "base", defaults.base, scope);
    backoff.multiplier = read_number(j, "multiplier", defaults.multiplier, scope);
    backoff.cap = read_ms(j, "cap", defaults.cap, scope);
    backoff.jitter = read_ms(j, "jitter", defaults.jitter, scope);
    if (backoff.multiplier < 1.0) {
        throw ConfigError(join(scope, "multiplier"), "must be >= 1");
    }
    return backoff;
}

CircuitBreakerConfig parse_breaker(const Json& j, const CircuitBreakerConfig& defaults, const std::string& scope) {
    require_object(j, scope);
    CircuitBreakerConfig breaker = defaults;
    breaker.timeout = read_ms(j, "timeout", defaults.timeout, scope);
    breaker.error_threshold_percentage =
        read_unsigned(j, "errorThresholdPercentage", defaults.error_threshold_percentage, scope);
    breaker.reset_timeout = read_ms(j, "resetTimeout", defaults.reset_timeout, scope);
    breaker.volume_threshold = read_unsigned(j, "volumeThreshold", defaults.volume_threshold, scope);
    breaker.timeout_threshold = read_unsigned(j, "timeoutThreshold", defaults.timeout_threshold, scope);
    breaker.rolling_window = read_ms(j, "rollingWindow", defaults.rolling_window, scope);
    breaker.rolling_buckets = read_unsigned(j, "rollingBuckets", defaults.rolling_buckets, scope);

    const bool percentage_valid = (breaker.error_threshold_percentage >= 1)
                               && (breaker.error_threshold_percentage <= 100);
    if (percentage_valid == false) {
        throw ConfigError(join(scope, "errorThresholdPercentage"), "must be within [1, 100]");
    }
    if (breaker.rolling_buckets == 0) {
        throw ConfigError(join(scope, "rollingBuckets"), "must be at least 1");
    }
    return breaker;
}

GatewayOptions parse_options(const Json& j, const std::string& scope) {
    require_object(j, scope);
    GatewayOptions defaults;
    GatewayOptions options;

    options.dispatch_threads = read_unsigned(j, "dispatchThreads", defaults.dispatch_threads, scope);
    options.degraded_fallback = read_bool(j, "degradedFallback", defaults.degraded_fallback, scope);
    options.route_cache_ttl = read_ms(j, "routeCacheTTL", defaults.route_cache_ttl, scope);
    options.cache_max_entries = read_unsigned(j, "cacheMaxEntries", defaults.cache_max_entries, scope);

    if (find(j, "randomSeed") != nullptr) {
        options.random_seed = static_cast<std::uint32_t>(read_unsigned(j, "randomSeed", 0, scope));
    }
    if (const auto* health = find(j, "health")) {
        options.health = parse_health(*health, join(scope, "health"));
    }
    if (const auto* backoff = find(j, "backoff")) {
        options.backoff = parse_backoff(*backoff, join(scope, "backoff"));
    }
    if (const auto* breaker = find(j, "circuitBreaker")) {
        options.default_circuit_breaker = parse_breaker(*breaker, defaults.default_circuit_breaker,
                                                        join(scope, "circuitBreaker"));
    }

    if (options.dispatch_threads == 0) {
        throw ConfigError(join(scope, "dispatchThreads"), "must be at least 1");
    }
    return options;
}

LoggingConfig parse_logging(const Json& j, const std::string& scope) {
    require_object(j, scope);
    LoggingConfig defaults;
    LoggingConfig logging;

    auto level_name = read_string(j, "level", "info", scope);
    std::ranges::transform(level_name, level_name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // parse_log_level falls back to Info for names it does not know
    const auto level = parse_log_level(level_name);
    const bool recognised = (level != LogLevel::Info) || (level_name == "info");
    if (recognised == false) {
        throw ConfigError(join(scope, "level"), "unknown log level '" + level_name + "'");
    }
    logging.level = level;

    logging.console = read_bool(j, "console", defaults.console, scope);
    if (find(j, "file") != nullptr) {
        logging.file = read_string(j, "file", "", scope);
        if (logging.file->empty()) {
            throw ConfigError(join(scope, "file"), "must not be empty");
        }
    }
    logging.max_file_size = read_unsigned(j, "maxFileSize", defaults.max_file_size, scope);
    logging.max_files = read_unsigned(j, "maxFiles", defaults.max_files, scope);
    logging.async = read_bool(j, "async", defaults.async, scope);
    logging.pattern = read_string(j, "pattern", defaults.pattern, scope);

    const bool has_sink = logging.console || logging.file.has_value();
    if (has_sink == false) {
        throw ConfigError(join(scope, "console"), "disabled without a file sink");
    }
    return logging;
}

EndpointConfig parse_endpoint(const Json& j, const std::string& scope) {
    // Shorthand: a bare string is the endpoint path
    if (j.is_string()) {
        return EndpointConfig{j.get<std::string>()};
    }
    require_object(j, scope);

    EndpointConfig endpoint;
    endpoint.path = read_string(j, "path", "", scope);
    endpoint.weight = read_number(j, "weight", 1.0, scope);
    if (endpoint.path.empty()) {
        throw ConfigError(join(scope, "path"), "is required");
    }
    if (endpoint.weight < 0.0) {
        throw ConfigError(join(scope, "weight"), "must not be negative");
    }
    return endpoint;
}

ServiceConfig parse_service(const Json& j, const CircuitBreakerConfig& breaker_defaults, const std::string& scope) {
    require_object(j, scope);
    ServiceConfig defaults;
    ServiceConfig service;

    service.name = read_string(j, "name", "", scope);
    if (service.name.empty()) {
        throw ConfigError(join(scope, "name"), "is required");
    }

    if (const auto* endpoints = find(j, "endpoints")) {
        if (endpoints->is_array() == false) {
            throw ConfigError(join(scope, "endpoints"), "expected an array");
        }
        for (std::size_t i = 0; i < endpoints->size(); ++i) {
            const auto field = join(scope, "endpoints") + "[" + std::to_string(i) + "]";
            service.endpoints.push_back(parse_endpoint((*endpoints)[i], field));
        }
    }

    service.routes = read_strings(j, "routes", scope);
    service.timeout = read_ms(j, "timeout", defaults.timeout, scope);
    service.max_retries = read_unsigned(j, "maxRetries", defaults.max_retries, scope);
    service.cache_ttl = std::chrono::seconds{static_cast<std::int64_t>(
        read_unsigned(j, "cacheTTL", static_cast<std::uint64_t>(defaults.cache_ttl.count()), scope))};
    service.tags = read_strings(j, "tags", scope);
    service.version = read_string(j, "version", defaults.version, scope);

    const auto strategy_name = read_string(j, "loadBalancingStrategy",
                                           std::string(to_string(defaults.strategy)), scope);
    const auto strategy = parse_strategy(strategy_name);
    if (strategy.has_value() == false) {
        throw ConfigError(join(scope, "loadBalancingStrategy"),
                          "unknown strategy '" + strategy_name + "'");
    }
    service.strategy = *strategy;

    if (const auto* breaker = find(j, "circuitBreaker")) {
        service.circuit_breaker = parse_breaker(*breaker, breaker_defaults, join(scope, "circuitBreaker"));
    }

    if (service.timeout.count() == 0) {
        throw ConfigError(join(scope, "timeout"), "must be positive");
    }
    return service;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

GatewayConfig parse_gateway_config(const Json& document) {
    require_object(document, "");

    GatewayConfig config;
    if (const auto* gateway = find(document, "gateway")) {
        config.options = parse_options(*gateway, "gateway");
    }

    if (const auto* logging = find(document, "logging")) {
        config.logging = parse_logging(*logging, "logging");
    }

    if (const auto* services = find(document, "services")) {
        if (services->is_array() == false) {
            throw ConfigError("services", "expected an array");
        }
        for (std::size_t i = 0; i < services->size(); ++i) {
            const auto scope = "services[" + std::to_string(i) + "]";
            config.services.push_back(
                parse_service((*services)[i], config.options.default_circuit_breaker, scope));
        }
    }
    return config;
}

GatewayConfig parse_gateway_config_text(const std::string& text) {
    Json document;
    try {
        document = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw ConfigError("", std::string("invalid JSON: ") + e.what());
    }
    return parse_gateway_config(document);
}

GatewayConfig load_gateway_config(const std::string& path) {
    std::ifstream file(path);
    if (file.is_open() == false) {
        throw ConfigError("", "cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_gateway_config_text(buffer.str());
}

}  // namespace meshgate
