#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Router
// ═══════════════════════════════════════════════════════════════════════════
// The gateway's entry point for traffic.
//
//   resolve service ──▶ GET cache lookup ──hit──▶ response (cache-hit counter only)
//         │                    │ miss
//         ▼                    ▼
//   ServiceNotFound     CircuitBreaker::call
//                         ├─ middleware chain (any rejection aborts)
//                         └─ attempt loop, bounded by max_retries and the
//                            breaker timeout:
//                              pick endpoint ─▶ dispatch on pool ─▶ wait_for
//                              mark endpoint health, backoff, retry
//                    ──▶ metrics, GET write-through, response or error
//
// The breaker sees one outcome per routed call, never one per attempt.

#include "meshgate/cache/response_cache.hpp"
#include "meshgate/gateway/request.hpp"
#include "meshgate/health/health_monitor.hpp"
#include "meshgate/metrics/metrics_collector.hpp"
#include "meshgate/metrics/metrics_sink.hpp"
#include "meshgate/registry/service_registry.hpp"
#include "meshgate/resilience/backoff_policy.hpp"

#include <asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace meshgate {

inline constexpr std::string_view kRequestIdHeader = "x-gateway-request-id";
inline constexpr std::string_view kTimestampHeader = "x-gateway-timestamp";
inline constexpr std::string_view kCacheHeader = "x-gateway-cache";

struct RouterOptions {
    /// Worker threads that run endpoint handlers
    std::size_t dispatch_threads{8};

    /// When no endpoint is healthy, dispatch once to any endpoint
    bool degraded_fallback{true};
};

class RequestRouter {
public:
    RequestRouter(
        ServiceRegistry& registry,
        HealthMonitor& health,
        MetricsCollector& metrics,
        std::shared_ptr<ICache> cache,
        std::shared_ptr<IMetricsSink> sink,
        std::shared_ptr<IBackoffPolicy> backoff,
        RouterOptions options = {}
    );

    /// Waits for abandoned dispatches to finish.
    ~RequestRouter();

    RequestRouter(const RequestRouter&) = delete;
    RequestRouter& operator=(const RequestRouter&) = delete;

    [[nodiscard]] GatewayResult<GatewayResponse> route(GatewayRequest request);

    [[nodiscard]] static std::string cache_key(
        const std::string& service,
        HttpMethod method,
        const std::string& path
    );

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] GatewayResult<ServiceHandle> resolve(const GatewayRequest& request);

    /// Everything that runs inside the breaker.
    [[nodiscard]] GatewayResult<GatewayResponse> execute(
        const ServiceHandle& service,
        GatewayRequest& request,
        Clock::time_point deadline
    );

    [[nodiscard]] GatewayResult<void> apply_middleware(const Service& service, GatewayRequest& request) const;

    [[nodiscard]] GatewayResult<GatewayResponse> dispatch_with_retries(
        const ServiceHandle& service,
        const GatewayRequest& request,
        Clock::time_point deadline
    );

    [[nodiscard]] GatewayResult<GatewayResponse> dispatch_once(
        const ServiceHandle& service,
        std::size_t endpoint_index,
        const GatewayRequest& request,
        std::chrono::milliseconds wait
    );

    void stamp_tracking_headers(GatewayRequest& request);

    ServiceRegistry& registry_;
    HealthMonitor& health_;
    MetricsCollector& metrics_;
    std::shared_ptr<ICache> cache_;
    std::shared_ptr<IMetricsSink> sink_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    RouterOptions options_;

    std::mutex id_mutex_;
    std::mt19937_64 id_rng_{std::random_device{}()};

    // Declared last: destroyed (joined) first, while everything above is alive
    asio::thread_pool pool_;
};

}  // namespace meshgate
