#include "meshgate/gateway/request_router.hpp"

#include "meshgate/log/logger.hpp"
#include "meshgate/resilience/retry_policy.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <optional>
#include <thread>

namespace meshgate {

namespace {

std::string to_hex(std::uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kDigits[value & 0xF];
        value >>= 4;
    }
    return out;
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    const auto elapsed = std::chrono::steady_clock::now() - since;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

// Fill in the routing context a handler may have left empty
GatewayError with_context(GatewayError error, const std::string& service, const std::string& endpoint) {
    if (error.service.empty()) {
        error.service = service;
    }
    if (error.endpoint.empty()) {
        error.endpoint = endpoint;
    }
    return error;
}

// Connection slot shared by a waiting caller and its pool job. Whichever side
// finishes first gives the slot back; a job that starts after its caller
// stopped waiting never runs the handler.
class DispatchSlot {
public:
    explicit DispatchSlot(Endpoint& endpoint) : guard_(endpoint) {}

    /// False once the caller has abandoned the dispatch
    bool begin() {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_ == false;
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        guard_.release();
    }

    void abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned_ = true;
        guard_.release();
    }

private:
    std::mutex mutex_;
    ConnectionGuard guard_;
    bool abandoned_{false};
};

}  // namespace

RequestRouter::RequestRouter(
    ServiceRegistry& registry,
    HealthMonitor& health,
    MetricsCollector& metrics,
    std::shared_ptr<ICache> cache,
    std::shared_ptr<IMetricsSink> sink,
    std::shared_ptr<IBackoffPolicy> backoff,
    RouterOptions options
)
    : registry_(registry)
    , health_(health)
    , metrics_(metrics)
    , cache_(std::move(cache))
    , sink_(sink ? std::move(sink) : std::make_shared<NullMetricsSink>())
    , backoff_(backoff ? std::move(backoff) : std::make_shared<ExponentialBackoff>())
    , options_(options)
    , pool_(std::max<std::size_t>(1, options.dispatch_threads))
{}

RequestRouter::~RequestRouter() {
    pool_.join();
}

std::string RequestRouter::cache_key(const std::string& service, HttpMethod method, const std::string& path) {
    return service + ":" + to_string(method) + ":" + path;
}

// ─────────────────────────────────────────────────────────────────────────────
// Route
// ─────────────────────────────────────────────────────────────────────────────

GatewayResult<GatewayResponse> RequestRouter::route(GatewayRequest request) {
    auto resolved = resolve(request);
    if (resolved.has_value() == false) {
        const auto& error = resolved.error();
        get_logger().error("Route failed", {
            {"path", request.path},
            {"code", std::string(to_string(error.code))},
            {"status", std::to_string(to_http_status(error))}
        });
        return tl::unexpected(error);
    }

    const ServiceHandle service = *resolved;
    const auto& config = service->config();
    const auto& name = service->name();
    request.service = name;

    // ─── Cache (GET only) ───────────────────────────────────────────────────
    const bool cacheable = (request.method == HttpMethod::Get)
                        && (cache_ != nullptr)
                        && (config.cache_ttl.count() > 0);
    const auto key = cache_key(name, request.method, request.path);

    if (cacheable) {
        auto cached = cache_->get(key);
        if (cached.has_value()) {
            metrics_.record_cache_hit(name);
            GatewayResponse response;
            response.status = 200;
            response.body = std::move(*cached);
            response.headers[std::string(kCacheHeader)] = "HIT";
            response.from_cache = true;
            return response;
        }
    }

    // ─── Breaker-wrapped execution ──────────────────────────────────────────
    stamp_tracking_headers(request);

    const auto start = Clock::now();
    const auto budget = service->breaker().config().timeout;
    const auto deadline = (budget.count() > 0) ? start + budget : Clock::time_point::max();

    auto result = service->breaker().call([&]() -> GatewayResult<GatewayResponse> {
        auto outcome = execute(service, request, deadline);
        if (outcome.has_value()) {
            sink_->track_request(elapsed_ms(start), outcome->status, request.path);
        } else {
            sink_->track_error(outcome.error(), request.path);
        }
        return outcome;
    });

    metrics_.record_request(name, elapsed_ms(start), result.has_value());

    if (result.has_value() == false) {
        const auto& error = result.error();
        get_logger().error("Route failed", {
            {"service", name},
            {"endpoint", error.endpoint},
            {"path", request.path},
            {"code", std::string(to_string(error.code))},
            {"status", std::to_string(to_http_status(error))},
            {"message", error.message}
        });
        return result;
    }

    if (cacheable) {
        cache_->set(key, result->body, config.cache_ttl);
    }
    return result;
}

GatewayResult<ServiceHandle> RequestRouter::resolve(const GatewayRequest& request) {
    if (request.service.has_value()) {
        return registry_.lookup(*request.service);
    }

    const auto name = registry_.resolve_by_path(request.path);
    if (name.has_value() == false) {
        return tl::unexpected(GatewayError::service_not_found(request.path));
    }
    return registry_.lookup(*name);
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution (inside the breaker)
// ─────────────────────────────────────────────────────────────────────────────

GatewayResult<GatewayResponse> RequestRouter::execute(
    const ServiceHandle& service,
    GatewayRequest& request,
    Clock::time_point deadline
) {
    auto admitted = apply_middleware(*service, request);
    if (admitted.has_value() == false) {
        return tl::unexpected(admitted.error());
    }
    return dispatch_with_retries(service, request, deadline);
}

GatewayResult<void> RequestRouter::apply_middleware(const Service& service, GatewayRequest& request) const {
    for (const auto& hook : service.config().middleware) {
        tl::expected<void, std::string> verdict;
        try {
            verdict = hook(request);
        } catch (const std::exception& e) {
            verdict = tl::unexpected(std::string(e.what()));
        } catch (...) {
            verdict = tl::unexpected(std::string("non-standard exception"));
        }

        if (verdict.has_value() == false) {
            return tl::unexpected(GatewayError::middleware_rejected(service.name(), verdict.error()));
        }
    }
    return {};
}

GatewayResult<GatewayResponse> RequestRouter::dispatch_with_retries(
    const ServiceHandle& service,
    const GatewayRequest& request,
    Clock::time_point deadline
) {
    const auto& config = service->config();
    const auto& name = service->name();
    const auto policy = RetryPolicy().with_max_attempts(config.max_retries);
    const auto first_attempt = Clock::now();

    std::optional<GatewayError> last_error;
    bool degraded_used = false;

    for (std::size_t attempt = 1; attempt <= policy.max_attempts(); ++attempt) {
        const auto now = Clock::now();
        if (now >= deadline) {
            last_error = GatewayError::upstream_timeout(name, "");
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        // ─── Endpoint selection ─────────────────────────────────────────────
        auto index = service->select_endpoint();
        if (index.has_value() == false) {
            const bool may_degrade = options_.degraded_fallback
                                  && (degraded_used == false)
                                  && (service->endpoint_count() > 0);
            if (may_degrade == false) {
                return tl::unexpected(GatewayError::no_healthy_endpoint(name));
            }

            index = service->select_any_endpoint();
            degraded_used = true;
            metrics_.record_degraded_dispatch(name);
            get_logger().warn("No healthy endpoints, degraded dispatch", {
                {"service", name},
                {"endpoint", service->endpoint(*index).path}
            });
        }

        auto& endpoint = service->endpoint(*index);
        const auto wait = std::max(std::chrono::milliseconds{1}, std::min(config.timeout, remaining));

        // ─── Dispatch ───────────────────────────────────────────────────────
        auto result = dispatch_once(service, *index, request, wait);
        health_.record_outcome(name, endpoint.path, *endpoint.health, result.has_value());

        if (result.has_value()) {
            result->endpoint = endpoint.path;
            result->attempts = attempt;
            return result;
        }

        last_error = with_context(std::move(result.error()), name, endpoint.path);
        get_logger().error("Dispatch attempt failed", {
            {"service", name},
            {"endpoint", endpoint.path},
            {"attempt", std::to_string(attempt)},
            {"code", std::string(to_string(last_error->code))},
            {"message", last_error->message}
        });

        const bool retry = policy.should_retry(*last_error, attempt);
        if (retry == false) {
            break;
        }

        // ─── Backoff ────────────────────────────────────────────────────────
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        const auto delay = std::min(backoff_->next_delay(attempt - 1), std::max(left, std::chrono::milliseconds{0}));
        get_logger().debug("Retry scheduled", {
            {"service", name},
            {"attempt", std::to_string(attempt + 1)},
            {"delay_ms", std::to_string(delay.count())}
        });
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

    get_logger().warn("All dispatch attempts failed", {
        {"service", name},
        {"elapsed_ms", std::to_string(static_cast<std::int64_t>(elapsed_ms(first_attempt)))}
    });
    return tl::unexpected(std::move(*last_error));
}

GatewayResult<GatewayResponse> RequestRouter::dispatch_once(
    const ServiceHandle& service,
    std::size_t endpoint_index,
    const GatewayRequest& request,
    std::chrono::milliseconds wait
) {
    auto& endpoint = service->endpoint(endpoint_index);
    const auto& name = service->name();

    const bool has_handler = static_cast<bool>(endpoint.handler);
    if (has_handler == false) {
        return tl::unexpected(GatewayError::upstream_error(name, endpoint.path, "Endpoint has no handler"));
    }

    GatewayRequest attempt_request = request;
    attempt_request.attempt_timeout = wait;

    auto promise = std::make_shared<std::promise<GatewayResult<GatewayResponse>>>();
    auto future = promise->get_future();
    auto slot = std::make_shared<DispatchSlot>(endpoint);

    // The job owns the service handle, so a timed-out dispatch that finishes
    // late still finds its endpoint alive.
    asio::post(pool_, [service, endpoint_index, promise, slot, req = std::move(attempt_request)]() {
        if (slot->begin() == false) {
            return;
        }

        auto& target = service->endpoint(endpoint_index);
        GatewayResult<GatewayResponse> outcome;
        try {
            outcome = target.handler(req);
        } catch (const std::exception& e) {
            outcome = tl::unexpected(GatewayError::upstream_error(service->name(), target.path, e.what()));
        } catch (...) {
            outcome = tl::unexpected(GatewayError::upstream_error(
                service->name(), target.path, "non-standard exception"));
        }
        slot->finish();
        promise->set_value(std::move(outcome));
    });

    const auto status = future.wait_for(wait);
    if (status != std::future_status::ready) {
        slot->abandon();
        return tl::unexpected(GatewayError::upstream_timeout(name, endpoint.path));
    }
    return future.get();
}

void RequestRouter::stamp_tracking_headers(GatewayRequest& request) {
    if (has_header(request.headers, kRequestIdHeader) == false) {
        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(id_mutex_);
            id = id_rng_();
        }
        request.headers[std::string(kRequestIdHeader)] = to_hex(id);
    }

    if (has_header(request.headers, kTimestampHeader) == false) {
        const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
        request.headers[std::string(kTimestampHeader)] = std::to_string(epoch_ms);
    }
}

}  // namespace meshgate
