#ifndef MESHGATE_METRICS_METRICS_SINK_HPP
#define MESHGATE_METRICS_METRICS_SINK_HPP

#include "meshgate/gateway/gateway_error.hpp"

#include <string>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// IMetricsSink
// ─────────────────────────────────────────────────────────────────────────────
// Fire-and-forget hook for cross-process aggregation. Distinct from the
// in-process MetricsCollector: the sink only sees the outcome of each
// breaker-wrapped call, never cache hits or rejections.

class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    virtual void track_request(double latency_ms, int status_code, const std::string& path) = 0;

    virtual void track_error(const GatewayError& error, const std::string& path) = 0;
};

class NullMetricsSink final : public IMetricsSink {
public:
    void track_request(double /*latency_ms*/, int /*status_code*/, const std::string& /*path*/) override {}

    void track_error(const GatewayError& /*error*/, const std::string& /*path*/) override {}
};

}  // namespace meshgate

#endif  // MESHGATE_METRICS_METRICS_SINK_HPP
