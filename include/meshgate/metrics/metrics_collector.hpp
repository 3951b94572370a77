#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Metrics Collector
// ═══════════════════════════════════════════════════════════════════════════
// In-process latency/error accounting per service.
//
// - avg_response_time is an exact running mean:
//     new_avg = (old_avg * (n - 1) + latency) / n
// - p95 is recomputed from the last 100 latencies (oldest evicted first), and
//   only once more than 10 samples are buffered:
//     p95 = sorted[floor(0.95 * len)]
// - availability = (request_count + 1 - error_count) / (request_count + 1) * 100
//   The +1 keeps the first sample away from a zero denominator.

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meshgate {

struct MetricsSample {
    std::size_t request_count{0};
    std::size_t error_count{0};
    std::size_t cache_hits{0};
    std::size_t degraded_dispatches{0};  ///< Last-resort picks while no endpoint was healthy
    double avg_response_time{0.0};   ///< milliseconds
    double p95_response_time{0.0};   ///< milliseconds, 0 until enough samples
    double availability_percentage{100.0};
};

class MetricsCollector {
public:
    static constexpr std::size_t kLatencyWindow = 100;
    static constexpr std::size_t kMinSamplesForP95 = 10;

    MetricsCollector() = default;

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    /// Record one routed request (cache hits are recorded separately).
    void record_request(std::string_view service, double latency_ms, bool success);

    /// Count a response served from cache. Does not touch request accounting.
    void record_cache_hit(std::string_view service);

    void record_degraded_dispatch(std::string_view service);

    [[nodiscard]] std::optional<MetricsSample> snapshot(std::string_view service) const;

    /// Buffered latencies, oldest first.
    [[nodiscard]] std::vector<double> latencies(std::string_view service) const;

    /// Drop everything recorded for a service (cascade of unregister).
    void remove(std::string_view service);

    [[nodiscard]] std::vector<std::string> services() const;

private:
    struct Entry {
        MetricsSample sample;
        std::deque<double> latencies;
    };

    Entry& entry_for(std::string_view service);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace meshgate
