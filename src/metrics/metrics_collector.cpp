#include "meshgate/metrics/metrics_collector.hpp"

#include <algorithm>
#include <cmath>

namespace meshgate {

MetricsCollector::Entry& MetricsCollector::entry_for(std::string_view service) {
    auto it = entries_.find(std::string(service));
    if (it == entries_.end()) {
        it = entries_.emplace(std::string(service), Entry{}).first;
    }
    return it->second;
}

void MetricsCollector::record_request(std::string_view service, double latency_ms, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_for(service);
    auto& sample = entry.sample;

    sample.request_count++;
    if (success == false) {
        sample.error_count++;
    }

    const auto n = static_cast<double>(sample.request_count);
    sample.avg_response_time = (sample.avg_response_time * (n - 1.0) + latency_ms) / n;

    entry.latencies.push_back(latency_ms);
    if (entry.latencies.size() > kLatencyWindow) {
        entry.latencies.pop_front();
    }

    if (entry.latencies.size() > kMinSamplesForP95) {
        std::vector<double> sorted(entry.latencies.begin(), entry.latencies.end());
        std::ranges::sort(sorted);
        const auto index = static_cast<std::size_t>(
            std::floor(static_cast<double>(sorted.size()) * 0.95)
        );
        sample.p95_response_time = sorted[std::min(index, sorted.size() - 1)];
    }

    const auto total = static_cast<double>(sample.request_count + 1);
    sample.availability_percentage =
        (total - static_cast<double>(sample.error_count)) / total * 100.0;
}

void MetricsCollector::record_cache_hit(std::string_view service) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_for(service).sample.cache_hits++;
}

void MetricsCollector::record_degraded_dispatch(std::string_view service) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_for(service).sample.degraded_dispatches++;
}

std::optional<MetricsSample> MetricsCollector::snapshot(std::string_view service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(std::string(service));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.sample;
}

std::vector<double> MetricsCollector::latencies(std::string_view service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(std::string(service));
    if (it == entries_.end()) {
        return {};
    }
    return {it->second.latencies.begin(), it->second.latencies.end()};
}

void MetricsCollector::remove(std::string_view service) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(std::string(service));
}

std::vector<std::string> MetricsCollector::services() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    std::ranges::sort(names);
    return names;
}

}  // namespace meshgate
