#include "meshgate/routing/load_balancer.hpp"

namespace meshgate {

std::optional<LoadBalancingStrategy> parse_strategy(std::string_view name) noexcept {
    if (name == "round-robin")       return LoadBalancingStrategy::RoundRobin;
    if (name == "least-connections") return LoadBalancingStrategy::LeastConnections;
    if (name == "weighted")          return LoadBalancingStrategy::Weighted;
    if (name == "random")            return LoadBalancingStrategy::Random;
    return std::nullopt;
}

LoadBalancer::LoadBalancer(LoadBalancingStrategy strategy, std::optional<std::uint32_t> seed)
    : strategy_(strategy)
    , rng_(seed.has_value() ? *seed : std::random_device{}())
{}

std::optional<std::size_t> LoadBalancer::select(const std::vector<Candidate>& candidates) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    std::size_t position = 0;
    switch (strategy_) {
        case LoadBalancingStrategy::RoundRobin:
            position = select_round_robin(candidates);
            break;
        case LoadBalancingStrategy::LeastConnections:
            position = select_least_connections(candidates);
            break;
        case LoadBalancingStrategy::Weighted:
            position = select_weighted(candidates);
            break;
        case LoadBalancingStrategy::Random:
            position = select_random(candidates);
            break;
    }
    return candidates[position].index;
}

std::optional<std::size_t> LoadBalancer::pick_any(std::size_t count) {
    if (count == 0) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

std::size_t LoadBalancer::select_round_robin(const std::vector<Candidate>& candidates) {
    const auto n = static_cast<std::uint64_t>(candidates.size());
    const auto position = (cursor_ + 1) % n;
    cursor_++;
    return static_cast<std::size_t>(position);
}

std::size_t LoadBalancer::select_least_connections(const std::vector<Candidate>& candidates) const {
    std::size_t best = 0;
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        // Strict comparison keeps the first occurrence on ties
        if (candidates[i].active_connections < candidates[best].active_connections) {
            best = i;
        }
    }
    return best;
}

std::size_t LoadBalancer::select_weighted(const std::vector<Candidate>& candidates) {
    double total = 0.0;
    for (const auto& candidate : candidates) {
        if (candidate.weight > 0.0) {
            total += candidate.weight;
        }
    }

    const bool none_qualify = (total <= 0.0);
    if (none_qualify) {
        return 0;
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double r = dist(rng_);

    std::size_t last_eligible = 0;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].weight <= 0.0) {
            continue;
        }
        last_eligible = i;
        r -= candidates[i].weight;
        if (r <= 0.0) {
            return i;
        }
    }
    // Floating-point residue
    return last_eligible;
}

std::size_t LoadBalancer::select_random(const std::vector<Candidate>& candidates) {
    std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
    return dist(rng_);
}

}  // namespace meshgate
