#ifndef MESHGATE_ROUTING_LOAD_BALANCER_HPP
#define MESHGATE_ROUTING_LOAD_BALANCER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Load Balancing Strategy
// ─────────────────────────────────────────────────────────────────────────────

enum class LoadBalancingStrategy {
    RoundRobin,
    LeastConnections,
    Weighted,
    Random
};

[[nodiscard]] constexpr std::string_view to_string(LoadBalancingStrategy strategy) noexcept {
    switch (strategy) {
        case LoadBalancingStrategy::RoundRobin:       return "round-robin";
        case LoadBalancingStrategy::LeastConnections: return "least-connections";
        case LoadBalancingStrategy::Weighted:         return "weighted";
        case LoadBalancingStrategy::Random:           return "random";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LoadBalancingStrategy> parse_strategy(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// LoadBalancer
// ─────────────────────────────────────────────────────────────────────────────
// Pure selection over a candidate view; never blocks and never falls back to
// an endpoint outside the view.
//
//   round-robin        candidates[(cursor + 1) % n], cursor advances every call
//   least-connections  argmin(active_connections), ties -> first in list
//   weighted           weight <= 0 excluded; r = U[0, sum), walk subtracting
//                      weights until r <= 0; nothing qualifies -> first candidate,
//                      which is the first healthy endpoint in list order
//   random             uniform pick
//
// Not synchronized: one instance per service, called under the service lock.

struct Candidate {
    std::size_t index;            ///< Position in the service's endpoint list
    double weight{1.0};
    std::int64_t active_connections{0};
};

class LoadBalancer {
public:
    explicit LoadBalancer(
        LoadBalancingStrategy strategy = LoadBalancingStrategy::RoundRobin,
        std::optional<std::uint32_t> seed = std::nullopt
    );

    /// Returns the chosen candidate's `index`, or nullopt when the view is empty.
    [[nodiscard]] std::optional<std::size_t> select(const std::vector<Candidate>& candidates);

    /// Uniform pick in [0, count). Used for the degraded last-resort dispatch.
    [[nodiscard]] std::optional<std::size_t> pick_any(std::size_t count);

    [[nodiscard]] LoadBalancingStrategy strategy() const noexcept { return strategy_; }
    [[nodiscard]] std::uint64_t cursor() const noexcept { return cursor_; }

private:
    std::size_t select_round_robin(const std::vector<Candidate>& candidates);
    std::size_t select_least_connections(const std::vector<Candidate>& candidates) const;
    std::size_t select_weighted(const std::vector<Candidate>& candidates);
    std::size_t select_random(const std::vector<Candidate>& candidates);

    LoadBalancingStrategy strategy_;
    std::uint64_t cursor_{0};
    std::mt19937 rng_;
};

}  // namespace meshgate

#endif  // MESHGATE_ROUTING_LOAD_BALANCER_HPP
