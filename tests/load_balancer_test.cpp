// ─────────────────────────────────────────────────────────────────────────────
// Load Balancer Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "meshgate/routing/load_balancer.hpp"

#include <map>
#include <vector>

using namespace meshgate;

namespace {

std::vector<Candidate> uniform(std::size_t count) {
    std::vector<Candidate> candidates;
    for (std::size_t i = 0; i < count; ++i) {
        candidates.push_back(Candidate{.index = i});
    }
    return candidates;
}

}  // namespace

TEST_CASE("LoadBalancer returns nothing for an empty view", "[routing][load_balancer]") {
    for (auto strategy : {LoadBalancingStrategy::RoundRobin, LoadBalancingStrategy::LeastConnections,
                          LoadBalancingStrategy::Weighted, LoadBalancingStrategy::Random}) {
        LoadBalancer balancer(strategy, 1);
        REQUIRE_FALSE(balancer.select({}).has_value());
    }
    LoadBalancer balancer;
    REQUIRE_FALSE(balancer.pick_any(0).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Round Robin
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Round robin starts after the cursor and cycles", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::RoundRobin);
    const auto candidates = uniform(3);

    REQUIRE(balancer.select(candidates) == 1u);
    REQUIRE(balancer.select(candidates) == 2u);
    REQUIRE(balancer.select(candidates) == 0u);
    REQUIRE(balancer.select(candidates) == 1u);
    REQUIRE(balancer.cursor() == 4);
}

TEST_CASE("Round robin is fair over many calls", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::RoundRobin);
    const auto candidates = uniform(4);

    std::map<std::size_t, int> hits;
    for (int i = 0; i < 400; ++i) {
        hits[*balancer.select(candidates)]++;
    }

    REQUIRE(hits.size() == 4);
    for (const auto& [index, count] : hits) {
        REQUIRE(count == 100);
    }
}

TEST_CASE("Round robin returns the candidate's endpoint index", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::RoundRobin);
    // Endpoint 1 filtered out as unhealthy
    const std::vector<Candidate> candidates{{.index = 0}, {.index = 2}};

    REQUIRE(balancer.select(candidates) == 2u);
    REQUIRE(balancer.select(candidates) == 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Least Connections
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Least connections picks the idlest endpoint", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::LeastConnections);
    const std::vector<Candidate> candidates{
        {.index = 0, .active_connections = 4},
        {.index = 1, .active_connections = 1},
        {.index = 2, .active_connections = 3},
    };

    REQUIRE(balancer.select(candidates) == 1u);
}

TEST_CASE("Least connections breaks ties by list order", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::LeastConnections);
    const std::vector<Candidate> candidates{
        {.index = 0, .active_connections = 2},
        {.index = 1, .active_connections = 0},
        {.index = 2, .active_connections = 0},
    };

    for (int i = 0; i < 5; ++i) {
        REQUIRE(balancer.select(candidates) == 1u);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Weighted
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Weighted selection follows the weights", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::Weighted, 12345);
    const std::vector<Candidate> candidates{
        {.index = 0, .weight = 1.0},
        {.index = 1, .weight = 3.0},
    };

    int heavy = 0;
    constexpr int draws = 10000;
    for (int i = 0; i < draws; ++i) {
        if (balancer.select(candidates) == 1u) {
            heavy++;
        }
    }

    const double share = static_cast<double>(heavy) / draws;
    REQUIRE(share > 0.72);
    REQUIRE(share < 0.78);
}

TEST_CASE("Weighted selection never picks zero-weight endpoints", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::Weighted, 7);
    const std::vector<Candidate> candidates{
        {.index = 0, .weight = 0.0},
        {.index = 1, .weight = 2.0},
        {.index = 2, .weight = 0.0},
    };

    for (int i = 0; i < 500; ++i) {
        REQUIRE(balancer.select(candidates) == 1u);
    }
}

TEST_CASE("Weighted selection falls back to the first candidate when all weights are zero", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::Weighted, 7);
    const std::vector<Candidate> candidates{
        {.index = 3, .weight = 0.0},
        {.index = 5, .weight = 0.0},
    };

    REQUIRE(balancer.select(candidates) == 3u);
}

TEST_CASE("Seeded balancers make identical choices", "[routing][load_balancer]") {
    LoadBalancer a(LoadBalancingStrategy::Random, 42);
    LoadBalancer b(LoadBalancingStrategy::Random, 42);
    const auto candidates = uniform(5);

    for (int i = 0; i < 50; ++i) {
        REQUIRE(a.select(candidates) == b.select(candidates));
    }
}

TEST_CASE("Random selection covers every candidate", "[routing][load_balancer]") {
    LoadBalancer balancer(LoadBalancingStrategy::Random, 3);
    const auto candidates = uniform(3);

    std::map<std::size_t, int> hits;
    for (int i = 0; i < 300; ++i) {
        hits[*balancer.select(candidates)]++;
    }
    REQUIRE(hits.size() == 3);
}

TEST_CASE("Strategy names parse and print", "[routing][load_balancer]") {
    REQUIRE(parse_strategy("round-robin") == LoadBalancingStrategy::RoundRobin);
    REQUIRE(parse_strategy("least-connections") == LoadBalancingStrategy::LeastConnections);
    REQUIRE(parse_strategy("weighted") == LoadBalancingStrategy::Weighted);
    REQUIRE(parse_strategy("random") == LoadBalancingStrategy::Random);
    REQUIRE_FALSE(parse_strategy("fastest").has_value());
    REQUIRE(to_string(LoadBalancingStrategy::LeastConnections) == "least-connections");
}
