/**
 * @file selection_strategy.cpp
 * @brief Round-robin, least-in-flight and random selection.
 * @author AnalyzerOrchestrator Team
 */

#include "pool/selection_strategy.hpp"

namespace analyzer_orchestrator {

size_t RoundRobinStrategy::choose(ServiceType service, const std::vector<Candidate>& candidates) {
    auto it = last_index_.find(service);
    size_t chosen = 0;
    if (it != last_index_.end()) {
        // First candidate registered after the previous pick, else wrap around.
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (candidates[i].index > it->second) {
                chosen = i;
                break;
            }
        }
    }
    last_index_[service] = candidates[chosen].index;
    return chosen;
}

size_t LeastInFlightStrategy::choose(ServiceType /*service*/,
                                     const std::vector<Candidate>& candidates) {
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (candidates[i].in_flight < candidates[best].in_flight) best = i;
    }
    return best;
}

RandomStrategy::RandomStrategy(uint64_t seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {}

size_t RandomStrategy::choose(ServiceType /*service*/, const std::vector<Candidate>& candidates) {
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return dist(rng_);
}

std::unique_ptr<ISelectionStrategy> make_selection_strategy(SelectionStrategy strategy,
                                                            uint64_t seed) {
    switch (strategy) {
        case SelectionStrategy::LeastInFlight:
            return std::make_unique<LeastInFlightStrategy>();
        case SelectionStrategy::Random:
            return std::make_unique<RandomStrategy>(seed);
        case SelectionStrategy::RoundRobin:
            break;
    }
    return std::make_unique<RoundRobinStrategy>();
}

}  // namespace analyzer_orchestrator
