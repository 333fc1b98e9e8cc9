/**
 * @file selection_strategy.hpp
 * @brief Pluggable endpoint selection among eligible candidates.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string_view>
#include <vector>

namespace analyzer_orchestrator {

struct Candidate {
    size_t index = 0;        ///< Registration index within the service
    uint32_t in_flight = 0;
};

/**
 * @brief Abstract selection policy (runtime polymorphism).
 *
 * choose() receives a non-empty candidate list ordered by registration index
 * and returns a position in it. The pool calls it under its exclusive lock,
 * so implementations may keep unsynchronised state.
 */
class ISelectionStrategy {
public:
    virtual ~ISelectionStrategy() = default;
    virtual size_t choose(ServiceType service, const std::vector<Candidate>& candidates) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Rotates through endpoints in registration order, skipping ineligible ones.
class RoundRobinStrategy : public ISelectionStrategy {
public:
    size_t choose(ServiceType service, const std::vector<Candidate>& candidates) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "round_robin"; }

private:
    std::map<ServiceType, size_t> last_index_;
};

/// Fewest in-flight requests; ties go to the lowest registration index.
class LeastInFlightStrategy : public ISelectionStrategy {
public:
    size_t choose(ServiceType service, const std::vector<Candidate>& candidates) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "least_in_flight"; }
};

class RandomStrategy : public ISelectionStrategy {
public:
    explicit RandomStrategy(uint64_t seed);

    size_t choose(ServiceType service, const std::vector<Candidate>& candidates) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "random"; }

private:
    std::mt19937_64 rng_;
};

/// seed == 0 draws a seed from std::random_device.
std::unique_ptr<ISelectionStrategy> make_selection_strategy(SelectionStrategy strategy,
                                                            uint64_t seed = 0);

}  // namespace analyzer_orchestrator
