/* Simulated annealing over zone->center assignments. */
#pragma once

#include "reliefroute/core/evaluator.hpp"
#include "reliefroute/core/optimizer.hpp"

namespace reliefroute::core {

// Single-solution search minimizing Evaluator::annealing_cost. A neighbor
// reassigns 1-2 random zones to uniformly random centers; worse neighbors
// are accepted with probability exp(-delta / T). T starts at
// initial_temperature and is multiplied by cooling_rate after every step
// until it falls to min_temperature.
class AnnealingOptimizer final : public AllocationOptimizer {
public:
  explicit AnnealingOptimizer(AnnealingOptions options);

  [[nodiscard]] const AnnealingOptions& options() const noexcept { return options_; }

  [[nodiscard]] SearchOutcome search(const ProblemInstance& problem, RandomEngine& rng) const override;
  [[nodiscard]] AllocationSolution optimize(const ProblemInstance& problem, RandomEngine& rng) const override;

  [[nodiscard]] static Genome neighbor(const Genome& current, std::size_t num_centers, RandomEngine& rng);
  // Metropolis criterion.
  [[nodiscard]] static bool accept(double current_cost, double neighbor_cost, double temperature,
                                   RandomEngine& rng);

private:
  AnnealingOptions options_;
};

} // namespace reliefroute::core
