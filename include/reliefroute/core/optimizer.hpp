/*
  Optimizer interface — interchangeable single-objective allocation search.

  Optimizers are pure functions of a caller-owned ProblemInstance and an
  injected random engine; they hold no shared mutable state and may run
  concurrently on independent engines.
*/
#pragma once

#include <memory>
#include <span>
#include <vector>

#include "reliefroute/core/allocation.hpp"
#include "reliefroute/core/model.hpp"
#include "reliefroute/core/options.hpp"
#include "reliefroute/core/problem.hpp"
#include "reliefroute/core/road_graph.hpp"

namespace reliefroute::core {

// Raw search result. Scores are in the optimizer's own sense: fitness
// (higher is better) for the genetic search, cost (lower is better) for
// annealing.
struct SearchOutcome {
  Genome best;
  double best_score {0.0};
  // Best score of the initial population / initial solution.
  double initial_score {0.0};
  // Best-so-far score after each generation / temperature step.
  std::vector<double> trace;
};

class AllocationOptimizer {
public:
  virtual ~AllocationOptimizer() noexcept = default;

  [[nodiscard]] virtual SearchOutcome search(const ProblemInstance& problem, RandomEngine& rng) const = 0;

  // search() followed by conversion of the best genome.
  [[nodiscard]] virtual AllocationSolution optimize(const ProblemInstance& problem, RandomEngine& rng) const = 0;
};

using OptimizerPtr = std::shared_ptr<AllocationOptimizer>;

// Both factories validate options and throw ValueError on invalid settings.
[[nodiscard]] OptimizerPtr make_genetic_optimizer(const GeneticOptions& options = {});
[[nodiscard]] OptimizerPtr make_annealing_optimizer(const AnnealingOptions& options = {});

// Entry points over a graph snapshot (time metric).
[[nodiscard]] AllocationSolution optimize_allocation(std::span<const ReliefCenter> centers,
                                                     std::span<const DisasterZone> zones,
                                                     const RoadGraph& network,
                                                     const GeneticOptions& options,
                                                     RandomEngine& rng);
[[nodiscard]] AllocationSolution optimize_allocation(std::span<const ReliefCenter> centers,
                                                     std::span<const DisasterZone> zones,
                                                     const RoadGraph& network,
                                                     const AnnealingOptions& options,
                                                     RandomEngine& rng);
[[nodiscard]] std::vector<AllocationSolution> optimize_pareto_front(std::span<const ReliefCenter> centers,
                                                                    std::span<const DisasterZone> zones,
                                                                    const RoadGraph& network,
                                                                    const ParetoOptions& options,
                                                                    RandomEngine& rng);

} // namespace reliefroute::core
