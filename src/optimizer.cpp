/* Optimizer entry points over caller-supplied graph snapshots. */
#include "reliefroute/core/optimizer.hpp"

#include "reliefroute/core/annealing_optimizer.hpp"
#include "reliefroute/core/genetic_optimizer.hpp"
#include "reliefroute/core/pareto_optimizer.hpp"

namespace reliefroute::core {

namespace {

ProblemInstance make_problem(std::span<const ReliefCenter> centers,
                             std::span<const DisasterZone> zones,
                             const RoadGraph& network) {
  return ProblemInstance(std::vector<ReliefCenter>(centers.begin(), centers.end()),
                         std::vector<DisasterZone>(zones.begin(), zones.end()),
                         network, PathMetric::Time);
}

} // namespace

AllocationSolution optimize_allocation(std::span<const ReliefCenter> centers,
                                       std::span<const DisasterZone> zones,
                                       const RoadGraph& network,
                                       const GeneticOptions& options,
                                       RandomEngine& rng) {
  const GeneticOptimizer opt(options);
  return opt.optimize(make_problem(centers, zones, network), rng);
}

AllocationSolution optimize_allocation(std::span<const ReliefCenter> centers,
                                       std::span<const DisasterZone> zones,
                                       const RoadGraph& network,
                                       const AnnealingOptions& options,
                                       RandomEngine& rng) {
  const AnnealingOptimizer opt(options);
  return opt.optimize(make_problem(centers, zones, network), rng);
}

std::vector<AllocationSolution> optimize_pareto_front(std::span<const ReliefCenter> centers,
                                                      std::span<const DisasterZone> zones,
                                                      const RoadGraph& network,
                                                      const ParetoOptions& options,
                                                      RandomEngine& rng) {
  const ParetoOptimizer opt(options);
  return opt.optimize(make_problem(centers, zones, network), rng);
}

} // namespace reliefroute::core
