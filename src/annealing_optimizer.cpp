/*
  AnnealingOptimizer — geometric cooling, Metropolis acceptance, best-seen
  tracking.
*/
#include "reliefroute/core/annealing_optimizer.hpp"

#include <cmath>
#include <utility>

namespace reliefroute::core {

AnnealingOptimizer::AnnealingOptimizer(AnnealingOptions options) : options_(std::move(options)) {
  validate(options_);
}

Genome AnnealingOptimizer::neighbor(const Genome& current, std::size_t num_centers, RandomEngine& rng) {
  Genome next = current;
  if (next.empty() || num_centers == 0) return next;
  std::uniform_int_distribution<int> count(1, 2);
  std::uniform_int_distribution<std::size_t> zone(0, next.size() - 1);
  std::uniform_int_distribution<std::size_t> center(0, num_centers - 1);
  const int n = count(rng);
  for (int i = 0; i < n; ++i) {
    const auto z = zone(rng);
    next[z] = center(rng);
  }
  return next;
}

bool AnnealingOptimizer::accept(double current_cost, double neighbor_cost, double temperature,
                                RandomEngine& rng) {
  if (neighbor_cost < current_cost) return true;
  const double probability = std::exp(-(neighbor_cost - current_cost) / temperature);
  std::uniform_real_distribution<double> u(0.0, 1.0);
  return u(rng) < probability;
}

SearchOutcome AnnealingOptimizer::search(const ProblemInstance& problem, RandomEngine& rng) const {
  const Evaluator eval(problem);
  Genome current = problem.random_genome(rng);
  double current_cost = eval.annealing_cost(current, options_.cost);

  SearchOutcome out;
  out.best = current;
  out.best_score = current_cost;
  out.initial_score = current_cost;
  if (current.empty()) return out;

  double temperature = options_.initial_temperature;
  while (temperature > options_.min_temperature) {
    Genome candidate = neighbor(current, problem.num_centers(), rng);
    const double candidate_cost = eval.annealing_cost(candidate, options_.cost);
    if (accept(current_cost, candidate_cost, temperature, rng)) {
      current = std::move(candidate);
      current_cost = candidate_cost;
      if (current_cost < out.best_score) {
        out.best = current;
        out.best_score = current_cost;
      }
    }
    temperature *= options_.cooling_rate;
    out.trace.push_back(out.best_score);
  }
  return out;
}

AllocationSolution AnnealingOptimizer::optimize(const ProblemInstance& problem, RandomEngine& rng) const {
  auto outcome = search(problem, rng);
  const Evaluator eval(problem);
  AllocationSolution sol = make_solution(problem, outcome.best);
  sol.total_cost = outcome.best_score;
  sol.coverage_score = eval.breakdown(outcome.best).coverage;
  const auto routes = static_cast<double>(outcome.best.size());
  sol.time_efficiency = routes > 0 ? 1.0 / (1.0 + sol.total_cost / routes) : 1.0;
  return sol;
}

OptimizerPtr make_annealing_optimizer(const AnnealingOptions& options) {
  return std::make_shared<AnnealingOptimizer>(options);
}

} // namespace reliefroute::core
