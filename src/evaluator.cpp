/*
  Evaluator — fitness, annealing cost and objective tuples.
*/
#include "reliefroute/core/evaluator.hpp"

#include <algorithm>

#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

namespace {
double compute_match(const ReliefCenter& center, const DisasterZone& zone) {
  if (zone.resources_needed.empty()) return 1.0;
  std::size_t covered = 0;
  for (auto const& need : zone.resources_needed) {
    if (center.stock_of(need.id) >= need.quantity) ++covered;
  }
  return static_cast<double>(covered) / static_cast<double>(std::max<std::size_t>(zone.resources_needed.size(), 1));
}
} // namespace

Evaluator::Evaluator(const ProblemInstance& problem, EvaluatorWeights weights)
    : problem_(&problem), weights_(weights) {
  validate(weights_);
  const auto centers = problem.centers();
  const auto zones = problem.zones();
  match_.resize(centers.size() * zones.size());
  for (std::size_t c = 0; c < centers.size(); ++c) {
    for (std::size_t z = 0; z < zones.size(); ++z) {
      match_[c * zones.size() + z] = compute_match(centers[c], zones[z]);
    }
  }
}

void Evaluator::check(std::span<const std::size_t> genes) const {
  if (genes.size() != problem_->num_zones()) {
    throw AssignmentError("genome length does not match zone count");
  }
  for (auto c : genes) {
    if (c >= problem_->num_centers()) throw AssignmentError("genome names unknown center index");
  }
}

FitnessBreakdown Evaluator::breakdown(std::span<const std::size_t> genes) const {
  check(genes);
  const auto zones = problem_->zones();
  FitnessBreakdown out;
  for (std::size_t z = 0; z < genes.size(); ++z) {
    const auto c = genes[z];
    if (!problem_->reachable(c, z)) {
      out.total_distance += weights_.unreachable_penalty;
      ++out.unreachable;
      continue;
    }
    out.total_distance += problem_->distance(c, z);
    const double priority_weight = static_cast<double>(zones[z].priority) / 5.0;
    const double match = resource_match(c, z);
    out.coverage += priority_weight * match;
    out.resource_efficiency += match;
  }
  out.fitness = weights_.coverage * out.coverage +
                weights_.efficiency * out.resource_efficiency -
                weights_.distance * out.total_distance;
  return out;
}

double Evaluator::fitness(std::span<const std::size_t> genes) const {
  return breakdown(genes).fitness;
}

double Evaluator::fitness(const Assignment& assignment) const {
  return fitness(problem_->resolve(assignment));
}

double Evaluator::route_cost(std::span<const std::size_t> genes, double penalty) const {
  check(genes);
  double total = 0.0;
  for (std::size_t z = 0; z < genes.size(); ++z) {
    total += problem_->reachable(genes[z], z) ? problem_->distance(genes[z], z) : penalty;
  }
  return total;
}

double Evaluator::annealing_cost(std::span<const std::size_t> genes,
                                 const AnnealingCostModel& model) const {
  check(genes);
  const auto zones = problem_->zones();
  double total = 0.0;
  for (std::size_t z = 0; z < genes.size(); ++z) {
    if (!problem_->reachable(genes[z], z)) {
      total += model.unreachable_penalty;
      continue;
    }
    const double priority_multiplier = static_cast<double>(6 - zones[z].priority) / 5.0;
    total += problem_->distance(genes[z], z) * priority_multiplier;
  }
  return total;
}

double Evaluator::annealing_cost(const Assignment& assignment, const AnnealingCostModel& model) const {
  return annealing_cost(problem_->resolve(assignment), model);
}

Objectives Evaluator::objectives(std::span<const std::size_t> genes, double penalty) const {
  check(genes);
  const auto zones = problem_->zones();
  double cost = 0.0, coverage = 0.0, speed = 0.0;
  for (std::size_t z = 0; z < genes.size(); ++z) {
    const auto c = genes[z];
    if (!problem_->reachable(c, z)) {
      cost += penalty;
      continue;
    }
    const double d = problem_->distance(c, z);
    cost += d;
    coverage += resource_match(c, z) * static_cast<double>(zones[z].priority);
    speed += 1.0 / (1.0 + d);
  }
  return Objectives{cost, -coverage, -speed};
}

Objectives Evaluator::objectives(const Assignment& assignment, double penalty) const {
  return objectives(problem_->resolve(assignment), penalty);
}

} // namespace reliefroute::core
