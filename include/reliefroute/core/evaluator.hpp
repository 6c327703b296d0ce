/*
  Evaluator — pure scoring functions over assignments.

  All scores read the ProblemInstance distance table; unreachable pairs are
  charged a finite penalty so infeasible-heavy individuals stay comparable.
*/
#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <vector>

#include "reliefroute/core/options.hpp"
#include "reliefroute/core/problem.hpp"

namespace reliefroute::core {

// (total cost, -coverage, -speed); every component is minimized.
using Objectives = std::array<double, 3>;

struct FitnessBreakdown {
  double total_distance {0.0};       // includes penalties
  double coverage {0.0};             // sum of priority/5 * resource match
  double resource_efficiency {0.0};  // sum of resource match
  std::size_t unreachable {0};
  double fitness {0.0};
};

class Evaluator {
public:
  explicit Evaluator(const ProblemInstance& problem, EvaluatorWeights weights = {});

  [[nodiscard]] const ProblemInstance& problem() const noexcept { return *problem_; }
  [[nodiscard]] const EvaluatorWeights& weights() const noexcept { return weights_; }

  // Fraction of the zone's needed resources the center can fully cover.
  // A zone with no needs matches fully.
  [[nodiscard]] double resource_match(std::size_t center, std::size_t zone) const noexcept {
    return match_[center * problem_->num_zones() + zone];
  }

  // Single-objective fitness (higher is better).
  [[nodiscard]] FitnessBreakdown breakdown(std::span<const std::size_t> genes) const;
  [[nodiscard]] double fitness(std::span<const std::size_t> genes) const;
  [[nodiscard]] double fitness(const Assignment& assignment) const;

  // Sum of path cost per route, unreachable pairs charged `penalty`.
  [[nodiscard]] double route_cost(std::span<const std::size_t> genes, double penalty) const;

  // Annealing cost (lower is better): distance * (6 - priority) / 5, so that
  // urgent zones weigh less per unit of distance.
  [[nodiscard]] double annealing_cost(std::span<const std::size_t> genes,
                                      const AnnealingCostModel& model) const;
  [[nodiscard]] double annealing_cost(const Assignment& assignment,
                                      const AnnealingCostModel& model) const;

  // Multi-objective tuple. Coverage per zone is resource match * priority,
  // speed is 1 / (1 + distance); unreachable pairs add `penalty` to cost and
  // nothing to coverage or speed.
  [[nodiscard]] Objectives objectives(std::span<const std::size_t> genes, double penalty) const;
  [[nodiscard]] Objectives objectives(const Assignment& assignment, double penalty) const;

private:
  void check(std::span<const std::size_t> genes) const;

  const ProblemInstance* problem_;
  EvaluatorWeights weights_;
  std::vector<double> match_;  // row-major [center][zone]
};

} // namespace reliefroute::core
