/*
  Multi-objective (Pareto) search: NSGA-II style non-dominated sorting with
  crowding-distance truncation over the three Evaluator objectives.
*/
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "reliefroute/core/allocation.hpp"
#include "reliefroute/core/evaluator.hpp"
#include "reliefroute/core/options.hpp"
#include "reliefroute/core/problem.hpp"

namespace reliefroute::core {

// a dominates b iff a is no worse in every objective and strictly better in
// at least one (all objectives minimized).
[[nodiscard]] bool dominates(const Objectives& a, const Objectives& b) noexcept;

// Partition [0, n) into ranked fronts. fronts[0] is the non-dominated set;
// each index appears in exactly one front. Indices within a front ascend.
[[nodiscard]] std::vector<std::vector<std::size_t>> non_dominated_sort(std::span<const Objectives> objs);

// Crowding distance of each member of a front. Per objective the two boundary
// members (first and last in a stable sort) get +inf and interior members
// the normalized gap between their neighbors. An objective with zero range
// still marks its boundaries but adds nothing to interior members. Fronts of
// at most two members are all boundary.
[[nodiscard]] std::vector<double> crowding_distance(std::span<const Objectives> front);

struct ParetoOutcome {
  // Distinct genomes of the final non-dominated front.
  std::vector<Genome> front;
  std::vector<Objectives> objectives;
};

class ParetoOptimizer {
public:
  explicit ParetoOptimizer(ParetoOptions options);

  [[nodiscard]] const ParetoOptions& options() const noexcept { return options_; }

  [[nodiscard]] ParetoOutcome search(const ProblemInstance& problem, RandomEngine& rng) const;
  // One solution per front member: total_cost = cost objective,
  // coverage_score and time_efficiency = the negated maximized objectives.
  [[nodiscard]] std::vector<AllocationSolution> optimize(const ProblemInstance& problem,
                                                         RandomEngine& rng) const;

private:
  // Crowded-comparison tournament: lower rank wins, then larger crowding.
  [[nodiscard]] std::size_t tournament(std::span<const std::size_t> rank,
                                       std::span<const double> crowding,
                                       RandomEngine& rng) const;
  [[nodiscard]] std::vector<Genome> offspring(const ProblemInstance& problem,
                                              const std::vector<Genome>& population,
                                              std::span<const Objectives> objs,
                                              RandomEngine& rng) const;

  ParetoOptions options_;
};

} // namespace reliefroute::core
