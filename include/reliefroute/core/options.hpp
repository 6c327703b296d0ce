/*
  Option structs for the evaluator, optimizers, exact allocation and the
  routing engine. Each has a validate() that raises ValueError; consumers call
  it at construction, so invalid settings fail fast and are never clamped.
*/
#pragma once

#include <chrono>
#include <cstddef>

#include "reliefroute/core/constants.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

// Weighted-sum fitness used by single-objective search:
//   coverage * coverage_sum + efficiency * match_sum - distance * distance_sum
struct EvaluatorWeights {
  double coverage {0.5};
  double efficiency {0.3};
  double distance {0.2};
  // Distance charged for an unreachable (center, zone) pair.
  double unreachable_penalty {kDefaultUnreachablePenalty};
};

// Annealing cost: sum of distance * (6 - priority) / 5.
struct AnnealingCostModel {
  double unreachable_penalty {kDefaultAnnealingPenalty};
};

struct GeneticOptions {
  int population_size {50};
  int generations {100};
  double mutation_rate {0.1};
  double elite_fraction {0.1};
  int tournament_size {3};
  EvaluatorWeights weights {};
};

struct AnnealingOptions {
  double initial_temperature {1000.0};
  double cooling_rate {0.95};
  double min_temperature {1.0};
  AnnealingCostModel cost {};
};

struct ParetoOptions {
  int population_size {50};
  int generations {100};
  double mutation_rate {0.1};
  int tournament_size {2};
  double unreachable_penalty {kDefaultUnreachablePenalty};
};

struct ExactAllocationOptions {
  // Report Infeasible unless every zone need can be met in full.
  bool require_full_coverage {false};
};

// Weights of the combined routing cost
//   time * effective_time + distance * base_distance + condition * delay
// where delay is the segment's condition x traffic multiplier.
struct RouteObjectives {
  double time {1.0};
  double distance {0.5};
  double condition {0.3};
};

struct RoutingOptions {
  std::chrono::milliseconds cache_ttl {kDefaultRouteCacheTtl};
  // Entries kept per segment in condition and traffic history.
  std::size_t history_limit {kDefaultHistoryLimit};
  // Used for connections that carry no explicit time.
  double default_speed_kmh {kDefaultSpeedKmh};
  // Queries at or above this priority use A*.
  int astar_min_priority {4};
  // Condition of newly created segments.
  RoadCondition initial_condition {RoadCondition::Good};
};

void validate(const EvaluatorWeights& w);
void validate(const AnnealingCostModel& c);
void validate(const GeneticOptions& o);
void validate(const AnnealingOptions& o);
void validate(const ParetoOptions& o);
void validate(const RouteObjectives& o);
void validate(const RoutingOptions& o);

} // namespace reliefroute::core
