#include "reliefroute/core/options.hpp"

#include <cmath>

#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

namespace {
bool finite_non_negative(double v) { return std::isfinite(v) && v >= 0.0; }
bool probability(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }
} // namespace

void validate(const EvaluatorWeights& w) {
  if (!std::isfinite(w.coverage) || !std::isfinite(w.efficiency) || !std::isfinite(w.distance)) {
    throw ValueError("evaluator weights must be finite");
  }
  if (!finite_non_negative(w.unreachable_penalty)) {
    throw ValueError("unreachable_penalty must be finite and >= 0");
  }
}

void validate(const AnnealingCostModel& c) {
  if (!finite_non_negative(c.unreachable_penalty)) {
    throw ValueError("unreachable_penalty must be finite and >= 0");
  }
}

void validate(const GeneticOptions& o) {
  if (o.population_size <= 0) throw ValueError("population_size must be > 0");
  if (o.generations <= 0) throw ValueError("generations must be > 0");
  if (!probability(o.mutation_rate)) throw ValueError("mutation_rate must be in [0, 1]");
  if (!probability(o.elite_fraction)) throw ValueError("elite_fraction must be in [0, 1]");
  if (o.tournament_size <= 0) throw ValueError("tournament_size must be > 0");
  validate(o.weights);
}

void validate(const AnnealingOptions& o) {
  if (!std::isfinite(o.initial_temperature) || o.initial_temperature <= 0.0) {
    throw ValueError("initial_temperature must be finite and > 0");
  }
  if (!std::isfinite(o.min_temperature) || o.min_temperature <= 0.0) {
    throw ValueError("min_temperature must be finite and > 0");
  }
  if (!(o.cooling_rate > 0.0 && o.cooling_rate < 1.0)) {
    throw ValueError("cooling_rate must be in (0, 1)");
  }
  validate(o.cost);
}

void validate(const ParetoOptions& o) {
  if (o.population_size <= 0) throw ValueError("population_size must be > 0");
  if (o.generations <= 0) throw ValueError("generations must be > 0");
  if (!probability(o.mutation_rate)) throw ValueError("mutation_rate must be in [0, 1]");
  if (o.tournament_size <= 0) throw ValueError("tournament_size must be > 0");
  if (!finite_non_negative(o.unreachable_penalty)) {
    throw ValueError("unreachable_penalty must be finite and >= 0");
  }
}

void validate(const RouteObjectives& o) {
  if (!finite_non_negative(o.time) || !finite_non_negative(o.distance) || !finite_non_negative(o.condition)) {
    throw ValueError("route objective weights must be finite and >= 0");
  }
}

void validate(const RoutingOptions& o) {
  if (o.cache_ttl.count() < 0) throw ValueError("cache_ttl must be >= 0");
  if (o.history_limit == 0) throw ValueError("history_limit must be > 0");
  if (!std::isfinite(o.default_speed_kmh) || o.default_speed_kmh <= 0.0) {
    throw ValueError("default_speed_kmh must be finite and > 0");
  }
  if (is_blocked(o.initial_condition)) throw ValueError("initial_condition must be passable");
}

} // namespace reliefroute::core
