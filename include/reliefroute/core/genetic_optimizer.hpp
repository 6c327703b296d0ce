/* Genetic algorithm over zone->center assignments. */
#pragma once

#include <span>
#include <vector>

#include "reliefroute/core/evaluator.hpp"
#include "reliefroute/core/optimizer.hpp"

namespace reliefroute::core {

// Elitist generational GA. Each generation keeps the top elite_fraction
// unconditionally and fills the rest with tournament-selected parents,
// uniform per-zone crossover and, with probability mutation_rate, a mutation
// that reassigns 1-2 zones to a center some individual of the current
// population already uses for that zone. The result is the best individual
// seen in any generation.
class GeneticOptimizer final : public AllocationOptimizer {
public:
  explicit GeneticOptimizer(GeneticOptions options);

  [[nodiscard]] const GeneticOptions& options() const noexcept { return options_; }

  [[nodiscard]] SearchOutcome search(const ProblemInstance& problem, RandomEngine& rng) const override;
  [[nodiscard]] AllocationSolution optimize(const ProblemInstance& problem, RandomEngine& rng) const override;

  // Index of the fittest of tournament_size distinct random individuals.
  [[nodiscard]] std::size_t tournament(std::span<const double> fitness, RandomEngine& rng) const;
  [[nodiscard]] static Genome crossover(const Genome& a, const Genome& b, RandomEngine& rng);
  static void mutate(Genome& child, std::span<const Genome> population, RandomEngine& rng);

private:
  [[nodiscard]] std::vector<Genome> evolve(const std::vector<Genome>& population,
                                           std::span<const double> fitness,
                                           RandomEngine& rng) const;

  GeneticOptions options_;
};

} // namespace reliefroute::core
