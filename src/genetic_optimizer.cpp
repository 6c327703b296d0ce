/*
  GeneticOptimizer — generational search with elitism, tournament selection,
  uniform crossover and population-bounded mutation.
*/
#include "reliefroute/core/genetic_optimizer.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

namespace reliefroute::core {

GeneticOptimizer::GeneticOptimizer(GeneticOptions options) : options_(std::move(options)) {
  validate(options_);
}

std::size_t GeneticOptimizer::tournament(std::span<const double> fitness, RandomEngine& rng) const {
  const std::size_t n = fitness.size();
  const std::size_t k = std::min<std::size_t>(static_cast<std::size_t>(options_.tournament_size), n);
  // Partial Fisher-Yates: sample k distinct indices.
  std::vector<std::size_t> idx(n);
  std::iota(idx.begin(), idx.end(), 0);
  std::size_t best = n;
  for (std::size_t i = 0; i < k; ++i) {
    std::uniform_int_distribution<std::size_t> pick(i, n - 1);
    std::swap(idx[i], idx[pick(rng)]);
    if (best == n || fitness[idx[i]] > fitness[best]) best = idx[i];
  }
  return best;
}

Genome GeneticOptimizer::crossover(const Genome& a, const Genome& b, RandomEngine& rng) {
  Genome child(a.size());
  std::bernoulli_distribution coin(0.5);
  for (std::size_t z = 0; z < a.size(); ++z) child[z] = coin(rng) ? a[z] : b[z];
  return child;
}

void GeneticOptimizer::mutate(Genome& child, std::span<const Genome> population, RandomEngine& rng) {
  if (child.empty() || population.empty()) return;
  std::uniform_int_distribution<int> count(1, 2);
  std::uniform_int_distribution<std::size_t> zone(0, child.size() - 1);
  const int n = count(rng);
  for (int i = 0; i < n; ++i) {
    const auto z = zone(rng);
    // Only centers already tried for this zone somewhere in the population.
    std::set<std::size_t> seen;
    for (auto const& ind : population) seen.insert(ind[z]);
    std::vector<std::size_t> candidates(seen.begin(), seen.end());
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    child[z] = candidates[pick(rng)];
  }
}

std::vector<Genome> GeneticOptimizer::evolve(const std::vector<Genome>& population,
                                             std::span<const double> fitness,
                                             RandomEngine& rng) const {
  const auto size = static_cast<std::size_t>(options_.population_size);
  std::vector<Genome> next;
  next.reserve(size);

  const auto elite_count = std::min(
      size, static_cast<std::size_t>(options_.elite_fraction * static_cast<double>(size)));
  std::vector<std::size_t> order(population.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) { return fitness[a] > fitness[b]; });
  for (std::size_t i = 0; i < elite_count && i < order.size(); ++i) next.push_back(population[order[i]]);

  std::bernoulli_distribution mutate_now(options_.mutation_rate);
  while (next.size() < size) {
    const auto& p1 = population[tournament(fitness, rng)];
    const auto& p2 = population[tournament(fitness, rng)];
    Genome child = crossover(p1, p2, rng);
    if (mutate_now(rng)) mutate(child, population, rng);
    next.push_back(std::move(child));
  }
  return next;
}

SearchOutcome GeneticOptimizer::search(const ProblemInstance& problem, RandomEngine& rng) const {
  const Evaluator eval(problem, options_.weights);
  std::vector<Genome> population;
  population.reserve(static_cast<std::size_t>(options_.population_size));
  for (int i = 0; i < options_.population_size; ++i) population.push_back(problem.random_genome(rng));

  SearchOutcome out;
  bool have_best = false;
  std::vector<double> fitness(population.size());
  for (int gen = 0; gen < options_.generations; ++gen) {
    for (std::size_t i = 0; i < population.size(); ++i) {
      fitness[i] = eval.fitness(population[i]);
      if (!have_best || fitness[i] > out.best_score) {
        out.best_score = fitness[i];
        out.best = population[i];
        have_best = true;
      }
    }
    if (gen == 0) out.initial_score = *std::max_element(fitness.begin(), fitness.end());
    out.trace.push_back(out.best_score);
    if (gen + 1 < options_.generations) population = evolve(population, fitness, rng);
  }
  return out;
}

AllocationSolution GeneticOptimizer::optimize(const ProblemInstance& problem, RandomEngine& rng) const {
  auto outcome = search(problem, rng);
  const Evaluator eval(problem, options_.weights);
  AllocationSolution sol = make_solution(problem, outcome.best);
  sol.total_cost = eval.route_cost(outcome.best, options_.weights.unreachable_penalty);
  sol.coverage_score = eval.breakdown(outcome.best).coverage;
  const auto routes = static_cast<double>(outcome.best.size());
  sol.time_efficiency = routes > 0 ? 1.0 / (1.0 + sol.total_cost / routes) : 1.0;
  return sol;
}

OptimizerPtr make_genetic_optimizer(const GeneticOptions& options) {
  return std::make_shared<GeneticOptimizer>(options);
}

} // namespace reliefroute::core
