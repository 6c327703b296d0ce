/*
  ParetoOptimizer — dominance, front peeling, crowding distance and the
  (mu + lambda) generational loop.
*/
#include "reliefroute/core/pareto_optimizer.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <numeric>
#include <set>
#include <utility>

namespace reliefroute::core {

namespace {

std::vector<Objectives> evaluate_all(const Evaluator& eval, const std::vector<Genome>& pop, double penalty) {
  std::vector<Objectives> out;
  out.reserve(pop.size());
  for (auto const& g : pop) out.push_back(eval.objectives(g, penalty));
  return out;
}

// Per-index rank and crowding distance over the whole population.
void rank_population(std::span<const Objectives> objs,
                     std::vector<std::size_t>& rank,
                     std::vector<double>& crowding) {
  rank.assign(objs.size(), 0);
  crowding.assign(objs.size(), 0.0);
  auto fronts = non_dominated_sort(objs);
  for (std::size_t f = 0; f < fronts.size(); ++f) {
    std::vector<Objectives> members;
    members.reserve(fronts[f].size());
    for (auto i : fronts[f]) members.push_back(objs[i]);
    auto cd = crowding_distance(members);
    for (std::size_t j = 0; j < fronts[f].size(); ++j) {
      rank[fronts[f][j]] = f;
      crowding[fronts[f][j]] = cd[j];
    }
  }
}

} // namespace

bool dominates(const Objectives& a, const Objectives& b) noexcept {
  bool strictly = false;
  for (std::size_t m = 0; m < a.size(); ++m) {
    if (a[m] > b[m]) return false;
    if (a[m] < b[m]) strictly = true;
  }
  return strictly;
}

std::vector<std::vector<std::size_t>> non_dominated_sort(std::span<const Objectives> objs) {
  const std::size_t n = objs.size();
  std::vector<std::vector<std::size_t>> dominated(n);
  std::vector<std::size_t> count(n, 0);
  std::vector<std::vector<std::size_t>> fronts;
  std::vector<std::size_t> current;
  for (std::size_t p = 0; p < n; ++p) {
    for (std::size_t q = 0; q < n; ++q) {
      if (p == q) continue;
      if (dominates(objs[p], objs[q])) dominated[p].push_back(q);
      else if (dominates(objs[q], objs[p])) ++count[p];
    }
    if (count[p] == 0) current.push_back(p);
  }
  while (!current.empty()) {
    std::vector<std::size_t> next;
    for (auto p : current) {
      for (auto q : dominated[p]) {
        if (--count[q] == 0) next.push_back(q);
      }
    }
    std::sort(next.begin(), next.end());
    fronts.push_back(std::move(current));
    current = std::move(next);
  }
  return fronts;
}

std::vector<double> crowding_distance(std::span<const Objectives> front) {
  constexpr double inf = std::numeric_limits<double>::infinity();
  const std::size_t n = front.size();
  if (n <= 2) return std::vector<double>(n, inf);
  std::vector<double> dist(n, 0.0);
  std::vector<std::size_t> order(n);
  for (std::size_t m = 0; m < std::tuple_size_v<Objectives>; ++m) {
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return front[a][m] < front[b][m]; });
    dist[order.front()] = inf;
    dist[order.back()] = inf;
    const double range = front[order.back()][m] - front[order.front()][m];
    if (!(range > 0.0)) continue;
    for (std::size_t i = 1; i + 1 < n; ++i) {
      dist[order[i]] += (front[order[i + 1]][m] - front[order[i - 1]][m]) / range;
    }
  }
  return dist;
}

ParetoOptimizer::ParetoOptimizer(ParetoOptions options) : options_(std::move(options)) {
  validate(options_);
}

std::size_t ParetoOptimizer::tournament(std::span<const std::size_t> rank,
                                        std::span<const double> crowding,
                                        RandomEngine& rng) const {
  const std::size_t n = rank.size();
  const std::size_t k = std::min<std::size_t>(static_cast<std::size_t>(options_.tournament_size), n);
  std::vector<std::size_t> idx(n);
  std::iota(idx.begin(), idx.end(), 0);
  std::size_t best = n;
  for (std::size_t i = 0; i < k; ++i) {
    std::uniform_int_distribution<std::size_t> pick(i, n - 1);
    std::swap(idx[i], idx[pick(rng)]);
    const auto c = idx[i];
    if (best == n || rank[c] < rank[best] || (rank[c] == rank[best] && crowding[c] > crowding[best])) {
      best = c;
    }
  }
  return best;
}

std::vector<Genome> ParetoOptimizer::offspring(const ProblemInstance& problem,
                                               const std::vector<Genome>& population,
                                               std::span<const Objectives> objs,
                                               RandomEngine& rng) const {
  std::vector<std::size_t> rank;
  std::vector<double> crowding;
  rank_population(objs, rank, crowding);

  std::bernoulli_distribution coin(0.5);
  std::bernoulli_distribution mutation(options_.mutation_rate);
  std::uniform_int_distribution<int> count(1, 2);
  std::vector<Genome> children;
  children.reserve(population.size());
  const std::size_t zones = problem.num_zones();
  while (children.size() < population.size()) {
    const auto& a = population[tournament(rank, crowding, rng)];
    const auto& b = population[tournament(rank, crowding, rng)];
    Genome child(zones);
    for (std::size_t z = 0; z < zones; ++z) child[z] = coin(rng) ? a[z] : b[z];
    if (zones > 0 && mutation(rng)) {
      std::uniform_int_distribution<std::size_t> zone(0, zones - 1);
      std::uniform_int_distribution<std::size_t> center(0, problem.num_centers() - 1);
      const int n = count(rng);
      for (int i = 0; i < n; ++i) {
        const auto z = zone(rng);
        child[z] = center(rng);
      }
    }
    children.push_back(std::move(child));
  }
  return children;
}

ParetoOutcome ParetoOptimizer::search(const ProblemInstance& problem, RandomEngine& rng) const {
  const Evaluator eval(problem);
  const auto size = static_cast<std::size_t>(options_.population_size);
  const double penalty = options_.unreachable_penalty;

  std::vector<Genome> population;
  population.reserve(size);
  for (std::size_t i = 0; i < size; ++i) population.push_back(problem.random_genome(rng));
  auto objs = evaluate_all(eval, population, penalty);

  for (int gen = 0; gen < options_.generations; ++gen) {
    auto children = offspring(problem, population, objs, rng);
    std::vector<Genome> combined = population;
    combined.insert(combined.end(), std::make_move_iterator(children.begin()),
                    std::make_move_iterator(children.end()));
    auto combined_objs = evaluate_all(eval, combined, penalty);

    std::vector<Genome> next;
    std::vector<Objectives> next_objs;
    next.reserve(size);
    next_objs.reserve(size);
    for (auto const& front : non_dominated_sort(combined_objs)) {
      if (next.size() == size) break;
      std::vector<std::size_t> chosen = front;
      if (next.size() + front.size() > size) {
        std::vector<Objectives> members;
        members.reserve(front.size());
        for (auto i : front) members.push_back(combined_objs[i]);
        const auto cd = crowding_distance(members);
        std::vector<std::size_t> order(front.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](std::size_t a, std::size_t b) { return cd[a] > cd[b]; });
        order.resize(size - next.size());
        chosen.clear();
        for (auto j : order) chosen.push_back(front[j]);
      }
      for (auto i : chosen) {
        next.push_back(combined[i]);
        next_objs.push_back(combined_objs[i]);
      }
    }
    population = std::move(next);
    objs = std::move(next_objs);
  }

  ParetoOutcome out;
  const auto fronts = non_dominated_sort(objs);
  if (fronts.empty()) return out;
  std::set<Genome> seen;
  for (auto i : fronts.front()) {
    if (!seen.insert(population[i]).second) continue;
    out.front.push_back(population[i]);
    out.objectives.push_back(objs[i]);
  }
  return out;
}

std::vector<AllocationSolution> ParetoOptimizer::optimize(const ProblemInstance& problem,
                                                          RandomEngine& rng) const {
  const auto outcome = search(problem, rng);
  std::vector<AllocationSolution> solutions;
  solutions.reserve(outcome.front.size());
  for (std::size_t i = 0; i < outcome.front.size(); ++i) {
    AllocationSolution sol = make_solution(problem, outcome.front[i]);
    sol.total_cost = outcome.objectives[i][0];
    sol.coverage_score = -outcome.objectives[i][1];
    sol.time_efficiency = -outcome.objectives[i][2];
    solutions.push_back(std::move(sol));
  }
  return solutions;
}

} // namespace reliefroute::core
