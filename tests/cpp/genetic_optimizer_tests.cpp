#include <gtest/gtest.h>
#include "reliefroute/core/error.hpp"
#include "reliefroute/core/genetic_optimizer.hpp"
#include "test_utils.hpp"

using namespace reliefroute::core;
using namespace reliefroute::core::test;

TEST(GeneticOptimizer, InvalidOptionsFailFast) {
  GeneticOptions o;
  o.population_size = 0;
  EXPECT_THROW((void)GeneticOptimizer{o}, ValueError);
  o = {};
  o.generations = 0;
  EXPECT_THROW((void)make_genetic_optimizer(o), ValueError);
  o = {};
  o.mutation_rate = 1.5;
  EXPECT_THROW((void)GeneticOptimizer{o}, ValueError);
  o = {};
  o.tournament_size = 0;
  EXPECT_THROW((void)GeneticOptimizer{o}, ValueError);
}

TEST(GeneticOptimizer, BestNeverWorseThanInitialPopulation) {
  auto p = make_grid_problem(4, 12);
  GeneticOptions o;
  o.population_size = 20;
  o.generations = 30;
  GeneticOptimizer ga(o);
  RandomEngine rng(7);
  auto out = ga.search(p, rng);
  ASSERT_EQ(out.trace.size(), 30u);
  EXPECT_GE(out.best_score, out.initial_score);
  for (std::size_t i = 1; i < out.trace.size(); ++i) EXPECT_GE(out.trace[i], out.trace[i - 1]);
  EXPECT_DOUBLE_EQ(out.trace.back(), out.best_score);
  EXPECT_DOUBLE_EQ(Evaluator(p, o.weights).fitness(out.best), out.best_score);
}

TEST(GeneticOptimizer, SeededRunsAreReproducible) {
  auto p = make_grid_problem(3, 8);
  GeneticOptions o;
  o.population_size = 16;
  o.generations = 10;
  GeneticOptimizer ga(o);
  RandomEngine a(42), b(42);
  auto ra = ga.search(p, a);
  auto rb = ga.search(p, b);
  EXPECT_EQ(ra.best, rb.best);
  EXPECT_EQ(ra.trace, rb.trace);
}

TEST(GeneticOptimizer, FindsNearestFullyStockedCenter) {
  auto s = make_two_center_scenario();
  ProblemInstance p(s.centers, s.zones, s.graph);
  GeneticOptions o;
  o.population_size = 60;
  o.generations = 20;
  RandomEngine rng(3);
  auto sol = GeneticOptimizer(o).optimize(p, rng);
  for (auto const& [zone, center] : sol.assignment) EXPECT_EQ(center, "c_near") << zone;
  EXPECT_DOUBLE_EQ(sol.total_cost, 6.0);
  EXPECT_NEAR(sol.coverage_score, 1.8, 1e-12);
  EXPECT_NEAR(sol.time_efficiency, 1.0 / (1.0 + 6.0 / 3.0), 1e-12);
  EXPECT_EQ(sol.routes.size(), 3u);
}

TEST(GeneticOptimizer, CrossoverCopiesEachZoneFromAParent) {
  RandomEngine rng(1);
  Genome a{0, 0, 0, 0, 0, 0}, b{1, 1, 1, 1, 1, 1};
  for (int i = 0; i < 20; ++i) {
    auto child = GeneticOptimizer::crossover(a, b, rng);
    ASSERT_EQ(child.size(), a.size());
    for (auto g : child) EXPECT_TRUE(g == 0 || g == 1);
  }
}

TEST(GeneticOptimizer, MutationDrawsFromCentersUsedByPopulation) {
  RandomEngine rng(5);
  std::vector<Genome> population{{3, 4}, {3, 5}};
  for (int i = 0; i < 50; ++i) {
    Genome child{0, 0};
    GeneticOptimizer::mutate(child, population, rng);
    EXPECT_TRUE(child[0] == 0 || child[0] == 3);
    EXPECT_TRUE(child[1] == 0 || child[1] == 4 || child[1] == 5);
    EXPECT_TRUE(child[0] != 0 || child[1] != 0);
  }
}

TEST(GeneticOptimizer, TournamentOverWholePopulationPicksFittest) {
  GeneticOptions o;
  o.tournament_size = 5;
  GeneticOptimizer ga(o);
  RandomEngine rng(9);
  std::vector<double> fitness{0.1, 0.7, -3.0, 0.2, 0.5};
  EXPECT_EQ(ga.tournament(fitness, rng), 1u);
}

TEST(GeneticOptimizer, NoZonesYieldsEmptySolution) {
  auto s = make_water_scenario();
  ProblemInstance p(s.centers, {}, s.graph);
  RandomEngine rng(0);
  auto sol = make_genetic_optimizer({})->optimize(p, rng);
  EXPECT_TRUE(sol.assignment.empty());
  EXPECT_DOUBLE_EQ(sol.time_efficiency, 1.0);
}
