#include <gtest/gtest.h>
#include "reliefroute/core/annealing_optimizer.hpp"
#include "reliefroute/core/error.hpp"
#include "test_utils.hpp"

using namespace reliefroute::core;
using namespace reliefroute::core::test;

TEST(AnnealingOptimizer, InvalidOptionsFailFast) {
  AnnealingOptions o;
  o.cooling_rate = 1.0;
  EXPECT_THROW((void)AnnealingOptimizer{o}, ValueError);
  o.cooling_rate = 0.0;
  EXPECT_THROW((void)AnnealingOptimizer{o}, ValueError);
  o = {};
  o.min_temperature = 0.0;
  EXPECT_THROW((void)make_annealing_optimizer(o), ValueError);
  o = {};
  o.initial_temperature = -5.0;
  EXPECT_THROW((void)AnnealingOptimizer{o}, ValueError);
}

TEST(AnnealingOptimizer, BestNeverWorseThanInitial) {
  auto p = make_grid_problem(4, 12);
  AnnealingOptimizer sa({});
  for (std::uint64_t seed : {1u, 2u, 3u}) {
    RandomEngine rng(seed);
    auto out = sa.search(p, rng);
    EXPECT_LE(out.best_score, out.initial_score);
    for (std::size_t i = 1; i < out.trace.size(); ++i) EXPECT_LE(out.trace[i], out.trace[i - 1]);
    EXPECT_NEAR(Evaluator(p).annealing_cost(out.best, {}), out.best_score, 1e-9);
  }
}

TEST(AnnealingOptimizer, GeometricCoolingSetsIterationCount) {
  auto p = make_grid_problem(2, 4);
  AnnealingOptions o;  // 1000 * 0.95^n > 1 for n = 0..134
  RandomEngine rng(11);
  EXPECT_EQ(AnnealingOptimizer(o).search(p, rng).trace.size(), 135u);
}

TEST(AnnealingOptimizer, SeededRunsAreReproducible) {
  auto p = make_grid_problem(3, 8);
  AnnealingOptimizer sa({});
  RandomEngine a(99), b(99);
  EXPECT_EQ(sa.search(p, a).best, sa.search(p, b).best);
}

TEST(AnnealingOptimizer, FindsNearestFullyStockedCenter) {
  auto s = make_two_center_scenario();
  ProblemInstance p(s.centers, s.zones, s.graph);
  AnnealingOptions o;
  o.cooling_rate = 0.99;
  RandomEngine rng(4);
  auto sol = AnnealingOptimizer(o).optimize(p, rng);
  for (auto const& [zone, center] : sol.assignment) EXPECT_EQ(center, "c_near") << zone;
  EXPECT_NEAR(sol.total_cost, 4.4, 1e-12);
  EXPECT_NEAR(sol.coverage_score, 1.8, 1e-12);
}

TEST(AnnealingOptimizer, AcceptanceRule) {
  RandomEngine rng(0);
  EXPECT_TRUE(AnnealingOptimizer::accept(10.0, 9.0, 1e-9, rng));
  EXPECT_FALSE(AnnealingOptimizer::accept(10.0, 11.0, 1e-9, rng));
  int accepted = 0;
  for (int i = 0; i < 1000; ++i) accepted += AnnealingOptimizer::accept(10.0, 11.0, 1e9, rng) ? 1 : 0;
  EXPECT_GT(accepted, 990);
}

TEST(AnnealingOptimizer, NeighborChangesAtMostTwoZones) {
  RandomEngine rng(2);
  Genome base(10, 0);
  for (int i = 0; i < 50; ++i) {
    auto n = AnnealingOptimizer::neighbor(base, 4, rng);
    int changed = 0;
    for (std::size_t z = 0; z < n.size(); ++z) {
      EXPECT_LT(n[z], 4u);
      changed += n[z] != base[z] ? 1 : 0;
    }
    EXPECT_LE(changed, 2);
  }
}

TEST(AnnealingOptimizer, NoZonesSkipsLoop) {
  auto s = make_water_scenario();
  ProblemInstance p(s.centers, {}, s.graph);
  RandomEngine rng(0);
  auto out = AnnealingOptimizer({}).search(p, rng);
  EXPECT_TRUE(out.best.empty());
  EXPECT_TRUE(out.trace.empty());
  EXPECT_DOUBLE_EQ(out.best_score, 0.0);
}
