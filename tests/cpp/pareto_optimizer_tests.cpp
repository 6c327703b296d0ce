#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <set>
#include "reliefroute/core/error.hpp"
#include "reliefroute/core/optimizer.hpp"
#include "reliefroute/core/pareto_optimizer.hpp"
#include "test_utils.hpp"

using namespace reliefroute::core;
using namespace reliefroute::core::test;

TEST(Dominance, StrictInAtLeastOneObjective) {
  EXPECT_TRUE(dominates({1, 1, 1}, {1, 2, 1}));
  EXPECT_FALSE(dominates({1, 1, 1}, {1, 1, 1}));
  EXPECT_FALSE(dominates({0, 2, 1}, {1, 1, 1}));
  EXPECT_FALSE(dominates({2, 2, 2}, {1, 1, 1}));
}

TEST(NonDominatedSort, FrontsPartitionAndRespectDominance) {
  std::vector<Objectives> objs{
      {1, 5, 0}, {2, 2, 0}, {5, 1, 0}, {3, 3, 0}, {6, 6, 0}, {2, 2, 0}, {4, 4, 1}};
  auto fronts = non_dominated_sort(objs);
  ASSERT_FALSE(fronts.empty());

  std::set<std::size_t> seen;
  for (auto const& f : fronts) {
    for (auto i : f) EXPECT_TRUE(seen.insert(i).second) << "index " << i << " repeated";
  }
  EXPECT_EQ(seen.size(), objs.size());

  EXPECT_EQ(fronts[0], (std::vector<std::size_t>{0, 1, 2, 5}));
  for (auto i : fronts[0]) {
    for (std::size_t j = 0; j < objs.size(); ++j) EXPECT_FALSE(dominates(objs[j], objs[i]));
  }
  for (std::size_t f = 1; f < fronts.size(); ++f) {
    for (auto i : fronts[f]) {
      bool dominated = false;
      for (auto j : fronts[f - 1]) dominated = dominated || dominates(objs[j], objs[i]);
      EXPECT_TRUE(dominated) << "front " << f << " index " << i;
    }
  }
}

TEST(NonDominatedSort, EmptyInput) {
  EXPECT_TRUE(non_dominated_sort(std::vector<Objectives>{}).empty());
}

TEST(CrowdingDistance, BoundariesInfiniteInteriorNormalized) {
  constexpr double inf = std::numeric_limits<double>::infinity();
  std::vector<Objectives> front{{0, 4, 0}, {1, 3, 0}, {2, 1, 0}, {4, 0, 0}};
  auto cd = crowding_distance(front);
  ASSERT_EQ(cd.size(), 4u);
  EXPECT_EQ(cd[0], inf);
  EXPECT_DOUBLE_EQ(cd[1], 1.25);
  EXPECT_DOUBLE_EQ(cd[2], 1.5);
  EXPECT_EQ(cd[3], inf);
}

TEST(CrowdingDistance, SmallFrontsAreAllBoundary) {
  std::vector<Objectives> two{{0, 1, 2}, {1, 0, 2}};
  for (double d : crowding_distance(two)) EXPECT_TRUE(std::isinf(d));
}

TEST(CrowdingDistance, IdenticalPointsKeepInfiniteBoundaries) {
  std::vector<Objectives> same{{1, -1, -1}, {1, -1, -1}, {1, -1, -1}};
  auto cd = crowding_distance(same);
  ASSERT_EQ(cd.size(), 3u);
  EXPECT_TRUE(std::isinf(cd[0]));
  EXPECT_DOUBLE_EQ(cd[1], 0.0);
  EXPECT_TRUE(std::isinf(cd[2]));
}

TEST(CrowdingDistance, ConstantObjectiveStillMarksBoundaries) {
  // Objective 2 is constant; its boundaries are the first and last members
  // in input order, which here coincide with the objective 0 extremes.
  std::vector<Objectives> front{{0, 2, 7}, {1, 1, 7}, {2, 0, 7}};
  auto cd = crowding_distance(front);
  ASSERT_EQ(cd.size(), 3u);
  EXPECT_TRUE(std::isinf(cd[0]));
  EXPECT_DOUBLE_EQ(cd[1], 2.0);
  EXPECT_TRUE(std::isinf(cd[2]));
}

TEST(ParetoOptimizer, InvalidOptionsFailFast) {
  ParetoOptions o;
  o.population_size = 0;
  EXPECT_THROW((void)ParetoOptimizer{o}, ValueError);
  o = {};
  o.mutation_rate = -0.1;
  EXPECT_THROW((void)ParetoOptimizer{o}, ValueError);
}

TEST(ParetoOptimizer, DominantAssignmentIsTheWholeFront) {
  auto s = make_two_center_scenario();
  ProblemInstance p(s.centers, s.zones, s.graph);
  RandomEngine rng(8);
  auto out = ParetoOptimizer({}).search(p, rng);
  ASSERT_EQ(out.front.size(), 1u);
  EXPECT_EQ(out.front[0], (Genome{0, 0, 0}));
  EXPECT_DOUBLE_EQ(out.objectives[0][0], 6.0);
  EXPECT_DOUBLE_EQ(out.objectives[0][1], -9.0);
}

TEST(ParetoOptimizer, FrontIsMutuallyNonDominatedAndDistinct) {
  auto p = make_grid_problem(4, 10);
  ParetoOptions o;
  o.population_size = 30;
  o.generations = 25;
  RandomEngine rng(21);
  auto out = ParetoOptimizer(o).search(p, rng);
  ASSERT_FALSE(out.front.empty());
  ASSERT_EQ(out.front.size(), out.objectives.size());
  std::set<Genome> distinct(out.front.begin(), out.front.end());
  EXPECT_EQ(distinct.size(), out.front.size());
  for (std::size_t i = 0; i < out.objectives.size(); ++i) {
    for (std::size_t j = 0; j < out.objectives.size(); ++j) {
      EXPECT_FALSE(dominates(out.objectives[i], out.objectives[j])) << i << " vs " << j;
    }
  }
}

TEST(ParetoOptimizer, SolutionsReportNegatedMaximizedObjectives) {
  auto s = make_two_center_scenario();
  ProblemInstance p(s.centers, s.zones, s.graph);
  RandomEngine rng(8);
  auto sols = ParetoOptimizer({}).optimize(p, rng);
  ASSERT_EQ(sols.size(), 1u);
  EXPECT_DOUBLE_EQ(sols[0].total_cost, 6.0);
  EXPECT_DOUBLE_EQ(sols[0].coverage_score, 9.0);
  EXPECT_NEAR(sols[0].time_efficiency, 1.0 / 2 + 1.0 / 3 + 1.0 / 4, 1e-12);
  EXPECT_EQ(sols[0].assignment.at("z3"), "c_near");
}

TEST(OptimizerEntryPoints, AllStrategiesProduceCompleteAssignments) {
  auto s = make_water_scenario();
  RandomEngine rng(5);

  GeneticOptions ga;
  ga.population_size = 10;
  ga.generations = 5;
  auto g = optimize_allocation(s.centers, s.zones, s.graph, ga, rng);
  EXPECT_EQ(g.assignment.size(), 2u);
  EXPECT_EQ(g.allocated("c1", "z_hi", "water"), 60);
  EXPECT_EQ(g.allocated("c1", "z_lo", "water"), 40);

  auto a = optimize_allocation(s.centers, s.zones, s.graph, AnnealingOptions{}, rng);
  EXPECT_EQ(a.assignment.size(), 2u);
  EXPECT_EQ(a.routes.size(), 2u);

  ParetoOptions po;
  po.population_size = 10;
  po.generations = 5;
  auto front = optimize_pareto_front(s.centers, s.zones, s.graph, po, rng);
  ASSERT_EQ(front.size(), 1u);
  EXPECT_EQ(front[0].assignment.at("z_hi"), "c1");
}
