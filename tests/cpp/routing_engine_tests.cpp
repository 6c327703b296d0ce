#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <memory>
#include <set>
#include "reliefroute/core/error.hpp"
#include "reliefroute/core/routing_engine.hpp"
#include "reliefroute/core/shortest_paths.hpp"
#include "test_utils.hpp"

using namespace reliefroute::core;
using namespace reliefroute::core::test;
using namespace std::chrono_literals;

namespace {
using Path = std::vector<LocationId>;
}

TEST(RoutingEngine, FindsCheapestRouteAndRegistersIt) {
  auto engine = make_abc_engine();
  auto r = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->waypoints, (Path{"A", "B", "C"}));
  EXPECT_DOUBLE_EQ(r->estimated_time, 2.0);
  EXPECT_DOUBLE_EQ(r->total_distance, 2.0);
  EXPECT_EQ(r->segments.size(), 2u);
  EXPECT_EQ(r->priority, 3);
  EXPECT_EQ(r->id.rfind("route_A_C_", 0), 0u);
  ASSERT_TRUE(engine->get_route(r->id).has_value());
  EXPECT_EQ(engine->get_network_statistics().active_routes, 1u);
  EXPECT_EQ(engine->get_network_statistics().cached_routes, 1u);
}

TEST(RoutingEngine, DefaultInitialConditionScalesTime) {
  DynamicRoutingEngine engine;
  auto locs = make_locations({"A", "B", "C"});
  auto conns = abc_connections();
  engine.initialize_network(locs, conns);
  auto r = engine.find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(r->estimated_time, 2.4, 1e-12);
}

TEST(RoutingEngine, BlockingRerouteInvalidatesCache) {
  auto engine = make_abc_engine();
  auto first = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(first.has_value());

  ASSERT_TRUE(engine->update_condition("B", "C", RoadCondition::Blocked));
  EXPECT_EQ(engine->get_network_statistics().cached_routes, 0u);

  auto second = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->waypoints, (Path{"A", "C"}));
  EXPECT_DOUBLE_EQ(second->estimated_time, 5.0);
  EXPECT_NE(first->id, second->id);
}

TEST(RoutingEngine, ActiveRouteThroughBlockedSegmentReportsBlocked) {
  auto engine = make_abc_engine();
  auto r = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());

  ASSERT_TRUE(engine->update_condition("B", "C", RoadCondition::Blocked));
  auto st = engine->get_route_status(r->id);
  ASSERT_TRUE(st.has_value());
  EXPECT_TRUE(st->blocked);
  EXPECT_EQ(st->status(), "blocked");
  EXPECT_EQ(st->blocked_segments, 1u);
  EXPECT_TRUE(std::isinf(st->estimated_time));
  EXPECT_TRUE(std::isinf(st->delay_factor));
  EXPECT_EQ(st->waypoints, (Path{"A", "B", "C"}));

  ASSERT_TRUE(engine->update_condition("B", "C", RoadCondition::Excellent));
  st = engine->get_route_status(r->id);
  ASSERT_TRUE(st.has_value());
  EXPECT_FALSE(st->blocked);
  EXPECT_EQ(st->status(), "active");
  EXPECT_DOUBLE_EQ(st->estimated_time, 2.0);
  EXPECT_DOUBLE_EQ(st->delay_factor, 1.0);
}

TEST(RoutingEngine, TrafficUpdateRecalculatesActiveRoutes) {
  auto engine = make_abc_engine();
  auto r = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(engine->update_traffic("A", "B", TrafficLevel::Severe));

  auto updated = engine->get_route(r->id);
  ASSERT_TRUE(updated.has_value());
  EXPECT_DOUBLE_EQ(updated->estimated_time, 2.5 + 1.0);
  EXPECT_EQ(updated->segments[0].traffic, TrafficLevel::Severe);
  auto st = engine->get_route_status(r->id);
  ASSERT_TRUE(st.has_value());
  EXPECT_DOUBLE_EQ(st->delay_factor, (2.5 + 1.0) / 2.0);

  // 3.5 is still cheaper than the direct 5.0.
  auto again = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->waypoints, (Path{"A", "B", "C"}));
}

TEST(RoutingEngine, UnrelatedUpdateLeavesRoutesAlone) {
  ManualClock clock;
  auto engine = make_abc_engine(clock.fn());
  auto r = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());
  clock.advance(1s);
  ASSERT_TRUE(engine->update_condition("A", "C", RoadCondition::Poor));
  EXPECT_EQ(engine->get_route(r->id)->last_updated, r->last_updated);
  EXPECT_EQ(engine->get_network_statistics().cached_routes, 1u);
}

TEST(RoutingEngine, UnknownSegmentUpdateIsRejected) {
  auto engine = make_abc_engine();
  EXPECT_FALSE(engine->update_condition("C", "A", RoadCondition::Blocked));
  EXPECT_FALSE(engine->update_traffic("X", "Y", TrafficLevel::Heavy));
  EXPECT_TRUE(engine->condition_history("C", "A").empty());
  EXPECT_TRUE(engine->traffic_history("X", "Y").empty());
  EXPECT_FALSE(engine->segment("C", "A").has_value());
}

TEST(RoutingEngine, HistoryIsOrderedAndBounded) {
  RoutingOptions opts;
  opts.history_limit = 3;
  ManualClock clock;
  DynamicRoutingEngine engine(opts, clock.fn());
  auto locs = make_locations({"A", "B", "C"});
  auto conns = abc_connections();
  engine.initialize_network(locs, conns);

  const RoadCondition seq[] = {RoadCondition::Fair, RoadCondition::Poor, RoadCondition::Damaged,
                               RoadCondition::Blocked, RoadCondition::Good};
  for (auto c : seq) {
    clock.advance(1s);
    ASSERT_TRUE(engine.update_condition("A", "B", c));
  }
  auto h = engine.condition_history("A", "B");
  ASSERT_EQ(h.size(), 3u);
  EXPECT_EQ(h[0].condition, RoadCondition::Damaged);
  EXPECT_EQ(h[1].condition, RoadCondition::Blocked);
  EXPECT_EQ(h[2].condition, RoadCondition::Good);
  EXPECT_LT(h[0].at, h[2].at);
  EXPECT_EQ(engine.segment("A", "B")->condition, RoadCondition::Good);
  EXPECT_EQ(engine.segment("A", "B")->last_updated, clock.now);

  ASSERT_TRUE(engine.update_traffic("A", "B", TrafficLevel::Heavy));
  auto th = engine.traffic_history("A", "B");
  ASSERT_EQ(th.size(), 1u);
  EXPECT_EQ(th[0].traffic, TrafficLevel::Heavy);
}

TEST(RoutingEngine, CacheEntriesExpireAfterTtl) {
  RoutingOptions opts;
  opts.cache_ttl = 10s;
  opts.initial_condition = RoadCondition::Excellent;
  ManualClock clock;
  DynamicRoutingEngine engine(opts, clock.fn());
  auto locs = make_locations({"A", "B", "C"});
  auto conns = abc_connections();
  engine.initialize_network(locs, conns);

  auto first = engine.find_optimal_route("A", "C");
  ASSERT_TRUE(first.has_value());
  clock.advance(5s);
  auto cached = engine.find_optimal_route("A", "C");
  ASSERT_TRUE(cached.has_value());
  EXPECT_EQ(cached->waypoints, first->waypoints);
  EXPECT_EQ(engine.sweep_expired_cache(), 0u);

  clock.advance(5s);
  EXPECT_EQ(engine.sweep_expired_cache(), 1u);
  EXPECT_EQ(engine.get_network_statistics().cached_routes, 0u);

  auto fresh = engine.find_optimal_route("A", "C");
  ASSERT_TRUE(fresh.has_value());
  EXPECT_EQ(fresh->waypoints, first->waypoints);
  EXPECT_EQ(engine.get_network_statistics().cached_routes, 1u);
}

TEST(RoutingEngine, AddSegmentClearsCache) {
  auto engine = make_abc_engine();
  ASSERT_TRUE(engine->find_optimal_route("A", "C").has_value());
  engine->add_location(make_location("D", 0.0, 0.005));
  engine->add_segment("A", "D", 0.1, 0.1);
  engine->add_segment("D", "C", 0.1, 0.1);
  EXPECT_EQ(engine->get_network_statistics().cached_routes, 0u);
  auto r = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->waypoints, (Path{"A", "D", "C"}));
}

TEST(RoutingEngine, AvoidedNodesBypassCache) {
  auto engine = make_abc_engine();
  ASSERT_TRUE(engine->find_optimal_route("A", "C").has_value());
  const std::vector<LocationId> avoid{"B"};
  auto r = engine->find_optimal_route("A", "C", 3, avoid);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->waypoints, (Path{"A", "C"}));
  // The cached entry still holds the unrestricted route.
  auto plain = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->waypoints, (Path{"A", "B", "C"}));

  const std::vector<LocationId> avoid_dst{"C"};
  EXPECT_FALSE(engine->find_optimal_route("A", "C", 3, avoid_dst).has_value());
}

TEST(RoutingEngine, HighPriorityUsesAStarWithSameResult) {
  auto engine = make_abc_engine();
  auto r = engine->find_optimal_route("A", "C", 5);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->waypoints, (Path{"A", "B", "C"}));
  EXPECT_EQ(r->priority, 5);
}

TEST(RoutingEngine, PriorityOutOfRangeThrows) {
  auto engine = make_abc_engine();
  EXPECT_THROW((void)engine->find_optimal_route("A", "C", 0), ValueError);
  EXPECT_THROW((void)engine->find_optimal_route("A", "C", 6), ValueError);
}

TEST(RoutingEngine, UnknownOrUnreachableEndpoints) {
  auto engine = make_abc_engine();
  EXPECT_FALSE(engine->find_optimal_route("A", "Z").has_value());
  EXPECT_FALSE(engine->find_optimal_route("C", "A").has_value());
  EXPECT_EQ(engine->get_network_statistics().active_routes, 0u);
}

TEST(RoutingEngine, SameOriginAndDestination) {
  auto engine = make_abc_engine();
  auto r = engine->find_optimal_route("B", "B");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->waypoints, (Path{"B"}));
  EXPECT_DOUBLE_EQ(r->estimated_time, 0.0);
  auto st = engine->get_route_status(r->id);
  ASSERT_TRUE(st.has_value());
  EXPECT_DOUBLE_EQ(st->delay_factor, 1.0);
  EXPECT_TRUE(engine->find_alternative_routes("B", "B").empty());
}

TEST(RoutingEngine, AlternativesAreEdgeDisjoint) {
  auto engine = make_abc_engine();
  auto alts = engine->find_alternative_routes("A", "C", 3);
  ASSERT_EQ(alts.size(), 2u);
  EXPECT_EQ(alts[0].waypoints, (Path{"A", "B", "C"}));
  EXPECT_EQ(alts[1].waypoints, (Path{"A", "C"}));
  EXPECT_NE(alts[0].id.find("alt0"), std::string::npos);
  EXPECT_NE(alts[1].id.find("alt1"), std::string::npos);

  std::set<std::pair<LocationId, LocationId>> used;
  for (auto const& r : alts) {
    EXPECT_EQ(r.priority, 3);
    for (std::size_t i = 0; i + 1 < r.waypoints.size(); ++i) {
      EXPECT_TRUE(used.emplace(r.waypoints[i], r.waypoints[i + 1]).second);
    }
  }
  auto stats = engine->get_network_statistics();
  EXPECT_EQ(stats.active_routes, 2u);
  EXPECT_EQ(stats.cached_routes, 0u);

  EXPECT_TRUE(engine->find_alternative_routes("A", "C", 0).empty());
  EXPECT_THROW((void)engine->find_alternative_routes("A", "C", -1), ValueError);
  EXPECT_EQ(engine->find_alternative_routes("A", "C", 1).size(), 1u);
}

TEST(RoutingEngine, NetworkStatisticsCountEveryTag) {
  auto engine = make_abc_engine();
  ASSERT_TRUE(engine->update_condition("A", "C", RoadCondition::Blocked));
  ASSERT_TRUE(engine->update_traffic("A", "B", TrafficLevel::Heavy));
  auto stats = engine->get_network_statistics();
  EXPECT_EQ(stats.total_segments, 3u);
  EXPECT_EQ(stats.blocked_segments, 1u);
  EXPECT_EQ(stats.passable_segments, 2u);
  EXPECT_EQ(stats.locations, 3u);
  EXPECT_EQ(stats.condition_distribution.size(), kNumRoadConditions);
  EXPECT_EQ(stats.traffic_distribution.size(), kNumTrafficLevels);
  EXPECT_EQ(stats.condition_distribution.at("EXCELLENT"), 2u);
  EXPECT_EQ(stats.condition_distribution.at("BLOCKED"), 1u);
  EXPECT_EQ(stats.condition_distribution.at("FAIR"), 0u);
  EXPECT_EQ(stats.traffic_distribution.at("LIGHT"), 2u);
  EXPECT_EQ(stats.traffic_distribution.at("HEAVY"), 1u);
}

TEST(RoutingEngine, SimulationUpdatesBoundedNumberOfSegments) {
  auto engine = make_abc_engine();
  RandomEngine rng(17);
  EXPECT_EQ(engine->simulate_traffic_conditions(rng), 3u);
  EXPECT_EQ(engine->simulate_road_incidents(rng), 2u);

  std::size_t degraded = 0;
  for (auto const& [from, to] : std::vector<std::pair<LocationId, LocationId>>{{"A", "B"}, {"B", "C"}, {"A", "C"}}) {
    auto seg = engine->segment(from, to);
    ASSERT_TRUE(seg.has_value());
    if (seg->condition != RoadCondition::Excellent) {
      ++degraded;
      EXPECT_TRUE(seg->condition == RoadCondition::Poor || seg->condition == RoadCondition::Damaged ||
                  seg->condition == RoadCondition::Blocked);
    }
  }
  EXPECT_EQ(degraded, 2u);

  DynamicRoutingEngine empty;
  EXPECT_EQ(empty.simulate_traffic_conditions(rng), 0u);
  EXPECT_EQ(empty.simulate_road_incidents(rng), 0u);
}

TEST(RoutingEngine, RemoveRoute) {
  auto engine = make_abc_engine();
  auto r = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(engine->remove_route(r->id));
  EXPECT_FALSE(engine->remove_route(r->id));
  EXPECT_FALSE(engine->get_route_status(r->id).has_value());
}

TEST(RoutingEngine, InitializeNetworkIsAllOrNothing) {
  auto engine = make_abc_engine();
  auto locs = make_locations({"D"});
  std::vector<Connection> bad{{"D", "A", 1.0, 1.0}, {"D", "missing", 1.0, 1.0}};
  EXPECT_THROW(engine->initialize_network(locs, bad), NotFoundError);
  auto stats = engine->get_network_statistics();
  EXPECT_EQ(stats.locations, 3u);
  EXPECT_EQ(stats.total_segments, 3u);
  EXPECT_FALSE(engine->segment("D", "A").has_value());
}

TEST(RoutingEngine, ConnectionWithoutTimeUsesDefaultSpeed) {
  RoutingOptions opts;
  opts.initial_condition = RoadCondition::Excellent;
  DynamicRoutingEngine engine(opts);
  auto locs = make_locations({"A", "B"});
  std::vector<Connection> conns{{"A", "B", 100.0, std::nullopt}};
  engine.initialize_network(locs, conns);
  auto seg = engine.segment("A", "B");
  ASSERT_TRUE(seg.has_value());
  EXPECT_DOUBLE_EQ(seg->base_time, 100.0 / kDefaultSpeedKmh);
}

TEST(RoutingEngine, InvalidOptionsFailFast) {
  RoutingOptions opts;
  opts.history_limit = 0;
  EXPECT_THROW((void)DynamicRoutingEngine{opts}, ValueError);
  opts = {};
  opts.initial_condition = RoadCondition::Blocked;
  EXPECT_THROW((void)DynamicRoutingEngine{opts}, ValueError);
}

TEST(RoutingEngine, SnapshotIsImmutableAcrossUpdates) {
  auto engine = make_abc_engine();
  auto before = engine->snapshot();
  ASSERT_TRUE(engine->update_condition("A", "B", RoadCondition::Blocked));
  auto after = engine->snapshot();
  EXPECT_NE(before.get(), after.get());
  EXPECT_EQ(before->num_edges(), 3);
  EXPECT_EQ(after->num_edges(), 2);
}

TEST(RoutingEngine, SnapshotCopyIsIndependentOfEngine) {
  auto engine = make_abc_engine();
  auto copy = std::make_shared<RoadGraph>(*engine->snapshot());
  ASSERT_TRUE(engine->update_condition("A", "C", RoadCondition::Blocked));
  EXPECT_EQ(copy->num_edges(), 3);
  EXPECT_EQ(engine->snapshot()->num_edges(), 2);
  auto p = shortest_path(*copy, 0, 2, PathMetric::Distance);
  ASSERT_TRUE(p.reachable());
  EXPECT_DOUBLE_EQ(p.cost, 2.0);
}

TEST(RoutingEngine, CacheHitReusesRegisteredRoute) {
  auto engine = make_abc_engine();
  auto first = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(first.has_value());
  for (int i = 0; i < 5; ++i) {
    auto again = engine->find_optimal_route("A", "C");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->id, first->id);
  }
  EXPECT_EQ(engine->get_network_statistics().active_routes, 1u);

  // A different priority is a distinct active route over the cached path.
  auto urgent = engine->find_optimal_route("A", "C", 5);
  ASSERT_TRUE(urgent.has_value());
  EXPECT_NE(urgent->id, first->id);
  EXPECT_EQ(urgent->waypoints, first->waypoints);
  EXPECT_EQ(engine->get_network_statistics().active_routes, 2u);

  // Once retired, the next hit registers a fresh route.
  ASSERT_TRUE(engine->remove_route(urgent->id));
  auto urgent_again = engine->find_optimal_route("A", "C", 5);
  ASSERT_TRUE(urgent_again.has_value());
  EXPECT_NE(urgent_again->id, urgent->id);
  auto plain = engine->find_optimal_route("A", "C");
  ASSERT_TRUE(plain.has_value());
  EXPECT_NE(plain->id, first->id);
  EXPECT_EQ(engine->get_network_statistics().active_routes, 3u);
}

TEST(RoutingEngine, WeightedRouteFollowsObjectiveWeights) {
  auto engine = make_abc_engine();
  ASSERT_TRUE(engine->update_traffic("A", "B", TrafficLevel::Severe));

  // Time only: A-B-C costs 2.5 + 1 against 5 for A-C.
  auto by_time = engine->find_weighted_route("A", "C", RouteObjectives{1.0, 0.0, 0.0});
  ASSERT_TRUE(by_time.has_value());
  EXPECT_EQ(by_time->waypoints, (Path{"A", "B", "C"}));
  EXPECT_DOUBLE_EQ(by_time->total_weight, 3.5);
  EXPECT_DOUBLE_EQ(by_time->estimated_time, 3.5);
  EXPECT_DOUBLE_EQ(by_time->total_distance, 2.0);

  // Heavy condition weight: A-B-C = 3.5 + 10 * (2.5 + 1), A-C = 5 + 10 * 1.
  auto by_condition = engine->find_weighted_route("A", "C", RouteObjectives{1.0, 0.0, 10.0});
  ASSERT_TRUE(by_condition.has_value());
  EXPECT_EQ(by_condition->waypoints, (Path{"A", "C"}));
  EXPECT_DOUBLE_EQ(by_condition->total_weight, 15.0);

  // Weighted queries neither register routes nor fill the cache.
  auto stats = engine->get_network_statistics();
  EXPECT_EQ(stats.active_routes, 0u);
  EXPECT_EQ(stats.cached_routes, 0u);
}

TEST(RoutingEngine, WeightedRouteAvoidsBlockedSegmentsAndBadWeights) {
  auto engine = make_abc_engine();
  ASSERT_TRUE(engine->update_condition("A", "C", RoadCondition::Blocked));
  auto r = engine->find_weighted_route("A", "C", RouteObjectives{0.0, 0.0, 1.0});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->waypoints, (Path{"A", "B", "C"}));
  EXPECT_FALSE(engine->find_weighted_route("A", "Z").has_value());
  EXPECT_FALSE(engine->find_weighted_route("C", "A").has_value());
  EXPECT_THROW((void)engine->find_weighted_route("A", "C", RouteObjectives{0.0, -1.0, 0.0}), ValueError);
}
