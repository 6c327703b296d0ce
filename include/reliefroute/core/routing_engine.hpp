/*
  DynamicRoutingEngine — owns the authoritative road network, the active
  routes and the route cache.

  Every mutation (network construction, condition/traffic updates, cache
  writes, route recalculation) runs under one exclusive lock. Path searches
  run on an immutable RoadGraph snapshot taken under a shared lock; results
  are only published if the network version is unchanged, otherwise the
  search is repeated under the exclusive lock.
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "reliefroute/core/model.hpp"
#include "reliefroute/core/options.hpp"
#include "reliefroute/core/road_graph.hpp"
#include "reliefroute/core/road_network.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

struct DynamicRoute {
  std::string id;
  LocationId origin;
  LocationId destination;
  std::vector<LocationId> waypoints;
  // Copies of the traversed segments as of the last recalculation.
  std::vector<RouteSegment> segments;
  double total_distance {0.0};
  double estimated_time {0.0};  // +inf once a traversed segment is blocked
  int priority {3};
  Timestamp created_at {};
  Timestamp last_updated {};

  [[nodiscard]] bool traverses(const LocationId& from, const LocationId& to) const noexcept;
};

// Result of a weighted-objective query. Not registered as an active route.
struct WeightedRoute {
  std::vector<LocationId> waypoints;
  double total_weight {0.0};
  double estimated_time {0.0};
  double total_distance {0.0};
};

struct RouteStatus {
  std::string route_id;
  bool blocked {false};
  double estimated_time {0.0};
  double total_distance {0.0};
  // Mean condition x traffic multiplier over the route's segments; 1.0 for a
  // route without segments.
  double delay_factor {1.0};
  std::size_t blocked_segments {0};
  Timestamp last_updated {};
  std::vector<LocationId> waypoints;

  [[nodiscard]] std::string_view status() const noexcept { return blocked ? "blocked" : "active"; }
};

struct NetworkStatistics {
  std::size_t total_segments {0};
  std::size_t blocked_segments {0};
  std::size_t passable_segments {0};
  std::size_t locations {0};
  std::size_t active_routes {0};
  std::size_t cached_routes {0};
  // Keyed by tag name; every tag is present.
  std::map<std::string, std::size_t> traffic_distribution;
  std::map<std::string, std::size_t> condition_distribution;
};

struct ConditionChange {
  Timestamp at;
  RoadCondition condition;
};

struct TrafficChange {
  Timestamp at;
  TrafficLevel traffic;
};

class DynamicRoutingEngine {
public:
  // Throws ValueError on invalid options. An empty clock means Clock::now.
  explicit DynamicRoutingEngine(RoutingOptions options = {}, ClockFn clock = {});

  DynamicRoutingEngine(const DynamicRoutingEngine&) = delete;
  DynamicRoutingEngine& operator=(const DynamicRoutingEngine&) = delete;

  [[nodiscard]] const RoutingOptions& options() const noexcept { return options_; }

  // Add locations, then one segment per connection. All-or-nothing: on
  // ValueError / NotFoundError the engine is left unchanged.
  void initialize_network(std::span<const Location> locations, std::span<const Connection> connections);
  void add_location(Location location);
  // Create or overwrite a segment. Clears the route cache.
  void add_segment(const LocationId& from, const LocationId& to, double distance, double base_time);

  // Best route by effective time, or nullopt when either endpoint is unknown,
  // avoided, or no path exists. Priority >= astar_min_priority uses A*.
  // Queries without avoided nodes read and fill the (origin, destination)
  // cache. Every returned route is registered as active; a cache hit at the
  // same priority returns the route already registered for that entry.
  [[nodiscard]] std::optional<DynamicRoute> find_optimal_route(const LocationId& origin,
                                                               const LocationId& destination,
                                                               int priority = 3,
                                                               std::span<const LocationId> avoid_nodes = {});

  // Up to count pairwise edge-disjoint routes, cheapest first. Registered as
  // active routes with priority 3; not cached.
  [[nodiscard]] std::vector<DynamicRoute> find_alternative_routes(const LocationId& origin,
                                                                  const LocationId& destination,
                                                                  int count = 3);

  // Cheapest route under the combined time / distance / condition weights,
  // searched on the current network without touching the cache. nullopt when
  // either endpoint is unknown or no path exists; ValueError on negative or
  // non-finite weights.
  [[nodiscard]] std::optional<WeightedRoute> find_weighted_route(const LocationId& origin,
                                                                 const LocationId& destination,
                                                                 const RouteObjectives& objectives = {}) const;

  // Serialized update path. Returns false, leaving every piece of state
  // unchanged, when the segment does not exist. Otherwise records history,
  // refreshes the graph, drops cached routes through the segment and
  // recalculates active routes that traverse it.
  [[nodiscard]] bool update_condition(const LocationId& from, const LocationId& to, RoadCondition condition);
  [[nodiscard]] bool update_traffic(const LocationId& from, const LocationId& to, TrafficLevel traffic);

  [[nodiscard]] std::optional<RouteStatus> get_route_status(const std::string& route_id) const;
  [[nodiscard]] std::optional<DynamicRoute> get_route(const std::string& route_id) const;
  [[nodiscard]] NetworkStatistics get_network_statistics() const;
  [[nodiscard]] std::optional<RouteSegment> segment(const LocationId& from, const LocationId& to) const;

  // Oldest first, at most history_limit entries.
  [[nodiscard]] std::vector<ConditionChange> condition_history(const LocationId& from, const LocationId& to) const;
  [[nodiscard]] std::vector<TrafficChange> traffic_history(const LocationId& from, const LocationId& to) const;

  // Re-roll traffic on up to 3 random segments. Returns the number updated.
  std::size_t simulate_traffic_conditions(RandomEngine& rng);
  // Degrade up to 2 random segments: POOR or DAMAGED with probability 0.7,
  // otherwise BLOCKED. Returns the number updated.
  std::size_t simulate_road_incidents(RandomEngine& rng);

  // Drop expired cache entries; returns how many were removed.
  std::size_t sweep_expired_cache();
  // Retire an active route. False if the id is unknown.
  bool remove_route(const std::string& route_id);

  // Current graph snapshot, safe to hand to optimizers.
  [[nodiscard]] std::shared_ptr<const RoadGraph> snapshot() const;

private:
  struct CacheEntry {
    std::vector<LocationId> waypoints;
    Timestamp expires_at;
    // Active route last served from this entry; reused by later hits of the
    // same priority while it is still registered.
    std::string route_id;
  };

  // The helpers below expect the exclusive lock to be held.
  void publish_graph();
  void on_segment_changed(const SegmentKey& key, Timestamp now);
  void recalculate(DynamicRoute& route, Timestamp now) const;
  DynamicRoute& materialize(const std::vector<LocationId>& waypoints, int priority,
                            const std::string& id_tag, Timestamp now);
  std::string next_route_id(const LocationId& origin, const LocationId& destination,
                            const std::string& tag);

  [[nodiscard]] std::vector<SegmentKey> sample_segments(std::size_t k, RandomEngine& rng) const;

  RoutingOptions options_;
  ClockFn clock_;

  mutable std::shared_mutex mutex_;
  RoadNetwork network_;
  std::shared_ptr<const RoadGraph> graph_;
  std::uint64_t version_ {0};
  std::uint64_t route_seq_ {0};
  std::map<std::string, DynamicRoute> routes_;
  std::unordered_map<SegmentKey, CacheEntry, SegmentKeyHash> cache_;
  std::unordered_map<SegmentKey, std::deque<ConditionChange>, SegmentKeyHash> condition_history_;
  std::unordered_map<SegmentKey, std::deque<TrafficChange>, SegmentKeyHash> traffic_history_;
};

} // namespace reliefroute::core
