/*
  DynamicRoutingEngine — cached route queries over a mutable road network.

  Queries: cache lookup and route registration under the exclusive lock,
  path search on a snapshot outside it. Updates: segment table, history,
  graph snapshot, cache invalidation and active-route recalculation in one
  critical section.
*/
#include "reliefroute/core/routing_engine.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <numeric>
#include <utility>

#include "reliefroute/core/constants.hpp"
#include "reliefroute/core/error.hpp"
#include "reliefroute/core/shortest_paths.hpp"

namespace reliefroute::core {

namespace {

using Waypoints = std::vector<LocationId>;

bool uses_segment(const Waypoints& path, const LocationId& from, const LocationId& to) noexcept {
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    if (path[i] == from && path[i + 1] == to) return true;
  }
  return false;
}

Waypoints to_waypoints(const RoadGraph& g, const PathResult& p) {
  Waypoints out;
  out.reserve(p.nodes.size());
  for (auto v : p.nodes) out.push_back(g.node_id(v));
  return out;
}

std::optional<Waypoints> compute_route(const RoadGraph& g, const LocationId& origin,
                                       const LocationId& destination, bool use_astar,
                                       std::span<const LocationId> avoid_nodes) {
  auto s = g.node_index(origin);
  auto t = g.node_index(destination);
  if (!s || !t) return std::nullopt;

  const auto n = static_cast<std::size_t>(g.num_nodes());
  std::unique_ptr<bool[]> mask;
  std::span<const bool> node_mask;
  if (!avoid_nodes.empty()) {
    mask.reset(new bool[n]);
    std::fill_n(mask.get(), n, true);
    for (auto const& id : avoid_nodes) {
      if (auto v = g.node_index(id)) mask[static_cast<std::size_t>(*v)] = false;
    }
    node_mask = std::span<const bool>(mask.get(), n);
  }
  PathResult p = use_astar ? astar_path(g, *s, *t, node_mask)
                           : shortest_path(g, *s, *t, PathMetric::Time, node_mask);
  if (!p.reachable()) return std::nullopt;
  return to_waypoints(g, p);
}

std::vector<Waypoints> compute_alternatives(const RoadGraph& g, const LocationId& origin,
                                            const LocationId& destination, int count) {
  std::vector<Waypoints> out;
  auto s = g.node_index(origin);
  auto t = g.node_index(destination);
  if (!s || !t) return out;
  for (auto const& p : edge_disjoint_paths(g, *s, *t, count, PathMetric::Time)) {
    // A route needs at least one segment.
    if (p.edges.empty()) continue;
    out.push_back(to_waypoints(g, p));
  }
  return out;
}

void check_priority(int priority) {
  if (priority < kMinPriority || priority > kMaxPriority) {
    throw ValueError("priority must be in [1, 5]");
  }
}

template <class Entry>
void push_bounded(std::deque<Entry>& history, Entry entry, std::size_t limit) {
  history.push_back(std::move(entry));
  while (history.size() > limit) history.pop_front();
}

} // namespace

bool DynamicRoute::traverses(const LocationId& from, const LocationId& to) const noexcept {
  return uses_segment(waypoints, from, to);
}

DynamicRoutingEngine::DynamicRoutingEngine(RoutingOptions options, ClockFn clock)
    : options_(std::move(options)), clock_(std::move(clock)), network_(options_.initial_condition) {
  validate(options_);
  if (!clock_) clock_ = [] { return Clock::now(); };
  publish_graph();
}

void DynamicRoutingEngine::publish_graph() {
  graph_ = std::make_shared<const RoadGraph>(network_.compile());
  ++version_;
}

void DynamicRoutingEngine::recalculate(DynamicRoute& route, Timestamp now) const {
  route.total_distance = 0.0;
  route.estimated_time = 0.0;
  for (auto& seg : route.segments) {
    if (const auto* current = network_.segment(seg.from, seg.to)) seg = *current;
    route.total_distance += seg.base_distance;
    route.estimated_time += seg.effective_time();
  }
  route.last_updated = now;
}

std::string DynamicRoutingEngine::next_route_id(const LocationId& origin, const LocationId& destination,
                                                const std::string& tag) {
  std::string id = "route_" + origin + "_" + destination + "_";
  if (!tag.empty()) id += tag + "_";
  return id + std::to_string(++route_seq_);
}

DynamicRoute& DynamicRoutingEngine::materialize(const std::vector<LocationId>& waypoints, int priority,
                                                const std::string& id_tag, Timestamp now) {
  DynamicRoute route;
  route.origin = waypoints.front();
  route.destination = waypoints.back();
  route.id = next_route_id(route.origin, route.destination, id_tag);
  route.waypoints = waypoints;
  route.priority = priority;
  route.created_at = now;
  route.segments.reserve(waypoints.size() - 1);
  for (std::size_t i = 0; i + 1 < waypoints.size(); ++i) {
    const auto* seg = network_.segment(waypoints[i], waypoints[i + 1]);
    if (seg == nullptr) {
      throw NotFoundError("no segment '" + waypoints[i] + "' -> '" + waypoints[i + 1] + "'");
    }
    route.segments.push_back(*seg);
  }
  recalculate(route, now);
  std::string id = route.id;
  auto [it, inserted] = routes_.emplace(std::move(id), std::move(route));
  return it->second;
}

void DynamicRoutingEngine::on_segment_changed(const SegmentKey& key, Timestamp now) {
  publish_graph();
  std::erase_if(cache_, [&](const auto& kv) { return uses_segment(kv.second.waypoints, key.from, key.to); });
  for (auto& [id, route] : routes_) {
    if (route.traverses(key.from, key.to)) recalculate(route, now);
  }
}

void DynamicRoutingEngine::initialize_network(std::span<const Location> locations,
                                              std::span<const Connection> connections) {
  std::unique_lock lock(mutex_);
  const auto now = clock_();
  RoadNetwork next = network_;
  for (auto const& loc : locations) next.add_location(loc);
  for (auto const& c : connections) {
    const double time = c.time.value_or(c.distance / options_.default_speed_kmh);
    next.add_segment(c.from, c.to, c.distance, time, now);
  }
  network_ = std::move(next);
  publish_graph();
  cache_.clear();
  for (auto& [id, route] : routes_) recalculate(route, now);
}

void DynamicRoutingEngine::add_location(Location location) {
  std::unique_lock lock(mutex_);
  network_.add_location(std::move(location));
  publish_graph();
}

void DynamicRoutingEngine::add_segment(const LocationId& from, const LocationId& to,
                                       double distance, double base_time) {
  std::unique_lock lock(mutex_);
  const auto now = clock_();
  network_.add_segment(from, to, distance, base_time, now);
  on_segment_changed(SegmentKey{from, to}, now);
  // A new edge can shorten routes that never used it.
  cache_.clear();
}

std::optional<DynamicRoute> DynamicRoutingEngine::find_optimal_route(const LocationId& origin,
                                                                     const LocationId& destination,
                                                                     int priority,
                                                                     std::span<const LocationId> avoid_nodes) {
  check_priority(priority);
  const bool cacheable = avoid_nodes.empty();
  const bool use_astar = priority >= options_.astar_min_priority;
  const SegmentKey key{origin, destination};

  std::shared_ptr<const RoadGraph> graph;
  std::uint64_t version = 0;
  {
    std::unique_lock lock(mutex_);
    const auto now = clock_();
    if (cacheable) {
      auto it = cache_.find(key);
      if (it != cache_.end() && now < it->second.expires_at) {
        auto active = routes_.find(it->second.route_id);
        if (active != routes_.end() && active->second.priority == priority) return active->second;
        DynamicRoute& route = materialize(it->second.waypoints, priority, "", now);
        it->second.route_id = route.id;
        return route;
      }
    }
    graph = graph_;
    version = version_;
  }

  auto waypoints = compute_route(*graph, origin, destination, use_astar, avoid_nodes);

  std::unique_lock lock(mutex_);
  if (version_ != version) {
    waypoints = compute_route(*graph_, origin, destination, use_astar, avoid_nodes);
  }
  if (!waypoints) return std::nullopt;
  const auto now = clock_();
  DynamicRoute& route = materialize(*waypoints, priority, "", now);
  if (cacheable) cache_.insert_or_assign(key, CacheEntry{*waypoints, now + options_.cache_ttl, route.id});
  return route;
}

std::vector<DynamicRoute> DynamicRoutingEngine::find_alternative_routes(const LocationId& origin,
                                                                        const LocationId& destination,
                                                                        int count) {
  if (count < 0) throw ValueError("count must be >= 0");
  std::vector<DynamicRoute> out;
  if (count == 0) return out;

  std::shared_ptr<const RoadGraph> graph;
  std::uint64_t version = 0;
  {
    std::shared_lock lock(mutex_);
    graph = graph_;
    version = version_;
  }
  auto paths = compute_alternatives(*graph, origin, destination, count);

  std::unique_lock lock(mutex_);
  if (version_ != version) paths = compute_alternatives(*graph_, origin, destination, count);
  const auto now = clock_();
  out.reserve(paths.size());
  for (std::size_t i = 0; i < paths.size(); ++i) {
    out.push_back(materialize(paths[i], 3, "alt" + std::to_string(i), now));
  }
  return out;
}

std::optional<WeightedRoute> DynamicRoutingEngine::find_weighted_route(const LocationId& origin,
                                                                       const LocationId& destination,
                                                                       const RouteObjectives& objectives) const {
  validate(objectives);
  std::shared_lock lock(mutex_);
  const RoadGraph& g = *graph_;
  auto s = g.node_index(origin);
  auto t = g.node_index(destination);
  if (!s || !t) return std::nullopt;

  const auto src = g.edge_src_view();
  const auto dst = g.edge_dst_view();
  std::vector<double> factors(src.size(), 1.0);
  for (std::size_t e = 0; e < src.size(); ++e) {
    const auto* seg = network_.segment(g.node_id(src[e]), g.node_id(dst[e]));
    if (seg != nullptr) factors[e] = condition_multiplier(seg->condition) * traffic_multiplier(seg->traffic);
  }
  const auto weights = combined_edge_weights(g, factors, objectives);
  const PathResult p = weighted_shortest_path(g, *s, *t, weights);
  if (!p.reachable()) return std::nullopt;

  WeightedRoute route;
  route.waypoints = to_waypoints(g, p);
  route.total_weight = p.cost;
  const auto time = g.time_view();
  const auto distance = g.distance_view();
  for (auto e : p.edges) {
    route.estimated_time += time[static_cast<std::size_t>(e)];
    route.total_distance += distance[static_cast<std::size_t>(e)];
  }
  return route;
}

bool DynamicRoutingEngine::update_condition(const LocationId& from, const LocationId& to,
                                            RoadCondition condition) {
  std::unique_lock lock(mutex_);
  const auto now = clock_();
  if (!network_.set_condition(from, to, condition, now)) return false;
  SegmentKey key{from, to};
  push_bounded(condition_history_[key], ConditionChange{now, condition}, options_.history_limit);
  on_segment_changed(key, now);
  return true;
}

bool DynamicRoutingEngine::update_traffic(const LocationId& from, const LocationId& to,
                                          TrafficLevel traffic) {
  std::unique_lock lock(mutex_);
  const auto now = clock_();
  if (!network_.set_traffic(from, to, traffic, now)) return false;
  SegmentKey key{from, to};
  push_bounded(traffic_history_[key], TrafficChange{now, traffic}, options_.history_limit);
  on_segment_changed(key, now);
  return true;
}

std::optional<RouteStatus> DynamicRoutingEngine::get_route_status(const std::string& route_id) const {
  std::shared_lock lock(mutex_);
  auto it = routes_.find(route_id);
  if (it == routes_.end()) return std::nullopt;
  const DynamicRoute& route = it->second;

  RouteStatus st;
  st.route_id = route.id;
  st.estimated_time = route.estimated_time;
  st.total_distance = route.total_distance;
  st.last_updated = route.last_updated;
  st.waypoints = route.waypoints;
  double delay = 0.0;
  for (auto const& seg : route.segments) {
    if (!seg.is_passable()) ++st.blocked_segments;
    delay += condition_multiplier(seg.condition) * traffic_multiplier(seg.traffic);
  }
  st.delay_factor = route.segments.empty() ? 1.0 : delay / static_cast<double>(route.segments.size());
  st.blocked = st.blocked_segments > 0;
  return st;
}

std::optional<DynamicRoute> DynamicRoutingEngine::get_route(const std::string& route_id) const {
  std::shared_lock lock(mutex_);
  auto it = routes_.find(route_id);
  if (it == routes_.end()) return std::nullopt;
  return it->second;
}

NetworkStatistics DynamicRoutingEngine::get_network_statistics() const {
  std::shared_lock lock(mutex_);
  NetworkStatistics stats;
  for (auto const& info : kTrafficTable) stats.traffic_distribution[std::string(info.name)] = 0;
  for (auto const& info : kConditionTable) stats.condition_distribution[std::string(info.name)] = 0;
  for (auto const& key : network_.segment_keys()) {
    const auto* seg = network_.segment(key.from, key.to);
    if (seg == nullptr) continue;
    ++stats.total_segments;
    if (seg->is_passable()) ++stats.passable_segments;
    else ++stats.blocked_segments;
    ++stats.traffic_distribution[std::string(to_string(seg->traffic))];
    ++stats.condition_distribution[std::string(to_string(seg->condition))];
  }
  stats.locations = network_.num_locations();
  stats.active_routes = routes_.size();
  stats.cached_routes = cache_.size();
  return stats;
}

std::optional<RouteSegment> DynamicRoutingEngine::segment(const LocationId& from, const LocationId& to) const {
  std::shared_lock lock(mutex_);
  const auto* seg = network_.segment(from, to);
  if (seg == nullptr) return std::nullopt;
  return *seg;
}

std::vector<ConditionChange> DynamicRoutingEngine::condition_history(const LocationId& from,
                                                                     const LocationId& to) const {
  std::shared_lock lock(mutex_);
  auto it = condition_history_.find(SegmentKey{from, to});
  if (it == condition_history_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<TrafficChange> DynamicRoutingEngine::traffic_history(const LocationId& from,
                                                                 const LocationId& to) const {
  std::shared_lock lock(mutex_);
  auto it = traffic_history_.find(SegmentKey{from, to});
  if (it == traffic_history_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<SegmentKey> DynamicRoutingEngine::sample_segments(std::size_t k, RandomEngine& rng) const {
  const auto keys = network_.segment_keys();
  std::vector<SegmentKey> pool(keys.begin(), keys.end());
  k = std::min(k, pool.size());
  for (std::size_t i = 0; i < k; ++i) {
    std::uniform_int_distribution<std::size_t> pick(i, pool.size() - 1);
    std::swap(pool[i], pool[pick(rng)]);
  }
  pool.resize(k);
  return pool;
}

std::size_t DynamicRoutingEngine::simulate_traffic_conditions(RandomEngine& rng) {
  std::vector<SegmentKey> keys;
  {
    std::shared_lock lock(mutex_);
    keys = sample_segments(3, rng);
  }
  std::uniform_int_distribution<std::size_t> level(0, kNumTrafficLevels - 1);
  std::size_t updated = 0;
  for (auto const& key : keys) {
    if (update_traffic(key.from, key.to, static_cast<TrafficLevel>(level(rng)))) ++updated;
  }
  return updated;
}

std::size_t DynamicRoutingEngine::simulate_road_incidents(RandomEngine& rng) {
  std::vector<SegmentKey> keys;
  {
    std::shared_lock lock(mutex_);
    keys = sample_segments(2, rng);
  }
  std::bernoulli_distribution degraded(0.7);
  std::bernoulli_distribution coin(0.5);
  std::size_t updated = 0;
  for (auto const& key : keys) {
    RoadCondition c = RoadCondition::Blocked;
    if (degraded(rng)) c = coin(rng) ? RoadCondition::Poor : RoadCondition::Damaged;
    if (update_condition(key.from, key.to, c)) ++updated;
  }
  return updated;
}

std::size_t DynamicRoutingEngine::sweep_expired_cache() {
  std::unique_lock lock(mutex_);
  const auto now = clock_();
  return std::erase_if(cache_, [&](const auto& kv) { return now >= kv.second.expires_at; });
}

bool DynamicRoutingEngine::remove_route(const std::string& route_id) {
  std::unique_lock lock(mutex_);
  return routes_.erase(route_id) > 0;
}

std::shared_ptr<const RoadGraph> DynamicRoutingEngine::snapshot() const {
  std::shared_lock lock(mutex_);
  return graph_;
}

} // namespace reliefroute::core
