/* Mutable road network: segment records keyed by (from, to) plus a derived graph. */
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "reliefroute/core/model.hpp"
#include "reliefroute/core/road_graph.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

// Directed road segment with mutable condition and traffic multipliers.
struct RouteSegment {
  LocationId from;
  LocationId to;
  double base_distance {0.0};
  double base_time {0.0};
  RoadCondition condition {RoadCondition::Good};
  TrafficLevel traffic {TrafficLevel::Light};
  Timestamp last_updated {};

  // base_time * condition * traffic; +inf when blocked.
  [[nodiscard]] double effective_time() const noexcept;
  [[nodiscard]] bool is_passable() const noexcept { return !is_blocked(condition); }
};

// RoadNetwork is the index-based form of the road graph: a table of segment
// records keyed by ordered location pairs. The graph edge set is derived from
// it: every passable segment is an edge weighted by its effective time, and a
// blocked segment keeps its record but has no edge. compile() materializes the
// edge set as an immutable RoadGraph for path search.
class RoadNetwork {
public:
  // Condition given to every segment created by add_segment.
  explicit RoadNetwork(RoadCondition initial_condition = RoadCondition::Good)
      : initial_condition_(initial_condition) {}

  // Locations are immutable once added; a duplicate id raises ValueError.
  void add_location(Location location);
  [[nodiscard]] bool has_location(const LocationId& id) const noexcept { return index_.count(id) != 0; }
  [[nodiscard]] const Location* find_location(const LocationId& id) const noexcept;
  [[nodiscard]] std::span<const Location> locations() const noexcept { return locations_; }

  // Create or overwrite the (from, to) segment. Both locations must exist
  // (NotFoundError); distance and time must be finite and >= 0 (ValueError).
  // An overwritten segment starts again at the initial condition and LIGHT.
  const RouteSegment& add_segment(const LocationId& from, const LocationId& to,
                                  double distance, double base_time,
                                  Timestamp now = Clock::now());

  // Update a multiplier and the last-update timestamp. Returns false, leaving
  // the network unchanged, when the segment does not exist.
  [[nodiscard]] bool set_condition(const LocationId& from, const LocationId& to,
                                   RoadCondition condition, Timestamp now = Clock::now());
  [[nodiscard]] bool set_traffic(const LocationId& from, const LocationId& to,
                                 TrafficLevel traffic, Timestamp now = Clock::now());

  [[nodiscard]] const RouteSegment* segment(const LocationId& from, const LocationId& to) const noexcept;
  // True iff the segment exists and is passable.
  [[nodiscard]] bool has_edge(const LocationId& from, const LocationId& to) const noexcept;
  // Effective time of the (from, to) edge; nullopt when there is no edge.
  [[nodiscard]] std::optional<double> edge_weight(const LocationId& from, const LocationId& to) const noexcept;

  [[nodiscard]] std::size_t num_locations() const noexcept { return locations_.size(); }
  [[nodiscard]] std::size_t num_segments() const noexcept { return segments_.size(); }
  // Segment keys in insertion order.
  [[nodiscard]] std::span<const SegmentKey> segment_keys() const noexcept { return order_; }

  // Snapshot of the current edge set. NodeIds follow location insertion order.
  [[nodiscard]] RoadGraph compile() const;

private:
  RoadCondition initial_condition_;
  std::vector<Location> locations_ {};
  std::unordered_map<LocationId, NodeId> index_ {};
  std::unordered_map<SegmentKey, RouteSegment, SegmentKeyHash> segments_ {};
  std::vector<SegmentKey> order_ {};
};

} // namespace reliefroute::core
