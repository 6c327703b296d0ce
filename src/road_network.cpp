/*
  RoadNetwork — authoritative segment table and graph compilation.
*/
#include "reliefroute/core/road_network.hpp"

#include <cmath>

#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

double RouteSegment::effective_time() const noexcept {
  return base_time * condition_multiplier(condition) * traffic_multiplier(traffic);
}

void RoadNetwork::add_location(Location location) {
  if (location.id.empty()) {
    throw ValueError("location id must not be empty");
  }
  auto id = static_cast<NodeId>(locations_.size());
  if (!index_.emplace(location.id, id).second) {
    throw ValueError("duplicate location id '" + location.id + "'");
  }
  locations_.push_back(std::move(location));
}

const Location* RoadNetwork::find_location(const LocationId& id) const noexcept {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &locations_[static_cast<std::size_t>(it->second)];
}

const RouteSegment& RoadNetwork::add_segment(const LocationId& from, const LocationId& to,
                                             double distance, double base_time, Timestamp now) {
  if (!has_location(from)) throw NotFoundError("unknown location '" + from + "'");
  if (!has_location(to)) throw NotFoundError("unknown location '" + to + "'");
  if (!(distance >= 0.0) || !std::isfinite(distance)) {
    throw ValueError("segment distance must be finite and >= 0");
  }
  if (!(base_time >= 0.0) || !std::isfinite(base_time)) {
    throw ValueError("segment time must be finite and >= 0");
  }
  SegmentKey key{from, to};
  RouteSegment seg;
  seg.from = from;
  seg.to = to;
  seg.base_distance = distance;
  seg.base_time = base_time;
  seg.condition = initial_condition_;
  seg.last_updated = now;
  auto [it, inserted] = segments_.insert_or_assign(key, std::move(seg));
  if (inserted) order_.push_back(std::move(key));
  return it->second;
}

bool RoadNetwork::set_condition(const LocationId& from, const LocationId& to,
                                RoadCondition condition, Timestamp now) {
  auto it = segments_.find(SegmentKey{from, to});
  if (it == segments_.end()) return false;
  it->second.condition = condition;
  it->second.last_updated = now;
  return true;
}

bool RoadNetwork::set_traffic(const LocationId& from, const LocationId& to,
                              TrafficLevel traffic, Timestamp now) {
  auto it = segments_.find(SegmentKey{from, to});
  if (it == segments_.end()) return false;
  it->second.traffic = traffic;
  it->second.last_updated = now;
  return true;
}

const RouteSegment* RoadNetwork::segment(const LocationId& from, const LocationId& to) const noexcept {
  auto it = segments_.find(SegmentKey{from, to});
  if (it == segments_.end()) return nullptr;
  return &it->second;
}

bool RoadNetwork::has_edge(const LocationId& from, const LocationId& to) const noexcept {
  const auto* seg = segment(from, to);
  return seg != nullptr && seg->is_passable();
}

std::optional<double> RoadNetwork::edge_weight(const LocationId& from, const LocationId& to) const noexcept {
  if (!has_edge(from, to)) return std::nullopt;
  return segment(from, to)->effective_time();
}

RoadGraph RoadNetwork::compile() const {
  std::vector<NodeId> src, dst;
  std::vector<Cost> time, distance;
  src.reserve(order_.size());
  dst.reserve(order_.size());
  time.reserve(order_.size());
  distance.reserve(order_.size());
  for (auto const& key : order_) {
    const auto& seg = segments_.at(key);
    if (!seg.is_passable()) continue;
    src.push_back(index_.at(seg.from));
    dst.push_back(index_.at(seg.to));
    time.push_back(seg.effective_time());
    distance.push_back(seg.base_distance);
  }
  return RoadGraph::from_arrays(locations_, src, dst, time, distance);
}

} // namespace reliefroute::core
