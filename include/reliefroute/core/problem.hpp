/*
  ProblemInstance — a point-in-time allocation problem: centers, zones and a
  precomputed center->zone distance table over a RoadGraph snapshot.

  Assignments are zone-id -> center-id maps. Optimizers search over the
  equivalent index form (Genome: center index per zone index); resolve()
  converts and enforces the completeness invariant.
*/
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <random>
#include <span>
#include <unordered_map>
#include <vector>

#include "reliefroute/core/model.hpp"
#include "reliefroute/core/road_graph.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

// zone id -> center id, exactly one entry per zone.
using Assignment = std::map<LocationId, LocationId>;
// genes[z] = index of the center serving zone z.
using Genome = std::vector<std::size_t>;

class ProblemInstance {
public:
  // Validates inputs (ValueError on bad records, duplicate ids, or zones
  // without any center). Locations missing from the graph are treated as
  // unreachable from everywhere.
  ProblemInstance(std::vector<ReliefCenter> centers,
                  std::vector<DisasterZone> zones,
                  const RoadGraph& graph,
                  PathMetric metric = PathMetric::Time);

  [[nodiscard]] std::span<const ReliefCenter> centers() const noexcept { return centers_; }
  [[nodiscard]] std::span<const DisasterZone> zones() const noexcept { return zones_; }
  [[nodiscard]] std::size_t num_centers() const noexcept { return centers_.size(); }
  [[nodiscard]] std::size_t num_zones() const noexcept { return zones_.size(); }
  [[nodiscard]] PathMetric metric() const noexcept { return metric_; }

  [[nodiscard]] std::optional<std::size_t> center_index(const LocationId& id) const noexcept;
  [[nodiscard]] std::optional<std::size_t> zone_index(const LocationId& id) const noexcept;

  // Shortest-path cost from center c to zone z; +inf when unreachable.
  [[nodiscard]] Cost distance(std::size_t center, std::size_t zone) const noexcept {
    return distances_[center * zones_.size() + zone];
  }
  [[nodiscard]] bool reachable(std::size_t center, std::size_t zone) const noexcept;

  // Throws AssignmentError unless every zone appears exactly once as a key
  // and every value names a known center.
  [[nodiscard]] Genome resolve(const Assignment& assignment) const;
  [[nodiscard]] Assignment to_assignment(std::span<const std::size_t> genes) const;

  // Each zone independently assigned a uniformly random center.
  [[nodiscard]] Genome random_genome(RandomEngine& rng) const;

private:
  std::vector<ReliefCenter> centers_;
  std::vector<DisasterZone> zones_;
  std::unordered_map<LocationId, std::size_t> center_index_;
  std::unordered_map<LocationId, std::size_t> zone_index_;
  std::vector<Cost> distances_;  // row-major [center][zone]
  PathMetric metric_;
};

} // namespace reliefroute::core
