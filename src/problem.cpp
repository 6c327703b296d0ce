/*
  ProblemInstance — id-indexed lookup tables and the center->zone distance
  table, built once per instance (one single-source search per center).
*/
#include "reliefroute/core/problem.hpp"

#include <cmath>

#include "reliefroute/core/constants.hpp"
#include "reliefroute/core/error.hpp"
#include "reliefroute/core/shortest_paths.hpp"

namespace reliefroute::core {

ProblemInstance::ProblemInstance(std::vector<ReliefCenter> centers,
                                 std::vector<DisasterZone> zones,
                                 const RoadGraph& graph,
                                 PathMetric metric)
    : centers_(std::move(centers)), zones_(std::move(zones)), metric_(metric) {
  validate_inputs(centers_, zones_);
  if (centers_.empty() && !zones_.empty()) {
    throw ValueError("at least one relief center is required");
  }
  for (std::size_t c = 0; c < centers_.size(); ++c) center_index_.emplace(centers_[c].location.id, c);
  for (std::size_t z = 0; z < zones_.size(); ++z) zone_index_.emplace(zones_[z].location.id, z);

  distances_.assign(centers_.size() * zones_.size(), kInfCost);
  std::vector<std::optional<NodeId>> zone_nodes;
  zone_nodes.reserve(zones_.size());
  for (auto const& z : zones_) zone_nodes.push_back(graph.node_index(z.location.id));
  for (std::size_t c = 0; c < centers_.size(); ++c) {
    auto src = graph.node_index(centers_[c].location.id);
    if (!src) continue;
    auto costs = single_source_costs(graph, *src, metric_);
    for (std::size_t z = 0; z < zones_.size(); ++z) {
      if (zone_nodes[z]) distances_[c * zones_.size() + z] = costs[static_cast<std::size_t>(*zone_nodes[z])];
    }
  }
}

std::optional<std::size_t> ProblemInstance::center_index(const LocationId& id) const noexcept {
  auto it = center_index_.find(id);
  if (it == center_index_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::size_t> ProblemInstance::zone_index(const LocationId& id) const noexcept {
  auto it = zone_index_.find(id);
  if (it == zone_index_.end()) return std::nullopt;
  return it->second;
}

bool ProblemInstance::reachable(std::size_t center, std::size_t zone) const noexcept {
  return std::isfinite(distance(center, zone));
}

Genome ProblemInstance::resolve(const Assignment& assignment) const {
  if (assignment.size() != zones_.size()) {
    throw AssignmentError("assignment covers " + std::to_string(assignment.size()) +
                          " zones, expected " + std::to_string(zones_.size()));
  }
  Genome genes(zones_.size());
  std::vector<char> seen(zones_.size(), 0);
  for (auto const& [zone_id, center_id] : assignment) {
    auto z = zone_index(zone_id);
    if (!z) throw AssignmentError("assignment names unknown zone '" + zone_id + "'");
    auto c = center_index(center_id);
    if (!c) throw AssignmentError("zone '" + zone_id + "' assigned to unknown center '" + center_id + "'");
    seen[*z] = 1;
    genes[*z] = *c;
  }
  for (std::size_t z = 0; z < zones_.size(); ++z) {
    if (!seen[z]) throw AssignmentError("assignment is missing zone '" + zones_[z].location.id + "'");
  }
  return genes;
}

Assignment ProblemInstance::to_assignment(std::span<const std::size_t> genes) const {
  if (genes.size() != zones_.size()) {
    throw AssignmentError("genome length does not match zone count");
  }
  Assignment out;
  for (std::size_t z = 0; z < genes.size(); ++z) {
    if (genes[z] >= centers_.size()) throw AssignmentError("genome names unknown center index");
    out.emplace(zones_[z].location.id, centers_[genes[z]].location.id);
  }
  return out;
}

Genome ProblemInstance::random_genome(RandomEngine& rng) const {
  Genome genes(zones_.size(), 0);
  if (centers_.empty()) return genes;
  std::uniform_int_distribution<std::size_t> pick(0, centers_.size() - 1);
  for (auto& g : genes) g = pick(rng);
  return genes;
}

} // namespace reliefroute::core
