/* Shortest paths over a RoadGraph: Dijkstra, A*, weighted objectives and edge-disjoint alternatives. */
#pragma once

#include <span>
#include <vector>

#include "reliefroute/core/options.hpp"
#include "reliefroute/core/road_graph.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

// A single concrete path. Unreachable is a normal outcome: cost is +inf and
// nodes/edges are empty.
struct PathResult {
  Cost cost;
  std::vector<NodeId> nodes;
  std::vector<EdgeId> edges;

  [[nodiscard]] bool reachable() const noexcept;
};

// Optional node/edge masks:
// - node_mask[v] == true means node v is allowed; false excludes it from search.
// - edge_mask[e] == true means edge e is allowed; false excludes it from search.
// Empty spans are ignored; spans of any other wrong length are rejected with
// ValueError.

[[nodiscard]] PathResult shortest_path(const RoadGraph& g, NodeId src, NodeId dst,
                                       PathMetric metric = PathMetric::Time,
                                       std::span<const bool> node_mask = {},
                                       std::span<const bool> edge_mask = {});

// A* on the time metric with a great-circle heuristic scaled by
// g.heuristic_scale(). Returns a path of the same cost as shortest_path.
[[nodiscard]] PathResult astar_path(const RoadGraph& g, NodeId src, NodeId dst,
                                    std::span<const bool> node_mask = {},
                                    std::span<const bool> edge_mask = {});

// Dijkstra over caller-supplied per-edge weights (indexed by EdgeId). Weights
// must be finite and >= 0 (ValueError otherwise).
[[nodiscard]] PathResult weighted_shortest_path(const RoadGraph& g, NodeId src, NodeId dst,
                                                std::span<const Cost> edge_weights,
                                                std::span<const bool> node_mask = {});

// Per-edge time * objectives.time + distance * objectives.distance
//   + condition_factor * objectives.condition.
// condition_factors is indexed by EdgeId; an empty span means 1.0 everywhere.
[[nodiscard]] std::vector<Cost> combined_edge_weights(const RoadGraph& g,
                                                      std::span<const double> condition_factors,
                                                      const RouteObjectives& objectives);

// Costs from src to every node (+inf where unreachable).
[[nodiscard]] std::vector<Cost> single_source_costs(const RoadGraph& g, NodeId src,
                                                    PathMetric metric = PathMetric::Time);

// Up to k pairwise edge-disjoint paths: each iteration takes the current
// shortest path and excludes its edges before the next search. Stops early
// once no path remains. Paths are not necessarily node-disjoint.
[[nodiscard]] std::vector<PathResult> edge_disjoint_paths(const RoadGraph& g, NodeId src, NodeId dst,
                                                          int k,
                                                          PathMetric metric = PathMetric::Time,
                                                          std::span<const bool> node_mask = {});

} // namespace reliefroute::core
