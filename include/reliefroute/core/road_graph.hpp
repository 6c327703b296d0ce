/* Immutable directed road graph snapshot with CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "reliefroute/core/model.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

// Notes on identifiers:
// - NodeId is the position of a location in the node table passed to
//   from_arrays; node_index() maps external LocationIds back to it.
// - EdgeId refers to the index of an edge in the compacted representation.
//   Edges are deterministically reordered during construction by
//   (time, src, dst) for stable traversal.
// Each edge carries two weights: effective travel time (the routing metric)
// and base distance.

class RoadGraph {
public:
  [[nodiscard]] static RoadGraph from_arrays(
      std::span<const Location> nodes,
      std::span<const NodeId> src,
      std::span<const NodeId> dst,
      std::span<const Cost> time,
      std::span<const Cost> distance,
      bool add_reverse = false);
  ~RoadGraph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(nodes_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edges_); }

  [[nodiscard]] std::span<const Cost> time_view() const noexcept { return time_; }
  [[nodiscard]] std::span<const Cost> distance_view() const noexcept { return distance_; }
  [[nodiscard]] std::span<const Cost> weight_view(PathMetric metric) const noexcept {
    return metric == PathMetric::Distance ? distance_view() : time_view();
  }
  [[nodiscard]] std::span<const NodeId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeId> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }

  [[nodiscard]] const Location& location(NodeId v) const { return nodes_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] const LocationId& node_id(NodeId v) const { return location(v).id; }
  [[nodiscard]] std::optional<NodeId> node_index(const LocationId& id) const noexcept;

  // First edge u->v in compacted order (the cheapest by time), if any.
  [[nodiscard]] std::optional<EdgeId> find_edge(NodeId u, NodeId v) const noexcept;

  // Lower bound on hours per straight-line kilometre over all edges. Scaling
  // great-circle distance by it yields an admissible A* heuristic for the
  // time metric. Zero when no edge spans a positive geographic distance.
  [[nodiscard]] double heuristic_scale() const noexcept { return heuristic_scale_; }

private:
  std::vector<Location> nodes_ {};
  std::unordered_map<LocationId, NodeId> index_ {};
  std::size_t edges_ {0};
  std::vector<Cost> time_ {};
  std::vector<Cost> distance_ {};
  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};

  // CSR adjacency for deterministic traversal
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {}; // map CSR entry -> EdgeId

  double heuristic_scale_ {0.0};
};

} // namespace reliefroute::core
