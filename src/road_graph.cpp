/*
  RoadGraph — immutable directed road graph with deterministic layout.

  Construction from arrays validates inputs, optionally duplicates reverse
  edges, and compacts data into CSR adjacency using a stable ordering.
  Time-first sorting keeps the cheapest parallel edge first in each
  neighbor group.
*/
#include "reliefroute/core/road_graph.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

RoadGraph RoadGraph::from_arrays(
    std::span<const Location> nodes,
    std::span<const NodeId> src,
    std::span<const NodeId> dst,
    std::span<const Cost> time,
    std::span<const Cost> distance,
    bool add_reverse) {

  if (src.size() != dst.size() || src.size() != time.size() || src.size() != distance.size()) {
    throw ValueError("src, dst, time, and distance must have the same length");
  }
  RoadGraph g;
  g.nodes_.assign(nodes.begin(), nodes.end());
  const auto num_nodes = static_cast<NodeId>(g.nodes_.size());
  for (NodeId v = 0; v < num_nodes; ++v) {
    const auto& id = g.nodes_[static_cast<std::size_t>(v)].id;
    if (!g.index_.emplace(id, v).second) {
      throw ValueError("duplicate node id '" + id + "'");
    }
  }
  std::size_t m = src.size();

  // Invariants: ids within [0, num_nodes), finite non-negative weights
  for (std::size_t i = 0; i < m; ++i) {
    if (src[i] < 0 || dst[i] < 0 || src[i] >= num_nodes || dst[i] >= num_nodes) {
      throw ValueError("edge endpoint out of range of node table");
    }
    if (!(time[i] >= 0.0) || !std::isfinite(time[i])) {
      throw ValueError("time must be finite and >= 0");
    }
    if (!(distance[i] >= 0.0) || !std::isfinite(distance[i])) {
      throw ValueError("distance must be finite and >= 0");
    }
  }
  std::vector<NodeId> src_v(src.begin(), src.end());
  std::vector<NodeId> dst_v(dst.begin(), dst.end());
  std::vector<Cost> time_v(time.begin(), time.end());
  std::vector<Cost> dist_v(distance.begin(), distance.end());

  if (add_reverse) {
    src_v.reserve(2 * m);
    dst_v.reserve(2 * m);
    time_v.reserve(2 * m);
    dist_v.reserve(2 * m);
    for (std::size_t i = 0; i < m; ++i) {
      src_v.push_back(dst_v[i]);
      dst_v.push_back(src_v[i]);
      time_v.push_back(time_v[i]);
      dist_v.push_back(dist_v[i]);
    }
    m = src_v.size();
  }

  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (time_v[a] != time_v[b]) return time_v[a] < time_v[b];
    if (src_v[a] != src_v[b]) return src_v[a] < src_v[b];
    return dst_v[a] < dst_v[b];
  });
  auto apply_perm = [&](auto& out_vec, const auto& in_vec) {
    out_vec.resize(m);
    for (std::size_t i = 0; i < m; ++i) out_vec[i] = in_vec[idx[i]];
  };
  apply_perm(g.src_, src_v);
  apply_perm(g.dst_, dst_v);
  apply_perm(g.time_, time_v);
  apply_perm(g.distance_, dist_v);
  g.edges_ = m;

  // Build CSR adjacency
  g.row_offsets_.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.col_indices_.resize(m);
  g.adj_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g.src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    g.col_indices_[pos] = g.dst_[e];
    g.adj_edge_index_[pos] = static_cast<EdgeId>(e);
  }

  // Heuristic scale: min time per straight-line km; by the triangle
  // inequality scale * geo(n, t) never exceeds the remaining travel time.
  double scale = std::numeric_limits<double>::infinity();
  for (std::size_t e = 0; e < m; ++e) {
    const auto& a = g.nodes_[static_cast<std::size_t>(g.src_[e])];
    const auto& b = g.nodes_[static_cast<std::size_t>(g.dst_[e])];
    const double geo = haversine_km(a.lat, a.lng, b.lat, b.lng);
    if (geo <= 0.0) continue;
    scale = std::min(scale, g.time_[e] / geo);
  }
  g.heuristic_scale_ = std::isfinite(scale) ? scale : 0.0;
  return g;
}

std::optional<NodeId> RoadGraph::node_index(const LocationId& id) const noexcept {
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeId> RoadGraph::find_edge(NodeId u, NodeId v) const noexcept {
  if (u < 0 || u >= num_nodes()) return std::nullopt;
  auto start = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto end = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  for (std::size_t i = start; i < end; ++i) {
    if (col_indices_[i] == v) return adj_edge_index_[i];
  }
  return std::nullopt;
}

} // namespace reliefroute::core
