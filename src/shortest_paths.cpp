/*
  shortest_paths — label-setting searches over a RoadGraph.

  Features:
    - Dijkstra on either edge weight (effective time or base distance).
    - A* with an admissible great-circle heuristic on the time metric.
    - Dijkstra on caller-supplied edge weights, e.g. a weighted sum of time,
      distance and road condition.
    - Optional node and edge masks; masked nodes are never entered and
      masked edges never relaxed.
    - Deterministic tie-breaking: the compacted edge order decides among
      equal-cost relaxations.
*/
#include "reliefroute/core/shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <queue>
#include <utility>

#include "reliefroute/core/constants.hpp"
#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

namespace {
void check_masks(const RoadGraph& g, std::span<const bool> node_mask, std::span<const bool> edge_mask) {
  if (!node_mask.empty() && node_mask.size() != static_cast<std::size_t>(g.num_nodes())) {
    throw ValueError("node_mask length mismatch");
  }
  if (!edge_mask.empty() && edge_mask.size() != static_cast<std::size_t>(g.num_edges())) {
    throw ValueError("edge_mask length mismatch");
  }
}

PathResult unreachable() {
  return PathResult{kInfCost, {}, {}};
}

// Shared best-first search. heuristic(v) must never overestimate the
// remaining cost to dst; a zero heuristic gives plain Dijkstra.
PathResult search(const RoadGraph& g, NodeId s, NodeId t, std::span<const Cost> weight,
                  std::span<const bool> node_mask, std::span<const bool> edge_mask,
                  const std::function<Cost(NodeId)>& heuristic) {
  check_masks(g, node_mask, edge_mask);
  const int N = g.num_nodes();
  if (s < 0 || t < 0 || s >= N || t >= N) return unreachable();
  auto ok_node = [&](NodeId v) { return node_mask.empty() || node_mask[static_cast<std::size_t>(v)]; };
  auto ok_edge = [&](std::size_t e) { return edge_mask.empty() || edge_mask[e]; };
  if (!ok_node(s) || !ok_node(t)) return unreachable();

  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto aei = g.adj_edge_index_view();

  std::vector<Cost> dist(static_cast<std::size_t>(N), kInfCost);
  std::vector<NodeId> parent(static_cast<std::size_t>(N), -1);
  std::vector<EdgeId> via(static_cast<std::size_t>(N), -1);
  std::vector<char> settled(static_cast<std::size_t>(N), 0);
  using QItem = std::pair<Cost, NodeId>;  // (g + h, node)
  auto cmp = [](const QItem& a, const QItem& b) { return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  dist[static_cast<std::size_t>(s)] = 0.0;
  pq.emplace(heuristic(s), s);
  while (!pq.empty()) {
    auto [f_u, u] = pq.top(); pq.pop();
    auto ui = static_cast<std::size_t>(u);
    if (settled[ui]) continue;
    settled[ui] = 1;
    if (u == t) break;
    auto start = static_cast<std::size_t>(row[ui]);
    auto end   = static_cast<std::size_t>(row[ui + 1]);
    for (std::size_t i = start; i < end; ++i) {
      NodeId v = col[i];
      auto vi = static_cast<std::size_t>(v);
      if (settled[vi] || !ok_node(v)) continue;
      auto e = static_cast<std::size_t>(aei[i]);
      if (!ok_edge(e)) continue;
      Cost nd = dist[ui] + weight[e];
      if (nd < dist[vi]) {
        dist[vi] = nd; parent[vi] = u; via[vi] = static_cast<EdgeId>(e);
        pq.emplace(nd + heuristic(v), v);
      }
    }
  }
  if (!std::isfinite(dist[static_cast<std::size_t>(t)])) return unreachable();
  // Reconstruct
  std::vector<NodeId> nodes_rev;
  std::vector<EdgeId> edges_rev;
  for (NodeId v = t; v != s; v = parent[static_cast<std::size_t>(v)]) {
    nodes_rev.push_back(v);
    edges_rev.push_back(via[static_cast<std::size_t>(v)]);
  }
  PathResult p;
  p.cost = dist[static_cast<std::size_t>(t)];
  p.nodes.reserve(nodes_rev.size() + 1);
  p.nodes.push_back(s);
  p.nodes.insert(p.nodes.end(), nodes_rev.rbegin(), nodes_rev.rend());
  p.edges.assign(edges_rev.rbegin(), edges_rev.rend());
  return p;
}
} // namespace

bool PathResult::reachable() const noexcept {
  return std::isfinite(cost);
}

PathResult shortest_path(const RoadGraph& g, NodeId src, NodeId dst, PathMetric metric,
                         std::span<const bool> node_mask, std::span<const bool> edge_mask) {
  return search(g, src, dst, g.weight_view(metric), node_mask, edge_mask, [](NodeId) { return 0.0; });
}

PathResult astar_path(const RoadGraph& g, NodeId src, NodeId dst,
                      std::span<const bool> node_mask, std::span<const bool> edge_mask) {
  if (dst < 0 || dst >= g.num_nodes()) return unreachable();
  const double scale = g.heuristic_scale();
  const Location& target = g.location(dst);
  auto h = [&](NodeId v) {
    if (scale <= 0.0) return 0.0;
    const Location& loc = g.location(v);
    return scale * haversine_km(loc.lat, loc.lng, target.lat, target.lng);
  };
  return search(g, src, dst, g.time_view(), node_mask, edge_mask, h);
}

PathResult weighted_shortest_path(const RoadGraph& g, NodeId src, NodeId dst,
                                  std::span<const Cost> edge_weights,
                                  std::span<const bool> node_mask) {
  if (edge_weights.size() != static_cast<std::size_t>(g.num_edges())) {
    throw ValueError("edge_weights length mismatch");
  }
  for (auto w : edge_weights) {
    if (!(w >= 0.0) || !std::isfinite(w)) throw ValueError("edge weights must be finite and >= 0");
  }
  return search(g, src, dst, edge_weights, node_mask, {}, [](NodeId) { return 0.0; });
}

std::vector<Cost> combined_edge_weights(const RoadGraph& g, std::span<const double> condition_factors,
                                        const RouteObjectives& objectives) {
  validate(objectives);
  const auto m = static_cast<std::size_t>(g.num_edges());
  if (!condition_factors.empty() && condition_factors.size() != m) {
    throw ValueError("condition_factors length mismatch");
  }
  const auto time = g.time_view();
  const auto distance = g.distance_view();
  std::vector<Cost> out(m);
  for (std::size_t e = 0; e < m; ++e) {
    const double factor = condition_factors.empty() ? 1.0 : condition_factors[e];
    out[e] = time[e] * objectives.time + distance[e] * objectives.distance + factor * objectives.condition;
  }
  return out;
}

std::vector<Cost> single_source_costs(const RoadGraph& g, NodeId src, PathMetric metric) {
  const auto N = g.num_nodes();
  std::vector<Cost> dist(static_cast<std::size_t>(N), kInfCost);
  if (src < 0 || src >= N) return dist;
  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto aei = g.adj_edge_index_view();
  const auto weight = g.weight_view(metric);

  using QItem = std::pair<Cost, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) { return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  dist[static_cast<std::size_t>(src)] = 0.0;
  pq.emplace(0.0, src);
  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    auto ui = static_cast<std::size_t>(u);
    if (d_u > dist[ui]) continue;
    auto start = static_cast<std::size_t>(row[ui]);
    auto end   = static_cast<std::size_t>(row[ui + 1]);
    for (std::size_t i = start; i < end; ++i) {
      auto vi = static_cast<std::size_t>(col[i]);
      Cost nd = d_u + weight[static_cast<std::size_t>(aei[i])];
      if (nd < dist[vi]) { dist[vi] = nd; pq.emplace(nd, col[i]); }
    }
  }
  return dist;
}

std::vector<PathResult> edge_disjoint_paths(const RoadGraph& g, NodeId src, NodeId dst, int k,
                                            PathMetric metric, std::span<const bool> node_mask) {
  std::vector<PathResult> paths;
  if (k <= 0) return paths;
  check_masks(g, node_mask, {});
  std::unique_ptr<bool[]> em(new bool[static_cast<std::size_t>(g.num_edges())]);
  std::fill_n(em.get(), static_cast<std::size_t>(g.num_edges()), true);
  std::span<const bool> edge_mask(em.get(), static_cast<std::size_t>(g.num_edges()));
  const auto esrc = g.edge_src_view();
  const auto edst = g.edge_dst_view();
  for (int i = 0; i < k; ++i) {
    auto p = shortest_path(g, src, dst, metric, node_mask, edge_mask);
    if (!p.reachable() || p.edges.empty()) {
      if (p.reachable()) paths.push_back(std::move(p));  // src == dst
      break;
    }
    // Exclude every parallel edge between the same endpoints as well, so the
    // next path does not reuse the (from, to) road.
    for (auto e : p.edges) {
      auto u = esrc[static_cast<std::size_t>(e)];
      auto v = edst[static_cast<std::size_t>(e)];
      for (EdgeId f = 0; f < g.num_edges(); ++f) {
        if (esrc[static_cast<std::size_t>(f)] == u && edst[static_cast<std::size_t>(f)] == v) {
          em[static_cast<std::size_t>(f)] = false;
        }
      }
    }
    paths.push_back(std::move(p));
  }
  return paths;
}

} // namespace reliefroute::core
