/*
  Allocation resolution and exact allocation.

  exact_allocation builds a layered flow network
    source -> center [capacity] -> (center, resource) [stock]
           -> (zone, resource) [reachable pairs, cost -weight] -> sink [need]
  and augments along minimum-cost residual paths (Bellman-Ford, since arc
  costs are negative) until no path of negative cost remains. The initial
  network is acyclic and each augmentation follows a shortest path, so the
  residual graph never holds a negative cycle and the final flow is optimal.
*/
#include "reliefroute/core/allocation.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <numeric>
#include <utility>

#include "reliefroute/core/constants.hpp"
#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

namespace {
struct FlowArc {
  std::int32_t to;
  std::int32_t rev;     // index of the paired arc in adj[to]
  std::int64_t cap;     // residual capacity
  double cost;
};

struct FlowNetwork {
  std::vector<std::vector<FlowArc>> adj;

  explicit FlowNetwork(std::size_t n) : adj(n) {}

  std::pair<std::int32_t, std::size_t> add_arc(std::int32_t u, std::int32_t v, std::int64_t cap, double cost) {
    auto& au = adj[static_cast<std::size_t>(u)];
    auto& av = adj[static_cast<std::size_t>(v)];
    au.push_back(FlowArc{v, static_cast<std::int32_t>(av.size()), cap, cost});
    av.push_back(FlowArc{u, static_cast<std::int32_t>(au.size() - 1), 0, -cost});
    return {u, au.size() - 1};
  }

  // Bellman-Ford (queue based) from s; returns the predecessor arc per node.
  bool shortest(std::int32_t s, std::int32_t t, std::vector<double>& dist,
                std::vector<std::pair<std::int32_t, std::int32_t>>& pred) const {
    const auto n = adj.size();
    dist.assign(n, kInfCost);
    pred.assign(n, {-1, -1});
    std::vector<char> in_queue(n, 0);
    std::vector<std::int32_t> queue;
    queue.reserve(n);
    dist[static_cast<std::size_t>(s)] = 0.0;
    queue.push_back(s);
    in_queue[static_cast<std::size_t>(s)] = 1;
    std::size_t head = 0;
    while (head < queue.size()) {
      auto u = queue[head++];
      auto ui = static_cast<std::size_t>(u);
      in_queue[ui] = 0;
      for (std::size_t i = 0; i < adj[ui].size(); ++i) {
        const auto& a = adj[ui][i];
        if (a.cap <= 0) continue;
        auto vi = static_cast<std::size_t>(a.to);
        double nd = dist[ui] + a.cost;
        if (nd < dist[vi] - kCostEpsilon) {
          dist[vi] = nd;
          pred[vi] = {u, static_cast<std::int32_t>(i)};
          if (!in_queue[vi]) { in_queue[vi] = 1; queue.push_back(a.to); }
        }
      }
    }
    return dist[static_cast<std::size_t>(t)] < kInfCost;
  }
};

std::vector<std::size_t> service_order(const ProblemInstance& problem) {
  const auto zones = problem.zones();
  std::vector<std::size_t> order(zones.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    const auto& za = zones[a];
    const auto& zb = zones[b];
    if (za.priority != zb.priority) return za.priority > zb.priority;
    if (za.severity != zb.severity) return za.severity > zb.severity;
    return za.location.id < zb.location.id;
  });
  return order;
}
} // namespace

std::int64_t AllocationSolution::allocated(const LocationId& center_id, const LocationId& zone_id,
                                           const std::string& resource_id) const noexcept {
  std::int64_t total = 0;
  for (auto const& a : allocations) {
    if (a.center_id == center_id && a.zone_id == zone_id && a.resource_id == resource_id) total += a.quantity;
  }
  return total;
}

std::vector<ResourceAllocation> resolve_allocations(const ProblemInstance& problem,
                                                    std::span<const std::size_t> genes) {
  if (genes.size() != problem.num_zones()) {
    throw AssignmentError("genome length does not match zone count");
  }
  const auto centers = problem.centers();
  const auto zones = problem.zones();
  // Remaining stock per (center, resource) and remaining capacity per center.
  std::vector<std::map<std::string, std::int64_t>> stock(centers.size());
  std::vector<std::int64_t> capacity(centers.size());
  for (std::size_t c = 0; c < centers.size(); ++c) {
    for (auto const& r : centers[c].resources) stock[c][r.id] = r.quantity;
    capacity[c] = centers[c].capacity;
  }
  std::vector<ResourceAllocation> out;
  for (auto z : service_order(problem)) {
    const auto c = genes[z];
    if (c >= centers.size()) throw AssignmentError("genome names unknown center index");
    if (!problem.reachable(c, z)) continue;
    for (auto const& need : zones[z].resources_needed) {
      auto it = stock[c].find(need.id);
      if (it == stock[c].end()) continue;
      const std::int64_t qty = std::min({need.quantity, it->second, capacity[c]});
      if (qty <= 0) continue;
      it->second -= qty;
      capacity[c] -= qty;
      out.push_back(ResourceAllocation{centers[c].location.id, zones[z].location.id, need.id, qty});
    }
  }
  return out;
}

AllocationSolution make_solution(const ProblemInstance& problem, std::span<const std::size_t> genes) {
  AllocationSolution sol;
  sol.assignment = problem.to_assignment(genes);
  sol.allocations = resolve_allocations(problem, genes);
  const auto centers = problem.centers();
  const auto zones = problem.zones();
  sol.routes.reserve(genes.size());
  for (std::size_t z = 0; z < genes.size(); ++z) {
    sol.routes.push_back(DeliveryRoute{centers[genes[z]].location.id, zones[z].location.id,
                                       problem.distance(genes[z], z)});
  }
  return sol;
}

ExactAllocationResult exact_allocation(const ProblemInstance& problem, const ExactAllocationOptions& options) {
  const auto centers = problem.centers();
  const auto zones = problem.zones();

  // Node layout: 0 = source, 1 = sink, then centers, (center, resource)
  // pairs and (zone, resource) pairs.
  const std::int32_t source = 0, sink = 1;
  std::int32_t next = 2;
  std::vector<std::int32_t> center_node(centers.size());
  for (auto& n : center_node) n = next++;
  struct Slot { std::size_t owner; std::string resource; std::int32_t node; std::int64_t amount; };
  std::vector<Slot> supply, demand;
  for (std::size_t c = 0; c < centers.size(); ++c) {
    for (auto const& r : centers[c].resources) supply.push_back(Slot{c, r.id, next++, r.quantity});
  }
  std::int64_t total_need = 0;
  for (std::size_t z = 0; z < zones.size(); ++z) {
    for (auto const& r : zones[z].resources_needed) {
      demand.push_back(Slot{z, r.id, next++, r.quantity});
      total_need += r.quantity;
    }
  }

  FlowNetwork net(static_cast<std::size_t>(next));
  for (std::size_t c = 0; c < centers.size(); ++c) {
    (void)net.add_arc(source, center_node[c], centers[c].capacity, 0.0);
  }
  for (auto const& s : supply) {
    (void)net.add_arc(center_node[s.owner], s.node, s.amount, 0.0);
  }
  struct Lane { std::size_t supply; std::size_t demand; std::pair<std::int32_t, std::size_t> arc; double weight; };
  std::vector<Lane> lanes;
  for (std::size_t si = 0; si < supply.size(); ++si) {
    for (std::size_t di = 0; di < demand.size(); ++di) {
      const auto& s = supply[si];
      const auto& d = demand[di];
      if (s.resource != d.resource || !problem.reachable(s.owner, d.owner)) continue;
      const double w = static_cast<double>(zones[d.owner].priority) / (1.0 + problem.distance(s.owner, d.owner));
      auto arc = net.add_arc(s.node, d.node, std::numeric_limits<std::int64_t>::max(), -w);
      lanes.push_back(Lane{si, di, arc, w});
    }
  }
  for (auto const& d : demand) {
    (void)net.add_arc(d.node, sink, d.amount, 0.0);
  }

  std::int64_t shipped = 0;
  std::vector<double> dist;
  std::vector<std::pair<std::int32_t, std::int32_t>> pred;
  while (net.shortest(source, sink, dist, pred)) {
    // Without the coverage requirement stop once no path is profitable;
    // with it keep augmenting to the maximum flow.
    if (!options.require_full_coverage && dist[static_cast<std::size_t>(sink)] >= -kCostEpsilon) break;
    std::int64_t push = std::numeric_limits<std::int64_t>::max();
    for (std::int32_t v = sink; v != source;) {
      auto [u, i] = pred[static_cast<std::size_t>(v)];
      push = std::min(push, net.adj[static_cast<std::size_t>(u)][static_cast<std::size_t>(i)].cap);
      v = u;
    }
    if (push <= 0) break;
    for (std::int32_t v = sink; v != source;) {
      auto [u, i] = pred[static_cast<std::size_t>(v)];
      auto& a = net.adj[static_cast<std::size_t>(u)][static_cast<std::size_t>(i)];
      a.cap -= push;
      net.adj[static_cast<std::size_t>(a.to)][static_cast<std::size_t>(a.rev)].cap += push;
      v = u;
    }
    shipped += push;
  }

  ExactAllocationResult result;
  result.unmet_demand = total_need - shipped;
  if (options.require_full_coverage && result.unmet_demand > 0) {
    result.status = AllocationStatus::Infeasible;
    return result;
  }
  result.status = AllocationStatus::Optimal;
  for (auto const& lane : lanes) {
    const auto& arc = net.adj[static_cast<std::size_t>(lane.arc.first)][lane.arc.second];
    const auto& back = net.adj[static_cast<std::size_t>(arc.to)][static_cast<std::size_t>(arc.rev)];
    const std::int64_t flow = back.cap;
    if (flow <= 0) continue;
    const auto& s = supply[lane.supply];
    const auto& d = demand[lane.demand];
    result.allocations.push_back(ResourceAllocation{centers[s.owner].location.id, zones[d.owner].location.id,
                                                    s.resource, flow});
    result.objective += lane.weight * static_cast<double>(flow);
  }
  return result;
}

} // namespace reliefroute::core
