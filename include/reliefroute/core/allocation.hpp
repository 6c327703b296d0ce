/*
  Allocation results: the AllocationSolution produced by every optimizer run,
  priority-ordered stock resolution, and the optional exact allocation.
*/
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "reliefroute/core/options.hpp"
#include "reliefroute/core/problem.hpp"
#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

// Quantity of one resource type shipped from a center to a zone.
struct ResourceAllocation {
  LocationId center_id;
  LocationId zone_id;
  std::string resource_id;
  std::int64_t quantity {0};
};

struct DeliveryRoute {
  LocationId center_id;
  LocationId zone_id;
  Cost distance {0.0};  // +inf when the zone is unreachable from the center
};

struct AllocationSolution {
  Assignment assignment;
  std::vector<ResourceAllocation> allocations;
  std::vector<DeliveryRoute> routes;  // one per zone
  double total_cost {0.0};
  double coverage_score {0.0};
  double time_efficiency {0.0};

  // Total quantity of resource_id shipped from center to zone.
  [[nodiscard]] std::int64_t allocated(const LocationId& center_id, const LocationId& zone_id,
                                       const std::string& resource_id) const noexcept;
};

// Serve zones in descending priority (then severity, then id). Each needed
// resource receives min(need, remaining stock, remaining capacity) from the
// zone's assigned center; stocks are decremented and never go negative.
// Zones unreachable from their center receive nothing.
[[nodiscard]] std::vector<ResourceAllocation> resolve_allocations(
    const ProblemInstance& problem, std::span<const std::size_t> genes);

// Assemble the routes and allocations of a solution for a genome; score
// fields are filled by the caller.
[[nodiscard]] AllocationSolution make_solution(const ProblemInstance& problem,
                                               std::span<const std::size_t> genes);

enum class AllocationStatus {
  Optimal = 1,
  Infeasible = 2
};

struct ExactAllocationResult {
  AllocationStatus status {AllocationStatus::Optimal};
  std::vector<ResourceAllocation> allocations;  // empty when infeasible
  double objective {0.0};
  std::int64_t unmet_demand {0};
};

// Exact solution of
//   maximize  sum priority_z / (1 + d_cz) * x_czr
//   s.t.      sum_zr x_czr <= capacity_c,  sum_z x_czr <= stock_cr,
//             sum_c x_czr <= need_zr,  x >= 0,  x_czr = 0 if z unreachable from c
// as a min-cost flow (successive shortest paths on the residual graph).
// With require_full_coverage the search continues to the maximum flow, so the
// result is the best allocation among those meeting every need, and
// Infeasible is reported only when even the maximum flow leaves demand unmet.
[[nodiscard]] ExactAllocationResult exact_allocation(const ProblemInstance& problem,
                                                     const ExactAllocationOptions& options = {});

} // namespace reliefroute::core
