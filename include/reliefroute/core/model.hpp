/* Relief domain records: locations, resources, centers and zones. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "reliefroute/core/types.hpp"

namespace reliefroute::core {

struct Location {
  LocationId id;
  std::string name;
  double lat {0.0};
  double lng {0.0};
  LocationKind kind {LocationKind::Transit};
};

struct Resource {
  std::string id;      // resource type, e.g. "water"
  std::string name;
  std::int64_t quantity {0};
  std::string unit;
};

struct ReliefCenter {
  Location location;
  std::vector<Resource> resources;
  std::int64_t capacity {0};

  // Stock of the given resource type, 0 if the center does not carry it.
  [[nodiscard]] std::int64_t stock_of(const std::string& resource_id) const noexcept;
};

struct DisasterZone {
  Location location;
  int severity {1};                 // 1..10
  std::int64_t population_affected {0};
  std::vector<Resource> resources_needed;
  int priority {1};                 // 1..5, 5 = most urgent
};

// Directed road connection used to initialize a road network. When time is
// absent it is derived from distance and the configured default speed.
struct Connection {
  LocationId from;
  LocationId to;
  double distance {0.0};
  std::optional<double> time {};
};

// Great-circle distance in kilometres.
[[nodiscard]] double haversine_km(double lat1, double lng1, double lat2, double lng2) noexcept;

// Throw ValueError on negative quantities, out-of-range priority/severity or
// empty ids.
void validate(const ReliefCenter& center);
void validate(const DisasterZone& zone);

// Validate every record and reject duplicate location ids across both lists.
void validate_inputs(std::span<const ReliefCenter> centers,
                     std::span<const DisasterZone> zones);

} // namespace reliefroute::core
