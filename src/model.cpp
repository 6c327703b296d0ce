/*
  Relief domain records — validation helpers and geographic distance.
*/
#include "reliefroute/core/model.hpp"

#include <cmath>
#include <numbers>
#include <unordered_set>

#include "reliefroute/core/constants.hpp"
#include "reliefroute/core/error.hpp"

namespace reliefroute::core {

namespace {
void validate_resources(const std::vector<Resource>& resources, const std::string& owner) {
  std::unordered_set<std::string> seen;
  for (auto const& r : resources) {
    if (r.id.empty()) {
      throw ValueError(owner + ": resource id must not be empty");
    }
    if (r.quantity < 0) {
      throw ValueError(owner + ": resource '" + r.id + "' quantity must be >= 0");
    }
    if (!seen.insert(r.id).second) {
      throw ValueError(owner + ": duplicate resource '" + r.id + "'");
    }
  }
}
} // namespace

std::int64_t ReliefCenter::stock_of(const std::string& resource_id) const noexcept {
  for (auto const& r : resources) {
    if (r.id == resource_id) return r.quantity;
  }
  return 0;
}

double haversine_km(double lat1, double lng1, double lat2, double lng2) noexcept {
  constexpr double deg = std::numbers::pi / 180.0;
  const double dlat = (lat2 - lat1) * deg;
  const double dlng = (lng2 - lng1) * deg;
  const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1 * deg) * std::cos(lat2 * deg) *
                   std::sin(dlng / 2) * std::sin(dlng / 2);
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusKm * c;
}

void validate(const ReliefCenter& center) {
  const auto& id = center.location.id;
  if (id.empty()) throw ValueError("relief center id must not be empty");
  if (center.capacity < 0) throw ValueError("relief center '" + id + "': capacity must be >= 0");
  validate_resources(center.resources, "relief center '" + id + "'");
}

void validate(const DisasterZone& zone) {
  const auto& id = zone.location.id;
  if (id.empty()) throw ValueError("disaster zone id must not be empty");
  if (zone.priority < kMinPriority || zone.priority > kMaxPriority) {
    throw ValueError("disaster zone '" + id + "': priority must be in [1, 5]");
  }
  if (zone.severity < kMinSeverity || zone.severity > kMaxSeverity) {
    throw ValueError("disaster zone '" + id + "': severity must be in [1, 10]");
  }
  if (zone.population_affected < 0) {
    throw ValueError("disaster zone '" + id + "': population_affected must be >= 0");
  }
  validate_resources(zone.resources_needed, "disaster zone '" + id + "'");
}

void validate_inputs(std::span<const ReliefCenter> centers,
                     std::span<const DisasterZone> zones) {
  std::unordered_set<std::string> ids;
  for (auto const& c : centers) {
    validate(c);
    if (!ids.insert(c.location.id).second) {
      throw ValueError("duplicate location id '" + c.location.id + "'");
    }
  }
  for (auto const& z : zones) {
    validate(z);
    if (!ids.insert(z.location.id).second) {
      throw ValueError("duplicate location id '" + z.location.id + "'");
    }
  }
}

} // namespace reliefroute::core
