/* Shared numeric constants. */
#pragma once

#include <chrono>
#include <cstddef>
#include <limits>

namespace reliefroute::core {

inline constexpr double kInfCost = std::numeric_limits<double>::infinity();
inline constexpr double kCostEpsilon = 1e-9;

// Default penalty charged for an unreachable (center, zone) pair.
inline constexpr double kDefaultUnreachablePenalty = 1000.0;
// Annealing compares cost differences against temperature, so its penalty is
// an order of magnitude larger.
inline constexpr double kDefaultAnnealingPenalty = 10000.0;

inline constexpr double kEarthRadiusKm = 6371.0;
inline constexpr double kDefaultSpeedKmh = 50.0;

inline constexpr std::chrono::seconds kDefaultRouteCacheTtl {300};
inline constexpr std::size_t kDefaultHistoryLimit = 100;

inline constexpr int kMinPriority = 1;
inline constexpr int kMaxPriority = 5;
inline constexpr int kMinSeverity = 1;
inline constexpr int kMaxSeverity = 10;

} // namespace reliefroute::core
