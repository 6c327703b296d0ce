/* Core type aliases, road condition/traffic tags and helper structs. */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace reliefroute::core {

// Node and edge identifiers inside a compiled RoadGraph are signed 32-bit
// indices. External location identifiers are strings.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using LocationId = std::string;
using Cost = double;  // Travel time (hours) or distance (km); +inf when unreachable

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
// Injectable time source; the engine uses Clock::now when none is given.
using ClockFn = std::function<Timestamp()>;
// Injectable random source for every randomized component.
using RandomEngine = std::mt19937_64;

// Road condition tags. Each tag carries its traversal-time multiplier as data
// (see condition_multiplier); Blocked carries +inf.
enum class RoadCondition : std::uint8_t {
  Excellent = 0,
  Good = 1,
  Fair = 2,
  Poor = 3,
  Damaged = 4,
  Blocked = 5
};

enum class TrafficLevel : std::uint8_t {
  Light = 0,
  Moderate = 1,
  Heavy = 2,
  Severe = 3
};

inline constexpr std::size_t kNumRoadConditions = 6;
inline constexpr std::size_t kNumTrafficLevels = 4;

struct ConditionInfo {
  std::string_view name;
  double multiplier;
};

inline constexpr std::array<ConditionInfo, kNumRoadConditions> kConditionTable {{
  {"EXCELLENT", 1.0},
  {"GOOD", 1.2},
  {"FAIR", 1.5},
  {"POOR", 2.0},
  {"DAMAGED", 3.0},
  {"BLOCKED", std::numeric_limits<double>::infinity()},
}};

inline constexpr std::array<ConditionInfo, kNumTrafficLevels> kTrafficTable {{
  {"LIGHT", 1.0},
  {"MODERATE", 1.3},
  {"HEAVY", 1.8},
  {"SEVERE", 2.5},
}};

[[nodiscard]] constexpr double condition_multiplier(RoadCondition c) noexcept {
  return kConditionTable[static_cast<std::size_t>(c)].multiplier;
}

[[nodiscard]] constexpr double traffic_multiplier(TrafficLevel t) noexcept {
  return kTrafficTable[static_cast<std::size_t>(t)].multiplier;
}

// Blocked is compared by tag, never by ordering multipliers.
[[nodiscard]] constexpr bool is_blocked(RoadCondition c) noexcept {
  return c == RoadCondition::Blocked;
}

[[nodiscard]] std::string_view to_string(RoadCondition c) noexcept;
[[nodiscard]] std::string_view to_string(TrafficLevel t) noexcept;
// Case-insensitive; nullopt for unknown names.
[[nodiscard]] std::optional<RoadCondition> parse_road_condition(std::string_view name);
[[nodiscard]] std::optional<TrafficLevel> parse_traffic_level(std::string_view name);

// Path cost metric: effective travel time or base distance.
enum class PathMetric {
  Time = 1,
  Distance = 2
};

enum class LocationKind {
  ReliefCenter = 1,
  DisasterZone = 2,
  Transit = 3
};

// Ordered (from, to) pair identifying a directed route segment.
struct SegmentKey {
  LocationId from;
  LocationId to;
  friend bool operator==(const SegmentKey& a, const SegmentKey& b) noexcept {
    return a.from == b.from && a.to == b.to;
  }
};

struct SegmentKeyHash {
  std::size_t operator()(const SegmentKey& k) const noexcept {
    std::size_t h = 0;
    auto combine = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    combine(std::hash<std::string>{}(k.from));
    combine(std::hash<std::string>{}(k.to));
    return h;
  }
};

} // namespace reliefroute::core
