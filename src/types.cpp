/*
  Road condition and traffic tag names.
*/
#include "reliefroute/core/types.hpp"

#include <algorithm>
#include <cctype>

namespace reliefroute::core {

namespace {
bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}
} // namespace

std::string_view to_string(RoadCondition c) noexcept {
  return kConditionTable[static_cast<std::size_t>(c)].name;
}

std::string_view to_string(TrafficLevel t) noexcept {
  return kTrafficTable[static_cast<std::size_t>(t)].name;
}

std::optional<RoadCondition> parse_road_condition(std::string_view name) {
  for (std::size_t i = 0; i < kConditionTable.size(); ++i) {
    if (iequals(kConditionTable[i].name, name)) return static_cast<RoadCondition>(i);
  }
  return std::nullopt;
}

std::optional<TrafficLevel> parse_traffic_level(std::string_view name) {
  for (std::size_t i = 0; i < kTrafficTable.size(); ++i) {
    if (iequals(kTrafficTable[i].name, name)) return static_cast<TrafficLevel>(i);
  }
  return std::nullopt;
}

} // namespace reliefroute::core
