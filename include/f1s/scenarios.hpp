#pragma once
#include <optional>
#include <string>
#include <vector>

namespace f1s {

// Pre-configured race strategy archetype.
struct Scenario {
  std::string key;                       // "aggressive_one_stop", ...
  std::string name;
  std::string description;
  std::vector<std::string> tire_sequence;
  std::vector<int> target_pit_laps;      // empty for trigger-based plans
  std::optional<std::string> trigger;
  std::string risk_level;                // Low | Medium | High
};

// Built-in catalog.
const std::vector<Scenario>& scenario_catalog();

std::optional<Scenario> scenario_by_key(const std::string& key);

} // namespace f1s
