#include <f1s/scenarios.hpp>
#include <algorithm>

namespace f1s {

static std::vector<Scenario> make_catalog_builtin() {
  std::vector<Scenario> v;
  v.push_back(Scenario{"aggressive_one_stop", "Aggressive One-Stop",
                       "Maximise stint length for a single pit stop",
                       {"MEDIUM", "HARD"}, {30}, std::nullopt, "Medium"});
  v.push_back(Scenario{"conservative_two_stop", "Conservative Two-Stop",
                       "Safer strategy with two pit stops",
                       {"SOFT", "MEDIUM", "MEDIUM"}, {15, 35}, std::nullopt, "Low"});
  v.push_back(Scenario{"undercut_aggressive", "Undercut Strategy",
                       "Early pit to gain track position",
                       {"MEDIUM", "HARD"}, {}, std::string("When within 2s of the car ahead"), "High"});
  v.push_back(Scenario{"overcut_defensive", "Overcut Strategy",
                       "Stay out to benefit from a clear track",
                       {"HARD", "MEDIUM"}, {}, std::string("When the car behind pits first"), "Medium"});
  return v;
}

const std::vector<Scenario>& scenario_catalog() {
  static const std::vector<Scenario> cat = make_catalog_builtin();
  return cat;
}

std::optional<Scenario> scenario_by_key(const std::string& key) {
  const auto& cat = scenario_catalog();
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Scenario& s){ return s.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

} // namespace f1s
