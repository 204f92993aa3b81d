#include <catch2/catch.hpp>

#include <f1s/json_io.hpp>
#include <f1s/scenarios.hpp>

using namespace f1s;

TEST_CASE("scenario catalog") {
  const auto& cat = scenario_catalog();
  REQUIRE(cat.size() == 4);
  for (const auto& s : cat) {
    REQUIRE_FALSE(s.tire_sequence.empty());
    // Either fixed laps or a trigger, never neither.
    REQUIRE((!s.target_pit_laps.empty() || s.trigger.has_value()));
  }
}

TEST_CASE("scenario_by_key") {
  auto two = scenario_by_key("conservative_two_stop");
  REQUIRE(two.has_value());
  REQUIRE(two->target_pit_laps == std::vector<int>{15, 35});
  REQUIRE(two->tire_sequence.size() == 3);
  REQUIRE(two->risk_level == "Low");

  auto undercut = scenario_by_key("undercut_aggressive");
  REQUIRE(undercut.has_value());
  REQUIRE(undercut->trigger.has_value());

  REQUIRE_FALSE(scenario_by_key("three_stop").has_value());
}

TEST_CASE("scenario json omits absent fields") {
  nlohmann::json one = *scenario_by_key("aggressive_one_stop");
  REQUIRE(one["target_pit_laps"] == nlohmann::json::array({30}));
  REQUIRE_FALSE(one.contains("trigger"));

  nlohmann::json over = *scenario_by_key("overcut_defensive");
  REQUIRE_FALSE(over.contains("target_pit_laps"));
  REQUIRE(over.contains("trigger"));
}
