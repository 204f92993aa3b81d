#include <catch2/catch.hpp>
#include <algorithm>
#include <limits>

#include <f1s/heuristics.hpp>

using Catch::Detail::Approx;
using namespace f1s;

static bool contains(const std::vector<std::string>& v, const std::string& needle) {
  return std::any_of(v.begin(), v.end(), [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

TEST_CASE("matching_rules keeps table order and limit") {
  const std::vector<Rule<int>> rules{
    {[](const int& x) { return x > 0; }, "positive {x}"},
    {[](const int& x) { return x > 5; }, "big"},
    {[](const int& x) { return x > 1; }, "more than one"},
  };
  auto all = matching_rules(rules, 10, 10, {{"x", "10"}});
  REQUIRE(all == std::vector<std::string>{"positive 10", "big", "more than one"});
  REQUIRE(matching_rules(rules, 10, 2).size() == 2);
  REQUIRE(first_rule(rules, 3).value() == "positive {x}");
  REQUIRE_FALSE(first_rule(rules, -1).has_value());
}

TEST_CASE("pit_urgency") {
  PitSettings pit;
  SECTION("sits at 50 at the margin") {
    REQUIRE(pit_urgency(20, 0.0, pit) == 50);
  }
  SECTION("bounded and non-decreasing in tire age") {
    for (double deg : {0.0, 0.05, 0.12}) {
      int prev = -1;
      for (int age = 0; age <= 60; ++age) {
        const int u = pit_urgency(age, deg, pit);
        REQUIRE(u >= 0);
        REQUIRE(u <= 100);
        REQUIRE(u >= prev);
        prev = u;
      }
    }
  }
  SECTION("extreme inputs stay in range") {
    constexpr int lo = std::numeric_limits<int>::min();
    constexpr int hi = std::numeric_limits<int>::max();
    REQUIRE(pit_urgency(lo + 5, 0.05, pit) == 0);
    REQUIRE(pit_urgency(lo, 0.0, pit) == 0);
    REQUIRE(pit_urgency(hi, 0.05, pit) == 100);
    REQUIRE(pit_urgency(hi, std::numeric_limits<double>::infinity(), pit) == 100);
    REQUIRE(pit_urgency(20, std::numeric_limits<double>::infinity(), pit) == 50);
  }
  SECTION("degradation steepens the curve") {
    REQUIRE(pit_urgency(30, 0.1, pit) > pit_urgency(30, 0.0, pit));
  }
}

TEST_CASE("undercut_opportunity") {
  PitSettings pit;
  REQUIRE(undercut_opportunity(5.0, 22.0, 10, 20, pit));
  REQUIRE_FALSE(undercut_opportunity(25.0, 22.0, 10, 20, pit));
  REQUIRE_FALSE(undercut_opportunity(5.0, 22.0, 10, 13, pit));
  REQUIRE_FALSE(undercut_opportunity(5.0, 22.0, std::numeric_limits<int>::max(), 0, pit));
}

TEST_CASE("pit_recommendation precedence") {
  PitStopRequest req;
  REQUIRE(pit_recommendation(true, true, 90, req).rfind("CRITICAL", 0) == 0);
  REQUIRE(pit_recommendation(true, true, 60, req).rfind("UNDERCUT", 0) == 0);
  REQUIRE(pit_recommendation(true, false, 60, req) == "WINDOW OPEN: good time to pit - within optimal range");
  REQUIRE(pit_recommendation(true, false, 40, req) == "WINDOW OPEN: pit window available, monitor gaps");
  REQUIRE(pit_recommendation(false, false, 40, req) == "STAY OUT: continue current stint");
  req.safety_car_deployed = true;
  REQUIRE(pit_recommendation(false, false, 40, req).rfind("SAFETY CAR", 0) == 0);
}

TEST_CASE("strategy_options") {
  PitStopRequest req;
  req.current_lap = 20;
  req.total_laps = 50;
  req.remaining_laps = 30;

  SECTION("three options when an earlier stop is possible") {
    auto opts = strategy_options(req, 28);
    REQUIRE(opts.size() == 3);
    REQUIRE(opts[0].name == "Optimal");
    REQUIRE(opts[0].compound == "MEDIUM");
    REQUIRE(opts[0].risk == "Low");
    REQUIRE(opts[1].pit_lap == 33);
    REQUIRE(opts[1].risk == "High");
    REQUIRE(opts[2].pit_lap == 25);
    REQUIRE(opts[2].risk == "Medium");
  }
  SECTION("no aggressive option at the current lap") {
    auto opts = strategy_options(req, 20);
    REQUIRE(opts.size() == 2);
  }
  SECTION("conservative lap capped at race length") {
    auto opts = strategy_options(req, 48);
    REQUIRE(opts[1].pit_lap == 50);
  }
}

TEST_CASE("pace_trend_label") {
  REQUIRE(pace_trend_label({0.9, 0.8, 0.7, 0.6, 0.5}, 3) == "improving");
  REQUIRE(pace_trend_label({0.5, 0.6, 0.7, 0.6, 0.5}, 3) == "improving");
  REQUIRE(pace_trend_label({0.5, 0.6, 0.7, 0.8, 0.9}, 3) == "degrading");
  REQUIRE(pace_trend_label({0.9, 0.8, 0.8}, 3) == "degrading");
  REQUIRE(pace_trend_label({0.4}, 3) == "degrading");
}

TEST_CASE("assess_performance bands") {
  RacePaceRequest req;
  req.best_lap_time = 88.0;
  req.avg_lap_time = 89.0;
  REQUIRE(assess_performance(88.2, req, "improving").level == "EXCELLENT");
  REQUIRE(assess_performance(88.7, req, "improving").level == "GOOD");
  REQUIRE(assess_performance(89.2, req, "improving").level == "AVERAGE");
  const auto slow = assess_performance(90.0, req, "degrading");
  REQUIRE(slow.level == "BELOW PAR");
  REQUIRE(slow.color == "red");
  REQUIRE(slow.delta_to_best == Approx(2.0));
  REQUIRE(slow.delta_to_average == Approx(1.0));
}

TEST_CASE("pace_recommendations") {
  RacePaceRequest req;
  req.fuel_load = 50.0;
  req.push_level = 90.0;
  REQUIRE(pace_recommendations(0.0, req) == std::vector<std::string>{"Pace is stable - maintain current rhythm"});

  req.fuel_load = 95.0;
  auto recs = pace_recommendations(0.15, req);
  REQUIRE(contains(recs, "0.150s/lap"));
  REQUIRE(contains(recs, "Heavy fuel load"));
}

TEST_CASE("attack and defense analysis") {
  PositionRequest req;
  req.gap_to_car_ahead = 0.6;
  req.gap_to_car_behind = 1.0;
  req.relative_pace = -0.3;

  const auto atk = attack_analysis(req, 0.45);
  REQUIRE(atk.recommended_action == "ATTACK");
  REQUIRE(atk.probability == Approx(45.0));
  REQUIRE(contains(atk.factors, "Within striking distance"));
  REQUIRE(attack_analysis(req, 0.2).recommended_action == "PRESSURE");

  const auto def = defense_analysis(req, 0.35);
  REQUIRE(def.threat_level == "HIGH");
  REQUIRE(def.recommended_action == "DEFEND");
  req.gap_to_car_behind = 4.0;
  REQUIRE(defense_analysis(req, 0.1).threat_level == "LOW");
  REQUIRE(defense_analysis(req, 0.1).recommended_action == "MAINTAIN");
}

TEST_CASE("battle_status") {
  REQUIRE(battle_status(1.0, 1.2) == "IN BATTLE - 1.0s to the car ahead, 1.2s to the car behind");
  REQUIRE(battle_status(1.0, 3.0) == "ATTACKING - car ahead at 1.0s");
  REQUIRE(battle_status(3.0, 0.8) == "DEFENDING - under pressure at 0.8s");
  REQUIRE(battle_status(6.0, 7.0) == "CLEAN AIR - no immediate battle");
  REQUIRE(battle_status(3.0, 7.0) == "MONITORING - gaps manageable");
}

TEST_CASE("tactical_recommendations honours the limit and fallback") {
  PositionRequest req;
  req.gap_to_car_ahead = 1.0;
  req.gap_to_car_behind = 0.5;
  req.tire_advantage = 12;
  req.remaining_laps = 5;

  auto recs = tactical_recommendations(req, 0.6, 0.4, 4);
  REQUIRE(recs.size() == 4);
  REQUIRE(recs[0] == "High overtake probability - commit to the move");
  REQUIRE(recs[2] == "Tire advantage (12 laps) - attack late in the stint");

  PositionRequest calm;
  calm.gap_to_car_ahead = 5.0;
  calm.gap_to_car_behind = 5.0;
  REQUIRE(tactical_recommendations(calm, 0.1, 0.1, 4) == std::vector<std::string>{"Maintain current strategy"});
}
