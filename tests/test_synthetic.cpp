#include <catch2/catch.hpp>
#include <random>

#include <f1s/features.hpp>
#include <f1s/synthetic.hpp>

using Catch::Detail::Approx;
using namespace f1s;

TEST_CASE("rule_compound precedence") {
  REQUIRE(rule_compound(90.0, 45.0, 40.0) == Compound::Wet);
  REQUIRE(rule_compound(75.0, 45.0, 40.0) == Compound::Intermediate);
  REQUIRE(rule_compound(10.0, 45.0, 40.0) == Compound::Hard);
  REQUIRE(rule_compound(10.0, 45.0, 10.0) == Compound::Medium);
  REQUIRE(rule_compound(10.0, 20.0, 40.0) == Compound::Soft);
  REQUIRE(rule_compound(10.0, 30.0, 10.0) == Compound::Soft);
  REQUIRE(rule_compound(10.0, 30.0, 30.0) == Compound::Medium);
}

TEST_CASE("pit window and undercut rules") {
  PitSettings pit;
  REQUIRE(rule_in_pit_window(20, 30, pit));
  REQUIRE_FALSE(rule_in_pit_window(10, 30, pit));
  REQUIRE_FALSE(rule_in_pit_window(20, 5, pit));
  REQUIRE_FALSE(rule_in_pit_window(31, 30, pit));

  REQUIRE(rule_undercut(2.0, 22.0, 20, 15, true, pit));
  REQUIRE_FALSE(rule_undercut(4.0, 22.0, 20, 15, true, pit));   // gap >= 3.3
  REQUIRE_FALSE(rule_undercut(2.0, 22.0, 20, 25, true, pit));
  REQUIRE_FALSE(rule_undercut(2.0, 22.0, 20, 15, false, pit));
}

TEST_CASE("position rules") {
  REQUIRE(rule_overtake(0.5, -0.4, true, 50.0));
  REQUIRE_FALSE(rule_overtake(0.5, -0.4, false, 50.0));
  REQUIRE_FALSE(rule_overtake(0.5, -0.4, true, 80.0));

  REQUIRE(rule_position_change(true, 0.1, 1.0) == 2);
  REQUIRE(rule_position_change(false, 0.3, 0.5) == 0);
  REQUIRE(rule_position_change(false, 2.0, 0.5) == 1);

  REQUIRE(rule_final_position(5, 20, 2) == Approx(2.0));
  REQUIRE(rule_final_position(19, 20, 0) == Approx(20.0));
  REQUIRE(rule_final_position(1, 30, 2) == Approx(1.0));
}

TEST_CASE("draw_neutralisation caps the combined probability") {
  std::mt19937 rng(7);
  int green = 0;
  for (int i = 0; i < 200; ++i)
    if (draw_neutralisation(0.9, 0.9, rng) == Neutralisation::Green) ++green;
  REQUIRE(green == 0);

  std::mt19937 rng2(7);
  for (int i = 0; i < 50; ++i) REQUIRE(draw_neutralisation(0.0, 0.0, rng2) == Neutralisation::Green);
}

TEST_CASE("synthetic_pool_size") {
  SyntheticSettings s;
  REQUIRE(synthetic_pool_size(Domain::TireStrategy, 0, 0.3, 100, s) == 1000);
  REQUIRE(synthetic_pool_size(Domain::PitStop, 50, 0.3, 100, s) == 800);
  REQUIRE(synthetic_pool_size(Domain::PitStop, 400, 0.5, 100, s) == 200);
  REQUIRE(synthetic_pool_size(Domain::Position, 900, 0.5, 100, s) == 0);
}

TEST_CASE("SyntheticGenerator output is complete and labelled") {
  SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 42);
  for (Domain d : kAllDomains) {
    auto ex = gen.generate(d, 200);
    REQUIRE(ex.size() == 200);
    for (const auto& e : ex) {
      REQUIRE(e.domain == d);
      REQUIRE(e.source == Source::Synthetic);
      REQUIRE(e.confidence == Approx(0.3));
      REQUIRE_NOTHROW(encode(d, e.features));
      REQUIRE_NOTHROW(require_labels(d, e.labels));
    }
  }
}

TEST_CASE("SyntheticGenerator respects rule invariants") {
  SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 3);
  PitSettings pit;

  for (const auto& e : gen.generate(Domain::TireStrategy, 300)) {
    const auto& f = e.features;
    REQUIRE(f.at("remaining_laps") == Approx(f.at("total_laps") - f.at("current_lap")));
    const auto c = rule_compound(f.at("rain_probability"), f.at("track_temperature"), f.at("remaining_laps"));
    REQUIRE(e.labels.at("compound") == Approx(static_cast<int>(c)));
    REQUIRE(e.labels.at("stint_length") >= 5.0);
    REQUIRE(e.labels.at("stint_length") <= 50.0);
    REQUIRE(e.labels.at("degradation_rate") >= 0.01);
    REQUIRE(e.labels.at("degradation_rate") <= 0.15);
  }

  for (const auto& e : gen.generate(Domain::PitStop, 300)) {
    const auto& f = e.features;
    const bool window = rule_in_pit_window(f.at("tire_age"), f.at("remaining_laps"), pit);
    REQUIRE(e.labels.at("in_pit_window") == Approx(window ? 1.0 : 0.0));
    if (e.labels.at("undercut") > 0.5) REQUIRE(window);
    REQUIRE(e.labels.at("pit_lap") >= f.at("current_lap"));
  }

  for (const auto& e : gen.generate(Domain::Position, 300)) {
    if (e.labels.at("overtake") > 0.5) REQUIRE(e.labels.at("position_change") == Approx(2.0));
    REQUIRE(e.labels.at("final_position") >= 1.0);
    REQUIRE(e.labels.at("final_position") <= 20.0);
  }
}

TEST_CASE("SyntheticGenerator is deterministic per seed") {
  SyntheticGenerator a(SyntheticSettings{}, PitSettings{}, 11);
  SyntheticGenerator b(SyntheticSettings{}, PitSettings{}, 11);
  SyntheticGenerator c(SyntheticSettings{}, PitSettings{}, 12);

  const auto x = a.generate(Domain::RacePace, 20);
  const auto y = b.generate(Domain::RacePace, 20);
  const auto z = c.generate(Domain::RacePace, 20);
  REQUIRE(x.front().features == y.front().features);
  REQUIRE(x.back().labels == y.back().labels);
  REQUIRE(x.front().features != z.front().features);
}

TEST_CASE("SyntheticGenerator widens observed temperatures") {
  std::vector<TrainingExample> real(2);
  real[0].features["track_temperature"] = 30.0;
  real[0].features["air_temperature"] = 20.0;
  real[1].features["track_temperature"] = 32.0;
  real[1].features["air_temperature"] = 22.0;

  const auto obs = observed_ranges(real);
  REQUIRE(obs.track_temperature->first == Approx(30.0));
  REQUIRE(obs.track_temperature->second == Approx(32.0));

  SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 5);
  for (const auto& e : gen.generate(Domain::TireStrategy, 100, real)) {
    REQUIRE(e.features.at("track_temperature") >= 25.0);
    REQUIRE(e.features.at("track_temperature") <= 37.0);
    REQUIRE(e.features.at("air_temperature") >= 15.0);
    REQUIRE(e.features.at("air_temperature") <= 27.0);
  }
}
