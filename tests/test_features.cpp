#include <catch2/catch.hpp>
#include <set>

#include <f1s/errors.hpp>
#include <f1s/features.hpp>
#include <f1s/requests.hpp>

using Catch::Detail::Approx;
using namespace f1s;

TEST_CASE("every domain has twenty unique feature keys and three labels") {
  for (Domain d : kAllDomains) {
    const auto& schema = feature_schema(d);
    REQUIRE(schema.size() == 20);
    REQUIRE(std::set<std::string>(schema.begin(), schema.end()).size() == 20);
    REQUIRE(label_schema(d).size() == 3);
    REQUIRE_FALSE(feature_summary(d).empty());
    REQUIRE_FALSE(output_summary(d).empty());
  }
}

TEST_CASE("request feature maps cover the schema exactly") {
  const auto check = [](Domain d, const FeatureMap& f) {
    REQUIRE(f.size() == feature_schema(d).size());
    REQUIRE(encode(d, f).size() == feature_schema(d).size());
  };
  check(Domain::TireStrategy, to_features(TireStrategyRequest{}));
  check(Domain::PitStop, to_features(PitStopRequest{}));
  check(Domain::RacePace, to_features(RacePaceRequest{}));
  check(Domain::Position, to_features(PositionRequest{}));
}

TEST_CASE("encode follows schema order") {
  FeatureMap f;
  for (const auto& k : feature_schema(Domain::PitStop)) f[k] = 0.0;
  f["current_lap"] = 12.0;
  f["rain_probability"] = 40.0;

  auto row = encode(Domain::PitStop, f);
  REQUIRE(row.front() == Approx(12.0));
  REQUIRE(row.back() == Approx(40.0));
}

TEST_CASE("encode reports the missing key") {
  auto f = to_features(RacePaceRequest{});
  f.erase("best_lap_time");
  try {
    encode(Domain::RacePace, f);
    FAIL("expected SchemaError");
  } catch (const SchemaError& e) {
    REQUIRE(e.field() == "best_lap_time");
  }
}

TEST_CASE("require_labels") {
  LabelMap labels{{"overtake", 1.0}, {"position_change", 2.0}};
  REQUIRE_THROWS_AS(require_labels(Domain::Position, labels), SchemaError);
  labels["final_position"] = 3.0;
  REQUIRE_NOTHROW(require_labels(Domain::Position, labels));
}

TEST_CASE("count_sources") {
  std::vector<TrainingExample> ex(3);
  ex[1].source = Source::Synthetic;
  auto b = count_sources(ex);
  REQUIRE(b.real == 2);
  REQUIRE(b.synthetic == 1);
  REQUIRE(b.total() == 3);
}
