#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>

#include <f1s/artifact.hpp>
#include <f1s/blend.hpp>
#include <f1s/errors.hpp>
#include <f1s/features.hpp>
#include <f1s/requests.hpp>
#include <f1s/synthetic.hpp>
#include <f1s/trainer.hpp>

using Catch::Detail::Approx;
using namespace f1s;

namespace fs = std::filesystem;

static fs::path scratch_dir(const std::string& name) {
  auto p = fs::temp_directory_path() / ("f1s_artifact_" + name);
  fs::remove_all(p);
  return p;
}

TEST_CASE("artifact_path names the file after the domain") {
  REQUIRE(fs::path(artifact_path("models", Domain::RacePace)).filename() == "race_pace_model.json");
}

TEST_CASE("save_artifact and load_artifact preserve predictions") {
  TrainingSettings ts;
  ts.max_estimators = 5;
  SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 42);
  auto data = blend({}, gen.generate(Domain::RacePace, 150), 0.7, 0.3);
  auto a = ModelTrainer(ts).train(Domain::RacePace, data);

  const auto dir = scratch_dir("roundtrip");
  const auto path = artifact_path((dir / "nested").string(), Domain::RacePace);
  save_artifact(*a, path);
  REQUIRE(fs::exists(path));
  REQUIRE_FALSE(fs::exists(path + ".tmp"));

  auto back = load_artifact(path);
  REQUIRE(back.has_value());
  REQUIRE(back->domain == Domain::RacePace);
  REQUIRE(back->feature_schema == a->feature_schema);
  REQUIRE(back->trained_at == a->trained_at);
  REQUIRE(back->metrics.scores == a->metrics.scores);
  REQUIRE(back->metrics.train_samples == a->metrics.train_samples);

  const auto row = encode(Domain::RacePace, to_features(RacePaceRequest{}));
  REQUIRE(back->estimator("lap_time").predict(row) == a->estimator("lap_time").predict(row));
  fs::remove_all(dir);
}

TEST_CASE("load_artifact distinguishes missing from malformed") {
  const auto dir = scratch_dir("malformed");
  REQUIRE_FALSE(load_artifact((dir / "absent.json").string()).has_value());

  fs::create_directories(dir);
  const auto bad = (dir / "bad.json").string();
  {
    std::ofstream out(bad);
    out << "{not json";
  }
  REQUIRE_THROWS_AS(load_artifact(bad), Error);

  const auto wrong = (dir / "wrong.json").string();
  {
    std::ofstream out(wrong);
    out << R"({"domain": "weather", "model_name": "x"})";
  }
  REQUIRE_THROWS_AS(load_artifact(wrong), Error);
  fs::remove_all(dir);
}
