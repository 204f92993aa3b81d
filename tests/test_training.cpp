#include <catch2/catch.hpp>
#include <filesystem>
#include <memory>

#include <f1s/errors.hpp>
#include <f1s/training.hpp>

using Catch::Detail::Approx;
using namespace f1s;

namespace fs = std::filesystem;

// Session 1: ten drivers running in fixed order for 40 laps, SOFT until a
// stop on lap 20, then HARD. Other session keys are empty.
class FakeSessions : public SessionSource {
public:
  std::vector<RawSessionRecord> fetch(int session_key) override {
    ++calls;
    std::vector<RawSessionRecord> out;
    if (session_key != 1) return out;
    for (int driver = 1; driver <= 10; ++driver) {
      for (int l = 1; l <= 40; ++l) {
        RawSessionRecord r;
        r.session_key = 1;
        r.driver_number = driver;
        r.lap_number = l;
        const bool first = l <= 20;
        const int age = first ? l - 1 : l - 21;
        r.lap_duration = 90.0 + 0.05 * age + 0.1 * driver;
        r.compound = first ? "SOFT" : "HARD";
        r.stint_number = first ? 1 : 2;
        r.tire_age = age;
        r.track_temperature = 35.0;
        r.air_temperature = 25.0;
        r.humidity = 50.0;
        r.position = driver;
        r.interval = driver == 1 ? 0.0 : (l % 2 == 0 ? 2.0 : 2.5);
        r.pit_in = l == 20;
        out.push_back(r);
      }
    }
    return out;
  }

  int calls = 0;
};

static EngineSettings small_settings(const fs::path& dir) {
  EngineSettings s;
  s.training.models_dir = dir.string();
  s.training.max_estimators = 10;
  s.synthetic.tire_samples = 300;
  s.synthetic.pit_samples = 400;
  s.synthetic.pace_samples = 300;
  s.synthetic.position_samples = 0;
  return s;
}

static fs::path scratch_dir(const std::string& name) {
  auto p = fs::temp_directory_path() / ("f1s_training_" + name);
  fs::remove_all(p);
  return p;
}

TEST_CASE("training without session data uses the synthetic pool") {
  const auto dir = scratch_dir("no_sessions");
  ModelRegistry reg(dir.string());
  TrainingService svc(reg, nullptr, small_settings(dir));

  const auto r = svc.train(Domain::TireStrategy, TrainRequest{});
  REQUIRE(r.model == "tire_strategy");
  REQUIRE(r.real_samples == 0);
  REQUIRE(r.synthetic_samples == 300);
  REQUIRE(r.metrics.data_breakdown.real == 0);
  REQUIRE(r.real_data_weight == Approx(0.0));
  REQUIRE(r.synthetic_data_weight == Approx(1.0));
  REQUIRE(reg.state(Domain::TireStrategy) == ModelState::Ready);
  fs::remove_all(dir);
}

TEST_CASE("real examples carry their configured influence") {
  const auto dir = scratch_dir("influence");
  ModelRegistry reg(dir.string());
  auto sessions = std::make_shared<FakeSessions>();
  TrainingService svc(reg, sessions, small_settings(dir));

  TrainRequest req;
  req.real_data_weight = 0.8;
  req.synthetic_data_weight = 0.2;
  req.session_keys = {1};

  const auto r = svc.train(Domain::PitStop, req);
  // Stint 1 of each driver: 10 * 20 laps.
  REQUIRE(r.real_samples == 200);
  // (400 - 200) * 0.2
  REQUIRE(r.synthetic_samples == 40);
  REQUIRE(r.real_data_weight == Approx(0.8));
  REQUIRE(r.metrics.real_influence == Approx(0.8));
  REQUIRE(r.metrics.scores.count("in_pit_window_accuracy_real") == 1);
  fs::remove_all(dir);
}

TEST_CASE("weights are normalised before blending") {
  const auto dir = scratch_dir("normalise");
  ModelRegistry reg(dir.string());
  TrainingService svc(reg, std::make_shared<FakeSessions>(), small_settings(dir));

  TrainRequest req;
  req.real_data_weight = 3.0;
  req.synthetic_data_weight = 1.0;
  req.session_keys = {1};
  const auto r = svc.train(Domain::PitStop, req);
  REQUIRE(r.real_data_weight == Approx(0.75));
  REQUIRE(r.synthetic_data_weight == Approx(0.25));
  fs::remove_all(dir);
}

TEST_CASE("hybrid mode off ignores session data") {
  const auto dir = scratch_dir("no_hybrid");
  ModelRegistry reg(dir.string());
  auto sessions = std::make_shared<FakeSessions>();
  TrainingService svc(reg, sessions, small_settings(dir));

  TrainRequest req;
  req.hybrid_mode = false;
  req.session_keys = {1};
  const auto r = svc.train(Domain::RacePace, req);
  REQUIRE(sessions->calls == 0);
  REQUIRE(r.real_samples == 0);
  REQUIRE(r.synthetic_samples == 300);
  REQUIRE(r.synthetic_data_weight == Approx(1.0));
  fs::remove_all(dir);
}

TEST_CASE("unknown session keys fall back to synthetic data") {
  const auto dir = scratch_dir("unknown_keys");
  ModelRegistry reg(dir.string());
  TrainingService svc(reg, std::make_shared<FakeSessions>(), small_settings(dir));

  TrainRequest req;
  req.session_keys = {99};
  const auto r = svc.train(Domain::RacePace, req);
  REQUIRE(r.real_samples == 0);
  REQUIRE(r.synthetic_samples == 300);
  fs::remove_all(dir);
}

TEST_CASE("invalid weights are rejected before any work") {
  const auto dir = scratch_dir("bad_weights");
  ModelRegistry reg(dir.string());
  auto sessions = std::make_shared<FakeSessions>();
  TrainingService svc(reg, sessions, small_settings(dir));

  TrainRequest req;
  req.real_data_weight = -0.5;
  req.session_keys = {1};
  REQUIRE_THROWS_AS(svc.train(Domain::PitStop, req), ConfigError);
  REQUIRE_THROWS_AS(svc.train_all(req), ConfigError);
  REQUIRE(sessions->calls == 0);
  REQUIRE(reg.state(Domain::PitStop) == ModelState::NotLoaded);
}

TEST_CASE("train_all isolates a failing domain") {
  const auto dir = scratch_dir("train_all");
  ModelRegistry reg(dir.string());
  auto sessions = std::make_shared<FakeSessions>();
  TrainingService svc(reg, sessions, small_settings(dir));

  TrainRequest req;
  req.session_keys = {1};
  const auto outcomes = svc.train_all(req);
  REQUIRE(outcomes.size() == 4);
  REQUIRE(sessions->calls == 1);

  for (const auto& o : outcomes) {
    if (o.domain == Domain::Position) {
      // Nobody changes places and no synthetic pool is configured.
      REQUIRE_FALSE(o.ok);
      REQUIRE_FALSE(o.error.empty());
      REQUIRE(reg.state(Domain::Position) == ModelState::Error);
    } else {
      REQUIRE(o.ok);
      REQUIRE(o.result.has_value());
      REQUIRE(reg.state(o.domain) == ModelState::Ready);
    }
  }
  fs::remove_all(dir);
}
