#include <catch2/catch.hpp>
#include <set>

#include <f1s/blend.hpp>
#include <f1s/errors.hpp>
#include <f1s/features.hpp>
#include <f1s/synthetic.hpp>
#include <f1s/trainer.hpp>

using Catch::Detail::Approx;
using namespace f1s;

static TrainingSettings small_training() {
  TrainingSettings s;
  s.max_estimators = 10;
  return s;
}

TEST_CASE("target_table covers every label") {
  for (Domain d : kAllDomains) {
    const auto& labels = label_schema(d);
    const auto& specs = target_table(d);
    REQUIRE(specs.size() == labels.size());
    for (std::size_t i = 0; i < specs.size(); ++i) REQUIRE(specs[i].target == labels[i]);
  }
  REQUIRE(target_table(Domain::TireStrategy)[0].n_classes == kCompoundCount);
  REQUIRE(target_table(Domain::Position)[1].n_classes == 3);
}

TEST_CASE("train_test_split") {
  SECTION("disjoint and complete") {
    auto s = train_test_split(100, 0.2, 42);
    REQUIRE(s.test.size() == 20);
    REQUIRE(s.train.size() == 80);
    std::set<std::size_t> all(s.train.begin(), s.train.end());
    all.insert(s.test.begin(), s.test.end());
    REQUIRE(all.size() == 100);
  }
  SECTION("deterministic per seed") {
    REQUIRE(train_test_split(50, 0.2, 7).test == train_test_split(50, 0.2, 7).test);
  }
  SECTION("training side never empty") {
    auto s = train_test_split(1, 0.9, 1);
    REQUIRE(s.train.size() == 1);
    REQUIRE(s.test.empty());
  }
}

TEST_CASE("fit_weights make source influence equal the blend weight") {
  std::vector<TrainingExample> ex(10);
  for (std::size_t i = 0; i < ex.size(); ++i) {
    const bool real = i < 2;
    ex[i].source = real ? Source::Real : Source::Synthetic;
    ex[i].weight = real ? 0.8 : 0.2;
  }
  const auto w = fit_weights(ex);
  REQUIRE(real_influence(ex, w) == Approx(0.8));
  // 0.8 * 10 / 2
  REQUIRE(w[0] == Approx(4.0));
}

TEST_CASE("ModelTrainer trains every target and records metrics") {
  SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 42);
  auto data = blend({}, gen.generate(Domain::TireStrategy, 300), 0.7, 0.3);

  ModelTrainer trainer(small_training());
  auto a = trainer.train(Domain::TireStrategy, data);
  REQUIRE(a->model_name == "tire_strategy");
  REQUIRE(a->feature_schema == feature_schema(Domain::TireStrategy));
  REQUIRE(a->estimators.size() == 3);
  REQUIRE(a->estimator("compound").is_classifier());
  REQUIRE(a->estimator("compound").n_classes() == kCompoundCount);
  REQUIRE_FALSE(a->estimator("stint_length").is_classifier());
  REQUIRE_THROWS_AS(a->estimator("lap_time"), NotFoundError);

  const auto& m = a->metrics;
  REQUIRE(m.train_samples == 240);
  REQUIRE(m.test_samples == 60);
  REQUIRE(m.data_breakdown.real == 0);
  REQUIRE(m.data_breakdown.synthetic == 300);
  REQUIRE(m.real_influence == Approx(0.0));
  REQUIRE(m.scores.count("compound_accuracy") == 1);
  REQUIRE(m.scores.count("compound_accuracy_synthetic") == 1);
  REQUIRE(m.scores.count("compound_accuracy_real") == 0);
  REQUIRE(m.scores.count("stint_length_mae") == 1);
  REQUIRE(m.scores.at("compound_accuracy") >= 0.0);
  REQUIRE(m.scores.at("compound_accuracy") <= 1.0);
  REQUIRE_FALSE(a->trained_at.empty());
}

TEST_CASE("ModelTrainer reports real influence of a mixed set") {
  SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 42);
  auto real = gen.generate(Domain::PitStop, 100);
  for (auto& e : real) e.source = Source::Real;
  auto data = blend(std::move(real), gen.generate(Domain::PitStop, 300), 0.8, 0.2);

  auto a = ModelTrainer(small_training()).train(Domain::PitStop, data);
  REQUIRE(a->metrics.real_influence == Approx(0.8));
  REQUIRE(a->metrics.real_data_weight == Approx(0.8));
  REQUIRE(a->metrics.data_breakdown.real == 100);
}

TEST_CASE("ModelTrainer failures") {
  ModelTrainer trainer(small_training());

  SECTION("empty set") {
    REQUIRE_THROWS_AS(trainer.train(Domain::RacePace, BlendResult{}), TrainingFailure);
  }
  SECTION("missing feature") {
    SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 1);
    auto ex = gen.generate(Domain::RacePace, 20);
    ex[3].features.erase("humidity");
    auto data = blend({}, std::move(ex), 0.7, 0.3);
    REQUIRE_THROWS_AS(trainer.train(Domain::RacePace, data), SchemaError);
  }
  SECTION("single-class binary label") {
    SyntheticGenerator gen(SyntheticSettings{}, PitSettings{}, 1);
    auto ex = gen.generate(Domain::PitStop, 50);
    for (auto& e : ex) e.labels["in_pit_window"] = 0.0;
    auto data = blend({}, std::move(ex), 0.7, 0.3);
    REQUIRE_THROWS_AS(trainer.train(Domain::PitStop, data), TrainingFailure);
  }
}
