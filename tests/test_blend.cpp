#include <catch2/catch.hpp>
#include <cmath>
#include <limits>

#include <f1s/blend.hpp>
#include <f1s/errors.hpp>

using Catch::Detail::Approx;
using namespace f1s;

static std::vector<TrainingExample> pool(std::size_t n) {
  std::vector<TrainingExample> v(n);
  for (auto& e : v) e.domain = Domain::PitStop;
  return v;
}

TEST_CASE("normalise_weights") {
  SECTION("scales to a unit sum") {
    auto [r, s] = normalise_weights(7.0, 3.0);
    REQUIRE(r == Approx(0.7));
    REQUIRE(s == Approx(0.3));
  }
  SECTION("one zero weight is allowed") {
    auto [r, s] = normalise_weights(0.0, 2.0);
    REQUIRE(r == Approx(0.0));
    REQUIRE(s == Approx(1.0));
  }
  SECTION("invalid weights throw ConfigError") {
    REQUIRE_THROWS_AS(normalise_weights(-0.1, 0.5), ConfigError);
    REQUIRE_THROWS_AS(normalise_weights(0.0, 0.0), ConfigError);
    REQUIRE_THROWS_AS(normalise_weights(std::nan(""), 0.5), ConfigError);
    REQUIRE_THROWS_AS(normalise_weights(std::numeric_limits<double>::infinity(), 0.5), ConfigError);
  }
}

TEST_CASE("blend tags and weights both pools") {
  auto out = blend(pool(4), pool(6), 0.8, 0.2);
  REQUIRE(out.examples.size() == 10);
  REQUIRE(out.data_breakdown.real == 4);
  REQUIRE(out.data_breakdown.synthetic == 6);
  REQUIRE(out.real_weight == Approx(0.8));
  REQUIRE(out.synthetic_weight == Approx(0.2));

  for (std::size_t i = 0; i < out.examples.size(); ++i) {
    const auto& e = out.examples[i];
    if (i < 4) {
      REQUIRE(e.source == Source::Real);
      REQUIRE(e.weight == Approx(0.8));
    } else {
      REQUIRE(e.source == Source::Synthetic);
      REQUIRE(e.weight == Approx(0.2));
    }
  }
}

TEST_CASE("blend collapses weights when a pool is empty") {
  SECTION("no real data") {
    auto out = blend({}, pool(5), 0.7, 0.3);
    REQUIRE(out.data_breakdown.real == 0);
    REQUIRE(out.real_weight == Approx(0.0));
    REQUIRE(out.synthetic_weight == Approx(1.0));
    for (const auto& e : out.examples) REQUIRE(e.weight == Approx(1.0));
  }
  SECTION("no synthetic data") {
    auto out = blend(pool(5), {}, 0.7, 0.3);
    REQUIRE(out.real_weight == Approx(1.0));
    REQUIRE(out.synthetic_weight == Approx(0.0));
  }
}

TEST_CASE("blend validates weights even with empty pools") {
  REQUIRE_THROWS_AS(blend({}, pool(3), -1.0, 1.0), ConfigError);
}
