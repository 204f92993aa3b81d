#include <f1s/trainer.hpp>
#include <f1s/errors.hpp>
#include <f1s/features.hpp>
#include <f1s/logging.hpp>
#include <f1s/text.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace f1s {

const std::vector<TargetSpec>& target_table(Domain d) {
  using K = EstimatorKind;
  static const std::vector<TargetSpec> tire{
    {"compound", K::RandomForestClassifier, kCompoundCount, 10, 100},
    {"stint_length", K::GradientBoostingRegressor, 0, 6, 100},
    {"degradation_rate", K::GradientBoostingRegressor, 0, 6, 100},
  };
  static const std::vector<TargetSpec> pit{
    {"in_pit_window", K::GradientBoostingClassifier, 2, 6, 100},
    {"undercut", K::GradientBoostingClassifier, 2, 6, 100},
    {"pit_lap", K::GradientBoostingRegressor, 0, 6, 100},
  };
  static const std::vector<TargetSpec> pace{
    {"lap_time", K::GradientBoostingRegressor, 0, 8, 150},
    {"fuel_effect", K::RandomForestRegressor, 0, 6, 100},
    {"pace_trend", K::GradientBoostingRegressor, 0, 6, 100},
  };
  static const std::vector<TargetSpec> position{
    {"overtake", K::GradientBoostingClassifier, 2, 6, 100},
    {"position_change", K::RandomForestClassifier, 3, 8, 100},
    {"final_position", K::GradientBoostingRegressor, 0, 6, 100},
  };
  switch (d) {
    case Domain::TireStrategy: return tire;
    case Domain::PitStop:      return pit;
    case Domain::RacePace:     return pace;
    case Domain::Position:     return position;
  }
  return tire;
}

TrainTestSplit train_test_split(std::size_t n, double test_fraction, unsigned seed) {
  std::vector<std::size_t> idx(n);
  std::iota(idx.begin(), idx.end(), std::size_t{0});
  std::mt19937 rng(seed);
  std::shuffle(idx.begin(), idx.end(), rng);

  std::size_t n_test = static_cast<std::size_t>(std::floor(static_cast<double>(n) * test_fraction));
  if (n > 0 && n_test >= n) n_test = n - 1;

  TrainTestSplit s;
  s.test.assign(idx.begin(), idx.begin() + static_cast<std::ptrdiff_t>(n_test));
  s.train.assign(idx.begin() + static_cast<std::ptrdiff_t>(n_test), idx.end());
  return s;
}

std::vector<double> fit_weights(const std::vector<TrainingExample>& examples) {
  const auto counts = count_sources(examples);
  const double n = static_cast<double>(counts.total());
  std::vector<double> w;
  w.reserve(examples.size());
  for (const auto& e : examples) {
    const std::size_t n_source = e.source == Source::Real ? counts.real : counts.synthetic;
    w.push_back(e.weight * n / static_cast<double>(n_source));
  }
  return w;
}

double real_influence(const std::vector<TrainingExample>& examples, const std::vector<double>& weights) {
  double real = 0.0, total = 0.0;
  for (std::size_t i = 0; i < examples.size(); ++i) {
    total += weights[i];
    if (examples[i].source == Source::Real) real += weights[i];
  }
  return total > 0.0 ? real / total : 0.0;
}

// Score of one target on a subset: accuracy for classifiers, MAE otherwise.
static double score(const Estimator& est, const Matrix& X, const std::vector<double>& y,
                    const std::vector<std::size_t>& rows) {
  double acc = 0.0;
  for (auto i : rows) {
    const double p = est.predict(X[i]);
    acc += est.is_classifier() ? (p == y[i] ? 1.0 : 0.0) : std::abs(p - y[i]);
  }
  return acc / static_cast<double>(rows.size());
}

std::unique_ptr<ModelArtifact> ModelTrainer::train(Domain d, const BlendResult& data) const {
  const auto& examples = data.examples;
  const std::string name = domain_name(d);
  if (examples.empty()) throw TrainingFailure(name + ": no training examples");

  const auto& schema = feature_schema(d);
  Matrix X;
  X.reserve(examples.size());
  for (const auto& e : examples) {
    X.push_back(encode(schema, e.features));
    require_labels(d, e.labels);
  }

  const auto split = train_test_split(examples.size(), settings_.test_fraction, settings_.seed);
  std::vector<TrainingExample> train_set;
  train_set.reserve(split.train.size());
  for (auto i : split.train) train_set.push_back(examples[i]);
  const auto weights = fit_weights(train_set);

  Matrix X_train;
  X_train.reserve(split.train.size());
  for (auto i : split.train) X_train.push_back(X[i]);

  // Held-out rows grouped by source; the full set stands in when nothing
  // was held out.
  const auto& eval_rows = split.test.empty() ? split.train : split.test;
  std::vector<std::size_t> eval_real, eval_synthetic;
  for (auto i : eval_rows) (examples[i].source == Source::Real ? eval_real : eval_synthetic).push_back(i);

  auto artifact = std::make_unique<ModelArtifact>();
  artifact->domain = d;
  artifact->model_name = name;
  artifact->feature_schema = schema;

  for (const auto& spec : target_table(d)) {
    std::vector<double> y_all;
    y_all.reserve(examples.size());
    for (const auto& e : examples) y_all.push_back(e.labels.at(spec.target));
    std::vector<double> y_train;
    y_train.reserve(split.train.size());
    for (auto i : split.train) y_train.push_back(y_all[i]);

    EnsembleParams p;
    p.n_estimators = std::min(spec.n_estimators, std::max(1, settings_.max_estimators));
    p.max_depth = spec.max_depth;
    p.seed = settings_.seed;
    auto est = make_estimator(spec.kind, p, spec.n_classes);
    try {
      est->fit(X_train, y_train, weights);
    } catch (const TrainingFailure& e) {
      throw TrainingFailure(name + "/" + spec.target + ": " + e.what());
    }

    const std::string metric = spec.target + (est->is_classifier() ? "_accuracy" : "_mae");
    auto& scores = artifact->metrics.scores;
    scores[metric] = score(*est, X, y_all, eval_rows);
    if (!eval_real.empty()) scores[metric + "_real"] = score(*est, X, y_all, eval_real);
    if (!eval_synthetic.empty()) scores[metric + "_synthetic"] = score(*est, X, y_all, eval_synthetic);

    artifact->estimators[spec.target] = std::move(est);
  }

  auto& m = artifact->metrics;
  m.data_breakdown = data.data_breakdown;
  m.real_data_weight = data.real_weight;
  m.synthetic_data_weight = data.synthetic_weight;
  m.real_influence = real_influence(train_set, weights);
  m.train_samples = split.train.size();
  m.test_samples = split.test.size();
  artifact->trained_at = timestamp_utc();

  get_logger("trainer").info("trained model", {
    {"model", name},
    {"train_samples", std::to_string(m.train_samples)},
    {"test_samples", std::to_string(m.test_samples)},
    {"real_influence", format_fixed(m.real_influence, 3)}});
  return artifact;
}

} // namespace f1s
