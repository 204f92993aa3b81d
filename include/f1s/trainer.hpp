#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <f1s/artifact.hpp>
#include <f1s/blend.hpp>
#include <f1s/config.hpp>
#include <f1s/forest.hpp>

namespace f1s {

// One fitted label target of a domain.
struct TargetSpec {
  std::string target;
  EstimatorKind kind;
  int n_classes = 0;      // classifiers only
  int max_depth = 6;
  int n_estimators = 100;
};

const std::vector<TargetSpec>& target_table(Domain d);

struct TrainTestSplit {
  std::vector<std::size_t> train;
  std::vector<std::size_t> test;
};

// Deterministic shuffle, then the first floor(n * test_fraction) indices are
// held out. The training side is never empty for n > 0.
TrainTestSplit train_test_split(std::size_t n, double test_fraction, unsigned seed);

// Rescales blend weights per source (w * N / n_source) so each source's total
// influence equals its blend weight regardless of how many examples it has.
std::vector<double> fit_weights(const std::vector<TrainingExample>& examples);

// Share of the summed weights carried by real examples.
double real_influence(const std::vector<TrainingExample>& examples, const std::vector<double>& weights);

class ModelTrainer {
public:
  explicit ModelTrainer(TrainingSettings settings) : settings_(std::move(settings)) {}

  // Full refit of every target of the domain. Throws TrainingFailure for an
  // empty set or an unusable label; SchemaError when an example lacks a
  // feature or label.
  std::unique_ptr<ModelArtifact> train(Domain d, const BlendResult& data) const;

private:
  TrainingSettings settings_;
};

} // namespace f1s
