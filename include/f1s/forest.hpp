#pragma once
#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <f1s/example.hpp>

namespace f1s {

using Matrix = std::vector<FeatureRow>;

struct TreeParams {
  int max_depth = 6;                 // <= 0 means unlimited
  std::size_t min_samples_split = 2;
  std::size_t min_samples_leaf = 1;
  std::size_t max_features = 0;      // features tried per split, 0 = all
};

struct TreeNode {
  int feature = -1;                  // -1 marks a leaf
  double threshold = 0.0;            // go left when x[feature] <= threshold
  int left = -1;
  int right = -1;
  std::vector<double> value;         // leaf mean (MSE) or class distribution (Gini)
};

// Weighted CART tree. Leaves hold one value for regression or a normalised
// class distribution for classification.
class DecisionTree {
public:
  enum class Criterion { Mse, Gini };

  DecisionTree() = default;
  DecisionTree(Criterion criterion, TreeParams params, int n_classes = 0)
    : criterion_(criterion), params_(params), n_classes_(n_classes) {}

  void fit(const Matrix& X, const std::vector<double>& y,
           const std::vector<double>& w, std::mt19937& rng);

  // Index of the leaf reached by x.
  int apply(const FeatureRow& x) const;
  const std::vector<double>& predict(const FeatureRow& x) const { return nodes_[apply(x)].value; }

  // Gradient boosting rewrites leaf values after the structure is grown.
  void set_leaf_value(int node, double v) { nodes_[node].value.assign(1, v); }

  const std::vector<TreeNode>& nodes() const { return nodes_; }
  bool empty() const { return nodes_.empty(); }
  // Highest feature index any split reads; -1 for a single leaf.
  int max_feature() const;

  nlohmann::json to_json() const;
  // Throws std::runtime_error unless children come after their parent, split
  // features are non-negative and leaves carry one value (MSE) or n_classes
  // values (Gini).
  static DecisionTree from_json(const nlohmann::json& j, Criterion criterion, int n_classes);

private:
  struct Split {
    int feature = -1;
    double threshold = 0.0;
    double gain = 0.0;
  };

  int build_(std::vector<std::size_t>& idx, int depth, const Matrix& X,
             const std::vector<double>& y, const std::vector<double>& w, std::mt19937& rng);
  std::vector<double> leaf_value_(const std::vector<std::size_t>& idx,
                                  const std::vector<double>& y, const std::vector<double>& w) const;
  double impurity_(const std::vector<std::size_t>& idx,
                   const std::vector<double>& y, const std::vector<double>& w) const;
  Split best_split_(const std::vector<std::size_t>& idx, double parent, const Matrix& X,
                    const std::vector<double>& y, const std::vector<double>& w,
                    std::mt19937& rng) const;

  Criterion criterion_ = Criterion::Mse;
  TreeParams params_{};
  int n_classes_ = 0;
  std::vector<TreeNode> nodes_;
};

struct EnsembleParams {
  int n_estimators = 100;
  int max_depth = 6;
  double learning_rate = 0.1;        // boosting only
  std::size_t min_samples_leaf = 1;
  unsigned seed = 42;
};

enum class EstimatorKind {
  RandomForestClassifier,
  RandomForestRegressor,
  GradientBoostingClassifier,
  GradientBoostingRegressor,
};

const char* estimator_kind_name(EstimatorKind k);

// Fitted model for one label target. Sample weights are honoured by every
// implementation; features are used unscaled.
class Estimator {
public:
  virtual ~Estimator() = default;

  // Throws TrainingFailure for unusable label sets.
  virtual void fit(const Matrix& X, const std::vector<double>& y, const std::vector<double>& w) = 0;

  // Class index for classifiers, value for regressors.
  virtual double predict(const FeatureRow& x) const = 0;

  // Class probabilities summing to 1; regressors throw std::logic_error.
  virtual std::vector<double> predict_proba(const FeatureRow& x) const;

  virtual bool is_classifier() const = 0;
  virtual int n_classes() const { return 0; }
  virtual EstimatorKind kind() const = 0;
  // Highest feature index read by the fitted trees.
  virtual int max_feature() const = 0;
  virtual nlohmann::json to_json() const = 0;
};

class RandomForestClassifier : public Estimator {
public:
  RandomForestClassifier(EnsembleParams p, int n_classes) : params_(p), n_classes_(n_classes) {}

  void fit(const Matrix& X, const std::vector<double>& y, const std::vector<double>& w) override;
  double predict(const FeatureRow& x) const override;
  std::vector<double> predict_proba(const FeatureRow& x) const override;
  bool is_classifier() const override { return true; }
  int n_classes() const override { return n_classes_; }
  EstimatorKind kind() const override { return EstimatorKind::RandomForestClassifier; }
  int max_feature() const override;
  nlohmann::json to_json() const override;
  static std::unique_ptr<RandomForestClassifier> from_json(const nlohmann::json& j);

private:
  EnsembleParams params_;
  int n_classes_;
  std::vector<DecisionTree> trees_;
};

class RandomForestRegressor : public Estimator {
public:
  explicit RandomForestRegressor(EnsembleParams p) : params_(p) {}

  void fit(const Matrix& X, const std::vector<double>& y, const std::vector<double>& w) override;
  double predict(const FeatureRow& x) const override;
  bool is_classifier() const override { return false; }
  EstimatorKind kind() const override { return EstimatorKind::RandomForestRegressor; }
  int max_feature() const override;
  nlohmann::json to_json() const override;
  static std::unique_ptr<RandomForestRegressor> from_json(const nlohmann::json& j);

private:
  EnsembleParams params_;
  std::vector<DecisionTree> trees_;
};

// Squared-loss boosting.
class GradientBoostingRegressor : public Estimator {
public:
  explicit GradientBoostingRegressor(EnsembleParams p) : params_(p) {}

  void fit(const Matrix& X, const std::vector<double>& y, const std::vector<double>& w) override;
  double predict(const FeatureRow& x) const override;
  bool is_classifier() const override { return false; }
  EstimatorKind kind() const override { return EstimatorKind::GradientBoostingRegressor; }
  int max_feature() const override;
  nlohmann::json to_json() const override;
  static std::unique_ptr<GradientBoostingRegressor> from_json(const nlohmann::json& j);

private:
  EnsembleParams params_;
  double init_ = 0.0;
  std::vector<DecisionTree> trees_;
};

// Binary boosting on the binomial deviance; labels must be 0/1 and both
// classes must carry weight.
class GradientBoostingClassifier : public Estimator {
public:
  explicit GradientBoostingClassifier(EnsembleParams p) : params_(p) {}

  void fit(const Matrix& X, const std::vector<double>& y, const std::vector<double>& w) override;
  double predict(const FeatureRow& x) const override;
  std::vector<double> predict_proba(const FeatureRow& x) const override;
  bool is_classifier() const override { return true; }
  int n_classes() const override { return 2; }
  EstimatorKind kind() const override { return EstimatorKind::GradientBoostingClassifier; }
  int max_feature() const override;
  nlohmann::json to_json() const override;
  static std::unique_ptr<GradientBoostingClassifier> from_json(const nlohmann::json& j);

private:
  double raw_score_(const FeatureRow& x) const;

  EnsembleParams params_;
  double init_ = 0.0;                // log-odds of the weighted prior
  std::vector<DecisionTree> trees_;
};

std::unique_ptr<Estimator> make_estimator(EstimatorKind kind, const EnsembleParams& p, int n_classes = 0);

// Rebuilds any estimator written by Estimator::to_json.
std::unique_ptr<Estimator> estimator_from_json(const nlohmann::json& j);

} // namespace f1s
