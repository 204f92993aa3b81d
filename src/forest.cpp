#include <f1s/forest.hpp>
#include <f1s/errors.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace f1s {

void to_json(nlohmann::json& j, const TreeNode& n) {
  j = {{"feature", n.feature}, {"threshold", n.threshold},
       {"left", n.left}, {"right", n.right}, {"value", n.value}};
}

void from_json(const nlohmann::json& j, TreeNode& n) {
  j.at("feature").get_to(n.feature);
  j.at("threshold").get_to(n.threshold);
  j.at("left").get_to(n.left);
  j.at("right").get_to(n.right);
  j.at("value").get_to(n.value);
}

static inline double sum_weights(const std::vector<std::size_t>& idx, const std::vector<double>& w) {
  double s = 0.0;
  for (auto i : idx) s += w[i];
  return s;
}

// ---- DecisionTree ----

void DecisionTree::fit(const Matrix& X, const std::vector<double>& y,
                       const std::vector<double>& w, std::mt19937& rng) {
  nodes_.clear();
  if (X.empty()) throw TrainingFailure("cannot fit a tree on an empty sample set");
  std::vector<std::size_t> idx(X.size());
  std::iota(idx.begin(), idx.end(), std::size_t{0});
  build_(idx, 0, X, y, w, rng);
}

int DecisionTree::apply(const FeatureRow& x) const {
  int id = 0;
  while (nodes_[id].feature != -1) {
    const auto& n = nodes_[id];
    id = (x[n.feature] <= n.threshold) ? n.left : n.right;
  }
  return id;
}

std::vector<double> DecisionTree::leaf_value_(const std::vector<std::size_t>& idx,
                                              const std::vector<double>& y,
                                              const std::vector<double>& w) const {
  const double sw = sum_weights(idx, w);
  // Zero-weight nodes fall back to plain counts.
  const bool unweighted = !(sw > 0.0);
  if (criterion_ == Criterion::Mse) {
    double num = 0.0, den = 0.0;
    for (auto i : idx) {
      const double wi = unweighted ? 1.0 : w[i];
      num += wi * y[i];
      den += wi;
    }
    return {den > 0.0 ? num / den : 0.0};
  }
  std::vector<double> dist(static_cast<std::size_t>(n_classes_), 0.0);
  double den = 0.0;
  for (auto i : idx) {
    const double wi = unweighted ? 1.0 : w[i];
    dist[static_cast<std::size_t>(y[i])] += wi;
    den += wi;
  }
  if (den > 0.0)
    for (auto& d : dist) d /= den;
  return dist;
}

double DecisionTree::impurity_(const std::vector<std::size_t>& idx,
                               const std::vector<double>& y,
                               const std::vector<double>& w) const {
  // Weighted totals: SSE for regression, sw * gini for classification.
  if (criterion_ == Criterion::Mse) {
    double sw = 0.0, swy = 0.0, swy2 = 0.0;
    for (auto i : idx) {
      sw += w[i];
      swy += w[i] * y[i];
      swy2 += w[i] * y[i] * y[i];
    }
    return sw > 0.0 ? std::max(0.0, swy2 - swy * swy / sw) : 0.0;
  }
  std::vector<double> c(static_cast<std::size_t>(n_classes_), 0.0);
  double sw = 0.0;
  for (auto i : idx) {
    c[static_cast<std::size_t>(y[i])] += w[i];
    sw += w[i];
  }
  if (!(sw > 0.0)) return 0.0;
  double sq = 0.0;
  for (double v : c) sq += v * v;
  return std::max(0.0, sw - sq / sw);
}

DecisionTree::Split DecisionTree::best_split_(const std::vector<std::size_t>& idx, double parent,
                                              const Matrix& X, const std::vector<double>& y,
                                              const std::vector<double>& w,
                                              std::mt19937& rng) const {
  const std::size_t d = X[idx.front()].size();
  std::vector<std::size_t> feats(d);
  std::iota(feats.begin(), feats.end(), std::size_t{0});
  std::size_t n_try = d;
  if (params_.max_features > 0 && params_.max_features < d) {
    std::shuffle(feats.begin(), feats.end(), rng);
    n_try = params_.max_features;
  }

  const std::size_t n = idx.size();
  const std::size_t min_leaf = std::max<std::size_t>(1, params_.min_samples_leaf);
  Split best;
  std::vector<std::size_t> sorted(idx);

  for (std::size_t t = 0; t < n_try; ++t) {
    const std::size_t f = feats[t];
    std::sort(sorted.begin(), sorted.end(),
              [&](std::size_t a, std::size_t b) { return X[a][f] < X[b][f]; });
    if (X[sorted.front()][f] == X[sorted.back()][f]) continue;

    if (criterion_ == Criterion::Mse) {
      double tw = 0.0, twy = 0.0, twy2 = 0.0;
      for (auto i : sorted) {
        tw += w[i];
        twy += w[i] * y[i];
        twy2 += w[i] * y[i] * y[i];
      }
      double lw = 0.0, lwy = 0.0, lwy2 = 0.0;
      for (std::size_t k = 0; k + 1 < n; ++k) {
        const auto i = sorted[k];
        lw += w[i];
        lwy += w[i] * y[i];
        lwy2 += w[i] * y[i] * y[i];
        const double v = X[i][f], next = X[sorted[k + 1]][f];
        if (v == next) continue;
        if (k + 1 < min_leaf || n - k - 1 < min_leaf) continue;
        const double rw = tw - lw, rwy = twy - lwy, rwy2 = twy2 - lwy2;
        const double l_sse = lw > 0.0 ? lwy2 - lwy * lwy / lw : 0.0;
        const double r_sse = rw > 0.0 ? rwy2 - rwy * rwy / rw : 0.0;
        const double gain = parent - l_sse - r_sse;
        if (gain > best.gain + 1e-12) best = {static_cast<int>(f), 0.5 * (v + next), gain};
      }
    } else {
      const auto k_classes = static_cast<std::size_t>(n_classes_);
      std::vector<double> total(k_classes, 0.0), left(k_classes, 0.0);
      double tw = 0.0;
      for (auto i : sorted) {
        total[static_cast<std::size_t>(y[i])] += w[i];
        tw += w[i];
      }
      double lw = 0.0;
      for (std::size_t k = 0; k + 1 < n; ++k) {
        const auto i = sorted[k];
        left[static_cast<std::size_t>(y[i])] += w[i];
        lw += w[i];
        const double v = X[i][f], next = X[sorted[k + 1]][f];
        if (v == next) continue;
        if (k + 1 < min_leaf || n - k - 1 < min_leaf) continue;
        const double rw = tw - lw;
        double lsq = 0.0, rsq = 0.0;
        for (std::size_t c = 0; c < k_classes; ++c) {
          lsq += left[c] * left[c];
          const double r = total[c] - left[c];
          rsq += r * r;
        }
        const double l_imp = lw > 0.0 ? lw - lsq / lw : 0.0;
        const double r_imp = rw > 0.0 ? rw - rsq / rw : 0.0;
        const double gain = parent - l_imp - r_imp;
        if (gain > best.gain + 1e-12) best = {static_cast<int>(f), 0.5 * (v + next), gain};
      }
    }
  }
  return best;
}

int DecisionTree::build_(std::vector<std::size_t>& idx, int depth, const Matrix& X,
                         const std::vector<double>& y, const std::vector<double>& w,
                         std::mt19937& rng) {
  TreeNode node;
  node.value = leaf_value_(idx, y, w);

  const double parent = impurity_(idx, y, w);
  const bool depth_left = params_.max_depth <= 0 || depth < params_.max_depth;
  if (!depth_left || idx.size() < std::max<std::size_t>(2, params_.min_samples_split) ||
      parent <= 1e-12) {
    nodes_.push_back(std::move(node));
    return static_cast<int>(nodes_.size()) - 1;
  }

  const Split s = best_split_(idx, parent, X, y, w, rng);
  if (s.feature == -1) {
    nodes_.push_back(std::move(node));
    return static_cast<int>(nodes_.size()) - 1;
  }

  std::vector<std::size_t> left, right;
  for (auto i : idx)
    (X[i][static_cast<std::size_t>(s.feature)] <= s.threshold ? left : right).push_back(i);
  idx.clear();
  idx.shrink_to_fit();

  node.feature = s.feature;
  node.threshold = s.threshold;
  const int cur = static_cast<int>(nodes_.size());
  nodes_.push_back(std::move(node));   // reserve slot

  const int l = build_(left, depth + 1, X, y, w, rng);
  const int r = build_(right, depth + 1, X, y, w, rng);
  nodes_[cur].left = l;
  nodes_[cur].right = r;
  return cur;
}

nlohmann::json DecisionTree::to_json() const {
  return nlohmann::json(nodes_);
}

DecisionTree DecisionTree::from_json(const nlohmann::json& j, Criterion criterion, int n_classes) {
  DecisionTree t(criterion, TreeParams{}, n_classes);
  t.nodes_ = j.get<std::vector<TreeNode>>();
  if (t.nodes_.empty()) throw std::runtime_error("tree without nodes");
  // Children always follow their parent, so every walk ends at a leaf.
  const auto size = static_cast<long long>(t.nodes_.size());
  const std::size_t leaf_width = criterion == Criterion::Gini ? static_cast<std::size_t>(n_classes) : 1;
  for (long long i = 0; i < size; ++i) {
    const auto& n = t.nodes_[static_cast<std::size_t>(i)];
    if (n.feature == -1) {
      if (n.value.size() != leaf_width)
        throw std::runtime_error("leaf " + std::to_string(i) + " has " + std::to_string(n.value.size()) +
                                 " values, expected " + std::to_string(leaf_width));
      for (double v : n.value)
        if (!std::isfinite(v)) throw std::runtime_error("leaf " + std::to_string(i) + " has a non-finite value");
      continue;
    }
    if (n.feature < 0) throw std::runtime_error("node " + std::to_string(i) + " has a negative feature");
    if (!std::isfinite(n.threshold))
      throw std::runtime_error("node " + std::to_string(i) + " has a non-finite threshold");
    if (n.left <= i || n.left >= size || n.right <= i || n.right >= size)
      throw std::runtime_error("node " + std::to_string(i) + " has out-of-order children");
  }
  return t;
}

int DecisionTree::max_feature() const {
  int m = -1;
  for (const auto& n : nodes_) m = std::max(m, n.feature);
  return m;
}

// ---- shared helpers ----

static inline void check_shapes(const Matrix& X, const std::vector<double>& y,
                                const std::vector<double>& w) {
  if (X.empty()) throw TrainingFailure("no training samples");
  if (y.size() != X.size() || w.size() != X.size())
    throw TrainingFailure("feature, label and weight counts differ");
}

static inline void check_classes(const std::vector<double>& y, int n_classes) {
  for (double v : y) {
    if (v < 0.0 || v >= n_classes || v != std::floor(v))
      throw TrainingFailure("class label out of range: " + std::to_string(v));
  }
}

// Bootstrap draw folded into the weights: a sample drawn k times weighs k*w.
static inline std::vector<double> bootstrap_weights(const std::vector<double>& w, std::mt19937& rng) {
  std::uniform_int_distribution<std::size_t> pick(0, w.size() - 1);
  std::vector<double> counts(w.size(), 0.0);
  for (std::size_t k = 0; k < w.size(); ++k) counts[pick(rng)] += 1.0;
  for (std::size_t i = 0; i < w.size(); ++i) counts[i] *= w[i];
  return counts;
}

// Rows with zero bootstrap weight are dropped before growing.
static inline DecisionTree grow_bagged(DecisionTree tree, const Matrix& X, const std::vector<double>& y,
                                       const std::vector<double>& bw, std::mt19937& rng) {
  Matrix xs;
  std::vector<double> ys, ws;
  for (std::size_t i = 0; i < X.size(); ++i) {
    if (bw[i] <= 0.0) continue;
    xs.push_back(X[i]);
    ys.push_back(y[i]);
    ws.push_back(bw[i]);
  }
  if (xs.empty()) {   // every drawn row had zero weight
    xs = X;
    ys = y;
    ws.assign(X.size(), 1.0);
  }
  tree.fit(xs, ys, ws, rng);
  return tree;
}

static inline int max_feature_of(const std::vector<DecisionTree>& trees) {
  int m = -1;
  for (const auto& t : trees) m = std::max(m, t.max_feature());
  return m;
}

static inline double finite_init(const nlohmann::json& j) {
  const double v = j.at("init").get<double>();
  if (!std::isfinite(v)) throw std::runtime_error("non-finite boosting init");
  return v;
}

static inline nlohmann::json params_json(const EnsembleParams& p) {
  return {{"n_estimators", p.n_estimators}, {"max_depth", p.max_depth},
          {"learning_rate", p.learning_rate}, {"min_samples_leaf", p.min_samples_leaf},
          {"seed", p.seed}};
}

static inline EnsembleParams params_from_json(const nlohmann::json& j) {
  EnsembleParams p;
  p.n_estimators = j.at("n_estimators").get<int>();
  p.max_depth = j.at("max_depth").get<int>();
  p.learning_rate = j.at("learning_rate").get<double>();
  p.min_samples_leaf = j.at("min_samples_leaf").get<std::size_t>();
  p.seed = j.at("seed").get<unsigned>();
  return p;
}

static inline nlohmann::json trees_json(const std::vector<DecisionTree>& trees) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& t : trees) arr.push_back(t.to_json());
  return arr;
}

static inline std::vector<DecisionTree> trees_from_json(const nlohmann::json& j,
                                                        DecisionTree::Criterion c, int n_classes) {
  std::vector<DecisionTree> out;
  for (const auto& t : j) out.push_back(DecisionTree::from_json(t, c, n_classes));
  if (out.empty()) throw std::runtime_error("ensemble without trees");
  return out;
}

static inline std::size_t argmax(const std::vector<double>& v) {
  return static_cast<std::size_t>(std::max_element(v.begin(), v.end()) - v.begin());
}

static inline double sigmoid(double z) { return 1.0 / (1.0 + std::exp(-z)); }

const char* estimator_kind_name(EstimatorKind k) {
  switch (k) {
    case EstimatorKind::RandomForestClassifier: return "random_forest_classifier";
    case EstimatorKind::RandomForestRegressor: return "random_forest_regressor";
    case EstimatorKind::GradientBoostingClassifier: return "gradient_boosting_classifier";
    case EstimatorKind::GradientBoostingRegressor: return "gradient_boosting_regressor";
  }
  return "unknown";
}

std::vector<double> Estimator::predict_proba(const FeatureRow&) const {
  throw std::logic_error(std::string("predict_proba on a regressor: ") + estimator_kind_name(kind()));
}

// ---- RandomForestClassifier ----

void RandomForestClassifier::fit(const Matrix& X, const std::vector<double>& y,
                                 const std::vector<double>& w) {
  check_shapes(X, y, w);
  if (n_classes_ < 2) throw TrainingFailure("classifier needs at least two classes");
  check_classes(y, n_classes_);

  const std::size_t d = X.front().size();
  TreeParams tp;
  tp.max_depth = params_.max_depth;
  tp.min_samples_leaf = params_.min_samples_leaf;
  tp.max_features = std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(std::sqrt(static_cast<double>(d)))));

  std::mt19937 rng(params_.seed);
  trees_.clear();
  for (int t = 0; t < std::max(1, params_.n_estimators); ++t) {
    const auto bw = bootstrap_weights(w, rng);
    trees_.push_back(grow_bagged(DecisionTree(DecisionTree::Criterion::Gini, tp, n_classes_), X, y, bw, rng));
  }
}

std::vector<double> RandomForestClassifier::predict_proba(const FeatureRow& x) const {
  std::vector<double> p(static_cast<std::size_t>(n_classes_), 0.0);
  for (const auto& t : trees_) {
    const auto& leaf = t.predict(x);
    for (std::size_t c = 0; c < p.size(); ++c) p[c] += leaf[c];
  }
  double s = 0.0;
  for (double v : p) s += v;
  if (s > 0.0)
    for (auto& v : p) v /= s;
  return p;
}

double RandomForestClassifier::predict(const FeatureRow& x) const {
  return static_cast<double>(argmax(predict_proba(x)));
}

int RandomForestClassifier::max_feature() const { return max_feature_of(trees_); }

nlohmann::json RandomForestClassifier::to_json() const {
  return {{"kind", estimator_kind_name(kind())}, {"n_classes", n_classes_},
          {"params", params_json(params_)}, {"trees", trees_json(trees_)}};
}

std::unique_ptr<RandomForestClassifier> RandomForestClassifier::from_json(const nlohmann::json& j) {
  const int n_classes = j.at("n_classes").get<int>();
  if (n_classes < 2) throw std::runtime_error("classifier needs at least two classes");
  auto m = std::make_unique<RandomForestClassifier>(params_from_json(j.at("params")), n_classes);
  m->trees_ = trees_from_json(j.at("trees"), DecisionTree::Criterion::Gini, m->n_classes_);
  return m;
}

// ---- RandomForestRegressor ----

void RandomForestRegressor::fit(const Matrix& X, const std::vector<double>& y,
                                const std::vector<double>& w) {
  check_shapes(X, y, w);
  TreeParams tp;
  tp.max_depth = params_.max_depth;
  tp.min_samples_leaf = params_.min_samples_leaf;

  std::mt19937 rng(params_.seed);
  trees_.clear();
  for (int t = 0; t < std::max(1, params_.n_estimators); ++t) {
    const auto bw = bootstrap_weights(w, rng);
    trees_.push_back(grow_bagged(DecisionTree(DecisionTree::Criterion::Mse, tp), X, y, bw, rng));
  }
}

double RandomForestRegressor::predict(const FeatureRow& x) const {
  double s = 0.0;
  for (const auto& t : trees_) s += t.predict(x)[0];
  return trees_.empty() ? 0.0 : s / static_cast<double>(trees_.size());
}

int RandomForestRegressor::max_feature() const { return max_feature_of(trees_); }

nlohmann::json RandomForestRegressor::to_json() const {
  return {{"kind", estimator_kind_name(kind())}, {"params", params_json(params_)},
          {"trees", trees_json(trees_)}};
}

std::unique_ptr<RandomForestRegressor> RandomForestRegressor::from_json(const nlohmann::json& j) {
  auto m = std::make_unique<RandomForestRegressor>(params_from_json(j.at("params")));
  m->trees_ = trees_from_json(j.at("trees"), DecisionTree::Criterion::Mse, 0);
  return m;
}

// ---- GradientBoostingRegressor ----

void GradientBoostingRegressor::fit(const Matrix& X, const std::vector<double>& y,
                                    const std::vector<double>& w) {
  check_shapes(X, y, w);
  double sw = 0.0, swy = 0.0;
  for (std::size_t i = 0; i < y.size(); ++i) {
    sw += w[i];
    swy += w[i] * y[i];
  }
  std::vector<double> fw = w;
  if (!(sw > 0.0)) {
    fw.assign(w.size(), 1.0);
    sw = static_cast<double>(w.size());
    swy = std::accumulate(y.begin(), y.end(), 0.0);
  }
  init_ = swy / sw;

  TreeParams tp;
  tp.max_depth = params_.max_depth;
  tp.min_samples_leaf = params_.min_samples_leaf;

  std::mt19937 rng(params_.seed);
  std::vector<double> f(y.size(), init_), r(y.size());
  trees_.clear();
  for (int m = 0; m < std::max(1, params_.n_estimators); ++m) {
    for (std::size_t i = 0; i < y.size(); ++i) r[i] = y[i] - f[i];
    DecisionTree tree(DecisionTree::Criterion::Mse, tp);
    tree.fit(X, r, fw, rng);
    for (std::size_t i = 0; i < y.size(); ++i) f[i] += params_.learning_rate * tree.predict(X[i])[0];
    trees_.push_back(std::move(tree));
  }
}

double GradientBoostingRegressor::predict(const FeatureRow& x) const {
  double v = init_;
  for (const auto& t : trees_) v += params_.learning_rate * t.predict(x)[0];
  return v;
}

int GradientBoostingRegressor::max_feature() const { return max_feature_of(trees_); }

nlohmann::json GradientBoostingRegressor::to_json() const {
  return {{"kind", estimator_kind_name(kind())}, {"params", params_json(params_)},
          {"init", init_}, {"trees", trees_json(trees_)}};
}

std::unique_ptr<GradientBoostingRegressor> GradientBoostingRegressor::from_json(const nlohmann::json& j) {
  auto m = std::make_unique<GradientBoostingRegressor>(params_from_json(j.at("params")));
  m->init_ = finite_init(j);
  m->trees_ = trees_from_json(j.at("trees"), DecisionTree::Criterion::Mse, 0);
  return m;
}

// ---- GradientBoostingClassifier ----

void GradientBoostingClassifier::fit(const Matrix& X, const std::vector<double>& y,
                                     const std::vector<double>& w) {
  check_shapes(X, y, w);
  check_classes(y, 2);

  std::vector<double> fw = w;
  double sw = 0.0, pos = 0.0;
  for (std::size_t i = 0; i < y.size(); ++i) {
    sw += w[i];
    pos += w[i] * y[i];
  }
  if (!(sw > 0.0)) {
    fw.assign(w.size(), 1.0);
    sw = static_cast<double>(w.size());
    pos = std::accumulate(y.begin(), y.end(), 0.0);
  }
  const double prior = pos / sw;
  if (prior <= 0.0 || prior >= 1.0)
    throw TrainingFailure("binary target has a single class");
  init_ = std::log(prior / (1.0 - prior));

  TreeParams tp;
  tp.max_depth = params_.max_depth;
  tp.min_samples_leaf = params_.min_samples_leaf;

  std::mt19937 rng(params_.seed);
  std::vector<double> f(y.size(), init_), r(y.size()), p(y.size());
  trees_.clear();
  for (int m = 0; m < std::max(1, params_.n_estimators); ++m) {
    for (std::size_t i = 0; i < y.size(); ++i) {
      p[i] = sigmoid(f[i]);
      r[i] = y[i] - p[i];
    }
    DecisionTree tree(DecisionTree::Criterion::Mse, tp);
    tree.fit(X, r, fw, rng);

    // One Newton step per leaf: sum(w*r) / sum(w*p*(1-p)).
    const auto& nodes = tree.nodes();
    std::vector<double> num(nodes.size(), 0.0), den(nodes.size(), 0.0);
    for (std::size_t i = 0; i < y.size(); ++i) {
      const auto leaf = static_cast<std::size_t>(tree.apply(X[i]));
      num[leaf] += fw[i] * r[i];
      den[leaf] += fw[i] * p[i] * (1.0 - p[i]);
    }
    for (std::size_t n = 0; n < nodes.size(); ++n) {
      if (nodes[n].feature != -1) continue;
      tree.set_leaf_value(static_cast<int>(n), den[n] > 1e-12 ? num[n] / den[n] : 0.0);
    }
    for (std::size_t i = 0; i < y.size(); ++i) f[i] += params_.learning_rate * tree.predict(X[i])[0];
    trees_.push_back(std::move(tree));
  }
}

double GradientBoostingClassifier::raw_score_(const FeatureRow& x) const {
  double v = init_;
  for (const auto& t : trees_) v += params_.learning_rate * t.predict(x)[0];
  return v;
}

std::vector<double> GradientBoostingClassifier::predict_proba(const FeatureRow& x) const {
  const double p1 = sigmoid(raw_score_(x));
  return {1.0 - p1, p1};
}

double GradientBoostingClassifier::predict(const FeatureRow& x) const {
  return raw_score_(x) > 0.0 ? 1.0 : 0.0;
}

int GradientBoostingClassifier::max_feature() const { return max_feature_of(trees_); }

nlohmann::json GradientBoostingClassifier::to_json() const {
  return {{"kind", estimator_kind_name(kind())}, {"n_classes", 2},
          {"params", params_json(params_)}, {"init", init_}, {"trees", trees_json(trees_)}};
}

std::unique_ptr<GradientBoostingClassifier> GradientBoostingClassifier::from_json(const nlohmann::json& j) {
  auto m = std::make_unique<GradientBoostingClassifier>(params_from_json(j.at("params")));
  m->init_ = finite_init(j);
  m->trees_ = trees_from_json(j.at("trees"), DecisionTree::Criterion::Mse, 0);
  return m;
}

// ---- factories ----

std::unique_ptr<Estimator> make_estimator(EstimatorKind kind, const EnsembleParams& p, int n_classes) {
  switch (kind) {
    case EstimatorKind::RandomForestClassifier: return std::make_unique<RandomForestClassifier>(p, n_classes);
    case EstimatorKind::RandomForestRegressor: return std::make_unique<RandomForestRegressor>(p);
    case EstimatorKind::GradientBoostingClassifier: return std::make_unique<GradientBoostingClassifier>(p);
    case EstimatorKind::GradientBoostingRegressor: return std::make_unique<GradientBoostingRegressor>(p);
  }
  throw std::invalid_argument("unknown estimator kind");
}

std::unique_ptr<Estimator> estimator_from_json(const nlohmann::json& j) {
  const auto kind = j.at("kind").get<std::string>();
  if (kind == estimator_kind_name(EstimatorKind::RandomForestClassifier))
    return RandomForestClassifier::from_json(j);
  if (kind == estimator_kind_name(EstimatorKind::RandomForestRegressor))
    return RandomForestRegressor::from_json(j);
  if (kind == estimator_kind_name(EstimatorKind::GradientBoostingClassifier))
    return GradientBoostingClassifier::from_json(j);
  if (kind == estimator_kind_name(EstimatorKind::GradientBoostingRegressor))
    return GradientBoostingRegressor::from_json(j);
  throw std::runtime_error("unknown estimator kind: " + kind);
}

} // namespace f1s
