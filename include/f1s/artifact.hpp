#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <f1s/domain.hpp>
#include <f1s/example.hpp>
#include <f1s/forest.hpp>

namespace f1s {

struct TrainingMetrics {
  // "<target>_accuracy" for classifiers, "<target>_mae" for regressors, each
  // with "_real" / "_synthetic" variants when the held-out set has that source.
  std::map<std::string, double> scores;
  DataBreakdown data_breakdown{};
  double real_data_weight = 0.0;      // effective blend weights
  double synthetic_data_weight = 0.0;
  double real_influence = 0.0;        // share of total fit weight on real examples
  std::size_t train_samples = 0;
  std::size_t test_samples = 0;
};

// Everything needed to serve one domain. Immutable once published.
struct ModelArtifact {
  Domain domain = Domain::TireStrategy;
  std::string model_name;
  std::vector<std::string> feature_schema;
  std::map<std::string, std::unique_ptr<Estimator>> estimators;   // by label target
  TrainingMetrics metrics{};
  std::string trained_at;             // UTC, ISO-8601

  // Throws NotFoundError for an unknown target.
  const Estimator& estimator(const std::string& target) const;
};

nlohmann::json metrics_to_json(const TrainingMetrics& m);
TrainingMetrics metrics_from_json(const nlohmann::json& j);

nlohmann::json artifact_to_json(const ModelArtifact& a);
// Throws Error when the document is not a valid artifact.
ModelArtifact artifact_from_json(const nlohmann::json& j);

// Throws Error unless `a` belongs to `d`, carries that domain's feature
// schema and has an estimator of the expected kind for every target.
void check_artifact(const ModelArtifact& a, Domain d);

// "<models_dir>/<domain>_model.json"
std::string artifact_path(const std::string& models_dir, Domain d);

// Writes to a temporary file beside `path` and renames it into place.
// Throws Error on I/O failure.
void save_artifact(const ModelArtifact& a, const std::string& path);

// nullopt when the file does not exist; throws Error when it is unreadable
// or malformed.
std::optional<ModelArtifact> load_artifact(const std::string& path);

} // namespace f1s
