#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <f1s/artifact.hpp>
#include <f1s/config.hpp>
#include <f1s/registry.hpp>
#include <f1s/session.hpp>

namespace f1s {

struct TrainRequest {
  bool hybrid_mode = true;           // false: rule-derived examples only
  double real_data_weight = 0.7;
  double synthetic_data_weight = 0.3;
  std::vector<int> session_keys;
};

struct TrainResult {
  std::string model;
  TrainingMetrics metrics{};
  std::size_t real_samples = 0;
  std::size_t synthetic_samples = 0;
  double real_data_weight = 0.0;     // effective, after normalisation and collapse
  double synthetic_data_weight = 0.0;
};

struct TrainOutcome {
  Domain domain = Domain::TireStrategy;
  bool ok = false;
  std::optional<TrainResult> result;
  std::string error;
};

// Extract -> generate -> blend -> fit -> publish, for one domain or all.
class TrainingService {
public:
  // `sessions` may be null; every call is then synthetic-only.
  TrainingService(ModelRegistry& registry, std::shared_ptr<SessionSource> sessions, EngineSettings settings)
    : registry_(registry), sessions_(std::move(sessions)), settings_(std::move(settings)) {}

  // Throws ConfigError for bad weights, TrainingFailure when fitting fails.
  TrainResult train(Domain d, const TrainRequest& req);

  // One thread per domain; a failing domain does not affect the others.
  std::vector<TrainOutcome> train_all(const TrainRequest& req);

private:
  std::vector<RawSessionRecord> fetch_(const TrainRequest& req) const;
  TrainResult train_with_(Domain d, const TrainRequest& req, const std::vector<RawSessionRecord>& records);

  ModelRegistry& registry_;
  std::shared_ptr<SessionSource> sessions_;
  EngineSettings settings_;
};

} // namespace f1s
