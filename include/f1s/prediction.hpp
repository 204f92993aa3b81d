#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <f1s/artifact.hpp>
#include <f1s/config.hpp>
#include <f1s/registry.hpp>
#include <f1s/requests.hpp>
#include <f1s/responses.hpp>

namespace f1s {

// One race situation described to all four models.
struct FullAnalysisRequest {
  TireStrategyRequest tire{};
  PitStopRequest pit{};
  RacePaceRequest pace{};
  PositionRequest position{};
};

struct ExecutiveSummary {
  std::vector<std::string> critical_actions;
  std::vector<std::string> recommendations;
  std::vector<std::string> risk_factors;
};

// Each domain succeeds or fails on its own; failures land in `errors` keyed
// by model name.
struct FullAnalysis {
  std::optional<TireStrategyResponse> tire;
  std::optional<PitStopResponse> pit;
  std::optional<RacePaceResponse> pace;
  std::optional<PositionResponse> position;
  std::map<std::string, std::string> errors;
  ExecutiveSummary executive_summary{};
};

// Pure reads of the registry's current artifacts: identical requests give
// identical responses until a retrain publishes a new artifact.
class PredictionService {
public:
  PredictionService(const ModelRegistry& registry, PitSettings pit, HeuristicSettings heuristics)
    : registry_(registry), pit_(pit), heuristics_(heuristics) {}

  // All throw NotReadyError when the domain has no artifact.
  TireStrategyResponse predict_tire(const TireStrategyRequest& req) const;
  PitStopResponse predict_pit_stop(const PitStopRequest& req) const;
  RacePaceResponse predict_race_pace(const RacePaceRequest& req) const;
  PositionResponse predict_position(const PositionRequest& req) const;

  FullAnalysis analyze(const FullAnalysisRequest& req) const;

private:
  std::shared_ptr<const ModelArtifact> require_(Domain d) const;

  const ModelRegistry& registry_;
  PitSettings pit_;
  HeuristicSettings heuristics_;
};

ExecutiveSummary executive_summary(const FullAnalysis& analysis);

} // namespace f1s
