#pragma once
#include <nlohmann/json.hpp>
#include <f1s/prediction.hpp>
#include <f1s/registry.hpp>
#include <f1s/requests.hpp>
#include <f1s/responses.hpp>
#include <f1s/scenarios.hpp>
#include <f1s/training.hpp>

namespace f1s {

// Request parsers. Required keys:
//   tire      current_lap, total_laps
//   pit stop  current_lap, total_laps, tire_age
//   race pace lap_number, best_lap_time
//   position  current_position, gap_to_car_ahead, gap_to_car_behind
// Other fields fall back to the struct defaults. A missing required key or a
// value of the wrong type throws SchemaError naming the field.
TireStrategyRequest tire_request_from_json(const nlohmann::json& j);
PitStopRequest pit_request_from_json(const nlohmann::json& j);
RacePaceRequest pace_request_from_json(const nlohmann::json& j);
PositionRequest position_request_from_json(const nlohmann::json& j);

// {"tire_strategy": {...}, "pit_stop": {...}, "race_pace": {...}, "position": {...}}
FullAnalysisRequest analysis_request_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const TireStrategyResponse& r);
void to_json(nlohmann::json& j, const StrategyOption& o);
void to_json(nlohmann::json& j, const PitStopResponse& r);
void to_json(nlohmann::json& j, const LapPrediction& p);
void to_json(nlohmann::json& j, const PerformanceAssessment& a);
void to_json(nlohmann::json& j, const RacePaceResponse& r);
void to_json(nlohmann::json& j, const AttackAnalysis& a);
void to_json(nlohmann::json& j, const DefenseAnalysis& d);
void to_json(nlohmann::json& j, const PositionResponse& r);
void to_json(nlohmann::json& j, const ExecutiveSummary& s);
void to_json(nlohmann::json& j, const FullAnalysis& a);
void to_json(nlohmann::json& j, const TrainResult& r);
void to_json(nlohmann::json& j, const TrainOutcome& o);
void to_json(nlohmann::json& j, const ModelStatus& s);
void to_json(nlohmann::json& j, const Scenario& s);

// Description, feature and output summaries, schema, status and metrics.
nlohmann::json model_info_json(Domain d, const ModelRegistry& registry);

} // namespace f1s
