#pragma once
#include <string>
#include <utility>
#include <vector>

namespace f1s {

struct TireStrategyResponse {
  std::string recommended_compound;
  double compound_confidence = 0.0;
  std::vector<std::pair<std::string, double>> compound_probabilities;   // one per compound, label order
  int predicted_stint_length = 0;
  double degradation_rate_per_lap = 0.0;
  double expected_time_loss_per_lap_ms = 0.0;
  std::vector<std::string> strategy_notes;
};

struct StrategyOption {
  std::string name;
  int pit_lap = 0;
  std::string compound;
  std::string expected_gain;
  std::string risk;          // Low | Medium | High
};

struct PitStopResponse {
  bool in_pit_window = false;
  double pit_window_probability = 0.0;
  bool undercut_opportunity = false;
  double undercut_probability = 0.0;
  int optimal_pit_lap = 0;
  int laps_until_optimal = 0;
  int pit_urgency = 0;       // 0..100
  std::string recommendation;
  std::vector<StrategyOption> strategy_options;
};

struct LapPrediction {
  int lap = 0;
  double predicted_time = 0.0;
  double fuel_load = 0.0;
  int tire_age = 0;
};

struct PerformanceAssessment {
  std::string level;         // EXCELLENT | GOOD | AVERAGE | BELOW PAR
  std::string color;
  double delta_to_best = 0.0;
  double delta_to_average = 0.0;
  std::string trend;         // improving | degrading
};

struct RacePaceResponse {
  double predicted_lap_time = 0.0;
  double fuel_effect_per_kg = 0.0;
  double pace_trend_per_lap = 0.0;
  double current_delta_to_optimal = 0.0;
  std::vector<LapPrediction> lap_predictions;
  PerformanceAssessment performance_assessment{};
  std::vector<std::string> recommendations;
};

struct PositionChangeProbabilities {
  double lose = 0.0;
  double maintain = 0.0;
  double gain = 0.0;
};

struct AttackAnalysis {
  double gap_to_target = 0.0;
  double probability = 0.0;  // percent
  std::vector<std::string> factors;
  std::string recommended_action;   // ATTACK | PRESSURE
};

struct DefenseAnalysis {
  double gap_to_threat = 0.0;
  std::string threat_level;  // LOW | MEDIUM | HIGH
  std::string threat_color;
  double lose_probability = 0.0;    // percent
  std::string recommended_action;   // DEFEND | MAINTAIN
};

struct PositionResponse {
  int current_position = 0;
  int predicted_final_position = 0;
  double overtake_probability = 0.0;
  PositionChangeProbabilities position_change_probabilities{};
  AttackAnalysis attack_analysis{};
  DefenseAnalysis defense_analysis{};
  std::string battle_status;
  std::vector<std::string> tactical_recommendations;
};

} // namespace f1s
