#include <f1s/features.hpp>
#include <f1s/errors.hpp>

namespace f1s {

DataBreakdown count_sources(const std::vector<TrainingExample>& examples) {
  DataBreakdown b;
  for (const auto& e : examples) {
    if (e.source == Source::Real) ++b.real;
    else ++b.synthetic;
  }
  return b;
}

const std::vector<std::string>& feature_schema(Domain d) {
  static const std::vector<std::string> tire{
    "track_temperature", "air_temperature", "humidity", "track_length",
    "number_of_corners", "high_speed_corners", "low_speed_corners",
    "current_lap", "total_laps", "remaining_laps", "current_position",
    "gap_to_leader", "gap_to_car_ahead", "gap_to_car_behind", "fuel_load",
    "tire_age", "rain_probability", "track_evolution", "safety_car", "vsc",
  };
  static const std::vector<std::string> pit{
    "current_lap", "total_laps", "remaining_laps", "tire_age",
    "tire_compound_idx", "current_position", "gap_to_car_ahead",
    "gap_to_car_behind", "pit_delta", "track_position_value",
    "tire_degradation_rate", "current_pace_delta", "competitor_tire_age",
    "competitor_compound_idx", "fuel_adjusted_pace", "traffic_density",
    "safety_car_probability", "drs_available", "track_temperature",
    "rain_probability",
  };
  static const std::vector<std::string> pace{
    "lap_number", "fuel_load", "tire_age", "tire_compound_idx",
    "track_temperature", "air_temperature", "track_evolution", "traffic",
    "drs_enabled", "sector1_time", "sector2_time", "previous_lap_time",
    "best_lap_time", "avg_lap_time", "position", "wind_speed", "humidity",
    "safety_car_laps", "push_level", "battery_deployment",
  };
  static const std::vector<std::string> position{
    "current_position", "lap_number", "remaining_laps", "gap_to_car_ahead",
    "gap_to_car_behind", "relative_pace", "tire_advantage",
    "compound_advantage", "drs_available", "battery_level", "straight_length",
    "overtaking_difficulty", "track_position_value", "driver_aggression",
    "car_performance_delta", "weather_stability", "safety_car_probability",
    "laps_since_pit", "competitor_laps_since_pit", "points_position",
  };
  switch (d) {
    case Domain::TireStrategy: return tire;
    case Domain::PitStop:      return pit;
    case Domain::RacePace:     return pace;
    case Domain::Position:     return position;
  }
  return tire;
}

const std::vector<std::string>& label_schema(Domain d) {
  static const std::vector<std::string> tire{"compound", "stint_length", "degradation_rate"};
  static const std::vector<std::string> pit{"in_pit_window", "undercut", "pit_lap"};
  static const std::vector<std::string> pace{"lap_time", "fuel_effect", "pace_trend"};
  static const std::vector<std::string> position{"overtake", "position_change", "final_position"};
  switch (d) {
    case Domain::TireStrategy: return tire;
    case Domain::PitStop:      return pit;
    case Domain::RacePace:     return pace;
    case Domain::Position:     return position;
  }
  return tire;
}

const std::vector<std::string>& feature_summary(Domain d) {
  static const std::vector<std::string> tire{
    "Track/air temperature", "Humidity", "Track characteristics",
    "Current lap/position", "Gaps to competitors", "Fuel load",
    "Tire age", "Weather conditions", "Safety car status"};
  static const std::vector<std::string> pit{
    "Current lap", "Tire age/compound", "Position",
    "Gaps to cars ahead/behind", "Pit delta", "Degradation rate",
    "Competitor tire status", "Safety car probability"};
  static const std::vector<std::string> pace{
    "Lap number", "Fuel load", "Tire age/compound", "Weather conditions",
    "Traffic", "Sector times", "Historical lap times", "Position"};
  static const std::vector<std::string> position{
    "Current position", "Remaining laps", "Gaps", "Relative pace",
    "Tire/compound advantage", "DRS availability", "Track characteristics",
    "Driver aggression"};
  switch (d) {
    case Domain::TireStrategy: return tire;
    case Domain::PitStop:      return pit;
    case Domain::RacePace:     return pace;
    case Domain::Position:     return position;
  }
  return tire;
}

const std::vector<std::string>& output_summary(Domain d) {
  static const std::vector<std::string> tire{
    "Recommended compound", "Compound confidence", "Predicted stint length",
    "Degradation rate per lap"};
  static const std::vector<std::string> pit{
    "In pit window (bool)", "Pit window probability", "Undercut opportunity",
    "Optimal pit lap", "Pit urgency score"};
  static const std::vector<std::string> pace{
    "Predicted lap time", "Fuel effect per kg", "Pace trend", "5-lap predictions"};
  static const std::vector<std::string> position{
    "Predicted final position", "Overtake probability",
    "Position change probabilities", "Battle status"};
  switch (d) {
    case Domain::TireStrategy: return tire;
    case Domain::PitStop:      return pit;
    case Domain::RacePace:     return pace;
    case Domain::Position:     return position;
  }
  return tire;
}

FeatureRow encode(const std::vector<std::string>& schema, const FeatureMap& fields) {
  FeatureRow row;
  row.reserve(schema.size());
  for (const auto& key : schema) {
    auto it = fields.find(key);
    if (it == fields.end()) throw SchemaError(key);
    row.push_back(it->second);
  }
  return row;
}

void require_labels(Domain d, const LabelMap& labels) {
  for (const auto& key : label_schema(d)) {
    if (!labels.count(key)) throw SchemaError(key);
  }
}

} // namespace f1s
