#include <f1s/json_io.hpp>
#include <f1s/errors.hpp>
#include <f1s/features.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace f1s {

// Integer fields take whole numbers within int range only.
static int integral_field(const nlohmann::json& v, const char* key) {
  constexpr double lo = std::numeric_limits<int>::min();
  constexpr double hi = std::numeric_limits<int>::max();
  if (v.is_number_integer() || v.is_number_unsigned() || v.is_number_float()) {
    const double d = v.get<double>();
    if (std::isfinite(d) && d == std::floor(d) && d >= lo && d <= hi) return static_cast<int>(d);
  }
  throw SchemaError(key, std::string("expected an integer for field: ") + key);
}

template <typename T>
static void read_optional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  if constexpr (std::is_same_v<T, int>) {
    out = integral_field(*it, key);
  } else {
    try {
      it->get_to(out);
    } catch (const nlohmann::json::exception&) {
      throw SchemaError(key, std::string("invalid value for field: ") + key);
    }
  }
}

static int laps_left(int total, int current) {
  const long long v = static_cast<long long>(total) - current;
  return static_cast<int>(std::clamp<long long>(v, std::numeric_limits<int>::min(),
                                                std::numeric_limits<int>::max()));
}

template <typename T>
static void read_required(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) throw SchemaError(key);
  read_optional(j, key, out);
}

static void require_object(const nlohmann::json& j, const char* what) {
  if (!j.is_object()) throw SchemaError(what, std::string(what) + " must be a JSON object");
}

TireStrategyRequest tire_request_from_json(const nlohmann::json& j) {
  require_object(j, "tire_strategy");
  TireStrategyRequest r;
  read_required(j, "current_lap", r.current_lap);
  read_required(j, "total_laps", r.total_laps);
  // remaining_laps follows the lap counters unless given.
  r.remaining_laps = laps_left(r.total_laps, r.current_lap);
  read_optional(j, "remaining_laps", r.remaining_laps);
  read_optional(j, "track_temperature", r.track_temperature);
  read_optional(j, "air_temperature", r.air_temperature);
  read_optional(j, "humidity", r.humidity);
  read_optional(j, "track_length", r.track_length);
  read_optional(j, "number_of_corners", r.number_of_corners);
  read_optional(j, "high_speed_corners", r.high_speed_corners);
  read_optional(j, "low_speed_corners", r.low_speed_corners);
  read_optional(j, "current_position", r.current_position);
  read_optional(j, "gap_to_leader", r.gap_to_leader);
  read_optional(j, "gap_to_car_ahead", r.gap_to_car_ahead);
  read_optional(j, "gap_to_car_behind", r.gap_to_car_behind);
  read_optional(j, "fuel_load", r.fuel_load);
  read_optional(j, "tire_age", r.tire_age);
  read_optional(j, "rain_probability", r.rain_probability);
  read_optional(j, "track_evolution", r.track_evolution);
  read_optional(j, "safety_car_deployed", r.safety_car_deployed);
  read_optional(j, "vsc_deployed", r.vsc_deployed);
  return r;
}

PitStopRequest pit_request_from_json(const nlohmann::json& j) {
  require_object(j, "pit_stop");
  PitStopRequest r;
  read_required(j, "current_lap", r.current_lap);
  read_required(j, "total_laps", r.total_laps);
  read_required(j, "tire_age", r.tire_age);
  r.remaining_laps = laps_left(r.total_laps, r.current_lap);
  read_optional(j, "remaining_laps", r.remaining_laps);
  read_optional(j, "tire_compound_idx", r.tire_compound_idx);
  read_optional(j, "current_position", r.current_position);
  read_optional(j, "gap_to_car_ahead", r.gap_to_car_ahead);
  read_optional(j, "gap_to_car_behind", r.gap_to_car_behind);
  read_optional(j, "pit_delta", r.pit_delta);
  read_optional(j, "track_position_value", r.track_position_value);
  read_optional(j, "tire_degradation_rate", r.tire_degradation_rate);
  read_optional(j, "current_pace_delta", r.current_pace_delta);
  read_optional(j, "competitor_tire_age", r.competitor_tire_age);
  read_optional(j, "competitor_compound_idx", r.competitor_compound_idx);
  read_optional(j, "fuel_adjusted_pace", r.fuel_adjusted_pace);
  read_optional(j, "traffic_density", r.traffic_density);
  read_optional(j, "safety_car_probability", r.safety_car_probability);
  read_optional(j, "drs_available", r.drs_available);
  read_optional(j, "track_temperature", r.track_temperature);
  read_optional(j, "rain_probability", r.rain_probability);
  read_optional(j, "safety_car_deployed", r.safety_car_deployed);
  return r;
}

RacePaceRequest pace_request_from_json(const nlohmann::json& j) {
  require_object(j, "race_pace");
  RacePaceRequest r;
  read_required(j, "lap_number", r.lap_number);
  read_required(j, "best_lap_time", r.best_lap_time);
  read_optional(j, "fuel_load", r.fuel_load);
  read_optional(j, "tire_age", r.tire_age);
  read_optional(j, "tire_compound_idx", r.tire_compound_idx);
  read_optional(j, "track_temperature", r.track_temperature);
  read_optional(j, "air_temperature", r.air_temperature);
  read_optional(j, "track_evolution", r.track_evolution);
  read_optional(j, "traffic", r.traffic);
  read_optional(j, "drs_enabled", r.drs_enabled);
  read_optional(j, "sector1_time", r.sector1_time);
  read_optional(j, "sector2_time", r.sector2_time);
  read_optional(j, "previous_lap_time", r.previous_lap_time);
  read_optional(j, "avg_lap_time", r.avg_lap_time);
  read_optional(j, "position", r.position);
  read_optional(j, "wind_speed", r.wind_speed);
  read_optional(j, "humidity", r.humidity);
  read_optional(j, "safety_car_laps", r.safety_car_laps);
  read_optional(j, "push_level", r.push_level);
  read_optional(j, "battery_deployment", r.battery_deployment);
  return r;
}

PositionRequest position_request_from_json(const nlohmann::json& j) {
  require_object(j, "position");
  PositionRequest r;
  read_required(j, "current_position", r.current_position);
  read_required(j, "gap_to_car_ahead", r.gap_to_car_ahead);
  read_required(j, "gap_to_car_behind", r.gap_to_car_behind);
  read_optional(j, "lap_number", r.lap_number);
  read_optional(j, "remaining_laps", r.remaining_laps);
  read_optional(j, "relative_pace", r.relative_pace);
  read_optional(j, "tire_advantage", r.tire_advantage);
  read_optional(j, "compound_advantage", r.compound_advantage);
  read_optional(j, "drs_available", r.drs_available);
  read_optional(j, "battery_level", r.battery_level);
  read_optional(j, "straight_length", r.straight_length);
  read_optional(j, "overtaking_difficulty", r.overtaking_difficulty);
  read_optional(j, "track_position_value", r.track_position_value);
  read_optional(j, "driver_aggression", r.driver_aggression);
  read_optional(j, "car_performance_delta", r.car_performance_delta);
  read_optional(j, "weather_stability", r.weather_stability);
  read_optional(j, "safety_car_probability", r.safety_car_probability);
  read_optional(j, "laps_since_pit", r.laps_since_pit);
  read_optional(j, "competitor_laps_since_pit", r.competitor_laps_since_pit);
  read_optional(j, "points_position", r.points_position);
  return r;
}

static const nlohmann::json& section(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) throw SchemaError(key);
  return *it;
}

FullAnalysisRequest analysis_request_from_json(const nlohmann::json& j) {
  require_object(j, "analysis");
  FullAnalysisRequest r;
  r.tire = tire_request_from_json(section(j, "tire_strategy"));
  r.pit = pit_request_from_json(section(j, "pit_stop"));
  r.pace = pace_request_from_json(section(j, "race_pace"));
  r.position = position_request_from_json(section(j, "position"));
  return r;
}

void to_json(nlohmann::json& j, const TireStrategyResponse& r) {
  nlohmann::json probs = nlohmann::json::object();
  for (const auto& [name, p] : r.compound_probabilities) probs[name] = p;
  j = {
    {"recommended_compound", r.recommended_compound},
    {"compound_confidence", r.compound_confidence},
    {"compound_probabilities", probs},
    {"predicted_stint_length", r.predicted_stint_length},
    {"degradation_rate_per_lap", r.degradation_rate_per_lap},
    {"expected_time_loss_per_lap_ms", r.expected_time_loss_per_lap_ms},
    {"strategy_notes", r.strategy_notes},
  };
}

void to_json(nlohmann::json& j, const StrategyOption& o) {
  j = {{"name", o.name}, {"pit_lap", o.pit_lap}, {"compound", o.compound},
       {"expected_gain", o.expected_gain}, {"risk", o.risk}};
}

void to_json(nlohmann::json& j, const PitStopResponse& r) {
  j = {
    {"in_pit_window", r.in_pit_window},
    {"pit_window_probability", r.pit_window_probability},
    {"undercut_opportunity", r.undercut_opportunity},
    {"undercut_probability", r.undercut_probability},
    {"optimal_pit_lap", r.optimal_pit_lap},
    {"laps_until_optimal", r.laps_until_optimal},
    {"pit_urgency", r.pit_urgency},
    {"recommendation", r.recommendation},
    {"strategy_options", r.strategy_options},
  };
}

void to_json(nlohmann::json& j, const LapPrediction& p) {
  j = {{"lap", p.lap}, {"predicted_time", p.predicted_time},
       {"fuel_load", p.fuel_load}, {"tire_age", p.tire_age}};
}

void to_json(nlohmann::json& j, const PerformanceAssessment& a) {
  j = {{"level", a.level}, {"color", a.color}, {"delta_to_best", a.delta_to_best},
       {"delta_to_average", a.delta_to_average}, {"trend", a.trend}};
}

void to_json(nlohmann::json& j, const RacePaceResponse& r) {
  j = {
    {"predicted_lap_time", r.predicted_lap_time},
    {"fuel_effect_per_kg", r.fuel_effect_per_kg},
    {"pace_trend_per_lap", r.pace_trend_per_lap},
    {"current_delta_to_optimal", r.current_delta_to_optimal},
    {"lap_predictions", r.lap_predictions},
    {"performance_assessment", r.performance_assessment},
    {"recommendations", r.recommendations},
  };
}

void to_json(nlohmann::json& j, const AttackAnalysis& a) {
  j = {{"gap_to_target", a.gap_to_target}, {"probability", a.probability},
       {"factors", a.factors}, {"recommended_action", a.recommended_action}};
}

void to_json(nlohmann::json& j, const DefenseAnalysis& d) {
  j = {{"gap_to_threat", d.gap_to_threat}, {"threat_level", d.threat_level},
       {"threat_color", d.threat_color}, {"lose_probability", d.lose_probability},
       {"recommended_action", d.recommended_action}};
}

void to_json(nlohmann::json& j, const PositionResponse& r) {
  j = {
    {"current_position", r.current_position},
    {"predicted_final_position", r.predicted_final_position},
    {"overtake_probability", r.overtake_probability},
    {"position_change_probabilities", {
      {"lose", r.position_change_probabilities.lose},
      {"maintain", r.position_change_probabilities.maintain},
      {"gain", r.position_change_probabilities.gain}}},
    {"attack_analysis", r.attack_analysis},
    {"defense_analysis", r.defense_analysis},
    {"battle_status", r.battle_status},
    {"tactical_recommendations", r.tactical_recommendations},
  };
}

void to_json(nlohmann::json& j, const ExecutiveSummary& s) {
  j = {{"critical_actions", s.critical_actions}, {"recommendations", s.recommendations},
       {"risk_factors", s.risk_factors}};
}

template <typename T>
static nlohmann::json or_null(const std::optional<T>& v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const FullAnalysis& a) {
  j = {
    {"tire_strategy", or_null(a.tire)},
    {"pit_stop", or_null(a.pit)},
    {"race_pace", or_null(a.pace)},
    {"position", or_null(a.position)},
    {"errors", a.errors},
    {"executive_summary", a.executive_summary},
  };
}

void to_json(nlohmann::json& j, const TrainResult& r) {
  j = {
    {"model", r.model},
    {"metrics", metrics_to_json(r.metrics)},
    {"real_samples", r.real_samples},
    {"synthetic_samples", r.synthetic_samples},
    {"real_data_weight", r.real_data_weight},
    {"synthetic_data_weight", r.synthetic_data_weight},
  };
}

void to_json(nlohmann::json& j, const TrainOutcome& o) {
  j = {{"model", domain_name(o.domain)}, {"ok", o.ok}};
  if (o.result) j["result"] = *o.result;
  if (!o.ok) j["error"] = o.error;
}

void to_json(nlohmann::json& j, const ModelStatus& s) {
  j = {{"name", s.name}, {"status", s.status}, {"description", s.description}, {"ready", s.ready}};
}

void to_json(nlohmann::json& j, const Scenario& s) {
  j = {{"key", s.key}, {"name", s.name}, {"description", s.description},
       {"tire_sequence", s.tire_sequence}, {"risk_level", s.risk_level}};
  if (!s.target_pit_laps.empty()) j["target_pit_laps"] = s.target_pit_laps;
  if (s.trigger) j["trigger"] = *s.trigger;
}

nlohmann::json model_info_json(Domain d, const ModelRegistry& registry) {
  nlohmann::json j = {
    {"name", domain_name(d)},
    {"description", domain_description(d)},
    {"features", feature_summary(d)},
    {"outputs", output_summary(d)},
    {"feature_schema", feature_schema(d)},
  };
  for (const auto& s : registry.status())
    if (s.name == domain_name(d)) j["status"] = s.status;
  if (auto a = registry.artifact(d)) {
    j["metrics"] = metrics_to_json(a->metrics);
    j["trained_at"] = a->trained_at;
  }
  return j;
}

} // namespace f1s
