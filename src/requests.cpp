#include <f1s/requests.hpp>

namespace f1s {

static inline double b2d(bool b) { return b ? 1.0 : 0.0; }

FeatureMap to_features(const TireStrategyRequest& r) {
  return {
    {"track_temperature", r.track_temperature},
    {"air_temperature", r.air_temperature},
    {"humidity", r.humidity},
    {"track_length", r.track_length},
    {"number_of_corners", r.number_of_corners},
    {"high_speed_corners", r.high_speed_corners},
    {"low_speed_corners", r.low_speed_corners},
    {"current_lap", r.current_lap},
    {"total_laps", r.total_laps},
    {"remaining_laps", r.remaining_laps},
    {"current_position", r.current_position},
    {"gap_to_leader", r.gap_to_leader},
    {"gap_to_car_ahead", r.gap_to_car_ahead},
    {"gap_to_car_behind", r.gap_to_car_behind},
    {"fuel_load", r.fuel_load},
    {"tire_age", r.tire_age},
    {"rain_probability", r.rain_probability},
    {"track_evolution", r.track_evolution},
    {"safety_car", b2d(r.safety_car_deployed)},
    {"vsc", b2d(r.vsc_deployed)},
  };
}

FeatureMap to_features(const PitStopRequest& r) {
  return {
    {"current_lap", r.current_lap},
    {"total_laps", r.total_laps},
    {"remaining_laps", r.remaining_laps},
    {"tire_age", r.tire_age},
    {"tire_compound_idx", r.tire_compound_idx},
    {"current_position", r.current_position},
    {"gap_to_car_ahead", r.gap_to_car_ahead},
    {"gap_to_car_behind", r.gap_to_car_behind},
    {"pit_delta", r.pit_delta},
    {"track_position_value", r.track_position_value},
    {"tire_degradation_rate", r.tire_degradation_rate},
    {"current_pace_delta", r.current_pace_delta},
    {"competitor_tire_age", r.competitor_tire_age},
    {"competitor_compound_idx", r.competitor_compound_idx},
    {"fuel_adjusted_pace", r.fuel_adjusted_pace},
    {"traffic_density", r.traffic_density},
    {"safety_car_probability", r.safety_car_probability},
    {"drs_available", r.drs_available},
    {"track_temperature", r.track_temperature},
    {"rain_probability", r.rain_probability},
  };
}

FeatureMap to_features(const RacePaceRequest& r) {
  return {
    {"lap_number", r.lap_number},
    {"fuel_load", r.fuel_load},
    {"tire_age", r.tire_age},
    {"tire_compound_idx", r.tire_compound_idx},
    {"track_temperature", r.track_temperature},
    {"air_temperature", r.air_temperature},
    {"track_evolution", r.track_evolution},
    {"traffic", r.traffic},
    {"drs_enabled", r.drs_enabled},
    {"sector1_time", r.sector1_time},
    {"sector2_time", r.sector2_time},
    {"previous_lap_time", r.previous_lap_time},
    {"best_lap_time", r.best_lap_time},
    {"avg_lap_time", r.avg_lap_time},
    {"position", r.position},
    {"wind_speed", r.wind_speed},
    {"humidity", r.humidity},
    {"safety_car_laps", r.safety_car_laps},
    {"push_level", r.push_level},
    {"battery_deployment", r.battery_deployment},
  };
}

FeatureMap to_features(const PositionRequest& r) {
  return {
    {"current_position", r.current_position},
    {"lap_number", r.lap_number},
    {"remaining_laps", r.remaining_laps},
    {"gap_to_car_ahead", r.gap_to_car_ahead},
    {"gap_to_car_behind", r.gap_to_car_behind},
    {"relative_pace", r.relative_pace},
    {"tire_advantage", r.tire_advantage},
    {"compound_advantage", r.compound_advantage},
    {"drs_available", r.drs_available},
    {"battery_level", r.battery_level},
    {"straight_length", r.straight_length},
    {"overtaking_difficulty", r.overtaking_difficulty},
    {"track_position_value", r.track_position_value},
    {"driver_aggression", r.driver_aggression},
    {"car_performance_delta", r.car_performance_delta},
    {"weather_stability", r.weather_stability},
    {"safety_car_probability", r.safety_car_probability},
    {"laps_since_pit", r.laps_since_pit},
    {"competitor_laps_since_pit", r.competitor_laps_since_pit},
    {"points_position", r.points_position},
  };
}

} // namespace f1s
