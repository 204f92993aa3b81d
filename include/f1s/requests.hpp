#pragma once
#include <f1s/example.hpp>

namespace f1s {

// Typed inference inputs. Member initialisers are the documented defaults
// for every optional field; the real-sample extractor starts from the same
// defaults for quantities telemetry cannot observe.

struct TireStrategyRequest {
  double track_temperature = 30.0;
  double air_temperature = 25.0;
  double humidity = 50.0;
  double track_length = 5.0;        // km
  int number_of_corners = 15;
  int high_speed_corners = 5;
  int low_speed_corners = 10;
  int current_lap = 1;
  int total_laps = 50;
  int remaining_laps = 50;
  int current_position = 10;
  double gap_to_leader = 0.0;
  double gap_to_car_ahead = 0.0;
  double gap_to_car_behind = 0.0;
  double fuel_load = 100.0;         // kg
  int tire_age = 0;
  double rain_probability = 0.0;    // percent
  double track_evolution = 50.0;
  bool safety_car_deployed = false;
  bool vsc_deployed = false;
};

struct PitStopRequest {
  int current_lap = 1;
  int total_laps = 50;
  int remaining_laps = 50;
  int tire_age = 0;
  int tire_compound_idx = 1;
  int current_position = 10;
  double gap_to_car_ahead = 2.0;
  double gap_to_car_behind = 2.0;
  double pit_delta = 22.0;
  double track_position_value = 50.0;
  double tire_degradation_rate = 0.05;
  double current_pace_delta = 0.0;
  int competitor_tire_age = 10;
  int competitor_compound_idx = 1;
  double fuel_adjusted_pace = 0.0;
  int traffic_density = 5;
  double safety_car_probability = 10.0;
  int drs_available = 1;
  double track_temperature = 30.0;
  double rain_probability = 0.0;
  bool safety_car_deployed = false; // not a model feature
};

struct RacePaceRequest {
  int lap_number = 1;
  double fuel_load = 100.0;
  int tire_age = 0;
  int tire_compound_idx = 1;
  double track_temperature = 30.0;
  double air_temperature = 25.0;
  double track_evolution = 50.0;
  int traffic = 0;
  int drs_enabled = 1;
  double sector1_time = 30.0;
  double sector2_time = 35.0;
  double previous_lap_time = 90.0;
  double best_lap_time = 88.0;
  double avg_lap_time = 89.0;
  int position = 10;
  double wind_speed = 10.0;
  double humidity = 50.0;
  int safety_car_laps = 0;
  double push_level = 80.0;
  double battery_deployment = 50.0;
};

struct PositionRequest {
  int current_position = 10;
  int lap_number = 1;
  int remaining_laps = 50;
  double gap_to_car_ahead = 2.0;
  double gap_to_car_behind = 2.0;
  double relative_pace = 0.0;       // s/lap against the car ahead, negative is faster
  int tire_advantage = 0;
  int compound_advantage = 0;
  int drs_available = 1;
  double battery_level = 80.0;
  double straight_length = 1000.0;  // metres
  double overtaking_difficulty = 50.0;
  double track_position_value = 50.0;
  double driver_aggression = 50.0;
  double car_performance_delta = 0.0;
  double weather_stability = 100.0;
  double safety_car_probability = 10.0;
  int laps_since_pit = 5;
  int competitor_laps_since_pit = 5;
  int points_position = 10;
};

// Feature maps keyed by the domain schema.
FeatureMap to_features(const TireStrategyRequest& r);
FeatureMap to_features(const PitStopRequest& r);
FeatureMap to_features(const RacePaceRequest& r);
FeatureMap to_features(const PositionRequest& r);

} // namespace f1s
