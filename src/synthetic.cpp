#include <f1s/synthetic.hpp>
#include <f1s/logging.hpp>

#include <algorithm>
#include <cmath>

namespace f1s {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static inline double uniform(std::mt19937& rng, double lo, double hi) {
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(rng);
}

// Inclusive integer draw, returned as a feature value.
static inline double uniform_int(std::mt19937& rng, int lo, int hi) {
  std::uniform_int_distribution<int> dist(lo, hi);
  return static_cast<double>(dist(rng));
}

static inline double flag(std::mt19937& rng, double p_true) {
  return uniform(rng, 0.0, 1.0) < p_true ? 1.0 : 0.0;
}

Neutralisation draw_neutralisation(double p_sc, double p_vsc, std::mt19937& rng) {
  double sc = clamp01(p_sc);
  double vsc = clamp01(p_vsc);
  const double total = sc + vsc;
  if (total > 1.0) {
    sc /= total;
    vsc /= total;
  }
  const double u = uniform(rng, 0.0, 1.0);
  if (u < sc) return Neutralisation::SafetyCar;
  if (u < sc + vsc) return Neutralisation::VirtualSafetyCar;
  return Neutralisation::Green;
}

Compound rule_compound(double rain_probability, double track_temperature, double remaining_laps) {
  if (rain_probability > 85.0) return Compound::Wet;
  if (rain_probability > 70.0) return Compound::Intermediate;
  if (track_temperature > 40.0) return remaining_laps <= 20.0 ? Compound::Medium : Compound::Hard;
  if (track_temperature < 25.0) return Compound::Soft;
  if (remaining_laps < 15.0) return Compound::Soft;
  return Compound::Medium;
}

double stint_base(Compound c) {
  switch (c) {
    case Compound::Soft:         return 12.0;
    case Compound::Medium:       return 25.0;
    case Compound::Hard:         return 35.0;
    case Compound::Intermediate: return 20.0;
    case Compound::Wet:          return 15.0;
  }
  return 25.0;
}

double compound_pace_offset(Compound c) {
  switch (c) {
    case Compound::Soft:         return -0.3;
    case Compound::Medium:       return 0.0;
    case Compound::Hard:         return 0.4;
    case Compound::Intermediate: return 0.8;
    case Compound::Wet:          return 1.5;
  }
  return 0.0;
}

bool rule_in_pit_window(double tire_age, double remaining_laps, const PitSettings& pit) {
  return tire_age >= pit.window_min_tire_age && tire_age <= pit.window_max_tire_age &&
         remaining_laps > pit.min_remaining_laps;
}

bool rule_undercut(double gap_to_car_ahead, double pit_delta, double tire_age,
                   double competitor_tire_age, bool in_window, const PitSettings& pit) {
  return in_window && gap_to_car_ahead < pit.undercut_gap_fraction * pit_delta &&
         tire_age > competitor_tire_age;
}

bool rule_overtake(double gap_ahead, double relative_pace, bool drs, double overtaking_difficulty) {
  return gap_ahead < 1.0 && relative_pace < -0.2 && drs && overtaking_difficulty < 70.0;
}

int rule_position_change(bool overtake, double gap_behind, double relative_pace) {
  if (overtake) return 2;
  if (gap_behind < 0.5 && relative_pace > 0.3) return 0;
  return 1;
}

double rule_final_position(double current_position, double remaining_laps, int position_change) {
  double pos = current_position;
  if (position_change == 2) pos -= std::min(remaining_laps / 5.0, 3.0);
  if (position_change == 0) pos += std::min(remaining_laps / 5.0, 2.0);
  return std::clamp(std::round(pos), 1.0, 20.0);
}

ObservedRanges observed_ranges(const std::vector<TrainingExample>& real) {
  ObservedRanges out;
  auto widen = [](std::optional<std::pair<double, double>>& r, double v) {
    if (!r) r = std::make_pair(v, v);
    else r = std::make_pair(std::min(r->first, v), std::max(r->second, v));
  };
  for (const auto& e : real) {
    if (auto it = e.features.find("track_temperature"); it != e.features.end())
      widen(out.track_temperature, it->second);
    if (auto it = e.features.find("air_temperature"); it != e.features.end())
      widen(out.air_temperature, it->second);
  }
  return out;
}

std::size_t synthetic_pool_size(Domain d, std::size_t n_real, double synthetic_weight,
                                std::size_t min_real_samples, const SyntheticSettings& s) {
  std::size_t target = 0;
  switch (d) {
    case Domain::TireStrategy: target = s.tire_samples; break;
    case Domain::PitStop:      target = s.pit_samples; break;
    case Domain::RacePace:     target = s.pace_samples; break;
    case Domain::Position:     target = s.position_samples; break;
  }
  if (n_real < min_real_samples) return target;
  if (n_real >= target) return 0;
  const double n = static_cast<double>(target - n_real) * std::max(0.0, synthetic_weight);
  return static_cast<std::size_t>(std::floor(n));
}

// Observed range padded on both sides, or the fixed default.
static inline std::pair<double, double> bounds(const std::optional<std::pair<double, double>>& obs,
                                               double pad, double lo, double hi) {
  if (!obs) return {lo, hi};
  return {obs->first - pad, obs->second + pad};
}

std::vector<TrainingExample> SyntheticGenerator::generate(Domain d, std::size_t n,
                                                          const std::vector<TrainingExample>& real) const {
  // One stream per domain so parallel training stays reproducible.
  std::mt19937 rng(seed_ + static_cast<unsigned>(d));
  const ObservedRanges obs = real.empty() ? ObservedRanges{} : observed_ranges(real);

  std::vector<TrainingExample> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    TrainingExample e;
    switch (d) {
      case Domain::TireStrategy: e = tire_(rng, obs); break;
      case Domain::PitStop:      e = pit_stop_(rng, obs); break;
      case Domain::RacePace:     e = race_pace_(rng, obs); break;
      case Domain::Position:     e = position_(rng); break;
    }
    e.domain = d;
    e.source = Source::Synthetic;
    e.confidence = settings_.confidence;
    out.push_back(std::move(e));
  }

  get_logger("synthetic").debug("generated synthetic examples", {
    {"domain", domain_name(d)}, {"count", std::to_string(out.size())},
    {"observed_temperatures", obs.track_temperature ? "true" : "false"}});
  return out;
}

TrainingExample SyntheticGenerator::tire_(std::mt19937& rng, const ObservedRanges& obs) const {
  const double pad = settings_.temperature_padding;
  const auto [tt_lo, tt_hi] = bounds(obs.track_temperature, pad, 20.0, 50.0);
  const auto [at_lo, at_hi] = bounds(obs.air_temperature, pad, 15.0, 40.0);

  TrainingExample e;
  auto& f = e.features;
  f["track_temperature"] = uniform(rng, tt_lo, tt_hi);
  f["air_temperature"] = uniform(rng, at_lo, at_hi);
  f["humidity"] = uniform(rng, 20.0, 90.0);
  f["track_length"] = uniform(rng, 3.0, 7.0);
  f["number_of_corners"] = uniform_int(rng, 10, 24);
  f["high_speed_corners"] = uniform_int(rng, 2, 9);
  f["low_speed_corners"] = uniform_int(rng, 5, 14);
  f["total_laps"] = uniform_int(rng, 50, 69);
  f["current_lap"] = uniform_int(rng, 1, static_cast<int>(f["total_laps"]) - 1);
  f["remaining_laps"] = f["total_laps"] - f["current_lap"];
  f["current_position"] = uniform_int(rng, 1, 20);
  f["gap_to_leader"] = uniform(rng, 0.0, 60.0);
  f["gap_to_car_ahead"] = uniform(rng, 0.0, 10.0);
  f["gap_to_car_behind"] = uniform(rng, 0.0, 10.0);
  f["fuel_load"] = uniform(rng, 10.0, 110.0);
  f["tire_age"] = uniform_int(rng, 0, 29);
  f["rain_probability"] = uniform(rng, 0.0, 100.0);
  f["track_evolution"] = uniform(rng, 0.0, 100.0);
  const auto status = draw_neutralisation(0.10, 0.05, rng);
  f["safety_car"] = status == Neutralisation::SafetyCar ? 1.0 : 0.0;
  f["vsc"] = status == Neutralisation::VirtualSafetyCar ? 1.0 : 0.0;

  const double tt = f["track_temperature"];
  const double hsc = f["high_speed_corners"];
  const Compound c = rule_compound(f["rain_probability"], tt, f["remaining_laps"]);
  e.labels["compound"] = static_cast<double>(static_cast<int>(c));
  e.labels["stint_length"] =
    std::clamp(stint_base(c) + uniform(rng, -5.0, 5.0) - 0.2 * (tt - 30.0) - 0.5 * hsc, 5.0, 50.0);
  e.labels["degradation_rate"] =
    std::clamp(0.05 + 0.002 * (tt - 30.0) + 0.003 * hsc + uniform(rng, -0.01, 0.01), 0.01, 0.15);
  return e;
}

TrainingExample SyntheticGenerator::pit_stop_(std::mt19937& rng, const ObservedRanges& obs) const {
  const auto [tt_lo, tt_hi] = bounds(obs.track_temperature, settings_.temperature_padding, 20.0, 50.0);

  TrainingExample e;
  auto& f = e.features;
  f["total_laps"] = uniform_int(rng, 50, 69);
  f["current_lap"] = uniform_int(rng, 1, static_cast<int>(f["total_laps"]) - 1);
  f["remaining_laps"] = f["total_laps"] - f["current_lap"];
  f["tire_age"] = uniform_int(rng, 0, 34);
  f["tire_compound_idx"] = uniform_int(rng, 0, 2);
  f["current_position"] = uniform_int(rng, 1, 20);
  f["gap_to_car_ahead"] = uniform(rng, 0.0, 10.0);
  f["gap_to_car_behind"] = uniform(rng, 0.0, 10.0);
  f["pit_delta"] = uniform(rng, 18.0, 26.0);
  f["track_position_value"] = uniform(rng, 30.0, 80.0);
  f["tire_degradation_rate"] = uniform(rng, 0.02, 0.12);
  f["current_pace_delta"] = uniform(rng, -1.0, 1.0);
  f["competitor_tire_age"] = uniform_int(rng, 0, 34);
  f["competitor_compound_idx"] = uniform_int(rng, 0, 2);
  f["fuel_adjusted_pace"] = uniform(rng, -0.6, 0.6);
  f["traffic_density"] = uniform_int(rng, 0, 14);
  f["safety_car_probability"] = uniform(rng, 0.0, 30.0);
  f["drs_available"] = flag(rng, 0.7);
  f["track_temperature"] = uniform(rng, tt_lo, tt_hi);
  f["rain_probability"] = uniform(rng, 0.0, 100.0);

  const bool window = rule_in_pit_window(f["tire_age"], f["remaining_laps"], pit_);
  const bool undercut = rule_undercut(f["gap_to_car_ahead"], f["pit_delta"], f["tire_age"],
                                      f["competitor_tire_age"], window, pit_);
  const auto c = compound_from_index(static_cast<int>(f["tire_compound_idx"])).value_or(Compound::Medium);
  const double lap = f["current_lap"] + stint_base(c) - f["tire_age"] + uniform_int(rng, -3, 3);
  e.labels["in_pit_window"] = window ? 1.0 : 0.0;
  e.labels["undercut"] = undercut ? 1.0 : 0.0;
  e.labels["pit_lap"] = std::max(f["current_lap"], lap);
  return e;
}

TrainingExample SyntheticGenerator::race_pace_(std::mt19937& rng, const ObservedRanges& obs) const {
  const double pad = settings_.temperature_padding;
  const auto [tt_lo, tt_hi] = bounds(obs.track_temperature, pad, 20.0, 50.0);
  const auto [at_lo, at_hi] = bounds(obs.air_temperature, pad, 15.0, 40.0);

  TrainingExample e;
  auto& f = e.features;
  f["lap_number"] = uniform_int(rng, 1, 59);
  f["fuel_load"] = uniform(rng, 5.0, 110.0);
  f["tire_age"] = uniform_int(rng, 0, 34);
  f["tire_compound_idx"] = uniform_int(rng, 0, 2);
  f["track_temperature"] = uniform(rng, tt_lo, tt_hi);
  f["air_temperature"] = uniform(rng, at_lo, at_hi);
  f["track_evolution"] = uniform(rng, 0.0, 100.0);
  f["traffic"] = uniform_int(rng, 0, 4);
  f["drs_enabled"] = flag(rng, 0.7);
  f["sector1_time"] = uniform(rng, 25.0, 35.0);
  f["sector2_time"] = uniform(rng, 30.0, 40.0);
  f["previous_lap_time"] = uniform(rng, 85.0, 95.0);
  f["best_lap_time"] = uniform(rng, 84.0, 88.0);
  f["avg_lap_time"] = uniform(rng, 86.0, 92.0);
  f["position"] = uniform_int(rng, 1, 20);
  f["wind_speed"] = uniform(rng, 0.0, 30.0);
  f["humidity"] = uniform(rng, 20.0, 90.0);
  f["safety_car_laps"] = uniform_int(rng, 0, 9);
  f["push_level"] = uniform(rng, 50.0, 100.0);
  f["battery_deployment"] = uniform(rng, 30.0, 100.0);

  const auto c = compound_from_index(static_cast<int>(f["tire_compound_idx"])).value_or(Compound::Medium);
  e.labels["lap_time"] = 88.0 + compound_pace_offset(c) + 0.03 * f["fuel_load"] +
                         0.04 * f["tire_age"] + 0.3 * f["traffic"] +
                         0.02 * (f["track_temperature"] - 30.0) + uniform(rng, -0.5, 0.5);
  e.labels["fuel_effect"] = 0.03 + uniform(rng, -0.003, 0.003);
  e.labels["pace_trend"] = 0.03 * f["tire_age"] + uniform(rng, -0.08, 0.08);
  return e;
}

TrainingExample SyntheticGenerator::position_(std::mt19937& rng) const {
  TrainingExample e;
  auto& f = e.features;
  f["current_position"] = uniform_int(rng, 1, 20);
  f["lap_number"] = uniform_int(rng, 1, 59);
  f["remaining_laps"] = uniform_int(rng, 1, 54);
  f["gap_to_car_ahead"] = uniform(rng, 0.0, 5.0);
  f["gap_to_car_behind"] = uniform(rng, 0.0, 5.0);
  f["relative_pace"] = uniform(rng, -1.0, 1.0);
  f["tire_advantage"] = uniform_int(rng, -15, 15);
  f["compound_advantage"] = uniform_int(rng, -1, 1);
  f["drs_available"] = flag(rng, 0.7);
  f["battery_level"] = uniform(rng, 30.0, 100.0);
  f["straight_length"] = uniform(rng, 500.0, 1500.0);
  f["overtaking_difficulty"] = uniform(rng, 20.0, 90.0);
  f["track_position_value"] = uniform(rng, 30.0, 80.0);
  f["driver_aggression"] = uniform(rng, 30.0, 90.0);
  f["car_performance_delta"] = uniform(rng, -0.6, 0.6);
  f["weather_stability"] = uniform(rng, 50.0, 100.0);
  f["safety_car_probability"] = uniform(rng, 0.0, 30.0);
  f["laps_since_pit"] = uniform_int(rng, 0, 29);
  f["competitor_laps_since_pit"] = uniform_int(rng, 0, 29);
  f["points_position"] = uniform_int(rng, 1, 20);

  const bool overtake = rule_overtake(f["gap_to_car_ahead"], f["relative_pace"],
                                      f["drs_available"] > 0.5, f["overtaking_difficulty"]);
  const int change = rule_position_change(overtake, f["gap_to_car_behind"], f["relative_pace"]);
  e.labels["overtake"] = overtake ? 1.0 : 0.0;
  e.labels["position_change"] = static_cast<double>(change);
  e.labels["final_position"] = rule_final_position(f["current_position"], f["remaining_laps"], change);
  return e;
}

} // namespace f1s
