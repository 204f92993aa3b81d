#include <f1s/extractor.hpp>
#include <f1s/logging.hpp>
#include <f1s/requests.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

namespace f1s {

namespace {

// Cross-driver lookups within the extracted sessions.
class SessionIndex {
public:
  explicit SessionIndex(const std::vector<RawSessionRecord>& records) {
    for (const auto& r : records) {
      int& total = total_laps_[r.session_key];
      total = std::max(total, r.lap_number);
      if (r.position) by_position_[{r.session_key, r.lap_number, *r.position}] = &r;
    }
  }

  int total_laps(int session_key) const {
    auto it = total_laps_.find(session_key);
    return it == total_laps_.end() ? 0 : it->second;
  }

  // Car running at `position` on that lap, if recorded.
  const RawSessionRecord* at(int session_key, int lap, int position) const {
    auto it = by_position_.find({session_key, lap, position});
    return it == by_position_.end() ? nullptr : it->second;
  }

private:
  std::map<int, int> total_laps_;
  std::map<std::tuple<int, int, int>, const RawSessionRecord*> by_position_;
};

void drop_non_finite(std::optional<double>& v) {
  if (v && !std::isfinite(*v)) v.reset();
}

// Non-finite readings count as missing.
std::vector<RawSessionRecord> finite_records(const std::vector<RawSessionRecord>& records) {
  std::vector<RawSessionRecord> out(records);
  for (auto& r : out) {
    drop_non_finite(r.lap_duration);
    drop_non_finite(r.track_temperature);
    drop_non_finite(r.air_temperature);
    drop_non_finite(r.humidity);
    drop_non_finite(r.wind_speed);
    drop_non_finite(r.gap_to_leader);
    drop_non_finite(r.interval);
    drop_non_finite(r.sector1_time);
    drop_non_finite(r.sector2_time);
  }
  return out;
}

} // namespace

std::vector<DriverRun> group_runs(const std::vector<RawSessionRecord>& records) {
  std::map<std::pair<int, int>, DriverRun> runs;
  for (const auto& r : records) {
    auto& run = runs[{r.session_key, r.driver_number}];
    run.session_key = r.session_key;
    run.driver_number = r.driver_number;
    run.laps.push_back(r);
  }
  std::vector<DriverRun> out;
  out.reserve(runs.size());
  for (auto& [key, run] : runs) {
    std::stable_sort(run.laps.begin(), run.laps.end(),
                     [](const RawSessionRecord& a, const RawSessionRecord& b) {
                       return a.lap_number < b.lap_number;
                     });
    out.push_back(std::move(run));
  }
  return out;
}

std::vector<Stint> split_stints(const DriverRun& run) {
  std::vector<Stint> out;
  for (const auto& lap : run.laps) {
    if (!lap.stint_number) continue;
    if (out.empty() || out.back().stint_number != *lap.stint_number) {
      Stint s;
      s.session_key = run.session_key;
      s.driver_number = run.driver_number;
      s.stint_number = *lap.stint_number;
      out.push_back(std::move(s));
    }
    out.back().laps.push_back(lap);
  }
  return out;
}

int stint_tire_age(const Stint& stint, const RawSessionRecord& lap) {
  if (lap.tire_age) return *lap.tire_age;
  return lap.lap_number - stint.first_lap();
}

double stint_slope(const Stint& stint, double fallback) {
  double n = 0.0, sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
  for (const auto& lap : stint.laps) {
    if (!lap.lap_duration || lap.pit_in) continue;
    const double x = stint_tire_age(stint, lap);
    const double y = *lap.lap_duration;
    n += 1.0;
    sx += x;
    sy += y;
    sxx += x * x;
    sxy += x * y;
  }
  if (n < 3.0) return fallback;
  const double den = n * sxx - sx * sx;
  if (den <= 0.0) return fallback;
  return (n * sxy - sx * sy) / den;
}

double estimated_fuel_load(int lap_number, double burn_per_lap) {
  return std::max(5.0, 110.0 - burn_per_lap * lap_number);
}

static inline std::optional<double> gap_behind(const SessionIndex& index, const RawSessionRecord& r) {
  if (!r.position) return std::nullopt;
  const auto* behind = index.at(r.session_key, r.lap_number, *r.position + 1);
  if (!behind || !behind->interval) return std::nullopt;
  return behind->interval;
}

static inline const RawSessionRecord* car_ahead(const SessionIndex& index, const RawSessionRecord& r) {
  if (!r.position || *r.position <= 1) return nullptr;
  return index.at(r.session_key, r.lap_number, *r.position - 1);
}

static inline TrainingExample real_example(Domain d, FeatureMap features) {
  TrainingExample e;
  e.domain = d;
  e.features = std::move(features);
  e.source = Source::Real;
  e.confidence = 1.0;
  return e;
}

static void extract_tire(const DriverRun& run, const SessionIndex& index, double fuel_burn,
                         std::vector<TrainingExample>& out, std::size_t& skipped) {
  const int total = index.total_laps(run.session_key);
  for (const auto& stint : split_stints(run)) {
    const double slope = stint_slope(stint);
    const double length = static_cast<double>(stint.laps.size());
    for (const auto& lap : stint.laps) {
      const auto compound = lap.compound ? compound_from_name(*lap.compound) : std::nullopt;
      if (!lap.lap_duration || !compound || !lap.track_temperature || !lap.air_temperature ||
          !lap.humidity) {
        ++skipped;
        continue;
      }
      TireStrategyRequest r;
      r.track_temperature = *lap.track_temperature;
      r.air_temperature = *lap.air_temperature;
      r.humidity = *lap.humidity;
      r.current_lap = lap.lap_number;
      r.total_laps = total;
      r.remaining_laps = total - lap.lap_number;
      r.current_position = lap.position.value_or(r.current_position);
      r.gap_to_leader = lap.gap_to_leader.value_or(r.gap_to_leader);
      r.gap_to_car_ahead = lap.interval.value_or(r.gap_to_car_ahead);
      r.gap_to_car_behind = gap_behind(index, lap).value_or(r.gap_to_car_behind);
      r.fuel_load = estimated_fuel_load(lap.lap_number, fuel_burn);
      r.tire_age = stint_tire_age(stint, lap);
      r.rain_probability = lap.rainfall.value_or(false) ? 100.0 : 0.0;
      r.track_evolution = std::min(100.0, 2.0 * lap.lap_number);
      r.safety_car_deployed = lap.safety_car;
      r.vsc_deployed = lap.vsc;

      auto e = real_example(Domain::TireStrategy, to_features(r));
      e.labels["compound"] = static_cast<double>(static_cast<int>(*compound));
      e.labels["stint_length"] = length;
      e.labels["degradation_rate"] = slope;
      out.push_back(std::move(e));
    }
  }
}

static void extract_pit(const DriverRun& run, const SessionIndex& index, const PitSettings& pit,
                        std::vector<TrainingExample>& out, std::size_t& skipped) {
  const int total = index.total_laps(run.session_key);
  const auto stints = split_stints(run);
  // Only stints that ended in a stop carry a pit lap label.
  for (std::size_t s = 0; s + 1 < stints.size(); ++s) {
    const auto& stint = stints[s];
    const double slope = stint_slope(stint);
    const double pit_lap = stint.last_lap();
    double best = 0.0;
    for (const auto& lap : stint.laps)
      if (lap.lap_duration && !lap.pit_in && (best == 0.0 || *lap.lap_duration < best)) best = *lap.lap_duration;

    std::optional<double> prev_interval;
    for (const auto& lap : stint.laps) {
      const auto compound = lap.compound ? compound_from_name(*lap.compound) : std::nullopt;
      if (!lap.lap_duration || !compound || !lap.position || !lap.interval) {
        ++skipped;
        prev_interval.reset();
        continue;
      }
      PitStopRequest r;
      r.current_lap = lap.lap_number;
      r.total_laps = total;
      r.remaining_laps = total - lap.lap_number;
      r.tire_age = stint_tire_age(stint, lap);
      r.tire_compound_idx = static_cast<int>(*compound);
      r.current_position = *lap.position;
      r.gap_to_car_ahead = *lap.interval;
      r.gap_to_car_behind = gap_behind(index, lap).value_or(r.gap_to_car_behind);
      r.pit_delta = pit.pit_delta;
      r.tire_degradation_rate = slope;
      r.current_pace_delta = best > 0.0 ? *lap.lap_duration - best : 0.0;
      if (const auto* ahead = car_ahead(index, lap)) {
        if (ahead->tire_age) r.competitor_tire_age = *ahead->tire_age;
        if (ahead->compound)
          if (auto c = compound_from_name(*ahead->compound)) r.competitor_compound_idx = static_cast<int>(*c);
      }
      r.track_temperature = lap.track_temperature.value_or(r.track_temperature);
      r.rain_probability = lap.rainfall.value_or(false) ? 100.0 : 0.0;

      // Gap closed to the car ahead over this lap.
      const double gain = prev_interval ? *prev_interval - *lap.interval : 0.0;
      const bool window = gain > pit.undercut_gain_threshold;
      const bool undercut = window && *lap.interval < pit.undercut_gap_fraction * pit.pit_delta;
      prev_interval = lap.interval;

      auto e = real_example(Domain::PitStop, to_features(r));
      e.labels["in_pit_window"] = window ? 1.0 : 0.0;
      e.labels["undercut"] = undercut ? 1.0 : 0.0;
      e.labels["pit_lap"] = pit_lap;
      out.push_back(std::move(e));
    }
  }
}

static void extract_pace(const DriverRun& run, double fuel_burn, double fuel_effect,
                         std::vector<TrainingExample>& out, std::size_t& skipped) {
  std::optional<double> previous, best;
  double sum = 0.0;
  int timed = 0;
  int neutralised = 0;
  for (const auto& stint : split_stints(run)) {
    const double slope = stint_slope(stint);
    for (const auto& lap : stint.laps) {
      const auto compound = lap.compound ? compound_from_name(*lap.compound) : std::nullopt;
      const bool usable = lap.lap_duration && compound && lap.track_temperature && lap.air_temperature;
      if (lap.safety_car || lap.vsc) ++neutralised;
      if (!usable || lap.pit_in) {
        ++skipped;
        continue;
      }
      RacePaceRequest r;
      r.lap_number = lap.lap_number;
      r.fuel_load = estimated_fuel_load(lap.lap_number, fuel_burn);
      r.tire_age = stint_tire_age(stint, lap);
      r.tire_compound_idx = static_cast<int>(*compound);
      r.track_temperature = *lap.track_temperature;
      r.air_temperature = *lap.air_temperature;
      r.track_evolution = std::min(100.0, 2.0 * lap.lap_number);
      r.sector1_time = lap.sector1_time.value_or(r.sector1_time);
      r.sector2_time = lap.sector2_time.value_or(r.sector2_time);
      if (previous) r.previous_lap_time = *previous;
      if (best) r.best_lap_time = *best;
      if (timed > 0) r.avg_lap_time = sum / timed;
      r.position = lap.position.value_or(r.position);
      r.wind_speed = lap.wind_speed.value_or(r.wind_speed);
      r.humidity = lap.humidity.value_or(r.humidity);
      r.safety_car_laps = neutralised;

      auto e = real_example(Domain::RacePace, to_features(r));
      e.labels["lap_time"] = *lap.lap_duration;
      e.labels["fuel_effect"] = fuel_effect;
      e.labels["pace_trend"] = slope;
      out.push_back(std::move(e));

      // History only ever looks backwards.
      previous = *lap.lap_duration;
      best = best ? std::min(*best, *lap.lap_duration) : *lap.lap_duration;
      sum += *lap.lap_duration;
      ++timed;
    }
  }
}

static void extract_position(const DriverRun& run, const SessionIndex& index,
                             std::vector<TrainingExample>& out, std::size_t& skipped) {
  const int total = index.total_laps(run.session_key);
  std::vector<const RawSessionRecord*> placed;
  for (const auto& lap : run.laps) {
    if (lap.position && lap.interval) placed.push_back(&lap);
    else ++skipped;
  }
  if (placed.size() < 2) {
    skipped += placed.size();
    return;
  }
  const double final_position = *placed.back()->position;

  for (std::size_t k = 0; k + 1 < placed.size(); ++k) {
    const auto& lap = *placed[k];
    const int delta = *placed[k + 1]->position - *lap.position;

    PositionRequest r;
    r.current_position = *lap.position;
    r.lap_number = lap.lap_number;
    r.remaining_laps = total - lap.lap_number;
    r.gap_to_car_ahead = *lap.interval;
    r.gap_to_car_behind = gap_behind(index, lap).value_or(r.gap_to_car_behind);
    if (lap.tire_age) r.laps_since_pit = *lap.tire_age;
    if (const auto* ahead = car_ahead(index, lap)) {
      if (lap.lap_duration && ahead->lap_duration) r.relative_pace = *lap.lap_duration - *ahead->lap_duration;
      if (ahead->tire_age) {
        r.competitor_laps_since_pit = *ahead->tire_age;
        if (lap.tire_age) r.tire_advantage = *ahead->tire_age - *lap.tire_age;
      }
    }

    auto e = real_example(Domain::Position, to_features(r));
    e.labels["overtake"] = delta < 0 ? 1.0 : 0.0;
    e.labels["position_change"] = delta < 0 ? 2.0 : (delta > 0 ? 0.0 : 1.0);
    e.labels["final_position"] = final_position;
    out.push_back(std::move(e));
  }
}

std::vector<TrainingExample> RealSampleExtractor::extract(Domain d,
                                                          const std::vector<RawSessionRecord>& raw) const {
  constexpr double kFuelEffect = 0.03;   // s per kg
  const auto records = finite_records(raw);
  const SessionIndex index(records);
  std::vector<TrainingExample> out;
  std::size_t skipped = 0;
  for (const auto& run : group_runs(records)) {
    switch (d) {
      case Domain::TireStrategy:
        extract_tire(run, index, heuristics_.fuel_burn_per_lap, out, skipped);
        break;
      case Domain::PitStop:
        extract_pit(run, index, pit_, out, skipped);
        break;
      case Domain::RacePace:
        extract_pace(run, heuristics_.fuel_burn_per_lap, kFuelEffect, out, skipped);
        break;
      case Domain::Position:
        extract_position(run, index, out, skipped);
        break;
    }
  }
  get_logger("extractor").debug("extracted real examples", {
    {"domain", domain_name(d)}, {"records", std::to_string(records.size())},
    {"examples", std::to_string(out.size())}, {"skipped", std::to_string(skipped)}});
  return out;
}

} // namespace f1s
