#pragma once
#include <vector>
#include <f1s/config.hpp>
#include <f1s/domain.hpp>
#include <f1s/example.hpp>
#include <f1s/session.hpp>

namespace f1s {

// Laps of one driver on one set of tires, ordered by lap number.
struct Stint {
  int session_key = 0;
  int driver_number = 0;
  int stint_number = 0;
  std::vector<RawSessionRecord> laps;

  int first_lap() const { return laps.empty() ? 0 : laps.front().lap_number; }
  int last_lap() const { return laps.empty() ? 0 : laps.back().lap_number; }
};

// All laps of one driver in one session, ordered by lap number.
struct DriverRun {
  int session_key = 0;
  int driver_number = 0;
  std::vector<RawSessionRecord> laps;
};

std::vector<DriverRun> group_runs(const std::vector<RawSessionRecord>& records);

// Consecutive laps sharing a stint number. Laps without one are dropped.
std::vector<Stint> split_stints(const DriverRun& run);

// Least-squares slope of lap time against tire age in s/lap, over the timed
// laps of the stint that are not in-laps. Returns fallback below three laps.
double stint_slope(const Stint& stint, double fallback = 0.05);

// Tire age on a lap: the feed's value when present, else laps since the
// stint's first lap.
int stint_tire_age(const Stint& stint, const RawSessionRecord& lap);

// Fuel estimate in kg for a lap: max(5, 110 - burn * lap).
double estimated_fuel_load(int lap_number, double burn_per_lap);

// Derives labelled examples from observed laps. Records missing a field the
// domain needs are skipped; unobservable features take the request defaults.
class RealSampleExtractor {
public:
  RealSampleExtractor(PitSettings pit, HeuristicSettings heuristics)
    : pit_(pit), heuristics_(heuristics) {}

  std::vector<TrainingExample> extract(Domain d, const std::vector<RawSessionRecord>& records) const;

private:
  PitSettings pit_;
  HeuristicSettings heuristics_;
};

} // namespace f1s
