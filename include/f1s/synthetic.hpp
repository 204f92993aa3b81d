#pragma once
#include <cstddef>
#include <optional>
#include <random>
#include <utility>
#include <vector>
#include <f1s/config.hpp>
#include <f1s/domain.hpp>
#include <f1s/example.hpp>

namespace f1s {

// Track-status draw for one synthetic sample.
enum class Neutralisation {
  Green,
  SafetyCar,
  VirtualSafetyCar,
};

// Single uniform draw; probabilities are clamped and capped to a total of 1
// keeping the SC:VSC ratio.
Neutralisation draw_neutralisation(double p_sc, double p_vsc, std::mt19937& rng);

// ---- rule tables (deterministic parts) ----

// First matching rule wins: wet, intermediate, hot track, cool track, short
// run to the flag, otherwise medium.
Compound rule_compound(double rain_probability, double track_temperature, double remaining_laps);

// Nominal stint length in laps for a compound.
double stint_base(Compound c);

// Lap time offset against a medium tire, seconds.
double compound_pace_offset(Compound c);

bool rule_in_pit_window(double tire_age, double remaining_laps, const PitSettings& pit);
bool rule_undercut(double gap_to_car_ahead, double pit_delta, double tire_age,
                   double competitor_tire_age, bool in_window, const PitSettings& pit);
bool rule_overtake(double gap_ahead, double relative_pace, bool drs, double overtaking_difficulty);

// 0 lose, 1 maintain, 2 gain.
int rule_position_change(bool overtake, double gap_behind, double relative_pace);
double rule_final_position(double current_position, double remaining_laps, int position_change);

// Temperature ranges seen in the real pool; unset when no example has the key.
struct ObservedRanges {
  std::optional<std::pair<double, double>> track_temperature;
  std::optional<std::pair<double, double>> air_temperature;
};

ObservedRanges observed_ranges(const std::vector<TrainingExample>& real);

// Number of synthetic examples to draw for a domain given the real pool size.
std::size_t synthetic_pool_size(Domain d, std::size_t n_real, double synthetic_weight,
                                std::size_t min_real_samples, const SyntheticSettings& s);

// Rule-labelled sample generator. Output is a pure function of the seed and
// the inputs; every example carries Source::Synthetic and the configured
// confidence.
class SyntheticGenerator {
public:
  SyntheticGenerator(SyntheticSettings settings, PitSettings pit, unsigned seed)
    : settings_(settings), pit_(pit), seed_(seed) {}

  // When real examples are given, their temperature range (padded) replaces
  // the default temperature bounds.
  std::vector<TrainingExample> generate(Domain d, std::size_t n,
                                        const std::vector<TrainingExample>& real = {}) const;

private:
  TrainingExample tire_(std::mt19937& rng, const ObservedRanges& obs) const;
  TrainingExample pit_stop_(std::mt19937& rng, const ObservedRanges& obs) const;
  TrainingExample race_pace_(std::mt19937& rng, const ObservedRanges& obs) const;
  TrainingExample position_(std::mt19937& rng) const;

  SyntheticSettings settings_;
  PitSettings pit_;
  unsigned seed_;
};

} // namespace f1s
