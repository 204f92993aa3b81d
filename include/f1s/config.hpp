#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace f1s {

struct LoggingSettings {
  std::string level = "INFO";            // DEBUG | INFO | WARN | ERROR
  bool json = false;                     // JSON lines instead of plain text
  std::optional<std::string> log_file;   // stderr when unset
  int max_bytes = 1'000'000;             // rotate when the file grows past this
  int backup_count = 3;
};

struct TrainingSettings {
  std::string models_dir = "./models";
  std::string sessions_dir;              // CSV session source, optional
  double real_data_weight = 0.7;
  double synthetic_data_weight = 0.3;
  std::size_t min_real_samples = 100;    // below this the full synthetic pool is used
  double test_fraction = 0.2;            // held-out share for metrics
  unsigned seed = 42;
  int max_estimators = 100;              // caps every ensemble's tree count
};

struct SyntheticSettings {
  double confidence = 0.3;               // fixed confidence of rule-derived labels
  std::size_t tire_samples = 1000;
  std::size_t pit_samples = 800;
  std::size_t pace_samples = 1000;
  std::size_t position_samples = 800;
  double temperature_padding = 5.0;      // widen observed temperature ranges by this
};

struct PitSettings {
  double pit_delta = 22.0;               // seconds lost in the pit lane
  double undercut_gap_fraction = 0.15;   // undercut needs gap < fraction * pit_delta
  double undercut_gain_threshold = 0.3;  // seconds closed per lap on the car ahead
  int window_min_tire_age = 15;
  int window_max_tire_age = 30;
  int min_remaining_laps = 10;
  int urgency_tire_age_margin = 20;      // tire age where urgency sits at 50
  int undercut_tire_age_margin = 3;
};

struct HeuristicSettings {
  std::size_t max_recommendations = 4;   // first-N matches kept
  std::size_t trend_window = 3;          // trailing projected laps for the pace trend
  int projection_laps = 5;
  double fuel_burn_per_lap = 1.8;        // kg
};

struct EngineSettings {
  LoggingSettings logging{};
  TrainingSettings training{};
  SyntheticSettings synthetic{};
  PitSettings pit{};
  HeuristicSettings heuristics{};
};

// Stream-based loader (test-friendly; no filesystem required).
// INI/TOML-like: [section] headers, key = value, '#' comments, blank lines.
// Unknown sections and keys are ignored; malformed values throw ConfigError.
EngineSettings settings_from_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<EngineSettings> load_settings(const std::string& path);

} // namespace f1s
