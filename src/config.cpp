#include <f1s/config.hpp>
#include <f1s/errors.hpp>
#include <f1s/text.hpp>
#include <fstream>

namespace f1s {

static bool parse_bool(const std::string& key, const std::string& value) {
  if (value == "true") return true;
  if (value == "false") return false;
  throw ConfigError("invalid boolean for " + key + ": " + value);
}

static double parse_double(const std::string& key, const std::string& value) {
  if (auto v = to_double(value)) return *v;
  throw ConfigError("invalid number for " + key + ": " + value);
}

static long parse_int(const std::string& key, const std::string& value) {
  if (auto v = to_long(value)) return *v;
  throw ConfigError("invalid integer for " + key + ": " + value);
}

static std::size_t parse_count(const std::string& key, const std::string& value) {
  const long v = parse_int(key, value);
  if (v < 0) throw ConfigError(key + " must not be negative");
  return static_cast<std::size_t>(v);
}

static std::optional<std::string> parse_optional_string(const std::string& value) {
  auto s = strip_quotes(value);
  if (s.empty() || s == "null" || s == "none") return std::nullopt;
  return s;
}

static void apply_logging(LoggingSettings& s, const std::string& key, const std::string& value) {
  if (key == "level")             s.level = strip_quotes(value);
  else if (key == "json")         s.json = parse_bool(key, value);
  else if (key == "log_file")     s.log_file = parse_optional_string(value);
  else if (key == "max_bytes")    s.max_bytes = static_cast<int>(parse_int(key, value));
  else if (key == "backup_count") s.backup_count = static_cast<int>(parse_int(key, value));
}

static void apply_training(TrainingSettings& s, const std::string& key, const std::string& value) {
  if (key == "models_dir")                 s.models_dir = strip_quotes(value);
  else if (key == "sessions_dir")          s.sessions_dir = strip_quotes(value);
  else if (key == "real_data_weight")      s.real_data_weight = parse_double(key, value);
  else if (key == "synthetic_data_weight") s.synthetic_data_weight = parse_double(key, value);
  else if (key == "min_real_samples")      s.min_real_samples = parse_count(key, value);
  else if (key == "test_fraction")         s.test_fraction = parse_double(key, value);
  else if (key == "seed")                  s.seed = static_cast<unsigned>(parse_count(key, value));
  else if (key == "max_estimators")        s.max_estimators = static_cast<int>(parse_int(key, value));
}

static void apply_synthetic(SyntheticSettings& s, const std::string& key, const std::string& value) {
  if (key == "confidence")               s.confidence = parse_double(key, value);
  else if (key == "tire_samples")        s.tire_samples = parse_count(key, value);
  else if (key == "pit_samples")         s.pit_samples = parse_count(key, value);
  else if (key == "pace_samples")        s.pace_samples = parse_count(key, value);
  else if (key == "position_samples")    s.position_samples = parse_count(key, value);
  else if (key == "temperature_padding") s.temperature_padding = parse_double(key, value);
}

static void apply_pit(PitSettings& s, const std::string& key, const std::string& value) {
  if (key == "pit_delta")                     s.pit_delta = parse_double(key, value);
  else if (key == "undercut_gap_fraction")    s.undercut_gap_fraction = parse_double(key, value);
  else if (key == "undercut_gain_threshold")  s.undercut_gain_threshold = parse_double(key, value);
  else if (key == "window_min_tire_age")      s.window_min_tire_age = static_cast<int>(parse_int(key, value));
  else if (key == "window_max_tire_age")      s.window_max_tire_age = static_cast<int>(parse_int(key, value));
  else if (key == "min_remaining_laps")       s.min_remaining_laps = static_cast<int>(parse_int(key, value));
  else if (key == "urgency_tire_age_margin")  s.urgency_tire_age_margin = static_cast<int>(parse_int(key, value));
  else if (key == "undercut_tire_age_margin") s.undercut_tire_age_margin = static_cast<int>(parse_int(key, value));
}

static void apply_heuristics(HeuristicSettings& s, const std::string& key, const std::string& value) {
  if (key == "max_recommendations")    s.max_recommendations = parse_count(key, value);
  else if (key == "trend_window")      s.trend_window = parse_count(key, value);
  else if (key == "projection_laps")   s.projection_laps = static_cast<int>(parse_int(key, value));
  else if (key == "fuel_burn_per_lap") s.fuel_burn_per_lap = parse_double(key, value);
}

EngineSettings settings_from_stream(std::istream& in) {
  EngineSettings settings;
  std::string section;
  std::string line;

  while (std::getline(in, line)) {
    if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    if (line.front() == '[' && line.back() == ']') {
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const auto key = trim(line.substr(0, eq));
    const auto value = trim(line.substr(eq + 1));

    if (section == "logging")         apply_logging(settings.logging, key, value);
    else if (section == "training")   apply_training(settings.training, key, value);
    else if (section == "synthetic")  apply_synthetic(settings.synthetic, key, value);
    else if (section == "pit")        apply_pit(settings.pit, key, value);
    else if (section == "heuristics") apply_heuristics(settings.heuristics, key, value);
  }

  if (settings.training.test_fraction < 0.0 || settings.training.test_fraction >= 1.0) {
    throw ConfigError("test_fraction must be in [0, 1)");
  }
  if (settings.training.max_estimators < 1) {
    throw ConfigError("max_estimators must be at least 1");
  }
  return settings;
}

std::optional<EngineSettings> load_settings(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return settings_from_stream(f);
}

} // namespace f1s
