#include <f1s/session.hpp>
#include <f1s/logging.hpp>
#include <f1s/text.hpp>
#include <cmath>
#include <filesystem>
#include <limits>
#include <fstream>
#include <map>

namespace f1s {

namespace {

using Row = std::map<std::string, std::string>;

const std::string* cell(const Row& row, const char* key) {
  auto it = row.find(key);
  if (it == row.end() || it->second.empty()) return nullptr;
  return &it->second;
}

std::optional<double> opt_double(const Row& row, const char* key) {
  if (const auto* c = cell(row, key)) return to_double(*c);
  return std::nullopt;
}

std::optional<int> opt_int(const Row& row, const char* key) {
  if (const auto* c = cell(row, key)) {
    if (auto v = to_long(*c)) {
      if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
      return static_cast<int>(*v);
    }
    // Feeds sometimes write integers as "12.0"
    if (auto d = to_double(*c)) {
      if (*d != std::floor(*d) || *d < std::numeric_limits<int>::min() ||
          *d > std::numeric_limits<int>::max())
        return std::nullopt;
      return static_cast<int>(*d);
    }
  }
  return std::nullopt;
}

std::optional<bool> opt_bool(const Row& row, const char* key) {
  const auto* c = cell(row, key);
  if (!c) return std::nullopt;
  const auto v = upper(*c);
  if (v == "1" || v == "TRUE" || v == "YES") return true;
  if (v == "0" || v == "FALSE" || v == "NO") return false;
  return std::nullopt;
}

std::optional<RawSessionRecord> parse_record_row(const Row& row) {
  const auto session = opt_int(row, "session_key");
  const auto driver = opt_int(row, "driver_number");
  const auto lap = opt_int(row, "lap_number");
  if (!session || !driver || !lap) return std::nullopt;

  RawSessionRecord r;
  r.session_key = *session;
  r.driver_number = *driver;
  r.lap_number = *lap;
  r.lap_duration = opt_double(row, "lap_duration");
  if (const auto* c = cell(row, "compound")) r.compound = upper(*c);
  r.stint_number = opt_int(row, "stint_number");
  r.tire_age = opt_int(row, "tire_age");
  r.track_temperature = opt_double(row, "track_temperature");
  r.air_temperature = opt_double(row, "air_temperature");
  r.humidity = opt_double(row, "humidity");
  r.wind_speed = opt_double(row, "wind_speed");
  r.rainfall = opt_bool(row, "rainfall");
  r.position = opt_int(row, "position");
  r.gap_to_leader = opt_double(row, "gap_to_leader");
  r.interval = opt_double(row, "interval");
  r.sector1_time = opt_double(row, "sector1_time");
  r.sector2_time = opt_double(row, "sector2_time");
  r.pit_in = opt_bool(row, "pit_in").value_or(false);
  r.safety_car = opt_bool(row, "safety_car").value_or(false);
  r.vsc = opt_bool(row, "vsc").value_or(false);
  return r;
}

} // namespace

std::vector<RawSessionRecord> session_records_from_csv_stream(std::istream& in) {
  std::vector<RawSessionRecord> out;
  std::vector<std::string> header;
  std::string line;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (header.empty()) {
      header = std::move(cols);
      continue;
    }

    Row row;
    for (std::size_t i = 0; i < header.size() && i < cols.size(); ++i) {
      row[header[i]] = cols[i];
    }
    if (auto rec = parse_record_row(row); rec.has_value()) {
      out.push_back(std::move(*rec));
    }
  }
  return out;
}

std::optional<std::vector<RawSessionRecord>> load_session_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return session_records_from_csv_stream(f);
}

std::vector<RawSessionRecord> CsvSessionSource::fetch(int session_key) {
  const auto path = std::filesystem::path(dir_) / (std::to_string(session_key) + ".csv");
  auto records = load_session_csv(path.string());
  if (!records) {
    get_logger("session").warn("session file not found", {{"path", path.string()}});
    return {};
  }
  return std::move(*records);
}

} // namespace f1s
