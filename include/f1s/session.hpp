#pragma once
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace f1s {

// One observed lap of one driver in one session. Everything beyond the
// identifying triple may be absent in the upstream feed.
struct RawSessionRecord {
  int session_key = 0;
  int driver_number = 0;
  int lap_number = 0;

  std::optional<double> lap_duration;       // seconds
  std::optional<std::string> compound;      // "SOFT", "MEDIUM", ...
  std::optional<int> stint_number;
  std::optional<int> tire_age;              // laps on this set at lap end
  std::optional<double> track_temperature;  // Celsius
  std::optional<double> air_temperature;
  std::optional<double> humidity;           // percent
  std::optional<double> wind_speed;         // m/s
  std::optional<bool> rainfall;
  std::optional<int> position;
  std::optional<double> gap_to_leader;      // seconds
  std::optional<double> interval;           // seconds to the car ahead
  std::optional<double> sector1_time;
  std::optional<double> sector2_time;
  bool pit_in = false;                      // entered the pit lane this lap
  bool safety_car = false;
  bool vsc = false;
};

// Stream-based CSV loader (test-friendly; no filesystem required).
// The first non-comment row is a header naming the columns; column order is
// free and unknown columns are ignored. Lines starting with '#' and blank
// lines are skipped. Empty cells leave the field unset. Rows without a
// parsable session_key, driver_number and lap_number are skipped.
std::vector<RawSessionRecord> session_records_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<std::vector<RawSessionRecord>> load_session_csv(const std::string& path);

// Read-only provider of raw records for a session key.
class SessionSource {
public:
  virtual ~SessionSource() = default;
  virtual std::vector<RawSessionRecord> fetch(int session_key) = 0;
};

// Reads "<dir>/<session_key>.csv". A missing file yields no records.
class CsvSessionSource : public SessionSource {
public:
  explicit CsvSessionSource(std::string dir) : dir_(std::move(dir)) {}
  std::vector<RawSessionRecord> fetch(int session_key) override;

private:
  std::string dir_;
};

} // namespace f1s
