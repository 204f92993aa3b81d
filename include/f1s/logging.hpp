#pragma once
#include <map>
#include <string>
#include <f1s/config.hpp>

namespace f1s {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

using LogFields = std::map<std::string, std::string>;

// Named logger; all instances share one process-wide sink.
class Logger {
public:
  explicit Logger(std::string name);

  void log(LogLevel level, const std::string& message, const LogFields& extra = {}) const;

  void debug(const std::string& message, const LogFields& extra = {}) const;
  void info(const std::string& message, const LogFields& extra = {}) const;
  void warn(const std::string& message, const LogFields& extra = {}) const;
  void error(const std::string& message, const LogFields& extra = {}) const;

  const std::string& name() const { return name_; }

private:
  std::string name_;
};

void configure_logging(const LoggingSettings& settings);
Logger get_logger(const std::string& name);

// "2026-03-01T12:00:00Z"
std::string timestamp_utc();

} // namespace f1s
