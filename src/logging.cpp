#include <f1s/logging.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>

namespace f1s {

namespace {

struct LogSink {
  LogLevel level = LogLevel::Info;
  bool json = false;
  std::optional<std::string> log_file;
  int max_bytes = 0;
  int backup_count = 0;
  std::unique_ptr<std::ofstream> file;
  std::mutex mutex;
};

LogSink& sink() {
  static LogSink instance;
  return instance;
}

LogLevel parse_level(const std::string& level) {
  if (level == "DEBUG") return LogLevel::Debug;
  if (level == "WARN" || level == "WARNING") return LogLevel::Warn;
  if (level == "ERROR") return LogLevel::Error;
  return LogLevel::Info;
}

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

// Caller holds the sink mutex.
void rotate_if_needed(LogSink& s) {
  if (!s.log_file || s.max_bytes <= 0 || s.backup_count <= 0) return;

  const std::filesystem::path base(*s.log_file);
  std::error_code ec;
  const auto size = std::filesystem::file_size(base, ec);
  if (ec || size < static_cast<std::uintmax_t>(s.max_bytes)) return;

  s.file.reset();
  for (int i = s.backup_count - 1; i >= 1; --i) {
    auto from = base;
    from += "." + std::to_string(i);
    if (!std::filesystem::exists(from, ec)) continue;
    auto to = base;
    to += "." + std::to_string(i + 1);
    std::filesystem::rename(from, to, ec);
  }
  auto rotated = base;
  rotated += ".1";
  std::filesystem::rename(base, rotated, ec);
  s.file = std::make_unique<std::ofstream>(base, std::ios::app);
}

} // namespace

std::string timestamp_utc() {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::log(LogLevel level, const std::string& message, const LogFields& extra) const {
  auto& s = sink();
  std::lock_guard<std::mutex> guard(s.mutex);
  if (static_cast<int>(level) < static_cast<int>(s.level)) return;

  rotate_if_needed(s);
  std::ostream& out = s.file ? static_cast<std::ostream&>(*s.file) : std::clog;

  std::ostringstream line;
  if (s.json) {
    line << "{\"ts\":\"" << timestamp_utc() << "\",\"level\":\"" << level_name(level)
         << "\",\"name\":\"" << json_escape(name_) << "\",\"message\":\"" << json_escape(message) << "\"";
    for (const auto& [key, value] : extra) {
      line << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
    }
    line << "}";
  } else {
    line << timestamp_utc() << " " << level_name(level) << " " << name_ << " " << message;
    if (!extra.empty()) {
      line << " |";
      for (const auto& [key, value] : extra) line << " " << key << "=" << value;
    }
  }
  out << line.str() << '\n';
  out.flush();
}

void Logger::debug(const std::string& message, const LogFields& extra) const {
  log(LogLevel::Debug, message, extra);
}

void Logger::info(const std::string& message, const LogFields& extra) const {
  log(LogLevel::Info, message, extra);
}

void Logger::warn(const std::string& message, const LogFields& extra) const {
  log(LogLevel::Warn, message, extra);
}

void Logger::error(const std::string& message, const LogFields& extra) const {
  log(LogLevel::Error, message, extra);
}

void configure_logging(const LoggingSettings& settings) {
  auto& s = sink();
  std::lock_guard<std::mutex> guard(s.mutex);
  s.level = parse_level(settings.level);
  s.json = settings.json;
  s.log_file = settings.log_file;
  s.max_bytes = settings.max_bytes;
  s.backup_count = settings.backup_count;
  s.file.reset();
  if (settings.log_file) {
    auto f = std::make_unique<std::ofstream>(*settings.log_file, std::ios::app);
    if (f->is_open()) s.file = std::move(f);
  }
}

Logger get_logger(const std::string& name) {
  return Logger(name);
}

} // namespace f1s
