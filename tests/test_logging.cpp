#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <f1s/logging.hpp>

using namespace f1s;

namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const fs::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

TEST_CASE("json log lines stay valid with control characters") {
  const auto path = fs::temp_directory_path() / "f1s_logging_json.log";
  fs::remove(path);

  LoggingSettings settings;
  settings.json = true;
  settings.log_file = path.string();
  settings.max_bytes = 0;
  configure_logging(settings);

  const std::string message = "col\tumn\r\nend \"quoted\" \\ \x01\x1f";
  get_logger("io").warn(message, {{"path", "a\tb"}});
  configure_logging(LoggingSettings{});

  const auto lines = read_lines(path);
  REQUIRE(lines.size() == 1);
  const auto j = nlohmann::json::parse(lines[0]);
  REQUIRE(j["level"] == "WARN");
  REQUIRE(j["name"] == "io");
  REQUIRE(j["message"] == message);
  REQUIRE(j["path"] == "a\tb");
  fs::remove(path);
}

TEST_CASE("records below the configured level are dropped") {
  const auto path = fs::temp_directory_path() / "f1s_logging_level.log";
  fs::remove(path);

  LoggingSettings settings;
  settings.level = "WARN";
  settings.log_file = path.string();
  settings.max_bytes = 0;
  configure_logging(settings);

  auto log = get_logger("trainer");
  log.info("hidden");
  log.error("shown", {{"model", "pit_stop"}});
  configure_logging(LoggingSettings{});

  const auto lines = read_lines(path);
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].find("ERROR trainer shown | model=pit_stop") != std::string::npos);
  fs::remove(path);
}
