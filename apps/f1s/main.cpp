#include <f1s/config.hpp>
#include <f1s/errors.hpp>
#include <f1s/json_io.hpp>
#include <f1s/logging.hpp>
#include <f1s/prediction.hpp>
#include <f1s/registry.hpp>
#include <f1s/scenarios.hpp>
#include <f1s/session.hpp>
#include <f1s/text.hpp>
#include <f1s/training.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace f1s;

namespace {

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <command> [args]\n"
            << "Commands:\n"
            << "  status                      model status\n"
            << "  train <model|all>           fit and publish models\n"
            << "  predict <model> <req.json>  run one prediction\n"
            << "  analyze <req.json>          run all four models on one situation\n"
            << "  scenarios [key]             strategy scenario catalog\n"
            << "  info <model>                model description and metrics\n"
            << "Options:\n"
            << "  --config <path>  --sessions <dir>  --session-keys 1,2,...\n"
            << "  --real-weight <w>  --synthetic-weight <w>  --no-hybrid\n";
}

struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> sessions_dir;
  std::vector<int> session_keys;
  std::optional<double> real_weight;
  std::optional<double> synthetic_weight;
  bool hybrid = true;
  std::vector<std::string> positional;
};

double parse_weight(const std::string& flag, const std::string& value) {
  if (auto v = to_double(value)) return *v;
  throw ConfigError("invalid number for " + flag + ": " + value);
}

std::vector<int> parse_keys(const std::string& value) {
  std::vector<int> keys;
  for (const auto& part : split_csv_line(value)) {
    if (part.empty()) continue;
    auto v = to_long(part);
    if (!v) throw ConfigError("invalid session key: " + part);
    keys.push_back(static_cast<int>(*v));
  }
  return keys;
}

nlohmann::json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw NotFoundError("cannot open " + path);
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw SchemaError("request", "cannot parse " + path + ": " + e.what());
  }
}

Domain require_domain(const std::string& name) {
  if (auto d = domain_from_name(name)) return *d;
  throw NotFoundError("unknown model: " + name);
}

nlohmann::json error_json(const std::string& type, const std::string& message) {
  return {{"error", message}, {"type", type}};
}

int run(const CliOptions& opt) {
  EngineSettings settings;
  if (opt.config_path) {
    auto loaded = load_settings(*opt.config_path);
    if (!loaded) throw ConfigError("cannot open config file: " + *opt.config_path);
    settings = *loaded;
  }
  if (opt.sessions_dir) settings.training.sessions_dir = *opt.sessions_dir;
  configure_logging(settings.logging);

  const auto& pos = opt.positional;
  const std::string& cmd = pos.front();

  if (cmd == "scenarios") {
    if (pos.size() > 1) {
      auto s = scenario_by_key(pos[1]);
      if (!s) throw NotFoundError("scenario not found: " + pos[1]);
      std::cout << nlohmann::json(*s).dump(2) << '\n';
    } else {
      std::cout << nlohmann::json({{"scenarios", scenario_catalog()}}).dump(2) << '\n';
    }
    return 0;
  }

  ModelRegistry registry(settings.training.models_dir);
  registry.load_all();

  if (cmd == "status") {
    std::cout << nlohmann::json({{"models", registry.status()}}).dump(2) << '\n';
    return 0;
  }

  if (cmd == "info") {
    if (pos.size() < 2) throw ConfigError("info needs a model name");
    std::cout << model_info_json(require_domain(pos[1]), registry).dump(2) << '\n';
    return 0;
  }

  if (cmd == "train") {
    if (pos.size() < 2) throw ConfigError("train needs a model name or 'all'");
    std::shared_ptr<SessionSource> sessions;
    if (!settings.training.sessions_dir.empty())
      sessions = std::make_shared<CsvSessionSource>(settings.training.sessions_dir);

    TrainRequest req;
    req.hybrid_mode = opt.hybrid;
    req.real_data_weight = opt.real_weight.value_or(settings.training.real_data_weight);
    req.synthetic_data_weight = opt.synthetic_weight.value_or(settings.training.synthetic_data_weight);
    req.session_keys = opt.session_keys;

    TrainingService service(registry, sessions, settings);
    if (pos[1] == "all") {
      const auto outcomes = service.train_all(req);
      std::cout << nlohmann::json({{"results", outcomes}}).dump(2) << '\n';
      for (const auto& o : outcomes)
        if (!o.ok) return 1;
      return 0;
    }
    std::cout << nlohmann::json(service.train(require_domain(pos[1]), req)).dump(2) << '\n';
    return 0;
  }

  const PredictionService predictions(registry, settings.pit, settings.heuristics);

  if (cmd == "predict") {
    if (pos.size() < 3) throw ConfigError("predict needs a model name and a request file");
    const auto body = read_json_file(pos[2]);
    nlohmann::json out;
    switch (require_domain(pos[1])) {
      case Domain::TireStrategy: out = predictions.predict_tire(tire_request_from_json(body)); break;
      case Domain::PitStop:      out = predictions.predict_pit_stop(pit_request_from_json(body)); break;
      case Domain::RacePace:     out = predictions.predict_race_pace(pace_request_from_json(body)); break;
      case Domain::Position:     out = predictions.predict_position(position_request_from_json(body)); break;
    }
    std::cout << out.dump(2) << '\n';
    return 0;
  }

  if (cmd == "analyze") {
    if (pos.size() < 2) throw ConfigError("analyze needs a request file");
    const auto analysis = predictions.analyze(analysis_request_from_json(read_json_file(pos[1])));
    std::cout << nlohmann::json(analysis).dump(2) << '\n';
    return 0;
  }

  throw ConfigError("unknown command: " + cmd);
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opt;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) throw ConfigError(arg + " needs a value");
        return argv[++i];
      };
      if (arg == "--config") opt.config_path = value();
      else if (arg == "--sessions") opt.sessions_dir = value();
      else if (arg == "--session-keys") opt.session_keys = parse_keys(value());
      else if (arg == "--real-weight") opt.real_weight = parse_weight(arg, value());
      else if (arg == "--synthetic-weight") opt.synthetic_weight = parse_weight(arg, value());
      else if (arg == "--no-hybrid") opt.hybrid = false;
      else if (arg == "-h" || arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (!arg.empty() && arg[0] == '-') {
        print_usage(argv[0]);
        return 2;
      } else {
        opt.positional.push_back(arg);
      }
    }
  } catch (const ConfigError& e) {
    std::cerr << e.what() << '\n';
    print_usage(argv[0]);
    return 2;
  }

  if (opt.positional.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  try {
    return run(opt);
  } catch (const SchemaError& e) {
    auto j = error_json("schema_error", e.what());
    j["field"] = e.field();
    std::cout << j.dump(2) << '\n';
  } catch (const ConfigError& e) {
    std::cout << error_json("config_error", e.what()).dump(2) << '\n';
  } catch (const NotReadyError& e) {
    std::cout << error_json("not_ready", e.what()).dump(2) << '\n';
  } catch (const NotFoundError& e) {
    std::cout << error_json("not_found", e.what()).dump(2) << '\n';
  } catch (const TrainingFailure& e) {
    std::cout << error_json("training_failure", e.what()).dump(2) << '\n';
  } catch (const Error& e) {
    std::cout << error_json("error", e.what()).dump(2) << '\n';
  } catch (const std::exception& e) {
    std::cout << error_json("internal", e.what()).dump(2) << '\n';
  }
  return 1;
}
