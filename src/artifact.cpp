#include <f1s/artifact.hpp>
#include <f1s/errors.hpp>
#include <f1s/features.hpp>
#include <f1s/trainer.hpp>

#include <filesystem>
#include <fstream>

namespace f1s {

const Estimator& ModelArtifact::estimator(const std::string& target) const {
  auto it = estimators.find(target);
  if (it == estimators.end() || !it->second)
    throw NotFoundError(model_name + " has no estimator for " + target);
  return *it->second;
}

nlohmann::json metrics_to_json(const TrainingMetrics& m) {
  return {
    {"scores", m.scores},
    {"data_breakdown", {{"real", m.data_breakdown.real},
                        {"synthetic", m.data_breakdown.synthetic},
                        {"total", m.data_breakdown.total()}}},
    {"real_data_weight", m.real_data_weight},
    {"synthetic_data_weight", m.synthetic_data_weight},
    {"real_influence", m.real_influence},
    {"train_samples", m.train_samples},
    {"test_samples", m.test_samples},
  };
}

TrainingMetrics metrics_from_json(const nlohmann::json& j) {
  TrainingMetrics m;
  j.at("scores").get_to(m.scores);
  const auto& b = j.at("data_breakdown");
  b.at("real").get_to(m.data_breakdown.real);
  b.at("synthetic").get_to(m.data_breakdown.synthetic);
  j.at("real_data_weight").get_to(m.real_data_weight);
  j.at("synthetic_data_weight").get_to(m.synthetic_data_weight);
  j.at("real_influence").get_to(m.real_influence);
  j.at("train_samples").get_to(m.train_samples);
  j.at("test_samples").get_to(m.test_samples);
  return m;
}

nlohmann::json artifact_to_json(const ModelArtifact& a) {
  nlohmann::json estimators = nlohmann::json::object();
  for (const auto& [target, est] : a.estimators) estimators[target] = est->to_json();
  return {
    {"format", 1},
    {"domain", domain_name(a.domain)},
    {"model_name", a.model_name},
    {"feature_schema", a.feature_schema},
    {"estimators", estimators},
    {"metrics", metrics_to_json(a.metrics)},
    {"trained_at", a.trained_at},
  };
}

ModelArtifact artifact_from_json(const nlohmann::json& j) {
  try {
    ModelArtifact a;
    const auto name = j.at("domain").get<std::string>();
    const auto d = domain_from_name(name);
    if (!d) throw Error("unknown domain in artifact: " + name);
    a.domain = *d;
    j.at("model_name").get_to(a.model_name);
    j.at("feature_schema").get_to(a.feature_schema);
    for (const auto& [target, est] : j.at("estimators").items())
      a.estimators[target] = estimator_from_json(est);
    a.metrics = metrics_from_json(j.at("metrics"));
    j.at("trained_at").get_to(a.trained_at);
    return a;
  } catch (const nlohmann::json::exception& e) {
    throw Error(std::string("malformed model artifact: ") + e.what());
  } catch (const std::runtime_error& e) {
    throw Error(std::string("malformed model artifact: ") + e.what());
  }
}

void check_artifact(const ModelArtifact& a, Domain d) {
  const std::string name = domain_name(d);
  if (a.domain != d)
    throw Error(name + " slot holds a " + domain_name(a.domain) + " artifact");
  const auto& schema = feature_schema(d);
  if (a.feature_schema != schema) throw Error(name + " artifact has a different feature schema");
  for (const auto& t : target_table(d)) {
    auto it = a.estimators.find(t.target);
    if (it == a.estimators.end() || !it->second)
      throw Error(name + " artifact has no estimator for " + t.target);
    const auto& est = *it->second;
    if (est.kind() != t.kind)
      throw Error(name + "/" + t.target + " is a " + estimator_kind_name(est.kind()) +
                  ", expected " + estimator_kind_name(t.kind));
    if (est.is_classifier() && est.n_classes() != t.n_classes)
      throw Error(name + "/" + t.target + " has " + std::to_string(est.n_classes()) + " classes, expected " +
                  std::to_string(t.n_classes));
    if (est.max_feature() >= static_cast<int>(schema.size()))
      throw Error(name + "/" + t.target + " splits on feature " + std::to_string(est.max_feature()) +
                  " beyond the schema");
  }
}

std::string artifact_path(const std::string& models_dir, Domain d) {
  return (std::filesystem::path(models_dir) / (std::string(domain_name(d)) + "_model.json")).string();
}

void save_artifact(const ModelArtifact& a, const std::string& path) {
  const std::filesystem::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) throw Error("cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  auto tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw Error("cannot write " + tmp.string());
    out << artifact_to_json(a).dump();
    out.flush();
    if (!out) throw Error("short write to " + tmp.string());
  }
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw Error("cannot move artifact into " + path);
  }
}

std::optional<ModelArtifact> load_artifact(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw Error("cannot parse " + path + ": " + e.what());
  }
  return artifact_from_json(j);
}

} // namespace f1s
