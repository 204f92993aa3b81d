#include <f1s/registry.hpp>
#include <f1s/errors.hpp>
#include <f1s/logging.hpp>

namespace f1s {

void ModelRegistry::load_all() {
  auto log = get_logger("registry");
  for (Domain d : kAllDomains) {
    auto& s = slot_(d);
    std::lock_guard<std::mutex> guard(s.train_mutex);
    const auto path = artifact_path(models_dir_, d);
    try {
      auto loaded = load_artifact(path);
      if (!loaded) {
        log.info("no saved model", {{"model", domain_name(d)}, {"path", path}});
        continue;
      }
      check_artifact(*loaded, d);
      std::shared_ptr<const ModelArtifact> a = std::make_shared<ModelArtifact>(std::move(*loaded));
      s.artifact.store(std::move(a));
      s.from_disk = true;
      s.state = ModelState::Ready;
      log.info("loaded model", {{"model", domain_name(d)}, {"path", path}});
    } catch (const Error& e) {
      s.state = ModelState::Error;
      log.error("failed to load model", {{"model", domain_name(d)}, {"error", e.what()}});
    }
  }
}

ModelState ModelRegistry::state(Domain d) const {
  return slot_(d).state.load();
}

std::vector<ModelStatus> ModelRegistry::status() const {
  std::vector<ModelStatus> out;
  for (Domain d : kAllDomains) {
    const auto& s = slot_(d);
    ModelStatus st;
    st.name = domain_name(d);
    st.description = domain_description(d);
    st.ready = s.artifact.load() != nullptr;
    switch (s.state.load()) {
      case ModelState::NotLoaded: st.status = "not_loaded"; break;
      case ModelState::Training:  st.status = "training"; break;
      case ModelState::Ready:     st.status = s.from_disk ? "loaded" : "trained"; break;
      case ModelState::Error:     st.status = "error"; break;
    }
    out.push_back(std::move(st));
  }
  return out;
}

std::shared_ptr<const ModelArtifact> ModelRegistry::artifact(Domain d) const {
  return slot_(d).artifact.load();
}

std::shared_ptr<const ModelArtifact> ModelRegistry::get(const std::string& name) const {
  const auto d = domain_from_name(name);
  if (!d) throw NotFoundError("unknown model: " + name);
  auto a = artifact(*d);
  if (!a) throw NotFoundError("model has no artifact: " + name);
  return a;
}

std::shared_ptr<const ModelArtifact> ModelRegistry::train(Domain d, const FitFn& fit) {
  auto& s = slot_(d);
  std::lock_guard<std::mutex> guard(s.train_mutex);
  auto log = get_logger("registry");
  s.state = ModelState::Training;
  try {
    auto built = fit();
    if (!built) throw TrainingFailure(std::string(domain_name(d)) + ": fit produced no artifact");
    save_artifact(*built, artifact_path(models_dir_, d));
    std::shared_ptr<const ModelArtifact> a = std::move(built);
    s.artifact.store(a);
    s.from_disk = false;
    s.state = ModelState::Ready;
    log.info("published model", {{"model", domain_name(d)}, {"trained_at", a->trained_at}});
    return a;
  } catch (const std::exception& e) {
    s.state = ModelState::Error;
    log.error("training failed", {{"model", domain_name(d)}, {"error", e.what()},
                                  {"previous_servable", s.artifact.load() ? "true" : "false"}});
    throw;
  }
}

} // namespace f1s
