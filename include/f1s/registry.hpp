#pragma once
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <f1s/artifact.hpp>
#include <f1s/domain.hpp>

namespace f1s {

enum class ModelState {
  NotLoaded,
  Training,
  Ready,
  Error,     // last training failed; a previous artifact may still serve
};

struct ModelStatus {
  std::string name;
  std::string status;        // not_loaded | training | trained | loaded | error
  std::string description;
  bool ready = false;        // an artifact is servable
};

// Owns one artifact slot per domain. Readers take a snapshot pointer; a
// retrain publishes a new artifact only after it is built and persisted.
class ModelRegistry {
public:
  using FitFn = std::function<std::unique_ptr<ModelArtifact>()>;

  explicit ModelRegistry(std::string models_dir) : models_dir_(std::move(models_dir)) {}
  ModelRegistry(const ModelRegistry&) = delete;
  ModelRegistry& operator=(const ModelRegistry&) = delete;

  // Loads every persisted artifact. Missing files leave the slot NotLoaded;
  // unreadable ones put it in Error and are logged.
  void load_all();

  std::vector<ModelStatus> status() const;
  ModelState state(Domain d) const;

  // Nullable snapshot.
  std::shared_ptr<const ModelArtifact> artifact(Domain d) const;

  // Throws NotFoundError for unknown names and for models with no artifact.
  std::shared_ptr<const ModelArtifact> get(const std::string& name) const;

  // Serialised per domain. On failure the slot moves to Error, the previous
  // artifact stays published, and the exception propagates.
  std::shared_ptr<const ModelArtifact> train(Domain d, const FitFn& fit);

  const std::string& models_dir() const { return models_dir_; }

private:
  struct Slot {
    std::mutex train_mutex;
    std::atomic<std::shared_ptr<const ModelArtifact>> artifact;
    std::atomic<ModelState> state{ModelState::NotLoaded};
    std::atomic<bool> from_disk{false};
  };

  Slot& slot_(Domain d) { return slots_[static_cast<std::size_t>(d)]; }
  const Slot& slot_(Domain d) const { return slots_[static_cast<std::size_t>(d)]; }

  std::string models_dir_;
  std::array<Slot, kAllDomains.size()> slots_;
};

} // namespace f1s
