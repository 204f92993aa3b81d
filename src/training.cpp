#include <f1s/training.hpp>
#include <f1s/blend.hpp>
#include <f1s/errors.hpp>
#include <f1s/extractor.hpp>
#include <f1s/logging.hpp>
#include <f1s/synthetic.hpp>
#include <f1s/text.hpp>
#include <f1s/trainer.hpp>

#include <thread>

namespace f1s {

std::vector<RawSessionRecord> TrainingService::fetch_(const TrainRequest& req) const {
  std::vector<RawSessionRecord> records;
  if (!req.hybrid_mode || !sessions_) return records;
  for (int key : req.session_keys) {
    auto part = sessions_->fetch(key);
    records.insert(records.end(), part.begin(), part.end());
  }
  return records;
}

TrainResult TrainingService::train(Domain d, const TrainRequest& req) {
  // Reject bad weights before touching any session data.
  normalise_weights(req.real_data_weight, req.synthetic_data_weight);
  return train_with_(d, req, fetch_(req));
}

TrainResult TrainingService::train_with_(Domain d, const TrainRequest& req,
                                         const std::vector<RawSessionRecord>& records) {
  auto log = get_logger("training");
  auto [real_weight, synthetic_weight] = normalise_weights(req.real_data_weight, req.synthetic_data_weight);
  if (!req.hybrid_mode) {
    real_weight = 0.0;
    synthetic_weight = 1.0;
  }

  const RealSampleExtractor extractor(settings_.pit, settings_.heuristics);
  auto real = req.hybrid_mode ? extractor.extract(d, records) : std::vector<TrainingExample>{};
  if (req.hybrid_mode && real.empty() && !req.session_keys.empty())
    log.warn("no usable real examples; training on synthetic data only", {{"model", domain_name(d)}});

  const auto n_synthetic = synthetic_pool_size(d, real.size(), synthetic_weight,
                                               settings_.training.min_real_samples, settings_.synthetic);
  const SyntheticGenerator generator(settings_.synthetic, settings_.pit, settings_.training.seed);
  auto synthetic = generator.generate(d, n_synthetic, real);

  const auto data = blend(std::move(real), std::move(synthetic), real_weight, synthetic_weight);
  log.info("training model", {
    {"model", domain_name(d)},
    {"real_samples", std::to_string(data.data_breakdown.real)},
    {"synthetic_samples", std::to_string(data.data_breakdown.synthetic)},
    {"real_weight", format_fixed(data.real_weight, 3)}});

  const ModelTrainer trainer(settings_.training);
  const auto artifact = registry_.train(d, [&] { return trainer.train(d, data); });

  TrainResult out;
  out.model = domain_name(d);
  out.metrics = artifact->metrics;
  out.real_samples = data.data_breakdown.real;
  out.synthetic_samples = data.data_breakdown.synthetic;
  out.real_data_weight = data.real_weight;
  out.synthetic_data_weight = data.synthetic_weight;
  return out;
}

std::vector<TrainOutcome> TrainingService::train_all(const TrainRequest& req) {
  normalise_weights(req.real_data_weight, req.synthetic_data_weight);
  const auto records = fetch_(req);

  std::vector<TrainOutcome> outcomes(kAllDomains.size());
  std::vector<std::thread> workers;
  workers.reserve(kAllDomains.size());
  for (std::size_t i = 0; i < kAllDomains.size(); ++i) {
    workers.emplace_back([this, &req, &records, &outcomes, i] {
      auto& o = outcomes[i];
      o.domain = kAllDomains[i];
      try {
        o.result = train_with_(o.domain, req, records);
        o.ok = true;
      } catch (const std::exception& e) {
        o.ok = false;
        o.error = e.what();
      }
    });
  }
  for (auto& w : workers) w.join();

  std::size_t ok = 0;
  for (const auto& o : outcomes) ok += o.ok ? 1 : 0;
  get_logger("training").info("trained all models", {
    {"succeeded", std::to_string(ok)}, {"failed", std::to_string(outcomes.size() - ok)}});
  return outcomes;
}

} // namespace f1s
