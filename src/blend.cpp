#include <f1s/blend.hpp>
#include <f1s/errors.hpp>
#include <f1s/logging.hpp>
#include <f1s/text.hpp>

#include <cmath>
#include <iterator>

namespace f1s {

static inline void check_weight(const char* name, double w) {
  if (!std::isfinite(w) || w < 0.0)
    throw ConfigError(std::string(name) + " must be a finite non-negative number");
}

std::pair<double, double> normalise_weights(double real_weight, double synthetic_weight) {
  check_weight("real_data_weight", real_weight);
  check_weight("synthetic_data_weight", synthetic_weight);
  const double sum = real_weight + synthetic_weight;
  if (sum <= 0.0) throw ConfigError("real_data_weight and synthetic_data_weight are both zero");
  return {real_weight / sum, synthetic_weight / sum};
}

BlendResult blend(std::vector<TrainingExample> real,
                  std::vector<TrainingExample> synthetic,
                  double real_weight, double synthetic_weight) {
  auto [rw, sw] = normalise_weights(real_weight, synthetic_weight);
  if (real.empty()) {
    rw = 0.0;
    sw = 1.0;
  } else if (synthetic.empty()) {
    rw = 1.0;
    sw = 0.0;
  }

  BlendResult out;
  out.real_weight = rw;
  out.synthetic_weight = sw;
  out.data_breakdown.real = real.size();
  out.data_breakdown.synthetic = synthetic.size();

  out.examples.reserve(real.size() + synthetic.size());
  for (auto& e : real) {
    e.source = Source::Real;
    e.weight = rw;
  }
  for (auto& e : synthetic) {
    e.source = Source::Synthetic;
    e.weight = sw;
  }
  out.examples.insert(out.examples.end(), std::make_move_iterator(real.begin()),
                      std::make_move_iterator(real.end()));
  out.examples.insert(out.examples.end(), std::make_move_iterator(synthetic.begin()),
                      std::make_move_iterator(synthetic.end()));

  get_logger("blend").debug("blended training set", {
    {"real_samples", std::to_string(out.data_breakdown.real)},
    {"synthetic_samples", std::to_string(out.data_breakdown.synthetic)},
    {"real_weight", format_fixed(rw, 3)},
    {"synthetic_weight", format_fixed(sw, 3)},
  });
  return out;
}

} // namespace f1s
