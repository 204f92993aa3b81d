#pragma once
#include <utility>
#include <vector>
#include <f1s/example.hpp>

namespace f1s {

struct BlendResult {
  std::vector<TrainingExample> examples;   // real first, then synthetic
  double real_weight = 0.0;                // effective, normalised
  double synthetic_weight = 0.0;
  DataBreakdown data_breakdown{};
};

// Returns the weights scaled to sum to 1. Throws ConfigError for a negative
// or non-finite weight, or when both are zero.
std::pair<double, double> normalise_weights(double real_weight, double synthetic_weight);

// Merges the two pools into one weighted set. Weights are normalised with
// normalise_weights; an empty pool forces its weight to 0.
BlendResult blend(std::vector<TrainingExample> real,
                  std::vector<TrainingExample> synthetic,
                  double real_weight, double synthetic_weight);

} // namespace f1s
