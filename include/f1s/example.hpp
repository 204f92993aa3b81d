#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <f1s/domain.hpp>

namespace f1s {

// Named feature values of one example or request. Order of the encoded row
// comes from the domain schema, not from the map.
using FeatureMap = std::map<std::string, double>;
using FeatureRow = std::vector<double>;
using LabelMap = std::map<std::string, double>;

struct TrainingExample {
  Domain domain = Domain::TireStrategy;
  FeatureMap features;
  LabelMap labels;
  Source source = Source::Real;
  double weight = 1.0;       // set by the blender from the source's configured weight
  double confidence = 1.0;   // 1.0 for observed outcomes, rule confidence otherwise
};

struct DataBreakdown {
  std::size_t real = 0;
  std::size_t synthetic = 0;
  std::size_t total() const { return real + synthetic; }
};

DataBreakdown count_sources(const std::vector<TrainingExample>& examples);

} // namespace f1s
