#pragma once
#include <string>
#include <vector>
#include <f1s/domain.hpp>
#include <f1s/example.hpp>

namespace f1s {

// Fixed-order feature keys per domain; stable across training and inference.
const std::vector<std::string>& feature_schema(Domain d);

// Label targets per domain.
const std::vector<std::string>& label_schema(Domain d);

// Human-readable summaries for model info.
const std::vector<std::string>& feature_summary(Domain d);
const std::vector<std::string>& output_summary(Domain d);

// Pure mapping to the schema order. Throws SchemaError naming the first
// missing key; never substitutes a default.
FeatureRow encode(const std::vector<std::string>& schema, const FeatureMap& fields);
inline FeatureRow encode(Domain d, const FeatureMap& fields) {
  return encode(feature_schema(d), fields);
}

// Throws SchemaError when a label target of the domain is missing.
void require_labels(Domain d, const LabelMap& labels);

} // namespace f1s
