#pragma once
#include <array>
#include <optional>
#include <string>

namespace f1s {

// The four independent strategy models.
enum class Domain : int {
  TireStrategy = 0,
  PitStop = 1,
  RacePace = 2,
  Position = 3,
};

inline constexpr std::array<Domain, 4> kAllDomains{
  Domain::TireStrategy, Domain::PitStop, Domain::RacePace, Domain::Position};

const char* domain_name(Domain d);               // "tire_strategy", ...
const char* domain_description(Domain d);
std::optional<Domain> domain_from_name(const std::string& name);

// Tire chemistry classes; the integer value is the class label.
enum class Compound : int {
  Soft = 0,
  Medium = 1,
  Hard = 2,
  Intermediate = 3,
  Wet = 4,
};

inline constexpr int kCompoundCount = 5;

const char* compound_name(Compound c);           // "SOFT", ...
// Case-insensitive; accepts "INTER" for intermediates.
std::optional<Compound> compound_from_name(const std::string& name);
std::optional<Compound> compound_from_index(int idx);

enum class Source : int {
  Real = 0,
  Synthetic = 1,
};

const char* source_name(Source s);

} // namespace f1s
