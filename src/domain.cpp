#include <f1s/domain.hpp>
#include <f1s/text.hpp>

namespace f1s {

const char* domain_name(Domain d) {
  switch (d) {
    case Domain::TireStrategy: return "tire_strategy";
    case Domain::PitStop:      return "pit_stop";
    case Domain::RacePace:     return "race_pace";
    case Domain::Position:     return "position";
  }
  return "unknown";
}

const char* domain_description(Domain d) {
  switch (d) {
    case Domain::TireStrategy:
      return "Predicts optimal tire compound selection, stint lengths, and degradation rates";
    case Domain::PitStop:
      return "Predicts optimal pit stop timing, undercut/overcut opportunities";
    case Domain::RacePace:
      return "Analyzes and predicts race pace, fuel effects, and performance trends";
    case Domain::Position:
      return "Predicts position changes and overtaking opportunities";
  }
  return "Unknown model";
}

std::optional<Domain> domain_from_name(const std::string& name) {
  for (Domain d : kAllDomains) {
    if (name == domain_name(d)) return d;
  }
  // Short aliases used on the command line
  if (name == "tire") return Domain::TireStrategy;
  if (name == "pit" || name == "pit-stop") return Domain::PitStop;
  if (name == "pace" || name == "race-pace") return Domain::RacePace;
  return std::nullopt;
}

const char* compound_name(Compound c) {
  switch (c) {
    case Compound::Soft:         return "SOFT";
    case Compound::Medium:       return "MEDIUM";
    case Compound::Hard:         return "HARD";
    case Compound::Intermediate: return "INTERMEDIATE";
    case Compound::Wet:          return "WET";
  }
  return "UNKNOWN";
}

std::optional<Compound> compound_from_name(const std::string& name) {
  const auto n = upper(name);
  if (n == "SOFT")   return Compound::Soft;
  if (n == "MEDIUM") return Compound::Medium;
  if (n == "HARD")   return Compound::Hard;
  if (n == "INTERMEDIATE" || n == "INTER") return Compound::Intermediate;
  if (n == "WET")    return Compound::Wet;
  return std::nullopt;
}

std::optional<Compound> compound_from_index(int idx) {
  if (idx < 0 || idx >= kCompoundCount) return std::nullopt;
  return static_cast<Compound>(idx);
}

const char* source_name(Source s) {
  return s == Source::Real ? "real" : "synthetic";
}

} // namespace f1s
