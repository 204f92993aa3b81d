#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <f1s/config.hpp>
#include <f1s/domain.hpp>
#include <f1s/requests.hpp>
#include <f1s/responses.hpp>
#include <f1s/text.hpp>

namespace f1s {

// Deterministic post-processing over model outputs and request context.

using TemplateVars = std::map<std::string, std::string>;

// One entry of an ordered rule table: emit `text` when `when` holds.
template <typename Ctx>
struct Rule {
  std::function<bool(const Ctx&)> when;
  std::string text;          // may contain {placeholders}
};

// Texts of the first `limit` matching rules, in table order.
template <typename Ctx>
std::vector<std::string> matching_rules(const std::vector<Rule<Ctx>>& rules, const Ctx& ctx,
                                        std::size_t limit, const TemplateVars& vars = {}) {
  std::vector<std::string> out;
  for (const auto& r : rules) {
    if (out.size() >= limit) break;
    if (r.when(ctx)) out.push_back(render_template(r.text, vars));
  }
  return out;
}

template <typename Ctx>
std::optional<std::string> first_rule(const std::vector<Rule<Ctx>>& rules, const Ctx& ctx,
                                      const TemplateVars& vars = {}) {
  auto m = matching_rules(rules, ctx, 1, vars);
  if (m.empty()) return std::nullopt;
  return m.front();
}

// ---- tire ----

std::vector<std::string> tire_strategy_notes(Compound compound, int stint_length,
                                             const TireStrategyRequest& req);

// ---- pit stop ----

// clamp(round(50 + (tire_age - margin) * (1.5 + 20 * max(0, degradation))), 0, 100).
// Non-decreasing in tire age for a fixed degradation.
int pit_urgency(int tire_age, double degradation, const PitSettings& pit);

bool undercut_opportunity(double gap_to_car_ahead, double pit_delta, int tire_age,
                          int competitor_tire_age, const PitSettings& pit);

std::string pit_recommendation(bool in_window, bool undercut, int urgency, const PitStopRequest& req);

// Low for a deviation of at most 1 lap, Medium up to 4, High beyond.
std::string option_risk(int deviation);

std::vector<StrategyOption> strategy_options(const PitStopRequest& req, int optimal_lap);

// ---- race pace ----

// "improving" iff the trailing `window` deltas are strictly decreasing.
std::string pace_trend_label(const std::vector<double>& deltas_to_best, std::size_t window);

PerformanceAssessment assess_performance(double predicted_lap_time, const RacePaceRequest& req,
                                         const std::string& trend);

std::vector<std::string> pace_recommendations(double pace_trend, const RacePaceRequest& req);

// ---- position ----

AttackAnalysis attack_analysis(const PositionRequest& req, double overtake_probability);
DefenseAnalysis defense_analysis(const PositionRequest& req, double lose_probability);
std::string battle_status(double gap_ahead, double gap_behind);
std::vector<std::string> tactical_recommendations(const PositionRequest& req, double overtake_probability,
                                                  double lose_probability, std::size_t limit);

} // namespace f1s
