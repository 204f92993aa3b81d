#include <f1s/prediction.hpp>
#include <f1s/errors.hpp>
#include <f1s/features.hpp>
#include <f1s/heuristics.hpp>
#include <f1s/logging.hpp>

#include <algorithm>
#include <cmath>

namespace f1s {

static inline std::size_t argmax(const std::vector<double>& v) {
  return static_cast<std::size_t>(std::max_element(v.begin(), v.end()) - v.begin());
}

std::shared_ptr<const ModelArtifact> PredictionService::require_(Domain d) const {
  auto a = registry_.artifact(d);
  if (!a) throw NotReadyError(domain_name(d));
  return a;
}

TireStrategyResponse PredictionService::predict_tire(const TireStrategyRequest& req) const {
  const auto a = require_(Domain::TireStrategy);
  const auto row = encode(a->feature_schema, to_features(req));

  TireStrategyResponse out;
  const auto probs = a->estimator("compound").predict_proba(row);
  const auto best = argmax(probs);
  for (std::size_t i = 0; i < probs.size(); ++i) {
    const auto c = compound_from_index(static_cast<int>(i));
    out.compound_probabilities.emplace_back(c ? compound_name(*c) : std::to_string(i), probs[i]);
  }
  const Compound compound = compound_from_index(static_cast<int>(best)).value_or(Compound::Medium);
  out.recommended_compound = compound_name(compound);
  out.compound_confidence = probs[best];

  out.predicted_stint_length = std::max(5, static_cast<int>(a->estimator("stint_length").predict(row)));
  out.degradation_rate_per_lap = std::max(0.01, a->estimator("degradation_rate").predict(row));
  out.expected_time_loss_per_lap_ms = out.degradation_rate_per_lap * 1000.0;
  out.strategy_notes = tire_strategy_notes(compound, out.predicted_stint_length, req);
  return out;
}

PitStopResponse PredictionService::predict_pit_stop(const PitStopRequest& req) const {
  const auto a = require_(Domain::PitStop);
  const auto row = encode(a->feature_schema, to_features(req));

  PitStopResponse out;
  const auto& window = a->estimator("in_pit_window");
  out.pit_window_probability = window.predict_proba(row)[1];
  out.in_pit_window = window.predict(row) > 0.5;
  out.undercut_probability = a->estimator("undercut").predict_proba(row)[1];
  out.undercut_opportunity = undercut_opportunity(req.gap_to_car_ahead, req.pit_delta, req.tire_age,
                                                  req.competitor_tire_age, pit_);

  out.optimal_pit_lap = std::max(req.current_lap, static_cast<int>(a->estimator("pit_lap").predict(row)));
  out.laps_until_optimal = std::max(0, out.optimal_pit_lap - req.current_lap);
  out.pit_urgency = pit_urgency(req.tire_age, req.tire_degradation_rate, pit_);
  out.recommendation = pit_recommendation(out.in_pit_window, out.undercut_opportunity, out.pit_urgency, req);
  out.strategy_options = strategy_options(req, out.optimal_pit_lap);
  return out;
}

RacePaceResponse PredictionService::predict_race_pace(const RacePaceRequest& req) const {
  const auto a = require_(Domain::RacePace);
  const auto row = encode(a->feature_schema, to_features(req));
  const auto& lap_time = a->estimator("lap_time");

  RacePaceResponse out;
  out.predicted_lap_time = lap_time.predict(row);
  out.fuel_effect_per_kg = a->estimator("fuel_effect").predict(row);
  out.pace_trend_per_lap = a->estimator("pace_trend").predict(row);
  out.current_delta_to_optimal = out.predicted_lap_time - req.best_lap_time;

  std::vector<double> deltas;
  for (int i = 1; i <= heuristics_.projection_laps; ++i) {
    RacePaceRequest future = req;
    future.lap_number = req.lap_number + i;
    future.fuel_load = std::max(5.0, req.fuel_load - i * heuristics_.fuel_burn_per_lap);
    future.tire_age = req.tire_age + i;
    const double t = lap_time.predict(encode(a->feature_schema, to_features(future)));
    out.lap_predictions.push_back({future.lap_number, t, future.fuel_load, future.tire_age});
    deltas.push_back(t - req.best_lap_time);
  }

  const auto trend = pace_trend_label(deltas, heuristics_.trend_window);
  out.performance_assessment = assess_performance(out.predicted_lap_time, req, trend);
  out.recommendations = pace_recommendations(out.pace_trend_per_lap, req);
  return out;
}

PositionResponse PredictionService::predict_position(const PositionRequest& req) const {
  const auto a = require_(Domain::Position);
  const auto row = encode(a->feature_schema, to_features(req));

  PositionResponse out;
  out.current_position = req.current_position;
  out.overtake_probability = a->estimator("overtake").predict_proba(row)[1];
  const auto change = a->estimator("position_change").predict_proba(row);
  out.position_change_probabilities = {change[0], change[1], change.size() > 2 ? change[2] : 0.0};

  const double final_pos = a->estimator("final_position").predict(row);
  out.predicted_final_position = static_cast<int>(std::clamp(std::lround(final_pos), 1L, 20L));

  const double lose = out.position_change_probabilities.lose;
  out.attack_analysis = attack_analysis(req, out.overtake_probability);
  out.defense_analysis = defense_analysis(req, lose);
  out.battle_status = battle_status(req.gap_to_car_ahead, req.gap_to_car_behind);
  out.tactical_recommendations =
    tactical_recommendations(req, out.overtake_probability, lose, heuristics_.max_recommendations);
  return out;
}

ExecutiveSummary executive_summary(const FullAnalysis& analysis) {
  ExecutiveSummary s;
  if (analysis.pit && analysis.pit->pit_urgency > 70)
    s.critical_actions.emplace_back("Consider a pit stop - high urgency");
  if (analysis.position && analysis.position->overtake_probability > 0.5)
    s.critical_actions.emplace_back("Overtaking opportunity detected");
  if (analysis.tire)
    s.recommendations.push_back("Recommended compound: " + analysis.tire->recommended_compound);
  if (analysis.pace && analysis.pace->pace_trend_per_lap > 0.1)
    s.risk_factors.emplace_back("Pace degradation detected");
  return s;
}

// Runs one domain, recording its failure instead of propagating it.
template <typename Resp, typename Fn>
static void run_isolated(std::optional<Resp>& slot, std::map<std::string, std::string>& errors,
                         Domain d, Fn&& fn) {
  try {
    slot = fn();
  } catch (const Error& e) {
    errors[domain_name(d)] = e.what();
    get_logger("prediction").warn("analysis step failed", {{"model", domain_name(d)}, {"error", e.what()}});
  }
}

FullAnalysis PredictionService::analyze(const FullAnalysisRequest& req) const {
  FullAnalysis out;
  run_isolated(out.tire, out.errors, Domain::TireStrategy, [&] { return predict_tire(req.tire); });
  run_isolated(out.pit, out.errors, Domain::PitStop, [&] { return predict_pit_stop(req.pit); });
  run_isolated(out.pace, out.errors, Domain::RacePace, [&] { return predict_race_pace(req.pace); });
  run_isolated(out.position, out.errors, Domain::Position, [&] { return predict_position(req.position); });
  out.executive_summary = executive_summary(out);
  return out;
}

} // namespace f1s
