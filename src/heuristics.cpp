#include <f1s/heuristics.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace f1s {

namespace {

struct TireNoteCtx {
  Compound compound;
  int stint_length;
  const TireStrategyRequest& req;
};

struct PitCtx {
  bool in_window;
  bool undercut;
  int urgency;
  const PitStopRequest& req;
};

struct PaceCtx {
  double trend;
  const RacePaceRequest& req;
};

struct TacticalCtx {
  double overtake;
  double lose;
  const PositionRequest& req;
};

struct BattleCtx {
  double ahead;
  double behind;
};

constexpr std::size_t kAll = std::numeric_limits<std::size_t>::max();

} // namespace

std::vector<std::string> tire_strategy_notes(Compound compound, int stint_length,
                                             const TireStrategyRequest& req) {
  static const std::vector<Rule<TireNoteCtx>> rules{
    {[](const TireNoteCtx& c) { return c.req.rain_probability > 50.0; },
     "High rain probability ({rain}%) - monitor weather closely"},
    {[](const TireNoteCtx& c) { return c.compound == Compound::Soft; },
     "Soft compound: maximum grip but high degradation"},
    {[](const TireNoteCtx& c) { return c.compound == Compound::Medium; },
     "Medium compound: balanced performance"},
    {[](const TireNoteCtx& c) { return c.compound == Compound::Hard; },
     "Hard compound: lower grip but excellent durability"},
    {[](const TireNoteCtx& c) { return c.compound == Compound::Intermediate; },
     "Intermediate compound: damp track, watch for a drying line"},
    {[](const TireNoteCtx& c) { return c.compound == Compound::Wet; },
     "Wet compound: standing water expected"},
    {[](const TireNoteCtx& c) { return c.stint_length < 15; },
     "Short stint expected ({stint} laps) - plan for an additional stop"},
    {[](const TireNoteCtx& c) { return c.stint_length > 30; },
     "Long stint possible ({stint} laps) - one-stop strategy viable"},
    {[](const TireNoteCtx& c) { return c.req.safety_car_deployed; },
     "Safety car - consider an opportunistic pit stop"},
    {[](const TireNoteCtx& c) { return c.req.track_temperature > 45.0; },
     "High track temperature ({track_temp} C) - expect increased degradation"},
  };
  const TireNoteCtx ctx{compound, stint_length, req};
  return matching_rules(rules, ctx, kAll, {
    {"rain", format_fixed(req.rain_probability, 0)},
    {"stint", std::to_string(stint_length)},
    {"track_temp", format_fixed(req.track_temperature, 1)},
  });
}

int pit_urgency(int tire_age, double degradation, const PitSettings& pit) {
  const double slope = 1.5 + 20.0 * std::max(0.0, degradation);
  const double over = static_cast<double>(tire_age) - pit.urgency_tire_age_margin;
  // 0 * inf when degradation is unbounded
  const double raw = over == 0.0 ? 50.0 : 50.0 + over * slope;
  if (std::isnan(raw)) return 50;
  return static_cast<int>(std::lround(std::clamp(raw, 0.0, 100.0)));
}

bool undercut_opportunity(double gap_to_car_ahead, double pit_delta, int tire_age,
                          int competitor_tire_age, const PitSettings& pit) {
  return gap_to_car_ahead < pit_delta &&
         static_cast<long long>(competitor_tire_age) > static_cast<long long>(tire_age) + pit.undercut_tire_age_margin;
}

std::string pit_recommendation(bool in_window, bool undercut, int urgency, const PitStopRequest& req) {
  static const std::vector<Rule<PitCtx>> rules{
    {[](const PitCtx& c) { return c.urgency > 80; },
     "CRITICAL: pit immediately - severe tire degradation (urgency {urgency})"},
    {[](const PitCtx& c) { return c.undercut && c.in_window; },
     "UNDERCUT: pit now to gain position on the car ahead ({gap}s)"},
    {[](const PitCtx& c) { return c.in_window && c.urgency > 50; },
     "WINDOW OPEN: good time to pit - within optimal range"},
    {[](const PitCtx& c) { return c.in_window; },
     "WINDOW OPEN: pit window available, monitor gaps"},
    {[](const PitCtx& c) { return c.req.safety_car_deployed; },
     "SAFETY CAR: reduced-loss pit stop opportunity"},
    {[](const PitCtx&) { return true; },
     "STAY OUT: continue current stint"},
  };
  const PitCtx ctx{in_window, undercut, urgency, req};
  return first_rule(rules, ctx, {
    {"urgency", std::to_string(urgency)},
    {"gap", format_fixed(req.gap_to_car_ahead, 1)},
  }).value_or("STAY OUT: continue current stint");
}

std::string option_risk(int deviation) {
  const int d = std::abs(deviation);
  if (d <= 1) return "Low";
  if (d <= 4) return "Medium";
  return "High";
}

std::vector<StrategyOption> strategy_options(const PitStopRequest& req, int optimal_lap) {
  std::vector<StrategyOption> out;
  out.push_back({"Optimal", optimal_lap, req.remaining_laps > 20 ? "MEDIUM" : "SOFT", "+0.0s",
                 option_risk(0)});

  const int conservative = std::min(optimal_lap + 5, req.total_laps);
  out.push_back({"Conservative", conservative, "SOFT", "-2.5s", option_risk(conservative - optimal_lap)});

  const int aggressive = std::max(req.current_lap, optimal_lap - 3);
  if (aggressive < optimal_lap)
    out.push_back({"Aggressive", aggressive, "MEDIUM", "+3.0s (if successful)",
                   option_risk(aggressive - optimal_lap)});
  return out;
}

std::string pace_trend_label(const std::vector<double>& deltas_to_best, std::size_t window) {
  const std::size_t n = std::min(window, deltas_to_best.size());
  if (n < 2) return "degrading";
  for (std::size_t i = deltas_to_best.size() - n + 1; i < deltas_to_best.size(); ++i) {
    if (!(deltas_to_best[i] < deltas_to_best[i - 1])) return "degrading";
  }
  return "improving";
}

PerformanceAssessment assess_performance(double predicted_lap_time, const RacePaceRequest& req,
                                         const std::string& trend) {
  PerformanceAssessment a;
  a.delta_to_best = predicted_lap_time - req.best_lap_time;
  a.delta_to_average = predicted_lap_time - req.avg_lap_time;
  a.trend = trend;
  if (a.delta_to_best < 0.5) {
    a.level = "EXCELLENT";
    a.color = "green";
  } else if (a.delta_to_best < 1.0) {
    a.level = "GOOD";
    a.color = "lime";
  } else if (a.delta_to_best < 1.5) {
    a.level = "AVERAGE";
    a.color = "yellow";
  } else {
    a.level = "BELOW PAR";
    a.color = "red";
  }
  return a;
}

std::vector<std::string> pace_recommendations(double pace_trend, const RacePaceRequest& req) {
  static const std::vector<Rule<PaceCtx>> rules{
    {[](const PaceCtx& c) { return c.trend > 0.1; },
     "Significant pace degradation ({trend}s/lap) - consider a pit stop soon"},
    {[](const PaceCtx& c) { return c.req.tire_age > 20 && c.trend > 0.05; },
     "High tire wear affecting pace"},
    {[](const PaceCtx& c) { return c.req.fuel_load > 80.0; },
     "Heavy fuel load - pace will improve as fuel burns"},
    {[](const PaceCtx& c) { return c.req.traffic > 0; },
     "Traffic affecting lap time - clean air needed"},
    {[](const PaceCtx& c) { return c.req.push_level < 70.0; },
     "Room to push harder if needed"},
  };
  const PaceCtx ctx{pace_trend, req};
  auto out = matching_rules(rules, ctx, kAll, {{"trend", format_fixed(pace_trend, 3)}});
  if (out.empty()) out.emplace_back("Pace is stable - maintain current rhythm");
  return out;
}

AttackAnalysis attack_analysis(const PositionRequest& req, double overtake_probability) {
  AttackAnalysis a;
  a.gap_to_target = req.gap_to_car_ahead;
  a.probability = overtake_probability * 100.0;
  if (req.gap_to_car_ahead < 1.0) a.factors.emplace_back("Within striking distance");
  else if (req.gap_to_car_ahead < 2.0) a.factors.emplace_back("Close but needs work");
  else a.factors.emplace_back("Too far to attack");
  a.factors.emplace_back(req.drs_available ? "DRS available" : "No DRS");
  a.factors.emplace_back(req.relative_pace < 0.0 ? "Pace advantage" : "No pace advantage");
  a.recommended_action = overtake_probability > 0.4 ? "ATTACK" : "PRESSURE";
  return a;
}

DefenseAnalysis defense_analysis(const PositionRequest& req, double lose_probability) {
  DefenseAnalysis d;
  d.gap_to_threat = req.gap_to_car_behind;
  if (req.gap_to_car_behind > 3.0) {
    d.threat_level = "LOW";
    d.threat_color = "green";
  } else if (req.gap_to_car_behind > 1.5) {
    d.threat_level = "MEDIUM";
    d.threat_color = "yellow";
  } else {
    d.threat_level = "HIGH";
    d.threat_color = "red";
  }
  d.lose_probability = lose_probability * 100.0;
  d.recommended_action = lose_probability > 0.3 ? "DEFEND" : "MAINTAIN";
  return d;
}

std::string battle_status(double gap_ahead, double gap_behind) {
  static const std::vector<Rule<BattleCtx>> rules{
    {[](const BattleCtx& c) { return c.ahead < 1.5 && c.behind < 1.5; },
     "IN BATTLE - {ahead}s to the car ahead, {behind}s to the car behind"},
    {[](const BattleCtx& c) { return c.ahead < 1.5; },
     "ATTACKING - car ahead at {ahead}s"},
    {[](const BattleCtx& c) { return c.behind < 1.5; },
     "DEFENDING - under pressure at {behind}s"},
    {[](const BattleCtx& c) { return c.ahead > 5.0 && c.behind > 5.0; },
     "CLEAN AIR - no immediate battle"},
    {[](const BattleCtx&) { return true; },
     "MONITORING - gaps manageable"},
  };
  return first_rule(rules, BattleCtx{gap_ahead, gap_behind}, {
    {"ahead", format_fixed(gap_ahead, 1)},
    {"behind", format_fixed(gap_behind, 1)},
  }).value_or("MONITORING - gaps manageable");
}

std::vector<std::string> tactical_recommendations(const PositionRequest& req, double overtake_probability,
                                                  double lose_probability, std::size_t limit) {
  static const std::vector<Rule<TacticalCtx>> rules{
    {[](const TacticalCtx& c) { return c.overtake > 0.5; },
     "High overtake probability - commit to the move"},
    {[](const TacticalCtx& c) { return c.overtake > 0.3 && c.overtake <= 0.5; },
     "Build pressure, wait for a mistake"},
    {[](const TacticalCtx& c) { return c.req.gap_to_car_behind < 1.0 && c.lose > 0.3; },
     "Defensive driving recommended"},
    {[](const TacticalCtx& c) { return c.req.tire_advantage > 10; },
     "Tire advantage ({tire_adv} laps) - attack late in the stint"},
    {[](const TacticalCtx& c) { return c.req.tire_advantage < -10; },
     "Tire disadvantage ({tire_adv} laps) - consider an early pit"},
    {[](const TacticalCtx& c) { return c.req.gap_to_car_ahead < 2.0 && c.req.drs_available; },
     "DRS active - use on the main straight"},
    {[](const TacticalCtx& c) { return c.req.remaining_laps < 10; },
     "Final laps - increased aggression warranted"},
  };
  const TacticalCtx ctx{overtake_probability, lose_probability, req};
  auto out = matching_rules(rules, ctx, limit, {{"tire_adv", std::to_string(req.tire_advantage)}});
  if (out.empty()) out.emplace_back("Maintain current strategy");
  return out;
}

} // namespace f1s
