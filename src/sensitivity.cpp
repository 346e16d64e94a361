#include <pitwall/sensitivity.hpp>
#include <cstdio>

namespace pitwall {

namespace {

std::string lap_str(const std::optional<int>& lap) {
  return lap ? "lap " + std::to_string(*lap) : std::string("stay out");
}

std::string fmt(const char* f, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), f, v);
  return std::string(buf);
}

std::string describe(const Sensitivity& s, const char* what, const char* unit) {
  const std::string d = fmt("%.2f", s.delta);
  const std::string head = std::string("If ") + what + " changes by +/-" + d + " " + unit +
                           " (base " + fmt("%.2f", s.base_value) + " " + unit + "), ";
  if (s.plus_lap == s.base_lap && s.minus_lap == s.base_lap) {
    return head + "the recommendation stays at " + lap_str(s.base_lap) + ".";
  }
  return head + "the recommendation moves from " + lap_str(s.base_lap) + " to " +
         lap_str(s.plus_lap) + " (+" + d + ") and " + lap_str(s.minus_lap) + " (-" + d + ").";
}

ModelStore with_shifted_rate(const ModelStore& store, const std::string& track_id,
                             Compound compound, double shift) {
  ModelStore copy = store;
  FittedDegradationModel m = store.at(track_id, compound);
  m.lap_coef += shift;
  copy.insert(DegradationKey::make(track_id, compound), m);
  return copy;
}

} // namespace

Sensitivity sensitivity_pit_loss(const RaceState& state, const ModelStore& store,
                                 const PitLossTable& pit_table, double delta_s) {
  Sensitivity s;
  s.base_value = pit_table.get_pit_loss(state.track_id, state.pit_condition);
  s.delta = delta_s;
  s.base_lap = recommended_pit_lap(optimize_pit_window(state, store, pit_table));
  // Shifted runs price the stop at exactly base +/- delta, whatever the condition.
  RaceState shifted = state;
  shifted.pit_condition = PitCondition::Green;
  s.plus_lap = recommended_pit_lap(optimize_pit_window(
    shifted, store, pit_table.with_override(state.track_id, s.base_value + delta_s)));
  s.minus_lap = recommended_pit_lap(optimize_pit_window(
    shifted, store, pit_table.with_override(state.track_id, s.base_value - delta_s)));
  s.message = describe(s, "pit loss", "s");
  return s;
}

Sensitivity sensitivity_degradation(const RaceState& state, const ModelStore& store,
                                    const PitLossTable& pit_table, double delta_s_per_lap) {
  Sensitivity s;
  s.base_value = store.degradation_rate(state.track_id, state.current_compound);
  s.delta = delta_s_per_lap;
  s.base_lap = recommended_pit_lap(optimize_pit_window(state, store, pit_table));
  const auto plus = with_shifted_rate(store, state.track_id, state.current_compound, delta_s_per_lap);
  const auto minus = with_shifted_rate(store, state.track_id, state.current_compound, -delta_s_per_lap);
  s.plus_lap = recommended_pit_lap(optimize_pit_window(state, plus, pit_table));
  s.minus_lap = recommended_pit_lap(optimize_pit_window(state, minus, pit_table));
  s.message = describe(s, "degradation", "s/lap");
  return s;
}

VscScenario vsc_recommendation(const RaceState& state, const ModelStore& store,
                               const PitLossTable& pit_table) {
  RaceState green = state;
  green.pit_condition = PitCondition::Green;
  RaceState vsc = state;
  vsc.pit_condition = PitCondition::Vsc;

  VscScenario v;
  v.green_pit_loss_s = pit_table.get_pit_loss(state.track_id, PitCondition::Green);
  v.vsc_pit_loss_s = pit_table.get_pit_loss(state.track_id, PitCondition::Vsc);
  v.green_lap = recommended_pit_lap(optimize_pit_window(green, store, pit_table));
  v.vsc_lap = recommended_pit_lap(optimize_pit_window(vsc, store, pit_table));

  const std::string costs = "pit loss " + fmt("%.1f", v.green_pit_loss_s) + " s -> " +
                            fmt("%.1f", v.vsc_pit_loss_s) + " s";
  if (v.vsc_lap == v.green_lap) {
    v.message = "Under a VSC (" + costs + ") the recommendation is unchanged: " +
                lap_str(v.vsc_lap) + ".";
  } else {
    v.message = "Under a VSC (" + costs + ") the recommendation moves from " +
                lap_str(v.green_lap) + " to " + lap_str(v.vsc_lap) + ".";
  }
  return v;
}

RecommendationBundle recommendation_bundle(const RaceState& state, const ModelStore& store,
                                           const PitLossTable& pit_table, double within_s,
                                           double pit_loss_delta_s, double degradation_delta) {
  RecommendationBundle b;
  b.result = optimize_pit_window(state, store, pit_table);
  b.recommended_lap = recommended_pit_lap(b.result);
  b.pit_window = pit_window_range(b.result, within_s);
  b.explanation = explain_strategy(b.result, state.track_id, state.current_compound,
                                   rate_lookup_from(store), b.result.pit_loss_s);
  b.pit_loss = sensitivity_pit_loss(state, store, pit_table, pit_loss_delta_s);
  b.degradation = sensitivity_degradation(state, store, pit_table, degradation_delta);
  b.vsc = vsc_recommendation(state, store, pit_table);
  return b;
}

} // namespace pitwall
