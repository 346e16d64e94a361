#include <pitwall/optimizer.hpp>
#include <pitwall/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace pitwall {

std::optional<int> Candidate::pit_lap() const {
  if (const auto* p = std::get_if<PitAt>(&choice)) return p->lap;
  return std::nullopt;
}

const Candidate* OptimizationResult::find_pit_lap(int lap) const {
  auto it = std::find_if(candidates.begin(), candidates.end(), [&](const Candidate& c){
    return c.pit_lap() == lap;
  });
  return it == candidates.end() ? nullptr : &*it;
}

const Candidate* OptimizationResult::stay_out() const {
  auto it = std::find_if(candidates.begin(), candidates.end(),
                         [](const Candidate& c){ return c.stays_out(); });
  return it == candidates.end() ? nullptr : &*it;
}

static void validate_state(const RaceState& s) {
  if (s.total_race_laps < 1) {
    throw InvalidRaceStateError("total_race_laps must be >= 1, got " +
                                std::to_string(s.total_race_laps));
  }
  if (s.current_lap < 1 || s.current_lap > s.total_race_laps) {
    throw InvalidRaceStateError("current_lap " + std::to_string(s.current_lap) +
                                " outside [1, " + std::to_string(s.total_race_laps) + "]");
  }
  if (s.window_laps < 0) {
    throw InvalidRaceStateError("window_laps must be >= 0, got " + std::to_string(s.window_laps));
  }
  if (s.lap_in_stint < 1) {
    throw InvalidRaceStateError("lap_in_stint must be >= 1, got " + std::to_string(s.lap_in_stint));
  }
  if (!(s.fuel.initial_kg >= 0.0) || !(s.fuel.per_lap_kg >= 0.0) || !(s.fuel.min_kg >= 0.0)) {
    throw InvalidRaceStateError("fuel parameters must be non-negative");
  }
  if (s.track_temp.has_value() && !std::isfinite(*s.track_temp)) {
    throw InvalidRaceStateError("track temperature must be finite");
  }
}

double project_stint_time(const ModelStore& store, const std::string& track_id,
                          Compound compound, int first_lap, int last_lap,
                          int stint_lap_start, const FuelParams& fuel,
                          std::optional<double> track_temp,
                          bool* temperature_substituted) {
  double total = 0.0;
  for (int lap = first_lap; lap <= last_lap; ++lap) {
    const int lap_in_stint = stint_lap_start + (lap - first_lap);
    const auto p = store.predict_detailed(track_id, compound, lap_in_stint,
                                          fuel_at_lap(fuel, lap), track_temp);
    total += p.seconds;
    if (temperature_substituted && p.temperature_substituted) *temperature_substituted = true;
  }
  return total;
}

int last_candidate_lap(const RaceState& state) {
  const int span = std::max(0, std::min(state.window_laps, state.total_race_laps - state.current_lap));
  return state.current_lap + span;
}

// Total order: time, then pit lap with staying out after the last race lap.
static int tie_break_lap(const Candidate& c, int total_race_laps) {
  return c.pit_lap().value_or(total_race_laps + 1);
}

OptimizationResult optimize_pit_window(const RaceState& state,
                                       const ModelStore& store,
                                       const PitLossTable& pit_table) {
  validate_state(state);

  // Fail fast on a missing key even when a branch would not reach it.
  (void)store.at(state.track_id, state.current_compound);
  (void)store.at(state.track_id, state.new_compound);

  OptimizationResult r;
  r.state = state;
  r.pit_loss_s = pit_table.get_pit_loss(state.track_id, state.pit_condition);
  bool substituted = false;

  const int last_pit_lap = last_candidate_lap(state);
  r.candidates.reserve(static_cast<std::size_t>(last_pit_lap - state.current_lap + 2));

  for (int pit_lap = state.current_lap; pit_lap <= last_pit_lap; ++pit_lap) {
    double t = project_stint_time(store, state.track_id, state.current_compound,
                                  state.current_lap, pit_lap, state.lap_in_stint,
                                  state.fuel, state.track_temp, &substituted);
    t += r.pit_loss_s;
    t += project_stint_time(store, state.track_id, state.new_compound,
                            pit_lap + 1, state.total_race_laps, 1,
                            state.fuel, state.track_temp, &substituted);
    r.candidates.push_back(Candidate{PitAt{pit_lap}, state.new_compound, t});
  }

  const double stay = project_stint_time(store, state.track_id, state.current_compound,
                                         state.current_lap, state.total_race_laps,
                                         state.lap_in_stint, state.fuel, state.track_temp,
                                         &substituted);
  r.candidates.push_back(Candidate{StayOut{}, state.current_compound, stay});

  const int n = state.total_race_laps;
  std::sort(r.candidates.begin(), r.candidates.end(), [n](const Candidate& a, const Candidate& b){
    if (a.total_time_s != b.total_time_s) return a.total_time_s < b.total_time_s;
    return tie_break_lap(a, n) < tie_break_lap(b, n);
  });

  const double best = r.candidates.front().total_time_s;
  for (std::size_t i = 0; i < r.candidates.size(); ++i) {
    r.candidates[i].rank = static_cast<int>(i + 1);
    r.candidates[i].delta_to_best_s = r.candidates[i].total_time_s - best;
  }
  r.temperature_substituted = substituted;
  return r;
}

std::optional<int> recommended_pit_lap(const OptimizationResult& result) {
  const Candidate* best = result.best();
  if (!best) return std::nullopt;
  return best->pit_lap();
}

std::optional<std::pair<int, int>> pit_window_range(const OptimizationResult& result,
                                                    double within_s) {
  const Candidate* best = result.best();
  if (!best || best->stays_out()) return std::nullopt;
  std::optional<std::pair<int, int>> out;
  for (const auto& c : result.candidates) {
    const auto lap = c.pit_lap();
    if (!lap || c.delta_to_best_s > within_s) continue;
    if (!out) out = std::make_pair(*lap, *lap);
    else {
      out->first = std::min(out->first, *lap);
      out->second = std::max(out->second, *lap);
    }
  }
  return out;
}

} // namespace pitwall
