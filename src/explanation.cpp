#include <pitwall/explanation.hpp>
#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdio>

namespace pitwall {

namespace {

std::string fmt1(double s) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.1f", s);
  return std::string(buf);
}

std::string choice_label(const Candidate& c) {
  if (const auto lap = c.pit_lap()) return "pitting on lap " + std::to_string(*lap);
  return "staying out";
}

std::optional<int> break_even(double rate, double pit_loss_s) {
  if (!(rate > 0.0) || !std::isfinite(rate)) return std::nullopt;
  const double ratio = std::floor(pit_loss_s / rate) + 1.0;
  if (!(ratio < static_cast<double>(INT_MAX))) return std::nullopt;
  return std::max(1, static_cast<int>(ratio));
}

} // namespace

DegradationRateLookup rate_lookup_from(const ModelStore& store) {
  return [&store](const std::string& track_id, Compound compound) {
    return store.degradation_rate(track_id, compound);
  };
}

StrategyExplanation explain_strategy(const OptimizationResult& result,
                                     const std::string& track_id,
                                     Compound current_compound,
                                     const DegradationRateLookup& degradation_rate_lookup,
                                     double pit_loss_s) {
  StrategyExplanation ex;
  ex.recommended_lap = recommended_pit_lap(result);
  ex.degradation_rate_s_per_lap = degradation_rate_lookup(track_id, current_compound);
  ex.pit_loss_s = pit_loss_s;

  const double rate = ex.degradation_rate_s_per_lap;
  const char* compound = to_string(current_compound);

  // (a) break-even on the current set
  ex.break_even_laps = break_even(rate, pit_loss_s);
  if (ex.break_even_laps) {
    const int n = *ex.break_even_laps;
    ex.break_even_race_lap = result.state.current_lap - result.state.lap_in_stint + n;
    const std::string race_lap = std::to_string(*ex.break_even_race_lap);
    if (*ex.break_even_race_lap < result.state.current_lap) {
      ex.window_opens =
        "The " + std::string(compound) + " loses " + fmt1(rate) + " s per lap; the accumulated loss " +
        "has already exceeded the " + fmt1(pit_loss_s) + " s pit loss since race lap " + race_lap +
        " (" + std::to_string(n) + " laps on the set).";
    } else {
      ex.window_opens =
        "The " + std::string(compound) + " loses " + fmt1(rate) + " s per lap; after " +
        std::to_string(n) + " laps on the set (race lap " + race_lap +
        ") the accumulated loss exceeds the " + fmt1(pit_loss_s) + " s pit loss.";
    }
  } else {
    ex.window_opens =
      "The " + std::string(compound) + " shows no positive degradation (" + fmt1(rate) +
      " s per lap), so tyre wear never pays back the " + fmt1(pit_loss_s) + " s pit loss.";
  }

  const Candidate* best = result.best();
  if (!best) {
    ex.recommendation = "No candidates were evaluated.";
    ex.summary = "- " + ex.recommendation;
    return ex;
  }

  // (b) margin to the next-best candidate
  if (result.candidates.size() > 1) {
    const Candidate& next = result.candidates[1];
    ex.margin_to_next_s = next.total_time_s - best->total_time_s;
    ex.margin = "Next best is " + choice_label(next) + ", " + fmt1(*ex.margin_to_next_s) +
                " s slower.";
  }

  if (ex.recommended_lap) {
    const int lap = *ex.recommended_lap;
    ex.recommendation = "Pit on lap " + std::to_string(lap) + " for " +
                        to_string(best->compound_after) + ".";

    // (c) one lap either side, when evaluated
    if (const Candidate* e = result.find_pit_lap(lap - 1)) ex.cost_one_lap_earlier_s = e->delta_to_best_s;
    if (const Candidate* l = result.find_pit_lap(lap + 1)) ex.cost_one_lap_later_s = l->delta_to_best_s;

    std::string earlier = ex.cost_one_lap_earlier_s
      ? "Pitting one lap earlier (lap " + std::to_string(lap - 1) + ") costs " +
        fmt1(*ex.cost_one_lap_earlier_s) + " s"
      : "Pitting one lap earlier was not evaluated";
    std::string later = ex.cost_one_lap_later_s
      ? "one lap later (lap " + std::to_string(lap + 1) + ") costs " +
        fmt1(*ex.cost_one_lap_later_s) + " s."
      : "one lap later was not evaluated.";
    ex.earlier_later = earlier + "; " + later;
  } else {
    const auto& s = result.state;
    const int last = last_candidate_lap(s);
    ex.recommendation = "Stay out: no pit lap between " + std::to_string(s.current_lap) +
                        " and " + std::to_string(last) + " beats remaining on the " +
                        compound + ".";
    const Candidate* best_pit = nullptr;
    for (const auto& c : result.candidates) {
      if (!c.stays_out()) { best_pit = &c; break; }
    }
    if (best_pit) {
      ex.earlier_later = "The best stop (lap " + std::to_string(*best_pit->pit_lap()) +
                         ") costs " + fmt1(best_pit->delta_to_best_s) + " s versus staying out.";
    }
  }

  ex.summary = "- " + ex.recommendation + "\n- " + ex.window_opens;
  if (!ex.margin.empty()) ex.summary += "\n- " + ex.margin;
  if (!ex.earlier_later.empty()) ex.summary += "\n- " + ex.earlier_later;
  return ex;
}

} // namespace pitwall
