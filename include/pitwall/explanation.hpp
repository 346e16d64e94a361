#pragma once
#include <functional>
#include <optional>
#include <string>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/optimizer.hpp>

namespace pitwall {

// (track_id, compound) -> degradation rate in s/lap.
using DegradationRateLookup = std::function<double(const std::string&, Compound)>;

// Adapts a store; the returned lookup holds a reference, keep the store alive.
DegradationRateLookup rate_lookup_from(const ModelStore& store);

struct StrategyExplanation {
  std::optional<int> recommended_lap;       // nullopt = stay out
  double degradation_rate_s_per_lap = 0.0;
  double pit_loss_s = 0.0;

  // Smallest lap-in-stint n with n * rate > pit loss, and the race lap where
  // the current stint reaches it. Undefined when the rate is not positive.
  std::optional<int> break_even_laps;
  std::optional<int> break_even_race_lap;

  std::optional<double> margin_to_next_s;   // rank 2 minus rank 1
  std::optional<double> cost_one_lap_earlier_s;
  std::optional<double> cost_one_lap_later_s;

  std::string recommendation;
  std::string window_opens;
  std::string margin;
  std::string earlier_later;
  std::string summary;                      // bulleted, one line per statement
};

// Pure: same inputs give the same text. Uses only values already in result,
// the looked-up rate for current_compound, and pit_loss_s.
StrategyExplanation explain_strategy(const OptimizationResult& result,
                                     const std::string& track_id,
                                     Compound current_compound,
                                     const DegradationRateLookup& degradation_rate_lookup,
                                     double pit_loss_s);

} // namespace pitwall
