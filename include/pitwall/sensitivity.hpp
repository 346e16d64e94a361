#pragma once
#include <optional>
#include <string>
#include <utility>
#include <pitwall/degradation.hpp>
#include <pitwall/explanation.hpp>
#include <pitwall/optimizer.hpp>
#include <pitwall/pit.hpp>

namespace pitwall {

inline constexpr double kPitLossSensitivitySeconds = 2.0;
inline constexpr double kDegradationSensitivitySecondsPerLap = 0.02;

// Recommendation under base, +delta and -delta values of one input.
struct Sensitivity {
  double base_value = 0.0;
  double delta = 0.0;
  std::optional<int> base_lap;     // nullopt = stay out
  std::optional<int> plus_lap;
  std::optional<int> minus_lap;
  std::string message;
};

// Pit loss of the state's track under its pit condition, shifted by +/- delta_s.
Sensitivity sensitivity_pit_loss(const RaceState& state, const ModelStore& store,
                                 const PitLossTable& pit_table,
                                 double delta_s = kPitLossSensitivitySeconds);

// Degradation rate of the current compound shifted by +/- delta (s/lap).
// Runs on copies of the store; the caller's store is untouched.
Sensitivity sensitivity_degradation(const RaceState& state, const ModelStore& store,
                                    const PitLossTable& pit_table,
                                    double delta_s_per_lap = kDegradationSensitivitySecondsPerLap);

// What-if: a VSC is in effect for the stop. Illustrative only.
struct VscScenario {
  double green_pit_loss_s = 0.0;
  double vsc_pit_loss_s = 0.0;
  std::optional<int> green_lap;
  std::optional<int> vsc_lap;
  std::string message;
};

VscScenario vsc_recommendation(const RaceState& state, const ModelStore& store,
                               const PitLossTable& pit_table);

// Everything a strategist reads at once.
struct RecommendationBundle {
  std::optional<int> recommended_lap;
  std::optional<std::pair<int, int>> pit_window;
  OptimizationResult result;
  StrategyExplanation explanation;
  Sensitivity pit_loss;
  Sensitivity degradation;
  VscScenario vsc;
};

RecommendationBundle recommendation_bundle(const RaceState& state, const ModelStore& store,
                                           const PitLossTable& pit_table,
                                           double within_s = kDefaultPitWindowWithinSeconds,
                                           double pit_loss_delta_s = kPitLossSensitivitySeconds,
                                           double degradation_delta = kDegradationSensitivitySecondsPerLap);

} // namespace pitwall
