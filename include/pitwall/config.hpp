#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <pitwall/degradation.hpp>
#include <pitwall/optimizer.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/sensitivity.hpp>
#include <pitwall/stint.hpp>
#include <pitwall/validation.hpp>

namespace pitwall {

// Tunables shared by the apps. Defaults are the built-in values.
struct StrategyConfig {
  FuelParams fuel{};
  int window_laps = kDefaultWindowLaps;
  std::size_t min_samples = kDefaultMinSamples;
  int alignment_window_laps = kAlignmentWindowLaps;
  double pit_window_within_s = kDefaultPitWindowWithinSeconds;
  double default_pit_loss_s = kDefaultPitLossSeconds;
  double vsc_factor = kVscPitLossFactor;
  double pit_loss_sensitivity_s = kPitLossSensitivitySeconds;
  double degradation_sensitivity_s_per_lap = kDegradationSensitivitySecondsPerLap;
  unsigned workers = 1;

  ValidationOptions validation_options() const;
};

// "key,value" rows over base. Accepts an optional header row; ignores '#'
// comments and blank lines. Unknown keys and invalid values are skipped.
StrategyConfig strategy_config_from_csv_stream(std::istream& in, StrategyConfig base = {});

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<StrategyConfig> load_strategy_config(const std::string& path);

} // namespace pitwall
