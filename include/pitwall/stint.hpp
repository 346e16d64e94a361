#pragma once
#include <vector>
#include <pitwall/lap.hpp>

namespace pitwall {

struct FuelParams {
  double initial_kg = 110.0;   // at the start of lap 1
  double per_lap_kg = 1.8;
  double min_kg = 0.0;         // floor; no refuelling
};

// Fuel at the start of absolute race lap n (1-based), linear burn clamped to min_kg.
double fuel_at_lap(const FuelParams& f, int lap_number);

// Fills lap_in_stint and fuel_kg from pit in-laps, per driver.
// Stint 1 runs up to and including the first in-lap; each later stint
// restarts lap_in_stint at 1 on the lap after the previous in-lap.
std::vector<LapRecord> add_stint_features(const std::vector<LapRecord>& laps,
                                          const std::vector<PitStopRecord>& pit_stops,
                                          const FuelParams& fuel = {});

// Stint index (1-based) of a lap given the sorted in-laps of that driver.
int stint_id_for_lap(const std::vector<int>& sorted_in_laps, int lap_number);

} // namespace pitwall
