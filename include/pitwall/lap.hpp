#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>

namespace pitwall {

// One observed lap, after stint features have been derived.
struct LapRecord {
  std::string track_id;
  std::string driver_number;
  Compound compound = Compound::Medium;
  int lap_in_stint = 0;             // 1 = first lap on this tyre set; 0 = not derived yet
  int lap_number = 0;               // absolute race lap, 1-based
  double fuel_kg = 0.0;             // estimated fuel at lap start
  std::optional<double> track_temp; // deg C
  double lap_time_s = 0.0;
};

// One historical stop: the in-lap and the compound fitted.
struct PitStopRecord {
  std::string driver_number;
  int lap = 0;
  Compound new_compound = Compound::Medium;
};

// Everything the core needs from one dry race.
struct RaceRecord {
  int year = 0;
  std::string track_id;
  int total_laps = 0;   // 0 = derive from the highest lap number
  std::vector<LapRecord> laps;
  std::vector<PitStopRecord> pit_stops;
};

} // namespace pitwall
