#include <pitwall/stint.hpp>
#include <algorithm>
#include <map>
#include <string>

namespace pitwall {

double fuel_at_lap(const FuelParams& f, int lap_number) {
  const int done = std::max(0, lap_number - 1);
  const double fuel = f.initial_kg - static_cast<double>(done) * f.per_lap_kg;
  return std::max(f.min_kg, fuel);
}

int stint_id_for_lap(const std::vector<int>& sorted_in_laps, int lap_number) {
  const auto before = std::lower_bound(sorted_in_laps.begin(), sorted_in_laps.end(), lap_number);
  return 1 + static_cast<int>(before - sorted_in_laps.begin());
}

std::vector<LapRecord> add_stint_features(const std::vector<LapRecord>& laps,
                                          const std::vector<PitStopRecord>& pit_stops,
                                          const FuelParams& fuel) {
  std::map<std::string, std::vector<int>> in_laps;
  for (const auto& p : pit_stops) {
    if (p.lap > 0) in_laps[p.driver_number].push_back(p.lap);
  }
  for (auto& [driver, v] : in_laps) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
  }

  static const std::vector<int> kNoStops;
  std::vector<LapRecord> out;
  out.reserve(laps.size());
  for (const auto& lap : laps) {
    LapRecord r = lap;
    auto it = in_laps.find(lap.driver_number);
    const auto& stops = it == in_laps.end() ? kNoStops : it->second;
    const int stint = stint_id_for_lap(stops, lap.lap_number);
    const int stint_start = stint == 1 ? 0 : stops[stint - 2];
    r.lap_in_stint = std::max(1, lap.lap_number - stint_start);
    r.fuel_kg = fuel_at_lap(fuel, lap.lap_number);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace pitwall
