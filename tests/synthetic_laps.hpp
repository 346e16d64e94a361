#pragma once
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/lap.hpp>
#include <pitwall/stint.hpp>

// Exact linear lap times for test fixtures.
struct LinearTruth {
  double intercept = 90.0;
  double rate = 0.1;        // s per lap in stint
  double fuel_coef = 0.03;  // s per kg
};

// Four stints starting at different race laps, so lap_in_stint and fuel are
// not collinear across the set.
inline std::vector<pitwall::LapRecord> synthetic_laps(const std::string& track,
                                                      pitwall::Compound compound,
                                                      const LinearTruth& t,
                                                      int stint_len = 12) {
  std::vector<pitwall::LapRecord> out;
  const pitwall::FuelParams fuel{};
  const int starts[] = {0, 7, 15, 24};
  int driver = 1;
  for (int s : starts) {
    for (int k = 1; k <= stint_len; ++k) {
      pitwall::LapRecord r;
      r.track_id = track;
      r.driver_number = std::to_string(driver);
      r.compound = compound;
      r.lap_in_stint = k;
      r.lap_number = s + k;
      r.fuel_kg = pitwall::fuel_at_lap(fuel, r.lap_number);
      r.lap_time_s = t.intercept + t.rate * k + t.fuel_coef * r.fuel_kg;
      out.push_back(r);
    }
    ++driver;
  }
  return out;
}

// Store entry with known coefficients, no fitting involved.
inline void put_model(pitwall::ModelStore& store, const std::string& track,
                      pitwall::Compound compound, const LinearTruth& t) {
  pitwall::FittedDegradationModel m;
  m.intercept = t.intercept;
  m.lap_coef = t.rate;
  m.fuel_coef = t.fuel_coef;
  m.sample_count = 48;
  m.usable = true;
  store.insert(pitwall::DegradationKey::make(track, compound), m);
}
