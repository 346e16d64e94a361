#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>

namespace pitwall {

inline constexpr double kDefaultCliffSlopeChange = 0.05;   // s/lap

struct CurvePoint {
  int lap_in_stint = 0;
  double lap_time_s = 0.0;
};

// Predicted lap time vs lap-in-stint at a fixed fuel load. Deterministic.
std::vector<CurvePoint> degradation_curve(const ModelStore& store,
                                          const std::string& track_id,
                                          Compound compound,
                                          double fuel_kg,
                                          std::optional<double> track_temp = std::nullopt,
                                          int first_lap = 1,
                                          int last_lap = 50);

struct CliffPoint {
  int lap_in_stint = 0;
  std::optional<double> slope_s_per_lap;   // undefined on the first lap
  std::optional<double> slope_change;      // undefined on the first two laps
  bool is_cliff = false;
};

// First and second differences of a curve; a cliff is a lap where the slope
// grows by at least threshold. A linear model never produces one.
std::vector<CliffPoint> detect_cliffs(const std::vector<CurvePoint>& curve,
                                      double threshold = kDefaultCliffSlopeChange);

std::vector<int> cliff_laps(const std::vector<CurvePoint>& curve,
                            double threshold = kDefaultCliffSlopeChange);

} // namespace pitwall
