#include <pitwall/diagnostics.hpp>

namespace pitwall {

std::vector<CurvePoint> degradation_curve(const ModelStore& store,
                                          const std::string& track_id,
                                          Compound compound,
                                          double fuel_kg,
                                          std::optional<double> track_temp,
                                          int first_lap,
                                          int last_lap) {
  std::vector<CurvePoint> out;
  if (last_lap < first_lap) return out;
  out.reserve(static_cast<std::size_t>(last_lap - first_lap + 1));
  for (int lap = first_lap; lap <= last_lap; ++lap) {
    out.push_back({lap, store.predict(track_id, compound, lap, fuel_kg, track_temp)});
  }
  return out;
}

std::vector<CliffPoint> detect_cliffs(const std::vector<CurvePoint>& curve, double threshold) {
  std::vector<CliffPoint> out(curve.size());
  for (std::size_t i = 0; i < curve.size(); ++i) {
    out[i].lap_in_stint = curve[i].lap_in_stint;
    if (i >= 1) out[i].slope_s_per_lap = curve[i].lap_time_s - curve[i-1].lap_time_s;
    if (i >= 2) {
      out[i].slope_change = *out[i].slope_s_per_lap - *out[i-1].slope_s_per_lap;
      out[i].is_cliff = *out[i].slope_change >= threshold;
    }
  }
  return out;
}

std::vector<int> cliff_laps(const std::vector<CurvePoint>& curve, double threshold) {
  std::vector<int> out;
  for (const auto& p : detect_cliffs(curve, threshold)) {
    if (p.is_cliff) out.push_back(p.lap_in_stint);
  }
  return out;
}

} // namespace pitwall
