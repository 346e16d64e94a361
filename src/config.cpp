#include <pitwall/config.hpp>
#include <pitwall/csv.hpp>
#include <fstream>

namespace pitwall {

ValidationOptions StrategyConfig::validation_options() const {
  ValidationOptions o;
  o.window_laps = window_laps;
  o.fuel = fuel;
  o.alignment_window_laps = alignment_window_laps;
  o.workers = workers;
  return o;
}

static bool set_non_negative(double& dst, const std::string& s) {
  const auto v = parse_double(s);
  if (!v || *v < 0.0) return false;
  dst = *v;
  return true;
}

static bool set_count(int& dst, const std::string& s) {
  const auto v = parse_int(s);
  if (!v || *v < 0) return false;
  dst = *v;
  return true;
}

static void apply_entry(StrategyConfig& c, const std::string& key, const std::string& value) {
  const std::string k = lower(key);
  if (k == "initial_fuel_kg")        set_non_negative(c.fuel.initial_kg, value);
  else if (k == "fuel_per_lap_kg")   set_non_negative(c.fuel.per_lap_kg, value);
  else if (k == "min_fuel_kg")       set_non_negative(c.fuel.min_kg, value);
  else if (k == "window_laps")       set_count(c.window_laps, value);
  else if (k == "alignment_window_laps") set_count(c.alignment_window_laps, value);
  else if (k == "pit_window_within_s")   set_non_negative(c.pit_window_within_s, value);
  else if (k == "pit_loss_sensitivity_s") set_non_negative(c.pit_loss_sensitivity_s, value);
  else if (k == "degradation_sensitivity_s_per_lap") set_non_negative(c.degradation_sensitivity_s_per_lap, value);
  else if (k == "default_pit_loss_s") {
    const auto v = parse_double(value);
    if (v && *v > 0.0) c.default_pit_loss_s = *v;
  }
  else if (k == "vsc_factor") {
    const auto v = parse_double(value);
    if (v && *v >= 0.0 && *v <= 1.0) c.vsc_factor = *v;
  }
  else if (k == "min_samples") {
    const auto v = parse_int(value);
    if (v && *v >= 1) c.min_samples = static_cast<std::size_t>(*v);
  }
  else if (k == "workers") {
    const auto v = parse_int(value);
    if (v && *v >= 1) c.workers = static_cast<unsigned>(*v);
  }
}

StrategyConfig strategy_config_from_csv_stream(std::istream& in, StrategyConfig base) {
  std::vector<std::string> cols;
  while (next_csv_record(in, cols)) {
    if (cols.size() < 2 || cols[0].empty()) continue;
    if (cols[0] == "key" || cols[0] == "Key") continue;
    apply_entry(base, cols[0], cols[1]);
  }
  return base;
}

std::optional<StrategyConfig> load_strategy_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return strategy_config_from_csv_stream(f);
}

} // namespace pitwall
