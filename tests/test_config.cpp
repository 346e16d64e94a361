#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <pitwall/config.hpp>

using Catch::Approx;
using namespace pitwall;

static std::string cfg_csv = R"(key,value
# fuel model
initial_fuel_kg, 105
fuel_per_lap_kg, 1.7
window_laps, 12
min_samples, 8
vsc_factor, 0.4
default_pit_loss_s, 23.5
workers, 4
)";

static std::string cfg_noise = R"(window_laps, -3
vsc_factor, 1.5
min_samples, 0
default_pit_loss_s, 0
no_such_key, 12
alignment_window_laps, two
pit_window_within_s, 3.0
)";

TEST_CASE("defaults match the library constants") {
  const StrategyConfig c;
  REQUIRE(c.window_laps == kDefaultWindowLaps);
  REQUIRE(c.min_samples == kDefaultMinSamples);
  REQUIRE(c.alignment_window_laps == kAlignmentWindowLaps);
  REQUIRE(c.default_pit_loss_s == Approx(kDefaultPitLossSeconds));
  REQUIRE(c.vsc_factor == Approx(kVscPitLossFactor));
  REQUIRE(c.fuel.initial_kg == Approx(110.0));
  REQUIRE(c.fuel.per_lap_kg == Approx(1.8));
}

TEST_CASE("strategy_config_from_csv_stream parses valid rows") {
  std::istringstream ss(cfg_csv);
  const auto c = strategy_config_from_csv_stream(ss);
  REQUIRE(c.fuel.initial_kg == Approx(105.0));
  REQUIRE(c.fuel.per_lap_kg == Approx(1.7));
  REQUIRE(c.window_laps == 12);
  REQUIRE(c.min_samples == 8);
  REQUIRE(c.vsc_factor == Approx(0.4));
  REQUIRE(c.default_pit_loss_s == Approx(23.5));
  REQUIRE(c.workers == 4);

  const auto o = c.validation_options();
  REQUIRE(o.window_laps == 12);
  REQUIRE(o.fuel.initial_kg == Approx(105.0));
  REQUIRE(o.workers == 4);
}

TEST_CASE("strategy_config_from_csv_stream skips invalid entries") {
  std::istringstream ss(cfg_noise);
  const StrategyConfig base;
  const auto c = strategy_config_from_csv_stream(ss, base);
  REQUIRE(c.window_laps == base.window_laps);
  REQUIRE(c.vsc_factor == Approx(base.vsc_factor));
  REQUIRE(c.min_samples == base.min_samples);
  REQUIRE(c.default_pit_loss_s == Approx(base.default_pit_loss_s));
  REQUIRE(c.alignment_window_laps == base.alignment_window_laps);
  REQUIRE(c.pit_window_within_s == Approx(3.0));
}

TEST_CASE("load_strategy_config returns nullopt on missing file") {
  REQUIRE_FALSE(load_strategy_config("this_file_does_not_exist.csv").has_value());
}
