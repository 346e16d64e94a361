#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <pitwall/diagnostics.hpp>
#include <pitwall/errors.hpp>
#include "synthetic_laps.hpp"

using Catch::Approx;
using namespace pitwall;

TEST_CASE("degradation_curve") {
  ModelStore store;
  put_model(store, "Bahrain", Compound::Soft, {90.0, 0.1, 0.03});

  const auto curve = degradation_curve(store, "Bahrain", Compound::Soft, 50.0);
  REQUIRE(curve.size() == 50);
  REQUIRE(curve.front().lap_in_stint == 1);
  REQUIRE(curve.back().lap_in_stint == 50);
  REQUIRE(curve.front().lap_time_s == Approx(90.0 + 0.1 + 1.5));

  SECTION("custom range") {
    const auto part = degradation_curve(store, "Bahrain", Compound::Soft, 50.0, std::nullopt, 5, 9);
    REQUIRE(part.size() == 5);
    REQUIRE(part.front().lap_time_s == Approx(curve[4].lap_time_s));
    REQUIRE(degradation_curve(store, "Bahrain", Compound::Soft, 50.0, std::nullopt, 9, 5).empty());
  }

  SECTION("a linear model has a constant slope and no cliffs") {
    const auto pts = detect_cliffs(curve);
    REQUIRE_FALSE(pts[0].slope_s_per_lap.has_value());
    REQUIRE_FALSE(pts[1].slope_change.has_value());
    for (std::size_t i = 1; i < pts.size(); ++i) {
      REQUIRE(*pts[i].slope_s_per_lap == Approx(0.1));
      REQUIRE_FALSE(pts[i].is_cliff);
    }
    REQUIRE(cliff_laps(curve).empty());
  }

  SECTION("missing model") {
    REQUIRE_THROWS_AS(degradation_curve(store, "Bahrain", Compound::Hard, 50.0), ModelNotFittedError);
  }
}

TEST_CASE("detect_cliffs flags a jump in slope") {
  std::vector<CurvePoint> curve;
  for (int k = 1; k <= 10; ++k) {
    double t = 90.0 + 0.05 * k;
    if (k > 6) t += 0.3 * (k - 6);   // wear accelerates after lap 6
    curve.push_back({k, t});
  }
  REQUIRE(cliff_laps(curve) == std::vector<int>{7});
  REQUIRE(cliff_laps(curve, 0.5).empty());

  const auto pts = detect_cliffs(curve);
  REQUIRE(*pts[6].slope_change == Approx(0.3));
  REQUIRE(*pts[7].slope_change == Approx(0.0).margin(1e-9));
}
