#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>

#include <pitwall/explanation.hpp>
#include "synthetic_laps.hpp"

using Catch::Approx;
using namespace pitwall;

static Candidate pit(int lap, double total) {
  return Candidate{PitAt{lap}, Compound::Hard, total};
}

static Candidate stay(double total) {
  return Candidate{StayOut{}, Compound::Soft, total};
}

// Ranks and deltas the way the optimizer assigns them; input already sorted.
static OptimizationResult ranked(RaceState s, std::vector<Candidate> cs) {
  OptimizationResult r;
  r.state = s;
  r.pit_loss_s = 22.0;
  for (std::size_t i = 0; i < cs.size(); ++i) {
    cs[i].rank = static_cast<int>(i + 1);
    cs[i].delta_to_best_s = cs[i].total_time_s - cs[0].total_time_s;
  }
  r.candidates = std::move(cs);
  return r;
}

static RaceState mid_stint() {
  RaceState s;
  s.current_lap = 10;
  s.current_compound = Compound::Soft;
  s.lap_in_stint = 8;
  s.total_race_laps = 50;
  s.track_id = "Testville";
  s.new_compound = Compound::Hard;
  s.window_laps = 10;
  return s;
}

static const DegradationRateLookup half_second = [](const std::string&, Compound) { return 0.5; };

TEST_CASE("break-even already behind the current lap") {
  RaceState s = mid_stint();
  s.current_lap = 55;
  s.lap_in_stint = 50;
  s.total_race_laps = 60;
  s.window_laps = 5;
  const auto r = ranked(s, {pit(55, 3000.0), pit(56, 3001.0), stay(3010.0)});
  const auto ex = explain_strategy(r, "Testville", Compound::Soft, half_second, 22.0);

  REQUIRE(ex.break_even_laps == 45);
  REQUIRE(ex.break_even_race_lap == 50);
  REQUIRE(ex.window_opens ==
          "The SOFT loses 0.5 s per lap; the accumulated loss has already exceeded "
          "the 22.0 s pit loss since race lap 50 (45 laps on the set).");

  SECTION("break-even on the current lap still reads as ahead") {
    s.lap_in_stint = 45;
    const auto now = explain_strategy(ranked(s, {pit(55, 3000.0), stay(3010.0)}),
                                      "Testville", Compound::Soft, half_second, 22.0);
    REQUIRE(now.break_even_race_lap == 55);
    REQUIRE(now.window_opens.find("after 45 laps on the set (race lap 55)") != std::string::npos);
  }
}

TEST_CASE("explain a pit recommendation") {
  const auto r = ranked(mid_stint(), {pit(12, 3000.0), pit(13, 3000.5), pit(11, 3001.5),
                                      pit(10, 3002.0), stay(3010.0)});
  const auto ex = explain_strategy(r, "Testville", Compound::Soft, half_second, 22.0);

  REQUIRE(ex.recommended_lap == 12);
  REQUIRE(ex.recommendation == "Pit on lap 12 for HARD.");

  SECTION("break-even is the first stint lap whose wear exceeds the stop") {
    // 45 * 0.5 = 22.5 > 22, 44 * 0.5 = 22 is not
    REQUIRE(ex.break_even_laps == 45);
    REQUIRE(ex.break_even_race_lap == 10 - 8 + 45);
    REQUIRE(ex.window_opens ==
            "The SOFT loses 0.5 s per lap; after 45 laps on the set (race lap 47) "
            "the accumulated loss exceeds the 22.0 s pit loss.");
  }

  SECTION("margin to the next best candidate") {
    REQUIRE(ex.margin_to_next_s == Approx(0.5));
    REQUIRE(ex.margin == "Next best is pitting on lap 13, 0.5 s slower.");
  }

  SECTION("one lap earlier and later") {
    REQUIRE(ex.cost_one_lap_earlier_s == Approx(1.5));
    REQUIRE(ex.cost_one_lap_later_s == Approx(0.5));
    REQUIRE(ex.earlier_later ==
            "Pitting one lap earlier (lap 11) costs 1.5 s; one lap later (lap 13) costs 0.5 s.");
  }

  SECTION("summary lists every statement") {
    REQUIRE(ex.summary == "- " + ex.recommendation + "\n- " + ex.window_opens + "\n- " +
                          ex.margin + "\n- " + ex.earlier_later);
  }

  SECTION("same inputs, same text") {
    const auto again = explain_strategy(r, "Testville", Compound::Soft, half_second, 22.0);
    REQUIRE(again.summary == ex.summary);
  }
}

TEST_CASE("neighbours outside the window are reported as not evaluated") {
  const auto r = ranked(mid_stint(), {pit(10, 3000.0), pit(11, 3000.75), stay(3004.0)});
  const auto ex = explain_strategy(r, "Testville", Compound::Soft, half_second, 22.0);
  REQUIRE_FALSE(ex.cost_one_lap_earlier_s.has_value());
  REQUIRE(ex.earlier_later ==
          "Pitting one lap earlier was not evaluated; one lap later (lap 11) costs 0.8 s.");
}

TEST_CASE("explain a stay-out recommendation") {
  const auto r = ranked(mid_stint(), {stay(2990.0), pit(11, 2993.5), pit(10, 2994.0)});
  const auto ex = explain_strategy(r, "Testville", Compound::Soft, half_second, 22.0);

  REQUIRE_FALSE(ex.recommended_lap.has_value());
  REQUIRE(ex.recommendation ==
          "Stay out: no pit lap between 10 and 20 beats remaining on the SOFT.");
  REQUIRE(ex.margin == "Next best is pitting on lap 11, 3.5 s slower.");
  REQUIRE(ex.earlier_later == "The best stop (lap 11) costs 3.5 s versus staying out.");
  REQUIRE_FALSE(ex.cost_one_lap_earlier_s.has_value());
  REQUIRE_FALSE(ex.cost_one_lap_later_s.has_value());
}

TEST_CASE("no positive degradation means no break-even") {
  const auto r = ranked(mid_stint(), {stay(2990.0), pit(10, 3012.0)});
  const DegradationRateLookup flat = [](const std::string&, Compound) { return -0.02; };
  const auto ex = explain_strategy(r, "Testville", Compound::Soft, flat, 22.0);
  REQUIRE_FALSE(ex.break_even_laps.has_value());
  REQUIRE_FALSE(ex.break_even_race_lap.has_value());
  REQUIRE(ex.window_opens.find("no positive degradation") != std::string::npos);
}

TEST_CASE("rate lookup from a store") {
  ModelStore store;
  put_model(store, "Testville", Compound::Soft, {90.0, 0.25, 0.03});
  const auto lookup = rate_lookup_from(store);
  REQUIRE(lookup("testville", Compound::Soft) == Approx(0.25));

  const auto r = ranked(mid_stint(), {pit(12, 3000.0), stay(3010.0)});
  const auto ex = explain_strategy(r, "Testville", Compound::Soft, lookup, 22.0);
  REQUIRE(ex.degradation_rate_s_per_lap == Approx(0.25));
  REQUIRE(ex.break_even_laps == 89);   // 88 * 0.25 = 22 exactly
}
