#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <pitwall/pit.hpp>

using Catch::Approx;
using namespace pitwall;

static std::string csv_minimal = R"(key,pit_loss_s
Bahrain,23.0
Nowhere,18.5
)";

static std::string csv_with_noise = R"( key , pit_loss_s
# comment lines are ignored
Bahrain , 23.0
, 20.0
Broken, fast
Negative, -4
"Red Bull Ring", 20.5
)";

TEST_CASE("PitLossTable with the built-in catalog") {
  const PitLossTable t;

  SECTION("known track, case-insensitive") {
    REQUIRE(t.get_pit_loss("Bahrain") == Approx(21.5));
    REQUIRE(t.get_pit_loss("  monaco ") == Approx(19.0));
    REQUIRE(t.get_pit_loss("SINGAPORE") == Approx(24.0));
  }

  SECTION("unknown track falls back to the default") {
    REQUIRE(t.get_pit_loss("Testville") == Approx(kDefaultPitLossSeconds));
    REQUIRE_FALSE(t.lookup("Testville").has_value());
  }

  SECTION("VSC scales the stop cost") {
    REQUIRE(t.get_pit_loss("Monza", PitCondition::Vsc) == Approx(22.5 * kVscPitLossFactor));
    REQUIRE(t.get_pit_loss("Testville", PitCondition::Vsc) == Approx(11.0));
  }

  SECTION("every value is positive") {
    for (const auto& e : pit_loss_catalog()) {
      REQUIRE(t.get_pit_loss(e.key) > 0.0);
    }
  }
}

TEST_CASE("PitLossTable custom construction") {
  SECTION("default and factor are configurable") {
    const PitLossTable t({{"Bahrain", 20.0}}, 25.0, 0.6);
    REQUIRE(t.get_pit_loss("bahrain") == Approx(20.0));
    REQUIRE(t.get_pit_loss("Elsewhere") == Approx(25.0));
    REQUIRE(t.get_pit_loss("Elsewhere", PitCondition::Vsc) == Approx(15.0));
    REQUIRE(t.size() == 1);
  }

  SECTION("invalid default and factor are corrected") {
    const PitLossTable t({}, -3.0, 1.7);
    REQUIRE(t.default_pit_loss() == Approx(kDefaultPitLossSeconds));
    REQUIRE(t.vsc_factor() == Approx(1.0));
  }

  SECTION("with_override leaves the source table untouched") {
    const PitLossTable t;
    const auto u = t.with_override("Bahrain", 30.0);
    REQUIRE(u.get_pit_loss("Bahrain") == Approx(30.0));
    REQUIRE(t.get_pit_loss("Bahrain") == Approx(21.5));
    REQUIRE(t.with_override("Bahrain", -5.0).get_pit_loss("Bahrain") == Approx(0.0));
  }
}

TEST_CASE("pit_loss_catalog_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto cat = pit_loss_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);

  const PitLossTable t(cat);
  REQUIRE(t.get_pit_loss("Bahrain") == Approx(23.0));
  REQUIRE(t.get_pit_loss("Nowhere") == Approx(18.5));
}

TEST_CASE("pit_loss_catalog_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto cat = pit_loss_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);
  const PitLossTable t(cat);
  REQUIRE(t.lookup("Red Bull Ring") == 20.5);
  REQUIRE_FALSE(t.lookup("Negative").has_value());
}

TEST_CASE("load_pit_loss_catalog_csv returns nullopt on missing file") {
  auto none = load_pit_loss_catalog_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}
