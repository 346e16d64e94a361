#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <pitwall/race_source.hpp>

using Catch::Approx;
using namespace pitwall;

static std::string laps_csv = R"(driver_number,lap_number,compound,lap_time_s,track_temp
44,1,SOFT,96.1,38.5
44,2,soft,95.9,
44,3,SOFT,95.8,38.9
44, x ,SOFT,95.8
16,1,MEDIUM,-1
16,2,HYPERSOFT,95.0
16,3,HARD,96.4
)";

static std::string pits_csv = R"(driver_number,lap,new_compound
44,20,HARD
16,0,HARD
16,22,MEDIUM
1,25,WET
)";

static void write_file(const std::filesystem::path& p, const std::string& text) {
  std::ofstream f(p);
  f << text;
}

TEST_CASE("laps_from_csv_stream") {
  std::istringstream ss(laps_csv);
  const auto out = laps_from_csv_stream(ss, "Bahrain");
  REQUIRE(out.wet_laps == 0);
  REQUIRE(out.laps.size() == 4);

  const auto& first = out.laps[0];
  REQUIRE(first.track_id == "Bahrain");
  REQUIRE(first.driver_number == "44");
  REQUIRE(first.lap_number == 1);
  REQUIRE(first.compound == Compound::Soft);
  REQUIRE(first.lap_time_s == Approx(96.1));
  REQUIRE(first.track_temp == 38.5);
  REQUIRE(first.lap_in_stint == 0);

  REQUIRE_FALSE(out.laps[1].track_temp.has_value());
  REQUIRE(out.laps[3].compound == Compound::Hard);
}

TEST_CASE("laps_from_csv_stream counts wet laps") {
  std::istringstream ss("44,1,INTERMEDIATE,110.0\n44,2,wet,115.0\n44,3,SOFT,96.0\n");
  const auto out = laps_from_csv_stream(ss, "Spa");
  REQUIRE(out.wet_laps == 2);
  REQUIRE(out.laps.size() == 1);
}

TEST_CASE("pit_stops_from_csv_stream") {
  std::istringstream ss(pits_csv);
  const auto out = pit_stops_from_csv_stream(ss);
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].driver_number == "44");
  REQUIRE(out[0].lap == 20);
  REQUIRE(out[0].new_compound == Compound::Hard);
  REQUIRE(out[1].new_compound == Compound::Medium);
}

TEST_CASE("CsvRaceSource") {
  const auto root = std::filesystem::temp_directory_path() / "pitwall_race_source_test";
  std::filesystem::remove_all(root);
  const CsvRaceSource source(root.string());

  SECTION("directory naming") {
    REQUIRE(std::filesystem::path(source.race_dir(2023, "Abu Dhabi")).filename().string() == "2023_abu_dhabi");
  }

  SECTION("loads a dry race") {
    const auto dir = std::filesystem::path(source.race_dir(2023, "Bahrain"));
    std::filesystem::create_directories(dir);
    write_file(dir / "laps.csv", laps_csv);
    write_file(dir / "pit_stops.csv", pits_csv);

    const auto race = source.load(2023, "Bahrain");
    REQUIRE(race.has_value());
    REQUIRE(race->year == 2023);
    REQUIRE(race->track_id == "Bahrain");
    REQUIRE(race->laps.size() == 4);
    REQUIRE(race->pit_stops.size() == 2);
  }

  SECTION("rejects a race with any wet lap") {
    const auto dir = std::filesystem::path(source.race_dir(2021, "Spa"));
    std::filesystem::create_directories(dir);
    write_file(dir / "laps.csv", laps_csv + "16,4,WET,120.0\n");
    write_file(dir / "pit_stops.csv", pits_csv);
    REQUIRE_FALSE(source.load(2021, "Spa").has_value());
  }

  SECTION("missing files") {
    REQUIRE_FALSE(source.load(1999, "Nowhere").has_value());
    const auto dir = std::filesystem::path(source.race_dir(2022, "Monza"));
    std::filesystem::create_directories(dir);
    write_file(dir / "laps.csv", laps_csv);
    REQUIRE_FALSE(source.load(2022, "Monza").has_value());
  }

  std::filesystem::remove_all(root);
}
