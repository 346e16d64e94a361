#include <catch2/catch_test_macros.hpp>
#include <string>
#include <pitwall/compound.hpp>

using namespace pitwall;

TEST_CASE("compound names") {
  REQUIRE(std::string(to_string(Compound::Soft)) == "SOFT");
  REQUIRE(std::string(to_string(Compound::Medium)) == "MEDIUM");
  REQUIRE(std::string(to_string(Compound::Hard)) == "HARD");
}

TEST_CASE("compound_from_string") {
  SECTION("case-insensitive, whitespace ignored") {
    REQUIRE(compound_from_string("soft") == Compound::Soft);
    REQUIRE(compound_from_string(" Medium ") == Compound::Medium);
    REQUIRE(compound_from_string("HARD") == Compound::Hard);
  }

  SECTION("wet compounds and garbage are rejected") {
    REQUIRE_FALSE(compound_from_string("INTERMEDIATE").has_value());
    REQUIRE_FALSE(compound_from_string("WET").has_value());
    REQUIRE_FALSE(compound_from_string("").has_value());
    REQUIRE_FALSE(compound_from_string("S").has_value());
  }

  SECTION("names round-trip") {
    for (Compound c : {Compound::Soft, Compound::Medium, Compound::Hard}) {
      REQUIRE(compound_from_string(to_string(c)) == c);
    }
  }
}
