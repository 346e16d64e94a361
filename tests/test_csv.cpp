#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <pitwall/csv.hpp>

using Catch::Approx;
using namespace pitwall;

TEST_CASE("split_csv_line") {
  SECTION("fields are trimmed") {
    auto cols = split_csv_line(" a , b,c ");
    REQUIRE(cols == std::vector<std::string>{"a", "b", "c"});
  }

  SECTION("quotes group commas and escape quotes") {
    auto cols = split_csv_line(R"(1,"Red Bull, Ring","say ""box""",x)");
    REQUIRE(cols.size() == 4);
    REQUIRE(cols[1] == "Red Bull, Ring");
    REQUIRE(cols[2] == "say \"box\"");
    REQUIRE(cols[3] == "x");
  }

  SECTION("empty fields are kept") {
    auto cols = split_csv_line("a,,c,");
    REQUIRE(cols == std::vector<std::string>{"a", "", "c", ""});
  }
}

TEST_CASE("csv_field quotes only when needed") {
  REQUIRE(csv_field("plain") == "plain");
  REQUIRE(csv_field("a,b") == "\"a,b\"");
  REQUIRE(csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");

  const std::string tricky = "no model for x, y \"z\"";
  auto back = split_csv_line("1," + csv_field(tricky) + ",2");
  REQUIRE(back.size() == 3);
  REQUIRE(back[1] == tricky);
}

TEST_CASE("csv_field output reads back through next_csv_record") {
  SECTION("a leading # is quoted, not taken for a comment") {
    REQUIRE(csv_field("#7 street") == "\"#7 street\"");
    REQUIRE(csv_field("street #7") == "street #7");
    std::istringstream ss(csv_field("#7 street") + ",1\n");
    std::vector<std::string> cols;
    REQUIRE(next_csv_record(ss, cols));
    REQUIRE(cols == std::vector<std::string>{"#7 street", "1"});
  }

  SECTION("line breaks stay inside one record") {
    const std::string msg = "no model\nfor \"x\",\n\n# y";
    REQUIRE(csv_field(msg) == "\"no model\nfor \"\"x\"\",\n\n# y\"");
    std::istringstream ss("a," + csv_field(msg) + ",b\nc,d\n");
    std::vector<std::string> cols;
    REQUIRE(next_csv_record(ss, cols));
    REQUIRE(cols == std::vector<std::string>{"a", msg, "b"});
    REQUIRE(next_csv_record(ss, cols));
    REQUIRE(cols == std::vector<std::string>{"c", "d"});
    REQUIRE_FALSE(next_csv_record(ss, cols));
  }

  SECTION("an unterminated quote ends at end of input") {
    std::istringstream ss("a,\"open\nstill open");
    std::vector<std::string> cols;
    REQUIRE(next_csv_record(ss, cols));
    REQUIRE(cols == std::vector<std::string>{"a", "open\nstill open"});
    REQUIRE_FALSE(next_csv_record(ss, cols));
  }
}

TEST_CASE("numeric parsing") {
  SECTION("parse_double") {
    REQUIRE(parse_double("1.5") == 1.5);
    REQUIRE(parse_double(" -2 ") == -2.0);
    REQUIRE(parse_double("0x1.8p+1") == 3.0);
    REQUIRE_FALSE(parse_double("").has_value());
    REQUIRE_FALSE(parse_double("1.5s").has_value());
    REQUIRE_FALSE(parse_double("abc").has_value());
  }

  SECTION("parse_int") {
    REQUIRE(parse_int("42") == 42);
    REQUIRE(parse_int(" 7 ") == 7);
    REQUIRE(parse_int("-3") == -3);
    REQUIRE_FALSE(parse_int("4.2").has_value());
    REQUIRE_FALSE(parse_int("x").has_value());
  }
}

TEST_CASE("exact double text forms") {
  const double values[] = {0.1, 1.0 / 3.0, 91.23456789012345, -0.0375, 1e-9};
  for (double v : values) {
    REQUIRE(parse_double(format_hexfloat(v)) == v);
    REQUIRE(parse_double(format_shortest(v)) == v);
  }
  REQUIRE(format_shortest(50.0) == "50");
  REQUIRE(format_shortest(0.5) == "0.5");
}

TEST_CASE("next_csv_record skips blank lines and comments") {
  std::istringstream ss("# header comment\n\n  a,b\n   # indented comment\nc,d\n");
  std::vector<std::string> cols;
  REQUIRE(next_csv_record(ss, cols));
  REQUIRE(cols == std::vector<std::string>{"a", "b"});
  REQUIRE(next_csv_record(ss, cols));
  REQUIRE(cols == std::vector<std::string>{"c", "d"});
  REQUIRE_FALSE(next_csv_record(ss, cols));
}

TEST_CASE("case helpers") {
  REQUIRE(trim("  x y  ") == "x y");
  REQUIRE(upper("Soft") == "SOFT");
  REQUIRE(lower("Abu Dhabi") == "abu dhabi");
}
