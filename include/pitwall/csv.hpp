#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pitwall {

// Text helpers shared by the CSV loaders and writers.

std::string trim(std::string s);
std::string upper(std::string s);
std::string lower(std::string s);

// Comma-separated fields, whitespace-trimmed. Double quotes group a field
// ("a,b") and "" inside quotes is a literal quote.
std::vector<std::string> split_csv_line(const std::string& line);

// Quotes a field when it contains a comma, quote, line break or leading/trailing
// space, or starts with '#'. Line breaks are kept inside the quotes.
std::string csv_field(const std::string& s);

// Whole-string numeric parses; nullopt on trailing garbage or empty input.
// parse_double accepts hexadecimal floats ("0x1.8p+1").
std::optional<double> parse_double(const std::string& s);
std::optional<int> parse_int(const std::string& s);

// Exact text forms of a double.
std::string format_hexfloat(double v);   // C99 %a, bit-exact through parse_double
std::string format_shortest(double v);   // shortest decimal that round-trips

// Reads the next logical record: skips blank lines and '#' comments. A quoted
// field left open at the end of a line continues on the next one.
bool next_csv_record(std::istream& in, std::vector<std::string>& cols);

} // namespace pitwall
