#include <pitwall/csv.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>

namespace pitwall {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  bool quoted = false;   // inside "..."
  bool was_quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i+1] == '"') { cur.push_back('"'); ++i; }
        else quoted = false;
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '"' && trim(cur).empty()) { cur.clear(); quoted = true; was_quoted = true; }
    else if (c == ',') {
      cols.push_back(was_quoted ? cur : trim(cur));
      cur.clear();
      was_quoted = false;
    }
    else if (!was_quoted) cur.push_back(c);
  }
  cols.push_back(was_quoted ? cur : trim(cur));
  return cols;
}

std::string csv_field(const std::string& s) {
  const bool needs = s.find_first_of(",\"\r\n") != std::string::npos ||
                     (!s.empty() && (s.front() == '#' ||
                                     std::isspace(static_cast<unsigned char>(s.front())) ||
                                     std::isspace(static_cast<unsigned char>(s.back()))));
  if (!needs) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::optional<double> parse_double(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0') return std::nullopt;
  return v;
}

std::optional<int> parse_int(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) return std::nullopt;
  int v = 0;
  const auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
  if (ec != std::errc{} || ptr != t.data() + t.size()) return std::nullopt;
  return v;
}

std::string format_hexfloat(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%a", v);
  return std::string(buf);
}

std::string format_shortest(double v) {
  char buf[64];
  const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) return "nan";
  return std::string(buf, ptr);
}

// True when the record text ends inside a quoted field (same rules as split_csv_line).
static bool ends_in_quote(const std::string& record) {
  bool quoted = false;
  bool at_field_start = true;
  for (std::size_t i = 0; i < record.size(); ++i) {
    const char c = record[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < record.size() && record[i+1] == '"') ++i;
        else quoted = false;
      }
      continue;
    }
    if (c == ',') at_field_start = true;
    else if (c == '"' && at_field_start) quoted = true;
    else if (!std::isspace(static_cast<unsigned char>(c))) at_field_start = false;
  }
  return quoted;
}

static void chop_cr(std::string& line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
}

bool next_csv_record(std::istream& in, std::vector<std::string>& cols) {
  std::string line;
  while (std::getline(in, line)) {
    chop_cr(line);
    const std::string head = trim(line);
    if (head.empty() || head[0] == '#') continue;
    std::string record = line;
    // A quoted field may span lines; its newlines are part of the value.
    std::string more;
    while (ends_in_quote(record) && std::getline(in, more)) {
      chop_cr(more);
      record += '\n';
      record += more;
    }
    cols = split_csv_line(record);
    return true;
  }
  return false;
}

} // namespace pitwall
