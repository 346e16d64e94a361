#include <pitwall/validation.hpp>
#include <pitwall/csv.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <map>
#include <thread>
#include <utility>

namespace pitwall {

static int race_length(const RaceRecord& race) {
  if (race.total_laps > 0) return race.total_laps;
  int max_lap = 0;
  for (const auto& l : race.laps) max_lap = std::max(max_lap, l.lap_number);
  return max_lap;
}

std::vector<ValidationDecision> validate_race(const RaceRecord& race,
                                              const ModelStore& store,
                                              const PitLossTable& pit_table,
                                              const ValidationOptions& options) {
  std::vector<ValidationDecision> rows;
  rows.reserve(race.pit_stops.size());

  std::map<std::pair<std::string, int>, const LapRecord*> by_driver_lap;
  for (const auto& l : race.laps) by_driver_lap.emplace(std::make_pair(l.driver_number, l.lap_number), &l);
  const int total_laps = race_length(race);

  for (const auto& stop : race.pit_stops) {
    ValidationDecision row;
    row.year = race.year;
    row.track_id = race.track_id;
    row.driver_number = stop.driver_number;
    row.actual_pit_lap = stop.lap;
    row.new_compound = stop.new_compound;
    row.current_compound = stop.new_compound;   // fallback when the lap is missing

    auto it = by_driver_lap.find(std::make_pair(stop.driver_number, stop.lap));
    if (it != by_driver_lap.end()) {
      row.current_compound = it->second->compound;
      row.lap_in_stint = std::max(1, it->second->lap_in_stint);
    }

    RaceState state;
    state.current_lap = stop.lap;
    state.current_compound = row.current_compound;
    state.lap_in_stint = row.lap_in_stint;
    state.total_race_laps = total_laps;
    state.track_id = race.track_id;
    state.new_compound = stop.new_compound;
    state.window_laps = options.window_laps;
    state.fuel = options.fuel;

    try {
      const auto result = optimize_pit_window(state, store, pit_table);
      row.recommended_pit_lap = recommended_pit_lap(result);
      if (row.recommended_pit_lap) {
        row.lap_delta = *row.recommended_pit_lap - stop.lap;
        row.alignment_within_3 = std::abs(*row.lap_delta) <= options.alignment_window_laps;
      } else {
        row.alignment_within_3 = false;   // advised to stay out, team pitted
      }
    } catch (const std::exception& e) {
      row.recommended_pit_lap.reset();
      row.lap_delta.reset();
      row.alignment_within_3.reset();
      row.error = true;
      row.error_message = e.what();
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

ValidationSummary summarize_validation(const std::vector<ValidationDecision>& details) {
  ValidationSummary s;
  s.total_decisions = details.size();
  std::size_t aligned_defined = 0;
  double abs_sum = 0.0;
  std::size_t delta_count = 0;
  for (const auto& d : details) {
    if (d.error) ++s.count_errors;
    if (d.alignment_within_3.has_value()) {
      ++aligned_defined;
      if (*d.alignment_within_3) ++s.count_within_3;
    }
    if (d.lap_delta.has_value()) {
      abs_sum += std::abs(*d.lap_delta);
      ++delta_count;
    }
  }
  s.pct_within_3 = aligned_defined == 0
    ? 0.0
    : 100.0 * static_cast<double>(s.count_within_3) / static_cast<double>(aligned_defined);
  if (delta_count > 0) s.mean_abs_lap_delta = abs_sum / static_cast<double>(delta_count);
  return s;
}

ValidationReport run_validation(const std::vector<RaceRecord>& races,
                                const ModelStore& store,
                                const PitLossTable& pit_table,
                                const ValidationOptions& options) {
  // One buffer per race, each written by exactly one worker, merged in input order.
  std::vector<std::vector<ValidationDecision>> per_race(races.size());

  const unsigned workers = std::max(1u, std::min<unsigned>(options.workers,
                                                           static_cast<unsigned>(races.size())));
  if (workers <= 1) {
    for (std::size_t i = 0; i < races.size(); ++i) {
      per_race[i] = validate_race(races[i], store, pit_table, options);
    }
  } else {
    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> failures(workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
      pool.emplace_back([&, w] {
        try {
          for (std::size_t i = next.fetch_add(1); i < races.size(); i = next.fetch_add(1)) {
            per_race[i] = validate_race(races[i], store, pit_table, options);
          }
        } catch (...) {
          failures[w] = std::current_exception();
        }
      });
    }
    for (auto& t : pool) t.join();
    for (const auto& f : failures) {
      if (f) std::rethrow_exception(f);
    }
  }

  ValidationReport report;
  for (auto& rows : per_race) {
    report.details.insert(report.details.end(),
                          std::make_move_iterator(rows.begin()),
                          std::make_move_iterator(rows.end()));
  }
  report.summary = summarize_validation(report.details);
  return report;
}

// ---- Persistence ----

static constexpr const char* kDetailsHeader =
  "year,track_id,driver_number,actual_pit_lap,recommended_pit_lap,lap_delta,"
  "alignment_within_3,current_compound,new_compound,lap_in_stint,error,error_message";

static std::string opt_int(const std::optional<int>& v) {
  return v ? std::to_string(*v) : std::string();
}

void write_validation_details(const std::vector<ValidationDecision>& details, std::ostream& out) {
  out << kDetailsHeader << "\n";
  for (const auto& d : details) {
    out << d.year << ","
        << csv_field(d.track_id) << ","
        << csv_field(d.driver_number) << ","
        << d.actual_pit_lap << ","
        << opt_int(d.recommended_pit_lap) << ","
        << opt_int(d.lap_delta) << ","
        << (d.alignment_within_3 ? (*d.alignment_within_3 ? "true" : "false") : "") << ","
        << to_string(d.current_compound) << ","
        << to_string(d.new_compound) << ","
        << d.lap_in_stint << ","
        << (d.error ? "true" : "false") << ","
        << csv_field(d.error_message) << "\n";
  }
}

static std::optional<bool> parse_bool(const std::string& s) {
  const std::string v = lower(trim(s));
  if (v == "true" || v == "1") return true;
  if (v == "false" || v == "0") return false;
  return std::nullopt;
}

// Empty cell = undefined; anything else must parse.
template <class T, class Parse>
static bool parse_nullable(const std::string& s, std::optional<T>& out, Parse parse) {
  if (trim(s).empty()) { out.reset(); return true; }
  const auto v = parse(s);
  if (!v) return false;
  out = *v;
  return true;
}

static std::optional<ValidationDecision> parse_details_row(const std::vector<std::string>& cols) {
  if (cols.size() < 11) return std::nullopt;
  ValidationDecision d;
  const auto year = parse_int(cols[0]);
  const auto actual = parse_int(cols[3]);
  const auto current = compound_from_string(cols[7]);
  const auto next = compound_from_string(cols[8]);
  const auto lis = parse_int(cols[9]);
  const auto error = parse_bool(cols[10]);
  if (!(year && actual && current && next && lis && error)) return std::nullopt;
  if (!parse_nullable(cols[4], d.recommended_pit_lap, parse_int)) return std::nullopt;
  if (!parse_nullable(cols[5], d.lap_delta, parse_int)) return std::nullopt;
  if (!parse_nullable(cols[6], d.alignment_within_3, parse_bool)) return std::nullopt;
  d.year = *year;
  d.track_id = cols[1];
  d.driver_number = cols[2];
  d.actual_pit_lap = *actual;
  d.current_compound = *current;
  d.new_compound = *next;
  d.lap_in_stint = *lis;
  d.error = *error;
  if (cols.size() > 11) d.error_message = cols[11];
  return d;
}

std::vector<ValidationDecision> validation_details_from_csv_stream(std::istream& in) {
  std::vector<ValidationDecision> out;
  std::vector<std::string> cols;
  while (next_csv_record(in, cols)) {
    if (!cols.empty() && cols[0] == "year") continue; // header
    if (auto row = parse_details_row(cols); row.has_value()) {
      out.push_back(std::move(*row));
    }
  }
  return out;
}

void write_validation_summary(const ValidationSummary& s, std::ostream& out) {
  out << "total_decisions: " << s.total_decisions << "\n"
      << "count_within_3: " << s.count_within_3 << "\n"
      << "pct_within_3: " << format_shortest(s.pct_within_3) << "\n"
      << "mean_abs_lap_delta: "
      << (s.mean_abs_lap_delta ? format_shortest(*s.mean_abs_lap_delta) : std::string("none")) << "\n"
      << "count_errors: " << s.count_errors << "\n";
}

std::optional<ValidationSummary> validation_summary_from_stream(std::istream& in) {
  std::map<std::string, std::string> kv;
  std::string line;
  while (std::getline(in, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    kv[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
  }

  auto count = [&](const char* key) -> std::optional<std::size_t> {
    auto it = kv.find(key);
    if (it == kv.end()) return std::nullopt;
    const auto v = parse_int(it->second);
    if (!v || *v < 0) return std::nullopt;
    return static_cast<std::size_t>(*v);
  };

  ValidationSummary s;
  const auto total = count("total_decisions");
  const auto within = count("count_within_3");
  const auto errors = count("count_errors");
  auto pct_it = kv.find("pct_within_3");
  auto mean_it = kv.find("mean_abs_lap_delta");
  if (!(total && within && errors) || pct_it == kv.end() || mean_it == kv.end()) return std::nullopt;
  const auto pct = parse_double(pct_it->second);
  if (!pct) return std::nullopt;
  s.total_decisions = *total;
  s.count_within_3 = *within;
  s.count_errors = *errors;
  s.pct_within_3 = *pct;
  if (mean_it->second != "none") {
    const auto mean = parse_double(mean_it->second);
    if (!mean) return std::nullopt;
    s.mean_abs_lap_delta = *mean;
  }
  return s;
}

bool save_validation_results(const ValidationReport& report, const std::string& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return false;
  const auto base = std::filesystem::path(dir);
  {
    std::ofstream f(base / kValidationDetailsFile, std::ios::binary);
    if (!f) return false;
    write_validation_details(report.details, f);
    if (!f) return false;
  }
  std::ofstream f(base / kValidationSummaryFile, std::ios::binary);
  if (!f) return false;
  write_validation_summary(report.summary, f);
  return static_cast<bool>(f);
}

std::optional<ValidationReport> load_validation_results(const std::string& dir) {
  const auto base = std::filesystem::path(dir);
  std::ifstream details(base / kValidationDetailsFile);
  std::ifstream summary(base / kValidationSummaryFile);
  if (!details || !summary) return std::nullopt;
  auto s = validation_summary_from_stream(summary);
  if (!s) return std::nullopt;
  ValidationReport r;
  r.details = validation_details_from_csv_stream(details);
  r.summary = *s;
  return r;
}

} // namespace pitwall
