#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/lap.hpp>
#include <pitwall/optimizer.hpp>
#include <pitwall/pit.hpp>

namespace pitwall {

inline constexpr int kAlignmentWindowLaps = 3;

// One replayed historical stop. On error rows every metric is undefined.
struct ValidationDecision {
  int year = 0;
  std::string track_id;
  std::string driver_number;
  int actual_pit_lap = 0;
  std::optional<int> recommended_pit_lap;   // nullopt: stay out, or error
  std::optional<int> lap_delta;             // recommended - actual
  std::optional<bool> alignment_within_3;   // nullopt only on error rows
  Compound current_compound = Compound::Medium;
  Compound new_compound = Compound::Medium;
  int lap_in_stint = 1;
  bool error = false;
  std::string error_message;

  bool operator==(const ValidationDecision&) const = default;
};

struct ValidationSummary {
  std::size_t total_decisions = 0;
  std::size_t count_within_3 = 0;
  double pct_within_3 = 0.0;                // over rows with a defined alignment
  std::optional<double> mean_abs_lap_delta; // over rows with a defined delta
  std::size_t count_errors = 0;

  bool operator==(const ValidationSummary&) const = default;
};

struct ValidationReport {
  std::vector<ValidationDecision> details;
  ValidationSummary summary;
};

struct ValidationOptions {
  int window_laps = kDefaultWindowLaps;
  FuelParams fuel{};
  int alignment_window_laps = kAlignmentWindowLaps;
  unsigned workers = 1;    // > 1: races split across threads, output order unchanged
};

// Never throws for a single bad decision: it becomes an error row.
ValidationReport run_validation(const std::vector<RaceRecord>& races,
                                const ModelStore& store,
                                const PitLossTable& pit_table,
                                const ValidationOptions& options = {});

// Rows for one race, in pit-stop order.
std::vector<ValidationDecision> validate_race(const RaceRecord& race,
                                              const ModelStore& store,
                                              const PitLossTable& pit_table,
                                              const ValidationOptions& options = {});

ValidationSummary summarize_validation(const std::vector<ValidationDecision>& details);

// validation_details.csv + validation_summary.txt under dir (created if needed).
inline constexpr const char* kValidationDetailsFile = "validation_details.csv";
inline constexpr const char* kValidationSummaryFile = "validation_summary.txt";

bool save_validation_results(const ValidationReport& report, const std::string& dir);
std::optional<ValidationReport> load_validation_results(const std::string& dir);

// Stream variants (test-friendly).
void write_validation_details(const std::vector<ValidationDecision>& details, std::ostream& out);
void write_validation_summary(const ValidationSummary& summary, std::ostream& out);
std::vector<ValidationDecision> validation_details_from_csv_stream(std::istream& in);
std::optional<ValidationSummary> validation_summary_from_stream(std::istream& in);

} // namespace pitwall
