#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/lap.hpp>

namespace pitwall {

// Race-loading contract. Implementations hand back dry races only.
class RaceSource {
public:
  virtual ~RaceSource() = default;
  virtual std::optional<RaceRecord> load(int year, const std::string& track_id) const = 0;
};

struct LapCsv {
  std::vector<LapRecord> laps;
  std::size_t wet_laps = 0;   // INTERMEDIATE / WET rows seen (not returned)
};

// "driver_number,lap_number,compound,lap_time_s[,track_temp]". Optional header,
// '#' comments, invalid rows skipped. lap_in_stint and fuel are left for
// add_stint_features.
LapCsv laps_from_csv_stream(std::istream& in, const std::string& track_id);

// "driver_number,lap,new_compound".
std::vector<PitStopRecord> pit_stops_from_csv_stream(std::istream& in);

// Directory layout: <root>/<year>_<track>/{laps.csv,pit_stops.csv}, track
// lower-cased with spaces as underscores. A race with any wet lap is rejected.
class CsvRaceSource : public RaceSource {
public:
  explicit CsvRaceSource(std::string root) : root_(std::move(root)) {}

  std::optional<RaceRecord> load(int year, const std::string& track_id) const override;
  std::string race_dir(int year, const std::string& track_id) const;

private:
  std::string root_;
};

} // namespace pitwall
