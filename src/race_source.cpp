#include <pitwall/race_source.hpp>
#include <pitwall/csv.hpp>
#include <filesystem>
#include <fstream>

namespace pitwall {

static bool is_wet_compound(const std::string& s) {
  const std::string u = upper(trim(s));
  return u == "INTERMEDIATE" || u == "WET";
}

LapCsv laps_from_csv_stream(std::istream& in, const std::string& track_id) {
  LapCsv out;
  std::vector<std::string> cols;
  while (next_csv_record(in, cols)) {
    if (cols.size() < 4) continue;
    if (cols[0] == "driver_number") continue; // header
    if (is_wet_compound(cols[2])) { ++out.wet_laps; continue; }
    const auto lap = parse_int(cols[1]);
    const auto compound = compound_from_string(cols[2]);
    const auto time = parse_double(cols[3]);
    if (cols[0].empty() || !lap || *lap < 1 || !compound || !time || !(*time > 0.0)) continue;

    LapRecord r;
    r.track_id = track_id;
    r.driver_number = cols[0];
    r.lap_number = *lap;
    r.compound = *compound;
    r.lap_time_s = *time;
    if (cols.size() > 4) r.track_temp = parse_double(cols[4]);
    out.laps.push_back(std::move(r));
  }
  return out;
}

std::vector<PitStopRecord> pit_stops_from_csv_stream(std::istream& in) {
  std::vector<PitStopRecord> out;
  std::vector<std::string> cols;
  while (next_csv_record(in, cols)) {
    if (cols.size() < 3) continue;
    if (cols[0] == "driver_number") continue; // header
    const auto lap = parse_int(cols[1]);
    const auto compound = compound_from_string(cols[2]);
    if (cols[0].empty() || !lap || *lap < 1 || !compound) continue;
    out.push_back(PitStopRecord{cols[0], *lap, *compound});
  }
  return out;
}

std::string CsvRaceSource::race_dir(int year, const std::string& track_id) const {
  std::string name = lower(trim(track_id));
  for (auto& c : name) if (c == ' ') c = '_';
  return (std::filesystem::path(root_) / (std::to_string(year) + "_" + name)).string();
}

std::optional<RaceRecord> CsvRaceSource::load(int year, const std::string& track_id) const {
  const auto dir = std::filesystem::path(race_dir(year, track_id));
  std::ifstream laps_file(dir / "laps.csv");
  std::ifstream pits_file(dir / "pit_stops.csv");
  if (!laps_file || !pits_file) return std::nullopt;

  auto laps = laps_from_csv_stream(laps_file, track_id);
  if (laps.wet_laps > 0) return std::nullopt;

  RaceRecord race;
  race.year = year;
  race.track_id = track_id;
  race.laps = std::move(laps.laps);
  race.pit_stops = pit_stops_from_csv_stream(pits_file);
  return race;
}

} // namespace pitwall
