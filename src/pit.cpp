#include <pitwall/pit.hpp>
#include <pitwall/csv.hpp>
#include <algorithm>
#include <fstream>

namespace pitwall {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static std::vector<TrackPitLoss> make_catalog_builtin() {
  return {
    {"Bahrain",     21.5}, {"Jeddah",        22.5}, {"Melbourne",   22.0},
    {"Suzuka",      22.5}, {"Shanghai",      22.0}, {"Miami",       22.0},
    {"Imola",       21.5}, {"Monaco",        19.0}, {"Montreal",    22.0},
    {"Barcelona",   21.5}, {"Red Bull Ring", 21.0}, {"Silverstone", 22.0},
    {"Hungaroring", 21.0}, {"Spa",           22.0}, {"Zandvoort",   21.5},
    {"Monza",       22.5}, {"Baku",          21.5}, {"Singapore",   24.0},
    {"Marina Bay",  24.0}, {"Americas",      22.0}, {"Mexico",      22.0},
    {"Brazil",      22.0}, {"Las Vegas",     22.5}, {"Losail",      22.0},
    {"Qatar",       22.0}, {"Abu Dhabi",     22.0}, {"Portimao",    21.5},
    {"Istanbul",    22.0},
  };
}

const std::vector<TrackPitLoss>& pit_loss_catalog() {
  static const std::vector<TrackPitLoss> cat = make_catalog_builtin();
  return cat;
}

static std::string normalise(const std::string& key) {
  return lower(trim(key));
}

static std::optional<TrackPitLoss> parse_pit_loss_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  if (cols[0].empty()) return std::nullopt;
  const auto loss = parse_double(cols[1]);
  if (!loss || !(*loss > 0.0)) return std::nullopt;
  return TrackPitLoss{cols[0], *loss};
}

std::vector<TrackPitLoss> pit_loss_catalog_from_csv_stream(std::istream& in) {
  std::vector<TrackPitLoss> out;
  std::vector<std::string> cols;
  bool header_consumed = false;
  while (next_csv_record(in, cols)) {
    if (!header_consumed && (cols[0] == "key" || cols[0] == "Key")) {
      header_consumed = true;
      continue;
    }
    if (auto row = parse_pit_loss_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<TrackPitLoss>> load_pit_loss_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return pit_loss_catalog_from_csv_stream(f);
}

// ---- PitLossTable ----

PitLossTable::PitLossTable() : PitLossTable(pit_loss_catalog()) {}

PitLossTable::PitLossTable(const std::vector<TrackPitLoss>& entries,
                           double default_s, double vsc_factor)
  : default_s_(default_s > 0.0 ? default_s : kDefaultPitLossSeconds),
    vsc_factor_(clamp01(vsc_factor)) {
  for (const auto& e : entries) {
    if (e.pit_loss_s > 0.0) losses_[normalise(e.key)] = e.pit_loss_s;
  }
}

std::optional<double> PitLossTable::lookup(const std::string& track_id) const {
  auto it = losses_.find(normalise(track_id));
  if (it == losses_.end()) return std::nullopt;
  return it->second;
}

double PitLossTable::get_pit_loss(const std::string& track_id, PitCondition condition) const {
  const double base = lookup(track_id).value_or(default_s_);
  return condition == PitCondition::Vsc ? base * vsc_factor_ : base;
}

PitLossTable PitLossTable::with_override(const std::string& track_id, double seconds) const {
  PitLossTable copy = *this;
  copy.losses_[normalise(track_id)] = std::max(0.0, seconds);
  return copy;
}

} // namespace pitwall
