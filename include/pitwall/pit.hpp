#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pitwall {

inline constexpr double kDefaultPitLossSeconds = 22.0;
inline constexpr double kVscPitLossFactor = 0.5;   // illustrative what-if, not a prediction

enum class PitCondition : int {
  Green = 0,
  Vsc = 1,   // virtual safety car in effect: cheaper stop
};

struct TrackPitLoss {
  std::string key;      // e.g., "Bahrain"
  double pit_loss_s;    // entry + stop + exit, relative to staying on track
};

// Built-in tiny catalog (default/fallback).
const std::vector<TrackPitLoss>& pit_loss_catalog();

// Stream-based CSV loader: "key,pit_loss_s". Optional header, '#' comments,
// blank lines and invalid rows (non-numeric or non-positive loss) skipped.
std::vector<TrackPitLoss> pit_loss_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<TrackPitLoss>> load_pit_loss_catalog_csv(const std::string& path);

// Track-keyed pit cost. Lookups are case-insensitive and never fail.
class PitLossTable {
public:
  // Built-in catalog, 22 s default, 0.5 VSC factor.
  PitLossTable();
  explicit PitLossTable(const std::vector<TrackPitLoss>& entries,
                        double default_s = kDefaultPitLossSeconds,
                        double vsc_factor = kVscPitLossFactor);

  double get_pit_loss(const std::string& track_id,
                      PitCondition condition = PitCondition::Green) const;

  // Entry for this track only, without the default fallback.
  std::optional<double> lookup(const std::string& track_id) const;

  // Copy with one track overridden (sensitivity runs, tests).
  PitLossTable with_override(const std::string& track_id, double seconds) const;

  double default_pit_loss() const { return default_s_; }
  double vsc_factor() const { return vsc_factor_; }
  std::size_t size() const { return losses_.size(); }

private:
  std::map<std::string, double> losses_;   // normalised key -> seconds
  double default_s_ = kDefaultPitLossSeconds;
  double vsc_factor_ = kVscPitLossFactor;
};

} // namespace pitwall
