#pragma once
#include <compare>
#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/lap.hpp>

namespace pitwall {

inline constexpr std::size_t kDefaultMinSamples = 5;

// Track ids are normalised (trimmed, lower-cased) on the way in.
struct DegradationKey {
  std::string track_id;
  Compound compound = Compound::Medium;

  static DegradationKey make(const std::string& track_id, Compound compound);
  auto operator<=>(const DegradationKey&) const = default;
};

// Linear lap-time model:
//   t = intercept + lap_coef * lap_in_stint + fuel_coef * fuel_kg [+ temp_coef * temp]
struct FittedDegradationModel {
  double intercept = 0.0;
  double lap_coef = 0.0;                // s per lap-in-stint: the degradation rate
  double fuel_coef = 0.0;               // s per kg
  std::optional<double> temp_coef;      // present only when fitted with temperature
  double temp_mean = 0.0;               // training mean, substituted when temp is absent
  std::size_t sample_count = 0;
  bool usable = false;

  bool has_temperature() const { return temp_coef.has_value(); }
};

struct LapTimePrediction {
  double seconds = 0.0;
  bool temperature_substituted = false; // model needed temp, training mean used
  bool temperature_ignored = false;     // temp supplied, model has no temp term
};

// Pure fit; does not touch any store. Throws InsufficientDataError.
FittedDegradationModel fit_degradation_model(const std::vector<LapRecord>& laps,
                                             const std::string& track_id,
                                             Compound compound,
                                             std::size_t min_samples = kDefaultMinSamples);

// Explicit, passable owner of every fitted model; at most one per key.
class ModelStore {
public:
  ModelStore() = default;

  // Fits and commits under (track_id, compound), replacing any prior model.
  // On failure the store is unchanged.
  const FittedDegradationModel& fit(const std::vector<LapRecord>& laps,
                                    const std::string& track_id,
                                    Compound compound,
                                    std::size_t min_samples = kDefaultMinSamples);

  // Throws ModelNotFittedError when the key is absent or unusable.
  double predict(const std::string& track_id, Compound compound, double lap_in_stint,
                 double fuel_kg, std::optional<double> track_temp = std::nullopt) const;
  LapTimePrediction predict_detailed(const std::string& track_id, Compound compound,
                                     double lap_in_stint, double fuel_kg,
                                     std::optional<double> track_temp = std::nullopt) const;
  double degradation_rate(const std::string& track_id, Compound compound) const;

  // Lookup helpers
  const FittedDegradationModel* find(const std::string& track_id, Compound compound) const;
  const FittedDegradationModel& at(const std::string& track_id, Compound compound) const;
  bool contains(const std::string& track_id, Compound compound) const;

  void insert(const DegradationKey& key, const FittedDegradationModel& model);
  bool erase(const std::string& track_id, Compound compound);
  void reset() { models_.clear(); }

  std::size_t size() const { return models_.size(); }
  bool empty() const { return models_.empty(); }
  std::vector<DegradationKey> keys() const;
  const std::map<DegradationKey, FittedDegradationModel>& models() const { return models_; }

private:
  std::map<DegradationKey, FittedDegradationModel> models_;
};

// Snapshot CSV. Doubles are written as hex floats so a restore reproduces
// predictions bit for bit. Invalid rows are skipped on load.
void write_model_store(const ModelStore& store, std::ostream& out);
ModelStore model_store_from_csv_stream(std::istream& in);

bool save_model_store(const ModelStore& store, const std::string& path);
std::optional<ModelStore> load_model_store(const std::string& path);

} // namespace pitwall
