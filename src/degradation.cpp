#include <pitwall/degradation.hpp>
#include <pitwall/csv.hpp>
#include <pitwall/errors.hpp>
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <fstream>

namespace pitwall {

namespace {

constexpr Eigen::Index kMaxFeatures = 3;    // lap_in_stint, fuel, temperature
constexpr double kCollinearTol = 1e-7;      // R diagonal ratio below which a column is dependent

// Feature columns kept in order: a column that adds no rank to the ones already
// accepted is dropped. X is centered; raw_norm holds the uncentered column norms,
// so a column whose spread is rounding noise counts as constant.
std::vector<Eigen::Index> independent_features(const Eigen::MatrixXd& X,
                                               const Eigen::RowVectorXd& raw_norm) {
  std::vector<Eigen::Index> accepted;
  for (Eigen::Index j = 0; j < X.cols(); ++j) {
    if (!(X.col(j).norm() > kCollinearTol * raw_norm(j))) continue;
    std::vector<Eigen::Index> trial = accepted;
    trial.push_back(j);
    Eigen::MatrixXd sub(X.rows(), static_cast<Eigen::Index>(trial.size()));
    for (std::size_t c = 0; c < trial.size(); ++c) {
      sub.col(static_cast<Eigen::Index>(c)) = X.col(trial[c]).normalized();
    }
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(sub);
    qr.setThreshold(kCollinearTol);
    if (qr.rank() == sub.cols()) accepted.push_back(j);
  }
  return accepted;
}

} // namespace

DegradationKey DegradationKey::make(const std::string& track_id, Compound compound) {
  return DegradationKey{lower(trim(track_id)), compound};
}

FittedDegradationModel fit_degradation_model(const std::vector<LapRecord>& laps,
                                             const std::string& track_id,
                                             Compound compound,
                                             std::size_t min_samples) {
  const std::string track = lower(trim(track_id));
  std::vector<const LapRecord*> rows;
  for (const auto& lap : laps) {
    if (lap.compound != compound) continue;
    if (lower(trim(lap.track_id)) != track) continue;
    if (lap.lap_in_stint < 1) continue;
    if (!std::isfinite(lap.lap_time_s) || lap.lap_time_s <= 0.0) continue;
    if (!std::isfinite(lap.fuel_kg)) continue;
    rows.push_back(&lap);
  }
  if (rows.size() < min_samples || rows.empty()) {
    throw InsufficientDataError(track_id, compound, rows.size(), min_samples);
  }

  const bool with_temp = std::all_of(rows.begin(), rows.end(), [](const LapRecord* r){
    return r->track_temp.has_value() && std::isfinite(*r->track_temp);
  });
  const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
  const Eigen::Index k = with_temp ? kMaxFeatures : 2;
  Eigen::MatrixXd X(n, k);
  Eigen::VectorXd y(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    const LapRecord* r = rows[static_cast<std::size_t>(i)];
    X(i, 0) = static_cast<double>(r->lap_in_stint);
    X(i, 1) = r->fuel_kg;
    if (with_temp) X(i, 2) = *r->track_temp;
    y(i) = r->lap_time_s;
  }

  const Eigen::RowVectorXd raw_norm = X.colwise().norm();
  const Eigen::RowVectorXd mean = X.colwise().mean();
  const double y_mean = y.mean();
  X.rowwise() -= mean;
  y.array() -= y_mean;

  const auto used = independent_features(X, raw_norm);
  if (used.empty() || used.front() != 0) {
    throw InsufficientDataError(track_id, compound, "lap_in_stint has no spread");
  }

  Eigen::MatrixXd A(n, static_cast<Eigen::Index>(used.size()));
  for (std::size_t c = 0; c < used.size(); ++c) A.col(static_cast<Eigen::Index>(c)) = X.col(used[c]);
  const Eigen::VectorXd beta_used = A.colPivHouseholderQr().solve(y);

  Eigen::Vector3d beta = Eigen::Vector3d::Zero();
  bool temp_used = false;
  for (std::size_t c = 0; c < used.size(); ++c) {
    beta(used[c]) = beta_used(static_cast<Eigen::Index>(c));
    if (used[c] == 2) temp_used = true;
  }

  FittedDegradationModel m;
  m.lap_coef = beta(0);
  m.fuel_coef = beta(1);
  m.intercept = y_mean - beta(0) * mean(0) - beta(1) * mean(1);
  if (temp_used) {
    m.temp_coef = beta(2);
    m.temp_mean = mean(2);
    m.intercept -= beta(2) * mean(2);
  }
  m.sample_count = rows.size();
  m.usable = true;
  return m;
}

// ---- ModelStore ----

const FittedDegradationModel& ModelStore::fit(const std::vector<LapRecord>& laps,
                                              const std::string& track_id,
                                              Compound compound,
                                              std::size_t min_samples) {
  FittedDegradationModel m = fit_degradation_model(laps, track_id, compound, min_samples);
  auto key = DegradationKey::make(track_id, compound);
  auto& slot = models_[key];
  slot = m;
  return slot;
}

const FittedDegradationModel* ModelStore::find(const std::string& track_id, Compound compound) const {
  auto it = models_.find(DegradationKey::make(track_id, compound));
  if (it == models_.end() || !it->second.usable) return nullptr;
  return &it->second;
}

const FittedDegradationModel& ModelStore::at(const std::string& track_id, Compound compound) const {
  const auto* m = find(track_id, compound);
  if (!m) throw ModelNotFittedError(track_id, compound);
  return *m;
}

bool ModelStore::contains(const std::string& track_id, Compound compound) const {
  return find(track_id, compound) != nullptr;
}

LapTimePrediction ModelStore::predict_detailed(const std::string& track_id, Compound compound,
                                               double lap_in_stint, double fuel_kg,
                                               std::optional<double> track_temp) const {
  const auto& m = at(track_id, compound);
  LapTimePrediction p;
  p.seconds = m.intercept + m.lap_coef * lap_in_stint + m.fuel_coef * fuel_kg;
  if (m.has_temperature()) {
    if (track_temp.has_value()) {
      p.seconds += *m.temp_coef * *track_temp;
    } else {
      p.seconds += *m.temp_coef * m.temp_mean;
      p.temperature_substituted = true;
    }
  } else if (track_temp.has_value()) {
    p.temperature_ignored = true;
  }
  return p;
}

double ModelStore::predict(const std::string& track_id, Compound compound, double lap_in_stint,
                           double fuel_kg, std::optional<double> track_temp) const {
  return predict_detailed(track_id, compound, lap_in_stint, fuel_kg, track_temp).seconds;
}

double ModelStore::degradation_rate(const std::string& track_id, Compound compound) const {
  return at(track_id, compound).lap_coef;
}

void ModelStore::insert(const DegradationKey& key, const FittedDegradationModel& model) {
  models_[DegradationKey::make(key.track_id, key.compound)] = model;
}

bool ModelStore::erase(const std::string& track_id, Compound compound) {
  return models_.erase(DegradationKey::make(track_id, compound)) > 0;
}

std::vector<DegradationKey> ModelStore::keys() const {
  std::vector<DegradationKey> out;
  out.reserve(models_.size());
  for (const auto& [k, m] : models_) out.push_back(k);
  return out;
}

// ---- Snapshot ----

static constexpr const char* kSnapshotHeader =
  "track_id,compound,intercept,lap_in_stint_coef,fuel_coef,has_temp,temp_coef,temp_mean,sample_count,usable";

void write_model_store(const ModelStore& store, std::ostream& out) {
  out << kSnapshotHeader << "\n";
  for (const auto& [key, m] : store.models()) {
    out << csv_field(key.track_id) << ","
        << to_string(key.compound) << ","
        << format_hexfloat(m.intercept) << ","
        << format_hexfloat(m.lap_coef) << ","
        << format_hexfloat(m.fuel_coef) << ","
        << (m.has_temperature() ? 1 : 0) << ","
        << format_hexfloat(m.temp_coef.value_or(0.0)) << ","
        << format_hexfloat(m.temp_mean) << ","
        << m.sample_count << ","
        << (m.usable ? 1 : 0) << "\n";
  }
}

static std::optional<std::pair<DegradationKey, FittedDegradationModel>>
parse_snapshot_row(const std::vector<std::string>& cols) {
  if (cols.size() < 10) return std::nullopt;
  if (cols[0].empty()) return std::nullopt;
  const auto compound = compound_from_string(cols[1]);
  const auto intercept = parse_double(cols[2]);
  const auto lap = parse_double(cols[3]);
  const auto fuel = parse_double(cols[4]);
  const auto has_temp = parse_int(cols[5]);
  const auto temp = parse_double(cols[6]);
  const auto temp_mean = parse_double(cols[7]);
  const auto count = parse_int(cols[8]);
  const auto usable = parse_int(cols[9]);
  if (!(compound && intercept && lap && fuel && has_temp && temp && temp_mean && count && usable)) {
    return std::nullopt;
  }
  if (*count < 0) return std::nullopt;

  FittedDegradationModel m;
  m.intercept = *intercept;
  m.lap_coef = *lap;
  m.fuel_coef = *fuel;
  if (*has_temp != 0) m.temp_coef = *temp;
  m.temp_mean = *temp_mean;
  m.sample_count = static_cast<std::size_t>(*count);
  m.usable = *usable != 0;
  return std::make_pair(DegradationKey::make(cols[0], *compound), m);
}

ModelStore model_store_from_csv_stream(std::istream& in) {
  ModelStore store;
  std::vector<std::string> cols;
  while (next_csv_record(in, cols)) {
    if (!cols.empty() && cols[0] == "track_id") continue; // header
    if (auto row = parse_snapshot_row(cols); row.has_value()) {
      store.insert(row->first, row->second);
    }
  }
  return store;
}

bool save_model_store(const ModelStore& store, const std::string& path) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  write_model_store(store, f);
  return static_cast<bool>(f);
}

std::optional<ModelStore> load_model_store(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return model_store_from_csv_stream(f);
}

} // namespace pitwall
