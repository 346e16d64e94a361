#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/stint.hpp>

namespace pitwall {

inline constexpr int kDefaultWindowLaps = 10;
inline constexpr double kDefaultPitWindowWithinSeconds = 2.0;

struct PitAt { int lap = 0; };
struct StayOut {};
using PitChoice = std::variant<PitAt, StayOut>;

struct Candidate {
  PitChoice choice;
  Compound compound_after = Compound::Medium;
  double total_time_s = 0.0;      // projected, current_lap .. end of race
  int rank = 0;                   // 1 = best
  double delta_to_best_s = 0.0;

  bool stays_out() const { return std::holds_alternative<StayOut>(choice); }
  std::optional<int> pit_lap() const;
};

// Decision point plus model inputs for one optimization.
struct RaceState {
  int current_lap = 1;            // lap about to start, 1-based
  Compound current_compound = Compound::Medium;
  int lap_in_stint = 1;           // of current_lap on the current set
  int total_race_laps = 0;
  std::string track_id;
  Compound new_compound = Compound::Hard;
  int window_laps = kDefaultWindowLaps;
  FuelParams fuel{};
  std::optional<double> track_temp;
  PitCondition pit_condition = PitCondition::Green;
};

struct OptimizationResult {
  RaceState state;
  double pit_loss_s = 0.0;
  bool temperature_substituted = false;
  std::vector<Candidate> candidates;   // ascending by total time; candidates[0].rank == 1

  const Candidate* best() const { return candidates.empty() ? nullptr : &candidates.front(); }
  const Candidate* find_pit_lap(int lap) const;
  const Candidate* stay_out() const;
};

// Throws InvalidRaceStateError before any simulation, ModelNotFittedError
// from any missing (track, compound). Pure otherwise.
OptimizationResult optimize_pit_window(const RaceState& state,
                                       const ModelStore& store,
                                       const PitLossTable& pit_table);

// Last pit lap the window reaches, clipped at the flag without overflow.
int last_candidate_lap(const RaceState& state);

// Rank-1 pit lap; nullopt when staying out wins (or the result is empty).
std::optional<int> recommended_pit_lap(const OptimizationResult& result);

// Min/max pit lap among pit candidates within within_s of the best;
// nullopt when the best is staying out or nothing qualifies.
std::optional<std::pair<int, int>> pit_window_range(const OptimizationResult& result,
                                                    double within_s = kDefaultPitWindowWithinSeconds);

// Sum of predictions for race laps first..last on one set, lap_in_stint counting
// up from stint_lap_start. Fuel follows the race-lap schedule.
double project_stint_time(const ModelStore& store, const std::string& track_id,
                          Compound compound, int first_lap, int last_lap,
                          int stint_lap_start, const FuelParams& fuel,
                          std::optional<double> track_temp,
                          bool* temperature_substituted = nullptr);

} // namespace pitwall
