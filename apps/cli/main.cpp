#include <pitwall/config.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/explanation.hpp>
#include <pitwall/optimizer.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/race_source.hpp>
#include <pitwall/sensitivity.hpp>
#include <pitwall/stint.hpp>
#include <pitwall/validation.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace pitwall;

namespace {

struct RaceRef {
  int year = 0;
  std::string track;
};

struct CliArgs {
  std::string command;
  std::string data_dir = "data/races";
  std::string models = "models.csv";
  std::string out_dir = "validation";
  std::string config;
  std::string pit_loss_csv;
  std::vector<RaceRef> races;
  std::string track;
  int lap = 0;
  int lap_in_stint = 1;
  int total_laps = 0;
  std::string compound;
  std::string new_compound = "MEDIUM";
  std::optional<int> window;
  std::optional<double> temp;
  bool vsc = false;
};

void usage() {
  std::cout <<
    "pitwall_cli fit      --data DIR --race YEAR:TRACK [--race ...] [--models FILE]\n"
    "pitwall_cli recommend --models FILE --track T --lap N --compound C --lap-in-stint K\n"
    "                      --total-laps N [--new-compound C] [--window W] [--temp X] [--vsc]\n"
    "pitwall_cli validate --data DIR --race YEAR:TRACK [--race ...] [--models FILE] [--out DIR]\n"
    "common: [--config FILE] [--pit-loss FILE]\n";
}

bool parse_int_arg(const std::string& s, int* out) {
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int>(v);
  return true;
}

bool parse_double_arg(const std::string& s, double* out) {
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

bool parse_race(const std::string& s, RaceRef* out) {
  const auto colon = s.find(':');
  if (colon == std::string::npos) return false;
  if (!parse_int_arg(s.substr(0, colon), &out->year)) return false;
  out->track = s.substr(colon + 1);
  return !out->track.empty();
}

bool parse_args(int argc, char** argv, CliArgs* args) {
  if (argc < 2) { usage(); return false; }
  args->command = argv[1];
  if (args->command == "--help" || args->command == "-h") { usage(); return false; }
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](const std::string& flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    const char* v = nullptr;
    if (a == "--vsc") { args->vsc = true; continue; }
    if (a == "--help" || a == "-h") { usage(); return false; }
    if (!(v = need(a))) return false;
    if (a == "--data") args->data_dir = v;
    else if (a == "--models") args->models = v;
    else if (a == "--out") args->out_dir = v;
    else if (a == "--config") args->config = v;
    else if (a == "--pit-loss") args->pit_loss_csv = v;
    else if (a == "--track") args->track = v;
    else if (a == "--compound") args->compound = v;
    else if (a == "--new-compound") args->new_compound = v;
    else if (a == "--race") {
      RaceRef r;
      if (!parse_race(v, &r)) { std::cerr << "Bad --race (want YEAR:TRACK): " << v << "\n"; return false; }
      args->races.push_back(r);
    }
    else if (a == "--lap") { if (!parse_int_arg(v, &args->lap)) return false; }
    else if (a == "--lap-in-stint") { if (!parse_int_arg(v, &args->lap_in_stint)) return false; }
    else if (a == "--total-laps") { if (!parse_int_arg(v, &args->total_laps)) return false; }
    else if (a == "--window") {
      int w = 0;
      if (!parse_int_arg(v, &w)) return false;
      args->window = w;
    }
    else if (a == "--temp") {
      double t = 0.0;
      if (!parse_double_arg(v, &t)) return false;
      args->temp = t;
    }
    else {
      std::cerr << "Unknown argument: " << a << "\n";
      return false;
    }
  }
  return true;
}

std::vector<RaceRecord> load_races(const CliArgs& args, const StrategyConfig& cfg) {
  CsvRaceSource source(args.data_dir);
  std::vector<RaceRecord> races;
  for (const auto& ref : args.races) {
    auto race = source.load(ref.year, ref.track);
    if (!race) {
      std::cerr << "warning: skipping " << ref.year << " " << ref.track
                << " (missing files under " << source.race_dir(ref.year, ref.track)
                << " or wet session)\n";
      continue;
    }
    race->laps = add_stint_features(race->laps, race->pit_stops, cfg.fuel);
    std::cerr << "loaded " << ref.year << " " << ref.track << ": " << race->laps.size()
              << " laps, " << race->pit_stops.size() << " stops\n";
    races.push_back(std::move(*race));
  }
  return races;
}

// Fits every (track, compound) seen; a key with too little data is skipped.
void fit_all(ModelStore& store, const std::vector<RaceRecord>& races, const StrategyConfig& cfg) {
  std::vector<LapRecord> all;
  std::set<std::pair<std::string, Compound>> keys;
  for (const auto& r : races) {
    all.insert(all.end(), r.laps.begin(), r.laps.end());
    for (const auto& l : r.laps) keys.emplace(r.track_id, l.compound);
  }
  for (const auto& [track, compound] : keys) {
    try {
      const auto& m = store.fit(all, track, compound, cfg.min_samples);
      std::cerr << "fitted " << track << "/" << to_string(compound) << ": "
                << m.sample_count << " laps, " << std::fixed << std::setprecision(3)
                << m.lap_coef << " s/lap" << std::defaultfloat << "\n";
    } catch (const InsufficientDataError& e) {
      std::cerr << "warning: " << e.what() << "\n";
    }
  }
}

int cmd_fit(const CliArgs& args, const StrategyConfig& cfg) {
  const auto races = load_races(args, cfg);
  if (races.empty()) { std::cerr << "error: no races loaded\n"; return 1; }
  ModelStore store;
  fit_all(store, races, cfg);
  if (store.empty()) { std::cerr << "error: no model could be fitted\n"; return 1; }
  if (!save_model_store(store, args.models)) {
    std::cerr << "error: cannot write " << args.models << "\n";
    return 1;
  }
  std::cout << "saved " << store.size() << " models to " << args.models << "\n";
  return 0;
}

int cmd_recommend(const CliArgs& args, const StrategyConfig& cfg, const PitLossTable& table) {
  const auto store = load_model_store(args.models);
  if (!store) { std::cerr << "error: cannot read " << args.models << "\n"; return 1; }
  const auto current = compound_from_string(args.compound);
  const auto next = compound_from_string(args.new_compound);
  if (!current || !next) { std::cerr << "error: compounds must be SOFT, MEDIUM or HARD\n"; return 1; }

  RaceState state;
  state.current_lap = args.lap;
  state.current_compound = *current;
  state.lap_in_stint = args.lap_in_stint;
  state.total_race_laps = args.total_laps;
  state.track_id = args.track;
  state.new_compound = *next;
  state.window_laps = args.window.value_or(cfg.window_laps);
  state.fuel = cfg.fuel;
  state.track_temp = args.temp;
  state.pit_condition = args.vsc ? PitCondition::Vsc : PitCondition::Green;

  const auto b = recommendation_bundle(state, *store, table, cfg.pit_window_within_s,
                                       cfg.pit_loss_sensitivity_s,
                                       cfg.degradation_sensitivity_s_per_lap);

  std::cout << "Track: " << args.track << "  |  At lap: " << state.current_lap << "/"
            << state.total_race_laps << "\n";
  std::cout << "Current compound: " << to_string(state.current_compound)
            << "  |  Lap in stint: " << state.lap_in_stint
            << "  |  New compound: " << to_string(state.new_compound) << "\n\n";
  if (b.recommended_lap) std::cout << "Recommendation: Pit on lap " << *b.recommended_lap << ".\n";
  else                   std::cout << "Recommendation: Stay out (no pit).\n";
  if (b.pit_window) {
    std::cout << "Pit window (within " << cfg.pit_window_within_s << " s): laps "
              << b.pit_window->first << "-" << b.pit_window->second << "\n";
  }
  if (b.result.temperature_substituted) {
    std::cout << "Note: no track temperature given; the training mean was used.\n";
  }
  std::cout << "\nExplanation:\n" << b.explanation.summary << "\n";
  std::cout << "\nSensitivity (pit loss): " << b.pit_loss.message << "\n";
  std::cout << "Sensitivity (degradation): " << b.degradation.message << "\n";
  std::cout << "If VSC: " << b.vsc.message << "\n";
  return 0;
}

int cmd_validate(const CliArgs& args, const StrategyConfig& cfg, const PitLossTable& table) {
  const auto races = load_races(args, cfg);
  ModelStore store;
  if (auto loaded = load_model_store(args.models)) {
    store = std::move(*loaded);
  } else {
    std::cerr << "no model snapshot at " << args.models << "; fitting from the loaded races\n";
    fit_all(store, races, cfg);
  }

  const auto report = run_validation(races, store, table, cfg.validation_options());
  if (!save_validation_results(report, args.out_dir)) {
    std::cerr << "error: cannot write results under " << args.out_dir << "\n";
    return 1;
  }
  write_validation_summary(report.summary, std::cout);
  std::cout << "details: " << args.out_dir << "/" << kValidationDetailsFile << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!parse_args(argc, argv, &args)) return 2;

  StrategyConfig cfg;
  if (!args.config.empty()) {
    auto loaded = load_strategy_config(args.config);
    if (!loaded) { std::cerr << "error: cannot read config " << args.config << "\n"; return 1; }
    cfg = *loaded;
  }

  std::vector<TrackPitLoss> entries = pit_loss_catalog();
  if (!args.pit_loss_csv.empty()) {
    auto extra = load_pit_loss_catalog_csv(args.pit_loss_csv);
    if (!extra) { std::cerr << "error: cannot read " << args.pit_loss_csv << "\n"; return 1; }
    entries.insert(entries.end(), extra->begin(), extra->end());
  }
  const PitLossTable table(entries, cfg.default_pit_loss_s, cfg.vsc_factor);

  try {
    if (args.command == "fit")       return cmd_fit(args, cfg);
    if (args.command == "recommend") return cmd_recommend(args, cfg, table);
    if (args.command == "validate")  return cmd_validate(args, cfg, table);
  } catch (const ModelNotFittedError& e) {
    std::cerr << "error: " << e.what() << " (run 'pitwall_cli fit' first)\n";
    return 1;
  } catch (const Error& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  std::cerr << "Unknown command: " << args.command << "\n";
  usage();
  return 2;
}
