#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/viewer/app.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace pitwall;

// pitwall_viewer MODELS TRACK TOTAL_LAPS [CURRENT_COMPOUND]
int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "usage: pitwall_viewer MODELS TRACK TOTAL_LAPS [CURRENT_COMPOUND]\n";
    return 2;
  }
  const auto store = load_model_store(argv[1]);
  if (!store) {
    std::cerr << "error: cannot read " << argv[1] << "\n";
    return 1;
  }
  const PitLossTable table;

  RaceState state;
  state.track_id = argv[2];
  state.total_race_laps = std::atoi(argv[3]);
  state.current_lap = 1;
  state.current_compound = Compound::Soft;
  if (argc > 4) {
    if (auto c = compound_from_string(argv[4])) state.current_compound = *c;
  }
  if (state.total_race_laps < 1) {
    std::cerr << "error: TOTAL_LAPS must be >= 1\n";
    return 2;
  }

  ViewerApp app(*store, table, state);
  return app.run();
}
