#pragma once
#include <optional>
#include <string>
#include <pitwall/degradation.hpp>
#include <pitwall/optimizer.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/sensitivity.hpp>

namespace pitwall {

// RAII application that renders degradation curves, candidate totals and the
// explanation for an editable race state.
class ViewerApp {
public:
  ViewerApp(const ModelStore& store, const PitLossTable& pit_table, RaceState initial);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void recompute_();
  // Rendering
  void render_frame_();
  void draw_curves_(int x0, int y0, int w, int h);
  void draw_candidates_(int x0, int y0, int w, int h);
  void draw_explanation_(int x0, int y0);
  void draw_hud_();

  // Dependencies
  const ModelStore& store_;
  const PitLossTable& pit_table_;

  // Editable decision point and its latest evaluation
  RaceState state_;
  std::optional<RecommendationBundle> bundle_;
  std::string error_;
  bool dirty_{true};

  // UI state
  int curve_laps_{40};
};

} // namespace pitwall
