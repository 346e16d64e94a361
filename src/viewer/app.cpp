#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <pitwall/viewer/app.hpp>
#include <pitwall/diagnostics.hpp>
#include <pitwall/errors.hpp>

namespace pitwall {

namespace {

static Color colorFor(Compound c) {
  switch (c) {
    case Compound::Soft:   return Color{231, 76, 60, 255};
    case Compound::Medium: return Color{241, 196, 15, 255};
    case Compound::Hard:   return Color{236, 240, 241, 255};
  }
  return Color{127, 140, 141, 255};
}

static Compound nextCompound(Compound c) {
  return static_cast<Compound>((static_cast<int>(c) + 1) % 3);
}

static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

// --- layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y  = 20;  // size 20
static constexpr int kHUD_LINE2_Y  = 46;  // size 18
static constexpr int kHUD_LINE3_Y  = 72;  // size 14
static constexpr int kPANEL_TOP_Y  = 110;

static void panel(int x, int y, int w, int h) {
  DrawRectangle(x - 6, y - 6, w + 12, h + 12, Color{0,0,0,80});
  DrawRectangle(x, y, w, h, Color{24,24,28,220});
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const ModelStore& store, const PitLossTable& pit_table, RaceState initial)
  : store_(store), pit_table_(pit_table), state_(std::move(initial)) {}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "Pitwall - Strategy Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    if (dirty_) recompute_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  const RaceState before = state_;
  const int total = std::max(1, state_.total_race_laps);

  // Decision lap; lap_in_stint moves with it
  if (IsKeyPressed(KEY_RIGHT) && state_.current_lap < total) { ++state_.current_lap; ++state_.lap_in_stint; }
  if (IsKeyPressed(KEY_LEFT) && state_.current_lap > 1) {
    --state_.current_lap;
    state_.lap_in_stint = std::max(1, state_.lap_in_stint - 1);
  }
  if (IsKeyPressed(KEY_UP))   ++state_.lap_in_stint;
  if (IsKeyPressed(KEY_DOWN)) state_.lap_in_stint = std::max(1, state_.lap_in_stint - 1);

  if (IsKeyPressed(KEY_C)) state_.current_compound = nextCompound(state_.current_compound);
  if (IsKeyPressed(KEY_N)) state_.new_compound = nextCompound(state_.new_compound);
  if (IsKeyPressed(KEY_V)) {
    state_.pit_condition = state_.pit_condition == PitCondition::Green ? PitCondition::Vsc
                                                                       : PitCondition::Green;
  }
  if (IsKeyPressed(KEY_LEFT_BRACKET))  state_.window_laps = std::max(0, state_.window_laps - 1);
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) state_.window_laps = std::min(state_.total_race_laps, state_.window_laps + 1);

  // Curve span only
  if (IsKeyPressed(KEY_W)) curve_laps_ = std::min(80, curve_laps_ + 5);
  if (IsKeyPressed(KEY_S)) curve_laps_ = std::max(10, curve_laps_ - 5);

  if (state_.current_lap != before.current_lap || state_.lap_in_stint != before.lap_in_stint ||
      state_.current_compound != before.current_compound ||
      state_.new_compound != before.new_compound ||
      state_.pit_condition != before.pit_condition || state_.window_laps != before.window_laps) {
    dirty_ = true;
  }
}

void ViewerApp::recompute_() {
  dirty_ = false;
  try {
    bundle_ = recommendation_bundle(state_, store_, pit_table_);
    error_.clear();
  } catch (const Error& e) {
    bundle_.reset();
    error_ = e.what();
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 20, 26, 255});

  const int W = GetScreenWidth();
  const int H = GetScreenHeight();
  const int half = (W - 60) / 2;

  draw_curves_(20, kPANEL_TOP_Y, half, 300);
  draw_candidates_(40 + half, kPANEL_TOP_Y, half, 300);
  draw_explanation_(20, kPANEL_TOP_Y + 330);
  draw_hud_();

  if (!error_.empty()) {
    DrawText(error_.c_str(), 20, H - 30, 18, Color{235,90,90,255});
  }
  EndDrawing();
}

void ViewerApp::draw_curves_(int x0, int y0, int w, int h) {
  panel(x0, y0, w, h);
  DrawText("Lap time vs lap in stint", x0 + 8, y0 + 6, 16, Color{220,220,230,255});

  const double fuel = fuel_at_lap(state_.fuel, state_.current_lap);
  std::vector<std::pair<Compound, std::vector<CurvePoint>>> curves;
  double lo = 1e18, hi = -1e18;
  for (Compound c : {Compound::Soft, Compound::Medium, Compound::Hard}) {
    if (!store_.find(state_.track_id, c)) continue;
    auto pts = degradation_curve(store_, state_.track_id, c, fuel, state_.track_temp, 1, curve_laps_);
    for (const auto& p : pts) { lo = std::min(lo, p.lap_time_s); hi = std::max(hi, p.lap_time_s); }
    curves.emplace_back(c, std::move(pts));
  }
  if (curves.empty()) {
    DrawText("no fitted model for this track", x0 + 8, y0 + 40, 16, Color{200,200,210,255});
    return;
  }
  if (hi - lo < 1e-6) { lo -= 0.5; hi += 0.5; }

  const int pad = 30;
  const float pw = float(w - 2 * pad), ph = float(h - 2 * pad);
  auto toScreen = [&](int lap, double t) -> Vector2 {
    const float fx = float(lap - 1) / float(std::max(1, curve_laps_ - 1));
    const float fy = float((t - lo) / (hi - lo));
    return { x0 + pad + fx * pw, y0 + pad + (1.0f - fy) * ph };
  };

  for (const auto& [compound, pts] : curves) {
    for (std::size_t i = 1; i < pts.size(); ++i) {
      DrawLineEx(toScreen(pts[i-1].lap_in_stint, pts[i-1].lap_time_s),
                 toScreen(pts[i].lap_in_stint, pts[i].lap_time_s), 2.0f, colorFor(compound));
    }
  }
  // Current position on the current set
  if (state_.lap_in_stint <= curve_laps_) {
    for (const auto& [compound, pts] : curves) {
      if (compound != state_.current_compound) continue;
      const auto& p = pts[std::size_t(state_.lap_in_stint - 1)];
      DrawCircleV(toScreen(p.lap_in_stint, p.lap_time_s), 5.0f, colorFor(compound));
    }
  }

  char lo_s[32], hi_s[32];
  fmt_time(lo, lo_s, sizeof(lo_s));
  fmt_time(hi, hi_s, sizeof(hi_s));
  DrawText(hi_s, x0 + 4, y0 + pad - 8, 12, Color{160,160,170,255});
  DrawText(lo_s, x0 + 4, y0 + h - pad - 4, 12, Color{160,160,170,255});
  DrawText(TextFormat("1 .. %d", curve_laps_), x0 + w - 70, y0 + h - 18, 12, Color{160,160,170,255});
}

void ViewerApp::draw_candidates_(int x0, int y0, int w, int h) {
  panel(x0, y0, w, h);
  DrawText("Race time to flag (delta to best)", x0 + 8, y0 + 6, 16, Color{220,220,230,255});
  if (!bundle_) return;

  // Drawn in lap order, StayOut last
  std::vector<Candidate> cs = bundle_->result.candidates;
  const int n = state_.total_race_laps;
  std::sort(cs.begin(), cs.end(), [n](const Candidate& a, const Candidate& b){
    return a.pit_lap().value_or(n + 1) < b.pit_lap().value_or(n + 1);
  });
  double worst = 0.0;
  for (const auto& c : cs) worst = std::max(worst, c.delta_to_best_s);
  if (worst < 1e-6) worst = 1.0;

  const int row_h = std::max(12, std::min(22, (h - 40) / std::max<int>(1, int(cs.size()))));
  const int bar_x = x0 + 90;
  const int bar_w = w - 180;
  int y = y0 + 30;
  for (const auto& c : cs) {
    const bool best = c.rank == 1;
    const Color col = best ? Color{80,220,120,255}
                    : c.stays_out() ? colorFor(state_.current_compound)
                                    : Color{110,130,170,255};
    const char* label = c.stays_out() ? "stay out" : TextFormat("lap %d", *c.pit_lap());
    DrawText(label, x0 + 8, y, row_h - 4, Color{200,200,210,255});
    const int len = std::max(2, int(bar_w * (c.delta_to_best_s / worst)));
    DrawRectangle(bar_x, y + 2, len, row_h - 6, col);
    DrawText(TextFormat("+%.2f", c.delta_to_best_s), bar_x + bar_w + 8, y, row_h - 4, col);
    y += row_h;
    if (y > y0 + h - row_h) break;
  }
}

void ViewerApp::draw_explanation_(int x0, int y0) {
  const int w = GetScreenWidth() - 40;
  panel(x0, y0, w, 300);
  if (!bundle_) return;

  const Color txt = Color{220,220,230,255};
  int y = y0 + 8;
  std::string line;
  for (char ch : bundle_->explanation.summary + "\n") {
    if (ch != '\n') { line += ch; continue; }
    DrawText(line.c_str(), x0 + 8, y, 16, txt);
    y += 22;
    line.clear();
  }
  y += 10;
  const Color dim = Color{180,190,200,255};
  DrawText(("Pit loss +/-: " + bundle_->pit_loss.message).c_str(), x0 + 8, y, 14, dim); y += 20;
  DrawText(("Degradation +/-: " + bundle_->degradation.message).c_str(), x0 + 8, y, 14, dim); y += 20;
  DrawText(("VSC: " + bundle_->vsc.message).c_str(), x0 + 8, y, 14, dim); y += 20;
  if (bundle_->result.temperature_substituted) {
    DrawText("No track temperature: training mean used", x0 + 8, y, 14, Color{241,196,15,255});
  }
}

void ViewerApp::draw_hud_() {
  char rec[96];
  if (!bundle_) std::snprintf(rec, sizeof(rec), "%s", "--");
  else if (bundle_->recommended_lap) std::snprintf(rec, sizeof(rec), "PIT lap %d", *bundle_->recommended_lap);
  else std::snprintf(rec, sizeof(rec), "%s", "STAY OUT");

  DrawText(TextFormat("track=%s  lap=%d/%d  stint lap=%d  %s -> %s  %s",
                      state_.track_id.c_str(),
                      state_.current_lap, state_.total_race_laps,
                      state_.lap_in_stint,
                      to_string(state_.current_compound),
                      to_string(state_.new_compound),
                      state_.pit_condition == PitCondition::Vsc ? "VSC" : "green"),
           20, kHUD_LINE1_Y, 20, Color{220,235,220,255});

  if (bundle_ && bundle_->pit_window) {
    DrawText(TextFormat("%s   window %d-%d   pit loss %.1fs   look-ahead %d",
                        rec, bundle_->pit_window->first, bundle_->pit_window->second,
                        bundle_->result.pit_loss_s, state_.window_laps),
             20, kHUD_LINE2_Y, 18, Color{235,220,220,255});
  } else {
    DrawText(TextFormat("%s   look-ahead %d", rec, state_.window_laps),
             20, kHUD_LINE2_Y, 18, Color{235,220,220,255});
  }

  DrawText("Left/Right: Lap | Up/Down: Stint lap | C: Current tyre | N: New tyre | V: VSC | [ ]: Look-ahead | W/S: Curve span",
           20, kHUD_LINE3_Y, 14, Color{190,205,190,255});
}

} // namespace pitwall
