#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <upace/viewer/app.hpp>
#include <upace/fatigue.hpp>
#include <upace/race_summary.hpp>

namespace upace {

namespace {

static Color colorFor(BonkRisk r) {
  switch (r) {
    case BonkRisk::None:     return Color{ 34,197, 94,255}; // green
    case BonkRisk::Low:      return Color{132,204, 22,255}; // lime
    case BonkRisk::Moderate: return Color{234,179,  8,255}; // yellow
    case BonkRisk::High:     return Color{249,115, 22,255}; // orange
    case BonkRisk::Critical: return Color{239, 68, 68,255}; // red
  }
  return Color{127,140,141,255};
}

static Color fatigueColor(double pct) {
  if (pct < 5.0)  return Color{ 34,197, 94,255};
  if (pct < 10.0) return Color{132,204, 22,255};
  if (pct < 15.0) return Color{234,179,  8,255};
  if (pct < 20.0) return Color{249,115, 22,255};
  return Color{239, 68, 68,255};
}

// --- layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y    = 20;
static constexpr int kHUD_LINE2_Y    = 46;
static constexpr int kHUD_LINE3_Y    = 72;
static constexpr int kProfileTop     = 110;
static constexpr int kProfileHeight  = 300;
static constexpr int kMarginX        = 60;
static constexpr int kFatigueHeight  = 140;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(PlanInputs inputs, PlanOptions opt)
  : inputs_(std::move(inputs)), opt_(std::move(opt)) {
  for (const auto& p : inputs_.track) {
    max_miles_ = std::max(max_miles_, p.distance);
  }
  if (!inputs_.track.empty()) {
    auto [lo, hi] = std::minmax_element(inputs_.track.begin(), inputs_.track.end(),
      [](const TrackPoint& a, const TrackPoint& b){ return a.elevation < b.elevation; });
    min_elev_ = lo->elevation;
    max_elev_ = std::max(hi->elevation, min_elev_ + 1.0);
  }
  replan_();
}

void ViewerApp::replan_() {
  plan_ = build_race_plan(inputs_.track, inputs_.segments, inputs_.activity,
                          &inputs_.athlete.metrics, opt_);
}

ViewerApp::Vec2f ViewerApp::profileToScreen_(double miles, double elev_m) const {
  const float w = float(GetScreenWidth() - 2 * kMarginX);
  const float x = kMarginX + float((miles - pan_miles_) / max_miles_) * w * zoom_;
  const float t = float((elev_m - min_elev_) / (max_elev_ - min_elev_));
  const float y = kProfileTop + kProfileHeight - t * kProfileHeight;
  return {x, y};
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "UltraPace - Plan Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Strategy tier
  bool changed = false;
  if (IsKeyPressed(KEY_ONE))   { opt_.tier = StrategyTier::Aggressive;   changed = true; }
  if (IsKeyPressed(KEY_TWO))   { opt_.tier = StrategyTier::Balanced;     changed = true; }
  if (IsKeyPressed(KEY_THREE)) { opt_.tier = StrategyTier::Conservative; changed = true; }

  // Fatigue factor
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) {
    opt_.fatigue_factor = std::min(8.0, (plan_ ? plan_->fatigue_factor : kDefaultFatigueFactor) + 0.5);
    changed = true;
  }
  if (IsKeyPressed(KEY_LEFT_BRACKET)) {
    opt_.fatigue_factor = std::max(0.0, (plan_ ? plan_->fatigue_factor : kDefaultFatigueFactor) - 0.5);
    changed = true;
  }
  if (IsKeyPressed(KEY_R)) { opt_.fatigue_factor.reset(); changed = true; }
  if (changed) replan_();

  // Zoom & pan along the course
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      zoom_ = std::min(20.0f, zoom_ * 1.02f);
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) zoom_ = std::max(1.0f, zoom_ * 0.98f);
  const float pan_step = float(max_miles_) * 0.005f / zoom_;
  if (IsKeyDown(KEY_LEFT))  pan_miles_ = std::max(0.0f, pan_miles_ - pan_step);
  if (IsKeyDown(KEY_RIGHT)) pan_miles_ = std::min(float(max_miles_), pan_miles_ + pan_step);
  if (IsKeyPressed(KEY_C))  { zoom_ = 1.0f; pan_miles_ = 0.0f; }

  // Segment selection
  const int n = plan_ ? static_cast<int>(plan_->segments.size()) : 0;
  if (n > 0 && IsKeyPressed(KEY_DOWN)) selected_ = (selected_ + 1) % n;
  if (n > 0 && IsKeyPressed(KEY_UP))   selected_ = (selected_ <= 0) ? n - 1 : selected_ - 1;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18,20,24,255});

  if (plan_) {
    draw_profile_();
    draw_fatigue_panel_();
    draw_segment_table_();
  } else {
    DrawText("Segments are out of order: cumulative distance decreases", 20, kProfileTop, 20,
             Color{239,68,68,255});
  }
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_profile_() {
  const auto& pts = inputs_.track;
  if (pts.size() < 2) return;

  // Panel
  DrawRectangle(kMarginX - 6, kProfileTop - 6, GetScreenWidth() - 2 * kMarginX + 12,
                kProfileHeight + 12, Color{24,24,28,220});

  // Colour each track interval by the bonk risk of the segment containing it.
  auto risk_at = [&](double miles) -> Color {
    for (const auto& sp : plan_->segments) {
      if (miles <= sp.segment.cumulative_distance) {
        return sp.energy ? colorFor(sp.energy->bonk_risk) : Color{52,152,219,255};
      }
    }
    return Color{127,140,141,255};
  };

  const float base_y = float(kProfileTop + kProfileHeight);
  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = profileToScreen_(pts[i-1].distance, pts[i-1].elevation);
    auto b = profileToScreen_(pts[i].distance,   pts[i].elevation);
    if (b.x < kMarginX || a.x > GetScreenWidth() - kMarginX) continue;
    const Color c = risk_at(pts[i].distance);
    DrawTriangle({a.x, a.y}, {a.x, base_y}, {b.x, base_y}, Fade(c, 0.35f));
    DrawTriangle({a.x, a.y}, {b.x, base_y}, {b.x, b.y}, Fade(c, 0.35f));
    DrawLineEx({a.x, a.y}, {b.x, b.y}, 2.0f, c);
  }

  // Checkpoint markers
  for (std::size_t i = 0; i < plan_->segments.size(); ++i) {
    const auto& sp = plan_->segments[i];
    auto top = profileToScreen_(sp.segment.cumulative_distance, max_elev_);
    if (top.x < kMarginX || top.x > GetScreenWidth() - kMarginX) continue;
    const bool sel = static_cast<int>(i) == selected_;
    DrawLineEx({top.x, top.y}, {top.x, base_y}, sel ? 2.0f : 1.0f,
               sel ? Color{255,215,0,255} : Color{200,200,210,120});
    DrawText(sp.segment.checkpoint_name.c_str(), int(top.x) + 3, int(top.y) + 2, 12,
             Color{220,220,230,255});
  }

  DrawText(TextFormat("%.0f m", max_elev_), 8, kProfileTop, 12, Color{160,160,170,255});
  DrawText(TextFormat("%.0f m", min_elev_), 8, kProfileTop + kProfileHeight - 12, 12,
           Color{160,160,170,255});
}

void ViewerApp::draw_fatigue_panel_() {
  const int y0 = kProfileTop + kProfileHeight + 24;
  const int x0 = kMarginX;
  const int w = GetScreenWidth() / 2 - kMarginX;
  DrawRectangle(x0 - 6, y0 - 6, w + 12, kFatigueHeight + 12, Color{24,24,28,220});

  const double base = plan_->segments.empty() ? 0.0 : plan_->segments.front().pace;
  const auto curve = generate_fatigue_curve(base, max_miles_, plan_->fatigue_factor);
  const auto last = curve.at(curve.size() - 1);
  const double lo = base, hi = std::max(last.expected_pace, base + 0.01);

  bool have_prev = false;
  Vector2 prev{};
  for (const auto p : curve) {
    const float x = x0 + float(p.distance / max_miles_) * w;
    const float y = y0 + kFatigueHeight - float((p.expected_pace - lo) / (hi - lo)) * (kFatigueHeight - 20);
    const Vector2 cur{x, y};
    if (have_prev) DrawLineEx(prev, cur, 2.0f, fatigueColor(p.percent_degradation));
    prev = cur;
    have_prev = true;
  }

  DrawText(TextFormat("Fatigue %.1f%%/10mi  start %s  finish %s (%s)",
                      plan_->fatigue_factor, format_pace(base).c_str(),
                      format_pace(last.expected_pace).c_str(),
                      fatigue_description(last.percent_degradation)),
           x0, y0, 14, Color{220,220,230,255});
}

void ViewerApp::draw_segment_table_() {
  const int x0 = GetScreenWidth() / 2 + 20;
  const int y0 = kProfileTop + kProfileHeight + 24;
  const int row_h = 16;
  const Color hdr = Color{220,220,230,255};
  const Color def = Color{200,200,210,255};

  DrawText("Checkpoint",  x0,       y0, 14, hdr);
  DrawText("Pace",        x0 + 170, y0, 14, hdr);
  DrawText("Split",       x0 + 230, y0, 14, hdr);
  DrawText("Arrive",      x0 + 310, y0, 14, hdr);
  DrawText("Glycogen",    x0 + 400, y0, 14, hdr);

  int y = y0 + row_h + 2;
  const int max_rows = (GetScreenHeight() - y - 20) / row_h;
  for (int i = 0; i < static_cast<int>(plan_->segments.size()) && i < max_rows; ++i) {
    const auto& sp = plan_->segments[static_cast<std::size_t>(i)];
    const Color c = (i == selected_) ? Color{255,215,0,255} : def;
    DrawText(sp.segment.checkpoint_name.c_str(), x0, y, 14, c);
    DrawText(format_pace(sp.pace).c_str(), x0 + 170, y, 14, c);
    DrawText(format_duration(sp.minutes_with_fatigue).c_str(), x0 + 230, y, 14, c);
    DrawText(format_duration(plan_->summary.arrivals[static_cast<std::size_t>(i)].arrival_minutes).c_str(),
             x0 + 310, y, 14, c);
    if (sp.energy) {
      DrawRectangle(x0 + 400, y + 3, 10, 10, colorFor(sp.energy->bonk_risk));
      DrawText(TextFormat("%.0f%%", sp.energy->estimated_glycogen_percent), x0 + 416, y, 14, c);
    }
    y += row_h;
  }
}

void ViewerApp::draw_hud_() {
  const auto& a = inputs_.athlete;
  if (plan_) {
    DrawText(TextFormat("athlete=%s  %.1f mi  running %s  stops %s  finish %s  tier=%s",
                        a.key.c_str(), max_miles_,
                        format_duration(plan_->total_minutes_with_fatigue).c_str(),
                        format_duration(plan_->summary.checkpoint_minutes).c_str(),
                        format_duration(plan_->summary.total_minutes).c_str(),
                        to_string(opt_.tier)),
             20, kHUD_LINE1_Y, 20, Color{220,235,220,255});
  }

  if (plan_ && selected_ >= 0 && selected_ < static_cast<int>(plan_->segments.size())) {
    const auto& sp = plan_->segments[static_cast<std::size_t>(selected_)];
    DrawText(TextFormat("%s: %s [%s]", sp.segment.checkpoint_name.c_str(),
                        sp.derivation.reasoning.c_str(), to_string(sp.derivation.confidence)),
             20, kHUD_LINE2_Y, 18, Color{235,220,220,255});
  }

  DrawText("1/2/3: Aggressive/Balanced/Conservative | [ ]: Fatigue -/+ | R: Auto fatigue | W/S: Zoom | Left/Right: Pan | Up/Down: Select | C: Reset view",
           20, kHUD_LINE3_Y, 14, Color{190,205,190,255});
}

} // namespace upace
