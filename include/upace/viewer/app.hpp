#pragma once
#include <optional>
#include <upace/csv_io.hpp>
#include <upace/planner.hpp>

namespace upace {

// RAII application that renders a race plan: elevation profile coloured
// by bonk risk, checkpoint markers, fatigue curve and a HUD.
class ViewerApp {
public:
  explicit ViewerApp(PlanInputs inputs, PlanOptions opt = {});
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void replan_();
  // Rendering
  void render_frame_();
  void draw_profile_();
  void draw_fatigue_panel_();
  void draw_segment_table_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f profileToScreen_(double miles, double elev_m) const;

  PlanInputs inputs_;
  PlanOptions opt_;
  std::optional<RacePlan> plan_;

  // Profile bounds
  double max_miles_{1.0};
  double min_elev_{0.0};
  double max_elev_{1.0};

  // UI state
  float zoom_{1.0f};
  float pan_miles_{0.0f};
  int selected_{-1};
};

} // namespace upace
