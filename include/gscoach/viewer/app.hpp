#pragma once
#include <cstdint>
#include <gscoach/coach.hpp>

namespace gscoach {

class ReplayRunner;

// RAII application that renders the minimap and advisory panel.
class ViewerApp {
public:
  ViewerApp(Coach& coach, ReplayRunner& replay);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_view_();
  // Rendering
  void render_frame_();
  void draw_minimap_();
  void draw_enemies_();
  void draw_local_hero_();
  void draw_panel_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y) const;

  // Dependencies
  Coach& coach_;
  ReplayRunner& replay_;
  CoachView view_{};
  std::uint64_t cursor_{0};

  // UI state
  float scale_px_per_unit_{0.04f};
  // Camera pan (world units)
  float pan_x_{0.0f};
  float pan_y_{0.0f};
  bool show_trails_{true};
  bool show_predictions_{true};
};

} // namespace gscoach
