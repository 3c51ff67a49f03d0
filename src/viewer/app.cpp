#include <raylib.h>
#include <algorithm>
#include <cstdio>
#include <string>
#include <unordered_map>

#include <gscoach/viewer/app.hpp>
#include <gscoach/replay_runner.hpp>

namespace gscoach {

namespace {

// Playable area in world units, both axes.
static constexpr double kMapHalfExtent = 8000.0;

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  if (w == 8.0)  return "8x";
  if (w == 16.0) return "16x";
  return "custom";
}

// Stable colour per tracked name for the session.
static Color colorFor(const std::string& name) {
  static const Color PAL[] = {
    {231, 76, 60, 255},   // red
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {230, 126, 34, 255},  // orange
    {236, 112, 99, 255},  // salmon
    {26, 188, 156, 255},  // teal
    {142, 68, 173, 255},  // amethyst
    {241, 90, 36, 255},   // orange-red
  };
  static std::unordered_map<std::string, int> idx;
  auto it = idx.find(name);
  if (it == idx.end()) {
    int assigned = static_cast<int>(idx.size()) % static_cast<int>(sizeof(PAL)/sizeof(PAL[0]));
    it = idx.emplace(name, assigned).first;
  }
  return PAL[it->second];
}

static Color fade(Color c, float a) {
  c.a = static_cast<unsigned char>(std::clamp(a, 0.0f, 1.0f) * 255.0f);
  return c;
}

// Right-hand advisory panel
static constexpr int kPanelW = 520;
static constexpr int kPanelLineH = 16;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Coach& coach, ReplayRunner& replay) : coach_(coach), replay_(replay) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y) const {
  const float cx = (GetScreenWidth() - kPanelW) * 0.5f - pan_x_ * scale_px_per_unit_;
  const float cy = GetScreenHeight() * 0.5f + pan_y_ * scale_px_per_unit_;
  return { cx + float(x * scale_px_per_unit_), cy - float(y * scale_px_per_unit_) };
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "gscoach - Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_view_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Time warp controls
  if (IsKeyPressed(KEY_SPACE)) {
    double cur = replay_.time_scale.load();
    replay_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   replay_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_TWO))   replay_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_THREE)) replay_.time_scale.store(4.0);
  if (IsKeyPressed(KEY_FOUR))  replay_.time_scale.store(8.0);
  if (IsKeyPressed(KEY_FIVE))  replay_.time_scale.store(16.0);

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_unit_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_unit_ *= 0.99f;

  // Camera pan
  const float pan_step = 40.0f; // world units per frame while key held
  if (IsKeyDown(KEY_LEFT))  pan_x_ -= pan_step;
  if (IsKeyDown(KEY_RIGHT)) pan_x_ += pan_step;
  if (IsKeyDown(KEY_UP))    pan_y_ += pan_step;
  if (IsKeyDown(KEY_DOWN))  pan_y_ -= pan_step;
  if (IsKeyPressed(KEY_C))  { pan_x_ = 0.0f; pan_y_ = 0.0f; }

  if (IsKeyPressed(KEY_T)) show_trails_ = !show_trails_;
  if (IsKeyPressed(KEY_P)) show_predictions_ = !show_predictions_;
  if (IsKeyPressed(KEY_R)) replay_.request_restart();
}

void ViewerApp::pump_view_() {
  // Only copies when something new was ingested
  (void)coach_.poll(cursor_, view_);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 22, 26, 255});

  draw_minimap_();
  draw_enemies_();
  draw_local_hero_();
  draw_panel_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_minimap_() {
  const auto tl = worldToScreen_(-kMapHalfExtent,  kMapHalfExtent);
  const auto br = worldToScreen_( kMapHalfExtent, -kMapHalfExtent);
  const float w = br.x - tl.x, h = br.y - tl.y;
  DrawRectangle(int(tl.x), int(tl.y), int(w), int(h), Color{34, 52, 38, 255});
  DrawRectangleLines(int(tl.x), int(tl.y), int(w), int(h), Color{70, 90, 70, 255});

  // River diagonal and a coarse 2000-unit grid.
  for (double g = -kMapHalfExtent; g <= kMapHalfExtent; g += 2000.0) {
    auto a = worldToScreen_(g, -kMapHalfExtent);
    auto b = worldToScreen_(g,  kMapHalfExtent);
    DrawLineV({a.x, a.y}, {b.x, b.y}, Color{44, 64, 48, 255});
    a = worldToScreen_(-kMapHalfExtent, g);
    b = worldToScreen_( kMapHalfExtent, g);
    DrawLineV({a.x, a.y}, {b.x, b.y}, Color{44, 64, 48, 255});
  }
  const auto r0 = worldToScreen_(-kMapHalfExtent,  kMapHalfExtent);
  const auto r1 = worldToScreen_( kMapHalfExtent, -kMapHalfExtent);
  DrawLineEx({r0.x, r0.y}, {r1.x, r1.y}, 6.0f, Color{40, 80, 120, 160});
}

void ViewerApp::draw_enemies_() {
  const GameClock now = view_.inputs.current.clock();

  if (show_trails_) {
    for (const auto& [name, ent] : view_.histories) {
      const auto& h = ent.history;
      const Color col = colorFor(name);
      for (std::size_t i = 1; i < h.size(); ++i) {
        const float age = float(now - h[i].clock);
        const float alpha = 1.0f - age / float(kDescribeWindowS);
        if (alpha <= 0.0f) continue;
        auto a = worldToScreen_(h[i-1].pos.x, h[i-1].pos.y);
        auto b = worldToScreen_(h[i].pos.x,   h[i].pos.y);
        DrawLineEx({a.x, a.y}, {b.x, b.y}, 2.0f, fade(col, 0.6f * alpha));
      }
    }
  }

  for (const auto& m : view_.inputs.movements) {
    const auto p = worldToScreen_(m.last_pos.x, m.last_pos.y);
    const Color col = colorFor(m.name);
    const float alpha = 1.0f - float(m.seconds_ago) / float(kDescribeWindowS);
    DrawCircleV({p.x, p.y}, 7.0f, fade(col, std::max(0.3f, alpha)));
    DrawText(TextFormat("%s (%ds)", m.name.c_str(), int(m.seconds_ago)),
             int(p.x) + 10, int(p.y) - 6, 12, fade(col, std::max(0.5f, alpha)));
  }

  if (show_predictions_) {
    for (const auto& pr : view_.inputs.predictions) {
      const auto p = worldToScreen_(pr.pos.x, pr.pos.y);
      const Color col = colorFor(pr.name);
      DrawCircleLines(int(p.x), int(p.y), 9.0f, col);
      for (const auto& m : view_.inputs.movements) {
        if (m.name != pr.name) continue;
        const auto a = worldToScreen_(m.last_pos.x, m.last_pos.y);
        DrawLineV({a.x, a.y}, {p.x, p.y}, fade(col, 0.5f));
      }
    }
  }
}

void ViewerApp::draw_local_hero_() {
  const auto& cur = view_.inputs.current;
  if (!cur.hero) return;
  const auto pos = cur.hero->position();
  if (!pos) return;
  const auto p = worldToScreen_(pos->x, pos->y);
  const bool alive = cur.hero->alive.value_or(true);
  const Color col = alive ? Color{80, 220, 120, 255} : Color{120, 120, 120, 255};
  DrawCircleV({p.x, p.y}, 8.0f, col);
  // Warning radius around the local hero.
  const float r = float(kProximityWarnRadius * scale_px_per_unit_);
  DrawCircleLines(int(p.x), int(p.y), r, fade(col, 0.35f));
}

void ViewerApp::draw_panel_() {
  const int x0 = GetScreenWidth() - kPanelW;
  const int pad = 10;
  DrawRectangle(x0, 0, kPanelW, GetScreenHeight(), Color{24, 24, 28, 230});
  DrawLine(x0, 0, x0, GetScreenHeight(), Color{60, 60, 70, 255});

  int y = pad;
  DrawText("Coach", x0 + pad, y, 20, Color{220, 220, 230, 255});
  y += 28;

  const Color normal = Color{200, 200, 210, 255};
  const Color header = Color{235, 220, 160, 255};
  const Color alert  = Color{255, 110, 90, 255};
  for (const auto& line : view_.insights) {
    if (y > GetScreenHeight() - kPanelLineH) break;
    Color c = normal;
    if (line.find("WARNING") != std::string::npos || line.find("TEAM FIGHT") != std::string::npos) c = alert;
    else if (!line.empty() && line.back() == ':') c = header;
    DrawText(line.c_str(), x0 + pad, y, 14, c);
    y += kPanelLineH;
  }
}

void ViewerApp::draw_hud_() {
  const double warp = replay_.time_scale.load();
  const auto& cur = view_.inputs.current;

  DrawText(TextFormat("clock=%s  tracked=%d  events=%d  seq=%llu  warp=%s%s",
                      format_game_time(cur.game_time).c_str(),
                      int(view_.histories.size()),
                      int(view_.events.size()),
                      (unsigned long long)view_.seq,
                      warpLabel(warp),
                      replay_.finished() ? "  [end of capture]" : ""),
           20, 20, 20, Color{220, 235, 220, 255});

  DrawText("Space: Pause/Resume | 1..5: 1x 2x 4x 8x 16x | W/S or +/-: Zoom | Arrows: Pan | C: Center | T: Trails | P: Predictions | R: Restart",
           20, GetScreenHeight() - 24, 14, Color{190, 205, 190, 255});
}

} // namespace gscoach
