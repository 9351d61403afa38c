#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

#include <voxsim/viewer/app.hpp>
#include <voxsim/block.hpp>
#include <voxsim/log.hpp>
#include <voxsim/loopback_server.hpp>
#include <voxsim/movement.hpp>

namespace voxsim {

namespace {

constexpr int kViewRadius = 12; // blocks drawn around the player
constexpr float kYawStep = 0.04f;
const Vec3 kDrift{0.02f, 0.0f, 0.0f};

Color color_for(std::uint16_t id) {
  if (is_water(id)) return Color{52, 120, 219, 160};
  if (is_lava(id)) return Color{230, 100, 20, 200};
  switch (block_shape(id)) {
    case BlockShape::Slab:
    case BlockShape::Stairs:    return Color{160, 130, 90, 255};
    case BlockShape::Fence:
    case BlockShape::FenceGate:
    case BlockShape::Wall:      return Color{120, 90, 60, 255};
    case BlockShape::Pane:      return Color{180, 220, 235, 200};
    case BlockShape::Door:
    case BlockShape::Trapdoor:  return Color{140, 100, 60, 255};
    case BlockShape::Partial:   return Color{200, 200, 200, 255};
    default: break;
  }
  if (id == blocks::kIce || id == blocks::kPackedIce) return Color{170, 210, 250, 255};
  return Color{110, 110, 118, 255};
}

} // namespace

void build_demo_world(ChunkColumnMap& w) {
  // Ground slab of stone with grass on top.
  w.fill(-32, 0, -32, 32, 2, 32, block_state(blocks::kStone));
  w.fill(-32, 3, -32, 32, 3, 32, block_state(blocks::kGrass));

  // Step ladder: slab, full block, stairs facing east.
  w.set_block(4, 4, 0, block_state(blocks::kStoneSlab));
  w.fill(5, 4, -1, 5, 4, 1, block_state(blocks::kStone));
  w.fill(6, 4, -1, 6, 5, 1, block_state(blocks::kStone));
  w.set_block(7, 4, 0, block_state(blocks::kOakStairs, 0));

  // Fence line with a gate and a short pane wall.
  w.fill(-6, 4, -6, 6, 4, -6, block_state(blocks::kOakFence));
  w.set_block(0, 4, -6, block_state(blocks::kOakFenceGate, 0));
  w.fill(-6, 4, 6, -2, 5, 6, block_state(blocks::kGlassPane));
  w.fill(2, 4, 6, 6, 4, 6, block_state(blocks::kCobblestoneWall));

  // Pool with a ledge to climb out of.
  w.fill(-14, 1, -4, -9, 3, 4, block_state(blocks::kWater));

  // Ice strip and a raised platform for sneak-edge checks.
  w.fill(10, 3, -8, 20, 3, -4, block_state(blocks::kIce));
  w.fill(10, 4, 4, 14, 6, 8, block_state(blocks::kStone));
}

ViewerApp::ViewerApp(Simulation& sim, LoopbackServer& server, const ChunkColumnMap& world, NetEventQueue& inbox)
  : sim_(sim), server_(server), map_(world), world_(world), inbox_(inbox) {}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "voxsim - prediction viewer");
  SetTargetFPS(144);

  while (!WindowShouldClose()) {
    process_input_();
    step_fixed_(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyDown(KEY_Q) || IsKeyDown(KEY_LEFT))  yaw_ += kYawStep;
  if (IsKeyDown(KEY_E) || IsKeyDown(KEY_RIGHT)) yaw_ -= kYawStep;
  if (yaw_ > kPI) yaw_ -= kTAU;
  if (yaw_ < -kPI) yaw_ += kTAU;

  if (IsKeyDown(KEY_KP_ADD))      scale_px_per_block_ *= 1.01f;
  if (IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_block_ *= 0.99f;

  if (IsKeyPressed(KEY_F)) {
    Abilities a = sim_.abilities();
    a.can_fly = !a.can_fly;
    sim_.set_abilities(a);
  }
  if (IsKeyPressed(KEY_T)) {
    const PlayerSimState auth = server_.authoritative();
    server_.request_teleport(auth.pos + Vec3{8.0f, 4.0f, 0.0f});
  }
  if (IsKeyPressed(KEY_LEFT_BRACKET)) {
    const std::uint32_t l = server_.latency_ticks();
    server_.set_latency_ticks(l > 0 ? l - 1 : 0);
  }
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) server_.set_latency_ticks(server_.latency_ticks() + 1);
  if (IsKeyPressed(KEY_G)) {
    drift_on_ = !drift_on_;
    server_.set_drift(drift_on_ ? kDrift : Vec3{});
  }
}

InputState ViewerApp::sample_input_() const {
  InputState in;
  if (IsKeyDown(KEY_W)) in.forward += 1.0f;
  if (IsKeyDown(KEY_S)) in.forward -= 1.0f;
  if (IsKeyDown(KEY_D)) in.strafe += 1.0f;
  if (IsKeyDown(KEY_A)) in.strafe -= 1.0f;
  in.jump = IsKeyDown(KEY_SPACE);
  in.sneak = IsKeyDown(KEY_LEFT_SHIFT);
  in.sprint = IsKeyDown(KEY_LEFT_CONTROL);
  in.yaw = yaw_;
  return in;
}

void ViewerApp::step_fixed_(float frame_dt) {
  const float tick = sim_.config().tick_seconds;
  accumulator_ += std::min(frame_dt, 0.25f);
  const InputState in = sample_input_();
  while (accumulator_ >= tick) {
    sim_.drain(inbox_, world_);
    const TickOutput out = sim_.tick(in, world_);
    server_.submit(out.tick, out.input);
    if (out.abilities_changed) {
      log_info("viewer", sim_.abilities().flying ? "flying on" : "flying off");
    }
    accumulator_ -= tick;
  }
  sim_.advance_visuals(frame_dt);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{24, 26, 32, 255});

  const int W = GetScreenWidth(), H = GetScreenHeight();
  const int hud_h = 110;
  draw_side_view_(0, hud_h, W / 2, H - hud_h);
  draw_top_view_(W / 2, hud_h, W / 2, H - hud_h);
  draw_hud_();

  EndDrawing();
}

// Horizontal axis is world x, vertical axis is world y, slice at the player's z.
void ViewerApp::draw_side_view_(int x0, int y0, int w, int h) {
  const float s = scale_px_per_block_;
  const Vec3 center = sim_.state().pos;
  const float cx = x0 + w * 0.5f, cy = y0 + h * 0.5f;
  auto to_screen = [&](float wx, float wy) {
    return Vector2{cx + (wx - center.x) * s, cy - (wy - center.y) * s};
  };

  BeginScissorMode(x0, y0, w, h);
  const int bz = block_coord(center.z);
  std::vector<Aabb> boxes;
  for (int bx = block_coord(center.x) - kViewRadius; bx <= block_coord(center.x) + kViewRadius; ++bx) {
    for (int by = block_coord(center.y) - kViewRadius; by <= block_coord(center.y) + kViewRadius; ++by) {
      const std::uint16_t state = map_.block_at(bx, by, bz);
      const std::uint16_t id = block_id(state);
      if (is_air(id)) continue;
      boxes.clear();
      if (is_liquid(id)) boxes.push_back(Aabb{{float(bx), float(by), float(bz)}, {bx + 1.0f, by + 1.0f, bz + 1.0f}});
      else collision_boxes(world_, bx, by, bz, state, boxes);
      for (const auto& b : boxes) {
        const Vector2 tl = to_screen(b.min.x, b.max.y);
        DrawRectangleV(tl, Vector2{(b.max.x - b.min.x) * s, (b.max.y - b.min.y) * s}, color_for(id));
      }
    }
  }

  auto draw_player = [&](const Vec3& p, Color c, bool filled) {
    const Vector2 tl = to_screen(p.x - physics::kPlayerHalfWidth, p.y + physics::kPlayerHeight);
    const Rectangle r{tl.x, tl.y, 2.0f * physics::kPlayerHalfWidth * s, physics::kPlayerHeight * s};
    if (filled) DrawRectangleRec(r, c);
    else DrawRectangleLinesEx(r, 2.0f, c);
  };
  draw_player(server_.authoritative().pos, Color{231, 76, 60, 255}, false);
  draw_player(sim_.state().pos, Color{46, 204, 113, 255}, false);
  const float alpha = accumulator_ / sim_.config().tick_seconds;
  draw_player(sim_.render_position(alpha), Color{241, 196, 15, 140}, true);
  EndScissorMode();

  DrawRectangleLines(x0, y0, w, h, Color{70, 70, 80, 255});
  DrawText("side (x / y)", x0 + 8, y0 + 8, 14, Color{200, 200, 210, 255});
}

// Horizontal axis is world x, vertical axis is world z, at the layer below the feet.
void ViewerApp::draw_top_view_(int x0, int y0, int w, int h) {
  const float s = scale_px_per_block_;
  const Vec3 center = sim_.state().pos;
  const float cx = x0 + w * 0.5f, cy = y0 + h * 0.5f;
  auto to_screen = [&](float wx, float wz) {
    return Vector2{cx + (wx - center.x) * s, cy + (wz - center.z) * s};
  };

  BeginScissorMode(x0, y0, w, h);
  const int feet_y = block_coord(center.y);
  for (int bx = block_coord(center.x) - kViewRadius; bx <= block_coord(center.x) + kViewRadius; ++bx) {
    for (int bz = block_coord(center.z) - kViewRadius; bz <= block_coord(center.z) + kViewRadius; ++bz) {
      // Show what stands at foot level, else the floor one below.
      std::uint16_t id = block_id(map_.block_at(bx, feet_y, bz));
      Color c;
      if (!is_air(id)) {
        c = color_for(id);
      } else {
        id = block_id(map_.block_at(bx, feet_y - 1, bz));
        if (is_air(id)) continue;
        c = color_for(id);
        c.a = 90;
      }
      DrawRectangleV(to_screen(float(bx), float(bz)), Vector2{s, s}, c);
    }
  }

  const Vec3 p = sim_.state().pos;
  const Vector2 pc = to_screen(p.x, p.z);
  DrawCircleV(pc, physics::kPlayerHalfWidth * s, Color{46, 204, 113, 255});
  const Vec3 f = forward_dir(sim_.state().yaw);
  DrawLineEx(pc, Vector2{pc.x + f.x * s, pc.y + f.z * s}, 2.0f, Color{240, 240, 240, 255});
  const Vec3 a = server_.authoritative().pos;
  DrawCircleLines(int(to_screen(a.x, a.z).x), int(to_screen(a.x, a.z).y), physics::kPlayerHalfWidth * s,
                  Color{231, 76, 60, 255});
  EndScissorMode();

  DrawRectangleLines(x0, y0, w, h, Color{70, 70, 80, 255});
  DrawText("top (x / z)", x0 + 8, y0 + 8, 14, Color{200, 200, 210, 255});
}

void ViewerApp::draw_hud_() {
  const DebugStats& d = sim_.debug();
  const PlayerSimState& st = sim_.state();

  DrawText(TextFormat("tick=%u  pos=(%.2f, %.2f, %.2f)  vel=(%.3f, %.3f, %.3f)  %s%s",
                      sim_.tick(), st.pos.x, st.pos.y, st.pos.z, st.vel.x, st.vel.y, st.vel.z,
                      st.on_ground ? "ground" : "air",
                      sim_.abilities().flying ? "  flying" : ""),
           20, 16, 18, Color{220, 235, 220, 255});
  DrawText(TextFormat("one-way=%u  latency=%u  last corr=%.4f  replay=%u  offset=%.4f  soft=%u  hard=%u  drift=%s",
                      d.one_way_ticks, server_.latency_ticks(), d.last_correction, d.last_replay,
                      d.smoothing_offset_len, d.soft_corrections, d.hard_teleports, drift_on_ ? "on" : "off"),
           20, 42, 18, Color{235, 220, 220, 255});
  DrawText("WASD: Move | Q/E: Turn | Space: Jump | Shift: Sneak | Ctrl: Sprint | F: Can fly | T: Teleport | [ ]: Latency | G: Drift",
           20, 72, 14, Color{190, 205, 190, 255});
}

} // namespace voxsim
