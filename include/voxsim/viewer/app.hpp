#pragma once
#include <cstdint>
#include <voxsim/event_queue.hpp>
#include <voxsim/simulation.hpp>
#include <voxsim/world.hpp>

namespace voxsim {

class LoopbackServer;

// Small test course: floor, steps, slabs, stairs, fences, panes, a pool and ice.
void build_demo_world(ChunkColumnMap& world);

// Debug window: runs the client prediction loop at a fixed step on the render
// thread and draws side and top views around the player.
class ViewerApp {
public:
  ViewerApp(Simulation& sim, LoopbackServer& server, const ChunkColumnMap& world, NetEventQueue& inbox);
  int run(); // returns 0 on normal exit

private:
  void process_input_();
  void step_fixed_(float frame_dt);
  void render_frame_();
  void draw_side_view_(int x0, int y0, int w, int h);
  void draw_top_view_(int x0, int y0, int w, int h);
  void draw_hud_();

  InputState sample_input_() const;

  Simulation& sim_;
  LoopbackServer& server_;
  const ChunkColumnMap& map_;
  WorldCollision world_;
  NetEventQueue& inbox_;

  float accumulator_{0.0f};
  float yaw_{0.0f};
  float scale_px_per_block_{24.0f};
  bool drift_on_{false};
};

} // namespace voxsim
