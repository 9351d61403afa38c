#include <voxsim/config.hpp>
#include <voxsim/event_queue.hpp>
#include <voxsim/log.hpp>
#include <voxsim/loopback_server.hpp>
#include <voxsim/simulation.hpp>
#include <voxsim/viewer/app.hpp>

using namespace voxsim;

int main() {
  SimConfig cfg;
  if (auto loaded = load_sim_config("voxsim.cfg")) {
    cfg = *loaded;
    log_info("viewer", "loaded voxsim.cfg");
  }

  ChunkColumnMap world;
  build_demo_world(world);

  NetEventQueue inbox;
  LoopbackConfig lcfg;
  lcfg.tick_seconds = cfg.tick_seconds;
  LoopbackServer server(world, inbox, lcfg);

  PlayerSimState spawn{};
  spawn.pos = Vec3{0.5f, 4.0f, 0.5f};
  server.spawn(spawn);
  server.start();

  Simulation sim(cfg);
  sim.reset(spawn);
  ViewerApp app(sim, server, world, inbox);
  const int code = app.run();

  server.stop();
  return code;
}
