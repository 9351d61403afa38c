#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <voxsim/event_queue.hpp>
#include <voxsim/types.hpp>
#include <voxsim/world.hpp>

namespace voxsim {

struct LoopbackConfig {
  std::uint32_t latency_ticks = 2;       // one-way, both directions
  std::uint32_t broadcast_interval = 20; // ticks between pose broadcasts
  float tick_seconds = 0.05f;
};

// Authoritative stand-in for a remote server. Runs the same movement code on
// the same read-only world, receives inputs and publishes poses with a fixed
// one-way delay. Either stepped by the caller or driven by its own thread.
class LoopbackServer {
public:
  LoopbackServer(const BlockSource& world, NetEventQueue& out, LoopbackConfig cfg = {});
  ~LoopbackServer() { stop(); }
  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Places the player and queues the initial pose for the client.
  void spawn(const PlayerSimState& s);

  // Thread-safe; the input arrives latency_ticks later. `client_tick` is
  // echoed back in poses once the input has been simulated.
  void submit(std::uint32_t client_tick, const InputState& in);

  // One server tick. `now` stamps delivered events as their receive time.
  void step(Clock::time_point now);

  void set_latency_ticks(std::uint32_t ticks);
  std::uint32_t latency_ticks() const;
  // Extra displacement added after every simulated input (server-side push).
  void set_drift(const Vec3& per_tick);
  void request_teleport(const Vec3& target);

  PlayerSimState authoritative() const;
  std::uint32_t server_tick() const;
  std::uint32_t inputs_processed() const;
  std::optional<std::uint32_t> last_input_tick() const;

private:
  struct PendingInput { std::uint32_t due; std::uint32_t client_tick; InputState input; };
  struct PendingPose { std::uint32_t due; ServerPoseEvent pose; };

  void thread_main_();
  void queue_pose_locked_();

  WorldCollision world_;
  NetEventQueue& out_;
  LoopbackConfig cfg_;

  mutable std::mutex mu_;
  PlayerSimState state_{};
  std::uint32_t tick_ = 0;
  std::uint32_t processed_ = 0;
  std::optional<std::uint32_t> last_input_tick_;
  std::deque<PendingInput> inbox_;
  std::deque<PendingPose> outbox_;
  Vec3 drift_{};
  std::optional<Vec3> teleport_;

  std::thread th_;
  std::atomic<bool> running_{false};
};

} // namespace voxsim
