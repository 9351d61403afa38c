#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <voxsim/config.hpp>
#include <voxsim/event_queue.hpp>
#include <voxsim/movement_packet.hpp>
#include <voxsim/predict.hpp>
#include <voxsim/reconcile.hpp>
#include <voxsim/smoothing.hpp>
#include <voxsim/types.hpp>
#include <voxsim/world.hpp>

namespace voxsim {

// Player abilities and status effects as last reported by the server.
struct Abilities {
  bool can_fly = false;
  bool flying = false;
  float flying_speed = 0.05f;
  std::optional<std::uint8_t> speed_amplifier;
  std::optional<std::uint8_t> jump_boost_amplifier;
};

// Round trip from sending a tick's input to receiving the server pose that
// reflects it. Send times are kept in a ring keyed like the history.
class LatencyEstimate {
public:
  explicit LatencyEstimate(float tick_seconds = 0.05f, std::size_t capacity = 256);

  void on_sent(std::uint32_t tick, Clock::time_point t);
  // False when the send time of `tick` is no longer held or is later than `recv`.
  bool on_acknowledged(std::uint32_t tick, Clock::time_point recv);

  std::uint32_t one_way_ticks() const { return one_way_ticks_; }
  // Local tick a pose without an acknowledged tick most likely corresponds to.
  std::uint32_t tick_estimate(std::uint32_t client_tick) const {
    return client_tick > one_way_ticks_ ? client_tick - one_way_ticks_ : 0;
  }
  void reset();

private:
  struct Sent {
    std::uint32_t tick = 0;
    Clock::time_point at{};
    bool valid = false;
  };

  float tick_seconds_;
  std::vector<Sent> sent_;
  std::uint32_t one_way_ticks_ = 0;
};

struct DebugStats {
  float last_correction = 0.0f;      // length of the last correction
  std::uint32_t last_replay = 0;
  std::uint32_t one_way_ticks = 0;
  float smoothing_offset_len = 0.0f;
  std::uint32_t soft_corrections = 0;
  std::uint32_t hard_teleports = 0;
  std::uint32_t snaps = 0;           // poses applied with no history to compare
};

struct TickOutput {
  std::uint32_t tick = 0;            // tick that was simulated
  InputState input{};                // input as simulated (abilities and sprint latch applied)
  PlayerSimState state{};
  MovementPacket packet{};
  std::vector<EntityAction> actions;
  bool abilities_changed = false;    // flying toggled; server must be told
};

// Owns the local player's predicted state and everything derived from it.
// Single-threaded: the host calls drain() then tick() once per fixed step.
class Simulation {
public:
  explicit Simulation(const SimConfig& cfg = {});

  void reset(const PlayerSimState& state);

  TickOutput tick(const InputState& raw_input, const WorldCollision& world);
  TickOutput tick(const InputState& raw_input, const WorldCollision& world, Clock::time_point now);

  void drain(NetEventQueue& queue, const WorldCollision& world);
  void apply_event(const NetEvent& ev, const WorldCollision& world);

  // Returns the reconcile outcome, or nullopt for a snap or a no-op.
  std::optional<ReconcileResult> apply_server_pose(std::uint32_t tick_estimate,
                                                   const PlayerSimState& pose,
                                                   const WorldCollision& world);

  void advance_visuals(float dt_sec);
  Vec3 render_position(float alpha) const;

  void set_abilities(const Abilities& a);

  const PlayerSimState& state() const { return state_; }
  const PlayerSimState& previous() const { return previous_; }
  const PredictionBuffer& history() const { return history_; }
  std::uint32_t tick() const { return tick_; }
  const DebugStats& debug() const { return debug_; }
  const Abilities& abilities() const { return abilities_; }
  const VisualOffset& visual_offset() const { return offset_; }
  const LatencyEstimate& latency() const { return latency_; }
  const SimConfig& config() const { return cfg_; }

private:
  InputState sample_input_(const InputState& raw, bool& abilities_changed);

  SimConfig cfg_;
  ReconcileThresholds thresholds_;
  PlayerSimState state_{};
  PlayerSimState previous_{};
  PredictionBuffer history_;
  VisualOffset offset_;
  LatencyEstimate latency_;
  MovementPacketTracker packets_;
  Abilities abilities_{};
  DebugStats debug_{};
  std::uint32_t tick_ = 0;

  bool jump_was_pressed_ = false;
  std::uint32_t fly_toggle_timer_ = 0;
  bool sprinting_ = false;
  bool sneaking_ = false;
};

} // namespace voxsim
