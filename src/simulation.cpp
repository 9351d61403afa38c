#include <voxsim/simulation.hpp>
#include <voxsim/log.hpp>
#include <voxsim/movement.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace voxsim {

static constexpr float kSprintStartSpeedSq = 1.0e-5f;
static constexpr float kSpeedEffectPerLevel = 0.2f;

LatencyEstimate::LatencyEstimate(float tick_seconds, std::size_t capacity)
  : tick_seconds_(tick_seconds), sent_(capacity > 0 ? capacity : 1) {}

void LatencyEstimate::on_sent(std::uint32_t tick, Clock::time_point t) {
  sent_[tick % sent_.size()] = Sent{tick, t, true};
}

bool LatencyEstimate::on_acknowledged(std::uint32_t tick, Clock::time_point recv) {
  const Sent& s = sent_[tick % sent_.size()];
  if (!s.valid || s.tick != tick || recv < s.at) return false;
  const float rtt = std::chrono::duration<float>(recv - s.at).count();
  one_way_ticks_ = static_cast<std::uint32_t>(std::lround((rtt * 0.5f) / tick_seconds_));
  return true;
}

void LatencyEstimate::reset() {
  std::fill(sent_.begin(), sent_.end(), Sent{});
  one_way_ticks_ = 0;
}

Simulation::Simulation(const SimConfig& cfg)
  : cfg_(cfg),
    thresholds_{cfg.noise_floor, cfg.hard_teleport_distance},
    history_(cfg.history_capacity),
    offset_(cfg.smoothing_decay),
    latency_(cfg.tick_seconds, cfg.history_capacity),
    packets_(cfg.position_resend_ticks) {}

void Simulation::reset(const PlayerSimState& state) {
  state_ = state;
  previous_ = state;
  history_.clear();
  offset_.reset();
  latency_.reset();
  packets_.reset();
  jump_was_pressed_ = false;
  fly_toggle_timer_ = 0;
  sprinting_ = false;
  sneaking_ = false;
  debug_.one_way_ticks = 0;
  debug_.smoothing_offset_len = 0.0f;
}

void Simulation::set_abilities(const Abilities& a) {
  abilities_ = a;
  if (!abilities_.can_fly) abilities_.flying = false;
}

InputState Simulation::sample_input_(const InputState& raw, bool& abilities_changed) {
  InputState in = raw;

  const bool jump_pressed = raw.jump && !jump_was_pressed_;
  jump_was_pressed_ = raw.jump;
  if (fly_toggle_timer_ > 0) --fly_toggle_timer_;

  if (abilities_.can_fly) {
    if (jump_pressed) {
      // Second jump press inside the window toggles flight.
      if (fly_toggle_timer_ == 0) {
        fly_toggle_timer_ = cfg_.fly_toggle_window_ticks;
      } else {
        abilities_.flying = !abilities_.flying;
        fly_toggle_timer_ = 0;
        abilities_changed = true;
      }
    }
  } else if (abilities_.flying) {
    abilities_.flying = false;
    fly_toggle_timer_ = 0;
    abilities_changed = true;
  }

  in.can_fly = abilities_.can_fly;
  in.flying = abilities_.flying;
  in.flying_speed = abilities_.flying_speed;
  in.speed_multiplier = abilities_.speed_amplifier
      ? 1.0f + kSpeedEffectPerLevel * (static_cast<float>(*abilities_.speed_amplifier) + 1.0f)
      : 1.0f;
  in.jump_boost = abilities_.jump_boost_amplifier;

  // Sprint latch: starting needs strong forward input and actual movement,
  // keeping it only needs the key held while moving forward.
  const float hspeed_sq = state_.vel.x * state_.vel.x + state_.vel.z * state_.vel.z;
  const bool can_start = raw.sprint && !raw.sneak &&
                         raw.forward >= physics::kSprintForwardThreshold && hspeed_sq > kSprintStartSpeedSq;
  const bool can_keep = sprinting_ && raw.sprint && !raw.sneak && raw.forward > 0.0f;
  in.sprint = can_start || can_keep;
  return in;
}

TickOutput Simulation::tick(const InputState& raw_input, const WorldCollision& world) {
  return tick(raw_input, world, Clock::now());
}

TickOutput Simulation::tick(const InputState& raw_input, const WorldCollision& world, Clock::time_point now) {
  TickOutput out;
  const InputState input = sample_input_(raw_input, out.abilities_changed);

  previous_ = state_;
  const PlayerSimState next = simulate_tick(state_, input, world);
  history_.push(PredictedFrame{tick_, input, next});
  state_ = next;

  if (abilities_.flying && !cfg_.spectator && state_.on_ground) {
    abilities_.flying = false;
    out.abilities_changed = true;
  }

  if (input.sneak != sneaking_) {
    out.actions.push_back(input.sneak ? EntityAction::StartSneaking : EntityAction::StopSneaking);
    sneaking_ = input.sneak;
  }
  const bool sprint = effective_sprint(input);
  if (sprint != sprinting_) {
    out.actions.push_back(sprint ? EntityAction::StartSprinting : EntityAction::StopSprinting);
    sprinting_ = sprint;
  }

  out.tick = tick_;
  out.input = input;
  out.state = state_;
  out.packet = packets_.next(state_);
  latency_.on_sent(tick_, now);

  ++tick_; // wraps
  debug_.smoothing_offset_len = offset_.length();
  return out;
}

void Simulation::drain(NetEventQueue& queue, const WorldCollision& world) {
  for (const auto& ev : queue.drain()) apply_event(ev, world);
}

void Simulation::apply_event(const NetEvent& ev, const WorldCollision& world) {
  if (const auto* vel = std::get_if<ServerVelocityEvent>(&ev)) {
    state_.vel = vel->velocity;
    return;
  }
  const auto& pose = std::get<ServerPoseEvent>(ev);

  PlayerSimState server{};
  server.pos = pose.position;
  server.on_ground = pose.on_ground;
  server.yaw = pose.yaw;
  server.pitch = pose.pitch;

  // An acknowledged tick anchors the pose exactly; otherwise fall back to
  // the newest tick minus the last measured one-way latency.
  const std::uint32_t client_tick = history_.latest_tick().value_or(tick_);
  std::uint32_t anchor = latency_.tick_estimate(client_tick);
  if (pose.input_tick) {
    if (pose.recv_time && latency_.on_acknowledged(*pose.input_tick, *pose.recv_time)) {
      debug_.one_way_ticks = latency_.one_way_ticks();
    }
    anchor = *pose.input_tick;
  }
  // Poses carry no velocity; keep the one predicted for that tick.
  if (const auto frame = history_.get_by_tick(anchor)) server.vel = frame->state.vel;
  apply_server_pose(anchor, server, world);
  packets_.acknowledge(server);
}

std::optional<ReconcileResult> Simulation::apply_server_pose(std::uint32_t tick_estimate,
                                                             const PlayerSimState& pose,
                                                             const WorldCollision& world) {
  const auto latest = history_.latest_tick();
  if (!latest) {
    reset(pose);
    ++debug_.snaps;
    debug_.last_correction = 0.0f;
    debug_.last_replay = 0;
    log_info("sim", "no history, snapping to server pose (" + std::to_string(pose.pos.x) + ", " +
                    std::to_string(pose.pos.y) + ", " + std::to_string(pose.pos.z) + ")");
    return std::nullopt;
  }

  auto r = reconcile(history_, world, tick_estimate, pose, *latest, state_, thresholds_);
  if (!r) return std::nullopt;

  debug_.last_correction = r->correction.length();
  debug_.last_replay = r->replayed_ticks;
  if (r->hard_teleport) {
    offset_.reset();
    previous_ = state_;
    ++debug_.hard_teleports;
    log_warn("sim", "hard teleport at tick " + std::to_string(tick_estimate) + ", error " +
                    std::to_string(debug_.last_correction));
  } else {
    // Physics already moved; the drawn pose starts where it was and eases in.
    offset_.add(-r->correction);
    ++debug_.soft_corrections;
    if (log_level() <= LogLevel::Debug) {
      log_debug("sim", "soft correction " + std::to_string(debug_.last_correction) + ", replayed " +
                       std::to_string(r->replayed_ticks) + " ticks");
    }
  }
  debug_.smoothing_offset_len = offset_.length();
  return r;
}

void Simulation::advance_visuals(float dt_sec) {
  offset_.decay(dt_sec);
  debug_.smoothing_offset_len = offset_.length();
}

Vec3 Simulation::render_position(float alpha) const {
  return voxsim::render_position(previous_.pos, state_.pos, alpha, offset_.value());
}

} // namespace voxsim
