#include <voxsim/loopback_server.hpp>
#include <voxsim/log.hpp>
#include <voxsim/movement.hpp>
#include <chrono>
#include <string>

namespace voxsim {

LoopbackServer::LoopbackServer(const BlockSource& world, NetEventQueue& out, LoopbackConfig cfg)
  : world_(world), out_(out), cfg_(cfg) {
  if (cfg_.broadcast_interval == 0) cfg_.broadcast_interval = 1;
}

void LoopbackServer::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&LoopbackServer::thread_main_, this);
  log_info("loopback", "started, latency " + std::to_string(latency_ticks()) + " ticks");
}

void LoopbackServer::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
  log_info("loopback", "stopped after " + std::to_string(server_tick()) + " ticks");
}

void LoopbackServer::spawn(const PlayerSimState& s) {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = s;
  inbox_.clear();
  last_input_tick_.reset();
  queue_pose_locked_();
}

void LoopbackServer::submit(std::uint32_t client_tick, const InputState& in) {
  std::lock_guard<std::mutex> lock(mu_);
  inbox_.push_back(PendingInput{tick_ + cfg_.latency_ticks, client_tick, in});
}

void LoopbackServer::queue_pose_locked_() {
  ServerPoseEvent pose;
  pose.position = state_.pos;
  pose.yaw = state_.yaw;
  pose.pitch = state_.pitch;
  pose.on_ground = state_.on_ground;
  pose.input_tick = last_input_tick_;
  outbox_.push_back(PendingPose{tick_ + cfg_.latency_ticks, pose});
}

void LoopbackServer::step(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mu_);
  ++tick_;

  bool moved = false;
  while (!inbox_.empty() && inbox_.front().due <= tick_) {
    state_ = simulate_tick(state_, inbox_.front().input, world_);
    state_.pos += drift_;
    last_input_tick_ = inbox_.front().client_tick;
    inbox_.pop_front();
    ++processed_;
    moved = true;
  }

  bool teleported = false;
  if (teleport_) {
    state_.pos = *teleport_;
    state_.vel = Vec3{};
    state_.on_ground = false;
    teleport_.reset();
    teleported = true;
  }

  if (teleported || (moved && tick_ % cfg_.broadcast_interval == 0)) queue_pose_locked_();

  while (!outbox_.empty() && outbox_.front().due <= tick_) {
    ServerPoseEvent ev = outbox_.front().pose;
    ev.recv_time = now;
    out_.push(ev);
    outbox_.pop_front();
  }
}

void LoopbackServer::set_latency_ticks(std::uint32_t ticks) {
  std::lock_guard<std::mutex> lock(mu_);
  cfg_.latency_ticks = ticks;
}

std::uint32_t LoopbackServer::latency_ticks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cfg_.latency_ticks;
}

void LoopbackServer::set_drift(const Vec3& per_tick) {
  std::lock_guard<std::mutex> lock(mu_);
  drift_ = per_tick;
}

void LoopbackServer::request_teleport(const Vec3& target) {
  std::lock_guard<std::mutex> lock(mu_);
  teleport_ = target;
}

PlayerSimState LoopbackServer::authoritative() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::uint32_t LoopbackServer::server_tick() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tick_;
}

std::uint32_t LoopbackServer::inputs_processed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return processed_;
}

std::optional<std::uint32_t> LoopbackServer::last_input_tick() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_input_tick_;
}

void LoopbackServer::thread_main_() {
  const auto tick_ns = std::chrono::nanoseconds(static_cast<long long>(cfg_.tick_seconds * 1e9));
  auto next = Clock::now();
  while (running_.load(std::memory_order_relaxed)) {
    step(Clock::now());
    next += tick_ns;
    std::this_thread::sleep_until(next);
  }
}

} // namespace voxsim
