#include <voxsim/reconcile.hpp>
#include <voxsim/movement.hpp>

namespace voxsim {

// Frame at tick, else the nearest older frame still held by the ring.
static std::optional<PredictedFrame> find_frame(const PredictionBuffer& buffer, std::uint32_t tick) {
  if (auto f = buffer.get_by_tick(tick)) return f;
  std::uint32_t t = tick;
  for (std::size_t n = 0; n < buffer.capacity() && t > 0; ++n) {
    --t;
    if (auto f = buffer.get_by_tick(t)) return f;
  }
  return std::nullopt;
}

std::optional<ReconcileResult> reconcile(PredictionBuffer& buffer,
                                         const WorldCollision& world,
                                         std::uint32_t server_tick,
                                         const PlayerSimState& server_state,
                                         std::uint32_t client_tick,
                                         PlayerSimState& current_state,
                                         const ReconcileThresholds& thresholds) {
  const auto predicted = find_frame(buffer, server_tick);
  if (!predicted) return std::nullopt;

  const Vec3 error = server_state.pos - predicted->state.pos;
  const float dist = error.length();
  if (dist < thresholds.noise_floor) return std::nullopt;

  ReconcileResult r;
  r.correction = error;

  if (dist >= thresholds.hard_teleport_distance) {
    current_state = server_state;
    buffer.truncate_older_than(server_tick);
    r.hard_teleport = true;
    return r;
  }

  if (auto* anchor = buffer.get_by_tick_mut(server_tick)) anchor->state = server_state;

  PlayerSimState s = server_state;
  for (std::uint32_t t = server_tick + 1; client_tick > server_tick && t <= client_tick; ++t) {
    PredictedFrame* frame = buffer.get_by_tick_mut(t);
    const InputState input = frame ? frame->input : InputState{};
    s = simulate_tick(s, input, world);
    if (frame) frame->state = s;
    ++r.replayed_ticks;
    if (t == client_tick) break; // client_tick may be UINT32_MAX
  }
  current_state = s;
  return r;
}

} // namespace voxsim
