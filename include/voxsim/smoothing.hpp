#pragma once
#include <cmath>
#include <voxsim/types.hpp>

namespace voxsim {

// Render-only positional delta that eases a physics correction out over
// time. Never fed back into the simulation.
class VisualOffset {
public:
  static constexpr float kDefaultDecay = 0.15f;
  static constexpr float kTicksPerSecond = 20.0f;

  explicit VisualOffset(float decay = kDefaultDecay) : decay_(decay) {}

  void add(const Vec3& delta) { offset_ += delta; }

  // Per-frame exponential falloff: (1 - decay)^(dt * 20).
  void decay(float dt_sec) {
    if (dt_sec <= 0.0f) return;
    offset_ *= std::pow(1.0f - decay_, dt_sec * kTicksPerSecond);
  }

  void reset() { offset_ = Vec3{}; }

  const Vec3& value() const { return offset_; }
  float length() const { return offset_.length(); }
  float decay_rate() const { return decay_; }

private:
  float decay_;
  Vec3 offset_{};
};

// Pose to draw between two fixed steps: lerp by the overstep fraction, then
// add the visual offset.
inline Vec3 render_position(const Vec3& previous, const Vec3& current, float alpha, const Vec3& offset) {
  const float t = alpha < 0.0f ? 0.0f : (alpha > 1.0f ? 1.0f : alpha);
  return lerp(previous, current, t) + offset;
}

} // namespace voxsim
