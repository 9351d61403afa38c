#include <voxsim/movement_packet.hpp>
#include <cmath>

namespace voxsim {

static constexpr float kRadToDeg = 180.0f / kPI;

float wrap_degrees(float deg) {
  deg = std::fmod(deg, 360.0f);
  if (deg <= -180.0f) deg += 360.0f;
  if (deg > 180.0f) deg -= 360.0f;
  return deg;
}

float protocol_yaw_deg(float yaw_rad) {
  const float d = wrap_degrees((kPI - yaw_rad) * kRadToDeg);
  return std::isfinite(d) ? d : 0.0f;
}

float protocol_pitch_deg(float pitch_rad) {
  float d = -pitch_rad * kRadToDeg;
  if (!std::isfinite(d)) d = 0.0f;
  return d < -90.0f ? -90.0f : (d > 90.0f ? 90.0f : d);
}

float client_yaw_rad(float yaw_deg) { return kPI - yaw_deg / kRadToDeg; }
float client_pitch_rad(float pitch_deg) { return -pitch_deg / kRadToDeg; }

MovementPacket MovementPacketTracker::next(const PlayerSimState& s) {
  if (pending_ack_) {
    MovementPacket ack = *pending_ack_;
    pending_ack_.reset();
    return ack;
  }

  MovementPacket p;
  p.pos = s.pos;
  p.yaw_deg = protocol_yaw_deg(s.yaw);
  p.pitch_deg = protocol_pitch_deg(s.pitch);
  p.on_ground = s.on_ground;

  bool moved = true, rotated = true;
  if (initialized_) {
    moved = (s.pos - last_pos_).length_squared() > kPosDeltaSqEps || ticks_since_pos_ >= resend_ticks_;
    rotated = std::fabs(p.yaw_deg - last_yaw_deg_) > kRotationEpsDeg ||
              std::fabs(p.pitch_deg - last_pitch_deg_) > kRotationEpsDeg;
  }

  if (moved && rotated) p.kind = MovementPacketKind::PositionLook;
  else if (moved) p.kind = MovementPacketKind::Position;
  else if (rotated) p.kind = MovementPacketKind::Look;
  else p.kind = MovementPacketKind::Ground;

  if (moved) {
    last_pos_ = s.pos;
    ticks_since_pos_ = 0;
  } else if (ticks_since_pos_ < UINT32_MAX) {
    ++ticks_since_pos_;
  }
  last_yaw_deg_ = p.yaw_deg;
  last_pitch_deg_ = p.pitch_deg;
  initialized_ = true;
  return p;
}

void MovementPacketTracker::acknowledge(const PlayerSimState& server_state) {
  MovementPacket ack;
  ack.kind = MovementPacketKind::PositionLook;
  ack.pos = server_state.pos;
  ack.yaw_deg = protocol_yaw_deg(server_state.yaw);
  ack.pitch_deg = protocol_pitch_deg(server_state.pitch);
  ack.on_ground = server_state.on_ground;
  pending_ack_ = ack;

  initialized_ = true;
  last_pos_ = ack.pos;
  last_yaw_deg_ = ack.yaw_deg;
  last_pitch_deg_ = ack.pitch_deg;
  ticks_since_pos_ = 0;
}

void MovementPacketTracker::reset() {
  initialized_ = false;
  last_pos_ = Vec3{};
  last_yaw_deg_ = 0.0f;
  last_pitch_deg_ = 0.0f;
  ticks_since_pos_ = 0;
  pending_ack_.reset();
}

} // namespace voxsim
