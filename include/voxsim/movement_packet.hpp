#pragma once
#include <cstdint>
#include <optional>
#include <voxsim/types.hpp>

namespace voxsim {

enum class MovementPacketKind : std::uint8_t { PositionLook, Position, Look, Ground };

// What the send collaborator serializes this tick. Angles in protocol degrees.
struct MovementPacket {
  MovementPacketKind kind = MovementPacketKind::Ground;
  Vec3 pos{};
  float yaw_deg = 0.0f;
  float pitch_deg = 0.0f;
  bool on_ground = false;
};

// Sneak/sprint state changes the server must be told about.
enum class EntityAction : std::uint8_t { StartSneaking, StopSneaking, StartSprinting, StopSprinting };

// Wraps into (-180, 180].
float wrap_degrees(float deg);
// Client yaw (radians) to protocol yaw (degrees); non-finite becomes 0.
float protocol_yaw_deg(float yaw_rad);
// Client pitch (radians) to protocol pitch clamped to [-90, 90].
float protocol_pitch_deg(float pitch_rad);
// Inverse of protocol_yaw_deg / protocol_pitch_deg.
float client_yaw_rad(float yaw_deg);
float client_pitch_rad(float pitch_deg);

// Chooses the smallest movement message that keeps the server in sync.
class MovementPacketTracker {
public:
  static constexpr float kPosDeltaSqEps = 9.0e-4f;
  static constexpr float kRotationEpsDeg = 0.001f;
  static constexpr std::uint32_t kDefaultResendTicks = 20;

  explicit MovementPacketTracker(std::uint32_t resend_ticks = kDefaultResendTicks)
    : resend_ticks_(resend_ticks) {}

  MovementPacket next(const PlayerSimState& s);

  // After the server moved us, echo the pose back once on the next send.
  void acknowledge(const PlayerSimState& server_state);

  void reset();
  bool initialized() const { return initialized_; }
  std::uint32_t ticks_since_position() const { return ticks_since_pos_; }

private:
  std::uint32_t resend_ticks_;
  bool initialized_ = false;
  Vec3 last_pos_{};
  float last_yaw_deg_ = 0.0f;
  float last_pitch_deg_ = 0.0f;
  std::uint32_t ticks_since_pos_ = 0;
  std::optional<MovementPacket> pending_ack_;
};

} // namespace voxsim
