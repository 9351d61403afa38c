#pragma once
#include <voxsim/types.hpp>
#include <voxsim/world.hpp>

namespace voxsim {

// Movement constants. These are protocol constants: the server runs the same
// numbers, so replays only line up when they match exactly.
namespace physics {
inline constexpr float kGravity = 0.08f;
inline constexpr float kAirDrag = 0.98f;
inline constexpr float kAirFriction = 0.91f;
inline constexpr float kDefaultSlipperiness = 0.6f;
inline constexpr float kJumpImpulse = 0.42f;
inline constexpr float kJumpBoostPerLevel = 0.1f;
inline constexpr float kSprintJumpBoost = 0.2f;
inline constexpr float kWalkSpeed = 0.1f;
inline constexpr float kSprintMultiplier = 1.3f;
inline constexpr float kAirAccel = 0.02f;
inline constexpr float kGroundAccelFactor = 0.16277136f;

inline constexpr float kWaterGravity = 0.02f;
inline constexpr float kWaterDrag = 0.8f;
inline constexpr float kLavaDrag = 0.5f;
inline constexpr float kWaterSurfaceAssist = 0.3f;
inline constexpr float kSwimUpAccel = 0.04f;
inline constexpr float kWaterMoveSpeed = 0.02f;

inline constexpr float kFlyVerticalMultiplier = 3.0f;
inline constexpr float kFlyHorizontalDamping = 0.91f;
inline constexpr float kFlyVerticalDamping = 0.6f;
inline constexpr float kFlySprintMultiplier = 2.0f;

inline constexpr float kPlayerHalfWidth = 0.3f;
inline constexpr float kPlayerHeight = 1.8f;
inline constexpr float kStepHeight = 0.6f;

inline constexpr float kSneakFactor = 0.3f;
inline constexpr float kInputDamping = 0.98f;
inline constexpr float kSprintForwardThreshold = 0.8f;
inline constexpr float kSneakEdgeStep = 0.05f;
inline constexpr float kMinWishSq = 1.0e-4f;

// Thin probe below the feet used as secondary ground check.
inline constexpr float kGroundProbeTop = 0.001f;
inline constexpr float kGroundProbeBottom = 0.02f;
} // namespace physics

struct ResolveResult {
  Vec3 pos{};
  Vec3 vel{};
  bool on_ground = false;
  bool collided_horizontally = false;
  bool collided_vertically = false;
};

inline Aabb player_box(const Vec3& feet) {
  return Aabb::from_feet(feet, physics::kPlayerHalfWidth, physics::kPlayerHeight);
}

// Unit vectors on the horizontal plane for a yaw in radians.
inline Vec3 forward_dir(float yaw) { return Vec3{-std::sin(yaw), 0.0f, -std::cos(yaw)}; }
inline Vec3 right_dir(float yaw) { return Vec3{std::cos(yaw), 0.0f, -std::sin(yaw)}; }

// Sprinting only takes effect when moving forward and not sneaking.
bool effective_sprint(const InputState& in);

// Moves the player box by `vel` against the world, Y then X then Z, with
// auto-step. Velocity components that were blocked come back zeroed.
ResolveResult resolve(const WorldCollision& world, const Vec3& pos, const Vec3& vel, bool was_on_ground);

// Horizontal acceleration toward the (strafe, forward) wish vector, scaled by
// `accel` and normalized when the wish is longer than one.
void move_flying(Vec3& vel, float strafe, float forward, float accel, float yaw);

// Shrinks horizontal velocity toward zero until the box, moved by it and one
// block down, still rests on something. No-op on an empty world.
Vec3 clamp_sneak_edge_velocity(const WorldCollision& world, const Vec3& pos, Vec3 vel);

// Thin probe just below the feet.
bool ground_probe(const WorldCollision& world, const Vec3& pos);

// One fixed step of player movement.
PlayerSimState simulate_tick(const PlayerSimState& prev, const InputState& in, const WorldCollision& world);

} // namespace voxsim
