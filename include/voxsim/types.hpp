#pragma once
#include <cmath>
#include <cstdint>
#include <numbers>
#include <optional>

namespace voxsim {

inline constexpr float kPI  = std::numbers::pi_v<float>;
inline constexpr float kTAU = 2.0f * kPI;

struct Vec3 {
  float x{};
  float y{};
  float z{};

  Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }
  Vec3& operator-=(const Vec3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
  Vec3& operator*=(float s) { x *= s; y *= s; z *= s; return *this; }

  float length_squared() const { return x * x + y * y + z * z; }
  float length() const { return std::sqrt(length_squared()); }
};

inline Vec3 operator+(Vec3 a, const Vec3& b) { return a += b; }
inline Vec3 operator-(Vec3 a, const Vec3& b) { return a -= b; }
inline Vec3 operator*(Vec3 a, float s) { return a *= s; }
inline Vec3 operator*(float s, Vec3 a) { return a *= s; }
inline Vec3 operator-(const Vec3& a) { return Vec3{-a.x, -a.y, -a.z}; }
inline bool operator==(const Vec3& a, const Vec3& b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline Vec3 lerp(const Vec3& a, const Vec3& b, float t) {
  return Vec3{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t, a.z + (b.z - a.z) * t};
}

// Per-tick intent sample. Immutable once captured for a tick.
struct InputState {
  float forward = 0.0f;         // -1..1
  float strafe = 0.0f;          // -1..1, positive = right
  bool jump = false;
  bool sprint = false;
  bool sneak = false;
  bool can_fly = false;
  bool flying = false;
  float flying_speed = 0.05f;
  float speed_multiplier = 1.0f;            // speed effect, 1.0 = none
  std::optional<std::uint8_t> jump_boost;   // jump boost amplifier
  float yaw = 0.0f;             // radians
  float pitch = 0.0f;           // radians
};

// Kinematic snapshot. vel is displacement per tick.
struct PlayerSimState {
  Vec3 pos{};
  Vec3 vel{};
  bool on_ground = false;
  float yaw = 0.0f;
  float pitch = 0.0f;
};

struct PredictedFrame {
  std::uint32_t tick = 0;
  InputState input{};
  PlayerSimState state{};
};

} // namespace voxsim
