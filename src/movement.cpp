#include <voxsim/movement.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace voxsim {

using namespace physics;

bool effective_sprint(const InputState& in) {
  return in.sprint && !in.sneak && in.forward >= kSprintForwardThreshold;
}

void move_flying(Vec3& vel, float strafe, float forward, float accel, float yaw) {
  float f = strafe * strafe + forward * forward;
  if (f < kMinWishSq) return;
  f = std::max(std::sqrt(f), 1.0f);
  f = accel / f;
  strafe *= f;
  forward *= f;
  vel += forward_dir(yaw) * forward;
  vel += right_dir(yaw) * strafe;
}

bool ground_probe(const WorldCollision& world, const Vec3& pos) {
  const Aabb probe{{pos.x - kPlayerHalfWidth, pos.y - kGroundProbeBottom, pos.z - kPlayerHalfWidth},
                   {pos.x + kPlayerHalfWidth, pos.y - kGroundProbeTop, pos.z + kPlayerHalfWidth}};
  return world.collides(probe);
}

static float clip_y_all(const std::vector<Aabb>& boxes, Aabb& bb, float dy) {
  for (const auto& b : boxes) dy = b.clip_y(bb, dy);
  bb = bb.offset(0.0f, dy, 0.0f);
  return dy;
}

static float clip_x_all(const std::vector<Aabb>& boxes, Aabb& bb, float dx) {
  for (const auto& b : boxes) dx = b.clip_x(bb, dx);
  bb = bb.offset(dx, 0.0f, 0.0f);
  return dx;
}

static float clip_z_all(const std::vector<Aabb>& boxes, Aabb& bb, float dz) {
  for (const auto& b : boxes) dz = b.clip_z(bb, dz);
  bb = bb.offset(0.0f, 0.0f, dz);
  return dz;
}

ResolveResult resolve(const WorldCollision& world, const Vec3& pos, const Vec3& vel, bool was_on_ground) {
  const float ox = vel.x, oy = vel.y, oz = vel.z;
  const Aabb start = player_box(pos);

  std::vector<Aabb> boxes;
  world.collect_boxes(start.expand_toward(ox, oy, oz), boxes);

  Aabb bb = start;
  float dy = clip_y_all(boxes, bb, oy);
  float dx = clip_x_all(boxes, bb, ox);
  float dz = clip_z_all(boxes, bb, oz);

  const bool can_step = was_on_ground || (dy != oy && oy < 0.0f);
  if (can_step && (dx != ox || dz != oz)) {
    const float flat_dx = dx, flat_dy = dy, flat_dz = dz;
    const Aabb flat_bb = bb;

    std::vector<Aabb> step_boxes;
    world.collect_boxes(start.expand_toward(ox, kStepHeight, oz), step_boxes);

    // Variant A: rise measured against the box swept horizontally.
    Aabb bb_a = start;
    Aabb swept = start.expand_toward(ox, 0.0f, oz);
    float up_a = kStepHeight;
    for (const auto& b : step_boxes) up_a = b.clip_y(swept, up_a);
    bb_a = bb_a.offset(0.0f, up_a, 0.0f);
    const float dx_a = clip_x_all(step_boxes, bb_a, ox);
    const float dz_a = clip_z_all(step_boxes, bb_a, oz);

    // Variant B: plain rise from the start box.
    Aabb bb_b = start;
    const float up_b = clip_y_all(step_boxes, bb_b, kStepHeight);
    const float dx_b = clip_x_all(step_boxes, bb_b, ox);
    const float dz_b = clip_z_all(step_boxes, bb_b, oz);

    float up;
    if (dx_a * dx_a + dz_a * dz_a > dx_b * dx_b + dz_b * dz_b) {
      dx = dx_a; dz = dz_a; up = up_a; bb = bb_a;
    } else {
      dx = dx_b; dz = dz_b; up = up_b; bb = bb_b;
    }
    // Settle back down onto whatever was stepped onto.
    const float down = clip_y_all(step_boxes, bb, -up);
    dy = up + down;

    if (flat_dx * flat_dx + flat_dz * flat_dz >= dx * dx + dz * dz) {
      dx = flat_dx; dy = flat_dy; dz = flat_dz; bb = flat_bb;
    }
  }

  ResolveResult r;
  r.pos = Vec3{pos.x + (bb.min.x - start.min.x), pos.y + (bb.min.y - start.min.y),
               pos.z + (bb.min.z - start.min.z)};
  r.vel = vel;
  r.collided_horizontally = dx != ox || dz != oz;
  r.collided_vertically = dy != oy;
  if (dx != ox) r.vel.x = 0.0f;
  if (dy != oy) r.vel.y = 0.0f;
  if (dz != oz) r.vel.z = 0.0f;
  r.on_ground = (r.collided_vertically && oy < 0.0f) || ground_probe(world, r.pos);
  return r;
}

static float step_toward_zero(float v) {
  if (v < kSneakEdgeStep && v >= -kSneakEdgeStep) return 0.0f;
  return v > 0.0f ? v - kSneakEdgeStep : v + kSneakEdgeStep;
}

Vec3 clamp_sneak_edge_velocity(const WorldCollision& world, const Vec3& pos, Vec3 vel) {
  if (!world.has_source()) return vel;
  const Aabb bb = player_box(pos);
  auto unsupported = [&](float dx, float dz) { return !world.collides(bb.offset(dx, -1.0f, dz)); };

  while (vel.x != 0.0f && unsupported(vel.x, 0.0f)) vel.x = step_toward_zero(vel.x);
  while (vel.z != 0.0f && unsupported(0.0f, vel.z)) vel.z = step_toward_zero(vel.z);
  while (vel.x != 0.0f && vel.z != 0.0f && unsupported(vel.x, vel.z)) {
    vel.x = step_toward_zero(vel.x);
    vel.z = step_toward_zero(vel.z);
  }
  return vel;
}

namespace {

struct Wish {
  float forward;
  float strafe;
};

Wish wish_from_input(const InputState& in) {
  float forward = in.forward, strafe = in.strafe;
  const float len = std::sqrt(forward * forward + strafe * strafe);
  if (len > 1.0f) { forward /= len; strafe /= len; }
  if (in.sneak) { forward *= kSneakFactor; strafe *= kSneakFactor; }
  return Wish{forward * kInputDamping, strafe * kInputDamping};
}

float jump_impulse(const InputState& in) {
  float v = kJumpImpulse;
  if (in.jump_boost) v += kJumpBoostPerLevel * (static_cast<float>(*in.jump_boost) + 1.0f);
  return v;
}

void apply_resolve(PlayerSimState& s, const ResolveResult& r) {
  s.pos = r.pos;
  s.vel = r.vel;
  s.on_ground = r.on_ground;
}

PlayerSimState simulate_flying(PlayerSimState s, const InputState& in, const Wish& wish,
                               const WorldCollision& world) {
  const float vertical = (in.jump ? 1.0f : 0.0f) - (in.sneak ? 1.0f : 0.0f);
  s.vel.y += vertical * in.flying_speed * kFlyVerticalMultiplier;
  const float accel = in.flying_speed * (in.sprint ? kFlySprintMultiplier : 1.0f);
  move_flying(s.vel, wish.strafe, wish.forward, accel, s.yaw);

  apply_resolve(s, resolve(world, s.pos, s.vel, s.on_ground));
  s.vel.y *= kFlyVerticalDamping;
  s.vel.x *= kFlyHorizontalDamping;
  s.vel.z *= kFlyHorizontalDamping;
  return s;
}

PlayerSimState simulate_liquid(PlayerSimState s, const Wish& wish, float drag,
                               const WorldCollision& world) {
  const float start_y = s.pos.y;
  move_flying(s.vel, wish.strafe, wish.forward, kWaterMoveSpeed, s.yaw);
  const ResolveResult r = resolve(world, s.pos, s.vel, s.on_ground);
  apply_resolve(s, r);

  s.vel *= drag;
  s.vel.y -= kWaterGravity;
  if (r.collided_horizontally) {
    // Climb out when the spot just above the ledge is open.
    const Aabb probe = player_box(s.pos).offset(s.vel.x, s.vel.y + kStepHeight - s.pos.y + start_y, s.vel.z);
    if (world.is_offset_position_free(probe)) s.vel.y = kWaterSurfaceAssist;
  }
  return s;
}

} // namespace

PlayerSimState simulate_tick(const PlayerSimState& prev, const InputState& in, const WorldCollision& world) {
  PlayerSimState s = prev;
  s.yaw = in.yaw;
  s.pitch = in.pitch;

  const Wish wish = wish_from_input(in);
  if (in.can_fly && in.flying) return simulate_flying(s, in, wish, world);

  const bool in_water = world.is_in_water(s.pos);
  const bool in_lava = !in_water && world.is_in_lava(s.pos);
  const bool sprint = effective_sprint(in);

  if (in.jump) {
    if (in_water || in_lava) {
      s.vel.y += kSwimUpAccel;
    } else if (s.on_ground) {
      s.vel.y = jump_impulse(in);
      if (sprint) s.vel += forward_dir(s.yaw) * kSprintJumpBoost;
    }
  }

  if (in_water) return simulate_liquid(s, wish, kWaterDrag, world);
  if (in_lava) return simulate_liquid(s, wish, kLavaDrag, world);

  float f4 = s.on_ground ? world.slipperiness_below(s.pos) * kAirFriction : kAirFriction;
  const float sprint_mult = sprint ? kSprintMultiplier : 1.0f;
  const float accel = s.on_ground
      ? kWalkSpeed * in.speed_multiplier * sprint_mult * (kGroundAccelFactor / (f4 * f4 * f4))
      : kAirAccel * sprint_mult;
  move_flying(s.vel, wish.strafe, wish.forward, accel, s.yaw);

  if (s.on_ground && in.sneak) s.vel = clamp_sneak_edge_velocity(world, s.pos, s.vel);

  apply_resolve(s, resolve(world, s.pos, s.vel, s.on_ground));

  if (!s.on_ground) s.vel.y -= kGravity;
  s.vel.y *= kAirDrag;
  f4 = s.on_ground ? world.slipperiness_below(s.pos) * kAirFriction : kAirFriction;
  s.vel.x *= f4;
  s.vel.z *= f4;
  return s;
}

} // namespace voxsim
