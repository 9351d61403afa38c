#pragma once
#include <voxsim/types.hpp>

namespace voxsim {

// Axis-aligned box in world space (blocks are unit cells).
struct Aabb {
  Vec3 min{};
  Vec3 max{};

  static Aabb from_feet(const Vec3& feet, float half_width, float height) {
    return Aabb{{feet.x - half_width, feet.y, feet.z - half_width},
                {feet.x + half_width, feet.y + height, feet.z + half_width}};
  }

  Aabb offset(float dx, float dy, float dz) const {
    return Aabb{{min.x + dx, min.y + dy, min.z + dz}, {max.x + dx, max.y + dy, max.z + dz}};
  }
  Aabb offset(const Vec3& d) const { return offset(d.x, d.y, d.z); }

  // Grows the box in the direction of travel (swept broad phase).
  Aabb expand_toward(float dx, float dy, float dz) const {
    Aabb r = *this;
    if (dx < 0.0f) r.min.x += dx; else r.max.x += dx;
    if (dy < 0.0f) r.min.y += dy; else r.max.y += dy;
    if (dz < 0.0f) r.min.z += dz; else r.max.z += dz;
    return r;
  }

  bool intersects(const Aabb& o) const {
    return o.max.x > min.x && o.min.x < max.x &&
           o.max.y > min.y && o.min.y < max.y &&
           o.max.z > min.z && o.min.z < max.z;
  }

  // Clip a mover's displacement along one axis against this box. The mover
  // must overlap this box on the two other axes for the clip to apply.
  float clip_x(const Aabb& mover, float dx) const {
    if (mover.max.y <= min.y || mover.min.y >= max.y) return dx;
    if (mover.max.z <= min.z || mover.min.z >= max.z) return dx;
    if (dx > 0.0f && mover.max.x <= min.x) {
      const float d = min.x - mover.max.x;
      if (d < dx) dx = d;
    } else if (dx < 0.0f && mover.min.x >= max.x) {
      const float d = max.x - mover.min.x;
      if (d > dx) dx = d;
    }
    return dx;
  }

  float clip_y(const Aabb& mover, float dy) const {
    if (mover.max.x <= min.x || mover.min.x >= max.x) return dy;
    if (mover.max.z <= min.z || mover.min.z >= max.z) return dy;
    if (dy > 0.0f && mover.max.y <= min.y) {
      const float d = min.y - mover.max.y;
      if (d < dy) dy = d;
    } else if (dy < 0.0f && mover.min.y >= max.y) {
      const float d = max.y - mover.min.y;
      if (d > dy) dy = d;
    }
    return dy;
  }

  float clip_z(const Aabb& mover, float dz) const {
    if (mover.max.x <= min.x || mover.min.x >= max.x) return dz;
    if (mover.max.y <= min.y || mover.min.y >= max.y) return dz;
    if (dz > 0.0f && mover.max.z <= min.z) {
      const float d = min.z - mover.max.z;
      if (d < dz) dz = d;
    } else if (dz < 0.0f && mover.min.z >= max.z) {
      const float d = max.z - mover.min.z;
      if (d > dz) dz = d;
    }
    return dz;
  }
};

} // namespace voxsim
