#include <voxsim/block.hpp>
#include <voxsim/world.hpp>

namespace voxsim {

BlockShape block_shape(std::uint16_t id) {
  switch (id) {
    // Air, liquids, plants, torches, rails, signs, buttons, plates, wire,
    // portals, vines, tripwire, crops, banners.
    case 0: case 6: case 8: case 9: case 10: case 11:
    case 27: case 28: case 30: case 31: case 32: case 36: case 37: case 38:
    case 39: case 40: case 50: case 51: case 55: case 59: case 63: case 66:
    case 68: case 69: case 70: case 72: case 75: case 76: case 77: case 83:
    case 90: case 104: case 105: case 106: case 115: case 119: case 131:
    case 132: case 141: case 142: case 143: case 147: case 148: case 157:
    case 175: case 176: case 177:
      return BlockShape::Empty;

    case 44: case 126: case 182:
      return BlockShape::Slab;

    case 53: case 67: case 108: case 109: case 114: case 128: case 134:
    case 135: case 136: case 156: case 163: case 164: case 180:
      return BlockShape::Stairs;

    case 85: case 113: case 188: case 189: case 190: case 191: case 192:
      return BlockShape::Fence;

    case 107: case 183: case 184: case 185: case 186: case 187:
      return BlockShape::FenceGate;

    case 139:
      return BlockShape::Wall;

    case 101: case 102: case 160:
      return BlockShape::Pane;

    case 64: case 71: case 193: case 194: case 195: case 196: case 197:
      return BlockShape::Door;

    case 96: case 167:
      return BlockShape::Trapdoor;

    case 26: case 54: case 65: case 78: case 81: case 88: case 92: case 93:
    case 94: case 111: case 116: case 120: case 130: case 140: case 146:
    case 149: case 150: case 151: case 171: case 178:
      return BlockShape::Partial;

    default:
      return BlockShape::FullCube;
  }
}

bool is_opaque_full_cube(std::uint16_t id) {
  if (!is_full_cube(id)) return false;
  switch (id) {
    case 18: case 161:            // leaves
    case 20: case 95:             // glass
    case 46: case 79: case 89:    // tnt, ice, glowstone
    case 138: case 165:           // beacon, slime
      return false;
    default:
      return true;
  }
}

float slipperiness(std::uint16_t id) {
  switch (id) {
    case blocks::kIce:
    case blocks::kPackedIce: return 0.98f;
    case blocks::kSlime: return 0.8f;
    default: return 0.6f;
  }
}

namespace {

struct Local {
  int x, y, z;
  std::vector<Aabb>& out;
  void add(float x0, float y0, float z0, float x1, float y1, float z1) const {
    out.push_back(Aabb{{x + x0, y + y0, z + z0}, {x + x1, y + y1, z + z1}});
  }
};

bool is_fence(std::uint16_t id) { return block_shape(id) == BlockShape::Fence; }
bool is_gate(std::uint16_t id) { return block_shape(id) == BlockShape::FenceGate; }

bool is_gourd(std::uint16_t id) { return id == 86 || id == 91 || id == 103; }

bool fence_connects(std::uint16_t self, std::uint16_t other) {
  if (other == 166) return false; // barrier
  if (is_fence(other)) {
    // Nether brick fences only join each other.
    const bool self_nether = self == blocks::kNetherBrickFence;
    const bool other_nether = other == blocks::kNetherBrickFence;
    return self_nether == other_nether;
  }
  if (is_gate(other)) return true;
  return is_opaque_full_cube(other) && !is_gourd(other);
}

bool wall_connects(std::uint16_t other) {
  if (other == 166) return false;
  if (other == blocks::kCobblestoneWall || is_gate(other)) return true;
  return is_opaque_full_cube(other) && !is_gourd(other);
}

bool pane_connects(std::uint16_t other) {
  return is_opaque_full_cube(other) || block_shape(other) == BlockShape::Pane ||
         other == blocks::kGlass || other == 95;
}

struct Neighbours {
  std::uint16_t north, south, west, east;
};

Neighbours neighbours(const WorldCollision& w, int x, int y, int z) {
  return Neighbours{w.block_id_at(x, y, z - 1), w.block_id_at(x, y, z + 1),
                    w.block_id_at(x - 1, y, z), w.block_id_at(x + 1, y, z)};
}

void slab_boxes(const Local& l, std::uint8_t meta) {
  if (meta & 0x8) l.add(0, 0.5f, 0, 1, 1, 1);
  else l.add(0, 0, 0, 1, 0.5f, 1);
}

void stair_boxes(const Local& l, std::uint8_t meta) {
  const bool upside_down = (meta & 0x4) != 0;
  const float base0 = upside_down ? 0.5f : 0.0f;
  const float step0 = upside_down ? 0.0f : 0.5f;
  l.add(0, base0, 0, 1, base0 + 0.5f, 1);
  switch (meta & 0x3) {
    case 0: l.add(0.5f, step0, 0, 1, step0 + 0.5f, 1); break;  // east
    case 1: l.add(0, step0, 0, 0.5f, step0 + 0.5f, 1); break;  // west
    case 2: l.add(0, step0, 0.5f, 1, step0 + 0.5f, 1); break;  // south
    default: l.add(0, step0, 0, 1, step0 + 0.5f, 0.5f); break; // north
  }
}

void fence_boxes(const Local& l, const WorldCollision& w, std::uint16_t id) {
  const Neighbours n = neighbours(w, l.x, l.y, l.z);
  const bool north = fence_connects(id, n.north);
  const bool south = fence_connects(id, n.south);
  const bool west = fence_connects(id, n.west);
  const bool east = fence_connects(id, n.east);

  float x0 = 0.375f, x1 = 0.625f;
  if (north || south) {
    l.add(x0, 0, north ? 0.0f : 0.375f, x1, 1.5f, south ? 1.0f : 0.625f);
  }
  if (west) x0 = 0.0f;
  if (east) x1 = 1.0f;
  if (west || east || (!north && !south)) {
    l.add(x0, 0, 0.375f, x1, 1.5f, 0.625f);
  }
}

void gate_boxes(const Local& l, std::uint8_t meta) {
  if (meta & 0x4) return; // open
  if ((meta & 0x1) == 0) l.add(0, 0, 0.375f, 1, 1.5f, 0.625f);
  else l.add(0.375f, 0, 0, 0.625f, 1.5f, 1);
}

void wall_boxes(const Local& l, const WorldCollision& w) {
  const Neighbours n = neighbours(w, l.x, l.y, l.z);
  const bool north = wall_connects(n.north);
  const bool south = wall_connects(n.south);
  const bool west = wall_connects(n.west);
  const bool east = wall_connects(n.east);

  float x0 = 0.25f, x1 = 0.75f, z0 = 0.25f, z1 = 0.75f;
  if (north) z0 = 0.0f;
  if (south) z1 = 1.0f;
  if (west) x0 = 0.0f;
  if (east) x1 = 1.0f;
  // Straight runs are a thinner slab.
  if (north && south && !west && !east) { x0 = 0.3125f; x1 = 0.6875f; }
  else if (!north && !south && west && east) { z0 = 0.3125f; z1 = 0.6875f; }
  l.add(x0, 0, z0, x1, 1.5f, z1);
}

void pane_boxes(const Local& l, const WorldCollision& w) {
  const Neighbours n = neighbours(w, l.x, l.y, l.z);
  const bool north = pane_connects(n.north);
  const bool south = pane_connects(n.south);
  const bool west = pane_connects(n.west);
  const bool east = pane_connects(n.east);
  const bool any = north || south || west || east;

  if ((!west || !east) && any) {
    if (west) l.add(0, 0, 0.4375f, 0.5f, 1, 0.5625f);
    else if (east) l.add(0.5f, 0, 0.4375f, 1, 1, 0.5625f);
  } else {
    l.add(0, 0, 0.4375f, 1, 1, 0.5625f);
  }
  if ((!north || !south) && any) {
    if (north) l.add(0.4375f, 0, 0, 0.5625f, 1, 0.5f);
    else if (south) l.add(0.4375f, 0, 0.5f, 0.5625f, 1, 1);
  } else {
    l.add(0.4375f, 0, 0, 0.5625f, 1, 1);
  }
}

void door_boxes(const Local& l, const WorldCollision& w, std::uint16_t id, std::uint8_t meta) {
  // Facing and open state live in the lower half, hinge side in the upper.
  std::uint8_t lower = meta, upper = meta;
  if (meta & 0x8) {
    const std::uint16_t below = w.block_at(l.x, l.y - 1, l.z);
    lower = block_id(below) == id ? block_meta(below) : 0;
  } else {
    const std::uint16_t above = w.block_at(l.x, l.y + 1, l.z);
    upper = block_id(above) == id ? block_meta(above) : 0x8;
  }
  const int facing = lower & 0x3; // 0 east, 1 south, 2 west, 3 north
  const bool open = (lower & 0x4) != 0;
  const bool hinge = (upper & 0x1) != 0;
  constexpr float t = 0.1875f;

  auto east_side = [&] { l.add(1 - t, 0, 0, 1, 1, 1); };
  auto west_side = [&] { l.add(0, 0, 0, t, 1, 1); };
  auto south_side = [&] { l.add(0, 0, 1 - t, 1, 1, 1); };
  auto north_side = [&] { l.add(0, 0, 0, 1, 1, t); };

  if (!open) {
    switch (facing) {
      case 0: west_side(); break;
      case 1: north_side(); break;
      case 2: east_side(); break;
      default: south_side(); break;
    }
    return;
  }
  switch (facing) {
    case 0: hinge ? south_side() : north_side(); break;
    case 1: hinge ? west_side() : east_side(); break;
    case 2: hinge ? north_side() : south_side(); break;
    default: hinge ? east_side() : west_side(); break;
  }
}

void trapdoor_boxes(const Local& l, std::uint8_t meta) {
  constexpr float t = 0.1875f;
  if (meta & 0x4) {
    switch (meta & 0x3) {
      case 0: l.add(0, 0, 1 - t, 1, 1, 1); break;
      case 1: l.add(0, 0, 0, 1, 1, t); break;
      case 2: l.add(1 - t, 0, 0, 1, 1, 1); break;
      default: l.add(0, 0, 0, t, 1, 1); break;
    }
  } else if (meta & 0x8) {
    l.add(0, 1 - t, 0, 1, 1, 1);
  } else {
    l.add(0, 0, 0, 1, t, 1);
  }
}

void ladder_boxes(const Local& l, std::uint8_t meta) {
  constexpr float t = 0.125f;
  switch (meta) {
    case 2: l.add(0, 0, 1 - t, 1, 1, 1); break;
    case 3: l.add(0, 0, 0, 1, 1, t); break;
    case 4: l.add(1 - t, 0, 0, 1, 1, 1); break;
    default: l.add(0, 0, 0, t, 1, 1); break;
  }
}

void partial_boxes(const Local& l, std::uint16_t id, std::uint8_t meta) {
  constexpr float px = 1.0f / 16.0f;
  switch (id) {
    case 78: l.add(0, 0, 0, 1, (meta & 0x7) * 0.125f, 1); break;
    case 171: l.add(0, 0, 0, 1, px, 1); break;
    case 88: l.add(0, 0, 0, 1, 0.875f, 1); break;
    case 81: l.add(px, 0, px, 1 - px, 1 - px, 1 - px); break;
    case 54: case 130: case 146: l.add(px, 0, px, 1 - px, 0.875f, 1 - px); break;
    case 26: l.add(0, 0, 0, 1, 0.5625f, 1); break;
    case 116: l.add(0, 0, 0, 1, 0.75f, 1); break;
    case 120: l.add(0, 0, 0, 1, 0.8125f, 1); break;
    case 151: case 178: l.add(0, 0, 0, 1, 0.375f, 1); break;
    case 111: l.add(0, 0, 0, 1, 0.015625f, 1); break;
    case 92: l.add((1 + (meta & 0x7) * 2) * px, 0, px, 1 - px, 0.5f, 1 - px); break;
    case 93: case 94: case 149: case 150: l.add(0, 0, 0, 1, 0.125f, 1); break;
    case 140: l.add(0.3125f, 0, 0.3125f, 0.6875f, 0.375f, 0.6875f); break;
    case blocks::kLadder: ladder_boxes(l, meta); break;
    default: l.add(0, 0, 0, 1, 1, 1); break;
  }
}

} // namespace

void collision_boxes(const WorldCollision& world, int x, int y, int z,
                     std::uint16_t state, std::vector<Aabb>& out) {
  const std::uint16_t id = block_id(state);
  const std::uint8_t meta = block_meta(state);
  const Local l{x, y, z, out};
  switch (block_shape(id)) {
    case BlockShape::Empty: break;
    case BlockShape::FullCube: l.add(0, 0, 0, 1, 1, 1); break;
    case BlockShape::Slab: slab_boxes(l, meta); break;
    case BlockShape::Stairs: stair_boxes(l, meta); break;
    case BlockShape::Fence: fence_boxes(l, world, id); break;
    case BlockShape::FenceGate: gate_boxes(l, meta); break;
    case BlockShape::Wall: wall_boxes(l, world); break;
    case BlockShape::Pane: pane_boxes(l, world); break;
    case BlockShape::Door: door_boxes(l, world, id, meta); break;
    case BlockShape::Trapdoor: trapdoor_boxes(l, meta); break;
    case BlockShape::Partial: partial_boxes(l, id, meta); break;
  }
}

} // namespace voxsim
