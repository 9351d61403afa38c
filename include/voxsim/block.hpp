#pragma once
#include <cstdint>
#include <vector>
#include <voxsim/aabb.hpp>

namespace voxsim {

class WorldCollision;

// Block state: low 4 bits = meta (variant), remaining bits = block id.
inline constexpr std::uint16_t block_id(std::uint16_t state) { return static_cast<std::uint16_t>(state >> 4); }
inline constexpr std::uint8_t block_meta(std::uint16_t state) { return static_cast<std::uint8_t>(state & 0xF); }
inline constexpr std::uint16_t block_state(std::uint16_t id, std::uint8_t meta = 0) {
  return static_cast<std::uint16_t>((id << 4) | (meta & 0xF));
}

namespace blocks {
inline constexpr std::uint16_t kAir = 0;
inline constexpr std::uint16_t kStone = 1;
inline constexpr std::uint16_t kGrass = 2;
inline constexpr std::uint16_t kDirt = 3;
inline constexpr std::uint16_t kFlowingWater = 8;
inline constexpr std::uint16_t kWater = 9;
inline constexpr std::uint16_t kFlowingLava = 10;
inline constexpr std::uint16_t kLava = 11;
inline constexpr std::uint16_t kGlass = 20;
inline constexpr std::uint16_t kStoneSlab = 44;
inline constexpr std::uint16_t kOakStairs = 53;
inline constexpr std::uint16_t kOakDoor = 64;
inline constexpr std::uint16_t kLadder = 65;
inline constexpr std::uint16_t kSnowLayer = 78;
inline constexpr std::uint16_t kIce = 79;
inline constexpr std::uint16_t kOakFence = 85;
inline constexpr std::uint16_t kTrapdoor = 96;
inline constexpr std::uint16_t kIronBars = 101;
inline constexpr std::uint16_t kGlassPane = 102;
inline constexpr std::uint16_t kOakFenceGate = 107;
inline constexpr std::uint16_t kNetherBrickFence = 113;
inline constexpr std::uint16_t kCobblestoneWall = 139;
inline constexpr std::uint16_t kSlime = 165;
inline constexpr std::uint16_t kCarpet = 171;
inline constexpr std::uint16_t kPackedIce = 174;
} // namespace blocks

enum class BlockShape : std::uint8_t {
  Empty,      // no collision
  FullCube,
  Slab,
  Stairs,
  Fence,
  FenceGate,
  Wall,
  Pane,
  Door,
  Trapdoor,
  Partial     // single box shorter or narrower than a cube
};

BlockShape block_shape(std::uint16_t id);

inline bool is_air(std::uint16_t id) { return id == blocks::kAir; }
inline bool is_water(std::uint16_t id) { return id == blocks::kFlowingWater || id == blocks::kWater; }
inline bool is_lava(std::uint16_t id) { return id == blocks::kFlowingLava || id == blocks::kLava; }
inline bool is_liquid(std::uint16_t id) { return is_water(id) || is_lava(id); }

// True when the block contributes any collision geometry.
inline bool is_solid(std::uint16_t id) { return block_shape(id) != BlockShape::Empty; }
inline bool is_full_cube(std::uint16_t id) { return block_shape(id) == BlockShape::FullCube; }

// Full cube that is not translucent (glass, leaves, ice...). Fences, walls
// and panes attach to these.
bool is_opaque_full_cube(std::uint16_t id);

// Ground friction base value (multiplied by 0.91 per tick by the resolver).
float slipperiness(std::uint16_t id);

// Appends the world-space collision boxes of the block at (x, y, z) whose
// state is `state`. Neighbours are read through `world` for connection rules.
void collision_boxes(const WorldCollision& world, int x, int y, int z,
                     std::uint16_t state, std::vector<Aabb>& out);

} // namespace voxsim
