#pragma once
#include <array>
#include <cstdint>
#include <unordered_map>
#include <vector>
#include <voxsim/aabb.hpp>
#include <voxsim/types.hpp>

namespace voxsim {

// Read-only block lookup. Implementations must tolerate concurrent reads.
// Returns the packed block state (id << 4 | meta).
class BlockSource {
public:
  virtual ~BlockSource() = default;
  virtual std::uint16_t block_at(int x, int y, int z) const = 0;
};

inline constexpr int kWorldHeight = 256;
inline constexpr int kSectionsPerColumn = 16;
inline constexpr int kSectionVolume = 16 * 16 * 16;

// One 16x16x16 section, index order y * 256 + z * 16 + x.
struct ChunkSection {
  std::uint8_t y = 0; // 0..15
  std::vector<std::uint16_t> blocks; // kSectionVolume entries, or empty = air
};

// Column payload as delivered by the network layer.
struct ChunkData {
  int x = 0;
  int z = 0;
  bool full = false;  // replace the whole column, else merge sections
  std::vector<ChunkSection> sections;
};

// In-memory column store. Writes must not race with reads; the owner
// serializes them (e.g. apply chunk updates between ticks).
class ChunkColumnMap : public BlockSource {
public:
  std::uint16_t block_at(int x, int y, int z) const override;

  void update_chunk(const ChunkData& chunk);
  void unload_chunk(int chunk_x, int chunk_z);
  void set_block(int x, int y, int z, std::uint16_t state);
  void clear() { columns_.clear(); }

  // Fills [x0..x1] x [y0..y1] x [z0..z1] (inclusive) with one state.
  void fill(int x0, int y0, int z0, int x1, int y1, int z1, std::uint16_t state);

  std::size_t column_count() const { return columns_.size(); }

private:
  using Section = std::vector<std::uint16_t>;
  struct Column {
    std::array<Section, kSectionsPerColumn> sections;
  };
  static std::uint64_t key_(int chunk_x, int chunk_z) {
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(chunk_x)) << 32) |
           static_cast<std::uint32_t>(chunk_z);
  }

  std::unordered_map<std::uint64_t, Column> columns_;
};

// Non-owning view used by the resolver. An empty view reads air everywhere
// (no sentinel floor), which keeps pure-physics tests independent of terrain.
class WorldCollision {
public:
  WorldCollision() = default;
  explicit WorldCollision(const BlockSource& src) : src_(&src) {}

  static WorldCollision empty() { return WorldCollision{}; }
  bool has_source() const { return src_ != nullptr; }

  std::uint16_t block_at(int x, int y, int z) const;
  std::uint16_t block_id_at(int x, int y, int z) const;

  // Boxes of every block whose shape intersects `area`.
  void collect_boxes(const Aabb& area, std::vector<Aabb>& out) const;
  bool collides(const Aabb& box) const;

  // Any of the three body probes (+0.2, +0.9, +1.4 above the feet) in water.
  bool is_in_water(const Vec3& feet) const;
  bool is_in_lava(const Vec3& feet) const;
  bool contains_liquid(const Aabb& box) const;
  bool is_offset_position_free(const Aabb& box) const;

  // Slipperiness of the block directly below the feet.
  float slipperiness_below(const Vec3& feet) const;

private:
  const BlockSource* src_ = nullptr;
};

// Cell coordinate containing v.
inline int block_coord(float v) { return static_cast<int>(std::floor(v)); }

} // namespace voxsim
