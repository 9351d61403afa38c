#include <voxsim/world.hpp>
#include <voxsim/block.hpp>
#include <algorithm>
#include <cmath>

namespace voxsim {

static int section_index(int lx, int ly, int lz) { return ly * 256 + lz * 16 + lx; }

std::uint16_t ChunkColumnMap::block_at(int x, int y, int z) const {
  if (y < 0) return block_state(blocks::kStone);
  if (y >= kWorldHeight) return block_state(blocks::kAir);
  auto it = columns_.find(key_(x >> 4, z >> 4));
  if (it == columns_.end()) return 0;
  const Section& s = it->second.sections[static_cast<std::size_t>(y >> 4)];
  if (s.empty()) return 0;
  return s[static_cast<std::size_t>(section_index(x & 15, y & 15, z & 15))];
}

void ChunkColumnMap::update_chunk(const ChunkData& chunk) {
  Column& col = columns_[key_(chunk.x, chunk.z)];
  if (chunk.full) col = Column{};
  for (const auto& sec : chunk.sections) {
    if (sec.y >= kSectionsPerColumn) continue;
    Section& dst = col.sections[sec.y];
    if (sec.blocks.size() == static_cast<std::size_t>(kSectionVolume)) {
      dst = sec.blocks;
    } else {
      dst.clear(); // malformed or empty payload reads as air
    }
  }
}

void ChunkColumnMap::unload_chunk(int chunk_x, int chunk_z) {
  columns_.erase(key_(chunk_x, chunk_z));
}

void ChunkColumnMap::set_block(int x, int y, int z, std::uint16_t state) {
  if (y < 0 || y >= kWorldHeight) return;
  Column& col = columns_[key_(x >> 4, z >> 4)];
  Section& s = col.sections[static_cast<std::size_t>(y >> 4)];
  if (s.empty()) {
    if (state == 0) return;
    s.assign(kSectionVolume, 0);
  }
  s[static_cast<std::size_t>(section_index(x & 15, y & 15, z & 15))] = state;
}

void ChunkColumnMap::fill(int x0, int y0, int z0, int x1, int y1, int z1, std::uint16_t state) {
  for (int y = std::min(y0, y1); y <= std::max(y0, y1); ++y)
    for (int z = std::min(z0, z1); z <= std::max(z0, z1); ++z)
      for (int x = std::min(x0, x1); x <= std::max(x0, x1); ++x)
        set_block(x, y, z, state);
}

std::uint16_t WorldCollision::block_at(int x, int y, int z) const {
  return src_ ? src_->block_at(x, y, z) : 0;
}

std::uint16_t WorldCollision::block_id_at(int x, int y, int z) const {
  return block_id(block_at(x, y, z));
}

void WorldCollision::collect_boxes(const Aabb& area, std::vector<Aabb>& out) const {
  if (!src_) return;
  const int x0 = block_coord(area.min.x), x1 = block_coord(area.max.x);
  const int z0 = block_coord(area.min.z), z1 = block_coord(area.max.z);
  // One extra layer below: fences and walls reach 1.5 blocks up.
  const int y0 = block_coord(area.min.y) - 1, y1 = block_coord(area.max.y);

  std::vector<Aabb> scratch;
  for (int x = x0; x <= x1; ++x) {
    for (int z = z0; z <= z1; ++z) {
      for (int y = y0; y <= y1; ++y) {
        const std::uint16_t state = src_->block_at(x, y, z);
        if (!is_solid(block_id(state))) continue;
        scratch.clear();
        collision_boxes(*this, x, y, z, state, scratch);
        for (const auto& b : scratch)
          if (b.intersects(area)) out.push_back(b);
      }
    }
  }
}

bool WorldCollision::collides(const Aabb& box) const {
  std::vector<Aabb> boxes;
  collect_boxes(box, boxes);
  return !boxes.empty();
}

bool WorldCollision::is_in_water(const Vec3& feet) const {
  const int x = block_coord(feet.x), z = block_coord(feet.z);
  for (float dy : {0.2f, 0.9f, 1.4f}) {
    if (is_water(block_id_at(x, block_coord(feet.y + dy), z))) return true;
  }
  return false;
}

bool WorldCollision::is_in_lava(const Vec3& feet) const {
  const int x = block_coord(feet.x), z = block_coord(feet.z);
  for (float dy : {0.2f, 0.9f, 1.4f}) {
    if (is_lava(block_id_at(x, block_coord(feet.y + dy), z))) return true;
  }
  return false;
}

bool WorldCollision::contains_liquid(const Aabb& box) const {
  if (!src_) return false;
  for (int x = block_coord(box.min.x); x <= block_coord(box.max.x); ++x)
    for (int y = block_coord(box.min.y); y <= block_coord(box.max.y); ++y)
      for (int z = block_coord(box.min.z); z <= block_coord(box.max.z); ++z)
        if (is_liquid(block_id_at(x, y, z))) return true;
  return false;
}

bool WorldCollision::is_offset_position_free(const Aabb& box) const {
  return !collides(box) && !contains_liquid(box);
}

float WorldCollision::slipperiness_below(const Vec3& feet) const {
  const std::uint16_t id = block_id_at(block_coord(feet.x), block_coord(feet.y) - 1, block_coord(feet.z));
  return slipperiness(id);
}

} // namespace voxsim
