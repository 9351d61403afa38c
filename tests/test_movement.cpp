#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>

#include <voxsim/block.hpp>
#include <voxsim/movement.hpp>

using Catch::Approx;
using namespace voxsim;

static constexpr float kFacePlusX = -kPI / 2.0f; // forward_dir == (+1, 0, 0)

static void stone_floor(ChunkColumnMap& w, std::uint16_t state = block_state(blocks::kStone)) {
  w.fill(-8, 0, -8, 8, 0, 8, state);
}

static PlayerSimState standing(float x = 0.5f, float y = 1.0f, float z = 0.5f) {
  PlayerSimState s{};
  s.pos = Vec3{x, y, z};
  s.on_ground = true;
  return s;
}

TEST_CASE("simulate_tick is deterministic on an empty world") {
  const auto world = WorldCollision::empty();
  PlayerSimState a{}, b{};
  a.pos = b.pos = Vec3{3.0f, 70.0f, -2.0f};

  for (int t = 0; t < 200; ++t) {
    InputState in;
    in.forward = std::sin(0.1f * t);
    in.strafe = std::cos(0.07f * t);
    in.sprint = (t / 20) % 2 == 0;
    in.sneak = (t % 33) == 0;
    in.yaw = 0.05f * t;
    in.pitch = -0.2f;
    a = simulate_tick(a, in, world);
    b = simulate_tick(b, in, world);
  }
  REQUIRE(a.pos.x == Approx(b.pos.x).margin(1e-6));
  REQUIRE(a.pos.y == Approx(b.pos.y).margin(1e-6));
  REQUIRE(a.pos.z == Approx(b.pos.z).margin(1e-6));
  REQUIRE(a.vel.x == Approx(b.vel.x).margin(1e-6));
  REQUIRE(a.vel.y == Approx(b.vel.y).margin(1e-6));
  REQUIRE(a.yaw == b.yaw);
  REQUIRE(a.pitch == b.pitch);
  REQUIRE(a.pitch == -0.2f);
}

TEST_CASE("Player at rest on a floor stays grounded with zero vertical velocity") {
  ChunkColumnMap map; stone_floor(map);
  const WorldCollision world(map);
  PlayerSimState s = standing();
  s.on_ground = false;

  s = simulate_tick(s, InputState{}, world);
  REQUIRE(s.on_ground);
  REQUIRE(s.vel.y == 0.0f);
  REQUIRE(s.pos.y == Approx(1.0f));

  for (int i = 0; i < 20; ++i) {
    s = simulate_tick(s, InputState{}, world);
    REQUIRE(s.on_ground);
    REQUIRE(s.vel.y == 0.0f);
  }
  REQUIRE(s.pos.y == Approx(1.0f));
}

TEST_CASE("Falling player lands on the floor") {
  ChunkColumnMap map; stone_floor(map);
  const WorldCollision world(map);
  PlayerSimState s = standing(0.5f, 6.0f, 0.5f);
  s.on_ground = false;

  for (int i = 0; i < 60; ++i) s = simulate_tick(s, InputState{}, world);
  REQUIRE(s.on_ground);
  REQUIRE(s.pos.y == Approx(1.0f).margin(1e-4));
  REQUIRE(s.vel.y == 0.0f);
}

TEST_CASE("Ground walking and jumping use the vanilla constants") {
  ChunkColumnMap map; stone_floor(map);
  const WorldCollision world(map);

  SECTION("first walking tick moves 0.098 along the facing") {
    InputState in;
    in.forward = 1.0f;
    const auto s = simulate_tick(standing(), in, world);
    REQUIRE(s.pos.z == Approx(0.5f - 0.098f).margin(1e-5));
    REQUIRE(s.pos.x == Approx(0.5f).margin(1e-6));
    REQUIRE(s.vel.z == Approx(-0.098f * 0.6f * 0.91f).margin(1e-5));
  }

  SECTION("jump impulse then gravity and drag") {
    InputState in;
    in.jump = true;
    const auto s = simulate_tick(standing(), in, world);
    REQUIRE_FALSE(s.on_ground);
    REQUIRE(s.pos.y == Approx(1.42f).margin(1e-5));
    REQUIRE(s.vel.y == Approx((0.42f - 0.08f) * 0.98f).margin(1e-5));
  }

  SECTION("jump boost raises the impulse") {
    InputState in;
    in.jump = true;
    in.jump_boost = std::uint8_t{1};
    const auto s = simulate_tick(standing(), in, world);
    REQUIRE(s.pos.y == Approx(1.62f).margin(1e-5));
  }

  SECTION("sprint jump adds a forward push") {
    InputState in;
    in.forward = 1.0f;
    in.sprint = true;
    in.jump = true;
    const auto s = simulate_tick(standing(), in, world);
    // 0.2 boost plus 0.1 * 1.3 * 0.98 ground acceleration
    REQUIRE(s.pos.z == Approx(0.5f - 0.3274f).margin(1e-4));
    REQUIRE(s.vel.z == Approx(-0.3274f * 0.91f).margin(1e-4));
  }

  SECTION("sneaking slows walking") {
    InputState in;
    in.forward = 1.0f;
    in.sneak = true;
    const auto s = simulate_tick(standing(), in, world);
    REQUIRE(s.pos.z == Approx(0.5f - 0.0294f).margin(1e-5));
  }
}

TEST_CASE("effective_sprint needs forward input and no sneak") {
  InputState in;
  in.sprint = true;
  in.forward = 1.0f;
  REQUIRE(effective_sprint(in));
  in.forward = 0.7f;
  REQUIRE_FALSE(effective_sprint(in));
  in.forward = 0.8f;
  REQUIRE(effective_sprint(in));
  in.sneak = true;
  REQUIRE_FALSE(effective_sprint(in));
}

TEST_CASE("move_flying normalizes long wish vectors only") {
  Vec3 v{};
  move_flying(v, 0.0f, 0.5f, 0.1f, 0.0f);
  REQUIRE(v.z == Approx(-0.05f));

  Vec3 w{};
  move_flying(w, 1.0f, 1.0f, 0.1f, 0.0f);
  REQUIRE(std::sqrt(w.x * w.x + w.z * w.z) == Approx(0.1f));

  Vec3 z{};
  move_flying(z, 0.001f, 0.001f, 0.1f, 0.0f);
  REQUIRE(z == Vec3{});
}

TEST_CASE("Walls stop horizontal motion and zero the blocked component") {
  ChunkColumnMap map; stone_floor(map);
  map.fill(2, 1, -2, 2, 2, 2, block_state(blocks::kStone));
  const WorldCollision world(map);

  InputState in;
  in.forward = 1.0f;
  in.yaw = kFacePlusX;
  PlayerSimState s = standing();
  bool hit = false;
  for (int i = 0; i < 30; ++i) {
    s = simulate_tick(s, in, world);
    REQUIRE(s.pos.x <= 1.7f + 1e-4f);
    if (s.pos.x > 1.69f) hit = true;
  }
  REQUIRE(hit);
  REQUIRE(s.vel.x == 0.0f);
  REQUIRE(s.pos.y == Approx(1.0f));

  const auto r = resolve(world, s.pos, Vec3{0.2f, 0.0f, 0.0f}, true);
  REQUIRE(r.collided_horizontally);
  REQUIRE(r.vel.x == 0.0f);
}

TEST_CASE("Auto-step climbs a slab but not a full block") {
  InputState in;
  in.forward = 1.0f;
  in.yaw = kFacePlusX;

  SECTION("half slab") {
    ChunkColumnMap map; stone_floor(map);
    map.set_block(2, 1, 0, block_state(blocks::kStoneSlab));
    const WorldCollision world(map);
    PlayerSimState s = standing();
    float max_y = s.pos.y;
    for (int i = 0; i < 30; ++i) {
      s = simulate_tick(s, in, world);
      max_y = std::max(max_y, s.pos.y);
    }
    REQUIRE(max_y == Approx(1.5f).margin(1e-3));
    REQUIRE(s.pos.x > 3.5f);
  }

  SECTION("full block") {
    ChunkColumnMap map; stone_floor(map);
    map.set_block(2, 1, 0, block_state(blocks::kStone));
    const WorldCollision world(map);
    PlayerSimState s = standing();
    for (int i = 0; i < 30; ++i) s = simulate_tick(s, in, world);
    REQUIRE(s.pos.x <= 1.7f + 1e-4f);
    REQUIRE(s.pos.y == Approx(1.0f));
  }

  SECTION("no step without ground contact") {
    ChunkColumnMap map; stone_floor(map);
    map.set_block(2, 1, 0, block_state(blocks::kStoneSlab));
    const WorldCollision world(map);
    const auto r = resolve(world, Vec3{1.69f, 1.0f, 0.5f}, Vec3{0.2f, 0.0f, 0.0f}, false);
    REQUIRE(r.pos.y == Approx(1.0f));
    REQUIRE(r.pos.x == Approx(1.7f).margin(1e-5));
  }
}

TEST_CASE("Sneaking keeps the feet on the ledge") {
  ChunkColumnMap map;
  map.fill(-4, 0, -4, 0, 0, 4, block_state(blocks::kStone));
  const WorldCollision world(map);

  InputState in;
  in.forward = 1.0f;
  in.sneak = true;
  in.yaw = kFacePlusX;
  PlayerSimState s = standing();
  for (int i = 0; i < 40; ++i) {
    s = simulate_tick(s, in, world);
    REQUIRE(s.on_ground);
    REQUIRE(s.pos.y == Approx(1.0f));
  }
  // Box still overlaps the last supporting block (x < 1).
  REQUIRE(s.pos.x - physics::kPlayerHalfWidth < 1.0f);
  REQUIRE(s.pos.x > 1.0f);

  SECTION("without sneak the player walks off") {
    in.sneak = false;
    PlayerSimState w = standing();
    for (int i = 0; i < 40; ++i) w = simulate_tick(w, in, world);
    REQUIRE(w.pos.y < 1.0f);
  }
}

TEST_CASE("clamp_sneak_edge_velocity steps toward zero") {
  ChunkColumnMap map;
  map.fill(-4, 0, -4, 0, 0, 4, block_state(blocks::kStone));
  const WorldCollision world(map);

  const Vec3 v = clamp_sneak_edge_velocity(world, Vec3{1.2f, 1.0f, 0.5f}, Vec3{0.3f, 0.0f, 0.0f});
  REQUIRE(v.x < 0.3f);
  REQUIRE(1.2f - physics::kPlayerHalfWidth + v.x < 1.0f);

  // Moving back onto support is untouched
  const Vec3 back = clamp_sneak_edge_velocity(world, Vec3{1.2f, 1.0f, 0.5f}, Vec3{-0.3f, 0.0f, 0.0f});
  REQUIRE(back.x == -0.3f);

  // No world, no clamp
  const Vec3 free = clamp_sneak_edge_velocity(WorldCollision::empty(), Vec3{1.2f, 1.0f, 0.5f}, Vec3{0.3f, 0.0f, 0.0f});
  REQUIRE(free.x == 0.3f);
}

TEST_CASE("Water movement") {
  ChunkColumnMap map; stone_floor(map);
  map.fill(-4, 1, -4, 4, 5, 4, block_state(blocks::kWater));
  const WorldCollision world(map);
  PlayerSimState s = standing(0.5f, 2.0f, 0.5f);
  s.on_ground = false;
  REQUIRE(world.is_in_water(s.pos));

  SECTION("sinks slowly") {
    const auto n = simulate_tick(s, InputState{}, world);
    REQUIRE(n.vel.y == Approx(-0.02f));
    REQUIRE(n.pos.y == Approx(2.0f));
  }

  SECTION("jump swims up") {
    InputState in;
    in.jump = true;
    const auto n = simulate_tick(s, in, world);
    REQUIRE(n.pos.y == Approx(2.04f).margin(1e-5));
    REQUIRE(n.vel.y == Approx(0.04f * 0.8f - 0.02f).margin(1e-5));
  }

  SECTION("water acceleration is 0.02") {
    InputState in;
    in.forward = 1.0f;
    const auto n = simulate_tick(s, in, world);
    REQUIRE(n.pos.z == Approx(0.5f - 0.0196f).margin(1e-5));
  }
}

TEST_CASE("Swimming into a ledge boosts out of the water") {
  ChunkColumnMap map;
  map.fill(-8, 0, -8, 8, 0, 8, block_state(blocks::kStone));
  map.fill(-8, 1, -8, 1, 1, 8, block_state(blocks::kWater));
  map.fill(2, 1, -8, 8, 1, 8, block_state(blocks::kStone));
  const WorldCollision world(map);

  InputState in;
  in.forward = 1.0f;
  in.yaw = kFacePlusX;
  PlayerSimState s = standing(1.69f, 1.5f, 0.5f);
  s.on_ground = false;
  s.vel.x = 0.05f;
  const auto n = simulate_tick(s, in, world);
  REQUIRE(n.vel.y == Approx(physics::kWaterSurfaceAssist));
}

TEST_CASE("Flying model") {
  const auto world = WorldCollision::empty();
  PlayerSimState s{};
  s.pos = Vec3{0.0f, 80.0f, 0.0f};

  InputState in;
  in.can_fly = true;
  in.flying = true;

  SECTION("jump ascends with 3x fly speed and 0.6 damping") {
    in.jump = true;
    const auto n = simulate_tick(s, in, world);
    REQUIRE(n.pos.y == Approx(80.15f).margin(1e-4));
    REQUIRE(n.vel.y == Approx(0.09f).margin(1e-6));
  }

  SECTION("no gravity while hovering") {
    auto n = s;
    for (int i = 0; i < 10; ++i) n = simulate_tick(n, in, world);
    REQUIRE(n.pos.y == 80.0f);
  }

  SECTION("sprint doubles horizontal acceleration") {
    in.forward = 1.0f;
    const auto walk = simulate_tick(s, in, world);
    in.sprint = true;
    const auto fast = simulate_tick(s, in, world);
    REQUIRE(fast.pos.z == Approx(2.0f * walk.pos.z));
    REQUIRE(walk.vel.z == Approx(-0.05f * 0.98f * 0.91f));
  }

  SECTION("flying requires the ability") {
    in.can_fly = false;
    const auto n = simulate_tick(s, in, world);
    REQUIRE(n.pos.y < 80.0f);
  }
}

TEST_CASE("Ice keeps momentum longer than stone") {
  auto glide = [](std::uint16_t floor_state) {
    ChunkColumnMap map;
    map.fill(-8, 0, -32, 8, 0, 32, floor_state);
    const WorldCollision world(map);
    PlayerSimState s = standing();
    s.vel.z = -0.3f;
    for (int i = 0; i < 10; ++i) s = simulate_tick(s, InputState{}, world);
    return 0.5f - s.pos.z;
  };
  const float stone = glide(block_state(blocks::kStone));
  const float ice = glide(block_state(blocks::kIce));
  REQUIRE(ice > stone * 2.0f);
}

TEST_CASE("ground_probe sees the block just below the feet") {
  ChunkColumnMap map; stone_floor(map);
  const WorldCollision world(map);
  REQUIRE(ground_probe(world, Vec3{0.5f, 1.0f, 0.5f}));
  REQUIRE(ground_probe(world, Vec3{0.5f, 1.015f, 0.5f}));
  REQUIRE_FALSE(ground_probe(world, Vec3{0.5f, 1.05f, 0.5f}));
  REQUIRE_FALSE(ground_probe(WorldCollision::empty(), Vec3{0.5f, 1.0f, 0.5f}));
}
