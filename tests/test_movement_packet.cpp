#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>

#include <voxsim/movement_packet.hpp>

using Catch::Approx;
using namespace voxsim;

TEST_CASE("Angle conversion to protocol degrees") {
  REQUIRE(wrap_degrees(190.0f) == Approx(-170.0f));
  REQUIRE(wrap_degrees(-180.0f) == Approx(180.0f));
  REQUIRE(wrap_degrees(720.0f + 45.0f) == Approx(45.0f));

  // Client yaw 0 faces -Z, which the protocol calls 180.
  REQUIRE(protocol_yaw_deg(0.0f) == Approx(180.0f));
  REQUIRE(protocol_yaw_deg(kPI / 2.0f) == Approx(90.0f));
  REQUIRE(protocol_yaw_deg(std::numeric_limits<float>::quiet_NaN()) == 0.0f);

  REQUIRE(protocol_pitch_deg(0.5f) == Approx(-0.5f * 180.0f / kPI));
  REQUIRE(protocol_pitch_deg(3.0f) == -90.0f);
  REQUIRE(protocol_pitch_deg(-3.0f) == 90.0f);

  REQUIRE(client_yaw_rad(protocol_yaw_deg(1.0f)) == Approx(1.0f));
  REQUIRE(client_pitch_rad(protocol_pitch_deg(-0.4f)) == Approx(-0.4f));
}

TEST_CASE("MovementPacketTracker picks the smallest message") {
  MovementPacketTracker tracker(20);
  PlayerSimState s{};
  s.pos = Vec3{1.0f, 64.0f, 1.0f};
  s.on_ground = true;

  SECTION("first send is a full pose") {
    REQUIRE_FALSE(tracker.initialized());
    auto p = tracker.next(s);
    REQUIRE(p.kind == MovementPacketKind::PositionLook);
    REQUIRE(p.pos == s.pos);
    REQUIRE(p.on_ground);
    REQUIRE(tracker.initialized());
  }

  SECTION("idle sends ground only, small motion is ignored") {
    tracker.next(s);
    REQUIRE(tracker.next(s).kind == MovementPacketKind::Ground);
    s.pos.x += 0.02f; // 0.0004 < 0.0009
    REQUIRE(tracker.next(s).kind == MovementPacketKind::Ground);
    REQUIRE(tracker.ticks_since_position() == 2);
  }

  SECTION("movement and rotation") {
    tracker.next(s);
    s.pos.x += 0.1f;
    auto p = tracker.next(s);
    REQUIRE(p.kind == MovementPacketKind::Position);
    REQUIRE(tracker.ticks_since_position() == 0);

    s.yaw = 0.5f;
    REQUIRE(tracker.next(s).kind == MovementPacketKind::Look);

    s.yaw = 1.0f;
    s.pos.z += 1.0f;
    REQUIRE(tracker.next(s).kind == MovementPacketKind::PositionLook);
  }

  SECTION("position is resent after the idle window") {
    tracker.next(s);
    for (int i = 0; i < 20; ++i) REQUIRE(tracker.next(s).kind == MovementPacketKind::Ground);
    REQUIRE(tracker.ticks_since_position() == 20);
    REQUIRE(tracker.next(s).kind == MovementPacketKind::Position);
    REQUIRE(tracker.ticks_since_position() == 0);
  }

  SECTION("acknowledge echoes the server pose once") {
    tracker.next(s);
    PlayerSimState server = s;
    server.pos = Vec3{10.0f, 70.0f, -3.0f};
    server.yaw = 1.2f;
    tracker.acknowledge(server);

    auto echo = tracker.next(s);
    REQUIRE(echo.kind == MovementPacketKind::PositionLook);
    REQUIRE(echo.pos == server.pos);
    REQUIRE(echo.yaw_deg == Approx(protocol_yaw_deg(1.2f)));

    // Back to normal deltas, measured from the acknowledged pose
    server.yaw = 1.2f;
    REQUIRE(tracker.next(server).kind == MovementPacketKind::Ground);
  }

  SECTION("reset forgets history") {
    tracker.next(s);
    tracker.acknowledge(s);
    tracker.reset();
    REQUIRE_FALSE(tracker.initialized());
    REQUIRE(tracker.next(s).kind == MovementPacketKind::PositionLook);
  }
}
