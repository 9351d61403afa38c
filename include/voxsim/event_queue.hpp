#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>
#include <voxsim/types.hpp>

namespace voxsim {

using Clock = std::chrono::steady_clock;

// Authoritative pose decoded from a server position packet.
struct ServerPoseEvent {
  Vec3 position{};
  float yaw = 0.0f;
  float pitch = 0.0f;
  bool on_ground = false;
  // Last client tick the server had simulated, when the server reports it.
  std::optional<std::uint32_t> input_tick;
  std::optional<Clock::time_point> recv_time;
};

// Server-set velocity (knockback, explosions...).
struct ServerVelocityEvent {
  Vec3 velocity{};
};

using NetEvent = std::variant<ServerPoseEvent, ServerVelocityEvent>;

// Multi-producer FIFO. The network side pushes; the simulation drains
// everything once per tick boundary, before simulating.
class NetEventQueue {
public:
  void push(NetEvent ev) {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(std::move(ev));
  }

  std::vector<NetEvent> drain() {
    std::deque<NetEvent> taken;
    {
      std::lock_guard<std::mutex> lock(mu_);
      taken.swap(events_);
    }
    return std::vector<NetEvent>(std::make_move_iterator(taken.begin()),
                                 std::make_move_iterator(taken.end()));
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_.size();
  }
  bool empty() const { return size() == 0; }

private:
  mutable std::mutex mu_;
  std::deque<NetEvent> events_;
};

} // namespace voxsim
