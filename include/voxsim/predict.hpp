#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <voxsim/types.hpp>

namespace voxsim {

// Ring of predicted frames keyed by tick (slot = tick % capacity).
// Single producer; ticks must be pushed in non-decreasing order.
class PredictionBuffer {
public:
  static constexpr std::size_t kDefaultCapacity = 512;

  explicit PredictionBuffer(std::size_t cap = kDefaultCapacity)
    : frames_(cap == 0 ? 1 : cap), valid_(cap == 0 ? 1 : cap, false) {}

  void push(const PredictedFrame& f) {
    const std::size_t i = slot(f.tick);
    frames_[i] = f;
    valid_[i] = true;
    latest_tick_ = f.tick;
  }

  // Empty when the slot was evicted by a newer tick or never written.
  std::optional<PredictedFrame> get_by_tick(std::uint32_t tick) const {
    const std::size_t i = slot(tick);
    if (valid_[i] && frames_[i].tick == tick) return frames_[i];
    return std::nullopt;
  }
  // Same lookup for in-place state rewrites during replay.
  PredictedFrame* get_by_tick_mut(std::uint32_t tick) {
    const std::size_t i = slot(tick);
    return (valid_[i] && frames_[i].tick == tick) ? &frames_[i] : nullptr;
  }

  // Invalidates slots strictly older than tick_min. The data stays in place.
  void truncate_older_than(std::uint32_t tick_min) {
    for (std::size_t i = 0; i < frames_.size(); ++i) {
      if (valid_[i] && frames_[i].tick < tick_min) valid_[i] = false;
    }
  }

  void clear() {
    std::fill(valid_.begin(), valid_.end(), false);
    latest_tick_.reset();
  }

  std::size_t capacity() const { return frames_.size(); }
  std::optional<std::uint32_t> latest_tick() const { return latest_tick_; }

  std::size_t valid_count() const {
    std::size_t n = 0;
    for (bool v : valid_) n += v ? 1u : 0u;
    return n;
  }

private:
  std::size_t slot(std::uint32_t tick) const { return static_cast<std::size_t>(tick) % frames_.size(); }

  std::vector<PredictedFrame> frames_;
  std::vector<bool> valid_;
  std::optional<std::uint32_t> latest_tick_;
};

} // namespace voxsim
