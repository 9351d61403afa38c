#pragma once
#include <cstdint>
#include <optional>
#include <voxsim/predict.hpp>
#include <voxsim/types.hpp>
#include <voxsim/world.hpp>

namespace voxsim {

struct ReconcileThresholds {
  float noise_floor = 0.001f;          // below: ignore
  float hard_teleport_distance = 3.0f; // at or above: snap, no replay
};

struct ReconcileResult {
  Vec3 correction{};                   // server pos - predicted pos at the matched tick
  std::uint32_t replayed_ticks = 0;
  bool hard_teleport = false;
};

// Compares the authoritative state at server_tick against history and
// corrects current_state. Returns nullopt when nothing was done (no usable
// frame, or the error is below the noise floor).
std::optional<ReconcileResult> reconcile(PredictionBuffer& buffer,
                                         const WorldCollision& world,
                                         std::uint32_t server_tick,
                                         const PlayerSimState& server_state,
                                         std::uint32_t client_tick,
                                         PlayerSimState& current_state,
                                         const ReconcileThresholds& thresholds = {});

} // namespace voxsim
