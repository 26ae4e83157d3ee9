#pragma once

#include "sigexec/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace sigexec {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" only changes when someone sets it.
//
// @details
// Tests use it to walk the engine across session boundaries: construct it at
// a known instant, run a tick, advance_by(hours), run another tick, and
// assert on the risk state. Nothing moves unless the test moves it, so every
// run is reproducible.
//
// The value is a std::atomic so reads from the IPC thread stay well defined
// while the tick thread advances the clock.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // @brief  Starts the clock at the given UTC epoch milliseconds.
  explicit SimulationTimeProvider(std::int64_t start_ms);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute instant.
  //
  // @details
  // Monotonicity is not enforced; tests occasionally rewind to probe edge
  // cases of the boundary calculation.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // @brief  Moves the clock forward (or backward, if negative) by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace sigexec
