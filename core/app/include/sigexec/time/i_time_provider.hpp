#pragma once

#include <cstdint>

namespace sigexec {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual clock so that session-boundary and daily-P/L logic can
//         be driven by a controllable clock in tests.
//
// @details
// The risk manager decides whether the session has rolled over, which deals
// belong to today, and when the circuit breaker unlocks — all from now_ms().
// If those components read std::chrono::system_clock directly, a test could
// not cross a 22:10 UTC boundary without waiting for it.
//
//   LiveTimeProvider        → std::chrono::system_clock.
//   SimulationTimeProvider  → value set by the test or replay harness.
//
// Components receive `const ITimeProvider&` and never own it.
//
// Thread-safety contract:
//   now_ms() must be safe to call from any thread. The tick loop is the only
//   caller in production, but the IPC thread formats timestamps too.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as UTC milliseconds since the Unix epoch.
  //
  // @details
  // Always UTC. Session-local time is derived from it by SessionClock with a
  // fixed offset; no component ever consults the host time zone.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace sigexec
