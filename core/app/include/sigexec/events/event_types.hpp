#pragma once

#include "sigexec/domain/signal.hpp"
#include "sigexec/domain/signal_status.hpp"
#include "sigexec/domain/venue_types.hpp"
#include "sigexec/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace sigexec {

// -----------------------------------------------------------------------------
// SignalStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Records that the core wrote a new status for a signal.
// Published by the Coordinator after the store accepted the write, so
// subscribers never see a status the database does not have.
// -----------------------------------------------------------------------------
struct SignalStatusEvent {
  domain::SignalId signal_id{0};
  std::string symbol;
  domain::SignalStatus status{domain::SignalStatus::Process};
  std::string reason;  // Short human-readable cause (e.g. "sl distance 20")
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// RiskLockEvent
// -----------------------------------------------------------------------------
// Responsibility: The daily-loss circuit breaker tripped. Trading stays
// locked until unlock_at_ms (the next session boundary).
// -----------------------------------------------------------------------------
struct RiskLockEvent {
  double daily_pnl{0.0};
  double drawdown_percent{0.0};
  double limit_percent{0.0};
  double starting_equity{0.0};
  std::int64_t unlock_at_ms{0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// SessionResetEvent
// -----------------------------------------------------------------------------
// Responsibility: A session boundary was crossed; equity re-snapshotted and
// any lock cleared.
// -----------------------------------------------------------------------------
struct SessionResetEvent {
  double starting_equity{0.0};
  bool was_locked{false};
  std::int64_t next_reset_ms{0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// BreakevenEvent
// -----------------------------------------------------------------------------
// Responsibility: A TP2 leg's stop was moved to its entry price.
// -----------------------------------------------------------------------------
struct BreakevenEvent {
  domain::Ticket ticket{0};
  std::string comment;
  double old_stop_loss{0.0};
  double new_stop_loss{0.0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// TickSummaryEvent
// -----------------------------------------------------------------------------
// Responsibility: Snapshot of engine state at the end of one tick. Feeds the
// periodic console status line and the IPC STATUS reply.
// -----------------------------------------------------------------------------
struct TickSummaryEvent {
  std::uint64_t tick{0};
  std::string session_time;  // Session-local "YYYY-MM-DD HH:MM:SS"
  double starting_equity{0.0};
  double daily_pnl{0.0};
  double daily_pnl_percent{0.0};
  bool trading_locked{false};
  std::size_t open_legs{0};
  std::size_t pending_signals{0};
  std::int64_t next_reset_ms{0};
  std::size_t executed{0};   // Signals moved to DONE this tick
  std::size_t rejected{0};   // Signals moved to INVALID this tick
  std::size_t failed{0};     // Signals moved to ERROR this tick
  Timestamp timestamp{};
};

}  // namespace sigexec
