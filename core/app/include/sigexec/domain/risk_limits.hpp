#pragma once

namespace sigexec {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — hard thresholds applied on every tick
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of price-distance and loss limits.
//
// @details
// Loaded once from the configuration file and copied by value into the
// Coordinator and ExecutionEngine. There is no reconfiguration while the
// engine runs.
//
// Units:
//   max_sl_distance and entry_tolerance are absolute price distances in the
//   instrument's quote currency (15.0 on gold = 1500 points at 0.01).
//   max_daily_loss_percent is a percentage of the equity captured at the
//   last session boundary (3.0 means 3 %).
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Signals whose stop is farther than this from the entry band are INVALID.
  double max_sl_distance{15.0};

  /// Allowed slippage beyond the entry band before a signal stops being
  /// executable.
  double entry_tolerance{3.0};

  /// Drawdown (inclusive) at which the circuit breaker locks trading until
  /// the next session boundary.
  double max_daily_loss_percent{3.0};
};

}  // namespace domain
}  // namespace sigexec
