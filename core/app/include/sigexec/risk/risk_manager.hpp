#pragma once

#include "sigexec/domain/venue_types.hpp"
#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/time/i_time_provider.hpp"
#include "sigexec/time/session_clock.hpp"
#include "sigexec/time/time_utils.hpp"
#include "sigexec/venue/i_venue.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace sigexec {

// Startup failure of the risk layer (starting equity unavailable).
class RiskError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// RiskState — the circuit breaker's entire memory
// -----------------------------------------------------------------------------
// Rebuilt from the venue at startup; nothing here is persisted.
// -----------------------------------------------------------------------------
struct RiskState {
  double starting_equity{0.0};  // Equity at the last boundary (or startup)
  bool trading_locked{false};
  std::int64_t next_reset_ms{0};  // Next session boundary, UTC epoch ms
};

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Session boundaries, daily P/L, the daily-loss circuit breaker and
//         lot-size normalization.
//
// @details
// Session:
//   The trading day runs from one boundary (e.g. 07:10 at UTC+9) to the
//   next. Crossing a boundary is detected lazily: whichever of
//   isTradingAllowed() / checkDailyLoss() runs first after next_reset_ms
//   performs the reset. A reset clears the lock, re-reads equity into
//   starting_equity and moves next_reset_ms to the first boundary after
//   now, skipping any boundaries missed while the process was down.
//
// Daily P/L (checkDailyLoss):
//   realized   deals in [session start, now]
//     - IN deals:  commission
//     - OUT deals of positions opened this session: profit + commission + swap
//     - OUT deals of positions opened before the boundary:
//         calcProfit(boundary price -> deal price) + commission
//   unrealized open positions
//     - opened this session: profit + swap
//     - opened before the boundary: calcProfit(boundary price -> current)
//
//   The boundary price comes from IVenue::priceAt() and is cached until the
//   next reset. When it (or calcProfit) is unavailable the venue's reported
//   profit is used instead. That over-counts the pre-boundary part of the
//   trade; it is logged once per symbol per session and is not an error.
//
//   Only deals and positions carrying the engine's magic are counted unless
//   include_manual_trades is set.
//
//   drawdown % = (-daily_pnl * 100) / starting_equity
//   drawdown % >= limit  ->  lock until the next boundary
//
// Events:
//   RiskLockEvent on lock, SessionResetEvent on every boundary crossing.
//
// Thread model: tick thread only. state() returns a copy.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  RiskManager(IVenue& venue, const ITimeProvider& clock, EventBus& bus,
              std::string instrument, SessionClock session,
              bool include_manual_trades);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  // -------------------------------------------------------------------------
  // init(spec)
  // -------------------------------------------------------------------------
  // @brief  Computes the first boundary and captures starting equity.
  //
  // @param  spec  Instrument constraints used by normalizeLot().
  //
  // @throws RiskError if the venue cannot report equity.
  // -------------------------------------------------------------------------
  void init(const domain::InstrumentSpec& spec);

  // -------------------------------------------------------------------------
  // isTradingAllowed()
  // -------------------------------------------------------------------------
  // @brief  Rolls the session over if a boundary has passed, then reports
  //         whether the circuit breaker is open.
  //
  // @details
  // Once locked this returns false until now >= next_reset_ms, whatever
  // happens to equity in between.
  // -------------------------------------------------------------------------
  bool isTradingAllowed();

  // -------------------------------------------------------------------------
  // checkDailyLoss(max_loss_percent, magic)
  // -------------------------------------------------------------------------
  // @brief  Recomputes daily P/L and locks trading if the drawdown reached
  //         max_loss_percent (inclusive).
  //
  // @details
  // No-op while locked. If the venue cannot supply deals or positions the
  // check is skipped for this tick (logged) and the previous P/L is kept.
  // -------------------------------------------------------------------------
  void checkDailyLoss(double max_loss_percent, domain::Magic magic);

  // @brief  Floors raw to the volume step and clamps to [min, max].
  double normalizeLot(double raw) const;

  // --- Read-only accessors ----------------------------------------------------
  std::string sessionTime() const;
  double startingEquity() const { return state_.starting_equity; }
  double dailyPnl() const { return daily_pnl_; }
  double dailyPnlPercent() const;
  bool isLocked() const { return state_.trading_locked; }
  std::int64_t nextResetMs() const { return state_.next_reset_ms; }
  RiskState state() const { return state_; }
  const SessionClock& session() const { return session_; }

 private:
  void rollSessionIfDue();

  std::optional<double> computeDailyPnl(domain::Magic magic);

  // Boundary price of symbol, cached per session; std::nullopt if the venue
  // has no history for that instant.
  std::optional<double> boundaryPrice(const std::string& symbol);

  // P/L of moving volume from the boundary price to price, or std::nullopt.
  std::optional<double> profitSinceBoundary(const std::string& symbol,
                                            domain::Side side, double volume,
                                            double price);

  void noteApproximation(const std::string& symbol);

  std::int64_t sessionStartMs() const {
    return state_.next_reset_ms - kMillisPerDay;
  }

  IVenue& venue_;
  const ITimeProvider& clock_;
  EventBus& bus_;
  std::string instrument_;
  SessionClock session_;
  bool include_manual_trades_;

  domain::InstrumentSpec spec_;
  RiskState state_;
  double daily_pnl_{0.0};

  std::map<std::string, double> boundary_prices_;
  std::set<std::string> approximated_;
};

}  // namespace sigexec
