// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for sigexec::RiskManager: session rollover, daily P/L and the
// daily-loss circuit breaker.
//
// Validates:
//   - A loss of exactly the limit locks (inclusive comparison)
//   - The lock holds until the session boundary, whatever equity does
//   - The boundary clears the lock and re-snapshots starting equity
//   - Positions that straddle the boundary only count the move since it
//     (and fall back to the venue's P/L when no boundary price exists)
//   - Manual trades are ignored unless explicitly included
//   - Missed boundaries after an outage are skipped in one step
//   - normalizeLot floors to the step and clamps to the limits
//
// All tests run on a SimulationTimeProvider at 2025-01-15 12:00 UTC, inside
// the session that opened at 2025-01-14 22:10 UTC (07:10 at UTC+9).
// =============================================================================

#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/risk/risk_manager.hpp"
#include "sigexec/time/simulation_time_provider.hpp"
#include "sigexec/venue/simulated_venue.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using sigexec::EventBus;
using sigexec::RiskError;
using sigexec::RiskLockEvent;
using sigexec::RiskManager;
using sigexec::SessionClock;
using sigexec::SessionResetEvent;
using sigexec::SimulatedVenue;
using sigexec::SimulationTimeProvider;
using sigexec::TimeOfDay;
using sigexec::domain::Deal;
using sigexec::domain::DealEntry;
using sigexec::domain::Side;
using sigexec::domain::VenuePosition;
using namespace sigexec_test;

namespace {

class RiskManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    venue.addInstrument(xauusdSpec());
    bus.subscribe<RiskLockEvent>(
        [this](const RiskLockEvent& e) { locks.push_back(e); });
    bus.subscribe<SessionResetEvent>(
        [this](const SessionResetEvent& e) { resets.push_back(e); });
  }

  std::unique_ptr<RiskManager> makeRisk(bool include_manual = false) {
    auto risk = std::make_unique<RiskManager>(
        venue, clock, bus, "XAUUSD", SessionClock(TimeOfDay{7, 10}, 9 * 60),
        include_manual);
    risk->init(xauusdSpec());
    return risk;
  }

  // Books an IN + OUT pair for a position opened and closed this session.
  void closedTradeThisSession(sigexec::domain::Ticket position_id,
                              double profit,
                              sigexec::domain::Magic magic = kMagic) {
    Deal in;
    in.ticket = position_id * 10;
    in.position_id = position_id;
    in.symbol = "XAUUSD";
    in.side = Side::Sell;
    in.entry = DealEntry::In;
    in.volume = 0.1;
    in.price = 2400.0;
    in.magic = magic;
    in.time_ms = kSessionStart + kMillisPerHour;
    venue.addDeal(in);

    Deal out = in;
    out.ticket = position_id * 10 + 1;
    out.side = Side::Buy;
    out.entry = DealEntry::Out;
    out.profit = profit;
    out.time_ms = kSessionStart + 2 * kMillisPerHour;
    venue.addDeal(out);
  }

  // SELL 0.1 opened at 2410 an hour before the boundary, now at 2395.
  VenuePosition straddlingSell() {
    VenuePosition pos;
    pos.symbol = "XAUUSD";
    pos.side = Side::Sell;
    pos.volume = 0.1;
    pos.open_price = 2410.0;
    pos.current_price = 2395.0;
    pos.profit = 150.0;
    pos.magic = kMagic;
    pos.open_time_ms = kSessionStart - kMillisPerHour;
    pos.comment = "SIG7_TP2";
    return pos;
  }

  SimulationTimeProvider clock{kJan15Noon};
  SimulatedVenue venue{clock, 10000.0};
  EventBus bus;
  std::vector<RiskLockEvent> locks;
  std::vector<SessionResetEvent> resets;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. init() places the first boundary and snapshots equity.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, InitCapturesBoundaryAndEquity) {
  auto risk = makeRisk();
  EXPECT_EQ(risk->nextResetMs(), kNextBoundary);
  EXPECT_DOUBLE_EQ(risk->startingEquity(), 10000.0);
  EXPECT_FALSE(risk->isLocked());
  EXPECT_EQ(risk->sessionTime(), "2025-01-15 21:00:00");
}

TEST_F(RiskManagerTest, InitThrowsWithoutEquity) {
  venue.setFailEquity(true);
  RiskManager risk(venue, clock, bus, "XAUUSD",
                   SessionClock(TimeOfDay{7, 10}, 9 * 60), false);
  EXPECT_THROW(risk.init(xauusdSpec()), RiskError);
}

// -----------------------------------------------------------------------------
// 2. -300 on 10000 is exactly 3 %: lock.
// Why: the limit is inclusive; a floating-point 2.9999 must not slip past.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ExactLimitLocks) {
  auto risk = makeRisk();
  closedTradeThisSession(1, -300.0);

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_DOUBLE_EQ(risk->dailyPnl(), -300.0);
  EXPECT_DOUBLE_EQ(risk->dailyPnlPercent(), -3.0);
  EXPECT_TRUE(risk->isLocked());
  EXPECT_FALSE(risk->isTradingAllowed());
  ASSERT_EQ(locks.size(), 1u);
  EXPECT_DOUBLE_EQ(locks[0].drawdown_percent, 3.0);
  EXPECT_EQ(locks[0].unlock_at_ms, kNextBoundary);
}

TEST_F(RiskManagerTest, BelowLimitStaysOpen) {
  auto risk = makeRisk();
  closedTradeThisSession(1, -299.0);

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_FALSE(risk->isLocked());
  EXPECT_TRUE(risk->isTradingAllowed());
  EXPECT_TRUE(locks.empty());
}

// -----------------------------------------------------------------------------
// 3. The lock survives recovery and is lifted only by the boundary, which
//    also re-snapshots starting equity.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, LockHoldsUntilBoundaryThenResets) {
  auto risk = makeRisk();
  closedTradeThisSession(1, -300.0);
  risk->checkDailyLoss(3.0, kMagic);
  ASSERT_TRUE(risk->isLocked());

  // A later winning trade does not unlock.
  closedTradeThisSession(2, 500.0);
  clock.advance_time(kNextBoundary - 1);
  risk->checkDailyLoss(3.0, kMagic);
  EXPECT_FALSE(risk->isTradingAllowed());

  venue.setBalance(9700.0);
  clock.advance_time(kNextBoundary);
  EXPECT_TRUE(risk->isTradingAllowed());
  EXPECT_DOUBLE_EQ(risk->startingEquity(), 9700.0);
  EXPECT_EQ(risk->nextResetMs(), kNextBoundary + kMillisPerDay);

  ASSERT_EQ(resets.size(), 1u);
  EXPECT_TRUE(resets[0].was_locked);
  EXPECT_DOUBLE_EQ(resets[0].starting_equity, 9700.0);

  // Yesterday's deals are outside the new session.
  risk->checkDailyLoss(3.0, kMagic);
  EXPECT_DOUBLE_EQ(risk->dailyPnl(), 0.0);
  EXPECT_FALSE(risk->isLocked());
}

TEST_F(RiskManagerTest, ResetKeepsOldEquityWhenUnavailable) {
  auto risk = makeRisk();
  venue.setFailEquity(true);
  clock.advance_time(kNextBoundary + kMillisPerMinute);

  EXPECT_TRUE(risk->isTradingAllowed());
  EXPECT_DOUBLE_EQ(risk->startingEquity(), 10000.0);
  EXPECT_EQ(risk->nextResetMs(), kNextBoundary + kMillisPerDay);
}

// -----------------------------------------------------------------------------
// 4. After a three-day outage the next boundary is the first future one.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, OutageSkipsMissedBoundaries) {
  auto risk = makeRisk();
  clock.advance_time(kJan15Noon + 3 * kMillisPerDay + kMillisPerHour);

  EXPECT_TRUE(risk->isTradingAllowed());
  EXPECT_EQ(risk->nextResetMs(), kNextBoundary + 3 * kMillisPerDay);
  EXPECT_EQ(resets.size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Straddling positions count only the move since the boundary.
// Why: yesterday's P/L of a carried position must not count against
//      today's loss limit.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, OpenStraddlingPositionUsesBoundaryPrice) {
  auto risk = makeRisk();
  venue.addPosition(straddlingSell());
  venue.setHistoricalPrice("XAUUSD", kSessionStart - kMillisPerMinute, 2400.0);

  risk->checkDailyLoss(3.0, kMagic);

  // SELL 0.1 from 2400 to 2395 = +50, not the reported +150.
  EXPECT_NEAR(risk->dailyPnl(), 50.0, 1e-9);
}

TEST_F(RiskManagerTest, OpenStraddlingPositionFallsBackToReportedProfit) {
  auto risk = makeRisk();
  venue.addPosition(straddlingSell());

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_NEAR(risk->dailyPnl(), 150.0, 1e-9);
}

TEST_F(RiskManagerTest, ClosedStraddlingPositionUsesBoundaryPrice) {
  auto risk = makeRisk();
  venue.setHistoricalPrice("XAUUSD", kSessionStart - kMillisPerMinute, 2400.0);

  // Only the closing deal is in this session.
  Deal out;
  out.ticket = 900;
  out.position_id = 77;
  out.symbol = "XAUUSD";
  out.side = Side::Buy;
  out.entry = DealEntry::Out;
  out.volume = 0.1;
  out.price = 2395.0;
  out.profit = 150.0;
  out.commission = -0.5;
  out.magic = kMagic;
  out.time_ms = kSessionStart + kMillisPerHour;
  venue.addDeal(out);

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_NEAR(risk->dailyPnl(), 49.5, 1e-9);
}

// -----------------------------------------------------------------------------
// 6. Manual trades (magic 0) only count when configured to.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ManualTradesIgnoredByDefault) {
  auto risk = makeRisk();
  closedTradeThisSession(5, -400.0, /*magic=*/0);

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_DOUBLE_EQ(risk->dailyPnl(), 0.0);
  EXPECT_FALSE(risk->isLocked());
}

TEST_F(RiskManagerTest, ManualTradesCountedWhenIncluded) {
  auto risk = makeRisk(/*include_manual=*/true);
  closedTradeThisSession(5, -400.0, /*magic=*/0);

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_DOUBLE_EQ(risk->dailyPnl(), -400.0);
  EXPECT_TRUE(risk->isLocked());
}

// -----------------------------------------------------------------------------
// 7. Unreadable history skips the check instead of guessing.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, HistoryFailureSkipsCheck) {
  auto risk = makeRisk();
  closedTradeThisSession(1, -500.0);
  venue.setFailHistory(true);

  risk->checkDailyLoss(3.0, kMagic);

  EXPECT_FALSE(risk->isLocked());
  EXPECT_DOUBLE_EQ(risk->dailyPnl(), 0.0);
}

// -----------------------------------------------------------------------------
// 8. Lot normalization.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, NormalizeLotFloorsAndClamps) {
  auto risk = makeRisk();
  EXPECT_NEAR(risk->normalizeLot(0.03), 0.03, 1e-12);
  EXPECT_NEAR(risk->normalizeLot(0.037), 0.03, 1e-12);
  EXPECT_NEAR(risk->normalizeLot(0.001), 0.01, 1e-12);
  EXPECT_NEAR(risk->normalizeLot(5.0), 1.0, 1e-12);
}
