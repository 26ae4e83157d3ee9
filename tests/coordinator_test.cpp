// =============================================================================
// coordinator_test.cpp
// =============================================================================
// Scenario tests for sigexec::Coordinator: one tick of the execution loop
// wired to a SimulatedVenue and an in-memory signal store.
//
// Validates:
//   - A valid in-range signal opens both legs and is marked DONE
//   - Validation failures are marked INVALID without touching the venue
//   - Out-of-range signals stay pending and are not written
//   - A tripped circuit breaker flattens and stops all intake
//   - A failed status write is retried on the next tick without trading again
//   - Signals whose legs already exist are closed out as DONE, unless the
//     producer edited them, in which case they reopen at the new levels
//   - Waiting signals that leave the queue are forgotten
//   - Execution failures are marked ERROR and leave no legs behind
// =============================================================================

#include "sigexec/engine/coordinator.hpp"
#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/execution/execution_engine.hpp"
#include "sigexec/risk/risk_manager.hpp"
#include "sigexec/time/simulation_time_provider.hpp"
#include "sigexec/venue/simulated_venue.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using sigexec::Coordinator;
using sigexec::CoordinatorSettings;
using sigexec::EventBus;
using sigexec::ExecutionEngine;
using sigexec::RiskManager;
using sigexec::SessionClock;
using sigexec::SignalStatusEvent;
using sigexec::SimulatedVenue;
using sigexec::SimulationTimeProvider;
using sigexec::TickSummaryEvent;
using sigexec::TimeOfDay;
using sigexec::domain::Deal;
using sigexec::domain::DealEntry;
using sigexec::domain::Side;
using sigexec::domain::SignalStatus;
using sigexec::domain::VenuePosition;
using namespace sigexec_test;

namespace {

class CoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    venue.addInstrument(xauusdSpec());
    venue.setQuote("XAUUSD", 2401.0, 2401.3);
    bus.subscribe<SignalStatusEvent>(
        [this](const SignalStatusEvent& e) { status_events.push_back(e); });
    build();
  }

  void build(double max_sl_distance = 15.0) {
    engine = std::make_unique<ExecutionEngine>(venue, clock, bus, "XAUUSD",
                                               kMagic, 3.0);
    risk = std::make_unique<RiskManager>(
        venue, clock, bus, "XAUUSD", SessionClock(TimeOfDay{7, 10}, 9 * 60),
        false);
    risk->init(engine->resolveInstrument());

    CoordinatorSettings settings;
    settings.instrument = "XAUUSD";
    settings.whitelist = {"XAUUSD"};
    settings.lot_leg1 = 0.01;
    settings.lot_leg2 = 0.01;
    settings.magic = kMagic;
    settings.limits.max_sl_distance = max_sl_distance;
    settings.limits.entry_tolerance = 3.0;
    settings.limits.max_daily_loss_percent = 3.0;
    coordinator = std::make_unique<Coordinator>(store, *risk, *engine, bus,
                                                clock, settings);
  }

  // Closed -300 trade this session: exactly the 3 % limit on 10000.
  void bookLimitLoss() {
    Deal in;
    in.ticket = 1;
    in.position_id = 500;
    in.symbol = "XAUUSD";
    in.side = Side::Sell;
    in.entry = DealEntry::In;
    in.volume = 0.1;
    in.magic = kMagic;
    in.time_ms = kSessionStart + kMillisPerHour;
    venue.addDeal(in);
    Deal out = in;
    out.ticket = 2;
    out.side = Side::Buy;
    out.entry = DealEntry::Out;
    out.profit = -300.0;
    out.time_ms = kSessionStart + 2 * kMillisPerHour;
    venue.addDeal(out);
  }

  SimulationTimeProvider clock{kJan15Noon};
  SimulatedVenue venue{clock, 10000.0};
  EventBus bus;
  InMemorySignalStore store;
  std::unique_ptr<ExecutionEngine> engine;
  std::unique_ptr<RiskManager> risk;
  std::unique_ptr<Coordinator> coordinator;
  std::vector<SignalStatusEvent> status_events;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. SELL 2400-2402, SL 2410, bid 2401: both legs open, row DONE.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, InRangeSignalOpensBothLegs) {
  store.add(makeSignal(1));

  TickSummaryEvent summary = coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Done);
  ASSERT_EQ(venue.positions().size(), 2u);
  EXPECT_EQ(venue.positions()[0].comment, "SIG1_TP1");
  EXPECT_EQ(venue.positions()[1].comment, "SIG1_TP2");
  EXPECT_EQ(summary.executed, 1u);
  EXPECT_EQ(summary.pending_signals, 1u);
  EXPECT_EQ(summary.open_legs, 2u);
  EXPECT_EQ(summary.tick, 1u);
  EXPECT_EQ(summary.next_reset_ms, kNextBoundary);
  ASSERT_EQ(status_events.size(), 1u);
  EXPECT_EQ(status_events[0].status, SignalStatus::Done);
}

// -----------------------------------------------------------------------------
// 2. Stop 8 away with a limit of 5: INVALID, venue never asked.
// Why: validation must not cost a quote round-trip or a placement.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, StopTooFarIsInvalid) {
  build(/*max_sl_distance=*/5.0);
  store.add(makeSignal(1));

  TickSummaryEvent summary = coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Invalid);
  EXPECT_EQ(venue.quoteRequests(), 0u);
  EXPECT_EQ(venue.placementAttempts(), 0u);
  EXPECT_EQ(summary.rejected, 1u);
}

TEST_F(CoordinatorTest, MissingSecondTargetIsInvalid) {
  auto signal = makeSignal(1);
  signal.take_profit_2.reset();
  store.add(signal);

  coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Invalid);
  EXPECT_EQ(venue.placementAttempts(), 0u);
}

TEST_F(CoordinatorTest, RejectionReasons) {
  auto ok = makeSignal(1, Side::Buy);
  EXPECT_FALSE(coordinator->rejectionReason(ok).has_value());

  auto lower = makeSignal(2);
  lower.symbol = "xauusd";
  EXPECT_FALSE(coordinator->rejectionReason(lower).has_value());

  auto other = makeSignal(3);
  other.symbol = "EURUSD";
  EXPECT_TRUE(coordinator->rejectionReason(other).has_value());

  // BUY measures from entry_min: |2398 - 2380| = 18 > 15.
  auto far = makeSignal(4, Side::Buy);
  far.stop_loss = 2380.0;
  EXPECT_TRUE(coordinator->rejectionReason(far).has_value());

  // Exactly at the limit is allowed: |2417 - 2402| = 15.
  auto edge = makeSignal(5);
  edge.stop_loss = 2417.0;
  EXPECT_FALSE(coordinator->rejectionReason(edge).has_value());
}

// -----------------------------------------------------------------------------
// 3. Price away from the band: nothing written, signal still pending; it
//    executes once price comes back.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, OutOfRangeSignalWaits) {
  venue.setQuote("XAUUSD", 2420.0, 2420.3);
  store.add(makeSignal(1));

  coordinator->tick();
  coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Process);
  EXPECT_EQ(store.attemptedWrites(), 0);
  EXPECT_EQ(venue.placementAttempts(), 0u);

  venue.setQuote("XAUUSD", 2401.0, 2401.3);
  coordinator->tick();
  EXPECT_EQ(store.statusOf(1), SignalStatus::Done);
}

TEST_F(CoordinatorTest, ExpiredWaitingSignalIsForgotten) {
  venue.setQuote("XAUUSD", 2420.0, 2420.3);
  store.add(makeSignal(1));
  store.add(makeSignal(2));

  coordinator->tick();
  ASSERT_EQ(coordinator->waitingCount(), 2u);

  store.setRowStatus(1, SignalStatus::Expired);
  coordinator->tick();

  EXPECT_EQ(coordinator->waitingCount(), 1u);
  EXPECT_EQ(store.attemptedWrites(), 0);
}

// -----------------------------------------------------------------------------
// 4. Daily loss at the limit: own legs flattened, no intake.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, LockFlattensAndStopsIntake) {
  store.add(makeSignal(1));
  coordinator->tick();
  ASSERT_EQ(venue.positions().size(), 2u);

  bookLimitLoss();
  store.add(makeSignal(2));
  TickSummaryEvent summary = coordinator->tick();

  EXPECT_TRUE(summary.trading_locked);
  EXPECT_TRUE(venue.positions().empty());
  EXPECT_EQ(store.statusOf(2), SignalStatus::Process);
  EXPECT_EQ(venue.placementAttempts(), 2u);
  EXPECT_EQ(summary.pending_signals, 0u);

  // Still locked on the next tick.
  coordinator->tick();
  EXPECT_EQ(store.statusOf(2), SignalStatus::Process);

  // The boundary reopens trading.
  clock.advance_time(kNextBoundary + kMillisPerMinute);
  summary = coordinator->tick();
  EXPECT_FALSE(summary.trading_locked);
  EXPECT_EQ(store.statusOf(2), SignalStatus::Done);
}

// -----------------------------------------------------------------------------
// 5. DONE write fails after both legs opened: the write is retried next tick
//    and the signal is not executed twice.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, FailedDoneWriteIsRetriedWithoutReexecution) {
  store.add(makeSignal(1));
  store.failNextWrites(1);

  coordinator->tick();
  EXPECT_EQ(store.statusOf(1), SignalStatus::Process);
  EXPECT_EQ(coordinator->pendingWriteCount(), 1u);
  EXPECT_EQ(venue.placementAttempts(), 2u);

  coordinator->tick();
  EXPECT_EQ(store.statusOf(1), SignalStatus::Done);
  EXPECT_EQ(coordinator->pendingWriteCount(), 0u);
  EXPECT_EQ(venue.placementAttempts(), 2u);
  EXPECT_EQ(venue.positions().size(), 2u);
}

TEST_F(CoordinatorTest, FailedWriteEndsTheTick) {
  auto missing_tp2 = makeSignal(1);
  missing_tp2.take_profit_2.reset();
  store.add(missing_tp2);
  store.add(makeSignal(2));
  store.failNextWrites(1);

  coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Process);
  EXPECT_EQ(store.statusOf(2), SignalStatus::Process);
  EXPECT_EQ(venue.placementAttempts(), 0u);

  coordinator->tick();
  EXPECT_EQ(store.statusOf(1), SignalStatus::Invalid);
  EXPECT_EQ(store.statusOf(2), SignalStatus::Done);
}

// -----------------------------------------------------------------------------
// 6. Legs for the signal already exist (e.g. after a crash between placement
//    and write-back): mark DONE, do not trade.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, ExistingLegsMarkDone) {
  VenuePosition leg;
  leg.symbol = "XAUUSD";
  leg.side = Side::Sell;
  leg.volume = 0.01;
  leg.open_price = 2401.0;
  leg.stop_loss = 2410.0;
  leg.take_profit = 2380.0;
  leg.magic = kMagic;
  leg.open_time_ms = kJan15Noon - kMillisPerMinute;
  leg.comment = "SIG9_TP2";
  venue.addPosition(leg);
  store.add(makeSignal(9));

  coordinator->tick();

  EXPECT_EQ(store.statusOf(9), SignalStatus::Done);
  EXPECT_EQ(venue.placementAttempts(), 0u);
}

// Why: the producer edits a signal by rewriting its row with new levels and
// status MODIFY. The open legs must be replaced, not left at the old stop.
TEST_F(CoordinatorTest, EditedSignalReopensWithNewLevels) {
  store.add(makeSignal(1));
  coordinator->tick();
  ASSERT_EQ(store.statusOf(1), SignalStatus::Done);
  ASSERT_EQ(venue.placementAttempts(), 2u);

  auto edited = makeSignal(1);
  edited.stop_loss = 2406.0;
  edited.status = SignalStatus::Modify;
  store.add(edited);
  coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Done);
  EXPECT_EQ(venue.placementAttempts(), 4u);
  ASSERT_EQ(venue.positions().size(), 2u);
  for (const auto& p : venue.positions()) {
    EXPECT_DOUBLE_EQ(p.stop_loss, 2406.0) << p.comment;
  }
}

TEST_F(CoordinatorTest, UnreadablePositionsDeferSignal) {
  store.add(makeSignal(1));
  venue.setFailPositions(true);

  coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Process);
  EXPECT_EQ(venue.placementAttempts(), 0u);
  EXPECT_EQ(store.attemptedWrites(), 0);
}

// -----------------------------------------------------------------------------
// 7. Second leg rejected: ERROR and no legs left.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, ExecutionFailureIsError) {
  venue.rejectPlacement(2);
  store.add(makeSignal(1));

  TickSummaryEvent summary = coordinator->tick();

  EXPECT_EQ(store.statusOf(1), SignalStatus::Error);
  EXPECT_TRUE(venue.positions().empty());
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.open_legs, 0u);
}

// -----------------------------------------------------------------------------
// 8. Store read failure: tick ends quietly, nothing written.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, StoreReadFailureSkipsIntake) {
  store.add(makeSignal(1));
  store.failReads(true);

  TickSummaryEvent summary = coordinator->tick();

  EXPECT_EQ(summary.pending_signals, 0u);
  EXPECT_EQ(store.attemptedWrites(), 0);
  EXPECT_EQ(venue.placementAttempts(), 0u);
}

// -----------------------------------------------------------------------------
// 9. Breakeven runs every tick before intake.
// -----------------------------------------------------------------------------
TEST_F(CoordinatorTest, TickMovesStopToBreakevenAfterFirstTarget) {
  store.add(makeSignal(1));
  coordinator->tick();

  venue.setQuote("XAUUSD", 2389.7, 2389.9);  // TP1 at 2390 fills
  coordinator->tick();

  ASSERT_EQ(venue.positions().size(), 1u);
  EXPECT_DOUBLE_EQ(venue.positions()[0].stop_loss,
                   venue.positions()[0].open_price);
}
