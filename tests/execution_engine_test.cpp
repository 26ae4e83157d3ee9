// =============================================================================
// execution_engine_test.cpp
// =============================================================================
// Unit tests for sigexec::ExecutionEngine against a SimulatedVenue.
//
// Validates:
//   - Entry range is inclusive at band +/- tolerance, priced on the side
//     that would fill (ask for BUY, bid for SELL)
//   - A dual position opens as two tagged legs sharing the stop
//   - A failed or throwing second leg leaves nothing open
//   - Unusable instrument volume limits are rejected at startup
//   - Breakeven moves the TP2 stop once TP1 is gone, exactly once
//   - flattenAll touches only the engine's own positions and orders
// =============================================================================

#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/execution/execution_engine.hpp"
#include "sigexec/time/simulation_time_provider.hpp"
#include "sigexec/venue/simulated_venue.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using sigexec::BreakevenEvent;
using sigexec::EventBus;
using sigexec::ExecutionEngine;
using sigexec::ExecutionError;
using sigexec::SimulatedVenue;
using sigexec::SimulationTimeProvider;
using sigexec::domain::Deal;
using sigexec::domain::InstrumentSpec;
using sigexec::domain::Magic;
using sigexec::domain::MarketOrderRequest;
using sigexec::domain::OrderResult;
using sigexec::domain::PendingOrder;
using sigexec::domain::Quote;
using sigexec::domain::Side;
using sigexec::domain::Ticket;
using sigexec::domain::VenuePosition;
using namespace sigexec_test;

namespace {

// Forwards to a SimulatedVenue but throws on the nth placement, the way a
// bridge adapter fails on an unexpected reply.
class ThrowingPlacementVenue final : public sigexec::IVenue {
 public:
  ThrowingPlacementVenue(SimulatedVenue& inner, std::size_t throw_on)
      : inner_(inner), throw_on_(throw_on) {}

  std::optional<InstrumentSpec> instrument(const std::string& symbol) override {
    return inner_.instrument(symbol);
  }
  std::optional<Quote> quote(const std::string& symbol) override {
    return inner_.quote(symbol);
  }
  std::optional<double> accountEquity() override {
    return inner_.accountEquity();
  }
  OrderResult placeMarketOrder(const MarketOrderRequest& request) override {
    if (++placements_ == throw_on_) {
      throw std::runtime_error("bridge reply carried a non-boolean ok");
    }
    return inner_.placeMarketOrder(request);
  }
  bool modifyPosition(Ticket ticket, double stop_loss,
                      double take_profit) override {
    return inner_.modifyPosition(ticket, stop_loss, take_profit);
  }
  bool closePosition(Ticket ticket) override {
    return inner_.closePosition(ticket);
  }
  bool cancelOrder(Ticket ticket) override { return inner_.cancelOrder(ticket); }
  std::optional<std::vector<VenuePosition>> openPositions(
      std::optional<Magic> magic) override {
    return inner_.openPositions(magic);
  }
  std::optional<std::vector<PendingOrder>> pendingOrders(
      std::optional<Magic> magic) override {
    return inner_.pendingOrders(magic);
  }
  std::optional<std::vector<Deal>> historyDeals(std::int64_t from_ms,
                                                std::int64_t to_ms) override {
    return inner_.historyDeals(from_ms, to_ms);
  }
  std::optional<double> priceAt(const std::string& symbol,
                                std::int64_t time_ms) override {
    return inner_.priceAt(symbol, time_ms);
  }
  std::optional<double> calcProfit(const std::string& symbol, Side side,
                                   double volume, double open_price,
                                   double close_price) override {
    return inner_.calcProfit(symbol, side, volume, open_price, close_price);
  }

 private:
  SimulatedVenue& inner_;
  std::size_t throw_on_;
  std::size_t placements_{0};
};

class ExecutionEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    venue.addInstrument(xauusdSpec());
    venue.setQuote("XAUUSD", 2401.0, 2401.3);
    engine.resolveInstrument();
    bus.subscribe<BreakevenEvent>(
        [this](const BreakevenEvent& e) { breakevens.push_back(e); });
  }

  SimulationTimeProvider clock{kJan15Noon};
  SimulatedVenue venue{clock, 10000.0};
  EventBus bus;
  ExecutionEngine engine{venue, clock, bus, "XAUUSD", kMagic, 3.0};
  std::vector<BreakevenEvent> breakevens;
};

}  // namespace

TEST_F(ExecutionEngineTest, LegCommentsTagSignalAndLeg) {
  EXPECT_EQ(ExecutionEngine::legComment(42, 1), "SIG42_TP1");
  EXPECT_EQ(ExecutionEngine::legComment(42, 2), "SIG42_TP2");
}

TEST_F(ExecutionEngineTest, UnknownInstrumentThrows) {
  ExecutionEngine other{venue, clock, bus, "EURUSD", kMagic, 3.0};
  EXPECT_THROW(other.resolveInstrument(), ExecutionError);
}

// Why: lot normalization clamps into [min, max]; inverted or empty limits
// must stop startup instead of reaching the clamp.
TEST_F(ExecutionEngineTest, UnusableVolumeLimitsThrow) {
  auto inverted = xauusdSpec();
  inverted.symbol = "XAGUSD";
  inverted.volume_min = 1.0;
  inverted.volume_max = 0.1;
  venue.addInstrument(inverted);
  ExecutionEngine silver{venue, clock, bus, "XAGUSD", kMagic, 3.0};
  EXPECT_THROW(silver.resolveInstrument(), ExecutionError);

  auto no_step = xauusdSpec();
  no_step.symbol = "XPTUSD";
  no_step.volume_step = 0.0;
  venue.addInstrument(no_step);
  ExecutionEngine platinum{venue, clock, bus, "XPTUSD", kMagic, 3.0};
  EXPECT_THROW(platinum.resolveInstrument(), ExecutionError);
}

// -----------------------------------------------------------------------------
// 1. Entry range. SELL band 2400-2402, tolerance 3 -> bid in [2397, 2405].
// -----------------------------------------------------------------------------
TEST_F(ExecutionEngineTest, SellEntryUsesBidInclusive) {
  auto signal = makeSignal(1, Side::Sell);

  venue.setQuote("XAUUSD", 2405.0, 2405.5);
  auto at_edge = engine.checkEntryRange(signal);
  EXPECT_TRUE(at_edge.eligible);
  ASSERT_TRUE(at_edge.price.has_value());
  EXPECT_DOUBLE_EQ(*at_edge.price, 2405.0);

  venue.setQuote("XAUUSD", 2405.01, 2405.3);
  EXPECT_FALSE(engine.checkEntryRange(signal).eligible);

  venue.setQuote("XAUUSD", 2397.0, 2397.3);
  EXPECT_TRUE(engine.checkEntryRange(signal).eligible);
}

TEST_F(ExecutionEngineTest, BuyEntryUsesAsk) {
  auto signal = makeSignal(1, Side::Buy);  // band 2398-2400 -> [2395, 2403]

  venue.setQuote("XAUUSD", 2402.9, 2403.0);
  EXPECT_TRUE(engine.checkEntryRange(signal).eligible);

  // Bid inside, ask outside: not eligible.
  venue.setQuote("XAUUSD", 2402.9, 2403.2);
  EXPECT_FALSE(engine.checkEntryRange(signal).eligible);
}

TEST_F(ExecutionEngineTest, NoQuoteIsNotEligible) {
  venue.setFailQuotes(true);
  auto check = engine.checkEntryRange(makeSignal(1));
  EXPECT_FALSE(check.eligible);
  EXPECT_FALSE(check.price.has_value());
}

// -----------------------------------------------------------------------------
// 2. Dual position: two legs, same stop, distinct targets and comments.
// -----------------------------------------------------------------------------
TEST_F(ExecutionEngineTest, OpensBothLegs) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(7), 0.02, 0.01));

  const auto& positions = venue.positions();
  ASSERT_EQ(positions.size(), 2u);
  EXPECT_EQ(positions[0].comment, "SIG7_TP1");
  EXPECT_DOUBLE_EQ(positions[0].volume, 0.02);
  EXPECT_DOUBLE_EQ(positions[0].take_profit, 2390.0);
  EXPECT_EQ(positions[1].comment, "SIG7_TP2");
  EXPECT_DOUBLE_EQ(positions[1].volume, 0.01);
  EXPECT_DOUBLE_EQ(positions[1].take_profit, 2380.0);
  for (const auto& pos : positions) {
    EXPECT_EQ(pos.side, Side::Sell);
    EXPECT_DOUBLE_EQ(pos.stop_loss, 2410.0);
    EXPECT_EQ(pos.magic, kMagic);
  }

  EXPECT_EQ(engine.hasLegsFor(7), true);
  EXPECT_EQ(engine.hasLegsFor(70), false);
  EXPECT_EQ(engine.openLegCount(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Second leg rejected: the first is closed again.
// Why: a single leg is an unmanaged half-position.
// -----------------------------------------------------------------------------
TEST_F(ExecutionEngineTest, SecondLegFailureRollsBack) {
  venue.rejectPlacement(2);

  EXPECT_FALSE(engine.openDualPosition(makeSignal(7), 0.01, 0.01));
  EXPECT_TRUE(venue.positions().empty());
  EXPECT_EQ(venue.placementAttempts(), 2u);
  EXPECT_EQ(engine.hasLegsFor(7), false);
}

// Why: an adapter that throws while placing the second leg must not leave
// the first leg open.
TEST_F(ExecutionEngineTest, ThrowingSecondLegRollsBack) {
  ThrowingPlacementVenue throwing{venue, 2};
  ExecutionEngine guarded{throwing, clock, bus, "XAUUSD", kMagic, 3.0};
  guarded.resolveInstrument();

  EXPECT_FALSE(guarded.openDualPosition(makeSignal(7), 0.01, 0.01));
  EXPECT_EQ(venue.placementAttempts(), 1u);
  EXPECT_TRUE(venue.positions().empty());
  EXPECT_EQ(guarded.hasLegsFor(7), false);
}

TEST_F(ExecutionEngineTest, MissingSecondTargetOpensNothing) {
  auto signal = makeSignal(7);
  signal.take_profit_2.reset();
  EXPECT_FALSE(engine.openDualPosition(signal, 0.01, 0.01));
  EXPECT_EQ(venue.placementAttempts(), 0u);
}

TEST_F(ExecutionEngineTest, ExistingLegsAreClearedFirst) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(1), 0.01, 0.01));
  ASSERT_TRUE(engine.openDualPosition(makeSignal(2), 0.01, 0.01));

  ASSERT_EQ(venue.positions().size(), 2u);
  EXPECT_EQ(engine.hasLegsFor(1), false);
  EXPECT_EQ(engine.hasLegsFor(2), true);
}

TEST_F(ExecutionEngineTest, FlattenFailureBlocksNewEntry) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(1), 0.01, 0.01));
  venue.setFailCloses(true);

  EXPECT_FALSE(engine.openDualPosition(makeSignal(2), 0.01, 0.01));
  EXPECT_EQ(venue.placementAttempts(), 2u);
}

TEST_F(ExecutionEngineTest, UnreadablePositionsAreUnknown) {
  venue.setFailPositions(true);
  EXPECT_FALSE(engine.hasLegsFor(7).has_value());
  EXPECT_EQ(engine.openLegCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Breakeven after TP1 fills.
// -----------------------------------------------------------------------------
TEST_F(ExecutionEngineTest, BreakevenAfterFirstTarget) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(7), 0.01, 0.01));

  // Both legs open: nothing to do.
  engine.manageBreakeven();
  EXPECT_EQ(venue.modifyCalls(), 0u);

  // Price reaches TP1 (2390): leg 1 closes at its target.
  venue.setQuote("XAUUSD", 2389.7, 2389.9);
  ASSERT_EQ(venue.positions().size(), 1u);

  engine.manageBreakeven();
  ASSERT_EQ(venue.positions().size(), 1u);
  const auto& leg2 = venue.positions()[0];
  EXPECT_EQ(leg2.comment, "SIG7_TP2");
  EXPECT_DOUBLE_EQ(leg2.stop_loss, leg2.open_price);
  EXPECT_DOUBLE_EQ(leg2.take_profit, 2380.0);
  ASSERT_EQ(breakevens.size(), 1u);
  EXPECT_DOUBLE_EQ(breakevens[0].old_stop_loss, 2410.0);

  // Already at entry: no second modification.
  engine.manageBreakeven();
  EXPECT_EQ(venue.modifyCalls(), 1u);
  EXPECT_EQ(breakevens.size(), 1u);
}

TEST_F(ExecutionEngineTest, BreakevenRetriesAfterModifyFailure) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(7), 0.01, 0.01));
  venue.setQuote("XAUUSD", 2389.7, 2389.9);
  venue.setFailModify(true);

  engine.manageBreakeven();
  EXPECT_TRUE(breakevens.empty());

  venue.setFailModify(false);
  engine.manageBreakeven();
  EXPECT_EQ(breakevens.size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. flattenAll leaves foreign positions alone.
// -----------------------------------------------------------------------------
TEST_F(ExecutionEngineTest, FlattenOnlyTouchesOwnMagic) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(7), 0.01, 0.01));

  VenuePosition manual;
  manual.symbol = "XAUUSD";
  manual.side = Side::Buy;
  manual.volume = 0.1;
  manual.open_price = 2390.0;
  manual.magic = 0;
  venue.addPosition(manual);

  sigexec::domain::PendingOrder own;
  own.ticket = 5001;
  own.symbol = "XAUUSD";
  own.magic = kMagic;
  venue.addPendingOrder(own);
  sigexec::domain::PendingOrder foreign = own;
  foreign.ticket = 5002;
  foreign.magic = 0;
  venue.addPendingOrder(foreign);

  EXPECT_TRUE(engine.flattenAll());

  ASSERT_EQ(venue.positions().size(), 1u);
  EXPECT_EQ(venue.positions()[0].magic, 0);
  auto orders = venue.pendingOrders(std::nullopt);
  ASSERT_TRUE(orders.has_value());
  ASSERT_EQ(orders->size(), 1u);
  EXPECT_EQ((*orders)[0].ticket, 5002u);
}

TEST_F(ExecutionEngineTest, FlattenReportsPartialFailure) {
  ASSERT_TRUE(engine.openDualPosition(makeSignal(7), 0.01, 0.01));
  venue.setFailCloses(true);

  EXPECT_FALSE(engine.flattenAll());
  EXPECT_EQ(venue.closeCalls(), 2u);
  EXPECT_EQ(venue.positions().size(), 2u);
}
