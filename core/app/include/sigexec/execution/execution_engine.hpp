#pragma once

#include "sigexec/domain/signal.hpp"
#include "sigexec/domain/venue_types.hpp"
#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/time/i_time_provider.hpp"
#include "sigexec/venue/i_venue.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace sigexec {

// Startup failure of the execution layer (instrument unknown to the venue).
class ExecutionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Result of the entry-band test.
struct EntryCheck {
  bool eligible{false};
  std::optional<double> price;  // Quote side used; empty if the quote failed
};

// -----------------------------------------------------------------------------
// ExecutionEngine
// -----------------------------------------------------------------------------
//
// @brief  Everything that touches positions at the venue: entry gating,
//         dual-leg placement, breakeven promotion and flatten-all.
//
// @details
// A signal becomes two market orders on the configured instrument, in the
// signal's direction and with the signal's stop:
//
//   leg 1  comment "SIG<id>_TP1"  target take_profit_1
//   leg 2  comment "SIG<id>_TP2"  target take_profit_2
//
// Both carry the engine's magic number; that tag is how the engine tells its
// own positions from manual trades. Positions are never cached: every call
// asks the venue what is open right now.
//
// All-or-nothing:
//   openDualPosition() first flattens everything the engine has open (at
//   most one dual position at a time), then places leg 1 and leg 2. If
//   either placement fails, everything tagged is flattened again, so a
//   single orphaned leg never survives the call.
//
// Breakeven:
//   When leg 1 hits its target the venue closes it. The next
//   manageBreakeven() finds a TP2 leg without its TP1 sibling and moves its
//   stop to the entry price. A stop already within one point of entry is
//   left alone, which makes repeated calls no-ops.
//
// Thread model: tick thread only.
// -----------------------------------------------------------------------------
class ExecutionEngine {
 public:
  ExecutionEngine(IVenue& venue, const ITimeProvider& clock, EventBus& bus,
                  std::string instrument, domain::Magic magic,
                  double entry_tolerance);

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  // -------------------------------------------------------------------------
  // resolveInstrument()
  // -------------------------------------------------------------------------
  // @brief  Loads point and volume constraints of the instrument.
  // @throws ExecutionError if the venue does not know the instrument, or
  //         reports a non-positive step or minimum, or a minimum above the
  //         maximum.
  // -------------------------------------------------------------------------
  const domain::InstrumentSpec& resolveInstrument();

  // -------------------------------------------------------------------------
  // checkEntryRange(signal)
  // -------------------------------------------------------------------------
  // @brief  Tests the executable price against the signal's entry band.
  //
  // @details
  // BUY uses ask, SELL uses bid. Eligible iff
  //   bandLow() - tolerance <= price <= bandHigh() + tolerance.
  // A failed quote is "not eligible".
  // -------------------------------------------------------------------------
  EntryCheck checkEntryRange(const domain::Signal& signal);

  // -------------------------------------------------------------------------
  // openDualPosition(signal, lot_leg1, lot_leg2)
  // -------------------------------------------------------------------------
  // @return true when both legs are open; false otherwise, in which case no
  //         tagged position is left open (unless the venue also refused the
  //         rollback closes, which is logged).
  // -------------------------------------------------------------------------
  bool openDualPosition(const domain::Signal& signal, double lot_leg1,
                        double lot_leg2);

  // @return Whether an open tagged leg belongs to the signal; std::nullopt
  //         if positions could not be read.
  std::optional<bool> hasLegsFor(domain::SignalId id);

  // Moves the stop of every orphaned TP2 leg to its entry price.
  void manageBreakeven();

  // -------------------------------------------------------------------------
  // flattenAll()
  // -------------------------------------------------------------------------
  // @brief  Closes every tagged position and cancels every tagged pending
  //         order, continuing past individual failures.
  // @return true if every item was handled (or there was nothing to do).
  // -------------------------------------------------------------------------
  bool flattenAll();

  // Number of open tagged legs; 0 if positions could not be read.
  std::size_t openLegCount();

  static std::string legComment(domain::SignalId id, int leg);

  const domain::InstrumentSpec& instrumentSpec() const { return spec_; }
  const std::string& instrument() const { return instrument_; }
  domain::Magic magic() const { return magic_; }

 private:
  // A venue that throws is reported as a rejected leg so the caller can roll
  // back.
  domain::OrderResult placeLeg(const domain::Signal& signal, double volume,
                               double take_profit, int leg);

  IVenue& venue_;
  const ITimeProvider& clock_;
  EventBus& bus_;
  std::string instrument_;
  domain::Magic magic_;
  double entry_tolerance_;
  domain::InstrumentSpec spec_;
};

}  // namespace sigexec
