#pragma once

#include "sigexec/domain/side.hpp"

#include <cstdint>
#include <string>

namespace sigexec {
namespace domain {

// -----------------------------------------------------------------------------
// Venue value types
// -----------------------------------------------------------------------------
//
// @brief  Plain snapshots of state that lives at the trading venue.
//
// @details
// The venue is the authoritative owner of positions, pending orders, deals
// and account equity. These structs are copies returned by IVenue calls and
// are only valid for the tick that fetched them — nothing in the core keeps
// them across ticks.
//
// Times are UTC epoch milliseconds, the same unit ITimeProvider uses.
// -----------------------------------------------------------------------------

using Ticket = std::uint64_t;
using Magic = std::int64_t;

// Trading constraints of one instrument.
struct InstrumentSpec {
  std::string symbol;
  double point{0.01};        // Minimal price increment
  int digits{2};             // Price precision
  double volume_min{0.01};
  double volume_max{100.0};
  double volume_step{0.01};
  double contract_size{100.0};
};

struct Quote {
  double bid{0.0};
  double ask{0.0};
  std::int64_t time_ms{0};
};

// An open position (one leg of a dual position, or a manual trade).
struct VenuePosition {
  Ticket ticket{0};
  std::string symbol;
  Side side{Side::Buy};
  double volume{0.0};
  double open_price{0.0};
  double current_price{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};
  double profit{0.0};  // Floating P/L as reported by the venue
  double swap{0.0};
  Magic magic{0};
  std::int64_t open_time_ms{0};
  std::string comment;
};

// A pending (not yet triggered) order.
struct PendingOrder {
  Ticket ticket{0};
  std::string symbol;
  Magic magic{0};
  std::string comment;
};

// Whether a deal opened or closed (part of) a position.
enum class DealEntry {
  In,
  Out,
  InOut,  // Reversal
  OutBy,  // Closed by an opposite position
};

// One executed trade from the account history.
struct Deal {
  Ticket ticket{0};
  Ticket position_id{0};  // Position the deal belongs to
  std::string symbol;
  Side side{Side::Buy};   // Direction of the deal itself, not the position
  DealEntry entry{DealEntry::In};
  double volume{0.0};
  double price{0.0};
  double profit{0.0};
  double commission{0.0};
  double swap{0.0};
  Magic magic{0};
  std::int64_t time_ms{0};
  std::string comment;
};

// Parameters of a market order.
struct MarketOrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  double volume{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};
  Magic magic{0};
  std::string comment;
};

// Outcome of a market order. ok == false means nothing was opened.
struct OrderResult {
  bool ok{false};
  Ticket ticket{0};
  double price{0.0};
  std::string message;
};

}  // namespace domain
}  // namespace sigexec
