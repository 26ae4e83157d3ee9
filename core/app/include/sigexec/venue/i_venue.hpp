#pragma once

#include "sigexec/domain/side.hpp"
#include "sigexec/domain/venue_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigexec {

// -----------------------------------------------------------------------------
// IVenue — narrow execution interface to the trading venue
// -----------------------------------------------------------------------------
//
// @brief  Everything the core needs from the broker terminal, and nothing
//         more.
//
// @details
// The venue owns positions, orders, deals and account state. The core never
// caches any of it across ticks; every decision re-reads what it needs here.
//
// Implementations:
//   ZmqVenue        → JSON over a ZeroMQ REQ socket to the terminal bridge.
//   SimulatedVenue  → deterministic in-memory book (paper mode and tests).
//
// Error reporting:
//   No method throws for a failed venue call. Queries return std::nullopt,
//   mutations return false (or OrderResult::ok == false). The caller logs
//   and decides; implementations log transport-level detail themselves.
//
// Thread model: tick thread only. Implementations need not be thread-safe.
// -----------------------------------------------------------------------------
class IVenue {
 public:
  virtual ~IVenue() = default;

  // Trading constraints of the symbol; std::nullopt if unknown.
  virtual std::optional<domain::InstrumentSpec> instrument(
      const std::string& symbol) = 0;

  virtual std::optional<domain::Quote> quote(const std::string& symbol) = 0;

  virtual std::optional<double> accountEquity() = 0;

  // -------------------------------------------------------------------------
  // placeMarketOrder(request)
  // -------------------------------------------------------------------------
  // @brief  Opens a position at market with the given stop and target.
  //
  // @return OrderResult with ok == true and the new position ticket on fill.
  //         ok == false means nothing was opened.
  // -------------------------------------------------------------------------
  virtual domain::OrderResult placeMarketOrder(
      const domain::MarketOrderRequest& request) = 0;

  // Sets stop loss and take profit of an open position.
  virtual bool modifyPosition(domain::Ticket ticket, double stop_loss,
                              double take_profit) = 0;

  virtual bool closePosition(domain::Ticket ticket) = 0;

  virtual bool cancelOrder(domain::Ticket ticket) = 0;

  // Open positions, restricted to one order tag when magic is set.
  virtual std::optional<std::vector<domain::VenuePosition>> openPositions(
      std::optional<domain::Magic> magic) = 0;

  virtual std::optional<std::vector<domain::PendingOrder>> pendingOrders(
      std::optional<domain::Magic> magic) = 0;

  // Deals with from_ms <= time_ms <= to_ms, all tags.
  virtual std::optional<std::vector<domain::Deal>> historyDeals(
      std::int64_t from_ms, std::int64_t to_ms) = 0;

  // -------------------------------------------------------------------------
  // priceAt(symbol, time_ms)
  // -------------------------------------------------------------------------
  // @brief  Reference price of the symbol at a past instant (close of the
  //         bar containing it). std::nullopt if history is unavailable.
  // -------------------------------------------------------------------------
  virtual std::optional<double> priceAt(const std::string& symbol,
                                        std::int64_t time_ms) = 0;

  // -------------------------------------------------------------------------
  // calcProfit(symbol, side, volume, open_price, close_price)
  // -------------------------------------------------------------------------
  // @brief  Account-currency profit of a hypothetical trade, computed with
  //         the venue's own contract rules.
  // -------------------------------------------------------------------------
  virtual std::optional<double> calcProfit(const std::string& symbol,
                                           domain::Side side, double volume,
                                           double open_price,
                                           double close_price) = 0;
};

}  // namespace sigexec
