#pragma once

#include "sigexec/time/i_time_provider.hpp"
#include "sigexec/venue/i_venue.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace sigexec {

// -----------------------------------------------------------------------------
// SimulatedVenue — deterministic in-memory venue for paper trading and tests
// -----------------------------------------------------------------------------
//
// @brief  Fills every market order instantly at the current quote and keeps
//         a small book of positions, pending orders and deals.
//
// @details
// Fill model:
//   - BUY fills at ask, SELL at bid. No slippage, no partial fills.
//   - A placement needs a known instrument, a quote, and a volume inside
//     [volume_min, volume_max]; otherwise it is rejected.
//   - Every setQuote() re-marks open positions of that symbol and closes any
//     whose stop or target was touched (BUY closes at bid, SELL at ask).
//
// Accounting:
//   profit  = (close - open) * sign(side) * volume * contract_size
//   equity  = balance + sum(floating profit + swap)
//   Each fill books an IN deal (commission_per_lot * volume charged against
//   the balance), each close books an OUT deal with the realized profit.
//
// Historical prices:
//   priceAt() answers from prices registered with setHistoricalPrice(): the
//   latest registered price at or before the requested instant.
//
// Failure injection and counters exist so tests can drive the error paths
// of the execution engine and risk manager without a real terminal.
//
// Time source: open and deal times come from the injected ITimeProvider, so
// a SimulationTimeProvider places them on the test's timeline.
//
// Thread model: tick thread only (the QuoteFeed drains on the tick thread
// before each tick).
// -----------------------------------------------------------------------------
class SimulatedVenue final : public IVenue {
 public:
  SimulatedVenue(const ITimeProvider& clock, double initial_balance);

  SimulatedVenue(const SimulatedVenue&) = delete;
  SimulatedVenue& operator=(const SimulatedVenue&) = delete;

  // --- Book setup ------------------------------------------------------------
  void addInstrument(const domain::InstrumentSpec& spec);

  // Updates the quote and evaluates stops/targets of positions on symbol.
  void setQuote(const std::string& symbol, double bid, double ask);

  void setHistoricalPrice(const std::string& symbol, std::int64_t time_ms,
                          double price);

  // Inserts a position as-is (e.g. a manual trade or one opened before the
  // session boundary). Assigns a ticket if position.ticket == 0.
  domain::Ticket addPosition(domain::VenuePosition position);

  void addPendingOrder(const domain::PendingOrder& order);

  // Appends a deal to the history without touching the balance.
  void addDeal(const domain::Deal& deal);

  void setBalance(double balance) { balance_ = balance; }
  void setCommissionPerLot(double commission) { commission_per_lot_ = commission; }

  // --- Failure injection -------------------------------------------------------
  // The nth placement attempt from now (1-based) is rejected.
  void rejectPlacement(std::size_t nth);
  void setFailQuotes(bool fail) { fail_quotes_ = fail; }
  void setFailEquity(bool fail) { fail_equity_ = fail; }
  void setFailCloses(bool fail) { fail_closes_ = fail; }
  void setFailModify(bool fail) { fail_modify_ = fail; }
  void setFailHistory(bool fail) { fail_history_ = fail; }
  void setFailPositions(bool fail) { fail_positions_ = fail; }
  void setFailCalcProfit(bool fail) { fail_calc_profit_ = fail; }

  // --- Counters ----------------------------------------------------------------
  std::size_t quoteRequests() const { return quote_requests_; }
  std::size_t placementAttempts() const { return placement_attempts_; }
  std::size_t modifyCalls() const { return modify_calls_; }
  std::size_t closeCalls() const { return close_calls_; }

  double balance() const { return balance_; }
  const std::vector<domain::VenuePosition>& positions() const {
    return positions_;
  }
  const std::vector<domain::Deal>& deals() const { return deals_; }

  // --- IVenue ------------------------------------------------------------------
  std::optional<domain::InstrumentSpec> instrument(
      const std::string& symbol) override;
  std::optional<domain::Quote> quote(const std::string& symbol) override;
  std::optional<double> accountEquity() override;
  domain::OrderResult placeMarketOrder(
      const domain::MarketOrderRequest& request) override;
  bool modifyPosition(domain::Ticket ticket, double stop_loss,
                      double take_profit) override;
  bool closePosition(domain::Ticket ticket) override;
  bool cancelOrder(domain::Ticket ticket) override;
  std::optional<std::vector<domain::VenuePosition>> openPositions(
      std::optional<domain::Magic> magic) override;
  std::optional<std::vector<domain::PendingOrder>> pendingOrders(
      std::optional<domain::Magic> magic) override;
  std::optional<std::vector<domain::Deal>> historyDeals(
      std::int64_t from_ms, std::int64_t to_ms) override;
  std::optional<double> priceAt(const std::string& symbol,
                                std::int64_t time_ms) override;
  std::optional<double> calcProfit(const std::string& symbol, domain::Side side,
                                   double volume, double open_price,
                                   double close_price) override;

 private:
  double contractSize(const std::string& symbol) const;
  double profitOf(const domain::VenuePosition& position, double price) const;

  // Price a position of the given side closes at under the current quote.
  std::optional<double> closePrice(const std::string& symbol,
                                   domain::Side side) const;

  // Removes positions_[index] at price and books the OUT deal.
  void closeAt(std::size_t index, double price, const std::string& reason);

  void evaluateStops(const std::string& symbol);

  const ITimeProvider& clock_;
  double balance_;
  double commission_per_lot_{0.0};
  domain::Ticket next_ticket_{1000};

  std::map<std::string, domain::InstrumentSpec> instruments_;
  std::map<std::string, domain::Quote> quotes_;
  std::map<std::string, std::map<std::int64_t, double>> history_prices_;
  std::vector<domain::VenuePosition> positions_;
  std::vector<domain::PendingOrder> orders_;
  std::vector<domain::Deal> deals_;

  std::size_t reject_at_attempt_{0};  // 0 = none
  bool fail_quotes_{false};
  bool fail_equity_{false};
  bool fail_closes_{false};
  bool fail_modify_{false};
  bool fail_history_{false};
  bool fail_positions_{false};
  bool fail_calc_profit_{false};

  std::size_t quote_requests_{0};
  std::size_t placement_attempts_{0};
  std::size_t modify_calls_{0};
  std::size_t close_calls_{0};
};

}  // namespace sigexec
