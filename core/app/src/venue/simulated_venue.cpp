#include "sigexec/venue/simulated_venue.hpp"

#include <algorithm>
#include <iterator>

namespace sigexec {

using domain::Side;

SimulatedVenue::SimulatedVenue(const ITimeProvider& clock,
                               double initial_balance)
    : clock_(clock), balance_(initial_balance) {}

// -----------------------------------------------------------------------------
// Book setup
// -----------------------------------------------------------------------------
void SimulatedVenue::addInstrument(const domain::InstrumentSpec& spec) {
  instruments_[spec.symbol] = spec;
}

void SimulatedVenue::setQuote(const std::string& symbol, double bid,
                              double ask) {
  domain::Quote& q = quotes_[symbol];
  q.bid = bid;
  q.ask = ask;
  q.time_ms = clock_.now_ms();
  evaluateStops(symbol);
}

void SimulatedVenue::setHistoricalPrice(const std::string& symbol,
                                        std::int64_t time_ms, double price) {
  history_prices_[symbol][time_ms] = price;
}

domain::Ticket SimulatedVenue::addPosition(domain::VenuePosition position) {
  if (position.ticket == 0) {
    position.ticket = next_ticket_++;
  }
  if (position.current_price == 0.0) {
    position.current_price = position.open_price;
  }
  domain::Ticket ticket = position.ticket;
  positions_.push_back(std::move(position));
  return ticket;
}

void SimulatedVenue::addPendingOrder(const domain::PendingOrder& order) {
  orders_.push_back(order);
}

void SimulatedVenue::addDeal(const domain::Deal& deal) {
  deals_.push_back(deal);
}

void SimulatedVenue::rejectPlacement(std::size_t nth) {
  reject_at_attempt_ = nth == 0 ? 0 : placement_attempts_ + nth;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
double SimulatedVenue::contractSize(const std::string& symbol) const {
  auto it = instruments_.find(symbol);
  return it != instruments_.end() ? it->second.contract_size : 1.0;
}

double SimulatedVenue::profitOf(const domain::VenuePosition& position,
                                double price) const {
  return (price - position.open_price) * domain::sideSign(position.side) *
         position.volume * contractSize(position.symbol);
}

std::optional<double> SimulatedVenue::closePrice(const std::string& symbol,
                                                 Side side) const {
  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return std::nullopt;
  }
  return side == Side::Buy ? it->second.bid : it->second.ask;
}

void SimulatedVenue::closeAt(std::size_t index, double price,
                             const std::string& reason) {
  domain::VenuePosition pos = positions_[index];
  positions_.erase(positions_.begin() + static_cast<std::ptrdiff_t>(index));

  const double profit = profitOf(pos, price);
  balance_ += profit + pos.swap;

  domain::Deal deal;
  deal.ticket = next_ticket_++;
  deal.position_id = pos.ticket;
  deal.symbol = pos.symbol;
  deal.side = domain::opposite(pos.side);
  deal.entry = domain::DealEntry::Out;
  deal.volume = pos.volume;
  deal.price = price;
  deal.profit = profit;
  deal.swap = pos.swap;
  deal.magic = pos.magic;
  deal.time_ms = clock_.now_ms();
  deal.comment = reason;
  deals_.push_back(std::move(deal));
}

void SimulatedVenue::evaluateStops(const std::string& symbol) {
  for (std::size_t i = 0; i < positions_.size();) {
    domain::VenuePosition& pos = positions_[i];
    if (pos.symbol != symbol) {
      ++i;
      continue;
    }
    const double price = *closePrice(symbol, pos.side);
    pos.current_price = price;
    pos.profit = profitOf(pos, price);

    const bool buy = pos.side == Side::Buy;
    const bool sl_hit = pos.stop_loss > 0.0 &&
                        (buy ? price <= pos.stop_loss : price >= pos.stop_loss);
    const bool tp_hit =
        pos.take_profit > 0.0 &&
        (buy ? price >= pos.take_profit : price <= pos.take_profit);

    if (sl_hit || tp_hit) {
      // Fill at the level itself, as a stop/limit order would.
      closeAt(i, sl_hit ? pos.stop_loss : pos.take_profit,
              sl_hit ? "[sl]" : "[tp]");
      continue;
    }
    ++i;
  }
}

// -----------------------------------------------------------------------------
// IVenue: queries
// -----------------------------------------------------------------------------
std::optional<domain::InstrumentSpec> SimulatedVenue::instrument(
    const std::string& symbol) {
  auto it = instruments_.find(symbol);
  if (it == instruments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Quote> SimulatedVenue::quote(const std::string& symbol) {
  ++quote_requests_;
  if (fail_quotes_) {
    return std::nullopt;
  }
  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<double> SimulatedVenue::accountEquity() {
  if (fail_equity_) {
    return std::nullopt;
  }
  double equity = balance_;
  for (const auto& pos : positions_) {
    equity += pos.profit + pos.swap;
  }
  return equity;
}

std::optional<std::vector<domain::VenuePosition>> SimulatedVenue::openPositions(
    std::optional<domain::Magic> magic) {
  if (fail_positions_) {
    return std::nullopt;
  }
  std::vector<domain::VenuePosition> out;
  for (const auto& pos : positions_) {
    if (!magic || pos.magic == *magic) {
      out.push_back(pos);
    }
  }
  return out;
}

std::optional<std::vector<domain::PendingOrder>> SimulatedVenue::pendingOrders(
    std::optional<domain::Magic> magic) {
  if (fail_positions_) {
    return std::nullopt;
  }
  std::vector<domain::PendingOrder> out;
  for (const auto& order : orders_) {
    if (!magic || order.magic == *magic) {
      out.push_back(order);
    }
  }
  return out;
}

std::optional<std::vector<domain::Deal>> SimulatedVenue::historyDeals(
    std::int64_t from_ms, std::int64_t to_ms) {
  if (fail_history_) {
    return std::nullopt;
  }
  std::vector<domain::Deal> out;
  for (const auto& deal : deals_) {
    if (deal.time_ms >= from_ms && deal.time_ms <= to_ms) {
      out.push_back(deal);
    }
  }
  return out;
}

std::optional<double> SimulatedVenue::priceAt(const std::string& symbol,
                                              std::int64_t time_ms) {
  auto sym = history_prices_.find(symbol);
  if (sym == history_prices_.end()) {
    return std::nullopt;
  }
  const auto& series = sym->second;
  auto it = series.upper_bound(time_ms);
  if (it == series.begin()) {
    return std::nullopt;
  }
  return std::prev(it)->second;
}

std::optional<double> SimulatedVenue::calcProfit(const std::string& symbol,
                                                 Side side, double volume,
                                                 double open_price,
                                                 double close_price) {
  if (fail_calc_profit_ || instruments_.count(symbol) == 0) {
    return std::nullopt;
  }
  return (close_price - open_price) * domain::sideSign(side) * volume *
         contractSize(symbol);
}

// -----------------------------------------------------------------------------
// IVenue: mutations
// -----------------------------------------------------------------------------
domain::OrderResult SimulatedVenue::placeMarketOrder(
    const domain::MarketOrderRequest& request) {
  ++placement_attempts_;
  domain::OrderResult result;

  if (reject_at_attempt_ != 0 && placement_attempts_ == reject_at_attempt_) {
    reject_at_attempt_ = 0;
    result.message = "rejected by failure injection";
    return result;
  }

  auto spec = instruments_.find(request.symbol);
  if (spec == instruments_.end()) {
    result.message = "unknown symbol " + request.symbol;
    return result;
  }
  if (request.volume < spec->second.volume_min - 1e-9 ||
      request.volume > spec->second.volume_max + 1e-9) {
    result.message = "invalid volume";
    return result;
  }
  auto q = quotes_.find(request.symbol);
  if (q == quotes_.end()) {
    result.message = "no quote";
    return result;
  }

  const double fill =
      request.side == Side::Buy ? q->second.ask : q->second.bid;
  const double commission = -commission_per_lot_ * request.volume;
  balance_ += commission;

  domain::VenuePosition pos;
  pos.ticket = next_ticket_++;
  pos.symbol = request.symbol;
  pos.side = request.side;
  pos.volume = request.volume;
  pos.open_price = fill;
  pos.current_price = *closePrice(request.symbol, request.side);
  pos.stop_loss = request.stop_loss;
  pos.take_profit = request.take_profit;
  pos.magic = request.magic;
  pos.open_time_ms = clock_.now_ms();
  pos.comment = request.comment;
  pos.profit = profitOf(pos, pos.current_price);
  positions_.push_back(pos);

  domain::Deal deal;
  deal.ticket = next_ticket_++;
  deal.position_id = pos.ticket;
  deal.symbol = pos.symbol;
  deal.side = pos.side;
  deal.entry = domain::DealEntry::In;
  deal.volume = pos.volume;
  deal.price = fill;
  deal.commission = commission;
  deal.magic = pos.magic;
  deal.time_ms = pos.open_time_ms;
  deal.comment = pos.comment;
  deals_.push_back(std::move(deal));

  result.ok = true;
  result.ticket = pos.ticket;
  result.price = fill;
  return result;
}

bool SimulatedVenue::modifyPosition(domain::Ticket ticket, double stop_loss,
                                    double take_profit) {
  ++modify_calls_;
  if (fail_modify_) {
    return false;
  }
  for (auto& pos : positions_) {
    if (pos.ticket == ticket) {
      pos.stop_loss = stop_loss;
      pos.take_profit = take_profit;
      return true;
    }
  }
  return false;
}

bool SimulatedVenue::closePosition(domain::Ticket ticket) {
  ++close_calls_;
  if (fail_closes_) {
    return false;
  }
  for (std::size_t i = 0; i < positions_.size(); ++i) {
    if (positions_[i].ticket == ticket) {
      auto price = closePrice(positions_[i].symbol, positions_[i].side);
      closeAt(i, price.value_or(positions_[i].current_price), "close");
      return true;
    }
  }
  return false;
}

bool SimulatedVenue::cancelOrder(domain::Ticket ticket) {
  auto it = std::find_if(
      orders_.begin(), orders_.end(),
      [ticket](const domain::PendingOrder& o) { return o.ticket == ticket; });
  if (it == orders_.end()) {
    return false;
  }
  orders_.erase(it);
  return true;
}

}  // namespace sigexec
