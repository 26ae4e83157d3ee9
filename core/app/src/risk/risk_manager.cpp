#include "sigexec/risk/risk_manager.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace sigexec {

namespace {

bool opensPosition(domain::DealEntry entry) {
  return entry == domain::DealEntry::In || entry == domain::DealEntry::InOut;
}

}  // namespace

RiskManager::RiskManager(IVenue& venue, const ITimeProvider& clock,
                         EventBus& bus, std::string instrument,
                         SessionClock session, bool include_manual_trades)
    : venue_(venue),
      clock_(clock),
      bus_(bus),
      instrument_(std::move(instrument)),
      session_(session),
      include_manual_trades_(include_manual_trades) {}

// -----------------------------------------------------------------------------
// init(): first boundary + starting equity
// -----------------------------------------------------------------------------
void RiskManager::init(const domain::InstrumentSpec& spec) {
  spec_ = spec;

  const std::int64_t now = clock_.now_ms();
  state_.next_reset_ms = session_.nextBoundaryAfter(now);
  state_.trading_locked = false;

  auto equity = venue_.accountEquity();
  if (!equity) {
    throw RiskError("cannot read account equity for the starting snapshot");
  }
  state_.starting_equity = *equity;

  std::cout << "[RiskManager] session " << session_.localTime(now)
            << " | starting equity " << state_.starting_equity
            << " | next reset " << format_utc(state_.next_reset_ms)
            << " UTC\n";
}

// -----------------------------------------------------------------------------
// rollSessionIfDue(): lazy boundary crossing
// -----------------------------------------------------------------------------
void RiskManager::rollSessionIfDue() {
  const std::int64_t now = clock_.now_ms();
  if (now < state_.next_reset_ms) {
    return;
  }

  const bool was_locked = state_.trading_locked;
  state_.trading_locked = false;

  auto equity = venue_.accountEquity();
  if (equity) {
    state_.starting_equity = *equity;
  } else {
    std::cerr << "[RiskManager] equity unavailable at session reset; keeping "
              << state_.starting_equity << "\n";
  }

  // After a long outage several boundaries may have passed; land on the
  // first one that is still ahead.
  while (state_.next_reset_ms <= now) {
    state_.next_reset_ms += kMillisPerDay;
  }

  boundary_prices_.clear();
  approximated_.clear();
  daily_pnl_ = 0.0;

  std::cout << "[RiskManager] session reset at " << session_.localTime(now)
            << " | starting equity " << state_.starting_equity
            << (was_locked ? " | lock cleared" : "") << " | next reset "
            << format_utc(state_.next_reset_ms) << " UTC\n";

  SessionResetEvent event;
  event.starting_equity = state_.starting_equity;
  event.was_locked = was_locked;
  event.next_reset_ms = state_.next_reset_ms;
  event.timestamp = ms_to_timestamp(now);
  bus_.publish(event);
}

bool RiskManager::isTradingAllowed() {
  rollSessionIfDue();
  return !state_.trading_locked;
}

// -----------------------------------------------------------------------------
// checkDailyLoss(): the circuit breaker
// -----------------------------------------------------------------------------
void RiskManager::checkDailyLoss(double max_loss_percent, domain::Magic magic) {
  rollSessionIfDue();
  if (state_.trading_locked) {
    return;
  }

  auto pnl = computeDailyPnl(magic);
  if (!pnl) {
    std::cerr << "[RiskManager] daily P/L unavailable; loss check skipped\n";
    return;
  }
  daily_pnl_ = *pnl;

  if (state_.starting_equity <= 0.0) {
    std::cerr << "[RiskManager] starting equity " << state_.starting_equity
              << " is not positive; loss check skipped\n";
    return;
  }

  // Multiply before dividing: 300 / 10000 must come out as exactly 3.0.
  const double drawdown = (-daily_pnl_ * 100.0) / state_.starting_equity;
  if (drawdown < max_loss_percent) {
    return;
  }

  state_.trading_locked = true;
  std::cerr << "[RiskManager] CRITICAL: daily loss " << daily_pnl_ << " ("
            << drawdown << "% of " << state_.starting_equity
            << ") reached limit " << max_loss_percent
            << "%. Trading locked until "
            << format_utc(state_.next_reset_ms) << " UTC\n";

  RiskLockEvent event;
  event.daily_pnl = daily_pnl_;
  event.drawdown_percent = drawdown;
  event.limit_percent = max_loss_percent;
  event.starting_equity = state_.starting_equity;
  event.unlock_at_ms = state_.next_reset_ms;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// computeDailyPnl(): realized since the boundary + unrealized now
// -----------------------------------------------------------------------------
std::optional<double> RiskManager::computeDailyPnl(domain::Magic magic) {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t session_start = sessionStartMs();

  auto deals = venue_.historyDeals(session_start, now);
  if (!deals) {
    return std::nullopt;
  }
  auto positions =
      venue_.openPositions(include_manual_trades_
                               ? std::nullopt
                               : std::optional<domain::Magic>{magic});
  if (!positions) {
    return std::nullopt;
  }

  auto counted = [&](domain::Magic m) {
    return include_manual_trades_ || m == magic;
  };

  std::set<domain::Ticket> opened_this_session;
  for (const auto& deal : *deals) {
    if (counted(deal.magic) && opensPosition(deal.entry)) {
      opened_this_session.insert(deal.position_id);
    }
  }

  double pnl = 0.0;

  for (const auto& deal : *deals) {
    if (!counted(deal.magic)) {
      continue;
    }
    if (deal.entry == domain::DealEntry::In) {
      pnl += deal.commission;
      continue;
    }

    if (opened_this_session.count(deal.position_id) != 0) {
      pnl += deal.profit + deal.commission + deal.swap;
      continue;
    }

    // Closing deal of a position opened before the boundary. The position
    // had the opposite direction of the deal that closed it.
    auto since = profitSinceBoundary(deal.symbol, domain::opposite(deal.side),
                                     deal.volume, deal.price);
    if (since) {
      pnl += *since + deal.commission;
    } else {
      noteApproximation(deal.symbol);
      pnl += deal.profit + deal.commission + deal.swap;
    }
  }

  for (const auto& pos : *positions) {
    if (!counted(pos.magic)) {
      continue;
    }
    if (pos.open_time_ms >= session_start) {
      pnl += pos.profit + pos.swap;
      continue;
    }
    auto since = profitSinceBoundary(pos.symbol, pos.side, pos.volume,
                                     pos.current_price);
    if (since) {
      pnl += *since;
    } else {
      noteApproximation(pos.symbol);
      pnl += pos.profit + pos.swap;
    }
  }

  return pnl;
}

std::optional<double> RiskManager::boundaryPrice(const std::string& symbol) {
  auto it = boundary_prices_.find(symbol);
  if (it != boundary_prices_.end()) {
    return it->second;
  }
  auto price = venue_.priceAt(symbol, sessionStartMs());
  if (price) {
    boundary_prices_.emplace(symbol, *price);
  }
  return price;
}

std::optional<double> RiskManager::profitSinceBoundary(
    const std::string& symbol, domain::Side side, double volume,
    double price) {
  auto ref = boundaryPrice(symbol);
  if (!ref) {
    return std::nullopt;
  }
  return venue_.calcProfit(symbol, side, volume, *ref, price);
}

void RiskManager::noteApproximation(const std::string& symbol) {
  if (!approximated_.insert(symbol).second) {
    return;
  }
  std::cerr << "[RiskManager] no boundary price for " << symbol
            << "; using venue-reported P/L for positions opened before "
            << format_utc(sessionStartMs()) << " UTC (approximate)\n";
}

// -----------------------------------------------------------------------------
// normalizeLot()
// -----------------------------------------------------------------------------
double RiskManager::normalizeLot(double raw) const {
  double lot = raw;
  if (spec_.volume_step > 0.0) {
    // The epsilon keeps 0.03 / 0.01 = 2.9999999 from flooring to 0.02.
    lot = std::floor(raw / spec_.volume_step + 1e-9) * spec_.volume_step;
  }
  return std::clamp(lot, spec_.volume_min, spec_.volume_max);
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
std::string RiskManager::sessionTime() const {
  return session_.localTime(clock_.now_ms());
}

double RiskManager::dailyPnlPercent() const {
  if (state_.starting_equity <= 0.0) {
    return 0.0;
  }
  return daily_pnl_ * 100.0 / state_.starting_equity;
}

}  // namespace sigexec
