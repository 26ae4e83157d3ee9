#include "sigexec/execution/execution_engine.hpp"
#include "sigexec/time/time_utils.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <set>
#include <utility>

namespace sigexec {

namespace {

constexpr const char* kTp1Suffix = "_TP1";
constexpr const char* kTp2Suffix = "_TP2";

bool endsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

ExecutionEngine::ExecutionEngine(IVenue& venue, const ITimeProvider& clock,
                                 EventBus& bus, std::string instrument,
                                 domain::Magic magic, double entry_tolerance)
    : venue_(venue),
      clock_(clock),
      bus_(bus),
      instrument_(std::move(instrument)),
      magic_(magic),
      entry_tolerance_(entry_tolerance) {
  spec_.symbol = instrument_;
}

std::string ExecutionEngine::legComment(domain::SignalId id, int leg) {
  return "SIG" + std::to_string(id) + (leg == 1 ? kTp1Suffix : kTp2Suffix);
}

// -----------------------------------------------------------------------------
// resolveInstrument()
// -----------------------------------------------------------------------------
const domain::InstrumentSpec& ExecutionEngine::resolveInstrument() {
  auto spec = venue_.instrument(instrument_);
  if (!spec) {
    throw ExecutionError("venue does not know instrument '" + instrument_ +
                         "'");
  }
  if (!(spec->volume_step > 0.0) || !(spec->volume_min > 0.0) ||
      spec->volume_min > spec->volume_max) {
    throw ExecutionError(
        "instrument '" + instrument_ + "' has unusable volume limits: min " +
        std::to_string(spec->volume_min) + ", max " +
        std::to_string(spec->volume_max) + ", step " +
        std::to_string(spec->volume_step));
  }
  spec_ = *spec;
  std::cout << "[ExecutionEngine] " << instrument_ << ": point " << spec_.point
            << ", volume " << spec_.volume_min << ".." << spec_.volume_max
            << " step " << spec_.volume_step << "\n";
  return spec_;
}

// -----------------------------------------------------------------------------
// checkEntryRange()
// -----------------------------------------------------------------------------
EntryCheck ExecutionEngine::checkEntryRange(const domain::Signal& signal) {
  EntryCheck check;
  auto q = venue_.quote(instrument_);
  if (!q) {
    std::cerr << "[ExecutionEngine] no quote for " << instrument_ << "\n";
    return check;
  }

  const double price =
      signal.direction == domain::Side::Buy ? q->ask : q->bid;
  check.price = price;
  check.eligible = price >= signal.bandLow() - entry_tolerance_ &&
                   price <= signal.bandHigh() + entry_tolerance_;
  return check;
}

// -----------------------------------------------------------------------------
// openDualPosition(): flatten, leg 1, leg 2, roll back on any failure
// -----------------------------------------------------------------------------
domain::OrderResult ExecutionEngine::placeLeg(const domain::Signal& signal,
                                              double volume,
                                              double take_profit, int leg) {
  domain::MarketOrderRequest request;
  request.symbol = instrument_;
  request.side = signal.direction;
  request.volume = volume;
  request.stop_loss = signal.stop_loss;
  request.take_profit = take_profit;
  request.magic = magic_;
  request.comment = legComment(signal.id, leg);

  domain::OrderResult result;
  try {
    result = venue_.placeMarketOrder(request);
  } catch (const std::exception& e) {
    result = domain::OrderResult{};
    result.message = std::string{"venue error: "} + e.what();
  }
  if (result.ok) {
    std::cout << "[ExecutionEngine] " << request.comment << " "
              << domain::sideToString(request.side) << " " << volume << " @ "
              << result.price << " sl " << request.stop_loss << " tp "
              << take_profit << " ticket " << result.ticket << "\n";
  } else {
    std::cerr << "[ExecutionEngine] " << request.comment
              << " rejected: " << result.message << "\n";
  }
  return result;
}

bool ExecutionEngine::openDualPosition(const domain::Signal& signal,
                                       double lot_leg1, double lot_leg2) {
  if (!signal.take_profit_2) {
    std::cerr << "[ExecutionEngine] signal " << signal.id
              << " has no second target\n";
    return false;
  }

  if (!flattenAll()) {
    std::cerr << "[ExecutionEngine] could not clear existing positions; "
                 "signal "
              << signal.id << " not executed\n";
    return false;
  }

  if (!placeLeg(signal, lot_leg1, signal.take_profit_1, 1).ok) {
    flattenAll();
    return false;
  }
  if (!placeLeg(signal, lot_leg2, *signal.take_profit_2, 2).ok) {
    std::cerr << "[ExecutionEngine] second leg failed for signal "
              << signal.id << "; rolling back\n";
    if (!flattenAll()) {
      std::cerr << "[ExecutionEngine] rollback incomplete for signal "
                << signal.id << "; a leg may still be open\n";
    }
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// hasLegsFor()
// -----------------------------------------------------------------------------
std::optional<bool> ExecutionEngine::hasLegsFor(domain::SignalId id) {
  auto positions = venue_.openPositions(magic_);
  if (!positions) {
    return std::nullopt;
  }
  const std::string prefix = "SIG" + std::to_string(id) + "_";
  for (const auto& pos : *positions) {
    if (startsWith(pos.comment, prefix)) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// manageBreakeven()
// -----------------------------------------------------------------------------
void ExecutionEngine::manageBreakeven() {
  auto positions = venue_.openPositions(magic_);
  if (!positions) {
    std::cerr << "[ExecutionEngine] positions unavailable; breakeven skipped\n";
    return;
  }

  std::set<std::string> open_comments;
  for (const auto& pos : *positions) {
    if (pos.symbol == instrument_) {
      open_comments.insert(pos.comment);
    }
  }

  for (const auto& pos : *positions) {
    if (pos.symbol != instrument_ || !endsWith(pos.comment, kTp2Suffix)) {
      continue;
    }
    const std::string sibling =
        pos.comment.substr(0, pos.comment.size() - 4) + kTp1Suffix;
    if (open_comments.count(sibling) != 0) {
      continue;
    }
    if (std::fabs(pos.stop_loss - pos.open_price) <= spec_.point) {
      continue;
    }

    if (!venue_.modifyPosition(pos.ticket, pos.open_price, pos.take_profit)) {
      std::cerr << "[ExecutionEngine] breakeven move failed for "
                << pos.comment << " (ticket " << pos.ticket << ")\n";
      continue;
    }
    std::cout << "[ExecutionEngine] " << pos.comment << " stop "
              << pos.stop_loss << " -> " << pos.open_price << " (breakeven)\n";

    BreakevenEvent event;
    event.ticket = pos.ticket;
    event.comment = pos.comment;
    event.old_stop_loss = pos.stop_loss;
    event.new_stop_loss = pos.open_price;
    event.timestamp = ms_to_timestamp(clock_.now_ms());
    bus_.publish(event);
  }
}

// -----------------------------------------------------------------------------
// flattenAll()
// -----------------------------------------------------------------------------
bool ExecutionEngine::flattenAll() {
  bool all_ok = true;

  auto positions = venue_.openPositions(magic_);
  if (!positions) {
    std::cerr << "[ExecutionEngine] positions unavailable; cannot flatten\n";
    all_ok = false;
  } else {
    for (const auto& pos : *positions) {
      if (venue_.closePosition(pos.ticket)) {
        std::cout << "[ExecutionEngine] closed " << pos.comment << " (ticket "
                  << pos.ticket << ")\n";
      } else {
        std::cerr << "[ExecutionEngine] close failed for ticket "
                  << pos.ticket << "\n";
        all_ok = false;
      }
    }
  }

  auto orders = venue_.pendingOrders(magic_);
  if (!orders) {
    std::cerr << "[ExecutionEngine] orders unavailable; cannot flatten\n";
    all_ok = false;
  } else {
    for (const auto& order : *orders) {
      if (!venue_.cancelOrder(order.ticket)) {
        std::cerr << "[ExecutionEngine] cancel failed for order "
                  << order.ticket << "\n";
        all_ok = false;
      }
    }
  }

  return all_ok;
}

std::size_t ExecutionEngine::openLegCount() {
  auto positions = venue_.openPositions(magic_);
  return positions ? positions->size() : 0;
}

}  // namespace sigexec
