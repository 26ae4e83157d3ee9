#include "sigexec/engine/coordinator.hpp"
#include "sigexec/store/status_codec.hpp"
#include "sigexec/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

namespace sigexec {

namespace {

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return s;
}

}  // namespace

Coordinator::Coordinator(ISignalStore& store, RiskManager& risk,
                         ExecutionEngine& engine, EventBus& bus,
                         const ITimeProvider& clock,
                         CoordinatorSettings settings)
    : store_(store),
      risk_(risk),
      engine_(engine),
      bus_(bus),
      clock_(clock),
      settings_(std::move(settings)) {
  for (auto& symbol : settings_.whitelist) {
    symbol = toUpper(symbol);
  }
  std::string instrument = toUpper(settings_.instrument);
  if (std::find(settings_.whitelist.begin(), settings_.whitelist.end(),
                instrument) == settings_.whitelist.end()) {
    settings_.whitelist.push_back(instrument);
  }
}

// -----------------------------------------------------------------------------
// tick()
// -----------------------------------------------------------------------------
TickSummaryEvent Coordinator::tick() {
  TickSummaryEvent summary;
  summary.tick = ++tick_count_;

  // --- 1-2) Circuit breaker ----------------------------------------------------
  risk_.checkDailyLoss(settings_.limits.max_daily_loss_percent,
                       settings_.magic);
  if (!risk_.isTradingAllowed()) {
    if (!engine_.flattenAll()) {
      std::cerr << "[Coordinator] flatten incomplete while locked; retrying "
                   "next tick\n";
    }
    return finish(std::move(summary));
  }

  // --- 3) Position management --------------------------------------------------
  engine_.manageBreakeven();

  // --- 4) Outstanding status writes ------------------------------------------
  if (!retryPendingWrites()) {
    return finish(std::move(summary));
  }

  // --- 5) Signal intake --------------------------------------------------------
  auto signals = store_.fetchPending(settings_.whitelist);
  if (!signals) {
    std::cerr << "[Coordinator] signal store read failed; skipping intake\n";
    return finish(std::move(summary));
  }
  summary.pending_signals = signals->size();

  // Forget signals that left the queue (expired or edited away) while waiting.
  for (auto it = waiting_logged_.begin(); it != waiting_logged_.end();) {
    const bool still_pending =
        std::any_of(signals->begin(), signals->end(),
                    [id = *it](const domain::Signal& s) { return s.id == id; });
    it = still_pending ? std::next(it) : waiting_logged_.erase(it);
  }

  bool stop = false;
  for (const auto& signal : *signals) {
    processSignal(signal, summary, stop);
    if (stop) {
      break;
    }
  }

  return finish(std::move(summary));
}

// -----------------------------------------------------------------------------
// rejectionReason(): step 5a
// -----------------------------------------------------------------------------
std::optional<std::string> Coordinator::rejectionReason(
    const domain::Signal& signal) const {
  const std::string symbol = toUpper(signal.symbol);
  if (std::find(settings_.whitelist.begin(), settings_.whitelist.end(),
                symbol) == settings_.whitelist.end()) {
    return "symbol " + signal.symbol + " is not " + settings_.instrument;
  }

  if (!signal.take_profit_2) {
    return std::string("missing take_profit_2");
  }

  const double distance =
      signal.direction == domain::Side::Buy
          ? std::fabs(signal.entry_min - signal.stop_loss)
          : std::fabs(signal.stop_loss - signal.entry_max);
  if (distance > settings_.limits.max_sl_distance) {
    std::ostringstream out;
    out << "sl distance " << distance << " exceeds "
        << settings_.limits.max_sl_distance;
    return out.str();
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// processSignal(): steps 5a-5f for one signal
// -----------------------------------------------------------------------------
void Coordinator::processSignal(const domain::Signal& signal,
                                TickSummaryEvent& summary, bool& stop) {
  using domain::SignalStatus;

  if (auto reason = rejectionReason(signal)) {
    if (!writeStatus(signal.id, signal.symbol, SignalStatus::Invalid,
                     *reason)) {
      stop = true;
      return;
    }
    ++summary.rejected;
    return;
  }

  if (pending_writes_.count(signal.id) != 0) {
    return;
  }

  auto legs = engine_.hasLegsFor(signal.id);
  if (!legs) {
    // Without knowing what is open, placing again could double the position.
    std::cerr << "[Coordinator] cannot read positions; signal " << signal.id
              << " deferred\n";
    return;
  }
  // An edited signal reopens with its new levels; openDualPosition clears the
  // old legs first.
  if (*legs && signal.status == SignalStatus::Process) {
    if (!writeStatus(signal.id, signal.symbol, SignalStatus::Done,
                     "legs already open")) {
      stop = true;
      return;
    }
    ++summary.executed;
    return;
  }

  EntryCheck check = engine_.checkEntryRange(signal);
  if (!check.eligible) {
    if (waiting_logged_.insert(signal.id).second) {
      std::cout << "[Coordinator] signal " << signal.id << " "
                << domain::sideToString(signal.direction) << " "
                << signal.bandLow() << "-" << signal.bandHigh()
                << " waiting for price";
      if (check.price) {
        std::cout << " (now " << *check.price << ")";
      }
      std::cout << "\n";
    }
    return;
  }
  waiting_logged_.erase(signal.id);

  const double lot1 = risk_.normalizeLot(settings_.lot_leg1);
  const double lot2 = risk_.normalizeLot(settings_.lot_leg2);

  std::cout << "[Coordinator] executing signal " << signal.id << " "
            << domain::sideToString(signal.direction) << " at "
            << *check.price << " (" << lot1 << " + " << lot2 << ")\n";

  const bool opened = engine_.openDualPosition(signal, lot1, lot2);
  const SignalStatus status = opened ? SignalStatus::Done : SignalStatus::Error;
  if (!writeStatus(signal.id, signal.symbol, status,
                   opened ? "dual position opened" : "execution failed")) {
    stop = true;
    return;
  }
  if (opened) {
    ++summary.executed;
  } else {
    ++summary.failed;
  }
}

// -----------------------------------------------------------------------------
// Status write-back
// -----------------------------------------------------------------------------
bool Coordinator::writeStatus(domain::SignalId id, const std::string& symbol,
                              domain::SignalStatus status,
                              const std::string& reason) {
  if (!store_.setStatus(id, status)) {
    std::cerr << "[Coordinator] could not write " << statusToText(status)
              << " for signal " << id << "; will retry\n";
    pending_writes_[id] = PendingWrite{status, symbol, reason};
    return false;
  }

  pending_writes_.erase(id);
  waiting_logged_.erase(id);

  std::ostream& log =
      status == domain::SignalStatus::Done ? std::cout : std::cerr;
  log << "[Coordinator] signal " << id << " " << symbol << " -> "
      << statusToText(status) << " (" << reason << ")\n";

  SignalStatusEvent event;
  event.signal_id = id;
  event.symbol = symbol;
  event.status = status;
  event.reason = reason;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(event);
  return true;
}

bool Coordinator::retryPendingWrites() {
  // Copy: writeStatus() erases from pending_writes_.
  const auto outstanding = pending_writes_;
  for (const auto& [id, write] : outstanding) {
    if (!writeStatus(id, write.symbol, write.status, write.reason)) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// finish(): step 6
// -----------------------------------------------------------------------------
TickSummaryEvent Coordinator::finish(TickSummaryEvent summary) {
  summary.session_time = risk_.sessionTime();
  summary.starting_equity = risk_.startingEquity();
  summary.daily_pnl = risk_.dailyPnl();
  summary.daily_pnl_percent = risk_.dailyPnlPercent();
  summary.trading_locked = risk_.isLocked();
  summary.open_legs = engine_.openLegCount();
  summary.next_reset_ms = risk_.nextResetMs();
  summary.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(summary);
  return summary;
}

}  // namespace sigexec
