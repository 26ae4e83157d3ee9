#pragma once

#include "sigexec/domain/risk_limits.hpp"
#include "sigexec/domain/signal.hpp"
#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/execution/execution_engine.hpp"
#include "sigexec/risk/risk_manager.hpp"
#include "sigexec/store/i_signal_store.hpp"
#include "sigexec/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sigexec {

struct CoordinatorSettings {
  std::string instrument;
  std::vector<std::string> whitelist;  // Upper-cased instrument + aliases
  double lot_leg1{0.01};
  double lot_leg2{0.01};
  domain::Magic magic{0};
  domain::RiskLimits limits;
};

// -----------------------------------------------------------------------------
// Coordinator — one control-loop tick
// -----------------------------------------------------------------------------
//
// @brief  Runs risk check -> position management -> signal intake -> status
//         write-back -> summary, in that order, to completion.
//
// @details
// tick():
//   1. RiskManager::checkDailyLoss()
//   2. Trading locked -> ExecutionEngine::flattenAll(), summary, done.
//   3. ExecutionEngine::manageBreakeven()
//   4. Retry status writes that failed on an earlier tick. If one still
//      fails the tick ends here: the store is probably unavailable.
//   5. fetchPending(); a failed read ends the tick. Per signal, oldest first:
//        a. wrong symbol / no TP2 / stop too far      -> INVALID
//        b. a status write for it is still pending      -> skip
//        c. PROCESS with legs already open at the venue -> DONE
//           (a MODIFY goes on to d/e and reopens with its new levels)
//        d. price outside the entry band                -> leave as is
//        e. openDualPosition()                          -> DONE or ERROR
//      A failed status write is remembered for step 4 and ends the tick.
//   6. Publish TickSummaryEvent.
//
// Idempotency:
//   If DONE could not be written after both legs opened, the id stays in
//   pending_writes_ and step 4 retries the write without touching the
//   venue. After a restart that memory is gone, so step c asks the venue
//   whether the signal's legs exist before anything is placed again.
//
// Ownership: holds references to the store, risk manager, execution engine,
// event bus and clock; owns only the pending-write memory.
//
// Thread model: tick thread only.
// -----------------------------------------------------------------------------
class Coordinator {
 public:
  Coordinator(ISignalStore& store, RiskManager& risk, ExecutionEngine& engine,
              EventBus& bus, const ITimeProvider& clock,
              CoordinatorSettings settings);

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Runs one tick and returns the summary it published.
  TickSummaryEvent tick();

  // -------------------------------------------------------------------------
  // rejectionReason(signal)
  // -------------------------------------------------------------------------
  // @brief  Validation of step 5a, without any venue call.
  // @return Why the signal is INVALID, or std::nullopt if it may proceed.
  // -------------------------------------------------------------------------
  std::optional<std::string> rejectionReason(const domain::Signal& signal) const;

  std::size_t pendingWriteCount() const { return pending_writes_.size(); }
  std::uint64_t tickCount() const { return tick_count_; }
  // Signals currently waiting for price whose wait has been logged.
  std::size_t waitingCount() const { return waiting_logged_.size(); }

 private:
  struct PendingWrite {
    domain::SignalStatus status{domain::SignalStatus::Error};
    std::string symbol;
    std::string reason;
  };

  // Writes the status; on success publishes SignalStatusEvent, on failure
  // records it in pending_writes_. Returns whether the write succeeded.
  bool writeStatus(domain::SignalId id, const std::string& symbol,
                   domain::SignalStatus status, const std::string& reason);

  bool retryPendingWrites();

  void processSignal(const domain::Signal& signal, TickSummaryEvent& summary,
                     bool& stop);

  TickSummaryEvent finish(TickSummaryEvent summary);

  ISignalStore& store_;
  RiskManager& risk_;
  ExecutionEngine& engine_;
  EventBus& bus_;
  const ITimeProvider& clock_;
  CoordinatorSettings settings_;

  std::map<domain::SignalId, PendingWrite> pending_writes_;
  std::set<domain::SignalId> waiting_logged_;
  std::uint64_t tick_count_{0};
};

}  // namespace sigexec
