#pragma once

#include "sigexec/config/engine_config.hpp"
#include "sigexec/engine/coordinator.hpp"
#include "sigexec/eventbus/event_bus.hpp"
#include "sigexec/execution/execution_engine.hpp"
#include "sigexec/network/ipc_server.hpp"
#include "sigexec/risk/risk_manager.hpp"
#include "sigexec/store/i_signal_store.hpp"
#include "sigexec/time/i_time_provider.hpp"
#include "sigexec/venue/i_venue.hpp"
#include "sigexec/venue/quote_feed.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sigexec {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Process root: owns the venue, the signal store, the four trading
//         components, the event bus and the IPC server, and drives the tick
//         loop.
//
// @details
// Lifecycle:
//   construct  → nothing opened, no threads.
//   start()    → opens venue and store, resolves the instrument, snapshots
//                starting equity, starts the IPC server. Any failure here is
//                fatal and thrown to the caller.
//   run()      → calls runOnce() every poll_interval_ms until requestStop().
//   stop()     → joins the IPC thread, destroys components, closes the store.
//
// Venue and store come either from the configuration (paper: SimulatedVenue
// fed by a QuoteFeed, bridge: ZmqVenue; SqliteSignalStore at
// signal_store_path) or are injected by the caller, which keeps ownership.
// Tests use injection to run ticks against a SimulatedVenue without sockets.
//
// Thread layout:
//   main thread  → start(), run() / runOnce(), stop()
//   IPC thread   → executeCommand() for PING / STATUS
//
// The IPC thread never touches components. Each tick's summary is rendered
// to JSON on the tick thread and stored under status_mutex_; STATUS returns
// a copy of it.
//
// Ownership (destroyed in reverse order):
//   TradingEngine
//    ├── bus_            (EventBus — value member)
//    ├── owned_venue_    (unique_ptr<IVenue>, config-built venue only)
//    ├── owned_store_    (unique_ptr<ISignalStore>, config-built store only)
//    ├── quote_feed_     (unique_ptr<QuoteFeed>, paper mode only)
//    ├── execution_      (unique_ptr<ExecutionEngine>)
//    ├── risk_           (unique_ptr<RiskManager>)
//    ├── coordinator_    (unique_ptr<Coordinator>)
//    └── ipc_server_     (unique_ptr<IpcServer>)
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // Venue and store are built from config in start().
  TradingEngine(EngineConfig config, const ITimeProvider& clock);

  // Venue and store are supplied by the caller and must outlive the engine.
  TradingEngine(EngineConfig config, const ITimeProvider& clock, IVenue& venue,
                ISignalStore& store);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Brings the engine to a state where ticks can run.
  //
  // @throws StoreError, ExecutionError, RiskError, zmq::error_t on the fatal
  //         startup failures; the engine stays stopped.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Idempotent. Called by the destructor.
  void stop();

  // -------------------------------------------------------------------------
  // runOnce()
  // -------------------------------------------------------------------------
  // @brief  Drains pending quotes (paper mode) and runs one Coordinator tick.
  // @throws std::logic_error if the engine is not started.
  // -------------------------------------------------------------------------
  TickSummaryEvent runOnce();

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  Ticks every poll_interval_ms until requestStop().
  //
  // @details
  // Ticks never overlap: the next one starts poll_interval_ms after the
  // previous one started, or immediately if it overran. An exception
  // escaping a tick is logged with the tick number and the loop continues.
  // -------------------------------------------------------------------------
  void run();

  // Asks run() to return after the current tick. Async-signal-safe.
  void requestStop() { stop_requested_.store(true); }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //   "PING"   → {"status":"ok","response":"PONG"}
  //   "STATUS" → {"status":"ok","summary":<last tick summary or null>}
  //   other    → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread-safety: safe from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  const EngineConfig& config() const { return config_; }
  bool isRunning() const { return running_; }

 private:
  void createVenue();
  void createStore();
  void logStatusLine(const TickSummaryEvent& summary) const;

  EngineConfig config_;
  const ITimeProvider& clock_;
  EventBus bus_;

  IVenue* injected_venue_{nullptr};
  ISignalStore* injected_store_{nullptr};

  std::unique_ptr<IVenue> owned_venue_;
  std::unique_ptr<ISignalStore> owned_store_;
  std::unique_ptr<QuoteFeed> quote_feed_;
  IVenue* venue_{nullptr};
  ISignalStore* store_{nullptr};

  std::unique_ptr<ExecutionEngine> execution_;
  std::unique_ptr<RiskManager> risk_;
  std::unique_ptr<Coordinator> coordinator_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::vector<EventBus::SubscriptionId> subscriptions_;

  mutable std::mutex status_mutex_;
  nlohmann::json last_summary_;  // null until the first tick

  std::atomic<bool> stop_requested_{false};
  bool running_{false};
};

}  // namespace sigexec
