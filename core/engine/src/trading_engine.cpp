#include "sigexec/engine/trading_engine.hpp"
#include "sigexec/events/event_json.hpp"
#include "sigexec/store/sqlite_signal_store.hpp"
#include "sigexec/time/time_utils.hpp"
#include "sigexec/venue/simulated_venue.hpp"
#include "sigexec/venue/zmq_venue.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace sigexec {

namespace {

// run() sleeps in slices this long so requestStop() is noticed promptly.
constexpr std::chrono::milliseconds kSleepSlice{50};

}  // namespace

// -----------------------------------------------------------------------------
// Constructors / destructor
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock) {}

TradingEngine::TradingEngine(EngineConfig config, const ITimeProvider& clock,
                             IVenue& venue, ISignalStore& store)
    : config_(std::move(config)),
      clock_(clock),
      injected_venue_(&venue),
      injected_store_(&store) {}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// Venue / store construction from config
// -----------------------------------------------------------------------------
void TradingEngine::createVenue() {
  if (config_.venue.mode == VenueMode::Bridge) {
    owned_venue_ = std::make_unique<ZmqVenue>(config_.venue.endpoint,
                                              config_.venue.timeout_ms);
    venue_ = owned_venue_.get();
    return;
  }

  auto simulated = std::make_unique<SimulatedVenue>(
      clock_, config_.paper.initial_balance);
  simulated->addInstrument(config_.paperInstrument());
  SimulatedVenue* sim = simulated.get();
  owned_venue_ = std::move(simulated);
  venue_ = sim;

  if (!config_.paper.quote_endpoint.empty()) {
    quote_feed_ = std::make_unique<QuoteFeed>(
        [sim](const QuoteTick& tick) {
          sim->setQuote(tick.symbol, tick.bid, tick.ask);
        },
        config_.paper.quote_endpoint);
  }
  std::cout << "[TradingEngine] paper venue, balance "
            << config_.paper.initial_balance << "\n";
}

void TradingEngine::createStore() {
  owned_store_ =
      std::make_unique<SqliteSignalStore>(config_.signal_store_path, clock_);
  store_ = owned_store_.get();
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  try {
    // ---  1) Venue and store ---------------------------------------------------
    if (injected_venue_ != nullptr) {
      venue_ = injected_venue_;
    } else {
      createVenue();
    }
    if (injected_store_ != nullptr) {
      store_ = injected_store_;
    } else {
      createStore();
    }

    // ---  2) Components, leaves first ------------------------------------------
    execution_ = std::make_unique<ExecutionEngine>(
        *venue_, clock_, bus_, config_.instrument, config_.magic_number,
        config_.limits.entry_tolerance);
    const domain::InstrumentSpec& spec = execution_->resolveInstrument();

    risk_ = std::make_unique<RiskManager>(
        *venue_, clock_, bus_, config_.instrument,
        SessionClock(config_.session_start, config_.session_utc_offset_minutes),
        config_.include_manual_trades);
    risk_->init(spec);

    CoordinatorSettings settings;
    settings.instrument = config_.instrument;
    settings.whitelist = config_.symbolWhitelist();
    settings.lot_leg1 = config_.lot_leg1;
    settings.lot_leg2 = config_.lot_leg2;
    settings.magic = config_.magic_number;
    settings.limits = config_.limits;
    coordinator_ = std::make_unique<Coordinator>(*store_, *risk_, *execution_,
                                                 bus_, clock_, settings);

    // ---  3) Status snapshot for the IPC thread ----------------------------------
    subscriptions_.push_back(bus_.subscribe<TickSummaryEvent>(
        [this](const TickSummaryEvent& e) {
          nlohmann::json json = toJson(e);
          std::lock_guard lock(status_mutex_);
          last_summary_ = std::move(json);
        }));

    // ---  4) IPC server (status + telemetry) -----------------------------------
    if (!config_.ipc.cmd_endpoint.empty() &&
        !config_.ipc.pub_endpoint.empty()) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
      ipc_server_->start();
      subscriptions_.push_back(bus_.subscribe(
          [this](const Event& e) { ipc_server_->pushTelemetry(e); }));
    }
  } catch (...) {
    // Tear down whatever was built, then let the caller see the failure.
    running_ = true;
    stop();
    throw;
  }

  stop_requested_.store(false);
  running_ = true;

  std::cout << "[TradingEngine] started. Instrument " << config_.instrument
            << ", magic " << config_.magic_number << ", tick every "
            << config_.poll_interval_ms << " ms"
            << (ipc_server_ ? ", IPC on" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) IPC first: its thread calls executeCommand() -----------------------
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
  subscriptions_.clear();
  ipc_server_.reset();

  // ---  2) Components (they hold references to venue, store and bus) ---------
  coordinator_.reset();
  risk_.reset();
  execution_.reset();

  // ---  3) Adapters; closing the store closes the database -------------------
  quote_feed_.reset();
  owned_store_.reset();
  owned_venue_.reset();
  store_ = nullptr;
  venue_ = nullptr;

  running_ = false;
  std::cout << "[TradingEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// runOnce() / run()
// -----------------------------------------------------------------------------
TickSummaryEvent TradingEngine::runOnce() {
  if (!running_) {
    throw std::logic_error("TradingEngine::runOnce() before start()");
  }
  if (quote_feed_) {
    quote_feed_->drain();
  }

  TickSummaryEvent summary = coordinator_->tick();

  const auto every = config_.status_log_interval_ticks;
  if (every > 0 && summary.tick % every == 0) {
    logStatusLine(summary);
  }
  return summary;
}

void TradingEngine::run() {
  const auto interval = std::chrono::milliseconds(config_.poll_interval_ms);

  while (!stop_requested_.load()) {
    const auto tick_started = std::chrono::steady_clock::now();

    try {
      runOnce();
    } catch (const std::exception& e) {
      std::cerr << "[TradingEngine] tick "
                << (coordinator_ ? coordinator_->tickCount() : 0)
                << " failed: " << e.what() << "\n";
    }

    const auto deadline = tick_started + interval;
    while (!stop_requested_.load() &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kSleepSlice);
    }
  }

  std::cout << "[TradingEngine] tick loop exited after "
            << (coordinator_ ? coordinator_->tickCount() : 0) << " ticks.\n";
}

void TradingEngine::logStatusLine(const TickSummaryEvent& s) const {
  std::cout << "[Status] " << s.session_time << " | equity0 "
            << s.starting_equity << " | P/L " << s.daily_pnl << " ("
            << s.daily_pnl_percent << "%) | "
            << (s.trading_locked ? "LOCKED" : "open") << " | legs "
            << s.open_legs << " | pending " << s.pending_signals
            << " | reset " << format_utc(s.next_reset_ms) << " UTC\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC thread
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    std::lock_guard lock(status_mutex_);
    response["summary"] = last_summary_;
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace sigexec
