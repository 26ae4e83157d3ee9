// -----------------------------------------------------------------------------
// signal_executor — single executable entry point.
//
//   signal_executor [config.json]
//
//   1) Load the configuration (default config/engine.json).
//   2) Build the TradingEngine on the wall clock and start it: opens the
//      venue (paper or bridge) and the signal store, resolves the instrument,
//      snapshots starting equity, starts the IPC server.
//   3) Run the tick loop on the main thread until SIGINT / SIGTERM.
//   4) Stop: finish the running tick, join the IPC thread, close the store.
//
// Exit codes: 0 on clean shutdown, 1 on a configuration or startup failure.
// -----------------------------------------------------------------------------

#include "sigexec/config/config_loader.hpp"
#include "sigexec/engine/trading_engine.hpp"
#include "sigexec/events/event_types.hpp"
#include "sigexec/time/live_time_provider.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <string>

// The only global: lets the signal handler reach the engine's stop flag. Set
// once before the handlers are installed and cleared after run() returns.
static sigexec::TradingEngine* g_engine_ptr = nullptr;

// requestStop() is a single atomic store, which is async-signal-safe.
static void shutdown_handler(int /*signum*/) {
  if (g_engine_ptr != nullptr) {
    g_engine_ptr->requestStop();
  }
}

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "config/engine.json";

  sigexec::EngineConfig config;
  try {
    config = sigexec::loadConfig(config_path);
  } catch (const sigexec::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  sigexec::LiveTimeProvider clock;
  sigexec::TradingEngine engine(config, clock);

  engine.eventBus().subscribe<sigexec::RiskLockEvent>(
      [](const sigexec::RiskLockEvent& e) {
        std::cerr << "[main] trading locked at " << e.drawdown_percent
                  << "% drawdown; all positions are being closed\n";
      });

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return 1;
  }

  g_engine_ptr = &engine;
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] running. Press Ctrl-C to shut down.\n";
  engine.run();

  g_engine_ptr = nullptr;
  std::cout << "[main] shutting down...\n";
  engine.stop();
  return 0;
}
