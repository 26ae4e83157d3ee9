#pragma once

#include "sigexec/domain/risk_limits.hpp"
#include "sigexec/domain/venue_types.hpp"
#include "sigexec/time/session_clock.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sigexec {

// -----------------------------------------------------------------------------
// EngineConfig — everything read from the configuration file
// -----------------------------------------------------------------------------
// Plain value, filled by loadConfig() and then treated as immutable. Defaults
// below are the values used when a key is absent.
// -----------------------------------------------------------------------------

enum class VenueMode {
  Paper,   // SimulatedVenue fed by the QuoteFeed
  Bridge,  // ZmqVenue talking to the terminal bridge
};

struct VenueConfig {
  VenueMode mode{VenueMode::Paper};
  std::string endpoint{"tcp://127.0.0.1:5560"};
  int timeout_ms{2000};
};

// Simulated account and instrument used in paper mode.
struct PaperConfig {
  std::string quote_endpoint{"tcp://127.0.0.1:5555"};
  double initial_balance{10000.0};
  double contract_size{100.0};
  double point{0.01};
  int digits{2};
  double volume_min{0.01};
  double volume_max{100.0};
  double volume_step{0.01};
};

// Either endpoint empty disables the IPC server.
struct IpcConfig {
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct EngineConfig {
  std::string instrument{"XAUUSD"};
  std::vector<std::string> symbol_aliases{"XAUUSD", "GOLD"};
  double lot_leg1{0.01};
  double lot_leg2{0.01};
  domain::Magic magic_number{20250101};
  int poll_interval_ms{1000};
  domain::RiskLimits limits;
  TimeOfDay session_start{7, 10};
  int session_utc_offset_minutes{540};
  bool include_manual_trades{false};
  std::string signal_store_path{"telegram_signals.sqlite3"};
  std::uint64_t status_log_interval_ticks{60};  // 0 disables the status line
  VenueConfig venue;
  PaperConfig paper;
  IpcConfig ipc;

  // Instrument plus aliases, upper-cased, without duplicates. This is both
  // the store query whitelist and the set a signal symbol must belong to.
  std::vector<std::string> symbolWhitelist() const;

  // Instrument spec the paper venue advertises for the configured
  // instrument.
  domain::InstrumentSpec paperInstrument() const;
};

}  // namespace sigexec
