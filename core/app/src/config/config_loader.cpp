#include "sigexec/config/config_loader.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace sigexec {

namespace {

using nlohmann::json;

// Copies root[key] into out if present. A value of the wrong JSON type is a
// ConfigError naming the full key.
template <typename T>
void read(const json& obj, const std::string& prefix, const char* key,
          T& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError("config key '" + prefix + key + "': " + e.what());
  }
}

void requirePositive(double value, const std::string& key) {
  if (!(value > 0.0)) {
    throw ConfigError("config key '" + key + "' must be positive");
  }
}

// Returns root[key] if it is an object, an empty object if absent.
const json& section(const json& root, const char* key) {
  static const json kEmpty = json::object();
  auto it = root.find(key);
  if (it == root.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config key '") + key +
                      "' must be an object");
  }
  return *it;
}

}  // namespace

// -----------------------------------------------------------------------------
// configFromJson(): the whole schema in one place
// -----------------------------------------------------------------------------
EngineConfig configFromJson(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  EngineConfig cfg;

  read(root, "", "instrument", cfg.instrument);
  read(root, "", "symbol_aliases", cfg.symbol_aliases);
  read(root, "", "lot_leg1", cfg.lot_leg1);
  read(root, "", "lot_leg2", cfg.lot_leg2);
  read(root, "", "magic_number", cfg.magic_number);
  read(root, "", "poll_interval_ms", cfg.poll_interval_ms);
  read(root, "", "entry_tolerance", cfg.limits.entry_tolerance);
  read(root, "", "max_daily_loss_percent", cfg.limits.max_daily_loss_percent);
  read(root, "", "max_sl_distance", cfg.limits.max_sl_distance);
  read(root, "", "session_utc_offset_minutes",
       cfg.session_utc_offset_minutes);
  read(root, "", "include_manual_trades", cfg.include_manual_trades);
  read(root, "", "signal_store_path", cfg.signal_store_path);
  read(root, "", "status_log_interval_ticks", cfg.status_log_interval_ticks);

  std::string session_start;
  read(root, "", "session_start", session_start);
  if (!session_start.empty()) {
    auto tod = SessionClock::parseTimeOfDay(session_start);
    if (!tod) {
      throw ConfigError("config key 'session_start': expected HH:MM, got '" +
                        session_start + "'");
    }
    cfg.session_start = *tod;
  }

  if (cfg.instrument.empty()) {
    throw ConfigError("config key 'instrument' must not be empty");
  }
  requirePositive(cfg.lot_leg1, "lot_leg1");
  requirePositive(cfg.lot_leg2, "lot_leg2");
  requirePositive(cfg.poll_interval_ms, "poll_interval_ms");
  requirePositive(cfg.limits.max_daily_loss_percent, "max_daily_loss_percent");
  requirePositive(cfg.limits.max_sl_distance, "max_sl_distance");
  if (cfg.limits.entry_tolerance < 0.0) {
    throw ConfigError("config key 'entry_tolerance' must not be negative");
  }
  if (cfg.session_utc_offset_minutes <= -24 * 60 ||
      cfg.session_utc_offset_minutes >= 24 * 60) {
    throw ConfigError(
        "config key 'session_utc_offset_minutes' must be within +/-1439");
  }

  // --- venue -------------------------------------------------------------------
  const json& venue = section(root, "venue");
  std::string mode = "paper";
  read(venue, "venue.", "mode", mode);
  if (mode == "paper") {
    cfg.venue.mode = VenueMode::Paper;
  } else if (mode == "bridge") {
    cfg.venue.mode = VenueMode::Bridge;
  } else {
    throw ConfigError("config key 'venue.mode': expected paper or bridge, got '" +
                      mode + "'");
  }
  read(venue, "venue.", "endpoint", cfg.venue.endpoint);
  read(venue, "venue.", "timeout_ms", cfg.venue.timeout_ms);
  requirePositive(cfg.venue.timeout_ms, "venue.timeout_ms");

  // --- paper -------------------------------------------------------------------
  const json& paper = section(root, "paper");
  read(paper, "paper.", "quote_endpoint", cfg.paper.quote_endpoint);
  read(paper, "paper.", "initial_balance", cfg.paper.initial_balance);
  read(paper, "paper.", "contract_size", cfg.paper.contract_size);
  read(paper, "paper.", "point", cfg.paper.point);
  read(paper, "paper.", "digits", cfg.paper.digits);
  read(paper, "paper.", "volume_min", cfg.paper.volume_min);
  read(paper, "paper.", "volume_max", cfg.paper.volume_max);
  read(paper, "paper.", "volume_step", cfg.paper.volume_step);
  requirePositive(cfg.paper.initial_balance, "paper.initial_balance");
  requirePositive(cfg.paper.contract_size, "paper.contract_size");
  requirePositive(cfg.paper.point, "paper.point");
  requirePositive(cfg.paper.volume_min, "paper.volume_min");
  requirePositive(cfg.paper.volume_step, "paper.volume_step");
  if (cfg.paper.volume_max < cfg.paper.volume_min) {
    throw ConfigError("config key 'paper.volume_max' is below volume_min");
  }

  // --- ipc ---------------------------------------------------------------------
  const json& ipc = section(root, "ipc");
  read(ipc, "ipc.", "cmd_endpoint", cfg.ipc.cmd_endpoint);
  read(ipc, "ipc.", "pub_endpoint", cfg.ipc.pub_endpoint);

  return cfg;
}

EngineConfig parseConfig(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("configuration is not valid JSON: ") +
                      e.what());
  }
  return configFromJson(root);
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  EngineConfig cfg = parseConfig(buffer.str());
  std::cout << "[Config] loaded " << path << " (instrument " << cfg.instrument
            << ", venue "
            << (cfg.venue.mode == VenueMode::Paper ? "paper" : "bridge")
            << ")\n";
  return cfg;
}

}  // namespace sigexec
