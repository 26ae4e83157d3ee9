#pragma once

#include "sigexec/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace sigexec {

// Thrown for an unreadable file or a malformed value. what() names the key.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// The file is one JSON object. Every key is optional; absent keys keep the
// EngineConfig default and unknown keys are ignored. Nested objects "venue",
// "paper" and "ipc" group the adapter settings:
//
//   {
//     "instrument": "XAUUSD",
//     "symbol_aliases": ["XAUUSD", "GOLD"],
//     "session_start": "07:10",
//     "session_utc_offset_minutes": 540,
//     "venue": {"mode": "bridge", "endpoint": "tcp://127.0.0.1:5560"},
//     ...
//   }
//
// Malformed values (wrong JSON type, a bad "HH:MM", a non-positive interval,
// lot size, limit or timeout, an unknown venue mode) raise ConfigError.
// -----------------------------------------------------------------------------

// @throws ConfigError if the file cannot be read or parsed, or a value is bad.
EngineConfig loadConfig(const std::string& path);

// @throws ConfigError if the text is not JSON or a value is bad.
EngineConfig parseConfig(const std::string& text);

// @throws ConfigError if a value is bad.
EngineConfig configFromJson(const nlohmann::json& root);

}  // namespace sigexec
