#pragma once

#include "sigexec/events/event.hpp"

#include <nlohmann/json.hpp>

namespace sigexec {

// -----------------------------------------------------------------------------
// JSON rendering of engine events
// -----------------------------------------------------------------------------
// Every object carries a "type" field ("signal_status", "risk_lock",
// "session_reset", "breakeven", "tick_summary") so a subscriber on the IPC PUB
// socket can dispatch without guessing. Instants are UTC epoch milliseconds;
// signal statuses use the same text as the signal store.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const SignalStatusEvent& e);
nlohmann::json toJson(const RiskLockEvent& e);
nlohmann::json toJson(const SessionResetEvent& e);
nlohmann::json toJson(const BreakevenEvent& e);
nlohmann::json toJson(const TickSummaryEvent& e);

nlohmann::json eventToJson(const Event& event);

}  // namespace sigexec
