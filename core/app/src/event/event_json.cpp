#include "sigexec/events/event_json.hpp"
#include "sigexec/store/status_codec.hpp"
#include "sigexec/time/time_utils.hpp"

namespace sigexec {

nlohmann::json toJson(const SignalStatusEvent& e) {
  nlohmann::json j;
  j["type"] = "signal_status";
  j["signal_id"] = e.signal_id;
  j["symbol"] = e.symbol;
  j["status"] = statusToText(e.status);
  j["reason"] = e.reason;
  j["time_ms"] = timestamp_to_ms(e.timestamp);
  return j;
}

nlohmann::json toJson(const RiskLockEvent& e) {
  nlohmann::json j;
  j["type"] = "risk_lock";
  j["daily_pnl"] = e.daily_pnl;
  j["drawdown_percent"] = e.drawdown_percent;
  j["limit_percent"] = e.limit_percent;
  j["starting_equity"] = e.starting_equity;
  j["unlock_at_ms"] = e.unlock_at_ms;
  j["time_ms"] = timestamp_to_ms(e.timestamp);
  return j;
}

nlohmann::json toJson(const SessionResetEvent& e) {
  nlohmann::json j;
  j["type"] = "session_reset";
  j["starting_equity"] = e.starting_equity;
  j["was_locked"] = e.was_locked;
  j["next_reset_ms"] = e.next_reset_ms;
  j["time_ms"] = timestamp_to_ms(e.timestamp);
  return j;
}

nlohmann::json toJson(const BreakevenEvent& e) {
  nlohmann::json j;
  j["type"] = "breakeven";
  j["ticket"] = e.ticket;
  j["comment"] = e.comment;
  j["old_stop_loss"] = e.old_stop_loss;
  j["new_stop_loss"] = e.new_stop_loss;
  j["time_ms"] = timestamp_to_ms(e.timestamp);
  return j;
}

nlohmann::json toJson(const TickSummaryEvent& e) {
  nlohmann::json j;
  j["type"] = "tick_summary";
  j["tick"] = e.tick;
  j["session_time"] = e.session_time;
  j["starting_equity"] = e.starting_equity;
  j["daily_pnl"] = e.daily_pnl;
  j["daily_pnl_percent"] = e.daily_pnl_percent;
  j["trading_locked"] = e.trading_locked;
  j["open_legs"] = e.open_legs;
  j["pending_signals"] = e.pending_signals;
  j["next_reset_ms"] = e.next_reset_ms;
  j["next_reset_utc"] = format_utc(e.next_reset_ms);
  j["executed"] = e.executed;
  j["rejected"] = e.rejected;
  j["failed"] = e.failed;
  j["time_ms"] = timestamp_to_ms(e.timestamp);
  return j;
}

nlohmann::json eventToJson(const Event& event) {
  return std::visit([](const auto& e) { return toJson(e); }, event);
}

}  // namespace sigexec
