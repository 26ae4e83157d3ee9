#pragma once

#include "sigexec/domain/side.hpp"
#include "sigexec/domain/signal_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sigexec {
namespace domain {

using SignalId = std::int64_t;

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
// Responsibility: One trading instruction as read from the shared queue.
//
// @details
// Value type. SignalStore builds it from a row; nothing in the core mutates
// it afterwards. Status changes go back to the store by id, never through
// this struct.
//
// The entry band is kept exactly as the producer wrote it. entry_min may be
// greater than entry_max if the producer got it wrong; bandLow()/bandHigh()
// give the normalized band so callers never have to care.
// -----------------------------------------------------------------------------
struct Signal {
  SignalId id{0};
  std::int64_t source_message_id{0};
  std::int64_t source_channel_id{0};
  std::string symbol;
  Side direction{Side::Buy};
  double entry_min{0.0};
  double entry_max{0.0};
  double stop_loss{0.0};
  double take_profit_1{0.0};
  std::optional<double> take_profit_2;
  std::optional<double> take_profit_3;  // preserved, not traded
  SignalStatus status{SignalStatus::Process};

  double bandLow() const {
    return entry_min < entry_max ? entry_min : entry_max;
  }
  double bandHigh() const {
    return entry_min < entry_max ? entry_max : entry_min;
  }
};

}  // namespace domain
}  // namespace sigexec
