#pragma once

#include "sigexec/time/i_time_provider.hpp"

namespace sigexec {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the signal_executor binary. std::chrono::system_clock is UTC based
// on every supported platform, which is what SessionClock expects.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace sigexec
