#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Shared fixtures for the engine tests:
//   - fixed UTC instants around the 07:10 @ UTC+9 session boundary
//   - makeSignal(): the canonical SELL 2400-2402 / SL 2410 scenario
//   - InMemorySignalStore: ISignalStore with failure injection
//   - xauusdSpec(): the instrument every venue test trades
// =============================================================================

#include "sigexec/domain/signal.hpp"
#include "sigexec/domain/venue_types.hpp"
#include "sigexec/store/i_signal_store.hpp"
#include "sigexec/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sigexec_test {

using sigexec::kMillisPerDay;
using sigexec::kMillisPerHour;
using sigexec::kMillisPerMinute;

// 2025-01-15 00:00:00 UTC
constexpr std::int64_t kJan15 = 1736899200000;

// 2025-01-15 12:00:00 UTC (21:00 at UTC+9): mid-session.
constexpr std::int64_t kJan15Noon = kJan15 + 12 * kMillisPerHour;

// 2025-01-14 22:10 UTC: the boundary that opened the session containing
// kJan15Noon (07:10 on 2025-01-15 at UTC+9).
constexpr std::int64_t kSessionStart =
    kJan15 - kMillisPerDay + 22 * kMillisPerHour + 10 * kMillisPerMinute;

// 2025-01-15 22:10 UTC: the next boundary after kJan15Noon.
constexpr std::int64_t kNextBoundary = kSessionStart + kMillisPerDay;

constexpr sigexec::domain::Magic kMagic = 20250101;

inline sigexec::domain::InstrumentSpec xauusdSpec() {
  sigexec::domain::InstrumentSpec spec;
  spec.symbol = "XAUUSD";
  spec.point = 0.01;
  spec.digits = 2;
  spec.volume_min = 0.01;
  spec.volume_max = 1.0;
  spec.volume_step = 0.01;
  spec.contract_size = 100.0;
  return spec;
}

// SELL 2400-2402, SL 2410, TP1 2390, TP2 2380.
inline sigexec::domain::Signal makeSignal(
    sigexec::domain::SignalId id,
    sigexec::domain::Side side = sigexec::domain::Side::Sell) {
  sigexec::domain::Signal s;
  s.id = id;
  s.symbol = "XAUUSD";
  s.direction = side;
  if (side == sigexec::domain::Side::Sell) {
    s.entry_min = 2400.0;
    s.entry_max = 2402.0;
    s.stop_loss = 2410.0;
    s.take_profit_1 = 2390.0;
    s.take_profit_2 = 2380.0;
  } else {
    s.entry_min = 2398.0;
    s.entry_max = 2400.0;
    s.stop_loss = 2390.0;
    s.take_profit_1 = 2410.0;
    s.take_profit_2 = 2420.0;
  }
  return s;
}

// -----------------------------------------------------------------------------
// InMemorySignalStore
// -----------------------------------------------------------------------------
// Same contract as SqliteSignalStore (whitelist, pending-only, id order,
// guarded update) without a database, plus knobs to make reads or the next N
// writes fail.
// -----------------------------------------------------------------------------
class InMemorySignalStore final : public sigexec::ISignalStore {
 public:
  void add(const sigexec::domain::Signal& signal) { rows_[signal.id] = signal; }

  std::optional<sigexec::domain::SignalStatus> statusOf(
      sigexec::domain::SignalId id) const {
    auto it = rows_.find(id);
    if (it == rows_.end()) {
      return std::nullopt;
    }
    return it->second.status;
  }

  void setRowStatus(sigexec::domain::SignalId id,
                    sigexec::domain::SignalStatus status) {
    rows_[id].status = status;
  }

  void failReads(bool fail) { fail_reads_ = fail; }
  void failNextWrites(int count) { failing_writes_ = count; }

  int successfulWrites() const { return successful_writes_; }
  int attemptedWrites() const { return attempted_writes_; }

  std::optional<std::vector<sigexec::domain::Signal>> fetchPending(
      const std::vector<std::string>& whitelist) override {
    if (fail_reads_) {
      return std::nullopt;
    }
    std::vector<sigexec::domain::Signal> out;
    for (const auto& [id, row] : rows_) {  // std::map: id order
      if (!sigexec::domain::isPending(row.status)) {
        continue;
      }
      if (std::find(whitelist.begin(), whitelist.end(), upper(row.symbol)) ==
          whitelist.end()) {
        continue;
      }
      out.push_back(row);
    }
    return out;
  }

  bool setStatus(sigexec::domain::SignalId id,
                 sigexec::domain::SignalStatus status) override {
    ++attempted_writes_;
    if (failing_writes_ > 0) {
      --failing_writes_;
      return false;
    }
    auto it = rows_.find(id);
    if (it != rows_.end() && sigexec::domain::isPending(it->second.status)) {
      it->second.status = status;
    }
    ++successful_writes_;
    return true;
  }

 private:
  static std::string upper(std::string s) {
    for (auto& c : s) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
  }

  std::map<sigexec::domain::SignalId, sigexec::domain::Signal> rows_;
  bool fail_reads_{false};
  int failing_writes_{0};
  int successful_writes_{0};
  int attempted_writes_{0};
};

}  // namespace sigexec_test
