#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sigexec {

using Timestamp = std::chrono::system_clock::time_point;

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// -----------------------------------------------------------------------------
// Time conversion and formatting helpers
// -----------------------------------------------------------------------------
//
// @brief  Free functions bridging epoch milliseconds (what ITimeProvider
//         returns), Timestamp (what events carry) and text (what logs, the
//         IPC status payload and the signal store need).
//
// @details
// Formatting goes through gmtime_r so the host's local time zone never leaks
// into the output. "Session-local" time is UTC shifted by a fixed offset,
// never a tz database zone.
//
// Thread-safety: stateless, safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Floor division that rounds toward negative infinity, so instants before
// 1970 (or negative offsets) still land on the correct calendar day.
inline std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string format_utc(std::int64_t ms);

// "YYYY-MM-DD HH:MM:SS.ffffff" in UTC — the layout the signal producer
// writes into created_at / updated_at.
std::string format_storage_time(std::int64_t ms);

// "YYYY-MM-DD HH:MM:SS" at UTC + offset_minutes.
std::string format_with_offset(std::int64_t ms, int offset_minutes);

}  // namespace sigexec
