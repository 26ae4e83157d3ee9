#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sigexec {

// Hour and minute of the trading-day boundary, in session-local time.
struct TimeOfDay {
  int hour{0};
  int minute{0};
};

// -----------------------------------------------------------------------------
// SessionClock — the one place that does time-zone arithmetic
// -----------------------------------------------------------------------------
//
// @brief  Maps (current UTC instant, boundary time-of-day, fixed UTC offset)
//         to the next session-boundary instant in UTC.
//
// @details
// The trading day does not roll over at UTC midnight. It rolls over at a
// fixed local time in a fixed-offset zone, e.g. 07:10 at UTC+9, which is
// 22:10 UTC of the previous calendar day.
//
// Algorithm (nextBoundary):
//   1. local_now     = now + offset
//   2. local_midnight = floor(local_now / 1 day) * 1 day
//   3. candidate     = local_midnight + HH:MM - offset      (back to UTC)
//   4. if candidate <= now: candidate += 1 day
//
// Step 4 is the "strictly in the future" rule: at exactly the boundary
// instant the next boundary is tomorrow's, so a RiskManager that resets at
// now == next_reset_at ends up with a future reset time.
//
// There are no DST rules — the offset is fixed by configuration.
//
// Thread-safety: immutable after construction; all methods are const.
// -----------------------------------------------------------------------------
class SessionClock {
 public:
  SessionClock(TimeOfDay boundary, int utc_offset_minutes);

  // -------------------------------------------------------------------------
  // parseTimeOfDay(text)
  // -------------------------------------------------------------------------
  // @brief  Parses "HH:MM" (or "H:MM") into a TimeOfDay.
  //
  // @return std::nullopt if the text is not two colon-separated integers in
  //         0..23 and 0..59. Surrounding whitespace is not accepted.
  // -------------------------------------------------------------------------
  static std::optional<TimeOfDay> parseTimeOfDay(const std::string& text);

  // @brief  Pure form of the algorithm above; used directly by tests.
  static std::int64_t nextBoundary(std::int64_t now_ms, TimeOfDay boundary,
                                   int utc_offset_minutes);

  // @brief  First boundary strictly after now_ms.
  std::int64_t nextBoundaryAfter(std::int64_t now_ms) const;

  // @brief  Boundary that opened the session containing now_ms.
  std::int64_t sessionStartFor(std::int64_t now_ms) const;

  // @brief  now_ms rendered as session-local "YYYY-MM-DD HH:MM:SS".
  std::string localTime(std::int64_t now_ms) const;

  TimeOfDay boundary() const { return boundary_; }
  int utcOffsetMinutes() const { return utc_offset_minutes_; }

 private:
  TimeOfDay boundary_;
  int utc_offset_minutes_;
};

}  // namespace sigexec
