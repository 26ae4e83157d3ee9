#include "sigexec/time/session_clock.hpp"
#include "sigexec/time/time_utils.hpp"

#include <cctype>

namespace sigexec {

namespace {

// Parses a run of 1-2 decimal digits. Returns -1 on anything else.
int parseSmallNumber(const std::string& text) {
  if (text.empty() || text.size() > 2) {
    return -1;
  }
  int value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return -1;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

SessionClock::SessionClock(TimeOfDay boundary, int utc_offset_minutes)
    : boundary_(boundary), utc_offset_minutes_(utc_offset_minutes) {}

// -----------------------------------------------------------------------------
// parseTimeOfDay
// -----------------------------------------------------------------------------
std::optional<TimeOfDay> SessionClock::parseTimeOfDay(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }

  int hour = parseSmallNumber(text.substr(0, colon));
  std::string minute_text = text.substr(colon + 1);
  if (minute_text.size() != 2) {
    return std::nullopt;
  }
  int minute = parseSmallNumber(minute_text);

  if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
    return std::nullopt;
  }
  return TimeOfDay{hour, minute};
}

// -----------------------------------------------------------------------------
// nextBoundary: local date of now → target local time → back to UTC
// -----------------------------------------------------------------------------
std::int64_t SessionClock::nextBoundary(std::int64_t now_ms,
                                        TimeOfDay boundary,
                                        int utc_offset_minutes) {
  const std::int64_t offset_ms =
      static_cast<std::int64_t>(utc_offset_minutes) * kMillisPerMinute;
  const std::int64_t target_ms = boundary.hour * kMillisPerHour +
                                 boundary.minute * kMillisPerMinute;

  const std::int64_t local_now = now_ms + offset_ms;
  const std::int64_t local_midnight =
      floor_div(local_now, kMillisPerDay) * kMillisPerDay;

  std::int64_t candidate = local_midnight + target_ms - offset_ms;
  if (candidate <= now_ms) {
    candidate += kMillisPerDay;
  }
  return candidate;
}

std::int64_t SessionClock::nextBoundaryAfter(std::int64_t now_ms) const {
  return nextBoundary(now_ms, boundary_, utc_offset_minutes_);
}

std::int64_t SessionClock::sessionStartFor(std::int64_t now_ms) const {
  return nextBoundaryAfter(now_ms) - kMillisPerDay;
}

std::string SessionClock::localTime(std::int64_t now_ms) const {
  return format_with_offset(now_ms, utc_offset_minutes_);
}

}  // namespace sigexec
