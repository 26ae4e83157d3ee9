#include "sigexec/time/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sigexec {

namespace {

// Splits epoch ms into a UTC broken-down time plus the sub-second remainder.
std::tm to_utc_tm(std::int64_t ms, std::int64_t& millis_out) {
  std::int64_t seconds = floor_div(ms, kMillisPerSecond);
  millis_out = ms - seconds * kMillisPerSecond;

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  return tm_utc;
}

}  // namespace

// -----------------------------------------------------------------------------
// format_utc
// -----------------------------------------------------------------------------
std::string format_utc(std::int64_t ms) {
  std::int64_t millis = 0;
  std::tm tm_utc = to_utc_tm(ms, millis);

  std::ostringstream out;
  out << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

// -----------------------------------------------------------------------------
// format_storage_time: microsecond field to match the producer's rows.
// -----------------------------------------------------------------------------
std::string format_storage_time(std::int64_t ms) {
  std::int64_t millis = 0;
  std::tm tm_utc = to_utc_tm(ms, millis);

  std::ostringstream out;
  out << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setw(6) << std::setfill('0') << millis * 1000;
  return out.str();
}

// -----------------------------------------------------------------------------
// format_with_offset
// -----------------------------------------------------------------------------
std::string format_with_offset(std::int64_t ms, int offset_minutes) {
  return format_utc(ms + static_cast<std::int64_t>(offset_minutes) *
                             kMillisPerMinute);
}

}  // namespace sigexec
