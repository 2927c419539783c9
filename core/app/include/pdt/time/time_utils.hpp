#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pdt {

// Wall-clock time point carried by every event.
using Timestamp = std::chrono::system_clock::time_point;

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;
constexpr std::int64_t kMillisPerWeek = 7 * kMillisPerDay;

// -------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -------------------------------------------------------------------------
// @brief  Convert between epoch milliseconds (ITimeProvider) and Timestamp
//         (event fields). Inverse of each other at millisecond resolution.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// week_start_ms
// -------------------------------------------------------------------------
// @brief  Returns Monday 00:00:00.000 UTC of the calendar week containing
//         `ms`.
//
// @details
// 1970-01-01 was a Thursday, so (days + 3) mod 7 is the ISO weekday index
// with Monday == 0. Floor division keeps pre-epoch values correct.
// -------------------------------------------------------------------------
inline std::int64_t week_start_ms(std::int64_t ms) {
  std::int64_t days = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --days;
  }
  std::int64_t weekday = ((days + 3) % 7 + 7) % 7;
  return (days - weekday) * kMillisPerDay;
}

// @brief  Formats epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string to_iso8601(std::int64_t ms);

inline std::string to_iso8601(Timestamp tp) {
  return to_iso8601(timestamp_to_ms(tp));
}

}  // namespace pdt
