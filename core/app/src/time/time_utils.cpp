#include "pdt/time/time_utils.hpp"

#include <cstdio>

namespace pdt {

namespace {

// Civil date from days since 1970-01-01 (proleptic Gregorian). Avoids
// gmtime(), which is not thread-safe and not available as gmtime_r on every
// platform.
void civil_from_days(std::int64_t z, int& year, unsigned& month,
                     unsigned& day) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 +
                          (month <= 2 ? 1 : 0));
}

}  // namespace

std::string to_iso8601(std::int64_t ms) {
  std::int64_t days = ms / kMillisPerDay;
  std::int64_t rem = ms % kMillisPerDay;
  if (rem < 0) {
    rem += kMillisPerDay;
    --days;
  }

  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_days(days, year, month, day);

  const auto hours = static_cast<int>(rem / 3600000);
  const auto minutes = static_cast<int>((rem / 60000) % 60);
  const auto seconds = static_cast<int>((rem / 1000) % 60);
  const auto millis = static_cast<int>(rem % 1000);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", year,
                month, day, hours, minutes, seconds, millis);
  return buf;
}

}  // namespace pdt
