#include "time.hpp"

#include <cctype>
#include <ctime>

namespace stackctl::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);
  return tm;
}

std::string Format(TimePoint tp, const char* fmt) {
  const std::tm tm = ToUtc(tp);
  char          buffer[32];
  const auto    n = std::strftime(buffer, sizeof(buffer), fmt, &tm);
  return std::string(buffer, n);
}

int Digits(std::string_view text, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string FormatCompact(TimePoint tp) {
  return Format(tp, "%Y%m%d_%H%M%S");
}

std::optional<TimePoint> ParseCompact(std::string_view text) {
  if (text.size() != 15 || text[8] != '_') {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 8) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return std::nullopt;
    }
  }

  std::tm tm{};
  tm.tm_year = Digits(text, 0, 4) - 1900;
  tm.tm_mon  = Digits(text, 4, 2) - 1;
  tm.tm_mday = Digits(text, 6, 2);
  tm.tm_hour = Digits(text, 9, 2);
  tm.tm_min  = Digits(text, 11, 2);
  tm.tm_sec  = Digits(text, 13, 2);

  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::nullopt;
  }

  return Clock::from_time_t(timegm(&tm));
}

std::string FormatIso8601(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace stackctl::util
