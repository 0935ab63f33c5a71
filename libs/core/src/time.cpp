#include "vigil/core/time.h"

#include <cstdio>
#include <ctime>
#include <kj/common.h>
#include <kj/string.h>

namespace vigil::core {

std::int64_t now_unix_ns() {
  const auto now = std::chrono::system_clock::now();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ns.count());
}

kj::String to_utc_iso8601(std::int64_t unix_ns) {
  std::int64_t seconds = unix_ns / 1'000'000'000;
  std::int64_t subsec_ns = unix_ns % 1'000'000'000;
  if (subsec_ns < 0) {
    subsec_ns += 1'000'000'000;
    seconds -= 1;
  }
  const auto time_sec = static_cast<std::time_t>(seconds);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &time_sec);
#else
  gmtime_r(&time_sec, &tm);
#endif

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09ldZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long>(subsec_ns));
  return kj::str(buf);
}

kj::String now_utc_iso8601() {
  return to_utc_iso8601(now_unix_ns());
}

} // namespace vigil::core
