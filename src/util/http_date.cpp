#include "cache_demo/http_date.hpp"
#include <cstdio>
#include <ctime>

// Formatting avoids strftime so day/month names never follow the C locale.

namespace cd {

namespace {

constexpr const char* kDays[]   = {"Sun","Mon","Tue","Wed","Thu","Fri","Sat"};
constexpr const char* kMonths[] = {"Jan","Feb","Mar","Apr","May","Jun",
                                   "Jul","Aug","Sep","Oct","Nov","Dec"};

// Splits tp into a UTC calendar time and the millisecond remainder.
std::tm to_utc(std::chrono::system_clock::time_point tp, int& ms_out) {
  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(tp.time_since_epoch()).count();
  auto secs = ms_epoch / 1000;
  auto rem  = ms_epoch % 1000;
  if (rem < 0) { rem += 1000; --secs; }
  ms_out = static_cast<int>(rem);

  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

}

std::string format_http_date(std::chrono::system_clock::time_point tp) {
  int ms = 0;
  const std::tm tm = to_utc(tp, ms);
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                        kDays[tm.tm_wday % 7], tm.tm_mday, kMonths[tm.tm_mon % 12],
                        tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return std::string(buf, (n > 0) ? static_cast<size_t>(n) : 0);
}

std::string format_iso8601_ms(std::chrono::system_clock::time_point tp) {
  int ms = 0;
  const std::tm tm = to_utc(tp, ms);
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                        tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return std::string(buf, (n > 0) ? static_cast<size_t>(n) : 0);
}

}
