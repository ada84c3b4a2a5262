#include "cache_demo/http_date.hpp"
#include <chrono>
#include <iostream>

using namespace std::chrono;

int main(){
  const system_clock::time_point epoch{};
  if (cd::format_http_date(epoch) != "Thu, 01 Jan 1970 00:00:00 GMT") {
    std::cerr << "[FAIL] epoch http-date: " << cd::format_http_date(epoch) << "\n"; return 1;
  }

  // RFC 7231 example date, plus 42ms that only the ISO form keeps.
  const system_clock::time_point t = epoch + seconds(784111777) + milliseconds(42);
  if (cd::format_http_date(t) != "Sun, 06 Nov 1994 08:49:37 GMT") {
    std::cerr << "[FAIL] http-date: " << cd::format_http_date(t) << "\n"; return 1;
  }
  if (cd::format_iso8601_ms(t) != "1994-11-06T08:49:37.042Z") {
    std::cerr << "[FAIL] iso: " << cd::format_iso8601_ms(t) << "\n"; return 1;
  }

  // Same second, different millis: identical validator string.
  if (cd::format_http_date(t) != cd::format_http_date(t + milliseconds(900))) {
    std::cerr << "[FAIL] http-date should drop sub-second part\n"; return 1;
  }

  // Millisecond field is zero-padded and pre-epoch times borrow from the seconds.
  if (cd::format_iso8601_ms(epoch + milliseconds(7)) != "1970-01-01T00:00:00.007Z") {
    std::cerr << "[FAIL] iso ms padding: " << cd::format_iso8601_ms(epoch + milliseconds(7)) << "\n"; return 1;
  }
  if (cd::format_iso8601_ms(epoch - milliseconds(1)) != "1969-12-31T23:59:59.999Z") {
    std::cerr << "[FAIL] iso pre-epoch: " << cd::format_iso8601_ms(epoch - milliseconds(1)) << "\n"; return 1;
  }
  if (cd::format_http_date(epoch + seconds(1792437300)) != "Mon, 19 Oct 2026 19:15:00 GMT") {
    std::cerr << "[FAIL] http-date 2026\n"; return 1;
  }

  std::cout << "[PASS] http dates\n";
  return 0;
}
