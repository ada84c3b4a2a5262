#pragma once
#include <chrono>
#include <string>

namespace cd {

// IMF-fixdate, e.g. "Mon, 19 Oct 2026 19:15:00 GMT". Sub-second part is dropped.
std::string format_http_date(std::chrono::system_clock::time_point tp);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_iso8601_ms(std::chrono::system_clock::time_point tp);

}
