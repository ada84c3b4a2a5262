#include "cache_demo/utility_routes.hpp"
#include "json_fields.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace std::chrono;

static int failed = 0;
static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failed; }
}

int main(){
  const auto t0 = cd::Clock::time_point{} + seconds(1792437300);
  cd::ServerState state(t0);

  // force-error: 500, fixed body, state untouched.
  for (int i = 0; i < 3; ++i) {
    auto r = cd::force_error(t0);
    check(r.status == 500, "force-error status");
    JsonFields f; parse_fields(r.body, f);
    check(f.str("error") == "Simulated server error for stale-if-error testing", "force-error message");
    check(f.str("timestamp") == "2026-10-19T19:15:00.000Z", "force-error timestamp");
  }
  auto s = state.snapshot();
  check(s.counter == 0 && s.version == 1 && s.last_updated == t0, "force-error left state alone");

  // update-data echoes the post-update values.
  {
    auto r = cd::update_data(state, t0 + milliseconds(1234));
    check(r.status == 200, "update status");
    JsonFields f; parse_fields(r.body, f);
    check(f.keys == std::vector<std::string>{"message","newCounter","newVersion","updatedAt"}, "update keys");
    check(f.str("message") == "Data updated successfully", "update message");
    check(f.num("newCounter") == 1.0 && f.num("newVersion") == 2.0, "update values");
    check(f.str("updatedAt") == "2026-10-19T19:15:01.234Z", "updatedAt");
  }

  // status is read-only.
  {
    auto r = cd::api_status(state, t0 + seconds(90));
    check(r.status == 200, "status code");
    JsonFields f; parse_fields(r.body, f);
    check(f.keys == std::vector<std::string>{"serverTime","dataStore","uptime"}, "status keys");
    check(f.str("serverTime") == "2026-10-19T19:16:30.000Z", "serverTime");
    check(f.num("uptime") == 90.0, "uptime");

    JsonFields store; parse_fields(f.objects["dataStore"], store);
    check(store.keys == std::vector<std::string>{"counter","lastUpdated","version"}, "dataStore keys");
    check(store.num("counter") == 1.0 && store.num("version") == 2.0, "dataStore values");
    check(store.str("lastUpdated") == "2026-10-19T19:15:01.234Z", "dataStore lastUpdated");

    auto after = state.snapshot();
    check(after.counter == 1 && after.version == 2, "status left state alone");
  }

  if (failed) return 1;
  std::cout << "[PASS] utility routes\n";
  return 0;
}
