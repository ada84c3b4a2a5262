#include "cache_demo/utility_routes.hpp"
#include "cache_demo/http_date.hpp"
#include "cache_demo/json_body.hpp"

namespace cd {

Response update_data(ServerState& state, Clock::time_point now) {
  const StateSnapshot st = state.update(now);
  JsonObject body;
  body.add("message", "Data updated successfully")
      .add("newCounter", st.counter)
      .add("newVersion", st.version)
      .add("updatedAt", format_iso8601_ms(st.last_updated));
  return json_response(200, body);
}

Response force_error(Clock::time_point now) {
  JsonObject body;
  body.add("error", "Simulated server error for stale-if-error testing")
      .add("timestamp", format_iso8601_ms(now));
  return json_response(500, body);
}

Response api_status(const ServerState& state, Clock::time_point now) {
  const StateSnapshot st = state.snapshot();
  JsonObject store;
  store.add("counter", st.counter)
       .add("lastUpdated", format_iso8601_ms(st.last_updated))
       .add("version", st.version);

  JsonObject body;
  body.add("serverTime", format_iso8601_ms(now))
      .add("dataStore", store)
      .add("uptime", state.uptime_seconds(now));
  return json_response(200, body);
}

}
