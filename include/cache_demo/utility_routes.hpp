#pragma once
#include "cache_demo/response.hpp"
#include "cache_demo/server_state.hpp"

namespace cd {

// GET /update-data: bump counter/version, stamp lastUpdated, echo new values.
Response update_data(ServerState& state, Clock::time_point now = Clock::now());

// GET /force-error: always 500, never touches state.
Response force_error(Clock::time_point now = Clock::now());

// GET /api/status: read-only snapshot plus uptime.
Response api_status(const ServerState& state, Clock::time_point now = Clock::now());

}
