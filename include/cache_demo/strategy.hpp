#pragma once
#include "cache_demo/conditional.hpp"
#include "cache_demo/json_body.hpp"
#include "cache_demo/response.hpp"
#include "cache_demo/server_state.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace cd {

enum class StrategyId {
  MaxAge,
  NoCache,
  NoStore,
  StaleWhileRevalidate,
  StaleIfError,
  ETagDemo,
  LastModifiedDemo,
  Combined,
};

// Static description of one demo endpoint.
struct Strategy {
  StrategyId id;
  std::string_view path;           // "/max-age"
  std::string_view cache_control;  // literal Cache-Control value
  ValidatorPolicy policy;
  std::string_view message;        // body "message"
  std::string_view label;          // body "cacheStrategy"

  // Navigation page text.
  std::string_view title;
  std::string_view description;

  bool uses_etag() const noexcept { return honors_etag(policy); }
  bool uses_last_modified() const noexcept { return honors_last_modified(policy); }
};

// All eight strategies, in navigation order.
const std::vector<Strategy>& strategies();

std::optional<Strategy> find_strategy(StrategyId id);
std::optional<Strategy> find_strategy(std::string_view path);

// The part of a representation that identifies its version (no construction
// timestamp). Its compact JSON is the fingerprint input.
JsonObject logical_content(const Strategy& s, const StateSnapshot& st);

// Build the response for one request: 200 with full JSON body, or 304 with
// no body when a honored validator matches.
Response respond(const Strategy& s,
                 const StateSnapshot& st,
                 const RequestValidators& req,
                 Clock::time_point now = Clock::now());

}
