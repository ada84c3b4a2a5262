#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace cd {

// Validators a client sent with the request. Absent headers stay nullopt.
struct RequestValidators {
  std::optional<std::string> if_none_match;
  std::optional<std::string> if_modified_since;
};

// Which validators an endpoint honors.
enum class ValidatorPolicy { None, ETagOnly, LastModifiedOnly, Either };

enum class Decision { Full, NotModified };

// Current validators of the representation; empty when the endpoint does not emit one.
struct CurrentValidators {
  std::string_view etag;
  std::string_view last_modified;
};

// Exact byte comparison only: no weak tags, no lists, no "*", no date parsing.
// Under Either a match on one validator is enough, even if the other is stale.
Decision evaluate(const RequestValidators& req,
                  const CurrentValidators& cur,
                  ValidatorPolicy policy);

bool honors_etag(ValidatorPolicy p) noexcept;
bool honors_last_modified(ValidatorPolicy p) noexcept;

const char* to_string(Decision d) noexcept;

}
