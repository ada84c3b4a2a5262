#include "cache_demo/conditional.hpp"

namespace cd {

bool honors_etag(ValidatorPolicy p) noexcept {
  return p == ValidatorPolicy::ETagOnly || p == ValidatorPolicy::Either;
}

bool honors_last_modified(ValidatorPolicy p) noexcept {
  return p == ValidatorPolicy::LastModifiedOnly || p == ValidatorPolicy::Either;
}

static bool same(const std::optional<std::string>& sent, std::string_view current) {
  return sent.has_value() && !current.empty() && std::string_view(*sent) == current;
}

Decision evaluate(const RequestValidators& req,
                  const CurrentValidators& cur,
                  ValidatorPolicy policy) {
  if (honors_etag(policy) && same(req.if_none_match, cur.etag))
    return Decision::NotModified;
  if (honors_last_modified(policy) && same(req.if_modified_since, cur.last_modified))
    return Decision::NotModified;
  return Decision::Full;
}

const char* to_string(Decision d) noexcept {
  switch (d) {
    case Decision::Full:        return "full";
    case Decision::NotModified: return "not-modified";
  }
  return "unknown";
}

}
