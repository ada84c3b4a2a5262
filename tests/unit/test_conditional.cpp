#include "cache_demo/conditional.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using cd::Decision;
using cd::ValidatorPolicy;

namespace {

struct Case {
  const char* name;
  std::optional<std::string> inm;
  std::optional<std::string> ims;
  ValidatorPolicy policy;
  Decision expect;
};

}

int main(){
  const std::string tag = "a20ed1a247532bd833c612769bb274b8";
  const std::string lm  = "Mon, 19 Oct 2026 19:15:00 GMT";
  const std::string old_lm = "Mon, 19 Oct 2026 19:14:59 GMT";
  const cd::CurrentValidators cur{tag, lm};

  const std::vector<Case> cases = {
    {"no validators",              std::nullopt, std::nullopt, ValidatorPolicy::Either,           Decision::Full},
    {"etag match",                 tag,          std::nullopt, ValidatorPolicy::ETagOnly,         Decision::NotModified},
    {"etag mismatch",              "deadbeef",   std::nullopt, ValidatorPolicy::ETagOnly,         Decision::Full},
    {"quoted etag is not equal",   "\"" + tag + "\"", std::nullopt, ValidatorPolicy::ETagOnly,    Decision::Full},
    {"weak etag is not equal",     "W/" + tag,   std::nullopt, ValidatorPolicy::ETagOnly,         Decision::Full},
    {"wildcard is not special",    "*",          std::nullopt, ValidatorPolicy::ETagOnly,         Decision::Full},
    {"empty header",               "",           "",           ValidatorPolicy::Either,           Decision::Full},
    {"etag ignored by lm policy",  tag,          std::nullopt, ValidatorPolicy::LastModifiedOnly, Decision::Full},
    {"lm match",                   std::nullopt, lm,           ValidatorPolicy::LastModifiedOnly, Decision::NotModified},
    {"lm older",                   std::nullopt, old_lm,       ValidatorPolicy::LastModifiedOnly, Decision::Full},
    {"lm ignored by etag policy",  std::nullopt, lm,           ValidatorPolicy::ETagOnly,         Decision::Full},
    {"lm malformed",               std::nullopt, "yesterday",  ValidatorPolicy::LastModifiedOnly, Decision::Full},
    {"either: etag only matches",  tag,          old_lm,       ValidatorPolicy::Either,           Decision::NotModified},
    {"either: lm only matches",    "deadbeef",   lm,           ValidatorPolicy::Either,           Decision::NotModified},
    {"either: both match",         tag,          lm,           ValidatorPolicy::Either,           Decision::NotModified},
    {"either: neither matches",    "deadbeef",   old_lm,       ValidatorPolicy::Either,           Decision::Full},
    {"none policy never matches",  tag,          lm,           ValidatorPolicy::None,             Decision::Full},
  };

  int failed = 0;
  for (auto& c : cases) {
    cd::RequestValidators req{c.inm, c.ims};
    Decision got = cd::evaluate(req, cur, c.policy);
    if (got != c.expect) {
      std::cerr << "[FAIL] " << c.name << ": got " << cd::to_string(got)
                << " expect " << cd::to_string(c.expect) << "\n";
      ++failed;
    }
  }

  // An endpoint that emits no ETag cannot be matched by an empty If-None-Match.
  cd::RequestValidators empty_inm{std::string(), std::nullopt};
  if (cd::evaluate(empty_inm, cd::CurrentValidators{"", lm}, ValidatorPolicy::Either) != Decision::Full) {
    std::cerr << "[FAIL] empty tag matched empty header\n"; ++failed;
  }

  if (failed) return 1;
  std::cout << "[PASS] conditional cases=" << cases.size() << "\n";
  return 0;
}
