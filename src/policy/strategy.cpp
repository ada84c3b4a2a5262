#include "cache_demo/strategy.hpp"
#include "cache_demo/fingerprint.hpp"
#include "cache_demo/http_date.hpp"
#include "cache_demo/json_body.hpp"

#include <string>

namespace cd {

const std::vector<Strategy>& strategies() {
  static const std::vector<Strategy> all = {
    {StrategyId::MaxAge, "/max-age",
     "public, max-age=60", ValidatorPolicy::None,
     "This response is cached for 60 seconds", "max-age=60",
     "Max-Age Caching", "Cache for 60 seconds with max-age directive"},
    {StrategyId::NoCache, "/no-cache",
     "no-cache", ValidatorPolicy::None,
     "This response uses no-cache (always revalidate)", "no-cache",
     "No-Cache", "Always revalidate with server before using cached response"},
    {StrategyId::NoStore, "/no-store",
     "no-store", ValidatorPolicy::None,
     "This response is never cached (no-store)", "no-store",
     "No-Store", "Never cache this response"},
    {StrategyId::StaleWhileRevalidate, "/stale-while-revalidate",
     "public, max-age=30, stale-while-revalidate=60", ValidatorPolicy::None,
     "Fresh for 30s, then stale-while-revalidate for 60s", "max-age=30, stale-while-revalidate=60",
     "Stale-While-Revalidate (SWR)", "Serve stale content while fetching fresh content in background"},
    {StrategyId::StaleIfError, "/stale-if-error",
     "public, max-age=30, stale-if-error=300", ValidatorPolicy::None,
     "Fresh for 30s, serve stale for 300s if server error occurs", "max-age=30, stale-if-error=300",
     "Stale-If-Error (SIE)", "Serve stale content if server returns an error"},
    {StrategyId::ETagDemo, "/etag-demo",
     "public, max-age=0, must-revalidate", ValidatorPolicy::ETagOnly,
     "This response uses ETag for validation", "ETag validation",
     "ETag Demo", "Use ETags for efficient cache validation"},
    {StrategyId::LastModifiedDemo, "/last-modified-demo",
     "public, max-age=0, must-revalidate", ValidatorPolicy::LastModifiedOnly,
     "This response uses Last-Modified for validation", "Last-Modified validation",
     "Last-Modified Demo", "Use Last-Modified header for cache validation"},
    {StrategyId::Combined, "/combined-strategy",
     "public, max-age=20, stale-while-revalidate=40, must-revalidate", ValidatorPolicy::Either,
     "Combined caching strategy: ETag + Last-Modified + SWR", "ETag + Last-Modified + SWR",
     "Combined Strategy", "ETag + Last-Modified + SWR"},
  };
  return all;
}

std::optional<Strategy> find_strategy(StrategyId id) {
  for (auto& s : strategies()) if (s.id == id) return s;
  return std::nullopt;
}

std::optional<Strategy> find_strategy(std::string_view path) {
  for (auto& s : strategies()) if (s.path == path) return s;
  return std::nullopt;
}

JsonObject logical_content(const Strategy& s, const StateSnapshot& st) {
  JsonObject o;
  o.add("message", s.message)
   .add("counter", st.counter)
   .add("version", st.version)
   .add("cacheStrategy", s.label);
  return o;
}

Response respond(const Strategy& s,
                 const StateSnapshot& st,
                 const RequestValidators& req,
                 Clock::time_point now) {
  std::string etag, last_modified;
  if (s.uses_etag()) etag = fingerprint(logical_content(s, st));
  if (s.uses_last_modified()) last_modified = format_http_date(st.last_updated);

  Response r;
  if (!etag.empty()) r.set_header("ETag", etag);
  if (!last_modified.empty()) r.set_header("Last-Modified", last_modified);
  r.set_header("Cache-Control", std::string(s.cache_control));

  if (s.policy != ValidatorPolicy::None &&
      evaluate(req, CurrentValidators{etag, last_modified}, s.policy) == Decision::NotModified) {
    r.status = 304;
    return r;
  }

  // Field order differs per endpoint; keep it identical to what clients already parse.
  JsonObject body;
  body.add("message", s.message)
      .add("timestamp", format_iso8601_ms(now))
      .add("counter", st.counter);
  switch (s.policy) {
    case ValidatorPolicy::None:
      body.add("cacheStrategy", s.label);
      break;
    case ValidatorPolicy::ETagOnly:
      body.add("version", st.version)
          .add("cacheStrategy", s.label)
          .add("etag", etag);
      break;
    case ValidatorPolicy::LastModifiedOnly:
      body.add("lastModified", last_modified)
          .add("cacheStrategy", s.label);
      break;
    case ValidatorPolicy::Either:
      body.add("version", st.version)
          .add("cacheStrategy", s.label)
          .add("etag", etag)
          .add("lastModified", last_modified);
      break;
  }

  r.status = 200;
  r.body = body.to_json();
  r.content_type = kJsonContentType;
  return r;
}

}
