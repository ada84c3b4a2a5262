#include "cache_demo/response.hpp"
#include "cache_demo/json_body.hpp"
#include <algorithm>
#include <cctype>

namespace cd {

static bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](char x, char y){ return std::tolower(static_cast<unsigned char>(x)) ==
                                               std::tolower(static_cast<unsigned char>(y)); });
}

Response& Response::set_header(std::string name, std::string value) {
  headers.emplace_back(std::move(name), std::move(value));
  return *this;
}

std::optional<std::string> Response::header(std::string_view name) const {
  for (auto& kv : headers)
    if (iequals(kv.first, name)) return kv.second;
  return std::nullopt;
}

Response json_response(int status, const JsonObject& body) {
  Response r;
  r.status = status;
  r.body = body.to_json();
  r.content_type = kJsonContentType;
  return r;
}

}
