#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cd {

class JsonObject;

inline constexpr const char* kJsonContentType = "application/json; charset=utf-8";

// Transport-neutral handler result. Headers are applied in list order.
// An empty content_type means "no body": no Content-Type header is sent.
struct Response {
  int status = 200;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::string content_type;

  Response& set_header(std::string name, std::string value);

  // Case-insensitive lookup of the first header called `name`.
  std::optional<std::string> header(std::string_view name) const;
};

Response json_response(int status, const JsonObject& body);

}
