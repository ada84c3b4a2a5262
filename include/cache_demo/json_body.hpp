#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cd {

// Ordered JSON object. Fields are emitted in insertion order, so the same
// sequence of calls always produces byte-identical output.
class JsonObject {
public:
  JsonObject& add(std::string_view key, std::string_view value);
  JsonObject& add(std::string_view key, const char* value) { return add(key, std::string_view(value)); }
  JsonObject& add(std::string_view key, std::uint64_t value);
  JsonObject& add(std::string_view key, double value);
  JsonObject& add(std::string_view key, const JsonObject& nested);

  // Compact serialization, no whitespace.
  std::string to_json() const;

private:
  std::vector<std::pair<std::string, std::string>> fields_; // key -> encoded value
};

// Quote and escape s as a JSON string literal.
std::string json_quote(std::string_view s);

}
