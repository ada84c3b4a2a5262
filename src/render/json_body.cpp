#include "cache_demo/json_body.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cd {

namespace {

// Length of the well-formed UTF-8 sequence starting at s[i]; 0 if malformed.
size_t utf8_seq_len(std::string_view s, size_t i) {
  auto b = [&](size_t k){ return static_cast<unsigned char>(s[k]); };
  const unsigned char c = b(i);
  size_t n = 0;
  unsigned char lo = 0x80, hi = 0xBF; // allowed range of the second byte
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c >= 0xE0 && c <= 0xEF) { n = 3; if (c == 0xE0) lo = 0xA0; else if (c == 0xED) hi = 0x9F; }
  else if (c >= 0xF0 && c <= 0xF4) { n = 4; if (c == 0xF0) lo = 0x90; else if (c == 0xF4) hi = 0x8F; }
  else return 0;
  if (i + n > s.size()) return 0;
  if (b(i+1) < lo || b(i+1) > hi) return 0;
  for (size_t k = 2; k < n; ++k)
    if (b(i+k) < 0x80 || b(i+k) > 0xBF) return 0;
  return n;
}

}

// Bytes that do not form valid UTF-8 are emitted as U+FFFD, one per byte.
std::string json_quote(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 2);
  o += '"';
  for (size_t i = 0; i < s.size(); ++i){
    const char c = s[i];
    switch(c){
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      case '\b': o += "\\b";  break;
      case '\f': o += "\\f";  break;
      default: {
        const auto u8 = static_cast<unsigned char>(c);
        if (u8 < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(u8));
          o += u;
        } else if (u8 < 0x80) {
          o += c;
        } else if (size_t n = utf8_seq_len(s, i)) {
          o.append(s.data() + i, n);
          i += n - 1;
        } else {
          o += "\\ufffd";
        }
        break;
      }
    }
  }
  o += '"';
  return o;
}

JsonObject& JsonObject::add(std::string_view key, std::string_view value) {
  fields_.emplace_back(std::string(key), json_quote(value));
  return *this;
}

JsonObject& JsonObject::add(std::string_view key, std::uint64_t value) {
  fields_.emplace_back(std::string(key), std::to_string(value));
  return *this;
}

JsonObject& JsonObject::add(std::string_view key, double value) {
  // Enough digits to round-trip; the default 6 would turn uptimes into 1.23457e+06.
  std::ostringstream o;
  o << std::setprecision(std::numeric_limits<double>::max_digits10)
    << (std::isfinite(value) ? value : 0.0);
  fields_.emplace_back(std::string(key), o.str());
  return *this;
}

JsonObject& JsonObject::add(std::string_view key, const JsonObject& nested) {
  fields_.emplace_back(std::string(key), nested.to_json());
  return *this;
}

std::string JsonObject::to_json() const {
  std::string o = "{";
  for (size_t i=0;i<fields_.size();++i){
    if (i) o += ",";
    o += json_quote(fields_[i].first);
    o += ":";
    o += fields_[i].second;
  }
  o += "}";
  return o;
}

}
