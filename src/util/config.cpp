#include "cache_demo/config.hpp"
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <system_error>

namespace cd {

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

std::optional<int> parse_port(std::string_view s) {
  if (s.empty()) return std::nullopt;
  int port = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (port < 1 || port > 65535) return std::nullopt;
  return port;
}

int port_from_env() {
  const std::string raw = env_or("PORT", "");
  if (raw.empty()) return kDefaultPort;
  if (auto p = parse_port(raw)) return *p;
  std::cerr << "[server] ignoring invalid PORT=\"" << raw << "\", using " << kDefaultPort << "\n";
  return kDefaultPort;
}

}
