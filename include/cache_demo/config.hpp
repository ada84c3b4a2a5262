#pragma once
#include <optional>
#include <string_view>

namespace cd {

constexpr int kDefaultPort = 3000;

// Decimal TCP port in 1..65535 with nothing trailing; nullopt otherwise.
std::optional<int> parse_port(std::string_view s);

// Value of PORT from the environment, kDefaultPort when unset or invalid.
// An invalid value is reported on stderr.
int port_from_env();

}
