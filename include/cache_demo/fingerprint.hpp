#pragma once
#include <string>
#include <string_view>

namespace cd {

class JsonObject;

// MD5 of `content` as 32 lowercase hex chars. Pure; identical input gives an
// identical digest. Throws std::runtime_error if the digest backend fails.
std::string fingerprint(std::string_view content);

// Fingerprint of the object's compact JSON encoding.
std::string fingerprint(const JsonObject& content);

}
