#include "cache_demo/fingerprint.hpp"
#include "cache_demo/json_body.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cd {

std::string fingerprint(std::string_view content) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(content.data(), content.size(), md, &md_len, EVP_md5(), nullptr) != 1)
    throw std::runtime_error("EVP_Digest(md5) failed");

  std::ostringstream o;
  for (unsigned int i = 0; i < md_len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  return o.str();
}

std::string fingerprint(const JsonObject& content) {
  return fingerprint(content.to_json());
}

}
