#include "semcache/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace semcache::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string short_digest(const std::string &text, const std::size_t length) {
  return sha256_hex(text).substr(0, length);
}

} // namespace semcache::common
