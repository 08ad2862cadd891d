#include "notegraph/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace notegraph::common {

std::string sha256_hex(const std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (const unsigned char byte : digest) {
    out << std::setw(2) << static_cast<int>(byte);
  }
  return out.str();
}

std::string short_content_hash(const std::string_view data) {
  return sha256_hex(data).substr(0, SHORT_HASH_LENGTH);
}

} // namespace notegraph::common
