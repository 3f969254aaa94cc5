#include "distd/digest.hpp"
#include "distd/errors.hpp"

#include <sodium.h>

namespace distd {

std::string toHex(const Hash &hash) {
  char hex[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), hash.data(), hash.size());
  return std::string(hex, DIGEST_SIZE * 2);
}

Hash hashFromHex(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throwInvalidInput("Hex hash must be " + std::to_string(DIGEST_SIZE * 2) +
                      " characters, got " + std::to_string(hex.size()));
  }
  Hash out{};
  size_t binLen = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr,
                     &binLen, &end) != 0 ||
      binLen != DIGEST_SIZE || end != hex.data() + hex.size()) {
    throwInvalidInput("Invalid hex hash: '" + hex + "'");
  }
  return out;
}

std::string shortHex(const Hash &hash) { return toHex(hash).substr(0, 8); }

bool digestEquals(const Hash &a, const Hash &b) {
  return sodium_memcmp(a.data(), b.data(), DIGEST_SIZE) == 0;
}

} // namespace distd
