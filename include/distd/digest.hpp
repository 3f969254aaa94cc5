#ifndef DISTD_DIGEST_HPP
#define DISTD_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_set>

namespace distd {

/// Digest size of BLAKE3 in its default output length (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// A chunk or tree-node hash.
using Hash = DigestArray;

/// Hasher for unordered containers keyed by Hash.
///
/// BLAKE3 output is uniformly distributed so the first machine word of the
/// digest is already a good bucket index.
struct HashHasher {
  size_t operator()(const Hash &h) const noexcept {
    size_t v;
    std::memcpy(&v, h.data(), sizeof(v));
    return v;
  }
};

/// Set of hashes a peer claims to hold.
using HashSet = std::unordered_set<Hash, HashHasher>;

/**
 * @brief Lowercase hex representation of a hash (64 characters).
 */
std::string toHex(const Hash &hash);

/**
 * @brief Parse a 64 character hex string into a hash.
 * @throws distd::InvalidInputError if the string is not valid hex of the
 *         right length.
 */
Hash hashFromHex(const std::string &hex);

/**
 * @brief Short form used in log lines: first 8 hex characters.
 */
std::string shortHex(const Hash &hash);

/// Constant-time comparison of two digests.
bool digestEquals(const Hash &a, const Hash &b);

} // namespace distd

#endif // DISTD_DIGEST_HPP
