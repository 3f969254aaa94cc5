#ifndef DISTD_CID_UTILS_HPP
#define DISTD_CID_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "distd/digest.hpp"

namespace distd {

// CIDv1, raw codec, BLAKE3 multihash, 32 byte digest.
extern const std::vector<uint8_t> CID_PREFIX_BLAKE3;

/**
 * @brief Converts a chunk hash to a CIDv1 string (RFC 4648 base32).
 */
std::string digestToCid(const Hash &digest);

/**
 * @brief Converts a CIDv1 string back to its digest.
 * @throws distd::InvalidInputError if the CID is malformed or uses another
 *         hash function.
 */
Hash cidToDigest(const std::string &cid);

} // namespace distd

#endif // DISTD_CID_UTILS_HPP
