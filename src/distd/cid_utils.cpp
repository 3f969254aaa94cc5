#include "distd/cid_utils.hpp"
#include "distd/errors.hpp"

#include <algorithm>
#include <cppcodec/base32_rfc4648.hpp>

namespace distd {

// CIDv1 (0x01), raw (0x55), BLAKE3 multihash (0x1e), length 0x20
const std::vector<uint8_t> CID_PREFIX_BLAKE3 = {0x01, 0x55, 0x1e, 0x20};

std::string digestToCid(const Hash &digest) {
  std::vector<uint8_t> bytes;
  bytes.reserve(CID_PREFIX_BLAKE3.size() + digest.size());
  bytes.insert(bytes.end(), CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return cppcodec::base32_rfc4648::encode(bytes);
}

Hash cidToDigest(const std::string &cid) {
  if (cid.empty()) {
    throwInvalidInput("CID string cannot be empty");
  }

  std::vector<uint8_t> decoded;
  try {
    decoded = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const cppcodec::parse_error &e) {
    throwInvalidInput("Failed to decode base32 CID: " + std::string(e.what()));
  }

  if (decoded.size() != CID_PREFIX_BLAKE3.size() + DIGEST_SIZE) {
    throwInvalidInput("Invalid CID: decoded length " +
                      std::to_string(decoded.size()) + " does not match a " +
                      "BLAKE3 CID");
  }
  if (!std::equal(CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end(),
                  decoded.begin())) {
    throwInvalidInput("Invalid CID: prefix mismatch");
  }

  Hash digest{};
  std::copy(decoded.begin() + CID_PREFIX_BLAKE3.size(), decoded.end(),
            digest.begin());
  return digest;
}

} // namespace distd
