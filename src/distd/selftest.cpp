#include "distd/selftest.h"
#include "distd/blockio.hpp"
#include "distd/logger.h"
#include "distd/merkle_tree.hpp"

#include <cstring>
#include <sodium.h>
#include <vector>

namespace distd {

bool hash_self_test() {
  if (sodium_init() < 0) {
    Logger::getInstance().log(LogLevel::ERROR, "libsodium failed to initialize");
    return false;
  }

  const char msg[] = "The quick brown fox jumps over the lazy dog";
  unsigned char digest[BLAKE3_OUT_LEN];
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, reinterpret_cast<const uint8_t *>(msg),
                       sizeof(msg) - 1);
  blake3_hasher_finalize(&hasher, digest, BLAKE3_OUT_LEN);
  const unsigned char expected[BLAKE3_OUT_LEN] = {
      0x2f, 0x15, 0x14, 0x18, 0x1a, 0xad, 0xcc, 0xd9, 0x13, 0xab, 0xd9,
      0x4c, 0xfa, 0x59, 0x27, 0x01, 0xa5, 0x68, 0x6a, 0xb2, 0x3f, 0x8d,
      0xf1, 0xdf, 0xf1, 0xb7, 0x47, 0x10, 0xfe, 0xbc, 0x6d, 0x4a};
  if (std::memcmp(digest, expected, BLAKE3_OUT_LEN) != 0) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "BLAKE3 known-answer test failed");
    return false;
  }

  // Two 1 KiB blocks: BLAKE3 tree mode and our parent rule must disagree.
  std::vector<std::byte> data(2048, std::byte{0x61});
  Hash native = BlockIO::hash(data);
  Hash left = MerkleTree::hashChunk(std::span(data).first(1024));
  Hash right = MerkleTree::hashChunk(std::span(data).last(1024));
  if (digestEquals(native, MerkleTree::mergeHashes(left, right))) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Parent hash rule collides with BLAKE3 tree mode");
    return false;
  }
  return true;
}

} // namespace distd
