#ifndef DISTD_WIRE_CODEC_HPP
#define DISTD_WIRE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "distd/merkle_tree.hpp"
#include "proto/distd.pb.h"

namespace distd {

/// Payload type, told apart by the four magic bytes.
enum class PayloadKind { Tree, HashSet, ChunkFrame, Unknown };

/// A chunk and the hash it was announced under.
struct ChunkFrame {
  Hash hash{};
  std::vector<std::byte> data;
};

/**
 * @brief Binary encoding of trees, hash sets and chunk frames.
 *
 * All integers are little-endian. Layouts:
 *
 *   tree:      "DTRE" u8 format, u32 chunk size, u32 leaf count,
 *              root[32], u64 total size, leaf count * (hash[32], u64 size)
 *   hash set:  "DHSH" u8 format, u32 count, count * hash[32] (ascending)
 *   chunk:     "DCHK" u8 format, hash[32], u32 size, size bytes
 *
 * Leaf offsets are not transmitted; they are the running sum of sizes.
 * Every decoder throws distd::InvalidInputError on a truncated payload,
 * unknown magic or format, or trailing bytes.
 */
class WireCodec {
public:
  static constexpr uint8_t FORMAT_VERSION = 1;

  static PayloadKind kindOf(std::span<const std::byte> payload);

  /// @throws distd::InvalidInputError if @p chunkSize is zero or too large.
  static std::vector<std::byte> serializeTree(const HashTree &tree,
                                              uint64_t chunkSize);
  /**
   * @brief Rebuild a tree and check it against the transmitted root.
   * @param chunkSize receives the chunk size field when not null.
   * @throws distd::InvariantViolationError if the rebuilt root differs.
   */
  static HashTree deserializeTree(std::span<const std::byte> payload,
                                  uint32_t *chunkSize = nullptr);

  static std::vector<std::byte> serializeHashSet(const HashSet &hashes);
  static HashSet deserializeHashSet(std::span<const std::byte> payload);

  static std::vector<std::byte> encodeChunkFrame(const Hash &hash,
                                                 std::span<const std::byte> data);
  /// @throws distd::InvalidInputError if the bytes do not hash to the
  ///         announced hash.
  static ChunkFrame decodeChunkFrame(std::span<const std::byte> payload);

  /// Hashes in ascending order.
  static proto::Hashes toProto(const HashSet &hashes);
  /// @throws distd::InvalidInputError for an entry that is not 32 bytes.
  static HashSet fromProto(const proto::Hashes &hashes);

  static proto::SerializedTree wrap(std::vector<std::byte> payload);
  static std::span<const std::byte> unwrap(const proto::SerializedTree &message);
};

} // namespace distd

#endif // DISTD_WIRE_CODEC_HPP
