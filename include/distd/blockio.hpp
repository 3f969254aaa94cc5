#ifndef DISTD_BLOCKIO_HPP
#define DISTD_BLOCKIO_HPP

#include <blake3.h>
#include <cstddef>
#include <span>
#include <vector>

#include "distd/digest.hpp"

namespace distd {

struct DigestResult {
  Hash digest;                 ///< BLAKE3 digest of all ingested bytes
  std::vector<std::byte> raw;  ///< ingested bytes, empty when not buffering
};

/**
 * @brief Incremental BLAKE3 hashing with optional buffering and zstd
 * compression helpers.
 *
 * A BlockIO instance hashes everything passed to ingest(). When constructed
 * with @p keep_buffer the plaintext is also retained so that callers can
 * obtain both the digest and the bytes in one pass.
 */
class BlockIO {
public:
  /**
   * @param compression_level Zstd level used by compress_data().
   * @param keep_buffer Retain ingested bytes for finalize_raw().
   */
  explicit BlockIO(int compression_level = 1, bool keep_buffer = true);

  /// @throws std::logic_error after finalize_hashed().
  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data) {
    ingest(data.data(), data.size());
  }

  /// Copy of the buffered plaintext.
  std::vector<std::byte> finalize_raw() const;

  /// @throws std::logic_error if called twice.
  DigestResult finalize_hashed();

  /// One-shot BLAKE3 of @p data.
  static Hash hash(std::span<const std::byte> data);

  /**
   * @brief Compress @p plaintext with zstd.
   * @throws distd::IoError on a zstd failure.
   */
  std::vector<std::byte> compress_data(std::span<const std::byte> plaintext);

  /**
   * @brief Decompress a zstd frame.
   *
   * When @p original_size is zero the size is read from the frame header.
   * @throws distd::InvalidInputError if the frame is corrupt or the size
   *         cannot be determined.
   */
  std::vector<std::byte> decompress_data(std::span<const std::byte> compressed,
                                         size_t original_size = 0);

  int compression_level() const { return compression_level_; }

private:
  std::vector<std::byte> buffer_;
  blake3_hasher hasher_;
  bool finalized_ = false;
  bool keep_buffer_ = true;
  int compression_level_ = 1;
};

} // namespace distd

#endif // DISTD_BLOCKIO_HPP
