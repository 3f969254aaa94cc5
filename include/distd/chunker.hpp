#ifndef DISTD_CHUNKER_HPP
#define DISTD_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace distd {

/// Default chunk size in bytes (256 KiB).
inline constexpr size_t DEFAULT_CHUNK_SIZE = 256 * 1024;

/// A chunk read from a byte source.
struct Chunk {
  uint64_t offset{0};          ///< position of the first byte in the source
  std::vector<std::byte> data; ///< chunk bytes
};

/**
 * @brief Splits a byte stream into fixed-size chunks.
 *
 * Every chunk is exactly chunkSize() bytes long except possibly the last
 * one. Chunks are read lazily, one per call to next(). The sequence can be
 * restarted from offset 0 with rewind() when the source is seekable.
 */
class Chunker {
public:
  /// @throws distd::InvalidInputError if @p chunkSize is zero.
  explicit Chunker(std::istream &source, size_t chunkSize = DEFAULT_CHUNK_SIZE);

  /**
   * @brief Read the next chunk into @p out.
   * @return false once the source is exhausted.
   * @throws distd::IoError if the source reports a read failure.
   */
  bool next(Chunk &out);

  /// @throws distd::IoError if the source cannot seek back to the start.
  void rewind();

  size_t chunkSize() const { return chunkSize_; }
  uint64_t offset() const { return offset_; }
  size_t chunksRead() const { return chunksRead_; }

  /// Split an in-memory buffer at the same boundaries a Chunker would use.
  static std::vector<std::span<const std::byte>>
  split(std::span<const std::byte> data, size_t chunkSize = DEFAULT_CHUNK_SIZE);

private:
  std::istream &source_;
  size_t chunkSize_;
  uint64_t offset_{0};
  size_t chunksRead_{0};
  bool exhausted_{false};
};

} // namespace distd

#endif // DISTD_CHUNKER_HPP
