#include "distd/blockio.hpp"
#include "distd/errors.hpp"

#include <stdexcept>
#include <string>
#include <zstd.h>

namespace distd {

BlockIO::BlockIO(int compression_level, bool keep_buffer)
    : keep_buffer_(keep_buffer), compression_level_(compression_level) {
  blake3_hasher_init(&hasher_);
}

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    if (keep_buffer_) {
      buffer_.insert(buffer_.end(), data, data + size);
    }
    blake3_hasher_update(&hasher_, reinterpret_cast<const uint8_t *>(data),
                         size);
  }
}

std::vector<std::byte> BlockIO::finalize_raw() const { return buffer_; }

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }
  DigestResult result;
  blake3_hasher_finalize(&hasher_, result.digest.data(), DIGEST_SIZE);
  if (keep_buffer_) {
    result.raw = std::move(buffer_);
    buffer_.clear();
  }
  finalized_ = true;
  return result;
}

Hash BlockIO::hash(std::span<const std::byte> data) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (!data.empty()) {
    blake3_hasher_update(&hasher, reinterpret_cast<const uint8_t *>(data.data()),
                         data.size());
  }
  Hash out;
  blake3_hasher_finalize(&hasher, out.data(), DIGEST_SIZE);
  return out;
}

std::vector<std::byte>
BlockIO::compress_data(std::span<const std::byte> plaintext) {
  size_t const bound = ZSTD_compressBound(plaintext.size());
  std::vector<std::byte> compressed(bound);

  size_t const cSize = ZSTD_compress(compressed.data(), bound, plaintext.data(),
                                     plaintext.size(), compression_level_);
  if (ZSTD_isError(cSize)) {
    throwIoFailure(std::string("ZSTD_compress failed: ") +
                   ZSTD_getErrorName(cSize));
  }
  compressed.resize(cSize);
  return compressed;
}

std::vector<std::byte>
BlockIO::decompress_data(std::span<const std::byte> compressed,
                         size_t original_size) {
  if (compressed.empty()) {
    throwInvalidInput("ZSTD_decompress: empty input");
  }
  if (original_size == 0) {
    unsigned long long const rSize =
        ZSTD_getFrameContentSize(compressed.data(), compressed.size());
    if (rSize == ZSTD_CONTENTSIZE_ERROR || rSize == ZSTD_CONTENTSIZE_UNKNOWN) {
      throwInvalidInput("ZSTD_decompress failed: frame content size is not "
                        "available");
    }
    original_size = static_cast<size_t>(rSize);
    if (original_size == 0) {
      return {};
    }
  }

  std::vector<std::byte> out(original_size);
  size_t const dSize = ZSTD_decompress(out.data(), original_size,
                                       compressed.data(), compressed.size());
  if (ZSTD_isError(dSize)) {
    throwInvalidInput(std::string("ZSTD_decompress failed: ") +
                      ZSTD_getErrorName(dSize));
  }
  if (dSize != original_size) {
    throwInvalidInput(
        "ZSTD_decompress failed: output size does not match original size.");
  }
  return out;
}

} // namespace distd
