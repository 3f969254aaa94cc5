#include "distd/chunker.hpp"
#include "distd/errors.hpp"

#include <algorithm>
#include <string>

namespace distd {

Chunker::Chunker(std::istream &source, size_t chunkSize)
    : source_(source), chunkSize_(chunkSize) {
  if (chunkSize_ == 0) {
    throwInvalidInput("Chunk size must be greater than zero");
  }
}

bool Chunker::next(Chunk &out) {
  if (exhausted_) {
    return false;
  }

  out.offset = offset_;
  out.data.resize(chunkSize_);
  size_t filled = 0;
  // A stream may hand out fewer bytes than requested without being at EOF
  // (pipes, sockets wrapped in streambufs), so keep reading until the chunk
  // is full or the source ends.
  while (filled < chunkSize_) {
    source_.read(reinterpret_cast<char *>(out.data.data() + filled),
                 static_cast<std::streamsize>(chunkSize_ - filled));
    std::streamsize got = source_.gcount();
    if (source_.bad()) {
      throwIoFailure("Read failure at offset " +
                     std::to_string(offset_ + filled));
    }
    filled += static_cast<size_t>(got);
    if (source_.eof()) {
      exhausted_ = true;
      break;
    }
    if (got == 0 && source_.fail()) {
      throwIoFailure("Source stopped producing data at offset " +
                     std::to_string(offset_ + filled));
    }
  }

  if (filled == 0) {
    out.data.clear();
    return false;
  }
  out.data.resize(filled);
  offset_ += filled;
  ++chunksRead_;
  return true;
}

void Chunker::rewind() {
  source_.clear();
  source_.seekg(0, std::ios::beg);
  if (source_.fail()) {
    throwIoFailure("Chunk source is not seekable");
  }
  offset_ = 0;
  chunksRead_ = 0;
  exhausted_ = false;
}

std::vector<std::span<const std::byte>>
Chunker::split(std::span<const std::byte> data, size_t chunkSize) {
  if (chunkSize == 0) {
    throwInvalidInput("Chunk size must be greater than zero");
  }
  std::vector<std::span<const std::byte>> out;
  out.reserve((data.size() + chunkSize - 1) / chunkSize);
  for (size_t pos = 0; pos < data.size(); pos += chunkSize) {
    out.push_back(data.subspan(pos, std::min(chunkSize, data.size() - pos)));
  }
  return out;
}

} // namespace distd
