#include "distd/chunk_backend.hpp"
#include "distd/blockio.hpp"
#include "distd/errors.hpp"
#include "distd/logger.h"

#include <atomic>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace distd {

// ---------------------------------------------------------------------------
// MemoryChunkBackend
// ---------------------------------------------------------------------------

void MemoryChunkBackend::put(const Hash &hash,
                             std::span<const std::byte> data) {
  auto bytes =
      std::make_shared<const std::vector<std::byte>>(data.begin(), data.end());
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.emplace(hash, std::move(bytes));
}

ChunkData MemoryChunkBackend::get(const Hash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(hash);
  if (it == chunks_.end()) {
    throwNotFound("Chunk " + toHex(hash) + " not in memory backend");
  }
  return it->second;
}

void MemoryChunkBackend::remove(const Hash &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.erase(hash);
}

bool MemoryChunkBackend::contains(const Hash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(hash) > 0;
}

std::vector<Hash> MemoryChunkBackend::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Hash> out;
  out.reserve(chunks_.size());
  for (const auto &kv : chunks_) {
    out.push_back(kv.first);
  }
  return out;
}

// ---------------------------------------------------------------------------
// FileChunkBackend
// ---------------------------------------------------------------------------

FileChunkBackend::FileChunkBackend(fs::path root, int compressionLevel)
    : root_(std::move(root)), compressionLevel_(compressionLevel) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throwIoFailure("Cannot create chunk directory " + root_.string() + ": " +
                   ec.message());
  }
}

fs::path FileChunkBackend::pathFor(const Hash &hash) const {
  std::string hex = toHex(hash);
  return root_ / hex.substr(0, 2) / hex;
}

void FileChunkBackend::put(const Hash &hash, std::span<const std::byte> data) {
  fs::path target = pathFor(hash);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throwIoFailure("Cannot create " + target.parent_path().string() + ": " +
                   ec.message());
  }

  std::vector<std::byte> encoded;
  std::span<const std::byte> payload = data;
  if (compressionLevel_ > 0) {
    BlockIO bio(compressionLevel_, false);
    encoded = bio.compress_data(data);
    payload = encoded;
  }

  static std::atomic<uint64_t> tmpCounter{0};
  fs::path tmp = target;
  tmp += ".tmp." + std::to_string(tmpCounter.fetch_add(1)) + "." +
         std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throwIoFailure("Cannot open " + tmp.string() + " for writing");
    }
    out.write(reinterpret_cast<const char *>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      throwIoFailure("Short write to " + tmp.string());
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throwIoFailure("Cannot move chunk into place at " + target.string() + ": " +
                   ec.message());
  }
}

ChunkData FileChunkBackend::get(const Hash &hash) const {
  fs::path path = pathFor(hash);
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      throwNotFound("Chunk " + toHex(hash) + " not on disk");
    }
    throwIoFailure("Cannot open chunk file " + path.string());
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad()) {
    throwIoFailure("Read failure on chunk file " + path.string());
  }
  std::span<const std::byte> bytes(reinterpret_cast<const std::byte *>(raw.data()),
                                   raw.size());
  if (compressionLevel_ > 0) {
    BlockIO bio(compressionLevel_, false);
    try {
      return std::make_shared<const std::vector<std::byte>>(
          bio.decompress_data(bytes));
    } catch (const InvalidInputError &e) {
      throwError(ErrorKind::InvariantViolation,
                 "Chunk file " + path.string() + " is corrupted: " + e.what());
    }
  }
  return std::make_shared<const std::vector<std::byte>>(bytes.begin(),
                                                        bytes.end());
}

void FileChunkBackend::remove(const Hash &hash) {
  std::error_code ec;
  fs::remove(pathFor(hash), ec);
  if (ec) {
    throwIoFailure("Cannot remove chunk " + toHex(hash) + ": " + ec.message());
  }
}

bool FileChunkBackend::contains(const Hash &hash) const {
  std::error_code ec;
  return fs::is_regular_file(pathFor(hash), ec);
}

std::vector<Hash> FileChunkBackend::list() const {
  std::vector<Hash> out;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file())
      continue;
    std::string name = it->path().filename().string();
    if (name.size() != DIGEST_SIZE * 2)
      continue; // temp files and strays
    try {
      out.push_back(hashFromHex(name));
    } catch (const InvalidInputError &) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Ignoring stray file in chunk directory: " +
                                    it->path().string());
    }
  }
  if (ec) {
    throwIoFailure("Cannot list chunk directory " + root_.string() + ": " +
                   ec.message());
  }
  return out;
}

std::unique_ptr<ChunkBackend> makeChunkBackend(const std::string &kind,
                                               const std::string &root,
                                               int compressionLevel) {
  if (kind == "memory") {
    return std::make_unique<MemoryChunkBackend>();
  }
  if (kind == "filesystem") {
    if (root.empty()) {
      throwInvalidInput("The filesystem chunk backend needs a root directory");
    }
    return std::make_unique<FileChunkBackend>(root, compressionLevel);
  }
  throwInvalidInput("Unknown chunk backend '" + kind + "'");
}

} // namespace distd
