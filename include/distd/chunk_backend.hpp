#ifndef DISTD_CHUNK_BACKEND_HPP
#define DISTD_CHUNK_BACKEND_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "distd/digest.hpp"

namespace distd {

/// Immutable chunk bytes shared between the store and its readers.
using ChunkData = std::shared_ptr<const std::vector<std::byte>>;

/**
 * @brief Byte persistence behind the ChunkStore.
 *
 * Backends only move bytes; reference counting and removal policy live in
 * ChunkStore, which serializes calls for a given hash. Implementations must
 * still be safe for concurrent calls on different hashes.
 */
class ChunkBackend {
public:
  virtual ~ChunkBackend() = default;

  virtual void put(const Hash &hash, std::span<const std::byte> data) = 0;
  /// @throws distd::NotFoundError if the chunk is absent.
  /// @throws distd::InvariantViolationError if stored bytes cannot be decoded.
  virtual ChunkData get(const Hash &hash) const = 0;
  virtual void remove(const Hash &hash) = 0;
  virtual bool contains(const Hash &hash) const = 0;
  /// Every hash currently persisted.
  virtual std::vector<Hash> list() const = 0;
  virtual std::string name() const = 0;
  /// Persistent backends may hand back bytes altered outside the process.
  virtual bool persistent() const { return false; }
};

/**
 * @brief Chunks kept in process memory.
 */
class MemoryChunkBackend : public ChunkBackend {
public:
  void put(const Hash &hash, std::span<const std::byte> data) override;
  ChunkData get(const Hash &hash) const override;
  void remove(const Hash &hash) override;
  bool contains(const Hash &hash) const override;
  std::vector<Hash> list() const override;
  std::string name() const override { return "memory"; }

private:
  mutable std::mutex mutex_;
  std::unordered_map<Hash, ChunkData, HashHasher> chunks_;
};

/**
 * @brief One file per chunk under a root directory.
 *
 * Layout: <root>/<first two hex chars>/<full hex hash>. Files are written to
 * a temporary name and renamed into place so a crash never leaves a
 * truncated chunk under its final name. With a compression level above zero
 * the file content is a zstd frame.
 */
class FileChunkBackend : public ChunkBackend {
public:
  /// @throws distd::IoError if @p root cannot be created.
  explicit FileChunkBackend(std::filesystem::path root,
                            int compressionLevel = 0);

  void put(const Hash &hash, std::span<const std::byte> data) override;
  ChunkData get(const Hash &hash) const override;
  void remove(const Hash &hash) override;
  bool contains(const Hash &hash) const override;
  std::vector<Hash> list() const override;
  std::string name() const override { return "filesystem"; }
  bool persistent() const override { return true; }

  const std::filesystem::path &root() const { return root_; }
  std::filesystem::path pathFor(const Hash &hash) const;

private:
  std::filesystem::path root_;
  int compressionLevel_;
};

/// Build a backend from its configuration name ("memory" or "filesystem").
std::unique_ptr<ChunkBackend> makeChunkBackend(const std::string &kind,
                                               const std::string &root,
                                               int compressionLevel);

} // namespace distd

#endif // DISTD_CHUNK_BACKEND_HPP
