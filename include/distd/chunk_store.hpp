#ifndef DISTD_CHUNK_STORE_HPP
#define DISTD_CHUNK_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "distd/chunk_backend.hpp"
#include "distd/digest.hpp"

namespace distd {

/// What happens to a chunk once its last reference is released.
enum class RemovalPolicy {
  Immediate, ///< bytes removed from the backend right away
  Deferred   ///< chunk parked as PendingRemoval until collectGarbage()
};

RemovalPolicy parseRemovalPolicy(const std::string &name);

enum class ChunkState { Absent, Live, PendingRemoval };

/**
 * @brief Deduplicated, reference-counted chunk storage.
 *
 * Chunks are keyed by their BLAKE3 hash. Every insert() or acquire() adds
 * one reference, every release() drops one. Bookkeeping is split into
 * shards selected by hash, each guarded by its own mutex, so all operations
 * on one hash are linearizable while unrelated hashes proceed in parallel.
 */
class ChunkStore {
public:
  explicit ChunkStore(std::unique_ptr<ChunkBackend> backend =
                          std::make_unique<MemoryChunkBackend>(),
                      RemovalPolicy policy = RemovalPolicy::Immediate,
                      size_t shardCount = 16);

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  /**
   * @brief Add a reference to the chunk made of @p data, storing it if new.
   * @return The chunk hash.
   * @throws distd::IoError if the backend cannot persist the bytes.
   */
  Hash insert(std::span<const std::byte> data);

  /**
   * @brief Add a reference to a chunk that is already stored.
   *
   * Revives a chunk pending removal.
   * @throws distd::NotFoundError if the chunk is not stored.
   */
  void acquire(const Hash &hash);

  /**
   * @brief Drop one reference.
   * @throws distd::NotFoundError if the chunk is unknown.
   * @throws distd::ConcurrencyConflictError if the count is already zero.
   * @throws distd::IoError if the backend cannot delete the bytes; the
   *         chunk is then left PendingRemoval.
   */
  void release(const Hash &hash);

  /**
   * @brief Bytes of a live chunk.
   * @throws distd::NotFoundError if absent or pending removal.
   * @throws distd::InvariantViolationError if the backend returned bytes
   *         that do not hash to @p hash.
   */
  ChunkData get(const Hash &hash) const;

  bool contains(const Hash &hash) const;
  uint64_t refCount(const Hash &hash) const;
  ChunkState state(const Hash &hash) const;

  /// Hashes of live chunks.
  std::vector<Hash> hashes() const;

  struct Stats {
    size_t liveChunks{0};
    size_t pendingChunks{0};
    uint64_t storedBytes{0};
    uint64_t totalReferences{0};
  };
  Stats stats() const;

  struct GCStats {
    size_t totalChunks{0};
    size_t reclaimableChunks{0};
    size_t reclaimableBytes{0};
    size_t freedChunks{0};
    size_t freedBytes{0};
  };

  /**
   * @brief Remove chunks pending removal.
   *
   * With @p dryRun nothing is deleted but the statistics are still filled.
   */
  GCStats collectGarbage(bool dryRun = false);

  /**
   * @brief Adopt chunks already persisted by the backend.
   *
   * Adopted chunks start with no references (PendingRemoval) and become
   * live again when a tree that uses them acquires them.
   * @return Number of chunks adopted.
   */
  size_t recover();

  RemovalPolicy policy() const { return policy_; }
  const ChunkBackend &backend() const { return *backend_; }

private:
  struct Entry {
    uint64_t refs{0};
    uint64_t size{0};
    ChunkState state{ChunkState::Live};
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Hash, Entry, HashHasher> entries;
  };

  Shard &shardFor(const Hash &hash);
  const Shard &shardFor(const Hash &hash) const;

  std::unique_ptr<ChunkBackend> backend_;
  RemovalPolicy policy_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace distd

#endif // DISTD_CHUNK_STORE_HPP
