#ifndef DISTD_ENGINE_HPP
#define DISTD_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "distd/chunk_store.hpp"
#include "distd/config.hpp"
#include "distd/item_registry.hpp"

namespace distd {

/// Outcome of one ingestion.
struct IngestResult {
  bool cancelled{false};
  std::string path;   ///< normalized item path
  uint32_t version{0};
  TreePtr tree;       ///< null when cancelled
};

/// Chunks received from a provider, keyed by the hash they were sent under.
using ReceivedChunks =
    std::unordered_map<Hash, std::vector<std::byte>, HashHasher>;

/**
 * @brief Chunk store and item registry wired together.
 *
 * Every leaf of every retained tree holds exactly one reference in the
 * store. The engine takes those references when a tree is ingested or
 * installed and gives them back when versions are dropped or items removed.
 */
class DistributionEngine {
public:
  /**
   * @brief Build the backend and store described by @p config.
   *
   * With a persistent backend the chunks on disk are adopted by
   * ChunkStore::recover(), then the items saved in config.registryFile are
   * restored and their leaves acquired. Chunks no saved item uses stay
   * PendingRemoval until collectGarbage().
   */
  explicit DistributionEngine(const DistdConfig &config = DistdConfig::defaults());

  /// With a non-empty @p catalogFile the items saved there are restored,
  /// which needs their chunks already in @p store, and every registry change
  /// is saved back.
  DistributionEngine(std::unique_ptr<ChunkStore> store, size_t chunkSize,
                     size_t maxVersions = 0,
                     std::filesystem::path catalogFile = {});

  DistributionEngine(const DistributionEngine &) = delete;
  DistributionEngine &operator=(const DistributionEngine &) = delete;

  /**
   * @brief Chunk @p source, store the chunks and register the tree.
   *
   * @p cancel is checked between chunks. A cancelled or failed ingestion
   * releases every reference it took and registers nothing; cancellation
   * is reported through IngestResult::cancelled.
   *
   * @throws distd::InvalidInputError for an invalid path.
   * @throws distd::IoError if the source fails, or if the catalog cannot
   *         be saved; the item then stays registered in this process.
   */
  IngestResult ingest(const std::string &itemPath, std::istream &source,
                      const std::atomic<bool> *cancel = nullptr);

  /// @throws distd::NotFoundError if @p file does not exist.
  IngestResult ingestFile(const std::string &itemPath,
                          const std::filesystem::path &file,
                          const std::atomic<bool> *cancel = nullptr);

  /// ingestFile() on a worker thread. @p cancel must outlive the future.
  std::future<IngestResult>
  ingestFileAsync(const std::string &itemPath, std::filesystem::path file,
                  const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Register a tree received from a provider.
   *
   * Chunks in @p received are stored, leaves already held are acquired.
   * Nothing is kept if a leaf is neither received nor held.
   *
   * @return The version assigned locally.
   * @throws distd::NotFoundError naming the first unavailable leaf.
   * @throws distd::InvalidInputError if a received chunk does not hash to
   *         its key.
   */
  uint32_t installTree(const std::string &itemPath, const HashTree &tree,
                       const ReceivedChunks &received);

  /**
   * @brief Write the bytes of an item version (latest by default).
   * @throws distd::NotFoundError for an unknown path, version or chunk.
   * @throws distd::IoError if @p out fails.
   */
  void exportItem(const std::string &itemPath, std::ostream &out,
                  std::optional<uint32_t> version = std::nullopt) const;

  /// Unregister an item and release the references of all its versions.
  void removeItem(const std::string &itemPath);

  /// Chunk size field to announce for @p tree.
  uint64_t chunkSizeFor(const HashTree &tree) const;

  ChunkStore &store() { return *store_; }
  const ChunkStore &store() const { return *store_; }
  ItemRegistry &registry() { return registry_; }
  const ItemRegistry &registry() const { return registry_; }
  size_t chunkSize() const { return chunkSize_; }
  const std::filesystem::path &catalogFile() const { return catalogFile_; }

private:
  size_t restoreCatalog();
  void persistCatalog();
  uint32_t registerWithRetention(const std::string &path, TreePtr tree);
  void releaseAll(const std::vector<Hash> &taken);
  void releaseTree(const HashTree &tree);

  std::unique_ptr<ChunkStore> store_;
  ItemRegistry registry_;
  size_t chunkSize_;
  std::filesystem::path catalogFile_;
  std::mutex catalogMutex_;
};

} // namespace distd

#endif // DISTD_ENGINE_HPP
