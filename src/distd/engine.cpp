#include "distd/engine.hpp"
#include "distd/catalog.hpp"
#include "distd/chunker.hpp"
#include "distd/errors.hpp"
#include "distd/logger.h"
#include "distd/metrics.h"

#include <algorithm>
#include <chrono>
#include <fstream>

namespace distd {

DistributionEngine::DistributionEngine(const DistdConfig &config)
    : store_(std::make_unique<ChunkStore>(
          makeChunkBackend(config.storageBackend, config.storageRoot,
                           config.compressionLevel),
          config.removalPolicy, config.shards)),
      registry_(config.maxVersions), chunkSize_(config.chunkSize) {
  validateConfig(config);
  if (store_->backend().persistent()) {
    store_->recover();
    catalogFile_ = config.registryFile;
    restoreCatalog();
  }
}

DistributionEngine::DistributionEngine(std::unique_ptr<ChunkStore> store,
                                       size_t chunkSize, size_t maxVersions,
                                       std::filesystem::path catalogFile)
    : store_(std::move(store)), registry_(maxVersions), chunkSize_(chunkSize),
      catalogFile_(std::move(catalogFile)) {
  if (!store_) {
    throwInvalidInput("DistributionEngine needs a chunk store");
  }
  if (chunkSize_ == 0) {
    throwInvalidInput("Chunk size must be positive");
  }
  restoreCatalog();
}

size_t DistributionEngine::restoreCatalog() {
  if (catalogFile_.empty()) {
    return 0;
  }
  size_t restored = 0;
  bool dropped = false;
  for (CatalogItem &item : loadCatalog(catalogFile_)) {
    std::vector<ItemVersion> kept;
    for (ItemVersion &v : item.versions) {
      std::vector<Hash> taken;
      try {
        for (const auto &leaf : v.tree->leaves()) {
          store_->acquire(leaf.hash);
          taken.push_back(leaf.hash);
        }
      } catch (const NotFoundError &e) {
        releaseAll(taken);
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Dropping version " +
                                      std::to_string(v.version) + " of " +
                                      item.path + ": " + e.what());
        dropped = true;
        continue;
      }
      kept.push_back(std::move(v));
    }
    if (kept.empty()) {
      continue;
    }
    try {
      registry_.restore(item.path, kept);
    } catch (...) {
      for (const auto &v : kept)
        releaseTree(*v.tree);
      throw;
    }
    ++restored;
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Restored " + std::to_string(restored) +
                                " items from " + catalogFile_.string());
  if (dropped) {
    persistCatalog();
  }
  return restored;
}

void DistributionEngine::persistCatalog() {
  if (catalogFile_.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(catalogMutex_);
  saveCatalog(registry_, catalogFile_,
              [this](const HashTree &tree) { return chunkSizeFor(tree); });
}

void DistributionEngine::releaseAll(const std::vector<Hash> &taken) {
  for (const Hash &h : taken) {
    store_->release(h);
  }
}

void DistributionEngine::releaseTree(const HashTree &tree) {
  for (const auto &leaf : tree.leaves()) {
    store_->release(leaf.hash);
  }
}

uint32_t DistributionEngine::registerWithRetention(const std::string &path,
                                                   TreePtr tree) {
  std::vector<TreePtr> dropped;
  const uint32_t version = registry_.registerTree(path, std::move(tree), &dropped);
  for (const auto &old : dropped) {
    releaseTree(*old);
  }
  return version;
}

IngestResult DistributionEngine::ingest(const std::string &itemPath,
                                        std::istream &source,
                                        const std::atomic<bool> *cancel) {
  IngestResult result;
  result.path = normalizePath(itemPath);

  const auto start = std::chrono::steady_clock::now();
  Chunker chunker(source, chunkSize_);
  TreeBuilder builder;
  std::vector<Hash> taken;

  try {
    Chunk chunk;
    while (chunker.next(chunk)) {
      if (cancel && cancel->load()) {
        Logger::getInstance().log(
            LogLevel::INFO, "Ingestion of " + result.path +
                                " cancelled after " +
                                std::to_string(taken.size()) + " chunks");
        releaseAll(taken);
        result.cancelled = true;
        return result;
      }
      taken.push_back(store_->insert(chunk.data));
      builder.addLeaf(taken.back(), chunk.data.size());
    }
    if (cancel && cancel->load()) {
      releaseAll(taken);
      result.cancelled = true;
      return result;
    }
    if (builder.leafCount() == 0) {
      // The empty item is one zero-length chunk.
      taken.push_back(store_->insert({}));
      builder.addLeaf(taken.back(), 0);
    }

    auto tree = std::make_shared<const HashTree>(builder.finish());
    result.version = registerWithRetention(result.path, tree);
    result.tree = std::move(tree);
  } catch (...) {
    releaseAll(taken);
    throw;
  }

  persistCatalog();

  const double seconds = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - start)
                             .count();
  MetricsRegistry::instance().incrementCounter(
      "distd_ingested_bytes_total", static_cast<double>(result.tree->totalSize()));
  MetricsRegistry::instance().observe("distd_ingest_seconds", seconds);
  Logger::getInstance().log(
      LogLevel::INFO, "Ingested " + result.path + " v" +
                          std::to_string(result.version) + ": " +
                          std::to_string(result.tree->totalSize()) +
                          " bytes in " +
                          std::to_string(result.tree->leafCount()) + " chunks");
  return result;
}

IngestResult DistributionEngine::ingestFile(const std::string &itemPath,
                                            const std::filesystem::path &file,
                                            const std::atomic<bool> *cancel) {
  if (!std::filesystem::is_regular_file(file)) {
    throwNotFound("No regular file at " + file.string());
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throwIoFailure("Cannot open " + file.string());
  }
  return ingest(itemPath, in, cancel);
}

std::future<IngestResult>
DistributionEngine::ingestFileAsync(const std::string &itemPath,
                                    std::filesystem::path file,
                                    const std::atomic<bool> *cancel) {
  return std::async(std::launch::async,
                    [this, itemPath, file = std::move(file), cancel] {
                      return ingestFile(itemPath, file, cancel);
                    });
}

uint32_t DistributionEngine::installTree(const std::string &itemPath,
                                         const HashTree &tree,
                                         const ReceivedChunks &received) {
  const std::string path = normalizePath(itemPath);
  std::vector<Hash> taken;
  taken.reserve(tree.leafCount());
  uint32_t version = 0;

  try {
    for (const auto &leaf : tree.leaves()) {
      auto it = received.find(leaf.hash);
      if (it != received.end()) {
        if (it->second.size() != leaf.size) {
          throwInvalidInput("Received chunk " + toHex(leaf.hash) + " has " +
                            std::to_string(it->second.size()) +
                            " bytes, tree says " + std::to_string(leaf.size));
        }
        const Hash stored = store_->insert(it->second);
        taken.push_back(stored);
        if (stored != leaf.hash) {
          throwInvalidInput("Received chunk announced as " + toHex(leaf.hash) +
                            " hashes to " + toHex(stored));
        }
      } else if (store_->state(leaf.hash) != ChunkState::Absent) {
        store_->acquire(leaf.hash);
        taken.push_back(leaf.hash);
      } else {
        throwNotFound("Chunk " + toHex(leaf.hash) + " of " + path +
                      " was neither received nor held");
      }
    }
    version = registerWithRetention(path, std::make_shared<const HashTree>(tree));
  } catch (...) {
    releaseAll(taken);
    throw;
  }
  persistCatalog();
  return version;
}

void DistributionEngine::exportItem(const std::string &itemPath,
                                    std::ostream &out,
                                    std::optional<uint32_t> version) const {
  const TreePtr tree = version ? registry_.lookupVersion(itemPath, *version)
                               : registry_.lookup(itemPath)->current().tree;
  for (const auto &leaf : tree->leaves()) {
    ChunkData data = store_->get(leaf.hash);
    if (data->size() != leaf.size) {
      throwError(ErrorKind::InvariantViolation,
                 "Chunk " + toHex(leaf.hash) + " has " +
                     std::to_string(data->size()) + " bytes, tree says " +
                     std::to_string(leaf.size));
    }
    out.write(reinterpret_cast<const char *>(data->data()),
              static_cast<std::streamsize>(data->size()));
    if (!out) {
      throwIoFailure("Failed writing " + itemPath + " at offset " +
                     std::to_string(leaf.offset));
    }
  }
}

void DistributionEngine::removeItem(const std::string &itemPath) {
  ItemPtr item = registry_.remove(itemPath);
  for (const auto &v : item->versions()) {
    releaseTree(*v.tree);
  }
  persistCatalog();
}

uint64_t DistributionEngine::chunkSizeFor(const HashTree &tree) const {
  uint64_t largest = 0;
  for (const auto &leaf : tree.leaves())
    largest = std::max(largest, leaf.size);
  return std::max<uint64_t>(chunkSize_, largest);
}

} // namespace distd
