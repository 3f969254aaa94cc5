#include "distd/chunk_store.hpp"
#include "distd/blockio.hpp"
#include "distd/errors.hpp"
#include "distd/logger.h"
#include "distd/metrics.h"

namespace distd {

namespace {
const char *const kInserted = "distd_chunks_inserted_total";
const char *const kDeduplicated = "distd_chunks_deduplicated_total";
const char *const kReleased = "distd_chunks_released_total";
const char *const kRemoved = "distd_chunks_removed_total";
const char *const kStoredBytes = "distd_chunk_store_bytes";
} // namespace

RemovalPolicy parseRemovalPolicy(const std::string &name) {
  if (name == "immediate")
    return RemovalPolicy::Immediate;
  if (name == "deferred")
    return RemovalPolicy::Deferred;
  throwInvalidInput("Unknown removal policy '" + name +
                    "', expected 'immediate' or 'deferred'");
}

ChunkStore::ChunkStore(std::unique_ptr<ChunkBackend> backend,
                       RemovalPolicy policy, size_t shardCount)
    : backend_(std::move(backend)), policy_(policy) {
  if (!backend_) {
    throwInvalidInput("ChunkStore needs a backend");
  }
  if (shardCount == 0) {
    throwInvalidInput("ChunkStore needs at least one shard");
  }
  shards_.reserve(shardCount);
  for (size_t i = 0; i < shardCount; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

ChunkStore::Shard &ChunkStore::shardFor(const Hash &hash) {
  return *shards_[HashHasher{}(hash) % shards_.size()];
}

const ChunkStore::Shard &ChunkStore::shardFor(const Hash &hash) const {
  return *shards_[HashHasher{}(hash) % shards_.size()];
}

Hash ChunkStore::insert(std::span<const std::byte> data) {
  // Hashing is the expensive part and needs no lock.
  const Hash hash = BlockIO::hash(data);

  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it != shard.entries.end()) {
    Entry &entry = it->second;
    if (entry.state == ChunkState::PendingRemoval) {
      Logger::trace("Reviving chunk %s", shortHex(hash).c_str());
      entry.state = ChunkState::Live;
    }
    ++entry.refs;
    MetricsRegistry::instance().incrementCounter(kDeduplicated);
    return hash;
  }

  backend_->put(hash, data);
  shard.entries.emplace(hash, Entry{1, data.size(), ChunkState::Live});
  MetricsRegistry::instance().incrementCounter(kInserted);
  MetricsRegistry::instance().addGauge(kStoredBytes,
                                       static_cast<double>(data.size()));
  return hash;
}

void ChunkStore::acquire(const Hash &hash) {
  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it == shard.entries.end()) {
    throwNotFound("Cannot acquire unknown chunk " + toHex(hash));
  }
  it->second.state = ChunkState::Live;
  ++it->second.refs;
}

void ChunkStore::release(const Hash &hash) {
  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it == shard.entries.end()) {
    throwNotFound("Cannot release unknown chunk " + toHex(hash));
  }
  Entry &entry = it->second;
  if (entry.refs == 0) {
    throwError(ErrorKind::ConcurrencyConflict,
               "Reference count underflow on chunk " + toHex(hash));
  }

  --entry.refs;
  MetricsRegistry::instance().incrementCounter(kReleased);
  if (entry.refs > 0) {
    return;
  }

  entry.state = ChunkState::PendingRemoval;
  if (policy_ == RemovalPolicy::Deferred) {
    return;
  }

  // A failed removal leaves the chunk pending for collectGarbage().
  const uint64_t size = entry.size;
  backend_->remove(hash);
  shard.entries.erase(it);
  MetricsRegistry::instance().incrementCounter(kRemoved);
  MetricsRegistry::instance().addGauge(kStoredBytes,
                                       -static_cast<double>(size));
}

ChunkData ChunkStore::get(const Hash &hash) const {
  const Shard &shard = shardFor(hash);
  ChunkData data;
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(hash);
    if (it == shard.entries.end() ||
        it->second.state != ChunkState::Live) {
      throwNotFound("Chunk " + toHex(hash) + " is not stored");
    }
    data = backend_->get(hash);
  }

  if (backend_->persistent() && !digestEquals(BlockIO::hash(*data), hash)) {
    throwError(ErrorKind::InvariantViolation,
               "Chunk " + toHex(hash) + " is corrupted in the " +
                   backend_->name() + " backend");
  }
  return data;
}

bool ChunkStore::contains(const Hash &hash) const {
  return state(hash) == ChunkState::Live;
}

uint64_t ChunkStore::refCount(const Hash &hash) const {
  const Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  return it == shard.entries.end() ? 0 : it->second.refs;
}

ChunkState ChunkStore::state(const Hash &hash) const {
  const Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  return it == shard.entries.end() ? ChunkState::Absent : it->second.state;
}

std::vector<Hash> ChunkStore::hashes() const {
  std::vector<Hash> out;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto &kv : shard->entries) {
      if (kv.second.state == ChunkState::Live)
        out.push_back(kv.first);
    }
  }
  return out;
}

ChunkStore::Stats ChunkStore::stats() const {
  Stats s;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto &kv : shard->entries) {
      if (kv.second.state == ChunkState::Live)
        ++s.liveChunks;
      else
        ++s.pendingChunks;
      s.storedBytes += kv.second.size;
      s.totalReferences += kv.second.refs;
    }
  }
  return s;
}

ChunkStore::GCStats ChunkStore::collectGarbage(bool dryRun) {
  GCStats stats{};
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    stats.totalChunks += shard->entries.size();
    for (auto it = shard->entries.begin(); it != shard->entries.end();) {
      if (it->second.state != ChunkState::PendingRemoval) {
        ++it;
        continue;
      }
      stats.reclaimableChunks++;
      stats.reclaimableBytes += it->second.size;
      if (dryRun) {
        ++it;
        continue;
      }
      backend_->remove(it->first);
      stats.freedChunks++;
      stats.freedBytes += it->second.size;
      MetricsRegistry::instance().incrementCounter(kRemoved);
      MetricsRegistry::instance().addGauge(
          kStoredBytes, -static_cast<double>(it->second.size));
      it = shard->entries.erase(it);
    }
  }
  Logger::getInstance().log(
      LogLevel::INFO, std::string(dryRun ? "GC dry run: " : "GC: ") +
                          std::to_string(stats.reclaimableChunks) + "/" +
                          std::to_string(stats.totalChunks) +
                          " chunks reclaimable, " +
                          std::to_string(stats.freedBytes) + " bytes freed");
  return stats;
}

size_t ChunkStore::recover() {
  size_t adopted = 0;
  for (const Hash &hash : backend_->list()) {
    Shard &shard = shardFor(hash);
    std::lock_guard<std::mutex> lock(shard.mutex);
    if (shard.entries.count(hash) > 0)
      continue;
    ChunkData data;
    try {
      data = backend_->get(hash);
    } catch (const InvariantViolationError &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Dropping chunk " + toHex(hash) +
                                    " found during recovery: " + e.what());
      backend_->remove(hash);
      continue;
    } catch (const NotFoundError &) {
      continue; // removed while listing
    }
    if (!digestEquals(BlockIO::hash(*data), hash)) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Dropping corrupted chunk " + toHex(hash) +
                                    " found during recovery");
      backend_->remove(hash);
      continue;
    }
    shard.entries.emplace(
        hash, Entry{0, data->size(), ChunkState::PendingRemoval});
    MetricsRegistry::instance().addGauge(kStoredBytes,
                                         static_cast<double>(data->size()));
    ++adopted;
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Recovered " + std::to_string(adopted) +
                                " chunks from the " + backend_->name() +
                                " backend");
  return adopted;
}

} // namespace distd
