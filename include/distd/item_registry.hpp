#ifndef DISTD_ITEM_REGISTRY_HPP
#define DISTD_ITEM_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "distd/merkle_tree.hpp"

namespace distd {

using TreePtr = std::shared_ptr<const HashTree>;

/// One registered version of an item.
struct ItemVersion {
  uint32_t version{0};
  TreePtr tree;
  std::chrono::system_clock::time_point created;
};

/**
 * @brief Immutable view of an item at one point in time.
 *
 * Versions are ordered oldest first; the last one is current. A snapshot is
 * never modified after publication, so it can be read without locks.
 */
class Item {
public:
  Item(std::string path, std::vector<ItemVersion> versions);

  const std::string &path() const { return path_; }
  const std::vector<ItemVersion> &versions() const { return versions_; }
  const ItemVersion &current() const { return versions_.back(); }
  const Hash &rootHash() const { return current().tree->rootHash(); }
  uint32_t latestVersion() const { return current().version; }

  /// @throws distd::NotFoundError if @p version is not retained.
  const ItemVersion &version(uint32_t version) const;
  bool hasVersion(uint32_t version) const;

private:
  std::string path_;
  std::vector<ItemVersion> versions_;
};

using ItemPtr = std::shared_ptr<const Item>;

/**
 * @brief Lexically normalize an installation path.
 *
 * A leading '/' is kept, a trailing one dropped.
 * @throws distd::InvalidInputError for an empty path, "." or a path that
 *         still contains ".." after normalization.
 */
std::string normalizePath(const std::string &path);

/**
 * @brief Maps installation paths to their versioned hash trees.
 *
 * The path map is protected by a shared mutex that only guards its
 * structure. Each record carries its own mutex serializing registrations
 * for that path, and publishes a fresh Item snapshot on every change so
 * readers see either the old or the new version list.
 */
class ItemRegistry {
public:
  /// @param maxVersions retained versions per item, 0 keeps every version.
  explicit ItemRegistry(size_t maxVersions = 0);

  ItemRegistry(const ItemRegistry &) = delete;
  ItemRegistry &operator=(const ItemRegistry &) = delete;

  /**
   * @brief Register @p tree as the next version of @p path.
   *
   * The first version of a path is 0. When the retention limit is exceeded
   * the oldest versions are dropped and appended to @p dropped so the
   * caller can release their chunk references.
   *
   * @return The new version number.
   * @throws distd::InvalidInputError for an invalid path or null tree.
   */
  uint32_t registerTree(const std::string &path, TreePtr tree,
                        std::vector<TreePtr> *dropped = nullptr);

  /**
   * @brief Reinstate an item saved by an earlier process.
   *
   * Version numbers and creation times are kept; the next registration
   * continues after the last restored version. Meant for start-up, before
   * the registry is shared between threads.
   * @throws distd::InvalidInputError if @p path is already registered or
   *         @p versions is empty, holds a null tree or is not ascending.
   */
  void restore(const std::string &path, std::vector<ItemVersion> versions);

  /// @throws distd::NotFoundError if @p path is not registered.
  ItemPtr lookup(const std::string &path) const;

  /// @throws distd::NotFoundError if the path or the version is unknown.
  TreePtr lookupVersion(const std::string &path, uint32_t version) const;

  bool contains(const std::string &path) const;
  std::vector<std::string> paths() const;
  size_t size() const;

  /**
   * @brief Unregister @p path.
   * @return The removed item, whose trees the caller releases.
   * @throws distd::NotFoundError if @p path is not registered.
   */
  ItemPtr remove(const std::string &path);

  size_t maxVersions() const { return maxVersions_; }

private:
  struct Record {
    std::mutex writeMutex;
    mutable std::mutex snapshotMutex;
    ItemPtr snapshot; // null until the first registration completes
    uint32_t nextVersion{0};
    bool removed{false};

    ItemPtr load() const;
    void store(ItemPtr item);
  };

  std::shared_ptr<Record> findRecord(const std::string &normalized) const;

  size_t maxVersions_;
  mutable std::shared_mutex mapMutex_;
  std::unordered_map<std::string, std::shared_ptr<Record>> records_;
};

} // namespace distd

#endif // DISTD_ITEM_REGISTRY_HPP
