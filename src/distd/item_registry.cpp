#include "distd/item_registry.hpp"
#include "distd/errors.hpp"
#include "distd/logger.h"

#include <algorithm>
#include <filesystem>

namespace distd {

Item::Item(std::string path, std::vector<ItemVersion> versions)
    : path_(std::move(path)), versions_(std::move(versions)) {
  if (versions_.empty()) {
    throwError(ErrorKind::InvariantViolation,
               "Item " + path_ + " has no version");
  }
}

const ItemVersion &Item::version(uint32_t version) const {
  for (const auto &v : versions_) {
    if (v.version == version)
      return v;
  }
  throwNotFound("Version " + std::to_string(version) + " of " + path_ +
                " is not retained");
}

bool Item::hasVersion(uint32_t version) const {
  return std::any_of(versions_.begin(), versions_.end(),
                     [version](const ItemVersion &v) {
                       return v.version == version;
                     });
}

std::string normalizePath(const std::string &path) {
  if (path.empty()) {
    throwInvalidInput("Item path is empty");
  }
  std::string normal = std::filesystem::path(path).lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  if (normal.empty() || normal == ".") {
    throwInvalidInput("Item path '" + path + "' names no item");
  }
  for (const auto &part : std::filesystem::path(normal)) {
    if (part == "..") {
      throwInvalidInput("Item path '" + path + "' escapes its root");
    }
  }
  return normal;
}

ItemPtr ItemRegistry::Record::load() const {
  std::lock_guard<std::mutex> lock(snapshotMutex);
  return snapshot;
}

void ItemRegistry::Record::store(ItemPtr item) {
  std::lock_guard<std::mutex> lock(snapshotMutex);
  snapshot = std::move(item);
}

ItemRegistry::ItemRegistry(size_t maxVersions) : maxVersions_(maxVersions) {}

std::shared_ptr<ItemRegistry::Record>
ItemRegistry::findRecord(const std::string &normalized) const {
  std::shared_lock<std::shared_mutex> lock(mapMutex_);
  auto it = records_.find(normalized);
  return it == records_.end() ? nullptr : it->second;
}

uint32_t ItemRegistry::registerTree(const std::string &path, TreePtr tree,
                                    std::vector<TreePtr> *dropped) {
  if (!tree) {
    throwInvalidInput("Cannot register a null tree for " + path);
  }
  const std::string key = normalizePath(path);

  for (;;) {
    std::shared_ptr<Record> record = findRecord(key);
    if (!record) {
      std::unique_lock<std::shared_mutex> lock(mapMutex_);
      auto &slot = records_[key];
      if (!slot)
        slot = std::make_shared<Record>();
      record = slot;
    }

    std::lock_guard<std::mutex> writeGuard(record->writeMutex);
    if (record->removed) {
      // Lost a race with remove(); the path gets a fresh record.
      continue;
    }

    std::vector<ItemVersion> versions;
    if (ItemPtr current = record->load()) {
      versions = current->versions();
    }
    const uint32_t version = record->nextVersion++;
    versions.push_back(
        ItemVersion{version, std::move(tree), std::chrono::system_clock::now()});

    if (maxVersions_ > 0 && versions.size() > maxVersions_) {
      const size_t excess = versions.size() - maxVersions_;
      for (size_t i = 0; i < excess; ++i) {
        Logger::getInstance().log(
            LogLevel::DEBUG, "[ItemRegistry] Dropping version " +
                                 std::to_string(versions[i].version) + " of " +
                                 key);
        if (dropped)
          dropped->push_back(versions[i].tree);
      }
      versions.erase(versions.begin(),
                     versions.begin() + static_cast<std::ptrdiff_t>(excess));
    }

    auto item = std::make_shared<const Item>(key, std::move(versions));
    Logger::getInstance().log(LogLevel::INFO,
                              "[ItemRegistry] Registered " + key + " v" +
                                  std::to_string(version) + " root " +
                                  shortHex(item->rootHash()));
    record->store(std::move(item));
    return version;
  }
}

void ItemRegistry::restore(const std::string &path,
                           std::vector<ItemVersion> versions) {
  const std::string key = normalizePath(path);
  if (versions.empty()) {
    throwInvalidInput("No version to restore for " + key);
  }
  for (size_t i = 0; i < versions.size(); ++i) {
    if (!versions[i].tree) {
      throwInvalidInput("Cannot restore a null tree for " + key);
    }
    if (i > 0 && versions[i].version <= versions[i - 1].version) {
      throwInvalidInput("Versions of " + key + " are not ascending");
    }
  }

  auto record = std::make_shared<Record>();
  record->nextVersion = versions.back().version + 1;
  record->store(std::make_shared<const Item>(key, std::move(versions)));

  std::unique_lock<std::shared_mutex> lock(mapMutex_);
  auto &slot = records_[key];
  if (slot && slot->load()) {
    throwInvalidInput("Item " + key + " is already registered");
  }
  slot = std::move(record);
  Logger::getInstance().log(LogLevel::DEBUG, "[ItemRegistry] Restored " + key);
}

ItemPtr ItemRegistry::lookup(const std::string &path) const {
  const std::string key = normalizePath(path);
  std::shared_ptr<Record> record = findRecord(key);
  ItemPtr item = record ? record->load() : nullptr;
  if (!item) {
    throwNotFound("Item " + key + " is not registered");
  }
  return item;
}

TreePtr ItemRegistry::lookupVersion(const std::string &path,
                                    uint32_t version) const {
  return lookup(path)->version(version).tree;
}

bool ItemRegistry::contains(const std::string &path) const {
  std::shared_ptr<Record> record = findRecord(normalizePath(path));
  return record && record->load() != nullptr;
}

std::vector<std::string> ItemRegistry::paths() const {
  std::vector<std::string> out;
  {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    for (const auto &kv : records_) {
      if (kv.second->load())
        out.push_back(kv.first);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

size_t ItemRegistry::size() const { return paths().size(); }

ItemPtr ItemRegistry::remove(const std::string &path) {
  const std::string key = normalizePath(path);
  std::shared_ptr<Record> record;
  {
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto it = records_.find(key);
    if (it == records_.end() || !it->second->load()) {
      throwNotFound("Item " + key + " is not registered");
    }
    record = it->second;
    records_.erase(it);
  }

  std::lock_guard<std::mutex> writeGuard(record->writeMutex);
  record->removed = true;
  ItemPtr item = record->load();
  record->store(nullptr);
  Logger::getInstance().log(LogLevel::INFO,
                            "[ItemRegistry] Removed " + key + " (" +
                                std::to_string(item->versions().size()) +
                                " versions)");
  return item;
}

} // namespace distd
