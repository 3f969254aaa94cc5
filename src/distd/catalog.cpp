#include "distd/catalog.hpp"
#include "distd/errors.hpp"
#include "distd/logger.h"
#include "distd/wire_codec.hpp"
#include "proto/distd.pb.h"

#include <atomic>
#include <chrono>
#include <fstream>
#include <span>
#include <system_error>

namespace fs = std::filesystem;

namespace distd {

namespace {

constexpr uint32_t CATALOG_FORMAT = 1;

int64_t toUnixMs(std::chrono::system_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

std::chrono::system_clock::time_point fromUnixMs(int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms)));
}

} // namespace

void saveCatalog(const ItemRegistry &registry, const fs::path &file,
                 const std::function<uint64_t(const HashTree &)> &chunkSizeFor) {
  proto::Catalog catalog;
  catalog.set_format(CATALOG_FORMAT);
  for (const std::string &path : registry.paths()) {
    ItemPtr item;
    try {
      item = registry.lookup(path);
    } catch (const NotFoundError &) {
      continue; // removed since paths() was taken
    }
    proto::StoredItem *stored = catalog.add_items();
    stored->set_path(item->path());
    for (const ItemVersion &v : item->versions()) {
      proto::StoredVersion *sv = stored->add_versions();
      sv->set_version(v.version);
      sv->set_created_unix_ms(toUnixMs(v.created));
      std::vector<std::byte> payload =
          WireCodec::serializeTree(*v.tree, chunkSizeFor(*v.tree));
      sv->set_tree(reinterpret_cast<const char *>(payload.data()),
                   payload.size());
    }
  }

  std::error_code ec;
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
      throwIoFailure("Cannot create " + file.parent_path().string() + ": " +
                     ec.message());
    }
  }
  static std::atomic<uint64_t> tmpCounter{0};
  fs::path tmp = file;
  tmp += ".tmp." + std::to_string(tmpCounter.fetch_add(1));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throwIoFailure("Cannot open " + tmp.string() + " for writing");
    }
    if (!catalog.SerializeToOstream(&out) || !out.flush()) {
      out.close();
      fs::remove(tmp, ec);
      throwIoFailure("Short write to " + tmp.string());
    }
  }
  fs::rename(tmp, file, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throwIoFailure("Cannot move catalog into place at " + file.string() +
                   ": " + ec.message());
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Saved " + std::to_string(catalog.items_size()) +
                                " items to " + file.string());
}

std::vector<CatalogItem> loadCatalog(const fs::path &file) {
  std::vector<CatalogItem> out;
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    return out;
  }
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    throwIoFailure("Cannot open catalog " + file.string());
  }
  proto::Catalog catalog;
  if (!catalog.ParseFromIstream(&in)) {
    if (in.bad()) {
      throwIoFailure("Read failure on catalog " + file.string());
    }
    throwInvalidInput(file.string() + " is not an item catalog");
  }
  if (catalog.format() != CATALOG_FORMAT) {
    throwInvalidInput("Unsupported catalog format " +
                      std::to_string(catalog.format()) + " in " +
                      file.string());
  }

  out.reserve(static_cast<size_t>(catalog.items_size()));
  for (const proto::StoredItem &stored : catalog.items()) {
    CatalogItem item;
    item.path = stored.path();
    for (const proto::StoredVersion &sv : stored.versions()) {
      const std::string &raw = sv.tree();
      std::span<const std::byte> payload(
          reinterpret_cast<const std::byte *>(raw.data()), raw.size());
      item.versions.push_back(
          ItemVersion{sv.version(),
                      std::make_shared<const HashTree>(
                          WireCodec::deserializeTree(payload)),
                      fromUnixMs(sv.created_unix_ms())});
    }
    out.push_back(std::move(item));
  }
  return out;
}

} // namespace distd
