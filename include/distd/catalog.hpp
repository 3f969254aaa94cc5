#ifndef DISTD_CATALOG_HPP
#define DISTD_CATALOG_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "distd/item_registry.hpp"

namespace distd {

/// One item as read back from a catalog file.
struct CatalogItem {
  std::string path;
  std::vector<ItemVersion> versions; ///< oldest first
};

/**
 * @brief Write every registered item with its retained versions to @p file.
 *
 * Trees are stored as wire payloads announcing @p chunkSizeFor(tree). The
 * file is written under a temporary name and renamed into place.
 * @throws distd::IoError if the file cannot be written.
 */
void saveCatalog(const ItemRegistry &registry,
                 const std::filesystem::path &file,
                 const std::function<uint64_t(const HashTree &)> &chunkSizeFor);

/**
 * @brief Read a file written by saveCatalog(). A missing file is empty.
 *
 * @throws distd::IoError if the file cannot be read.
 * @throws distd::InvalidInputError if the file is not a catalog.
 * @throws distd::InvariantViolationError if a stored tree fails its root
 *         check.
 */
std::vector<CatalogItem> loadCatalog(const std::filesystem::path &file);

} // namespace distd

#endif // DISTD_CATALOG_HPP
