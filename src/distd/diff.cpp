#include "distd/diff.hpp"
#include "distd/logger.h"

namespace distd {

std::vector<Hash> diffLeaves(const HashTree &tree, const HashSet &known) {
  std::vector<Hash> missing;
  if (known.count(tree.rootHash()) > 0)
    return missing;
  for (const auto &leaf : tree.leaves()) {
    if (known.count(leaf.hash) == 0)
      missing.push_back(leaf.hash);
  }
  return missing;
}

TransferPlan::TransferPlan(Hash rootHash, std::vector<TransferEntry> entries)
    : rootHash_(rootHash), entries_(std::move(entries)) {}

uint64_t TransferPlan::missingBytes() const {
  uint64_t total = 0;
  for (const auto &e : entries_)
    total += e.leaf.size;
  return total;
}

std::vector<Hash> TransferPlan::uniqueHashes() const {
  std::vector<Hash> out;
  HashSet seen;
  for (const auto &e : entries_) {
    if (seen.insert(e.leaf.hash).second)
      out.push_back(e.leaf.hash);
  }
  return out;
}

TransferPlan planTransfer(const HashTree &tree, const HashSet &known,
                          const std::optional<Hash> &requesterRoot) {
  const Hash &root = tree.rootHash();
  if ((requesterRoot && *requesterRoot == root) || known.count(root) > 0) {
    return TransferPlan(root, {});
  }

  std::vector<TransferEntry> entries;
  const auto &leaves = tree.leaves();
  for (size_t i = 0; i < leaves.size(); ++i) {
    if (known.count(leaves[i].hash) == 0)
      entries.push_back(TransferEntry{i, leaves[i]});
  }
  Logger::trace("Transfer plan for %s: %zu of %zu leaves missing",
                shortHex(root).c_str(), entries.size(), leaves.size());
  return TransferPlan(root, std::move(entries));
}

} // namespace distd
