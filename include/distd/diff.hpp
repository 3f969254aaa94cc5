#ifndef DISTD_DIFF_HPP
#define DISTD_DIFF_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "distd/merkle_tree.hpp"

namespace distd {

/**
 * @brief Leaf hashes of @p tree that are not in @p known, in leaf order.
 *
 * A hash repeated in the tree is listed at each position. Returns nothing
 * when @p known already holds the root hash.
 */
std::vector<Hash> diffLeaves(const HashTree &tree, const HashSet &known);

/// One chunk the requester has to fetch.
struct TransferEntry {
  size_t index{0}; ///< leaf index in the tree
  LeafInfo leaf;
};

/**
 * @brief Ordered list of leaves to send for one tree.
 */
class TransferPlan {
public:
  TransferPlan() = default;
  TransferPlan(Hash rootHash, std::vector<TransferEntry> entries);

  const Hash &rootHash() const { return rootHash_; }
  const std::vector<TransferEntry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool upToDate() const { return entries_.empty(); }

  /// Sum of the sizes of every entry, repeated leaves counted each time.
  uint64_t missingBytes() const;
  /// Missing hashes without repetition, in first-occurrence order.
  std::vector<Hash> uniqueHashes() const;

private:
  Hash rootHash_{};
  std::vector<TransferEntry> entries_;
};

/**
 * @brief Plan the transfer of @p tree to a peer holding @p known.
 *
 * When @p requesterRoot equals the tree root, or the root is in @p known,
 * the plan is empty. Otherwise every leaf whose hash is not known is listed
 * in leaf order.
 */
TransferPlan planTransfer(const HashTree &tree, const HashSet &known,
                          const std::optional<Hash> &requesterRoot = std::nullopt);

} // namespace distd

#endif // DISTD_DIFF_HPP
