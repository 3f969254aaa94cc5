#ifndef DISTD_MERKLE_TREE_HPP
#define DISTD_MERKLE_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "distd/digest.hpp"

namespace distd {

struct ChunkRef;
using ChunkRefPtr = std::shared_ptr<const ChunkRef>;

/**
 * @brief Node of a hash tree.
 *
 * A leaf covers one chunk (left and right are null). An internal node owns
 * two children and its hash is BLAKE3(left.hash || right.hash). Nodes are
 * immutable and may be shared between trees.
 */
struct ChunkRef {
  Hash hash{};
  uint64_t offset{0}; // first byte covered
  uint64_t size{0};   // bytes covered
  ChunkRefPtr left;
  ChunkRefPtr right;

  bool isLeaf() const { return !left && !right; }
};

/// Flattened view of one leaf.
struct LeafInfo {
  Hash hash{};
  uint64_t offset{0};
  uint64_t size{0};

  bool operator==(const LeafInfo &other) const = default;
};

/**
 * @brief Immutable binary merkle tree over an item's chunk sequence.
 */
class HashTree {
public:
  HashTree(ChunkRefPtr root, std::vector<LeafInfo> leaves);

  const Hash &rootHash() const { return root_->hash; }
  const ChunkRefPtr &root() const { return root_; }
  const std::vector<LeafInfo> &leaves() const { return leaves_; }
  const LeafInfo &leafAt(size_t index) const { return leaves_.at(index); }
  size_t leafCount() const { return leaves_.size(); }
  uint64_t totalSize() const { return root_->size; }

  /// Leaf hashes in order, repeated hashes included.
  std::vector<Hash> leafHashes() const;
  /// Unique leaf hashes.
  HashSet uniqueLeafHashes() const;
  /// Hashes of every node (leaves and internal nodes).
  HashSet allHashes() const;
  /// Height of the tree, a single leaf has depth 0.
  size_t depth() const;

  /**
   * @brief Recompute the root from the leaves and compare.
   * @throws distd::InvariantViolationError on mismatch.
   */
  void verify() const;

  /// Indented one-node-per-line dump for debugging.
  std::string dump() const;

  /// Equal when root hash and the ordered leaf list match.
  bool operator==(const HashTree &other) const;

private:
  ChunkRefPtr root_;
  std::vector<LeafInfo> leaves_;
};

class MerkleTree {
public:
  /// Leaf hash: BLAKE3 of the chunk bytes.
  static Hash hashChunk(std::span<const std::byte> data);

  /// Parent hash: BLAKE3 over the 64 byte concatenation of both children.
  static Hash mergeHashes(const Hash &left, const Hash &right);

  /**
   * @brief Root hash of a leaf sequence.
   *
   * Leaves are paired left to right; when a level has an odd number of
   * nodes the last one is promoted unchanged to the next level.
   *
   * @throws distd::InvalidInputError if @p leafHashes is empty.
   */
  static Hash computeRoot(const std::vector<Hash> &leafHashes);

  /**
   * @brief Build the full tree from (hash, size) leaves.
   *
   * Offsets are recomputed as the running sum of sizes. Uses the same
   * pairing rule as computeRoot().
   *
   * @throws distd::InvalidInputError if @p leaves is empty.
   */
  static HashTree build(const std::vector<LeafInfo> &leaves);

  /// Tree of the empty item: one zero-length leaf hashed as BLAKE3("").
  static HashTree emptyTree();
};

/**
 * @brief Accumulates leaves while an item is being chunked.
 */
class TreeBuilder {
public:
  /// Hash @p data and append it as the next leaf.
  const LeafInfo &addChunk(std::span<const std::byte> data);
  /// Append an already hashed leaf of @p size bytes.
  const LeafInfo &addLeaf(const Hash &hash, uint64_t size);

  size_t leafCount() const { return leaves_.size(); }
  uint64_t totalSize() const { return offset_; }
  const std::vector<LeafInfo> &leaves() const { return leaves_; }

  /// @throws distd::InvalidInputError if no leaf was added.
  HashTree finish() const;

private:
  std::vector<LeafInfo> leaves_;
  uint64_t offset_{0};
};

} // namespace distd

#endif // DISTD_MERKLE_TREE_HPP
