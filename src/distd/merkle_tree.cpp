#include "distd/merkle_tree.hpp"
#include "distd/blockio.hpp"
#include "distd/errors.hpp"

#include <algorithm>
#include <functional>
#include <sstream>

namespace distd {

// ---------------------------------------------------------------------------
// HashTree
// ---------------------------------------------------------------------------

HashTree::HashTree(ChunkRefPtr root, std::vector<LeafInfo> leaves)
    : root_(std::move(root)), leaves_(std::move(leaves)) {
  if (!root_ || leaves_.empty()) {
    throwInvalidInput("A hash tree needs a root and at least one leaf");
  }
}

std::vector<Hash> HashTree::leafHashes() const {
  std::vector<Hash> out;
  out.reserve(leaves_.size());
  for (const auto &leaf : leaves_) {
    out.push_back(leaf.hash);
  }
  return out;
}

HashSet HashTree::uniqueLeafHashes() const {
  HashSet out;
  out.reserve(leaves_.size());
  for (const auto &leaf : leaves_) {
    out.insert(leaf.hash);
  }
  return out;
}

HashSet HashTree::allHashes() const {
  HashSet out;
  std::vector<const ChunkRef *> stack{root_.get()};
  while (!stack.empty()) {
    const ChunkRef *node = stack.back();
    stack.pop_back();
    out.insert(node->hash);
    if (node->left)
      stack.push_back(node->left.get());
    if (node->right)
      stack.push_back(node->right.get());
  }
  return out;
}

size_t HashTree::depth() const {
  std::function<size_t(const ChunkRef &)> walk = [&](const ChunkRef &n) {
    if (n.isLeaf())
      return size_t{0};
    return 1 + std::max(walk(*n.left), walk(*n.right));
  };
  return walk(*root_);
}

void HashTree::verify() const {
  Hash recomputed = MerkleTree::computeRoot(leafHashes());
  if (!digestEquals(recomputed, root_->hash)) {
    throwError(ErrorKind::InvariantViolation,
               "Root mismatch: stored " + shortHex(root_->hash) +
                   ", recomputed " + shortHex(recomputed));
  }
  uint64_t expected = 0;
  for (const auto &leaf : leaves_) {
    if (leaf.offset != expected) {
      throwError(ErrorKind::InvariantViolation,
                 "Leaf offset " + std::to_string(leaf.offset) +
                     " does not follow previous leaf end " +
                     std::to_string(expected));
    }
    expected += leaf.size;
  }
  if (expected != root_->size) {
    throwError(ErrorKind::InvariantViolation,
               "Leaf sizes sum to " + std::to_string(expected) +
                   " but root covers " + std::to_string(root_->size));
  }
}

std::string HashTree::dump() const {
  std::ostringstream os;
  std::function<void(const ChunkRef &, int)> walk = [&](const ChunkRef &n,
                                                        int indent) {
    os << std::string(static_cast<size_t>(indent) * 2, ' ')
       << (n.isLeaf() ? "leaf " : "node ") << shortHex(n.hash) << " @"
       << n.offset << " " << n.size << "B\n";
    if (n.left)
      walk(*n.left, indent + 1);
    if (n.right)
      walk(*n.right, indent + 1);
  };
  walk(*root_, 0);
  return os.str();
}

bool HashTree::operator==(const HashTree &other) const {
  return root_->hash == other.root_->hash && leaves_ == other.leaves_;
}

// ---------------------------------------------------------------------------
// MerkleTree
// ---------------------------------------------------------------------------

Hash MerkleTree::hashChunk(std::span<const std::byte> data) {
  return BlockIO::hash(data);
}

Hash MerkleTree::mergeHashes(const Hash &left, const Hash &right) {
  BlockIO bio(1, false);
  bio.ingest(reinterpret_cast<const std::byte *>(left.data()), left.size());
  bio.ingest(reinterpret_cast<const std::byte *>(right.data()), right.size());
  return bio.finalize_hashed().digest;
}

Hash MerkleTree::computeRoot(const std::vector<Hash> &leafHashes) {
  if (leafHashes.empty()) {
    throwInvalidInput("Cannot compute the root of an empty leaf sequence");
  }
  std::vector<Hash> level = leafHashes;
  while (level.size() > 1) {
    std::vector<Hash> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
      next.push_back(mergeHashes(level[i], level[i + 1]));
    }
    if (level.size() % 2 == 1) {
      next.push_back(level.back()); // promoted unpaired
    }
    level = std::move(next);
  }
  return level.front();
}

HashTree MerkleTree::build(const std::vector<LeafInfo> &leaves) {
  if (leaves.empty()) {
    throwInvalidInput("Cannot build a hash tree without leaves");
  }

  std::vector<LeafInfo> normalized;
  normalized.reserve(leaves.size());
  std::vector<ChunkRefPtr> level;
  level.reserve(leaves.size());
  uint64_t offset = 0;
  for (const auto &leaf : leaves) {
    auto node = std::make_shared<ChunkRef>();
    node->hash = leaf.hash;
    node->offset = offset;
    node->size = leaf.size;
    level.push_back(std::move(node));
    normalized.push_back(LeafInfo{leaf.hash, offset, leaf.size});
    offset += leaf.size;
  }

  while (level.size() > 1) {
    std::vector<ChunkRefPtr> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
      auto parent = std::make_shared<ChunkRef>();
      parent->hash = mergeHashes(level[i]->hash, level[i + 1]->hash);
      parent->offset = level[i]->offset;
      parent->size = level[i]->size + level[i + 1]->size;
      parent->left = level[i];
      parent->right = level[i + 1];
      next.push_back(std::move(parent));
    }
    if (level.size() % 2 == 1) {
      next.push_back(level.back());
    }
    level = std::move(next);
  }

  return HashTree(level.front(), std::move(normalized));
}

HashTree MerkleTree::emptyTree() {
  return build({LeafInfo{hashChunk({}), 0, 0}});
}

// ---------------------------------------------------------------------------
// TreeBuilder
// ---------------------------------------------------------------------------

const LeafInfo &TreeBuilder::addChunk(std::span<const std::byte> data) {
  return addLeaf(MerkleTree::hashChunk(data), data.size());
}

const LeafInfo &TreeBuilder::addLeaf(const Hash &hash, uint64_t size) {
  leaves_.push_back(LeafInfo{hash, offset_, size});
  offset_ += size;
  return leaves_.back();
}

HashTree TreeBuilder::finish() const { return MerkleTree::build(leaves_); }

} // namespace distd
