#include "distd/blockio.hpp"
#include "distd/errors.hpp"
#include "distd/merkle_tree.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace distd;
using distd::test::bytesOf;
using distd::test::patternBytes;

namespace {

std::vector<std::vector<std::byte>> makeChunks(size_t count, size_t size) {
  std::vector<std::vector<std::byte>> out;
  for (size_t i = 0; i < count; ++i)
    out.push_back(patternBytes(size, static_cast<uint32_t>(i + 1)));
  return out;
}

HashTree treeOf(const std::vector<std::vector<std::byte>> &chunks) {
  TreeBuilder builder;
  for (const auto &c : chunks)
    builder.addChunk(c);
  return builder.finish();
}

} // namespace

TEST(MerkleTree, LeafHashIsPlainBlake3) {
  auto data = bytesOf("abc");
  EXPECT_EQ(MerkleTree::hashChunk(data), BlockIO::hash(data));
}

TEST(MerkleTree, ParentHashesConcatenation) {
  Hash a = MerkleTree::hashChunk(bytesOf("left"));
  Hash b = MerkleTree::hashChunk(bytesOf("right"));
  std::vector<std::byte> concat;
  for (uint8_t x : a)
    concat.push_back(std::byte{x});
  for (uint8_t x : b)
    concat.push_back(std::byte{x});
  EXPECT_EQ(MerkleTree::mergeHashes(a, b), BlockIO::hash(concat));
  EXPECT_NE(MerkleTree::mergeHashes(a, b), MerkleTree::mergeHashes(b, a));
}

TEST(MerkleTree, SingleLeafRootIsLeafHash) {
  auto chunks = makeChunks(1, 100);
  HashTree tree = treeOf(chunks);
  EXPECT_EQ(tree.rootHash(), MerkleTree::hashChunk(chunks[0]));
  EXPECT_EQ(tree.depth(), 0u);
  EXPECT_TRUE(tree.root()->isLeaf());
}

TEST(MerkleTree, ThreeLeavesPromoteOddNode) {
  auto chunks = makeChunks(3, 64);
  HashTree tree = treeOf(chunks);
  Hash h0 = MerkleTree::hashChunk(chunks[0]);
  Hash h1 = MerkleTree::hashChunk(chunks[1]);
  Hash h2 = MerkleTree::hashChunk(chunks[2]);

  EXPECT_EQ(tree.rootHash(),
            MerkleTree::mergeHashes(MerkleTree::mergeHashes(h0, h1), h2));
  EXPECT_EQ(tree.depth(), 2u);
  // The promoted leaf is the right child of the root as-is.
  EXPECT_EQ(tree.root()->right->hash, h2);
  EXPECT_TRUE(tree.root()->right->isLeaf());
}

TEST(MerkleTree, FiveLeavesRoot) {
  auto chunks = makeChunks(5, 10);
  std::vector<Hash> h;
  for (const auto &c : chunks)
    h.push_back(MerkleTree::hashChunk(c));
  Hash left = MerkleTree::mergeHashes(MerkleTree::mergeHashes(h[0], h[1]),
                                      MerkleTree::mergeHashes(h[2], h[3]));
  EXPECT_EQ(MerkleTree::computeRoot(h), MerkleTree::mergeHashes(left, h[4]));
  EXPECT_EQ(treeOf(chunks).rootHash(), MerkleTree::computeRoot(h));
}

TEST(MerkleTree, DeterministicAndOrderSensitive) {
  auto chunks = makeChunks(4, 32);
  EXPECT_EQ(treeOf(chunks), treeOf(chunks));
  std::swap(chunks[1], chunks[2]);
  auto swapped = treeOf(chunks);
  std::swap(chunks[1], chunks[2]);
  EXPECT_NE(treeOf(chunks).rootHash(), swapped.rootHash());
}

TEST(MerkleTree, OffsetsAndSizes) {
  TreeBuilder builder;
  builder.addChunk(patternBytes(100, 1));
  builder.addChunk(patternBytes(100, 2));
  builder.addChunk(patternBytes(37, 3));
  HashTree tree = builder.finish();
  ASSERT_EQ(tree.leafCount(), 3u);
  EXPECT_EQ(tree.leafAt(0).offset, 0u);
  EXPECT_EQ(tree.leafAt(1).offset, 100u);
  EXPECT_EQ(tree.leafAt(2).offset, 200u);
  EXPECT_EQ(tree.totalSize(), 237u);
  EXPECT_EQ(tree.root()->left->size, 200u);
  EXPECT_NO_THROW(tree.verify());
}

TEST(MerkleTree, BuildRecomputesOffsets) {
  Hash a = test::filledHash(1), b = test::filledHash(2);
  HashTree tree = MerkleTree::build({{a, 999, 10}, {b, 5, 20}});
  EXPECT_EQ(tree.leafAt(0).offset, 0u);
  EXPECT_EQ(tree.leafAt(1).offset, 10u);
}

TEST(MerkleTree, RepeatedChunksShareHash) {
  auto same = patternBytes(50, 42);
  TreeBuilder builder;
  builder.addChunk(same);
  builder.addChunk(same);
  builder.addChunk(patternBytes(50, 43));
  HashTree tree = builder.finish();
  EXPECT_EQ(tree.leafHashes().size(), 3u);
  EXPECT_EQ(tree.uniqueLeafHashes().size(), 2u);
  // leaves + one internal node + root
  EXPECT_EQ(tree.allHashes().size(), 4u);
}

TEST(MerkleTree, EmptyInputsRejected) {
  EXPECT_THROW(MerkleTree::computeRoot({}), InvalidInputError);
  EXPECT_THROW(MerkleTree::build({}), InvalidInputError);
  TreeBuilder builder;
  EXPECT_THROW(builder.finish(), InvalidInputError);
}

TEST(MerkleTree, EmptyTreeSentinel) {
  HashTree empty = MerkleTree::emptyTree();
  EXPECT_EQ(empty.leafCount(), 1u);
  EXPECT_EQ(empty.totalSize(), 0u);
  EXPECT_EQ(empty.rootHash(), MerkleTree::hashChunk({}));
}

TEST(MerkleTree, VerifyDetectsForgedRoot) {
  auto chunks = makeChunks(2, 16);
  HashTree good = treeOf(chunks);
  auto forgedRoot = std::make_shared<ChunkRef>(*good.root());
  forgedRoot->hash = test::filledHash(0xee);
  HashTree forged(forgedRoot, good.leaves());
  EXPECT_THROW(forged.verify(), InvariantViolationError);
}

TEST(MerkleTree, DumpListsEveryNode) {
  HashTree tree = treeOf(makeChunks(3, 8));
  std::string dump = tree.dump();
  size_t lines = std::count(dump.begin(), dump.end(), '\n');
  EXPECT_EQ(lines, 5u);
  EXPECT_EQ(dump.rfind("node ", 0), 0u);
}
