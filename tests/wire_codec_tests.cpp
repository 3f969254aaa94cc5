#include "distd/errors.hpp"
#include "distd/merkle_tree.hpp"
#include "distd/wire_codec.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace distd;
using distd::test::bytesOf;
using distd::test::filledHash;
using distd::test::patternBytes;

namespace {

HashTree treeWithLeaves(size_t count, uint64_t chunkSize = 1024) {
  TreeBuilder builder;
  for (size_t i = 0; i < count; ++i) {
    // Last leaf shorter, like a real chunked file.
    size_t size = (i + 1 == count) ? chunkSize / 3 : chunkSize;
    builder.addChunk(patternBytes(size, static_cast<uint32_t>(i)));
  }
  return builder.finish();
}

} // namespace

class TreeCodecTest : public ::testing::TestWithParam<size_t> {};

TEST_P(TreeCodecTest, RoundTripPreservesTree) {
  HashTree tree = treeWithLeaves(GetParam());
  auto payload = WireCodec::serializeTree(tree, 1024);
  EXPECT_EQ(WireCodec::kindOf(payload), PayloadKind::Tree);
  EXPECT_EQ(payload.size(), 5 + 4 + 4 + 32 + 8 + GetParam() * 40);

  uint32_t chunkSize = 0;
  HashTree decoded = WireCodec::deserializeTree(payload, &chunkSize);
  EXPECT_EQ(chunkSize, 1024u);
  EXPECT_EQ(decoded, tree);
  EXPECT_EQ(decoded.totalSize(), tree.totalSize());
  EXPECT_EQ(decoded.depth(), tree.depth());
}

INSTANTIATE_TEST_SUITE_P(LeafCounts, TreeCodecTest,
                         ::testing::Values(1, 2, 3, 7, 129));

TEST(WireCodecTest, TreeHeaderIsLittleEndian) {
  HashTree tree = treeWithLeaves(2, 300);
  auto payload = WireCodec::serializeTree(tree, 0x01020304);
  EXPECT_EQ(test::stringOf(std::vector<std::byte>(payload.begin(),
                                                  payload.begin() + 4)),
            "DTRE");
  EXPECT_EQ(payload[4], std::byte{1});
  EXPECT_EQ(payload[5], std::byte{0x04});
  EXPECT_EQ(payload[8], std::byte{0x01});
  EXPECT_EQ(payload[9], std::byte{2}); // leaf count
}

TEST(WireCodecTest, TamperedLeafBreaksRoot) {
  HashTree tree = treeWithLeaves(4);
  auto payload = WireCodec::serializeTree(tree, 1024);
  // First byte of the second leaf hash.
  payload[5 + 4 + 4 + 32 + 8 + 40] ^= std::byte{0xff};
  EXPECT_THROW(WireCodec::deserializeTree(payload), InvariantViolationError);
}

TEST(WireCodecTest, MalformedTreePayloadsRejected) {
  HashTree tree = treeWithLeaves(3);
  const auto good = WireCodec::serializeTree(tree, 1024);

  auto truncated = good;
  truncated.pop_back();
  EXPECT_THROW(WireCodec::deserializeTree(truncated), InvalidInputError);

  auto trailing = good;
  trailing.push_back(std::byte{0});
  EXPECT_THROW(WireCodec::deserializeTree(trailing), InvalidInputError);

  auto badMagic = good;
  badMagic[0] = std::byte{'X'};
  EXPECT_THROW(WireCodec::deserializeTree(badMagic), InvalidInputError);

  auto badFormat = good;
  badFormat[4] = std::byte{9};
  EXPECT_THROW(WireCodec::deserializeTree(badFormat), InvalidInputError);

  auto badTotal = good;
  badTotal[5 + 4 + 4 + 32] ^= std::byte{1};
  EXPECT_THROW(WireCodec::deserializeTree(badTotal), InvalidInputError);

  EXPECT_THROW(WireCodec::deserializeTree({}), InvalidInputError);
  EXPECT_THROW(WireCodec::serializeTree(tree, 0), InvalidInputError);
}

TEST(WireCodecTest, ZeroLeafPayloadRejected) {
  std::vector<std::byte> payload = bytesOf("DTRE");
  payload.push_back(std::byte{1});
  for (int i = 0; i < 4; ++i) // chunk size 1
    payload.push_back(std::byte{static_cast<unsigned char>(i == 0)});
  for (int i = 0; i < 4 + 32 + 8; ++i) // count 0, root, total
    payload.push_back(std::byte{0});
  EXPECT_THROW(WireCodec::deserializeTree(payload), InvalidInputError);
}

TEST(WireCodecTest, EmptyItemTreeRoundTrips) {
  HashTree empty = MerkleTree::emptyTree();
  auto decoded = WireCodec::deserializeTree(WireCodec::serializeTree(empty, 4096));
  EXPECT_EQ(decoded, empty);
  EXPECT_EQ(decoded.totalSize(), 0u);
}

TEST(WireCodecTest, HashSetIsCanonical) {
  HashSet a{filledHash(3), filledHash(1), filledHash(2)};
  HashSet b{filledHash(2), filledHash(3), filledHash(1)};
  auto pa = WireCodec::serializeHashSet(a);
  EXPECT_EQ(pa, WireCodec::serializeHashSet(b));
  EXPECT_EQ(WireCodec::kindOf(pa), PayloadKind::HashSet);
  // Sorted ascending: first hash on the wire is all 0x01.
  EXPECT_EQ(pa[9], std::byte{1});
  EXPECT_EQ(WireCodec::deserializeHashSet(pa), a);

  auto empty = WireCodec::serializeHashSet({});
  EXPECT_TRUE(WireCodec::deserializeHashSet(empty).empty());
}

TEST(WireCodecTest, HashSetDuplicatesCollapseAndTruncationFails) {
  auto payload = WireCodec::serializeHashSet({filledHash(5)});
  // Duplicate the only entry and bump the count to 2.
  std::vector<std::byte> entry(payload.end() - 32, payload.end());
  payload.insert(payload.end(), entry.begin(), entry.end());
  payload[5] = std::byte{2};
  EXPECT_EQ(WireCodec::deserializeHashSet(payload).size(), 1u);

  payload.pop_back();
  EXPECT_THROW(WireCodec::deserializeHashSet(payload), InvalidInputError);
}

TEST(WireCodecTest, ChunkFrameVerifiesContent) {
  auto data = patternBytes(777, 4);
  Hash h = MerkleTree::hashChunk(data);
  auto frame = WireCodec::encodeChunkFrame(h, data);
  EXPECT_EQ(WireCodec::kindOf(frame), PayloadKind::ChunkFrame);
  ChunkFrame decoded = WireCodec::decodeChunkFrame(frame);
  EXPECT_EQ(decoded.hash, h);
  EXPECT_EQ(decoded.data, data);

  frame.back() ^= std::byte{0x01};
  EXPECT_THROW(WireCodec::decodeChunkFrame(frame), InvalidInputError);

  auto lying = WireCodec::encodeChunkFrame(filledHash(9), data);
  EXPECT_THROW(WireCodec::decodeChunkFrame(lying), InvalidInputError);
}

TEST(WireCodecTest, ProtoHashesConversion) {
  HashSet set{filledHash(2), filledHash(1)};
  proto::Hashes msg = WireCodec::toProto(set);
  ASSERT_EQ(msg.hashes_size(), 2);
  EXPECT_EQ(static_cast<uint8_t>(msg.hashes(0)[0]), 1);
  EXPECT_EQ(WireCodec::fromProto(msg), set);

  msg.add_hashes("short");
  EXPECT_THROW(WireCodec::fromProto(msg), InvalidInputError);
}

TEST(WireCodecTest, SerializedTreeWrapping) {
  auto frame = WireCodec::encodeChunkFrame(MerkleTree::hashChunk(bytesOf("x")),
                                           bytesOf("x"));
  proto::SerializedTree msg = WireCodec::wrap(frame);
  auto view = WireCodec::unwrap(msg);
  EXPECT_TRUE(std::equal(view.begin(), view.end(), frame.begin(), frame.end()));
  EXPECT_EQ(WireCodec::kindOf(bytesOf("nope")), PayloadKind::Unknown);
}
