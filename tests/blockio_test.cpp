#include "distd/blockio.hpp"
#include "distd/errors.hpp"
#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using distd::BlockIO;
using distd::DigestResult;
using distd::hashFromHex;
using distd::test::bytesOf;
using distd::test::patternBytes;

TEST(BlockIOTest, IngestEmpty) {
  BlockIO bio;
  std::vector<std::byte> empty_data;
  bio.ingest(empty_data.data(), empty_data.size());
  EXPECT_TRUE(bio.finalize_raw().empty());
}

TEST(BlockIOTest, IngestMultipleChunks) {
  BlockIO bio;
  std::vector<std::byte> expected;
  auto a = patternBytes(10, 1);
  auto b = patternBytes(20, 2);
  bio.ingest(a);
  bio.ingest(std::span<const std::byte>{});
  bio.ingest(b);
  expected.insert(expected.end(), a.begin(), a.end());
  expected.insert(expected.end(), b.begin(), b.end());

  std::vector<std::byte> result = bio.finalize_raw();
  ASSERT_EQ(result.size(), expected.size());
  EXPECT_TRUE(std::equal(result.begin(), result.end(), expected.begin()));
}

TEST(BlockIOTest, FinalizeHashedEmpty) {
  BlockIO bio;
  DigestResult result = bio.finalize_hashed();
  EXPECT_TRUE(result.raw.empty());
  // BLAKE3 of the empty string
  EXPECT_EQ(result.digest,
            hashFromHex("af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262"));
}

TEST(BlockIOTest, FinalizeHashedKnownAnswer) {
  BlockIO bio;
  bio.ingest(bytesOf("abc"));
  DigestResult result = bio.finalize_hashed();
  EXPECT_EQ(result.digest,
            hashFromHex("6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85"));
  EXPECT_EQ(result.raw, bytesOf("abc"));
}

TEST(BlockIOTest, IncrementalMatchesOneShot) {
  auto data = patternBytes(100000, 7);
  BlockIO bio(1, false);
  bio.ingest(std::span<const std::byte>(data).first(333));
  bio.ingest(std::span<const std::byte>(data).subspan(333));
  DigestResult result = bio.finalize_hashed();
  EXPECT_TRUE(result.raw.empty());
  EXPECT_EQ(result.digest, BlockIO::hash(data));
}

TEST(BlockIOTest, FinalizeHashedStateManagement) {
  BlockIO bio;
  bio.ingest(bytesOf("initial data"));
  (void)bio.finalize_hashed();
  auto more = bytesOf("more data");
  ASSERT_THROW(bio.ingest(more.data(), more.size()), std::logic_error);
  ASSERT_THROW(bio.finalize_hashed(), std::logic_error);
}

TEST(BlockIOTest, CompressRoundTrip) {
  BlockIO bio(3);
  std::vector<std::byte> data(64 * 1024, std::byte{'z'});
  auto compressed = bio.compress_data(data);
  EXPECT_LT(compressed.size(), data.size());
  EXPECT_EQ(bio.decompress_data(compressed), data);
  EXPECT_EQ(bio.decompress_data(compressed, data.size()), data);
}

TEST(BlockIOTest, DecompressGarbageThrows) {
  BlockIO bio;
  auto garbage = bytesOf("definitely not a zstd frame");
  EXPECT_THROW(bio.decompress_data(garbage), distd::InvalidInputError);
  EXPECT_THROW(bio.decompress_data({}), distd::InvalidInputError);
}
