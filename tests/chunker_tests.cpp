#include "distd/chunker.hpp"
#include "distd/errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <streambuf>

using distd::Chunk;
using distd::Chunker;
using distd::test::patternBytes;
using distd::test::stringOf;

namespace {

std::vector<Chunk> readAll(Chunker &chunker) {
  std::vector<Chunk> chunks;
  Chunk c;
  while (chunker.next(c))
    chunks.push_back(c);
  return chunks;
}

/// Streambuf that fails after handing out a few bytes.
class FailingBuf : public std::streambuf {
public:
  explicit FailingBuf(size_t good) : good_(good) {}

protected:
  int_type underflow() override {
    if (served_ >= good_)
      throw std::runtime_error("disk on fire");
    ch_ = 'x';
    ++served_;
    setg(&ch_, &ch_, &ch_ + 1);
    return traits_type::to_int_type(ch_);
  }

private:
  size_t good_;
  size_t served_{0};
  char ch_{0};
};

} // namespace

TEST(ChunkerTest, SplitsAtFixedBoundaries) {
  std::istringstream in(std::string(10, 'a'));
  Chunker chunker(in, 4);
  auto chunks = readAll(chunker);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].offset, 0u);
  EXPECT_EQ(chunks[1].offset, 4u);
  EXPECT_EQ(chunks[2].offset, 8u);
  EXPECT_EQ(chunks[0].data.size(), 4u);
  EXPECT_EQ(chunks[2].data.size(), 2u);
  EXPECT_EQ(chunker.offset(), 10u);
  EXPECT_EQ(chunker.chunksRead(), 3u);
}

TEST(ChunkerTest, ExactMultipleHasNoShortTail) {
  std::istringstream in(std::string(12, 'b'));
  Chunker chunker(in, 4);
  auto chunks = readAll(chunker);
  ASSERT_EQ(chunks.size(), 3u);
  for (const auto &c : chunks)
    EXPECT_EQ(c.data.size(), 4u);
}

TEST(ChunkerTest, EmptySourceYieldsNothing) {
  std::istringstream in("");
  Chunker chunker(in, 4);
  Chunk c;
  EXPECT_FALSE(chunker.next(c));
  EXPECT_FALSE(chunker.next(c));
  EXPECT_EQ(chunker.chunksRead(), 0u);
}

TEST(ChunkerTest, ZeroChunkSizeRejected) {
  std::istringstream in("abc");
  EXPECT_THROW({ Chunker bad(in, 0); }, distd::InvalidInputError);
  auto data = patternBytes(8, 1);
  EXPECT_THROW(Chunker::split(data, 0), distd::InvalidInputError);
}

TEST(ChunkerTest, ConcatenationRestoresSource) {
  auto data = patternBytes(100003, 3);
  std::istringstream in(stringOf(data));
  Chunker chunker(in, 4096);
  std::vector<std::byte> joined;
  for (const auto &c : readAll(chunker))
    joined.insert(joined.end(), c.data.begin(), c.data.end());
  EXPECT_EQ(joined, data);
}

TEST(ChunkerTest, RewindRestartsSequence) {
  std::istringstream in("abcdefg");
  Chunker chunker(in, 3);
  auto first = readAll(chunker);
  chunker.rewind();
  EXPECT_EQ(chunker.offset(), 0u);
  auto second = readAll(chunker);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].offset, second[i].offset);
    EXPECT_EQ(first[i].data, second[i].data);
  }
}

TEST(ChunkerTest, SplitMatchesStreamBoundaries) {
  auto data = patternBytes(1000, 9);
  auto spans = Chunker::split(data, 300);
  ASSERT_EQ(spans.size(), 4u);
  EXPECT_EQ(spans[3].size(), 100u);

  std::istringstream in(stringOf(data));
  Chunker chunker(in, 300);
  auto chunks = readAll(chunker);
  ASSERT_EQ(chunks.size(), spans.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    EXPECT_TRUE(std::equal(spans[i].begin(), spans[i].end(),
                           chunks[i].data.begin(), chunks[i].data.end()));
  }
}

TEST(ChunkerTest, ReadFailureIsIoError) {
  FailingBuf buf(5);
  std::istream in(&buf);
  Chunker chunker(in, 16);
  Chunk c;
  EXPECT_THROW(chunker.next(c), distd::IoError);
}
