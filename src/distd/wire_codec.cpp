#include "distd/wire_codec.hpp"
#include "distd/errors.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace distd {

namespace {

constexpr char kTreeMagic[4] = {'D', 'T', 'R', 'E'};
constexpr char kHashSetMagic[4] = {'D', 'H', 'S', 'H'};
constexpr char kChunkMagic[4] = {'D', 'C', 'H', 'K'};
constexpr size_t kHeaderSize = 5; // magic + format

constexpr size_t kTreeFixed = kHeaderSize + 4 + 4 + DIGEST_SIZE + 8;
constexpr size_t kTreeLeafSize = DIGEST_SIZE + 8;

class Writer {
public:
  explicit Writer(size_t reserve) { out_.reserve(reserve); }

  void magic(const char (&m)[4]) {
    for (char c : m)
      out_.push_back(static_cast<std::byte>(c));
    u8(WireCodec::FORMAT_VERSION);
  }
  void u8(uint8_t v) { out_.push_back(static_cast<std::byte>(v)); }
  void u32(uint32_t v) {
    for (int i = 0; i < 4; ++i)
      out_.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xff));
  }
  void u64(uint64_t v) {
    for (int i = 0; i < 8; ++i)
      out_.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xff));
  }
  void hash(const Hash &h) {
    for (uint8_t b : h)
      out_.push_back(static_cast<std::byte>(b));
  }
  void bytes(std::span<const std::byte> data) {
    out_.insert(out_.end(), data.begin(), data.end());
  }
  std::vector<std::byte> take() { return std::move(out_); }

private:
  std::vector<std::byte> out_;
};

class Reader {
public:
  Reader(std::span<const std::byte> in, const char *what)
      : in_(in), what_(what) {}

  void header(const char (&m)[4]) {
    need(kHeaderSize);
    if (std::memcmp(in_.data(), m, 4) != 0) {
      throwInvalidInput(std::string("Bad magic in ") + what_ + " payload");
    }
    pos_ = 4;
    const uint8_t format = u8();
    if (format != WireCodec::FORMAT_VERSION) {
      throwInvalidInput(std::string("Unsupported ") + what_ +
                        " format version " + std::to_string(format));
    }
  }
  uint8_t u8() {
    need(1);
    return static_cast<uint8_t>(in_[pos_++]);
  }
  uint32_t u32() {
    need(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
      v |= static_cast<uint32_t>(in_[pos_++]) << (8 * i);
    return v;
  }
  uint64_t u64() {
    need(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
      v |= static_cast<uint64_t>(in_[pos_++]) << (8 * i);
    return v;
  }
  Hash hash() {
    need(DIGEST_SIZE);
    Hash h;
    std::memcpy(h.data(), in_.data() + pos_, DIGEST_SIZE);
    pos_ += DIGEST_SIZE;
    return h;
  }
  std::span<const std::byte> bytes(size_t n) {
    need(n);
    auto out = in_.subspan(pos_, n);
    pos_ += n;
    return out;
  }
  size_t remaining() const { return in_.size() - pos_; }
  void finish() const {
    if (remaining() != 0) {
      throwInvalidInput(std::string("Trailing bytes after ") + what_ +
                        " payload");
    }
  }

private:
  void need(size_t n) const {
    if (in_.size() - pos_ < n) {
      throwInvalidInput(std::string("Truncated ") + what_ + " payload");
    }
  }

  std::span<const std::byte> in_;
  const char *what_;
  size_t pos_{0};
};

bool hasMagic(std::span<const std::byte> payload, const char (&m)[4]) {
  return payload.size() >= 4 && std::memcmp(payload.data(), m, 4) == 0;
}

} // namespace

PayloadKind WireCodec::kindOf(std::span<const std::byte> payload) {
  if (hasMagic(payload, kTreeMagic))
    return PayloadKind::Tree;
  if (hasMagic(payload, kHashSetMagic))
    return PayloadKind::HashSet;
  if (hasMagic(payload, kChunkMagic))
    return PayloadKind::ChunkFrame;
  return PayloadKind::Unknown;
}

std::vector<std::byte> WireCodec::serializeTree(const HashTree &tree,
                                                uint64_t chunkSize) {
  if (chunkSize == 0 || chunkSize > std::numeric_limits<uint32_t>::max()) {
    throwInvalidInput("Chunk size " + std::to_string(chunkSize) +
                      " cannot be encoded");
  }
  if (tree.leafCount() > std::numeric_limits<uint32_t>::max()) {
    throwInvalidInput("Tree has too many leaves to encode");
  }
  Writer w(kTreeFixed + tree.leafCount() * kTreeLeafSize);
  w.magic(kTreeMagic);
  w.u32(static_cast<uint32_t>(chunkSize));
  w.u32(static_cast<uint32_t>(tree.leafCount()));
  w.hash(tree.rootHash());
  w.u64(tree.totalSize());
  for (const auto &leaf : tree.leaves()) {
    w.hash(leaf.hash);
    w.u64(leaf.size);
  }
  return w.take();
}

HashTree WireCodec::deserializeTree(std::span<const std::byte> payload,
                                    uint32_t *chunkSize) {
  Reader r(payload, "tree");
  r.header(kTreeMagic);
  const uint32_t size = r.u32();
  const uint32_t count = r.u32();
  const Hash root = r.hash();
  const uint64_t total = r.u64();

  if (size == 0) {
    throwInvalidInput("Tree payload declares a zero chunk size");
  }
  if (count == 0) {
    throwInvalidInput("Tree payload has no leaves");
  }
  if (static_cast<uint64_t>(count) * kTreeLeafSize != r.remaining()) {
    throwInvalidInput("Tree payload length does not match its leaf count");
  }

  std::vector<LeafInfo> leaves;
  leaves.reserve(count);
  uint64_t offset = 0;
  for (uint32_t i = 0; i < count; ++i) {
    LeafInfo leaf;
    leaf.hash = r.hash();
    leaf.size = r.u64();
    leaf.offset = offset;
    if (leaf.size > size) {
      throwInvalidInput("Leaf " + std::to_string(i) +
                        " is larger than the chunk size");
    }
    offset += leaf.size;
    leaves.push_back(leaf);
  }
  r.finish();

  if (offset != total) {
    throwInvalidInput("Tree payload sizes add up to " + std::to_string(offset) +
                      ", header says " + std::to_string(total));
  }

  HashTree tree = MerkleTree::build(leaves);
  if (!digestEquals(tree.rootHash(), root)) {
    throwError(ErrorKind::InvariantViolation,
               "Rebuilt root " + toHex(tree.rootHash()) +
                   " differs from transmitted root " + toHex(root));
  }
  if (chunkSize)
    *chunkSize = size;
  return tree;
}

std::vector<std::byte> WireCodec::serializeHashSet(const HashSet &hashes) {
  if (hashes.size() > std::numeric_limits<uint32_t>::max()) {
    throwInvalidInput("Hash set too large to encode");
  }
  std::vector<Hash> sorted(hashes.begin(), hashes.end());
  std::sort(sorted.begin(), sorted.end());

  Writer w(kHeaderSize + 4 + sorted.size() * DIGEST_SIZE);
  w.magic(kHashSetMagic);
  w.u32(static_cast<uint32_t>(sorted.size()));
  for (const auto &h : sorted)
    w.hash(h);
  return w.take();
}

HashSet WireCodec::deserializeHashSet(std::span<const std::byte> payload) {
  Reader r(payload, "hash set");
  r.header(kHashSetMagic);
  const uint32_t count = r.u32();
  if (static_cast<uint64_t>(count) * DIGEST_SIZE != r.remaining()) {
    throwInvalidInput("Hash set payload length does not match its count");
  }
  HashSet out;
  out.reserve(count);
  for (uint32_t i = 0; i < count; ++i)
    out.insert(r.hash());
  r.finish();
  return out;
}

std::vector<std::byte>
WireCodec::encodeChunkFrame(const Hash &hash, std::span<const std::byte> data) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    throwInvalidInput("Chunk too large for a frame");
  }
  Writer w(kHeaderSize + DIGEST_SIZE + 4 + data.size());
  w.magic(kChunkMagic);
  w.hash(hash);
  w.u32(static_cast<uint32_t>(data.size()));
  w.bytes(data);
  return w.take();
}

ChunkFrame WireCodec::decodeChunkFrame(std::span<const std::byte> payload) {
  Reader r(payload, "chunk frame");
  r.header(kChunkMagic);
  ChunkFrame frame;
  frame.hash = r.hash();
  const uint32_t size = r.u32();
  auto bytes = r.bytes(size);
  r.finish();

  if (!digestEquals(MerkleTree::hashChunk(bytes), frame.hash)) {
    throwInvalidInput("Chunk frame content does not match hash " +
                      toHex(frame.hash));
  }
  frame.data.assign(bytes.begin(), bytes.end());
  return frame;
}

proto::Hashes WireCodec::toProto(const HashSet &hashes) {
  std::vector<Hash> sorted(hashes.begin(), hashes.end());
  std::sort(sorted.begin(), sorted.end());
  proto::Hashes msg;
  for (const auto &h : sorted) {
    msg.add_hashes(reinterpret_cast<const char *>(h.data()), h.size());
  }
  return msg;
}

HashSet WireCodec::fromProto(const proto::Hashes &hashes) {
  HashSet out;
  out.reserve(static_cast<size_t>(hashes.hashes_size()));
  for (int i = 0; i < hashes.hashes_size(); ++i) {
    const std::string &raw = hashes.hashes(i);
    if (raw.size() != DIGEST_SIZE) {
      throwInvalidInput("Advertised hash " + std::to_string(i) + " is " +
                        std::to_string(raw.size()) + " bytes long");
    }
    Hash h;
    std::memcpy(h.data(), raw.data(), DIGEST_SIZE);
    out.insert(h);
  }
  return out;
}

proto::SerializedTree WireCodec::wrap(std::vector<std::byte> payload) {
  proto::SerializedTree msg;
  msg.set_payload(reinterpret_cast<const char *>(payload.data()),
                  payload.size());
  return msg;
}

std::span<const std::byte>
WireCodec::unwrap(const proto::SerializedTree &message) {
  const std::string &payload = message.payload();
  return {reinterpret_cast<const std::byte *>(payload.data()), payload.size()};
}

} // namespace distd
