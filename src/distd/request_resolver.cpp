#include "distd/request_resolver.hpp"
#include "distd/logger.h"
#include "distd/wire_codec.hpp"

namespace distd {

RequestResolver::RequestResolver(DistributionEngine &engine) : engine_(engine) {}

proto::EnumAcknowledge RequestResolver::ackForError(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
  case ErrorKind::InvalidInput:
    return proto::ACK_CONFUSED;
  default:
    return proto::ACK_UNSPECIFIED;
  }
}

Resolution RequestResolver::resolve(const proto::ItemRequest &request) const {
  Resolution res;
  res.path = request.item_path();
  try {
    ItemPtr item = engine_.registry().lookup(request.item_path());
    res.path = item->path();
    res.version = request.has_request_version() ? request.request_version()
                                                : item->latestVersion();
    res.tree = item->version(res.version).tree;

    HashSet known;
    if (request.has_hashes()) {
      known = WireCodec::fromProto(request.hashes());
    }
    std::optional<Hash> requesterRoot;
    if (request.has_from_version()) {
      const TreePtr &from = item->version(request.from_version()).tree;
      for (const auto &leaf : from->leaves())
        known.insert(leaf.hash);
      requesterRoot = from->rootHash();
    }

    res.plan = planTransfer(*res.tree, known, requesterRoot);
    res.ack = res.plan.upToDate() ? proto::ACK_IGNORED : proto::ACK_OK;
  } catch (const DistdError &e) {
    if (e.kind() == ErrorKind::ConcurrencyConflict ||
        e.kind() == ErrorKind::InvariantViolation) {
      throw;
    }
    res.ack = ackForError(e.kind());
    res.error = e.kind();
    res.message = e.what();
    res.tree.reset();
    res.plan = TransferPlan();
  }

  Logger::getInstance().log(
      LogLevel::DEBUG, "[RequestResolver] " + res.path + " v" +
                           std::to_string(res.version) + " -> " +
                           proto::EnumAcknowledge_Name(res.ack) + " (" +
                           std::to_string(res.plan.size()) + " chunks)");
  return res;
}

std::vector<proto::SerializedTree>
RequestResolver::serialize(const Resolution &resolution) const {
  std::vector<proto::SerializedTree> out;
  if (resolution.ack != proto::ACK_OK || !resolution.tree) {
    return out;
  }
  const std::vector<Hash> hashes = resolution.plan.uniqueHashes();
  out.reserve(hashes.size() + 1);
  out.push_back(WireCodec::wrap(WireCodec::serializeTree(
      *resolution.tree, engine_.chunkSizeFor(*resolution.tree))));
  for (const Hash &h : hashes) {
    ChunkData data = engine_.store().get(h);
    out.push_back(WireCodec::wrap(WireCodec::encodeChunkFrame(h, *data)));
  }
  return out;
}

proto::Acknowledge
RequestResolver::acknowledgeHashes(const std::string &peerId,
                                   const proto::Hashes &hashes) {
  proto::Acknowledge ack;
  HashSet set;
  try {
    set = WireCodec::fromProto(hashes);
  } catch (const InvalidInputError &e) {
    Logger::getInstance().log(LogLevel::WARN, "[RequestResolver] Peer " +
                                                  peerId + " advertised " +
                                                  e.what());
    ack.set_ack(proto::ACK_CONFUSED);
    return ack;
  }

  for (const Hash &h : set) {
    if (!engine_.store().contains(h)) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[RequestResolver] Peer " + peerId +
                                    " advertised unknown hash " + toHex(h));
      ack.set_ack(proto::ACK_CONFUSED);
      return ack;
    }
  }

  std::lock_guard<std::mutex> lock(peersMutex_);
  auto it = lastAdvertised_.find(peerId);
  if (it != lastAdvertised_.end() && it->second == set) {
    ack.set_ack(proto::ACK_IGNORED);
    return ack;
  }
  lastAdvertised_[peerId] = std::move(set);
  ack.set_ack(proto::ACK_OK);
  return ack;
}

void RequestResolver::forgetPeer(const std::string &peerId) {
  std::lock_guard<std::mutex> lock(peersMutex_);
  lastAdvertised_.erase(peerId);
}

} // namespace distd
