#ifndef DISTD_REQUEST_RESOLVER_HPP
#define DISTD_REQUEST_RESOLVER_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "distd/diff.hpp"
#include "distd/engine.hpp"
#include "distd/errors.hpp"
#include "proto/distd.pb.h"

namespace distd {

/// Answer to one ItemRequest.
struct Resolution {
  proto::EnumAcknowledge ack{proto::ACK_UNSPECIFIED};
  std::optional<ErrorKind> error; ///< set when the request was rejected
  std::string message;
  std::string path;
  uint32_t version{0};
  TreePtr tree;
  TransferPlan plan;
};

/**
 * @brief Provider side of the tree transfer and hash advertisement messages.
 */
class RequestResolver {
public:
  explicit RequestResolver(DistributionEngine &engine);

  /**
   * @brief Select the requested version and plan what the requester lacks.
   *
   * Unknown paths or versions and malformed hashes give ACK_CONFUSED, a
   * requester that is already up to date gets ACK_IGNORED.
   */
  Resolution resolve(const proto::ItemRequest &request) const;

  /**
   * @brief Messages answering an ACK_OK resolution: the tree payload, then
   * one chunk frame per missing hash in first-occurrence order.
   *
   * Other resolutions produce no message. The chunks are read from the
   * store at this point, not during resolve().
   *
   * @throws distd::NotFoundError if a planned chunk was released after
   *         resolve(); resolve the request again.
   */
  std::vector<proto::SerializedTree> serialize(const Resolution &resolution) const;

  /**
   * @brief Acknowledge the hashes advertised by @p peerId.
   *
   * ACK_CONFUSED for a malformed hash or one the store does not hold,
   * ACK_IGNORED when the set repeats the peer's previous advertisement.
   */
  proto::Acknowledge acknowledgeHashes(const std::string &peerId,
                                       const proto::Hashes &hashes);

  void forgetPeer(const std::string &peerId);

  /// NotFound and InvalidInput map to ACK_CONFUSED, anything else to
  /// ACK_UNSPECIFIED.
  static proto::EnumAcknowledge ackForError(ErrorKind kind);

private:
  DistributionEngine &engine_;
  std::mutex peersMutex_;
  std::unordered_map<std::string, HashSet> lastAdvertised_;
};

} // namespace distd

#endif // DISTD_REQUEST_RESOLVER_HPP
