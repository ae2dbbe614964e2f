#pragma once

#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/discovery/advertisement.hpp"

namespace eryzaa::discovery {

enum class AcceptResult {
  kAccepted,
  kSelf,
  kStale,
  kOutOfOrder,
};

/*
  Latest advertisement per remote node.

  Never holds the local node. Entries older than the staleness window, or
  more than one window ahead of the clock, are rejected by Accept and removed
  by EvictStale; readers never filter lazily.
*/
class PeerTable {
 public:
  PeerTable(std::string local_node_id, std::chrono::seconds staleness_window);

  // now: unix seconds
  AcceptResult Accept(const NodeAdvertisement& advertisement, std::uint64_t now);

  // Returns the number of entries removed.
  std::size_t EvictStale(std::uint64_t now);

  std::unordered_map<std::string, NodeAdvertisement> Snapshot() const;
  std::vector<NodeAdvertisement>                     ByKind(NodeKind kind) const;
  std::vector<NodeAdvertisement>                     AvailableRentals() const;
  std::size_t                                        Size() const;

 private:
  bool IsStale(std::uint64_t timestamp, std::uint64_t now) const;

  const std::string   local_node_id_;
  const std::uint64_t window_secs_;

  mutable std::shared_mutex                          mutex_;
  std::unordered_map<std::string, NodeAdvertisement> peers_;
};

} // namespace eryzaa::discovery
