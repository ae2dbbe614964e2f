#include "internal/discovery/peer_table.hpp"

#include <mutex>

namespace eryzaa::discovery {

PeerTable::PeerTable(std::string local_node_id, std::chrono::seconds staleness_window)
    : local_node_id_(std::move(local_node_id)),
      window_secs_(staleness_window.count() > 0 ? static_cast<std::uint64_t>(staleness_window.count()) : 0) {
}

bool PeerTable::IsStale(std::uint64_t timestamp, std::uint64_t now) const {
  // a clock ahead of ours is tolerated up to one window
  if (timestamp >= now) return timestamp - now > window_secs_;
  return now - timestamp >= window_secs_;
}

AcceptResult PeerTable::Accept(const NodeAdvertisement& advertisement, std::uint64_t now) {
  if (advertisement.node_id() == local_node_id_) return AcceptResult::kSelf;
  if (IsStale(advertisement.timestamp(), now)) return AcceptResult::kStale;

  std::unique_lock lock(mutex_);

  auto it = peers_.find(advertisement.node_id());
  if (it == peers_.end()) {
    peers_.emplace(advertisement.node_id(), advertisement);
    return AcceptResult::kAccepted;
  }

  if (advertisement.timestamp() < it->second.timestamp()) return AcceptResult::kOutOfOrder;

  it->second = advertisement;
  return AcceptResult::kAccepted;
}

std::size_t PeerTable::EvictStale(std::uint64_t now) {
  std::unique_lock lock(mutex_);

  std::size_t removed = 0;
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (IsStale(it->second.timestamp(), now)) {
      it = peers_.erase(it);
      ++removed;
      continue;
    }
    ++it;
  }
  return removed;
}

std::unordered_map<std::string, NodeAdvertisement> PeerTable::Snapshot() const {
  std::shared_lock lock(mutex_);
  return peers_;
}

std::vector<NodeAdvertisement> PeerTable::ByKind(NodeKind kind) const {
  std::shared_lock lock(mutex_);

  std::vector<NodeAdvertisement> out;
  for (const auto& [id, advertisement] : peers_) {
    if (advertisement.kind() == kind) out.push_back(advertisement);
  }
  return out;
}

std::vector<NodeAdvertisement> PeerTable::AvailableRentals() const {
  std::shared_lock lock(mutex_);

  std::vector<NodeAdvertisement> out;
  for (const auto& [id, advertisement] : peers_) {
    if (advertisement.kind() == eryzaa::discovery::v1::NODE_KIND_RENTAL &&
        advertisement.status() == eryzaa::discovery::v1::NODE_STATUS_AVAILABLE) {
      out.push_back(advertisement);
    }
  }
  return out;
}

std::size_t PeerTable::Size() const {
  std::shared_lock lock(mutex_);
  return peers_.size();
}

} // namespace eryzaa::discovery
