#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/discovery/advertisement.hpp"
#include "internal/discovery/overlay_peer_source.hpp"
#include "internal/discovery/peer_table.hpp"
#include "internal/discovery/udp_socket.hpp"

namespace eryzaa::discovery {

struct DiscoverySettings {
  std::string   bind_address    = "0.0.0.0";
  std::uint16_t port            = 9999;
  std::string   multicast_group = "239.255.255.250";

  // "a.b.c.d" or "a.b.c.d:port"; bare addresses use `port`
  std::vector<std::string> broadcast_addresses = {"10.242.0.255", "10.243.0.255", "192.168.191.255"};

  std::chrono::milliseconds advertise_interval{30000};
  std::chrono::milliseconds janitor_interval{60000};
  std::chrono::milliseconds receive_timeout{1000};
  std::chrono::milliseconds probe_timeout{5000};
  std::chrono::seconds      staleness_window{120};

  static DiscoverySettings FromConfig(const eryzaa::runtime::config::DiscoveryConfig& config);
};

/*
  Advertises the local node and maintains the table of live peers.

  Construction binds the discovery socket (BindError on failure). Start()
  launches three loops:

      advertiser  every advertise_interval, send the local record to the
                  multicast group and every broadcast address
      listener    receive with receive_timeout, answer DISCOVER probes,
                  feed advertisements into the peer table
      janitor     every janitor_interval, evict entries older than the
                  staleness window

  Stop() wakes every loop and joins it. The listener notices within one
  receive_timeout.
*/
class DiscoveryService {
 public:
  DiscoveryService(NodeAdvertisement local, DiscoverySettings settings, std::shared_ptr<OverlayPeerSource> peer_source = nullptr);
  ~DiscoveryService();

  DiscoveryService(const DiscoveryService&)            = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  void Start();
  void Stop();
  bool Running() const;

  // ------------------------------------------------------------
  // Peer queries
  // ------------------------------------------------------------
  std::unordered_map<std::string, NodeAdvertisement> GetDiscoveredNodes() const;
  std::vector<NodeAdvertisement>                     GetNodesByType(NodeKind kind) const;
  std::vector<NodeAdvertisement>                     GetAvailableRentals() const;

  // ------------------------------------------------------------
  // Local record
  // ------------------------------------------------------------
  void              UpdateStatus(NodeStatus status);
  void              UpdateCapabilities(const NodeCapabilities& capabilities);
  NodeAdvertisement LocalNode() const;

  // Sends one advertisement outside the periodic cycle; returns the number of
  // targets the datagram was handed to.
  std::size_t AdvertiseNow();

  // One janitor pass; returns the number of evicted peers.
  std::size_t EvictStaleNow();

  // Probes every overlay peer of `network_id` and returns the ones that answered.
  std::vector<NodeAdvertisement> DiscoverOnDemand(const std::string& network_id);

  std::uint16_t Port() const;

 private:
  void AdvertiseLoop();
  void ListenLoop();
  void JanitorLoop();

  void HandleDatagram(const Datagram& datagram);
  void RefreshTimestampLocked();

  // true once Stop() was requested
  bool WaitForStop(std::chrono::milliseconds interval);
  bool StopRequested();

  const DiscoverySettings            settings_;
  const std::vector<Endpoint>        targets_;
  std::shared_ptr<OverlayPeerSource> peer_source_;

  UdpSocket     socket_;
  std::uint16_t port_ = 0;

  mutable std::mutex local_mutex_;
  NodeAdvertisement  local_;

  PeerTable peers_;

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
  bool                    stop_requested_ = false;

  std::atomic<bool> running_{false};
  std::thread       advertiser_;
  std::thread       listener_;
  std::thread       janitor_;
};

} // namespace eryzaa::discovery
