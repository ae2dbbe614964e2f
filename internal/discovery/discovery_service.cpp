#include "internal/discovery/discovery_service.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/discovery/probe.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace eryzaa::discovery {

using eryzaa::observability::IntField;
using eryzaa::observability::Metrics;
using eryzaa::observability::StringField;
using eryzaa::util::BindError;

namespace {

std::vector<Endpoint> BuildTargets(const DiscoverySettings& settings) {
  if (!IsMulticastAddress(settings.multicast_group)) {
    throw BindError("invalid multicast group: " + settings.multicast_group);
  }

  std::vector<Endpoint> targets;
  targets.push_back(Endpoint{settings.multicast_group, settings.port});
  for (const auto& text : settings.broadcast_addresses) {
    targets.push_back(ParseEndpoint(text, settings.port));
  }
  return targets;
}

std::string ToText(const Endpoint& endpoint) {
  return endpoint.address + ":" + std::to_string(endpoint.port);
}

std::string_view OutcomeName(AcceptResult result) {
  switch (result) {
    case AcceptResult::kAccepted:
      return "accepted";
    case AcceptResult::kSelf:
      return "self";
    case AcceptResult::kStale:
      return "stale";
    case AcceptResult::kOutOfOrder:
      return "out_of_order";
  }
  return "unknown";
}

} // namespace

DiscoverySettings DiscoverySettings::FromConfig(const eryzaa::runtime::config::DiscoveryConfig& config) {
  using eryzaa::util::FromProto;

  DiscoverySettings settings;
  if (!config.bind_address().empty()) settings.bind_address = config.bind_address();
  if (config.port() != 0) {
    if (config.port() > 65535) {
      throw eryzaa::util::InvalidArgument("discovery port out of range: " + std::to_string(config.port()));
    }
    settings.port = static_cast<std::uint16_t>(config.port());
  }
  if (!config.multicast_group().empty()) settings.multicast_group = config.multicast_group();
  if (config.broadcast_addresses_size() > 0) {
    settings.broadcast_addresses.assign(config.broadcast_addresses().begin(), config.broadcast_addresses().end());
  }

  if (config.has_advertise_interval()) settings.advertise_interval = FromProto(config.advertise_interval());
  if (config.has_janitor_interval()) settings.janitor_interval = FromProto(config.janitor_interval());
  if (config.has_receive_timeout()) settings.receive_timeout = FromProto(config.receive_timeout());
  if (config.has_probe_timeout()) settings.probe_timeout = FromProto(config.probe_timeout());
  if (config.has_staleness_window()) {
    settings.staleness_window = std::chrono::duration_cast<std::chrono::seconds>(FromProto(config.staleness_window()));
  }
  return settings;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

DiscoveryService::DiscoveryService(NodeAdvertisement local, DiscoverySettings settings, std::shared_ptr<OverlayPeerSource> peer_source)
    : settings_(std::move(settings)),
      targets_(BuildTargets(settings_)),
      peer_source_(std::move(peer_source)),
      local_(std::move(local)),
      peers_(local_.node_id(), settings_.staleness_window) {
  if (local_.protocol_version() == 0) local_.set_protocol_version(kProtocolVersion);

  socket_.SetReuseAddress(true);
  socket_.SetBroadcast(true);
  socket_.Bind(settings_.bind_address, settings_.port);
  port_ = socket_.LocalPort();

  if (!socket_.JoinMulticastGroup(settings_.multicast_group)) {
    ERYZAA_LOG_WARN("could not join multicast group", {StringField("group", settings_.multicast_group)});
  }

  ERYZAA_LOG_INFO("discovery socket bound", {StringField("node_id", local_.node_id()),
                                             StringField("bind_address", settings_.bind_address),
                                             IntField("port", port_)});
}

DiscoveryService::~DiscoveryService() {
  Stop();
}

void DiscoveryService::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(stop_mutex_);
    stop_requested_ = false;
  }

  advertiser_ = std::thread(&DiscoveryService::AdvertiseLoop, this);
  listener_   = std::thread(&DiscoveryService::ListenLoop, this);
  janitor_    = std::thread(&DiscoveryService::JanitorLoop, this);

  ERYZAA_LOG_INFO("discovery started", {StringField("node_id", LocalNode().node_id())});
}

void DiscoveryService::Stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (advertiser_.joinable()) advertiser_.join();
  if (listener_.joinable()) listener_.join();
  if (janitor_.joinable()) janitor_.join();

  ERYZAA_LOG_INFO("discovery stopped");
}

bool DiscoveryService::Running() const {
  return running_.load();
}

bool DiscoveryService::WaitForStop(std::chrono::milliseconds interval) {
  std::unique_lock lock(stop_mutex_);
  return stop_cv_.wait_for(lock, interval, [this] { return stop_requested_; });
}

bool DiscoveryService::StopRequested() {
  std::lock_guard lock(stop_mutex_);
  return stop_requested_;
}

// ------------------------------------------------------------
// Loops
// ------------------------------------------------------------

void DiscoveryService::AdvertiseLoop() {
  do {
    AdvertiseNow();
  } while (!WaitForStop(settings_.advertise_interval));
}

void DiscoveryService::ListenLoop() {
  while (!StopRequested()) {
    auto datagram = socket_.Receive(settings_.receive_timeout);
    if (!datagram) continue;
    HandleDatagram(*datagram);
  }
}

void DiscoveryService::JanitorLoop() {
  while (!WaitForStop(settings_.janitor_interval)) {
    EvictStaleNow();
  }
}

void DiscoveryService::HandleDatagram(const Datagram& datagram) {
  if (datagram.payload == kProbeToken) {
    const auto reply = Serialize(LocalNode());
    if (!socket_.SendTo(reply, datagram.from)) {
      ERYZAA_LOG_DEBUG("probe reply failed", {StringField("to", ToText(datagram.from))});
    }
    Metrics::Instance().RecordDatagram("probe");
    return;
  }

  NodeAdvertisement advertisement;
  try {
    advertisement = Deserialize(datagram.payload);
  } catch (const eryzaa::util::SerializationError& e) {
    ERYZAA_LOG_DEBUG("dropped datagram", {StringField("from", ToText(datagram.from)), StringField("error", e.what())});
    Metrics::Instance().RecordDatagram("malformed");
    return;
  }

  const auto result = peers_.Accept(advertisement, eryzaa::util::NowUnixSeconds());
  Metrics::Instance().RecordDatagram(OutcomeName(result));

  if (result == AcceptResult::kAccepted) {
    Metrics::Instance().SetPeerCount(static_cast<std::int64_t>(peers_.Size()));
  } else if (result != AcceptResult::kSelf) {
    ERYZAA_LOG_DEBUG("ignored advertisement", {StringField("node_id", advertisement.node_id()),
                                               StringField("reason", OutcomeName(result))});
  }
}

// ------------------------------------------------------------
// Peer queries
// ------------------------------------------------------------

std::unordered_map<std::string, NodeAdvertisement> DiscoveryService::GetDiscoveredNodes() const {
  return peers_.Snapshot();
}

std::vector<NodeAdvertisement> DiscoveryService::GetNodesByType(NodeKind kind) const {
  return peers_.ByKind(kind);
}

std::vector<NodeAdvertisement> DiscoveryService::GetAvailableRentals() const {
  return peers_.AvailableRentals();
}

// ------------------------------------------------------------
// Local record
// ------------------------------------------------------------

void DiscoveryService::RefreshTimestampLocked() {
  local_.set_timestamp(std::max(eryzaa::util::NowUnixSeconds(), local_.timestamp()));
}

void DiscoveryService::UpdateStatus(NodeStatus status) {
  std::lock_guard lock(local_mutex_);
  local_.set_status(status);
  RefreshTimestampLocked();
}

void DiscoveryService::UpdateCapabilities(const NodeCapabilities& capabilities) {
  std::lock_guard lock(local_mutex_);
  *local_.mutable_capabilities() = capabilities;
  RefreshTimestampLocked();
}

NodeAdvertisement DiscoveryService::LocalNode() const {
  std::lock_guard lock(local_mutex_);
  return local_;
}

std::size_t DiscoveryService::AdvertiseNow() {
  std::string payload;
  try {
    std::lock_guard lock(local_mutex_);
    RefreshTimestampLocked();
    payload = Serialize(local_);
  } catch (const eryzaa::util::SerializationError& e) {
    ERYZAA_LOG_DEBUG("advertisement not serialized", {StringField("error", e.what())});
    return 0;
  }

  std::size_t sent = 0;
  for (const auto& target : targets_) {
    const bool ok = socket_.SendTo(payload, target);
    Metrics::Instance().RecordAdvertisementSent(target.address, ok);
    if (ok) {
      ++sent;
    } else {
      ERYZAA_LOG_DEBUG("advertisement send failed", {StringField("to", ToText(target))});
    }
  }
  return sent;
}

std::size_t DiscoveryService::EvictStaleNow() {
  const auto removed = peers_.EvictStale(eryzaa::util::NowUnixSeconds());
  if (removed > 0) {
    ERYZAA_LOG_DEBUG("evicted stale peers", {IntField("count", static_cast<std::int64_t>(removed))});
  }
  Metrics::Instance().SetPeerCount(static_cast<std::int64_t>(peers_.Size()));
  return removed;
}

std::vector<NodeAdvertisement> DiscoveryService::DiscoverOnDemand(const std::string& network_id) {
  std::vector<NodeAdvertisement> discovered;
  if (!peer_source_) return discovered;

  const auto local_id = LocalNode().node_id();

  std::unordered_set<std::string> seen;
  for (const auto& address : peer_source_->ListPeers(network_id)) {
    if (!seen.insert(address).second) continue;

    try {
      auto node = ProbeNode(address, settings_.port, settings_.probe_timeout);
      if (node.node_id() == local_id) continue;
      discovered.push_back(std::move(node));
    } catch (const eryzaa::util::PeerTimeout& e) {
      ERYZAA_LOG_DEBUG("probe skipped", {StringField("address", address), StringField("error", e.what())});
    }
  }

  ERYZAA_LOG_INFO("on-demand discovery finished", {StringField("network_id", network_id),
                                                   IntField("probed", static_cast<std::int64_t>(seen.size())),
                                                   IntField("found", static_cast<std::int64_t>(discovered.size()))});
  return discovered;
}

std::uint16_t DiscoveryService::Port() const {
  return port_;
}

} // namespace eryzaa::discovery
