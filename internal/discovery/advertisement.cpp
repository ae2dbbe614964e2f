#include "internal/discovery/advertisement.hpp"

#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace eryzaa::discovery {

using eryzaa::util::InvalidArgument;
using eryzaa::util::SerializationError;

std::string Serialize(const NodeAdvertisement& advertisement) {
  std::string out;
  if (!advertisement.SerializeToString(&out)) {
    throw SerializationError("failed to serialize advertisement for node " + advertisement.node_id());
  }
  return out;
}

NodeAdvertisement Deserialize(std::string_view bytes) {
  if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw SerializationError("advertisement datagram too large");
  }

  NodeAdvertisement advertisement;
  if (!advertisement.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw SerializationError("malformed advertisement datagram");
  }
  if (advertisement.protocol_version() == 0) {
    throw SerializationError("advertisement carries no protocol version");
  }
  if (advertisement.node_id().empty()) {
    throw SerializationError("advertisement carries no node id");
  }
  return advertisement;
}

namespace {

NodeAdvertisement MakeAdvertisement(NodeKind kind, const std::string& node_id, const std::string& ip_address,
                                    const std::optional<std::string>& overlay_address, const std::string& network_id) {
  NodeAdvertisement advertisement;
  advertisement.set_protocol_version(kProtocolVersion);
  advertisement.set_node_id(node_id);
  advertisement.set_kind(kind);
  advertisement.set_ip_address(ip_address);
  if (overlay_address) {
    advertisement.set_overlay_address(*overlay_address);
  }
  advertisement.set_ssh_port(kDefaultSshPort);
  advertisement.set_api_port(kDefaultApiPort);
  advertisement.set_status(eryzaa::discovery::v1::NODE_STATUS_AVAILABLE);
  advertisement.set_timestamp(eryzaa::util::NowUnixSeconds());
  advertisement.set_network_id(network_id);
  return advertisement;
}

} // namespace

NodeAdvertisement MakeRentalAdvertisement(const std::string& node_id, const std::string& ip_address,
                                          const std::optional<std::string>& overlay_address, const NodeCapabilities& capabilities,
                                          const std::string& network_id) {
  auto advertisement = MakeAdvertisement(eryzaa::discovery::v1::NODE_KIND_RENTAL, node_id, ip_address, overlay_address, network_id);
  *advertisement.mutable_capabilities() = capabilities;
  return advertisement;
}

NodeAdvertisement MakeClientAdvertisement(const std::string& node_id, const std::string& ip_address,
                                          const std::optional<std::string>& overlay_address, const std::string& network_id) {
  auto advertisement = MakeAdvertisement(eryzaa::discovery::v1::NODE_KIND_CLIENT, node_id, ip_address, overlay_address, network_id);
  // clients advertise an explicitly empty capability block
  advertisement.mutable_capabilities();
  return advertisement;
}

std::string_view KindName(NodeKind kind) {
  switch (kind) {
    case eryzaa::discovery::v1::NODE_KIND_RENTAL:
      return "rental";
    case eryzaa::discovery::v1::NODE_KIND_CLIENT:
      return "client";
    case eryzaa::discovery::v1::NODE_KIND_COORDINATOR:
      return "coordinator";
    default:
      return "unspecified";
  }
}

std::string_view StatusName(NodeStatus status) {
  switch (status) {
    case eryzaa::discovery::v1::NODE_STATUS_AVAILABLE:
      return "available";
    case eryzaa::discovery::v1::NODE_STATUS_BUSY:
      return "busy";
    case eryzaa::discovery::v1::NODE_STATUS_MAINTENANCE:
      return "maintenance";
    case eryzaa::discovery::v1::NODE_STATUS_OFFLINE:
      return "offline";
    default:
      return "unspecified";
  }
}

NodeKind ParseKind(std::string_view name) {
  if (name == "rental") return eryzaa::discovery::v1::NODE_KIND_RENTAL;
  if (name == "client") return eryzaa::discovery::v1::NODE_KIND_CLIENT;
  if (name == "coordinator") return eryzaa::discovery::v1::NODE_KIND_COORDINATOR;
  throw InvalidArgument("unknown node kind: " + std::string(name));
}

} // namespace eryzaa::discovery
