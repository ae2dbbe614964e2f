#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "eryzaa/node/v1.hpp"

namespace eryzaa::discovery {

using eryzaa::discovery::v1::NodeAdvertisement;
using eryzaa::discovery::v1::NodeCapabilities;
using eryzaa::discovery::v1::NodeKind;
using eryzaa::discovery::v1::NodeStatus;

inline constexpr std::uint32_t    kProtocolVersion = 1;
inline constexpr std::string_view kProbeToken      = "DISCOVER";

inline constexpr std::uint32_t kDefaultSshPort = 22;
inline constexpr std::uint32_t kDefaultApiPort = 8080;

/*
  Wire codec for one advertisement datagram.

  Both directions throw SerializationError; the listener catches it and drops
  the packet.
*/
std::string       Serialize(const NodeAdvertisement& advertisement);
NodeAdvertisement Deserialize(std::string_view bytes);

NodeAdvertisement MakeRentalAdvertisement(const std::string& node_id, const std::string& ip_address,
                                          const std::optional<std::string>& overlay_address, const NodeCapabilities& capabilities,
                                          const std::string& network_id);

NodeAdvertisement MakeClientAdvertisement(const std::string& node_id, const std::string& ip_address,
                                          const std::optional<std::string>& overlay_address, const std::string& network_id);

std::string_view KindName(NodeKind kind);
std::string_view StatusName(NodeStatus status);

// "rental" | "client" | "coordinator"; throws InvalidArgument otherwise.
NodeKind ParseKind(std::string_view name);

} // namespace eryzaa::discovery
