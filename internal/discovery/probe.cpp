#include "internal/discovery/probe.hpp"

#include "internal/discovery/udp_socket.hpp"
#include "internal/util/errors.hpp"

namespace eryzaa::discovery {

using eryzaa::util::PeerTimeout;

NodeAdvertisement ProbeNode(const std::string& address, std::uint16_t port, std::chrono::milliseconds timeout) {
  const Endpoint target{address, port};
  const auto     target_text = address + ":" + std::to_string(port);

  UdpSocket socket;
  socket.Bind("0.0.0.0", 0);

  if (!socket.SendTo(kProbeToken, target)) {
    throw PeerTimeout("probe of " + target_text + " could not be sent");
  }

  auto reply = socket.Receive(timeout);
  if (!reply) {
    throw PeerTimeout("probe of " + target_text + " timed out");
  }

  try {
    return Deserialize(reply->payload);
  } catch (const eryzaa::util::SerializationError& e) {
    throw PeerTimeout("probe of " + target_text + " got a malformed reply: " + e.what());
  }
}

} // namespace eryzaa::discovery
