#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/discovery/advertisement.hpp"

namespace eryzaa::discovery {

/*
  Directed probe: sends the DISCOVER token from an ephemeral port to
  address:port and waits up to `timeout` for one advertisement back.

  Throws PeerTimeout when nothing usable arrives in time, including when the
  reply does not parse.
*/
NodeAdvertisement ProbeNode(const std::string& address, std::uint16_t port, std::chrono::milliseconds timeout);

} // namespace eryzaa::discovery
