#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eryzaa::discovery {

struct Endpoint {
  std::string   address;
  std::uint16_t port = 0;
};

// "a.b.c.d" or "a.b.c.d:port"; throws InvalidArgument on anything else.
Endpoint ParseEndpoint(std::string_view text, std::uint16_t default_port);

bool IsIPv4Address(std::string_view text);
bool IsMulticastAddress(std::string_view text);

struct Datagram {
  std::string payload;
  Endpoint    from;
};

/*
  Owning wrapper around an IPv4 datagram socket.

  Setup failures throw BindError. Send and receive report failure through
  their return values so the discovery loops can keep going.
*/
class UdpSocket {
 public:
  UdpSocket();
  ~UdpSocket();

  UdpSocket(const UdpSocket&)            = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  UdpSocket(UdpSocket&& other) noexcept;
  UdpSocket& operator=(UdpSocket&& other) noexcept;

  void SetReuseAddress(bool enabled);
  void SetBroadcast(bool enabled);
  void Bind(const std::string& address, std::uint16_t port);

  // Returns false when the host has no route for the group.
  bool JoinMulticastGroup(const std::string& group);

  std::uint16_t LocalPort() const;

  bool SendTo(std::string_view payload, const Endpoint& to);

  // Waits at most `timeout` for one datagram.
  std::optional<Datagram> Receive(std::chrono::milliseconds timeout);

 private:
  void Close() noexcept;

  int fd_ = -1;
};

} // namespace eryzaa::discovery
