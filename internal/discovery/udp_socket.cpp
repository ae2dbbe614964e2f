#include "internal/discovery/udp_socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>

#include "internal/util/errors.hpp"

namespace eryzaa::discovery {

using eryzaa::util::BindError;
using eryzaa::util::InvalidArgument;

namespace {

constexpr std::size_t kMaxDatagram = 65536;

std::string ErrnoText() {
  return std::strerror(errno);
}

sockaddr_in ToSockaddr(const Endpoint& endpoint) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(endpoint.port);
  if (::inet_pton(AF_INET, endpoint.address.c_str(), &addr.sin_addr) != 1) {
    throw InvalidArgument("not an IPv4 address: " + endpoint.address);
  }
  return addr;
}

} // namespace

bool IsIPv4Address(std::string_view text) {
  in_addr addr{};
  return ::inet_pton(AF_INET, std::string(text).c_str(), &addr) == 1;
}

bool IsMulticastAddress(std::string_view text) {
  in_addr addr{};
  if (::inet_pton(AF_INET, std::string(text).c_str(), &addr) != 1) return false;
  return IN_MULTICAST(ntohl(addr.s_addr));
}

Endpoint ParseEndpoint(std::string_view text, std::uint16_t default_port) {
  Endpoint endpoint;
  endpoint.port = default_port;

  const auto colon = text.rfind(':');
  if (colon == std::string_view::npos) {
    endpoint.address = std::string(text);
  } else {
    endpoint.address     = std::string(text.substr(0, colon));
    const auto port_text = text.substr(colon + 1);

    unsigned int port = 0;
    auto [ptr, ec]    = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
      throw InvalidArgument("invalid port in endpoint: " + std::string(text));
    }
    endpoint.port = static_cast<std::uint16_t>(port);
  }

  if (!IsIPv4Address(endpoint.address)) {
    throw InvalidArgument("invalid IPv4 endpoint: " + std::string(text));
  }
  return endpoint;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

UdpSocket::UdpSocket() {
  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    throw BindError("socket() failed: " + ErrnoText());
  }
}

UdpSocket::~UdpSocket() {
  Close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    fd_       = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void UdpSocket::Close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// ------------------------------------------------------------
// Options
// ------------------------------------------------------------

void UdpSocket::SetReuseAddress(bool enabled) {
  int optval = enabled ? 1 : 0;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) != 0) {
    throw BindError("SO_REUSEADDR failed: " + ErrnoText());
  }
}

void UdpSocket::SetBroadcast(bool enabled) {
  int optval = enabled ? 1 : 0;
  if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) != 0) {
    throw BindError("SO_BROADCAST failed: " + ErrnoText());
  }
}

void UdpSocket::Bind(const std::string& address, std::uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port);
  if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    throw BindError("invalid bind address: " + address);
  }

  if (::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw BindError("bind " + address + ":" + std::to_string(port) + " failed: " + ErrnoText());
  }
}

bool UdpSocket::JoinMulticastGroup(const std::string& group) {
  ip_mreq request{};
  if (::inet_pton(AF_INET, group.c_str(), &request.imr_multiaddr) != 1) return false;
  request.imr_interface.s_addr = htonl(INADDR_ANY);

  return ::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &request, sizeof(request)) == 0;
}

std::uint16_t UdpSocket::LocalPort() const {
  sockaddr_in addr{};
  socklen_t   len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

// ------------------------------------------------------------
// I/O
// ------------------------------------------------------------

bool UdpSocket::SendTo(std::string_view payload, const Endpoint& to) {
  sockaddr_in addr{};
  try {
    addr = ToSockaddr(to);
  } catch (const InvalidArgument&) {
    return false;
  }

  const auto sent = ::sendto(fd_, payload.data(), payload.size(), MSG_NOSIGNAL, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  return sent == static_cast<ssize_t>(payload.size());
}

std::optional<Datagram> UdpSocket::Receive(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) return std::nullopt;

    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0 && errno == EINTR) continue;
    if (ready <= 0) return std::nullopt;

    std::array<char, kMaxDatagram> buffer;
    sockaddr_in                    sender{};
    socklen_t                      sender_len = sizeof(sender);

    const auto n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr*>(&sender), &sender_len);
    if (n < 0) {
      // ECONNREFUSED is a queued ICMP error from an earlier send, not a receive failure
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNREFUSED) continue;
      return std::nullopt;
    }

    char ip[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &sender.sin_addr, ip, sizeof(ip));

    Datagram datagram;
    datagram.payload.assign(buffer.data(), static_cast<std::size_t>(n));
    datagram.from.address = ip;
    datagram.from.port    = ntohs(sender.sin_port);
    return datagram;
  }
}

} // namespace eryzaa::discovery
