#include "internal/discovery/udp_socket.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using eryzaa::discovery::Endpoint;
using eryzaa::discovery::ParseEndpoint;
using eryzaa::discovery::UdpSocket;

void TestParseEndpoint() {
  const auto bare = ParseEndpoint("10.242.0.255", 9999);
  assert(bare.address == "10.242.0.255");
  assert(bare.port == 9999);

  const auto with_port = ParseEndpoint("127.0.0.1:47001", 9999);
  assert(with_port.address == "127.0.0.1");
  assert(with_port.port == 47001);

  for (const char* bad : {"localhost", "10.0.0.1:", "10.0.0.1:70000", "10.0.0.1:0", "10.0.0.1:abc", "::1"}) {
    bool threw = false;
    try {
      (void)ParseEndpoint(bad, 9999);
    } catch (const eryzaa::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestAddressClassification() {
  assert(eryzaa::discovery::IsIPv4Address("192.168.191.255"));
  assert(!eryzaa::discovery::IsIPv4Address("192.168.191"));
  assert(eryzaa::discovery::IsMulticastAddress("239.255.255.250"));
  assert(eryzaa::discovery::IsMulticastAddress("224.0.0.1"));
  assert(!eryzaa::discovery::IsMulticastAddress("10.0.0.1"));
  assert(!eryzaa::discovery::IsMulticastAddress("not-an-address"));
}

void TestLoopbackSendAndReceive() {
  UdpSocket receiver;
  receiver.Bind("127.0.0.1", 0);
  const auto port = receiver.LocalPort();
  assert(port != 0);

  UdpSocket sender;
  sender.Bind("127.0.0.1", 0);
  assert(sender.SendTo("hello", Endpoint{"127.0.0.1", port}));

  const auto datagram = receiver.Receive(std::chrono::seconds(2));
  assert(datagram.has_value());
  assert(datagram->payload == "hello");
  assert(datagram->from.address == "127.0.0.1");
  assert(datagram->from.port == sender.LocalPort());
}

void TestReceiveTimesOut() {
  UdpSocket socket;
  socket.Bind("127.0.0.1", 0);

  const auto start    = std::chrono::steady_clock::now();
  const auto datagram = socket.Receive(std::chrono::milliseconds(200));
  const auto elapsed  = std::chrono::steady_clock::now() - start;

  assert(!datagram.has_value());
  assert(elapsed >= std::chrono::milliseconds(150));
  assert(elapsed < std::chrono::seconds(2));
}

void TestBindConflictThrows() {
  UdpSocket first;
  first.Bind("127.0.0.1", 0);

  UdpSocket second;
  bool      threw = false;
  try {
    second.Bind("127.0.0.1", first.LocalPort());
  } catch (const eryzaa::util::BindError&) {
    threw = true;
  }
  assert(threw);
}

void TestSendToInvalidAddressFails() {
  UdpSocket socket;
  assert(!socket.SendTo("x", Endpoint{"not-an-address", 9999}));
}

void TestMoveTransfersOwnership() {
  UdpSocket original;
  original.Bind("127.0.0.1", 0);
  const auto port = original.LocalPort();

  UdpSocket moved(std::move(original));
  assert(moved.LocalPort() == port);
}

} // namespace

int main() {
  TestParseEndpoint();
  TestAddressClassification();
  TestLoopbackSendAndReceive();
  TestReceiveTimesOut();
  TestBindConflictThrows();
  TestSendToInvalidAddressFails();
  TestMoveTransfersOwnership();

  std::cout << "eryzaa_unit_udp_socket: pass\n";
  return 0;
}
