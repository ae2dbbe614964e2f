#include "internal/discovery/advertisement.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using eryzaa::discovery::Deserialize;
using eryzaa::discovery::NodeAdvertisement;
using eryzaa::discovery::NodeCapabilities;
using eryzaa::discovery::Serialize;
using eryzaa::util::SerializationError;

NodeCapabilities MakeCapabilities() {
  NodeCapabilities caps;
  caps.set_cpu_cores(16);
  caps.set_memory_gb(64);
  caps.set_gpu_count(2);
  caps.set_gpu_memory_gb(48);
  caps.set_disk_space_gb(2000);
  caps.set_network_speed_mbps(1000);
  caps.set_supports_docker(true);
  caps.set_supports_gpu(true);
  caps.set_max_concurrent_jobs(4);
  return caps;
}

bool Rejects(const std::string& bytes) {
  try {
    (void)Deserialize(bytes);
  } catch (const SerializationError&) {
    return true;
  }
  return false;
}

void TestRoundTripPreservesEveryField() {
  auto ad = eryzaa::discovery::MakeRentalAdvertisement("node-a", "10.242.0.5", std::string("10.243.1.7"), MakeCapabilities(), "8056c2e21c000001");
  ad.set_status(eryzaa::discovery::v1::NODE_STATUS_BUSY);
  ad.set_ssh_port(2222);
  ad.set_api_port(9090);
  ad.set_timestamp(1700000000);

  const auto decoded = Deserialize(Serialize(ad));
  assert(google::protobuf::util::MessageDifferencer::Equals(ad, decoded));
  assert(decoded.has_overlay_address());
  assert(decoded.overlay_address() == "10.243.1.7");
  assert(decoded.capabilities().gpu_memory_gb() == 48);
}

void TestAbsentOverlayAddressStaysAbsent() {
  const auto ad      = eryzaa::discovery::MakeClientAdvertisement("client-1", "192.168.1.2", std::nullopt, "net");
  const auto decoded = Deserialize(Serialize(ad));
  assert(!decoded.has_overlay_address());
  assert(decoded.kind() == eryzaa::discovery::v1::NODE_KIND_CLIENT);
  assert(decoded.capabilities().cpu_cores() == 0);
}

void TestFactoryDefaults() {
  const auto ad = eryzaa::discovery::MakeRentalAdvertisement("node-b", "127.0.0.1", std::nullopt, MakeCapabilities(), "net");
  assert(ad.protocol_version() == eryzaa::discovery::kProtocolVersion);
  assert(ad.ssh_port() == 22);
  assert(ad.api_port() == 8080);
  assert(ad.status() == eryzaa::discovery::v1::NODE_STATUS_AVAILABLE);
  assert(ad.timestamp() > 0);
  assert(ad.capabilities().max_concurrent_jobs() == 4);
}

void TestMalformedDatagramsAreRejected() {
  assert(Rejects("\xff\xff\xff"));
  assert(Rejects(std::string(eryzaa::discovery::kProbeToken)));

  auto no_version = eryzaa::discovery::MakeClientAdvertisement("client-2", "127.0.0.1", std::nullopt, "net");
  no_version.clear_protocol_version();
  assert(Rejects(no_version.SerializeAsString()));

  auto no_id = eryzaa::discovery::MakeClientAdvertisement("client-3", "127.0.0.1", std::nullopt, "net");
  no_id.clear_node_id();
  assert(Rejects(no_id.SerializeAsString()));

  assert(Rejects(std::string()));
}

void TestUnknownFieldsFromNewerSendersAreSkipped() {
  const auto ad    = eryzaa::discovery::MakeClientAdvertisement("client-4", "127.0.0.1", std::nullopt, "net");
  auto       bytes = Serialize(ad);
  // field 99, varint, value 1
  bytes += std::string("\x98\x06\x01", 3);

  const auto decoded = Deserialize(bytes);
  assert(decoded.node_id() == "client-4");
}

void TestKindNames() {
  assert(eryzaa::discovery::ParseKind("rental") == eryzaa::discovery::v1::NODE_KIND_RENTAL);
  assert(eryzaa::discovery::ParseKind("coordinator") == eryzaa::discovery::v1::NODE_KIND_COORDINATOR);
  assert(eryzaa::discovery::KindName(eryzaa::discovery::v1::NODE_KIND_CLIENT) == "client");
  assert(eryzaa::discovery::StatusName(eryzaa::discovery::v1::NODE_STATUS_OFFLINE) == "offline");

  bool threw = false;
  try {
    (void)eryzaa::discovery::ParseKind("server");
  } catch (const eryzaa::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRoundTripPreservesEveryField();
  TestAbsentOverlayAddressStaysAbsent();
  TestFactoryDefaults();
  TestMalformedDatagramsAreRejected();
  TestUnknownFieldsFromNewerSendersAreSkipped();
  TestKindNames();

  std::cout << "eryzaa_unit_advertisement: pass\n";
  return 0;
}
