#include "internal/discovery/overlay_peer_source.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/util/errors.hpp"

namespace {

using eryzaa::discovery::CliPeerSource;
using eryzaa::discovery::ExtractAddress;
using eryzaa::process::CommandResult;
using eryzaa::process::CommandRunner;

class ScriptedRunner final : public CommandRunner {
 public:
  explicit ScriptedRunner(CommandResult result, bool fail_to_start = false)
      : result_(std::move(result)), fail_to_start_(fail_to_start) {
  }

  CommandResult Run(const std::vector<std::string>& argv, const std::string&) override {
    calls.push_back(argv);
    if (fail_to_start_) throw eryzaa::util::CommandFailure("spawn failed");
    return result_;
  }

  std::vector<std::vector<std::string>> calls;

 private:
  CommandResult result_;
  bool          fail_to_start_;
};

void TestExtractAddress() {
  assert(ExtractAddress("200 listpeers 8056c2e21c 10.242.7.9/9993;123;456 12 1.10.2 LEAF") == "10.242.7.9");
  assert(ExtractAddress("peer 2001:db8::7/9993 LEAF") == "2001:db8::7");
  assert(ExtractAddress("10.0.0.3,10.0.0.4") == "10.0.0.3");
  assert(!ExtractAddress("200 listpeers 8056c2e21c - -1 - PLANET").has_value());
  assert(!ExtractAddress("").has_value());
  assert(!ExtractAddress("   ").has_value());
}

void TestListPeersFiltersByNetwork() {
  CommandResult result;
  result.exit_code   = 0;
  result.stdout_text = "200 listpeers <ztaddr> <path> <latency> <version> <role>\n"
                       "200 listpeers a1 10.242.0.11/9993;1;2 5 1.10.2 LEAF net-a\n"
                       "200 listpeers b2 10.242.0.12/9993;1;2 5 1.10.2 LEAF net-b\n"
                       "200 listpeers c3 10.242.0.13/9993;1;2 5 1.10.2 LEAF net-a\n";

  auto          runner = std::make_shared<ScriptedRunner>(result);
  CliPeerSource source(runner, "zerotier-cli");

  const auto peers = source.ListPeers("net-a");
  assert(peers.size() == 2);
  assert(peers[0] == "10.242.0.11");
  assert(peers[1] == "10.242.0.13");

  assert(runner->calls.size() == 1);
  assert(runner->calls[0] == (std::vector<std::string>{"zerotier-cli", "listpeers"}));

  // no network filter
  assert(source.ListPeers("").size() == 3);
}

void TestFailingCliYieldsEmptyList() {
  CommandResult failed;
  failed.exit_code   = 1;
  failed.stderr_text = "zerotier-one not running";
  CliPeerSource exits_nonzero(std::make_shared<ScriptedRunner>(failed), "zerotier-cli");
  assert(exits_nonzero.ListPeers("net").empty());

  CliPeerSource cannot_start(std::make_shared<ScriptedRunner>(CommandResult{}, true), "zerotier-cli");
  assert(cannot_start.ListPeers("net").empty());
}

void TestStaticPeerSource() {
  eryzaa::discovery::StaticPeerSource source({"10.0.0.1", "10.0.0.2"});
  assert(source.ListPeers("anything").size() == 2);
}

} // namespace

int main() {
  TestExtractAddress();
  TestListPeersFiltersByNetwork();
  TestFailingCliYieldsEmptyList();
  TestStaticPeerSource();

  std::cout << "eryzaa_unit_overlay_peer_source: pass\n";
  return 0;
}
