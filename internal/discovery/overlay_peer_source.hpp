#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/process/command_runner.hpp"

namespace eryzaa::discovery {

/*
  Source of candidate peer addresses reported by the overlay network daemon.
  Used by on-demand discovery to probe nodes that never broadcast to us.
*/
class OverlayPeerSource {
 public:
  virtual ~OverlayPeerSource() = default;

  virtual std::vector<std::string> ListPeers(const std::string& network_id) = 0;
};

/*
  Runs `<cli> listpeers` and pulls one address out of every line that mentions
  the network id. A missing or failing CLI yields an empty list.
*/
class CliPeerSource final : public OverlayPeerSource {
 public:
  CliPeerSource(std::shared_ptr<eryzaa::process::CommandRunner> runner, std::string cli);

  std::vector<std::string> ListPeers(const std::string& network_id) override;

 private:
  std::shared_ptr<eryzaa::process::CommandRunner> runner_;
  std::string                                     cli_;
};

// Fixed list, for tests and static deployments.
class StaticPeerSource final : public OverlayPeerSource {
 public:
  explicit StaticPeerSource(std::vector<std::string> peers);

  std::vector<std::string> ListPeers(const std::string& network_id) override;

 private:
  std::vector<std::string> peers_;
};

// First whitespace-separated token that parses as an IP address, with any
// "/port" or "/prefix" suffix removed.
std::optional<std::string> ExtractAddress(std::string_view line);

} // namespace eryzaa::discovery
