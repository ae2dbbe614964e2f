#include "internal/discovery/overlay_peer_source.hpp"

#include <arpa/inet.h>

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eryzaa::discovery {

namespace {

bool IsIpAddress(const std::string& text) {
  in_addr  v4{};
  in6_addr v6{};
  return ::inet_pton(AF_INET, text.c_str(), &v4) == 1 || ::inet_pton(AF_INET6, text.c_str(), &v6) == 1;
}

} // namespace

CliPeerSource::CliPeerSource(std::shared_ptr<eryzaa::process::CommandRunner> runner, std::string cli)
    : runner_(std::move(runner)), cli_(std::move(cli)) {
}

std::vector<std::string> CliPeerSource::ListPeers(const std::string& network_id) {
  std::vector<std::string> peers;

  eryzaa::process::CommandResult result;
  try {
    result = runner_->Run({cli_, "listpeers"});
  } catch (const eryzaa::util::CommandFailure& e) {
    ERYZAA_LOG_WARN("overlay peer listing failed to start", {eryzaa::observability::StringField("cli", cli_),
                                                             eryzaa::observability::StringField("error", e.what())});
    return peers;
  }

  if (!result.Succeeded()) {
    ERYZAA_LOG_WARN("overlay peer listing failed", {eryzaa::observability::StringField("cli", cli_),
                                                    eryzaa::observability::IntField("exit_code", result.exit_code),
                                                    eryzaa::observability::StringField("stderr", result.stderr_text)});
    return peers;
  }

  std::istringstream lines(result.stdout_text);
  std::string        line;
  while (std::getline(lines, line)) {
    if (!network_id.empty() && line.find(network_id) == std::string::npos) continue;
    if (auto address = ExtractAddress(line)) {
      peers.push_back(std::move(*address));
    }
  }

  ERYZAA_LOG_DEBUG("overlay peers listed", {eryzaa::observability::StringField("network_id", network_id),
                                            eryzaa::observability::IntField("count", static_cast<std::int64_t>(peers.size()))});
  return peers;
}

StaticPeerSource::StaticPeerSource(std::vector<std::string> peers) : peers_(std::move(peers)) {
}

std::vector<std::string> StaticPeerSource::ListPeers(const std::string&) {
  return peers_;
}

std::optional<std::string> ExtractAddress(std::string_view line) {
  std::size_t pos = 0;
  while (pos < line.size()) {
    const auto start = line.find_first_not_of(" \t\r,", pos);
    if (start == std::string_view::npos) break;
    auto end = line.find_first_of(" \t\r,", start);
    if (end == std::string_view::npos) end = line.size();

    std::string token(line.substr(start, end - start));
    if (const auto slash = token.find('/'); slash != std::string::npos) {
      token.resize(slash);
    }
    if (!token.empty() && IsIpAddress(token)) {
      return token;
    }
    pos = end;
  }
  return std::nullopt;
}

} // namespace eryzaa::discovery
