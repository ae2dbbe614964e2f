#include "internal/factory.hpp"

#include <chrono>
#include <optional>
#include <string>

#include "internal/access/direct_account_gateway.hpp"
#include "internal/access/probing_account_gateway.hpp"
#include "internal/discovery/overlay_peer_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#if ERYZAA_WITH_HELPER_RPC
#include "internal/access/helper_account_gateway.hpp"
#endif

namespace eryzaa::factory {

using namespace eryzaa;
using eryzaa::observability::BoolField;
using eryzaa::observability::StringField;

namespace {

discovery::NodeCapabilities ToCapabilities(const eryzaa::runtime::config::CapabilitiesConfig& config) {
  discovery::NodeCapabilities caps;
  caps.set_cpu_cores(config.cpu_cores());
  caps.set_memory_gb(config.memory_gb());
  caps.set_gpu_count(config.gpu_count());
  caps.set_gpu_memory_gb(config.gpu_memory_gb());
  caps.set_disk_space_gb(config.disk_space_gb());
  caps.set_network_speed_mbps(config.network_speed_mbps());
  caps.set_supports_docker(config.supports_docker());
  caps.set_supports_gpu(config.supports_gpu());
  caps.set_max_concurrent_jobs(config.max_concurrent_jobs());
  return caps;
}

access::DirectGatewayOptions DirectOptions(const eryzaa::runtime::config::AccessConfig& config, bool use_sudo) {
  access::DirectGatewayOptions options;
  options.use_sudo         = use_sudo;
  options.login_shell      = config.login_shell();
  options.privileged_group = config.privileged_group();
  return options;
}

} // namespace

discovery::NodeAdvertisement BuildLocalAdvertisement(const eryzaa::runtime::config::NodeConfig& node) {
  const auto node_id = node.node_id().empty() ? "node-" + util::ToString(util::GenerateUUID()) : node.node_id();

  std::optional<std::string> overlay;
  if (!node.overlay_address().empty()) overlay = node.overlay_address();

  const auto kind = discovery::ParseKind(node.kind());

  discovery::NodeAdvertisement local;
  if (kind == discovery::v1::NODE_KIND_RENTAL) {
    local = discovery::MakeRentalAdvertisement(node_id, node.ip_address(), overlay, ToCapabilities(node.capabilities()), node.network_id());
  } else {
    local = discovery::MakeClientAdvertisement(node_id, node.ip_address(), overlay, node.network_id());
    local.set_kind(kind);
  }

  if (node.ssh_port() != 0) local.set_ssh_port(node.ssh_port());
  if (node.api_port() != 0) local.set_api_port(node.api_port());
  return local;
}

std::shared_ptr<access::AccountGateway> BuildHelperBackend(const eryzaa::runtime::config::AccessConfig& config) {
  return std::make_shared<access::DirectAccountGateway>(std::make_shared<process::PosixCommandRunner>(), DirectOptions(config, false));
}

std::shared_ptr<access::AccountGateway> BuildAccountGateway(const eryzaa::runtime::config::AccessConfig& config) {
  auto direct = std::make_shared<access::DirectAccountGateway>(std::make_shared<process::PosixCommandRunner>(),
                                                               DirectOptions(config, config.use_sudo()));
#if ERYZAA_WITH_HELPER_RPC
  auto helper = std::make_shared<access::HelperAccountGateway>(config.helper_socket(), util::FromProto(config.helper_timeout()));
  return std::make_shared<access::ProbingAccountGateway>(std::move(helper), std::move(direct));
#else
  ERYZAA_LOG_INFO("helper RPC not built, using direct account commands");
  return std::make_shared<access::ProbingAccountGateway>(nullptr, std::move(direct));
#endif
}

/*
    Build full application dependency graph
*/
Application Build(const eryzaa::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------------
  auto peer_source = std::make_shared<discovery::CliPeerSource>(std::make_shared<process::PosixCommandRunner>(),
                                                                config.discovery().overlay_cli());

  app.discovery = std::make_shared<discovery::DiscoveryService>(BuildLocalAdvertisement(config.node()),
                                                                discovery::DiscoverySettings::FromConfig(config.discovery()),
                                                                std::move(peer_source));

  // ------------------------------------------------------------------
  // Access
  // ------------------------------------------------------------------
  const auto default_lease = std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(config.access().default_lease()));
  app.broker = std::make_shared<access::AccessBroker>(BuildAccountGateway(config.access()), default_lease);
  app.reaper = std::make_shared<access::LeaseReaper>(app.broker, util::FromProto(config.access().cleanup_interval()));

  ERYZAA_LOG_INFO("node assembled", {StringField("node_id", app.discovery->LocalNode().node_id()),
                                     StringField("kind", discovery::KindName(app.discovery->LocalNode().kind())),
                                     BoolField("helper_rpc", ERYZAA_WITH_HELPER_RPC != 0)});
  return app;
}

} // namespace eryzaa::factory
