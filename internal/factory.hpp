#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/access/access_broker.hpp"
#include "internal/access/account_gateway.hpp"
#include "internal/access/lease_reaper.hpp"
#include "internal/discovery/discovery_service.hpp"

namespace eryzaa::factory {

/*
  Application

  Owns all long-lived components of a node. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<discovery::DiscoveryService> discovery;
  std::shared_ptr<access::AccessBroker>        broker;
  std::shared_ptr<access::LeaseReaper>         reaper;
};

/*
  Build

  Constructs the node from runtime config. This is the composition root: the
  only place that knows which account gateway backs the broker.
*/
Application Build(const eryzaa::runtime::config::RuntimeConfig& config);

// Local advertisement from the node section; generates node-<uuid> when no id is set.
discovery::NodeAdvertisement BuildLocalAdvertisement(const eryzaa::runtime::config::NodeConfig& node);

// Helper first when compiled in, direct execution otherwise.
std::shared_ptr<access::AccountGateway> BuildAccountGateway(const eryzaa::runtime::config::AccessConfig& config);

// What the privileged helper daemon runs: direct execution without sudo.
std::shared_ptr<access::AccountGateway> BuildHelperBackend(const eryzaa::runtime::config::AccessConfig& config);

} // namespace eryzaa::factory
