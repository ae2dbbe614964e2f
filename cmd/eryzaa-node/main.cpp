#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: eryzaa-node <config.yaml> OR eryzaa-node --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = eryzaa::config::ConfigLoader::LoadFromYaml(config_path);

    eryzaa::observability::InitializeLogging(config, "eryzaa-node");
    eryzaa::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = eryzaa::factory::Build(config);

    // Register signal handlers before starting loops to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.discovery->Start();
    app.reaper->Start();
    ERYZAA_LOG_INFO("eryzaa node started", {eryzaa::observability::StringField("node_id", app.discovery->LocalNode().node_id()),
                                            eryzaa::observability::IntField("discovery_port", app.discovery->Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ERYZAA_LOG_INFO("shutting down eryzaa node");

    // tell peers we are gone before the loops stop
    app.discovery->UpdateStatus(eryzaa::discovery::v1::NODE_STATUS_OFFLINE);
    app.discovery->AdvertiseNow();

    const auto revoked = app.broker->RevokeAll();
    if (revoked > 0) {
      ERYZAA_LOG_INFO("revoked leases on shutdown", {eryzaa::observability::IntField("count", static_cast<std::int64_t>(revoked))});
    }

    app.reaper->Stop();
    app.discovery->Stop();

    eryzaa::observability::ShutdownMetrics();
    eryzaa::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ERYZAA_LOG_ERROR("fatal error", {eryzaa::observability::StringField("error", e.what())});
    eryzaa::observability::ShutdownMetrics();
    eryzaa::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
