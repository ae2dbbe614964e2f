#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/account_helper_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using eryzaa::observability::StringField;
using eryzaa::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

mode_t ParseSocketMode(const std::string& text) {
  std::size_t consumed = 0;
  const auto  mode     = std::stoul(text, &consumed, 8);
  if (consumed != text.size() || mode > 07777) {
    throw std::runtime_error("invalid helper.socket_mode: " + text);
  }
  return static_cast<mode_t>(mode);
}

void RemoveSocketFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    ERYZAA_LOG_WARN("could not remove helper socket", {StringField("path", path.string()), StringField("error", ec.message())});
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: eryzaa-access-helper <config.yaml> OR eryzaa-access-helper --config <config.yaml>" << std::endl;
    return 1;
  }

  std::filesystem::path socket_path;
  bool                  listening = false;
  try {
    auto config = eryzaa::config::ConfigLoader::LoadFromYaml(config_path);
    eryzaa::observability::InitializeLogging(config, "eryzaa-access-helper");

    if (::geteuid() != 0) {
      ERYZAA_LOG_WARN("access helper is not running as root, account commands will likely fail");
    }

    socket_path = config.access().helper_socket();
    const auto mode = ParseSocketMode(config.helper().socket_mode());

    // ------------------------------------------------------------
    // Socket file
    // ------------------------------------------------------------
    if (socket_path.has_parent_path()) std::filesystem::create_directories(socket_path.parent_path());
    if (std::filesystem::exists(socket_path)) {
      ERYZAA_LOG_INFO("removing stale helper socket", {StringField("path", socket_path.string())});
      std::filesystem::remove(socket_path);
    }

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<eryzaa::grpc::AccountHelperServer>(eryzaa::factory::BuildHelperBackend(config.access())));

    Server server("unix:" + socket_path.string(), std::move(services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    listening = true;
    if (::chmod(socket_path.c_str(), mode) != 0) {
      throw std::runtime_error("chmod " + socket_path.string() + " failed: " + std::strerror(errno));
    }
    ERYZAA_LOG_INFO("access helper started", {StringField("socket", socket_path.string()), StringField("mode", config.helper().socket_mode())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ERYZAA_LOG_INFO("shutting down access helper");
    server.Stop();
    RemoveSocketFile(socket_path);
    eryzaa::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ERYZAA_LOG_ERROR("fatal error", {StringField("error", e.what())});
    if (listening) RemoveSocketFile(socket_path);
    eryzaa::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
