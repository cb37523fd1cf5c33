#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/grpc/sync_remote_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/remote_store.hpp"
#include "internal/runtime/server.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string server_address = "0.0.0.0:50051";
  uint32_t    schema_version = 1;
  if (argc > 1) {
    server_address = argv[1];
  }
  if (argc > 2) {
    schema_version = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));
  }

  syncore::observability::InitializeLogging(syncore::runtime::config::RuntimeConfig{});

  try {
    auto store = std::make_shared<syncore::remote::RemoteStore>(schema_version);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<syncore::grpc::SyncRemoteServer>(store));

    syncore::runtime::Server server(syncore::runtime::ServerOptions{.bind_address = server_address}, std::move(services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SYNCORE_LOG_INFO("syncore remote started", {syncore::observability::StringField("bind_address", server_address),
                                                syncore::observability::IntField("schema_version", schema_version)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    SYNCORE_LOG_INFO("Shutting down syncore remote", {syncore::observability::IntField("changes", static_cast<int64_t>(store->LogSize()))});
    server.Stop();
  } catch (const std::exception& e) {
    std::cerr << "syncore-remote: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
