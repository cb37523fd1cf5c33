#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/cache/cache_store.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/oplog/operation_log.hpp"
#include "internal/sync/sync_coordinator.hpp"

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
    std::cerr << "Usage: syncore-agent <config.yaml> OR syncore-agent --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = syncore::config::ConfigLoader::LoadFromYaml(config_path);

    syncore::observability::InitializeTracing(config);
    syncore::observability::InitializeMetrics(config);
    syncore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build sync core (dependency graph)
    // ------------------------------------------------------------
    auto  runtime = syncore::factory::BuildRuntime(config);
    auto& ctx     = runtime.context;

    ctx.events->Subscribe([](const syncore::v1::Event& event) {
      SYNCORE_LOG_DEBUG("event", {syncore::observability::StringField("type", syncore::events::EventName(event.type())),
                                  syncore::observability::StringField("subject", event.subject_id()),
                                  syncore::observability::StringField("reason", event.reason())});
    });

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // Standalone agent: no platform reports device state, assume a charged
    // wifi connection.
    ctx.monitor->Report(syncore::v1::NETWORK_CLASS_WIFI, 100.0, true);
    ctx.monitor->Start();

    SYNCORE_LOG_INFO("syncore agent started", {syncore::observability::StringField("config", config_path)});

    const auto compact_interval = syncore::util::FromProto(config.cache().compact_interval(), std::chrono::minutes(10));
    auto       next_compact     = std::chrono::steady_clock::now() + compact_interval;
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(500));
      if (std::chrono::steady_clock::now() >= next_compact) {
        const auto removed = ctx.cache->Compact();
        if (!removed.empty()) {
          SYNCORE_LOG_INFO("cache compacted", {syncore::observability::IntField("removed", static_cast<int64_t>(removed.size()))});
        }
        next_compact = std::chrono::steady_clock::now() + compact_interval;
      }
    }

    SYNCORE_LOG_INFO("Shutting down syncore agent");

    ctx.coordinator->CancelSession();
    ctx.monitor->Stop();
    ctx.oplog->Checkpoint();

    syncore::observability::ShutdownLogging();
    syncore::observability::ShutdownMetrics();
    syncore::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SYNCORE_LOG_ERROR("Fatal error", {syncore::observability::StringField("error", e.what())});
    syncore::observability::ShutdownLogging();
    syncore::observability::ShutdownMetrics();
    syncore::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
