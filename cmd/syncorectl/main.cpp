#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/factory.hpp"
#include "internal/model/priority.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using namespace syncore::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  syncorectl <config.yaml> status\n"
            << "  syncorectl <config.yaml> list\n"
            << "  syncorectl <config.yaml> enqueue <kind> <priority=critical|high|medium|low|background> <payload> [target_key]\n"
            << "  syncorectl <config.yaml> cancel <operation_id>\n"
            << "  syncorectl <config.yaml> conflicts\n"
            << "  syncorectl <config.yaml> resolve <conflict_id> <keep_local|keep_remote|merged> [merged_value]\n"
            << "  syncorectl <config.yaml> audit [after_seq]\n"
            << "  syncorectl <config.yaml> cache-stats\n"
            << "  syncorectl <config.yaml> cache-query [tag|-] [priority]\n"
            << "  syncorectl <config.yaml> compact\n"
            << "  syncorectl <config.yaml> pause\n"
            << "  syncorectl <config.yaml> resume\n"
            << "  syncorectl <config.yaml> sync [max_batch]\n";
}

static void Print(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  std::cout << json;
}

static std::optional<ResolutionKind> ParseResolution(const std::string& value) {
  if (value == "keep_local") return RESOLUTION_KIND_KEEP_LOCAL;
  if (value == "keep_remote") return RESOLUTION_KIND_KEEP_REMOTE;
  if (value == "merged") return RESOLUTION_KIND_MERGED;
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = syncore::config::ConfigLoader::LoadFromYaml(config_path);
    syncore::observability::InitializeLogging(config);

    auto  runtime = syncore::factory::BuildRuntime(config);
    auto& service = *runtime.service;

    if (cmd == "status") {
      Print(service.Status());
    } else if (cmd == "list") {
      for (const auto& op : service.ListOperations()) {
        Print(op);
      }
    } else if (cmd == "enqueue") {
      if (argc < 6) {
        Usage();
        return 1;
      }
      auto priority = syncore::model::ParsePriority(argv[4]);
      if (!priority) {
        std::cerr << "unknown priority: " << argv[4] << "\n";
        return 1;
      }
      syncore::service::EnqueueRequest request;
      request.kind     = argv[3];
      request.priority = *priority;
      request.payload  = argv[5];
      if (argc > 6) request.target_key = argv[6];
      std::cout << service.Enqueue(request) << "\n";
    } else if (cmd == "cancel") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      const bool cancelled = service.Cancel(argv[3]);
      std::cout << (cancelled ? "cancelled" : "not cancellable") << "\n";
      if (!cancelled) return 3;
    } else if (cmd == "conflicts") {
      for (const auto& conflict : service.OpenConflicts()) {
        Print(conflict);
      }
    } else if (cmd == "resolve") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      auto kind = ParseResolution(argv[4]);
      if (!kind) {
        std::cerr << "unknown resolution: " << argv[4] << "\n";
        return 1;
      }
      Print(service.ResolveConflict(argv[3], *kind, argc > 5 ? argv[5] : ""));
    } else if (cmd == "audit") {
      const uint64_t after = argc > 3 ? std::strtoull(argv[3], nullptr, 10) : 0;
      for (const auto& record : service.Audit(after)) {
        Print(record);
      }
    } else if (cmd == "cache-stats") {
      Print(service.CacheStatus());
    } else if (cmd == "cache-query") {
      CacheQuery query;
      if (argc > 3 && std::string(argv[3]) != "-") query.set_tag(argv[3]);
      if (argc > 4) {
        auto priority = syncore::model::ParsePriority(argv[4]);
        if (!priority) {
          std::cerr << "unknown priority: " << argv[4] << "\n";
          return 1;
        }
        query.set_priority(*priority);
      }
      for (const auto& entry : service.QueryCache(query)) {
        Print(entry);
      }
    } else if (cmd == "pause") {
      service.PauseQueue();
      std::cout << "paused\n";
    } else if (cmd == "resume") {
      service.ResumeQueue();
      std::cout << "resumed\n";
    } else if (cmd == "compact") {
      for (const auto& key : service.CompactCache()) {
        std::cout << key << "\n";
      }
    } else if (cmd == "sync") {
      std::optional<uint32_t> max_batch;
      if (argc > 3) max_batch = static_cast<uint32_t>(std::strtoul(argv[3], nullptr, 10));
      // one-shot administrative session: treat the device as connected
      runtime.context.monitor->Report(NETWORK_CLASS_WIFI, 100.0, true);
      Print(service.Sync(max_batch));
    } else {
      Usage();
      return 1;
    }

    service.Checkpoint();
  } catch (const syncore::util::ValidationError& e) {
    std::cerr << "invalid request: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "syncorectl: " << e.what() << "\n";
    return 2;
  }

  return 0;
}
