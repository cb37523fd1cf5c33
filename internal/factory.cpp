#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "internal/cache/cache_store.hpp"
#include "internal/cache/cipher.hpp"
#include "internal/conflict/conflict_ledger.hpp"
#include "internal/conflict/conflict_resolver.hpp"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/oplog/operation_log.hpp"
#include "internal/policy/policy_gate.hpp"
#include "internal/remote/grpc_remote_endpoint.hpp"
#include "internal/remote/loopback_endpoint.hpp"
#include "internal/remote/remote_store.hpp"
#include "internal/sync/sync_coordinator.hpp"
#if SYNCORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace syncore::factory {

using namespace syncore;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const syncore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SYNCORE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), !database.sqlite().disable_wal());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

cache::CacheStoreOptions BuildCacheOptions(const syncore::runtime::config::CacheConfig& config) {
  cache::CacheStoreOptions options;
  options.size_budget_bytes = config.size_budget_bytes();
  options.default_ttl       = util::FromProto(config.default_ttl(), options.default_ttl);
  if (auto cipher = cache::Cipher::FromHex(config.encryption_key_hex())) {
    options.cipher = std::make_shared<const cache::Cipher>(*cipher);
  }
  options.sensitive_kinds.insert(config.sensitive_kinds().begin(), config.sensitive_kinds().end());
  return options;
}

} // namespace

/*
    Build full sync core dependency graph
*/
Runtime BuildRuntime(const syncore::runtime::config::RuntimeConfig& config, std::shared_ptr<remote::RemoteEndpoint> remote) {
  Runtime runtime;
  auto&   ctx = runtime.context;

  // ------------------------------------------------------------------
  // Persistence + events
  // ------------------------------------------------------------------
  ctx.repository = BuildRepository(config);
  ctx.events     = std::make_shared<events::EventBus>();

  // ------------------------------------------------------------------
  // Operation log
  // ------------------------------------------------------------------
  oplog::OperationLogOptions log_options;
  log_options.max_operations      = config.queue().max_operations();
  log_options.checkpoint_every    = config.queue().checkpoint_every();
  log_options.default_ttl         = util::FromProto(config.queue().default_ttl(), util::Millis(0));
  log_options.completed_retention = config.queue().completed_retention();

  ctx.oplog = std::make_shared<oplog::OperationLog>(ctx.repository, log_options, ctx.events);
  ctx.oplog->Open();
  const auto recovered = ctx.oplog->Recover();
  if (!recovered.empty()) {
    SYNCORE_LOG_INFO("operations recovered after restart", {observability::IntField("count", static_cast<int64_t>(recovered.size()))});
  }

  // ------------------------------------------------------------------
  // Cache
  // ------------------------------------------------------------------
  ctx.cache = std::make_shared<cache::CacheStore>(ctx.repository, BuildCacheOptions(config.cache()), ctx.events);
  ctx.cache->Load();

  // ------------------------------------------------------------------
  // Policy + conflicts
  // ------------------------------------------------------------------
  ctx.gate     = std::make_shared<policy::PolicyGate>(config.policy());
  ctx.resolver = std::make_shared<conflict::ConflictResolver>(conflict::ResolverRules::FromConfig(config.resolver()));
  ctx.ledger   = std::make_shared<conflict::ConflictLedger>(ctx.repository, ctx.events);

  // ------------------------------------------------------------------
  // Remote
  // ------------------------------------------------------------------
  if (!remote) {
    const auto& remote_config = config.remote();
    if (remote_config.has_grpc()) {
      remote = remote::GrpcRemoteEndpoint::Connect(remote_config.grpc().target(), remote_config.grpc().insecure(),
                                                   util::FromProto(config.sync().request_timeout(), util::Millis(15000)));
    } else {
      runtime.loopback_store = std::make_shared<remote::RemoteStore>(config.sync().schema_version());
      remote                 = std::make_shared<remote::LoopbackEndpoint>(runtime.loopback_store);
    }
  }

  // ------------------------------------------------------------------
  // Sync + connectivity
  // ------------------------------------------------------------------
  ctx.coordinator = std::make_shared<sync::SyncCoordinator>(ctx.repository, ctx.oplog, ctx.cache, ctx.gate, ctx.resolver, ctx.ledger,
                                                            std::move(remote), sync::SyncCoordinatorOptions::FromConfig(config.sync()),
                                                            ctx.events);

  ctx.monitor = std::make_shared<connectivity::ConnectivityMonitor>(config.connectivity(), config.policy().low_battery_percent(),
                                                                     config.sync().max_batch(), ctx.events);

  std::weak_ptr<sync::SyncCoordinator>             coordinator = ctx.coordinator;
  std::weak_ptr<connectivity::ConnectivityMonitor> monitor     = ctx.monitor;
  ctx.coordinator->SetContextProvider([monitor] {
    auto locked = monitor.lock();
    return locked ? locked->Context() : policy::PolicyContext{};
  });
  ctx.monitor->SetTrigger([coordinator](uint32_t max_batch) {
    if (auto locked = coordinator.lock()) {
      locked->RunSession(max_batch);
    }
  });

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  runtime.service = std::make_shared<service::SyncService>(ctx);

  SYNCORE_LOG_INFO("sync core ready", {observability::StringField("database", config.database().has_sqlite() ? "sqlite" : "memory"),
                                       observability::StringField("remote", config.remote().has_grpc() ? config.remote().grpc().target() : "loopback")});
  return runtime;
}

} // namespace syncore::factory
