#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/events/event_bus.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#include "syncore/v1/change.pb.h"
#include "syncore/v1/conflict.pb.h"
#include "syncore/v1/operation.pb.h"
#include "syncore/v1/status.pb.h"

namespace syncore::service {

struct EnqueueRequest {
  // generated when empty
  std::string                 id;
  std::string                 kind;
  syncore::v1::Priority       priority = syncore::v1::PRIORITY_UNSPECIFIED;
  std::string                 payload;
  std::vector<std::string>    depends_on;
  std::string                 target_key;
  std::string                 origin_role;
  bool                        requires_review = false;
  // defaults to the cached version of target_key
  std::optional<uint64_t>     base_version;
  std::optional<util::Millis> ttl;
};

/*
  Caller-facing surface of the sync core: operation submission, status,
  conflict administration and the event stream.

  Local calls never depend on network state.
*/
class SyncService {
 public:
  explicit SyncService(ServiceContext ctx);

  std::string Enqueue(const EnqueueRequest& request);
  bool        Cancel(const std::string& id);

  syncore::v1::QueueSnapshot             Status() const;
  std::vector<syncore::v1::Operation>    ListOperations() const;
  std::optional<syncore::v1::Tombstone>  Outcome(const std::string& id) const;

  syncore::v1::SyncOutcome Sync(std::optional<uint32_t> max_batch = std::nullopt);
  bool                     CancelSync();

  // Pausing suspends pushes only; pulls keep the cache fresh.
  void PauseQueue();
  void ResumeQueue();
  bool QueuePaused() const;

  std::vector<syncore::v1::Conflict>    OpenConflicts() const;
  syncore::v1::Resolution               ResolveConflict(const std::string& conflict_id, syncore::v1::ResolutionKind kind,
                                                        const std::string& merged_value = {});
  std::vector<syncore::v1::AuditRecord> Audit(uint64_t after_seq = 0) const;

  syncore::v1::CacheStats  CacheStatus() const;
  std::vector<std::string> CompactCache();
  std::vector<syncore::v1::CacheEntryInfo> QueryCache(const syncore::v1::CacheQuery& query) const;

  uint64_t Subscribe(events::EventBus::Handler handler);
  void     Unsubscribe(uint64_t handle);

  void Checkpoint();

 private:
  ServiceContext ctx_;
};

} // namespace syncore::service
