#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "syncore/v1/conflict.pb.h"

namespace syncore::events {
class EventBus;
}

namespace syncore::conflict {

/*
  Durable record of conflicts.

  Open conflicts are parked until someone resolves them; every resolver
  decision, automatic or manual, is appended to the audit trail, which is
  never rewritten. Writers take the caller's transaction so the record lands
  atomically with the operation state change it explains.
*/
class ConflictLedger {
 public:
  ConflictLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventBus> events = nullptr);

  void Park(db::Transaction& tx, const syncore::v1::Conflict& conflict);
  void Close(db::Transaction& tx, const std::string& conflict_id);
  uint64_t Audit(db::Transaction& tx, const syncore::v1::Conflict& conflict, const syncore::v1::Resolution& resolution, bool manual);

  std::vector<syncore::v1::Conflict>     ListOpen() const;
  std::optional<syncore::v1::Conflict>   GetOpen(const std::string& conflict_id) const;
  std::optional<syncore::v1::Conflict>   FindOpenForOperation(const std::string& operation_id) const;
  std::vector<syncore::v1::AuditRecord>  ReadAudit(uint64_t after_seq = 0) const;

  void PublishDetected(const syncore::v1::Conflict& conflict) const;
  void PublishResolved(const syncore::v1::Conflict& conflict, const syncore::v1::Resolution& resolution) const;

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventBus> events_;
};

} // namespace syncore::conflict
