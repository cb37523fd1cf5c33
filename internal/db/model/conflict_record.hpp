#pragma once

#include <cstdint>
#include <string>

namespace syncore::db::model {

// Open (unresolved) conflict. body is a serialized syncore.v1.Conflict.
struct ConflictRecord {
  std::string id;
  std::string operation_id;
  std::string body;
  uint64_t    opened_at_ms = 0;
};

// Immutable audit row. body is a serialized syncore.v1.AuditRecord.
struct AuditRow {
  uint64_t    seq = 0;
  std::string conflict_id;
  std::string body;
  uint64_t    recorded_at_ms = 0;
};

}
