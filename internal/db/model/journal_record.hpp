#pragma once

#include <cstdint>
#include <string>

namespace syncore::db::model {

/*
  One append-only journal row.

  body is a serialized syncore.v1.JournalEntry. entry_type mirrors
  JournalEntryType so rows can be filtered without decoding.
*/
struct JournalRecord {
  uint64_t    seq = 0;
  std::string op_id;
  int         entry_type = 0;
  std::string body;
  uint64_t    appended_at_ms = 0;
};

/*
  Single-row checkpoint. body is a serialized syncore.v1.OperationCheckpoint
  covering every journal row with seq <= last_seq.
*/
struct CheckpointRecord {
  uint64_t    last_seq = 0;
  std::string body;
  uint64_t    taken_at_ms = 0;
};

}
