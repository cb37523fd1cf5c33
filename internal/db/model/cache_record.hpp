#pragma once

#include <cstdint>
#include <string>

namespace syncore::db::model {

// body is a serialized syncore.v1.StoredCacheEntry.
struct CacheRecord {
  std::string key;
  std::string body;
  uint64_t    updated_at_ms = 0;
};

// body is a serialized syncore.v1.QuarantineRecord.
struct QuarantineRow {
  std::string key;
  std::string body;
  std::string reason;
  uint64_t    quarantined_at_ms = 0;
};

}
