#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/cache/cipher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "syncore/v1/change.pb.h"
#include "syncore/v1/status.pb.h"

namespace syncore::events {
class EventBus;
}

namespace syncore::cache {

struct SetOptions {
  syncore::v1::Priority       priority = syncore::v1::PRIORITY_MEDIUM;
  std::optional<util::Millis> ttl;
  bool                        pinned    = false;
  bool                        sensitive = false;
  std::vector<std::string>    tags;
  uint64_t                    version = 0;
};

struct GetOptions {
  // refresh LRU position
  bool touch = true;
};

struct CacheStoreOptions {
  uint64_t                        size_budget_bytes = 64ull * 1024 * 1024;
  util::Millis                    default_ttl{24ll * 60 * 60 * 1000};
  std::shared_ptr<const Cipher>   cipher;
  std::unordered_set<std::string> sensitive_kinds;
};

/*
  A value encrypted and checksummed outside any lock, ready to be persisted
  inside a caller's transaction and then published to readers.
*/
struct PreparedWrite {
  syncore::v1::StoredCacheEntry record;
  bool                          remove    = false;
  uint64_t                      write_seq = 0;
};

/*
  Encrypted, priority-tiered key/value cache.

  Every stored value carries a SHA-256 checksum over its stored bytes; a
  mismatch or failed decryption quarantines the entry and reports a miss.
  CRITICAL and pinned entries are never evicted. Readers hold a reference to
  the entry they are reading, so compaction can never free it underneath them.
*/
class CacheStore {
  struct Entry;

 public:
  using TxHook = std::function<void(db::Transaction&)>;

  // A validated value. Its entry stays resident while the reader is alive.
  class Reader {
   public:
    const std::string& Value() const {
      return value_;
    }

   private:
    friend class CacheStore;
    Reader(std::shared_ptr<const Entry> entry, std::string value) : entry_(std::move(entry)), value_(std::move(value)) {
    }

    std::shared_ptr<const Entry> entry_;
    std::string                  value_;
  };

  CacheStore(std::shared_ptr<db::Repository> repository, CacheStoreOptions options, std::shared_ptr<events::EventBus> events = nullptr);

  // Hydrates the readable set and quarantine from the repository.
  void Load();

  void                       Set(const std::string& key, const std::string& value, const SetOptions& options = {});
  std::optional<std::string> Get(const std::string& key, const GetOptions& options = {});
  std::optional<Reader>      Read(const std::string& key, const GetOptions& options = {});

  // Unexpired entries matching the query, ordered by key.
  std::vector<syncore::v1::CacheEntryInfo> Query(const syncore::v1::CacheQuery& query) const;

  bool   Invalidate(const std::string& key);
  size_t InvalidateTag(const std::string& tag);
  void   Clear();

  // Reclaims expired entries, then the coldest unpinned entries until under
  // budget. Returns the removed keys.
  std::vector<std::string> Compact(util::TimePoint now = util::Now());

  syncore::v1::CacheStats                    Stats() const;
  std::vector<syncore::v1::QuarantineRecord> Quarantined() const;
  std::optional<uint64_t>                    Version(const std::string& key) const;
  bool                                       Contains(const std::string& key) const;

  // Two-phase write for callers that own the transaction.
  PreparedWrite Prepare(const std::string& key, const std::string& value, const SetOptions& options) const;
  PreparedWrite PrepareRemote(const syncore::v1::Change& change) const;
  void          Persist(db::Transaction& tx, PreparedWrite& write);
  void          Publish(const PreparedWrite& write);

  // Applies pulled changes and runs `hook` in the same transaction.
  void MergeRemote(const std::vector<syncore::v1::Change>& changes, const TxHook& hook = {});

 private:
  struct Entry {
    explicit Entry(syncore::v1::StoredCacheEntry r, uint64_t seq) : record(std::move(r)), write_seq(seq), last_access_ms(record.last_access_ms()) {
    }

    syncore::v1::StoredCacheEntry record;
    uint64_t                      write_seq;
    mutable std::atomic<uint64_t> last_access_ms;
  };

  using EntryPtr = std::shared_ptr<const Entry>;

  static uint64_t EntryBytes(const syncore::v1::StoredCacheEntry& record);

  void InstallLocked(const PreparedWrite& write);
  void EraseLocked(const std::string& key);
  void Quarantine(const std::string& key, const EntryPtr& entry, const std::string& reason);
  void RemoveExpired(const std::string& key, const EntryPtr& entry);
  std::vector<std::string> CompactLocked(uint64_t now_ms);
  void RemoveKeys(const std::vector<std::string>& keys);

  std::shared_ptr<db::Repository>   repository_;
  CacheStoreOptions                 options_;
  std::shared_ptr<events::EventBus> events_;

  std::mutex writer_mutex_;

  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, EntryPtr>    entries_;
  std::vector<syncore::v1::QuarantineRecord>   quarantine_;
  uint64_t                                     bytes_ = 0;

  std::atomic<uint64_t> next_write_seq_{1};
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> evictions_{0};
  std::atomic<uint64_t> expirations_{0};
  std::atomic<uint64_t> corruptions_{0};
};

} // namespace syncore::cache
