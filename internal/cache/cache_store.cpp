#include "internal/cache/cache_store.hpp"

#include <algorithm>
#include <map>

#include "internal/events/event_bus.hpp"
#include "internal/model/priority.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace syncore::cache {

using namespace syncore::v1;

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

bool HasTag(const StoredCacheEntry& record, const std::string& tag) {
  return std::find(record.tags().begin(), record.tags().end(), tag) != record.tags().end();
}

} // namespace

CacheStore::CacheStore(std::shared_ptr<db::Repository> repository, CacheStoreOptions options, std::shared_ptr<events::EventBus> events)
    : repository_(std::move(repository)), options_(std::move(options)), events_(std::move(events)) {
  if (!repository_) {
    throw std::invalid_argument("cache store requires a repository");
  }
  if (!options_.sensitive_kinds.empty() && !options_.cipher) {
    throw util::ValidationError("cache: sensitive kinds configured without an encryption key");
  }
}

uint64_t CacheStore::EntryBytes(const StoredCacheEntry& record) {
  return record.key().size() + record.stored().size();
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

void CacheStore::Load() {
  std::lock_guard<std::mutex> writer(writer_mutex_);

  auto tx         = repository_->Begin();
  auto rows       = repository_->ListCacheEntries(*tx);
  auto quarantine = repository_->ListQuarantine(*tx);
  tx->Commit();

  std::vector<db::model::CacheRecord> unreadable;
  std::unique_lock                    lock(mutex_);
  entries_.clear();
  quarantine_.clear();
  bytes_ = 0;

  for (const auto& row : rows) {
    StoredCacheEntry record;
    if (!record.ParseFromString(row.body) || record.key() != row.key) {
      unreadable.push_back(row);
      continue;
    }
    bytes_ += EntryBytes(record);
    entries_[row.key] = std::make_shared<const Entry>(std::move(record), next_write_seq_++);
  }
  for (const auto& row : quarantine) {
    QuarantineRecord record;
    if (!record.ParseFromString(row.body)) {
      record.mutable_entry()->set_key(row.key);
      record.set_reason(row.reason);
      record.set_quarantined_at_ms(row.quarantined_at_ms);
    }
    quarantine_.push_back(std::move(record));
  }
  lock.unlock();

  if (!unreadable.empty()) {
    const uint64_t now    = NowMs();
    auto           fix_tx = repository_->Begin();
    for (const auto& row : unreadable) {
      QuarantineRecord record;
      record.mutable_entry()->set_key(row.key);
      record.set_reason("unreadable record");
      record.set_quarantined_at_ms(now);

      db::model::QuarantineRow q{row.key, record.SerializeAsString(), record.reason(), now};
      db::ThrowIfDbError(repository_->InsertQuarantine(*fix_tx, q), "quarantine unreadable cache row");
      db::ThrowIfDbError(repository_->DeleteCacheEntry(*fix_tx, row.key), "delete unreadable cache row");

      std::unique_lock relock(mutex_);
      quarantine_.push_back(std::move(record));
    }
    fix_tx->Commit();
    corruptions_ += unreadable.size();
    SYNCORE_LOG_WARN("cache rows quarantined on load", {observability::IntField("count", static_cast<int64_t>(unreadable.size()))});
  }

  SYNCORE_LOG_INFO("cache loaded", {observability::IntField("entries", static_cast<int64_t>(rows.size() - unreadable.size())),
                                    observability::IntField("quarantined", static_cast<int64_t>(quarantine.size()))});
}

// ------------------------------------------------------------
// Prepare / Persist / Publish
// ------------------------------------------------------------

PreparedWrite CacheStore::Prepare(const std::string& key, const std::string& value, const SetOptions& options) const {
  if (key.empty()) {
    throw util::ValidationError("cache: key is required");
  }
  if (!model::IsValid(options.priority)) {
    throw util::ValidationError("cache: invalid priority for key " + key);
  }

  const uint64_t now = NowMs();
  PreparedWrite  write;
  auto&          record = write.record;
  record.set_key(key);
  record.set_priority(options.priority);
  record.set_pinned(options.pinned || options.priority == PRIORITY_CRITICAL);
  record.set_version(options.version);
  record.set_written_at_ms(now);
  record.set_last_access_ms(now);
  for (const auto& tag : options.tags) {
    record.add_tags(tag);
  }

  const auto ttl = options.ttl.value_or(options_.default_ttl);
  if (ttl.count() > 0) {
    record.set_expires_at_ms(now + static_cast<uint64_t>(ttl.count()));
  }

  if (options.sensitive) {
    if (!options_.cipher) {
      throw util::ValidationError("cache: sensitive value for " + key + " but no encryption key is configured");
    }
    record.set_stored(options_.cipher->Seal(value));
    record.set_encrypted(true);
  } else {
    record.set_stored(value);
  }
  record.set_checksum(Sha256Hex(record.stored()));
  return write;
}

PreparedWrite CacheStore::PrepareRemote(const Change& change) const {
  if (change.deleted()) {
    PreparedWrite write;
    write.record.set_key(change.key());
    write.record.set_version(change.version());
    write.remove = true;
    return write;
  }

  if (!change.checksum().empty() && Sha256Hex(change.value()) != change.checksum()) {
    throw util::TransientTransportError("pulled change for " + change.key() + " failed checksum validation");
  }

  SetOptions options;
  options.version   = change.version();
  options.sensitive = options_.sensitive_kinds.contains(change.kind());
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(change.key());
    if (it != entries_.end()) {
      const auto& existing = it->second->record;
      options.priority     = existing.priority();
      options.pinned       = existing.pinned();
      options.sensitive    = options.sensitive || existing.encrypted();
      options.tags.assign(existing.tags().begin(), existing.tags().end());
    }
  }
  return Prepare(change.key(), change.value(), options);
}

void CacheStore::Persist(db::Transaction& tx, PreparedWrite& write) {
  write.write_seq = next_write_seq_++;
  if (write.remove) {
    db::ThrowIfDbError(repository_->DeleteCacheEntry(tx, write.record.key()), "delete cache entry");
    return;
  }

  db::model::CacheRecord row;
  row.key           = write.record.key();
  row.updated_at_ms = write.record.written_at_ms();
  if (!write.record.SerializeToString(&row.body)) {
    throw std::runtime_error("cache: serialize failed for " + row.key);
  }
  db::ThrowIfDbError(repository_->UpsertCacheEntry(tx, row), "upsert cache entry");
}

void CacheStore::Publish(const PreparedWrite& write) {
  std::unique_lock lock(mutex_);
  InstallLocked(write);
}

// caller holds the unique lock
void CacheStore::InstallLocked(const PreparedWrite& write) {
  auto it = entries_.find(write.record.key());
  if (it != entries_.end() && it->second->write_seq > write.write_seq) {
    // a later commit already replaced it
    return;
  }
  if (write.remove) {
    if (it != entries_.end()) EraseLocked(write.record.key());
    return;
  }
  if (it != entries_.end()) {
    bytes_ -= EntryBytes(it->second->record);
  }
  bytes_ += EntryBytes(write.record);
  entries_[write.record.key()] = std::make_shared<const Entry>(write.record, write.write_seq);
}

void CacheStore::EraseLocked(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) return;
  bytes_ -= EntryBytes(it->second->record);
  entries_.erase(it);
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------

void CacheStore::Set(const std::string& key, const std::string& value, const SetOptions& options) {
  auto write = Prepare(key, value, options);

  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto                        tx = repository_->Begin();
  Persist(*tx, write);
  tx->Commit();
  Publish(write);

  bool over_budget;
  {
    std::shared_lock lock(mutex_);
    over_budget = bytes_ > options_.size_budget_bytes;
  }
  if (over_budget) {
    CompactLocked(NowMs());
  }
}

std::optional<std::string> CacheStore::Get(const std::string& key, const GetOptions& options) {
  auto reader = Read(key, options);
  if (!reader) return std::nullopt;
  return std::move(reader->value_);
}

std::optional<CacheStore::Reader> CacheStore::Read(const std::string& key, const GetOptions& options) {
  EntryPtr entry;
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it != entries_.end()) entry = it->second;
  }
  if (!entry) {
    misses_++;
    return std::nullopt;
  }

  const uint64_t now    = NowMs();
  const auto&    record = entry->record;
  if (record.expires_at_ms() != 0 && now >= record.expires_at_ms()) {
    misses_++;
    RemoveExpired(key, entry);
    return std::nullopt;
  }

  if (Sha256Hex(record.stored()) != record.checksum()) {
    misses_++;
    Quarantine(key, entry, "checksum mismatch");
    return std::nullopt;
  }

  std::string value;
  if (record.encrypted()) {
    if (!options_.cipher) {
      misses_++;
      Quarantine(key, entry, "no key to decrypt");
      return std::nullopt;
    }
    try {
      value = options_.cipher->Open(record.stored());
    } catch (const std::exception& e) {
      misses_++;
      Quarantine(key, entry, std::string("decryption failed: ") + e.what());
      return std::nullopt;
    }
  } else {
    value = record.stored();
  }

  if (options.touch) {
    entry->last_access_ms.store(now);
  }
  hits_++;
  return Reader(std::move(entry), std::move(value));
}

std::vector<CacheEntryInfo> CacheStore::Query(const CacheQuery& query) const {
  const uint64_t              now = NowMs();
  std::vector<CacheEntryInfo> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [key, entry] : entries_) {
      const auto& record = entry->record;
      if (record.expires_at_ms() != 0 && now >= record.expires_at_ms()) continue;
      if (query.priority() != PRIORITY_UNSPECIFIED && record.priority() != query.priority()) continue;
      if (!query.tag().empty() && !HasTag(record, query.tag())) continue;

      CacheEntryInfo info;
      info.set_key(key);
      info.set_priority(record.priority());
      info.set_version(record.version());
      info.set_pinned(record.pinned());
      info.set_encrypted(record.encrypted());
      *info.mutable_tags() = record.tags();
      info.set_bytes(EntryBytes(record));
      info.set_expires_at_ms(record.expires_at_ms());
      info.set_last_access_ms(entry->last_access_ms.load());
      out.push_back(std::move(info));
    }
  }

  std::sort(out.begin(), out.end(), [](const CacheEntryInfo& a, const CacheEntryInfo& b) { return a.key() < b.key(); });
  if (query.limit() != 0 && out.size() > query.limit()) {
    out.resize(query.limit());
  }
  return out;
}

bool CacheStore::Invalidate(const std::string& key) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  {
    std::shared_lock lock(mutex_);
    if (!entries_.contains(key)) return false;
  }
  RemoveKeys({key});
  return true;
}

size_t CacheStore::InvalidateTag(const std::string& tag) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::vector<std::string>    keys;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [key, entry] : entries_) {
      if (HasTag(entry->record, tag)) keys.push_back(key);
    }
  }
  if (!keys.empty()) RemoveKeys(keys);
  return keys.size();
}

void CacheStore::Clear() {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::vector<std::string>    keys;
  {
    std::shared_lock lock(mutex_);
    keys.reserve(entries_.size());
    for (const auto& [key, _] : entries_) keys.push_back(key);
  }
  if (!keys.empty()) RemoveKeys(keys);
  SYNCORE_LOG_INFO("cache cleared", {observability::IntField("entries", static_cast<int64_t>(keys.size()))});
}

std::vector<std::string> CacheStore::Compact(util::TimePoint now) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  return CompactLocked(util::ToUnixMillis(now));
}

// caller holds writer_mutex_
std::vector<std::string> CacheStore::CompactLocked(uint64_t now_ms) {
  struct Candidate {
    std::string key;
    int         priority;
    uint64_t    last_access;
    uint64_t    bytes;
  };

  std::vector<std::string> expired;
  std::vector<Candidate>   candidates;
  uint64_t                 projected;
  {
    std::shared_lock lock(mutex_);
    projected = bytes_;
    for (const auto& [key, entry] : entries_) {
      const auto& record = entry->record;
      if (record.pinned() || record.priority() == PRIORITY_CRITICAL) continue;
      // held by a reader
      if (entry.use_count() > 1) continue;

      if (record.expires_at_ms() != 0 && now_ms >= record.expires_at_ms()) {
        expired.push_back(key);
        projected -= EntryBytes(record);
        continue;
      }
      candidates.push_back({key, static_cast<int>(record.priority()), entry->last_access_ms.load(), EntryBytes(record)});
    }
  }

  // lowest priority first, then least recently used
  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.last_access != b.last_access) return a.last_access < b.last_access;
    return a.key < b.key;
  });

  std::vector<std::string> evicted;
  for (const auto& candidate : candidates) {
    if (projected <= options_.size_budget_bytes) break;
    evicted.push_back(candidate.key);
    projected -= candidate.bytes;
  }

  std::vector<std::string> removed = expired;
  removed.insert(removed.end(), evicted.begin(), evicted.end());
  if (removed.empty()) {
    return removed;
  }

  RemoveKeys(removed);
  expirations_ += expired.size();
  evictions_ += evicted.size();

  SYNCORE_LOG_DEBUG("cache compacted", {observability::IntField("expired", static_cast<int64_t>(expired.size())),
                                        observability::IntField("evicted", static_cast<int64_t>(evicted.size()))});
  return removed;
}

// caller holds writer_mutex_
void CacheStore::RemoveKeys(const std::vector<std::string>& keys) {
  auto tx = repository_->Begin();
  for (const auto& key : keys) {
    db::ThrowIfDbError(repository_->DeleteCacheEntry(*tx, key), "delete cache entry");
  }
  tx->Commit();

  std::unique_lock lock(mutex_);
  for (const auto& key : keys) {
    EraseLocked(key);
  }
}

void CacheStore::RemoveExpired(const std::string& key, const EntryPtr& entry) {
  expirations_++;
  if (entry->record.pinned()) {
    return;
  }

  std::lock_guard<std::mutex> writer(writer_mutex_);
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end() || it->second != entry) return;
  }
  RemoveKeys({key});
}

void CacheStore::Quarantine(const std::string& key, const EntryPtr& entry, const std::string& reason) {
  corruptions_++;
  observability::Metrics::Instance().RecordCorruption();
  SYNCORE_LOG_WARN("cache entry quarantined", {observability::StringField("key", key), observability::StringField("reason", reason)});

  {
    std::lock_guard<std::mutex> writer(writer_mutex_);

    bool current;
    {
      std::shared_lock lock(mutex_);
      auto             it = entries_.find(key);
      current           = it != entries_.end() && it->second == entry;
    }

    QuarantineRecord record;
    *record.mutable_entry() = entry->record;
    record.set_reason(reason);
    record.set_quarantined_at_ms(NowMs());

    db::model::QuarantineRow row{key, record.SerializeAsString(), reason, record.quarantined_at_ms()};
    auto                     tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertQuarantine(*tx, row), "insert quarantine");
    if (current) {
      db::ThrowIfDbError(repository_->DeleteCacheEntry(*tx, key), "delete corrupted cache entry");
    }
    tx->Commit();

    std::unique_lock lock(mutex_);
    quarantine_.push_back(std::move(record));
    if (current) EraseLocked(key);
  }

  if (events_) {
    Event event;
    event.set_type(EVENT_TYPE_CORRUPTION_DETECTED);
    event.set_subject_id(key);
    event.set_reason(reason);
    events_->Publish(std::move(event));
  }
}

void CacheStore::MergeRemote(const std::vector<Change>& changes, const TxHook& hook) {
  std::vector<PreparedWrite> writes;
  writes.reserve(changes.size());
  for (const auto& change : changes) {
    writes.push_back(PrepareRemote(change));
  }

  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto                        tx = repository_->Begin();
  for (auto& write : writes) {
    Persist(*tx, write);
  }
  if (hook) {
    hook(*tx);
  }
  tx->Commit();

  bool over_budget;
  {
    std::unique_lock lock(mutex_);
    for (const auto& write : writes) {
      InstallLocked(write);
    }
    over_budget = bytes_ > options_.size_budget_bytes;
  }
  if (over_budget) {
    CompactLocked(NowMs());
  }
}

// ------------------------------------------------------------
// Inspection
// ------------------------------------------------------------

CacheStats CacheStore::Stats() const {
  CacheStats stats;
  {
    std::shared_lock        lock(mutex_);
    std::map<int, uint64_t> by_priority;
    uint64_t                pinned = 0;
    for (const auto& [_, entry] : entries_) {
      by_priority[entry->record.priority()]++;
      if (entry->record.pinned()) pinned++;
    }
    stats.set_entries(entries_.size());
    stats.set_bytes(bytes_);
    stats.set_quarantined(quarantine_.size());
    stats.set_pinned(pinned);
    for (const auto& [priority, count] : by_priority) {
      auto* entry = stats.add_by_priority();
      entry->set_priority(static_cast<Priority>(priority));
      entry->set_count(count);
    }
  }
  stats.set_budget_bytes(options_.size_budget_bytes);
  stats.set_hits(hits_.load());
  stats.set_misses(misses_.load());
  stats.set_evictions(evictions_.load());
  stats.set_expirations(expirations_.load());
  stats.set_corruptions(corruptions_.load());
  return stats;
}

std::vector<QuarantineRecord> CacheStore::Quarantined() const {
  std::shared_lock lock(mutex_);
  return quarantine_;
}

std::optional<uint64_t> CacheStore::Version(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second->record.version();
}

bool CacheStore::Contains(const std::string& key) const {
  std::shared_lock lock(mutex_);
  return entries_.contains(key);
}

} // namespace syncore::cache
