#include "internal/cache/cache_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/util/errors.hpp"

namespace {

using syncore::cache::CacheStore;
using syncore::cache::CacheStoreOptions;
using syncore::cache::Cipher;
using syncore::cache::SetOptions;
using syncore::db::memory::MemoryRepository;
using namespace syncore::v1;

const std::string kKeyHex  = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";
const std::string kKeyHex2 = "1f1e1d1c1b1a191817161514131211100f0e0d0c0b0a09080706050403020100";

std::shared_ptr<const Cipher> MakeCipher(const std::string& hex) {
  auto cipher = Cipher::FromHex(hex);
  assert(cipher.has_value());
  return std::make_shared<const Cipher>(*cipher);
}

SetOptions WithPriority(Priority priority, bool pinned = false) {
  SetOptions options;
  options.priority = priority;
  options.pinned   = pinned;
  return options;
}

void TestSetGetAndPersistence() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    CacheStore cache(repo, {});
    cache.Load();
    SetOptions options = WithPriority(PRIORITY_HIGH);
    options.version    = 7;
    cache.Set("roster/5a", "alice,bob", options);

    assert(cache.Get("roster/5a") == std::optional<std::string>("alice,bob"));
    assert(!cache.Get("roster/5b").has_value());
    assert(cache.Version("roster/5a") == std::optional<uint64_t>(7));

    auto stats = cache.Stats();
    assert(stats.entries() == 1);
    assert(stats.hits() == 1);
    assert(stats.misses() == 1);
  }

  CacheStore reloaded(repo, {});
  reloaded.Load();
  assert(reloaded.Get("roster/5a") == std::optional<std::string>("alice,bob"));
  assert(reloaded.Version("roster/5a") == std::optional<uint64_t>(7));
}

void TestCorruptedEntryIsQuarantinedOnRead() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto events = std::make_shared<syncore::events::EventBus>();

  // a row whose bytes no longer match their checksum
  StoredCacheEntry record;
  record.set_key("grade/42");
  record.set_stored("A+");
  record.set_checksum(syncore::cache::Sha256Hex("C-"));
  record.set_priority(PRIORITY_MEDIUM);
  {
    auto                           tx = repo->Begin();
    syncore::db::model::CacheRecord row{"grade/42", record.SerializeAsString(), 1};
    syncore::db::ThrowIfDbError(repo->UpsertCacheEntry(*tx, row), "seed corrupted row");
    tx->Commit();
  }

  std::vector<Event> seen;
  events->Subscribe([&](const Event& event) {
    if (event.type() == EVENT_TYPE_CORRUPTION_DETECTED) seen.push_back(event);
  });

  CacheStore cache(repo, {}, events);
  cache.Load();
  assert(cache.Contains("grade/42"));

  assert(!cache.Get("grade/42").has_value());
  assert(!cache.Contains("grade/42"));
  assert(seen.size() == 1);
  assert(seen[0].subject_id() == "grade/42");
  assert(seen[0].reason() == "checksum mismatch");

  auto quarantined = cache.Quarantined();
  assert(quarantined.size() == 1);
  assert(quarantined[0].entry().stored() == "A+");
  assert(cache.Stats().corruptions() == 1);

  auto tx = repo->Begin();
  assert(repo->ListCacheEntries(*tx).empty());
  assert(repo->ListQuarantine(*tx).size() == 1);
  tx->Commit();
}

void TestUnreadableRowQuarantinedOnLoad() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto                           tx = repo->Begin();
    syncore::db::model::CacheRecord row{"broken", std::string("\xff\xff\xff\x01", 4), 1};
    syncore::db::ThrowIfDbError(repo->UpsertCacheEntry(*tx, row), "seed unreadable row");
    tx->Commit();
  }

  CacheStore cache(repo, {});
  cache.Load();
  assert(!cache.Contains("broken"));
  assert(cache.Quarantined().size() == 1);
  assert(cache.Quarantined()[0].reason() == "unreadable record");
}

void TestCompactionNeverEvictsPinned() {
  auto              repo = std::make_shared<MemoryRepository>();
  CacheStoreOptions options;
  options.size_budget_bytes = 64;
  CacheStore cache(repo, options);
  cache.Load();

  cache.Set("crit", std::string(50, 'c'), WithPriority(PRIORITY_CRITICAL));
  cache.Set("pin", std::string(40, 'p'), WithPriority(PRIORITY_MEDIUM, true));
  // over budget with nothing evictable
  assert(cache.Contains("crit"));
  assert(cache.Contains("pin"));

  cache.Set("low", std::string(10, 'l'), WithPriority(PRIORITY_LOW));
  assert(cache.Contains("crit"));
  assert(cache.Contains("pin"));
  assert(!cache.Contains("low"));

  auto stats = cache.Stats();
  assert(stats.evictions() == 1);
  assert(stats.pinned() == 2);
  assert(stats.bytes() > stats.budget_bytes());

  // explicit compaction still leaves the pinned entries alone
  assert(cache.Compact().empty());
  assert(cache.Stats().entries() == 2);
}

void TestEvictionPrefersLowerPriority() {
  auto              repo = std::make_shared<MemoryRepository>();
  CacheStoreOptions options;
  options.size_budget_bytes = 100;
  CacheStore cache(repo, options);
  cache.Load();

  cache.Set("a", std::string(40, 'a'), WithPriority(PRIORITY_BACKGROUND));
  cache.Set("b", std::string(40, 'b'), WithPriority(PRIORITY_HIGH));
  cache.Set("c", std::string(40, 'c'), WithPriority(PRIORITY_MEDIUM));

  assert(!cache.Contains("a"));
  assert(cache.Contains("b"));
  assert(cache.Contains("c"));
}

void TestExpiry() {
  auto       repo = std::make_shared<MemoryRepository>();
  CacheStore cache(repo, {});
  cache.Load();

  SetOptions short_lived = WithPriority(PRIORITY_LOW);
  short_lived.ttl        = std::chrono::milliseconds(1);
  cache.Set("session", "token", short_lived);

  SetOptions pinned = WithPriority(PRIORITY_LOW, true);
  pinned.ttl        = std::chrono::minutes(1);
  cache.Set("timetable", "mon-fri", pinned);

  SetOptions hourly = WithPriority(PRIORITY_LOW);
  hourly.ttl        = std::chrono::minutes(1);
  cache.Set("news", "headline", hourly);

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  assert(!cache.Get("session").has_value());
  assert(!cache.Contains("session"));

  auto removed = cache.Compact(syncore::util::Now() + std::chrono::hours(1));
  assert((removed == std::vector<std::string>{"news"}));
  assert(cache.Contains("timetable"));
  assert(cache.Stats().expirations() == 2);
}

void TestCompactionSkipsEntriesBeingRead() {
  auto       repo = std::make_shared<MemoryRepository>();
  CacheStore cache(repo, {});
  cache.Load();

  SetOptions hourly = WithPriority(PRIORITY_LOW);
  hourly.ttl        = std::chrono::minutes(1);
  cache.Set("held", "lesson plan", hourly);
  cache.Set("idle", "old notice", hourly);

  const auto later = syncore::util::Now() + std::chrono::hours(1);
  {
    auto reader = cache.Read("held");
    assert(reader.has_value());

    auto removed = cache.Compact(later);
    assert((removed == std::vector<std::string>{"idle"}));
    assert(cache.Contains("held"));
    assert(reader->Value() == "lesson plan");
  }

  auto removed = cache.Compact(later);
  assert((removed == std::vector<std::string>{"held"}));
}

void TestBudgetEvictionSkipsEntriesBeingRead() {
  auto              repo = std::make_shared<MemoryRepository>();
  CacheStoreOptions options;
  options.size_budget_bytes = 100;
  CacheStore cache(repo, options);
  cache.Load();

  cache.Set("a", std::string(40, 'a'), WithPriority(PRIORITY_BACKGROUND));
  auto reader = cache.Read("a");
  assert(reader.has_value());
  cache.Set("b", std::string(40, 'b'), WithPriority(PRIORITY_MEDIUM));
  cache.Set("c", std::string(40, 'c'), WithPriority(PRIORITY_MEDIUM));

  assert(cache.Contains("a"));
  assert(!cache.Contains("b"));
  assert(cache.Contains("c"));
}

void TestQueryByTagAndPriority() {
  auto       repo = std::make_shared<MemoryRepository>();
  CacheStore cache(repo, {});
  cache.Load();

  SetOptions class_5a = WithPriority(PRIORITY_HIGH);
  class_5a.tags       = {"class-5a"};
  class_5a.version    = 3;
  cache.Set("roster/5a", "x", class_5a);
  SetOptions grades_5a = WithPriority(PRIORITY_LOW);
  grades_5a.tags       = {"class-5a", "grades"};
  cache.Set("grades/5a", "y", grades_5a);
  cache.Set("roster/6b", "z", WithPriority(PRIORITY_HIGH));

  CacheQuery by_tag;
  by_tag.set_tag("class-5a");
  auto tagged = cache.Query(by_tag);
  assert(tagged.size() == 2);
  assert(tagged[0].key() == "grades/5a");
  assert(tagged[0].tags_size() == 2);
  assert(tagged[1].key() == "roster/5a");
  assert(tagged[1].version() == 3);

  CacheQuery by_priority;
  by_priority.set_priority(PRIORITY_HIGH);
  auto high = cache.Query(by_priority);
  assert(high.size() == 2);
  assert(high[0].key() == "roster/5a");
  assert(high[1].key() == "roster/6b");

  CacheQuery both = by_tag;
  both.set_priority(PRIORITY_HIGH);
  assert(cache.Query(both).size() == 1);

  CacheQuery limited;
  limited.set_limit(1);
  assert(cache.Query(limited).size() == 1);
  assert(cache.Query({}).size() == 3);
}

void TestSensitiveValuesAreEncrypted() {
  auto              repo = std::make_shared<MemoryRepository>();
  CacheStoreOptions options;
  options.cipher = MakeCipher(kKeyHex);
  {
    CacheStore cache(repo, options);
    cache.Load();
    SetOptions sensitive = WithPriority(PRIORITY_HIGH);
    sensitive.sensitive  = true;
    cache.Set("medical/7", "asthma inhaler", sensitive);
    assert(cache.Get("medical/7") == std::optional<std::string>("asthma inhaler"));
  }

  {
    auto tx   = repo->Begin();
    auto rows = repo->ListCacheEntries(*tx);
    tx->Commit();
    assert(rows.size() == 1);
    StoredCacheEntry stored;
    assert(stored.ParseFromString(rows[0].body));
    assert(stored.encrypted());
    assert(stored.stored().find("asthma") == std::string::npos);
  }

  CacheStoreOptions wrong_key;
  wrong_key.cipher = MakeCipher(kKeyHex2);
  CacheStore other(repo, wrong_key);
  other.Load();
  assert(!other.Get("medical/7").has_value());
  assert(other.Quarantined().size() == 1);
}

void TestSensitiveWithoutKeyIsRejected() {
  auto              repo = std::make_shared<MemoryRepository>();
  CacheStoreOptions options;
  options.sensitive_kinds.insert("medical");
  bool threw = false;
  try {
    CacheStore cache(repo, options);
  } catch (const syncore::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  CacheStore plain(repo, {});
  plain.Load();
  SetOptions sensitive = WithPriority(PRIORITY_LOW);
  sensitive.sensitive  = true;
  threw                = false;
  try {
    plain.Set("medical/1", "x", sensitive);
  } catch (const syncore::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidateByTag() {
  auto       repo = std::make_shared<MemoryRepository>();
  CacheStore cache(repo, {});
  cache.Load();

  SetOptions tagged = WithPriority(PRIORITY_MEDIUM);
  tagged.tags       = {"class-5a"};
  cache.Set("roster/5a", "x", tagged);
  cache.Set("grades/5a", "y", tagged);
  cache.Set("roster/6b", "z", WithPriority(PRIORITY_MEDIUM));

  assert(cache.InvalidateTag("class-5a") == 2);
  assert(!cache.Contains("roster/5a"));
  assert(cache.Contains("roster/6b"));
  assert(cache.Invalidate("roster/6b"));
  assert(!cache.Invalidate("roster/6b"));
}

void TestMergeRemoteAppliesChangesWithHook() {
  auto       repo = std::make_shared<MemoryRepository>();
  CacheStore cache(repo, {});
  cache.Load();
  cache.Set("roster/5a", "old", WithPriority(PRIORITY_HIGH, true));

  Change update;
  update.set_key("roster/5a");
  update.set_value("new");
  update.set_version(3);
  update.set_checksum(syncore::cache::Sha256Hex("new"));

  Change removal;
  removal.set_key("roster/gone");
  removal.set_deleted(true);
  removal.set_version(2);

  cache.MergeRemote({update, removal}, [&](syncore::db::Transaction& tx) {
    syncore::db::ThrowIfDbError(repo->PutSyncState(tx, "cursor", "2"), "advance cursor");
  });

  assert(cache.Get("roster/5a") == std::optional<std::string>("new"));
  assert(cache.Version("roster/5a") == std::optional<uint64_t>(3));
  assert(cache.Stats().pinned() == 1);
  {
    auto tx = repo->Begin();
    assert(repo->GetSyncState(*tx, "cursor") == std::optional<std::string>("2"));
    tx->Commit();
  }

  // a change that fails validation leaves cache and cursor untouched
  Change tampered = update;
  tampered.set_value("evil");
  tampered.set_version(4);
  bool threw = false;
  try {
    cache.MergeRemote({tampered}, [&](syncore::db::Transaction& tx) {
      syncore::db::ThrowIfDbError(repo->PutSyncState(tx, "cursor", "3"), "advance cursor");
    });
  } catch (const syncore::util::TransientTransportError&) {
    threw = true;
  }
  assert(threw);
  assert(cache.Get("roster/5a") == std::optional<std::string>("new"));
  auto tx = repo->Begin();
  assert(repo->GetSyncState(*tx, "cursor") == std::optional<std::string>("2"));
  tx->Commit();
}

} // namespace

int main() {
  TestSetGetAndPersistence();
  TestCorruptedEntryIsQuarantinedOnRead();
  TestUnreadableRowQuarantinedOnLoad();
  TestCompactionNeverEvictsPinned();
  TestEvictionPrefersLowerPriority();
  TestExpiry();
  TestCompactionSkipsEntriesBeingRead();
  TestBudgetEvictionSkipsEntriesBeingRead();
  TestQueryByTagAndPriority();
  TestSensitiveValuesAreEncrypted();
  TestSensitiveWithoutKeyIsRejected();
  TestInvalidateByTag();
  TestMergeRemoteAppliesChangesWithHook();

  std::cout << "cache_store_test: pass\n";
  return 0;
}
