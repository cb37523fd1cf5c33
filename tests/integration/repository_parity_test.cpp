#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if SYNCORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using syncore::db::ErrorCode;
using syncore::db::Repository;
using syncore::db::memory::MemoryRepository;
using syncore::db::model::AuditRow;
using syncore::db::model::CacheRecord;
using syncore::db::model::CheckpointRecord;
using syncore::db::model::ConflictRecord;
using syncore::db::model::JournalRecord;
using syncore::db::model::QuarantineRow;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

JournalRecord Journal(const std::string& op_id, int entry_type, const std::string& body) {
  JournalRecord record;
  record.op_id          = op_id;
  record.entry_type     = entry_type;
  record.body           = body;
  record.appended_at_ms = NowMs();
  return record;
}

void VerifyJournalAppendReadTruncate(Repository& repo) {
  auto tx = repo.Begin();

  auto first  = Journal("op-1", 1, "upsert-1");
  auto second = Journal("op-2", 1, std::string("bin\0ary", 7));
  auto third  = Journal("op-1", 2, "remove-1");
  assert(repo.AppendJournal(*tx, first));
  assert(repo.AppendJournal(*tx, second));
  assert(repo.AppendJournal(*tx, third));
  assert(first.seq > 0);
  assert(second.seq > first.seq);
  assert(third.seq > second.seq);

  // reads see uncommitted writes of the same transaction
  auto all = repo.ReadJournal(*tx, 0);
  assert(all.size() == 3);
  assert(all[1].body == std::string("bin\0ary", 7));
  assert(all[2].entry_type == 2);

  auto tail = repo.ReadJournal(*tx, first.seq);
  assert(tail.size() == 2);
  assert(tail[0].op_id == "op-2");
  tx->Commit();

  auto truncate_tx = repo.Begin();
  CheckpointRecord checkpoint{.last_seq = second.seq, .body = "snapshot", .taken_at_ms = NowMs()};
  assert(repo.PutCheckpoint(*truncate_tx, checkpoint));
  assert(repo.TruncateJournal(*truncate_tx, second.seq));
  truncate_tx->Commit();

  auto verify_tx = repo.Begin();
  auto remaining = repo.ReadJournal(*verify_tx, 0);
  assert(remaining.size() == 1);
  assert(remaining[0].seq == third.seq);

  auto stored = repo.GetCheckpoint(*verify_tx);
  assert(stored.has_value());
  assert(stored->last_seq == second.seq);
  assert(stored->body == "snapshot");

  // sequence numbers keep increasing after truncation
  auto fourth = Journal("op-3", 1, "upsert-3");
  assert(repo.AppendJournal(*verify_tx, fourth));
  assert(fourth.seq > third.seq);
  verify_tx->Commit();
}

void VerifyCheckpointReplaced(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.PutCheckpoint(*tx, CheckpointRecord{.last_seq = 100, .body = "v1", .taken_at_ms = 1}));
  assert(repo.PutCheckpoint(*tx, CheckpointRecord{.last_seq = 200, .body = "v2", .taken_at_ms = 2}));
  tx->Commit();

  auto verify_tx = repo.Begin();
  auto stored    = repo.GetCheckpoint(*verify_tx);
  assert(stored.has_value());
  assert(stored->last_seq == 200);
  assert(stored->body == "v2");
  verify_tx->Commit();
}

void VerifyCacheAndQuarantine(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(repo.UpsertCacheEntry(*tx, CacheRecord{.key = prefix + "/a", .body = "one", .updated_at_ms = 1}));
  assert(repo.UpsertCacheEntry(*tx, CacheRecord{.key = prefix + "/b", .body = "two", .updated_at_ms = 2}));
  assert(repo.UpsertCacheEntry(*tx, CacheRecord{.key = prefix + "/a", .body = "one-v2", .updated_at_ms = 3}));
  assert(repo.DeleteCacheEntry(*tx, prefix + "/b"));
  // deleting an absent entry is not an error
  assert(repo.DeleteCacheEntry(*tx, prefix + "/missing"));

  assert(repo.InsertQuarantine(*tx, QuarantineRow{.key = prefix + "/bad", .body = "junk-1", .reason = "checksum mismatch", .quarantined_at_ms = 5}));
  assert(repo.InsertQuarantine(*tx, QuarantineRow{.key = prefix + "/bad", .body = "junk-2", .reason = "decrypt failed", .quarantined_at_ms = 6}));
  tx->Commit();

  auto verify_tx = repo.Begin();
  auto entries   = repo.ListCacheEntries(*verify_tx);
  std::vector<CacheRecord> mine;
  std::copy_if(entries.begin(), entries.end(), std::back_inserter(mine), [&](const CacheRecord& r) { return r.key.rfind(prefix, 0) == 0; });
  assert(mine.size() == 1);
  assert(mine[0].body == "one-v2");
  assert(mine[0].updated_at_ms == 3);

  auto quarantined = repo.ListQuarantine(*verify_tx);
  assert(quarantined.size() >= 2);
  // the same key may be quarantined more than once, in insertion order
  const auto& last = quarantined.back();
  const auto& prev = quarantined[quarantined.size() - 2];
  assert(prev.reason == "checksum mismatch");
  assert(last.reason == "decrypt failed");
  assert(last.body == "junk-2");
  verify_tx->Commit();
}

void VerifySyncState(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetSyncState(*tx, "delta_cursor").has_value());
  assert(repo.PutSyncState(*tx, "delta_cursor", "17"));
  assert(repo.PutSyncState(*tx, "delta_cursor", "42"));
  tx->Commit();

  auto verify_tx = repo.Begin();
  assert(repo.GetSyncState(*verify_tx, "delta_cursor") == std::optional<std::string>("42"));
  verify_tx->Commit();
}

void VerifyConflictsAndAudit(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpsertOpenConflict(*tx, ConflictRecord{.id = "c-2", .operation_id = "op-2", .body = "second", .opened_at_ms = 20}));
  assert(repo.UpsertOpenConflict(*tx, ConflictRecord{.id = "c-1", .operation_id = "op-1", .body = "first", .opened_at_ms = 10}));
  // a later write keeps the original open time
  assert(repo.UpsertOpenConflict(*tx, ConflictRecord{.id = "c-2", .operation_id = "op-2", .body = "second-v2", .opened_at_ms = 99}));

  AuditRow first{.seq = 0, .conflict_id = "c-0", .body = "resolved-0", .recorded_at_ms = 5};
  AuditRow second{.seq = 0, .conflict_id = "c-1", .body = "resolved-1", .recorded_at_ms = 6};
  assert(repo.AppendAudit(*tx, first));
  assert(repo.AppendAudit(*tx, second));
  assert(second.seq > first.seq);
  tx->Commit();

  auto verify_tx = repo.Begin();
  auto open      = repo.ListOpenConflicts(*verify_tx);
  assert(open.size() == 2);
  assert(open[0].id == "c-1");
  assert(open[1].id == "c-2");
  assert(open[1].body == "second-v2");
  assert(open[1].opened_at_ms == 20);

  assert(repo.DeleteOpenConflict(*verify_tx, "c-1"));
  auto missing = repo.DeleteOpenConflict(*verify_tx, "c-1");
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  auto audit = repo.ReadAudit(*verify_tx, 0);
  assert(audit.size() == 2);
  assert(audit[0].conflict_id == "c-0");
  assert(repo.ReadAudit(*verify_tx, first.seq).size() == 1);
  verify_tx->Commit();

  auto final_tx = repo.Begin();
  assert(repo.ListOpenConflicts(*final_tx).size() == 1);
  final_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.PutSyncState(*tx, "rollback_cursor", "dirty"));
    assert(repo.UpsertCacheEntry(*tx, CacheRecord{.key = "rollback/key", .body = "dirty", .updated_at_ms = 1}));
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx = repo.Begin();
    auto record = Journal("rollback-op", 1, "dirty");
    assert(repo.AppendJournal(*tx, record));
  }

  auto tx = repo.Begin();
  assert(!repo.GetSyncState(*tx, "rollback_cursor").has_value());
  for (const auto& entry : repo.ListCacheEntries(*tx)) {
    assert(entry.key != "rollback/key");
  }
  for (const auto& entry : repo.ReadJournal(*tx, 0)) {
    assert(entry.op_id != "rollback-op");
  }
  tx->Commit();
}

void VerifySerializedTransactions(Repository& repo) {
  constexpr int kThreads = 4;
  constexpr int kAppends = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&repo, t] {
      for (int i = 0; i < kAppends; ++i) {
        auto tx     = repo.Begin();
        auto record = Journal("parallel-" + std::to_string(t), 1, std::to_string(i));
        assert(repo.AppendJournal(*tx, record));
        tx->Commit();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto     tx      = repo.Begin();
  auto     journal = repo.ReadJournal(*tx, 0);
  uint64_t last    = 0;
  int      count   = 0;
  for (const auto& entry : journal) {
    assert(entry.seq > last);
    last = entry.seq;
    if (entry.op_id.rfind("parallel-", 0) == 0) count++;
  }
  assert(count == kThreads * kAppends);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo = backend.make_repository();
  uint64_t journal_seq;
  {
    auto tx     = repo->Begin();
    auto record = Journal("durable-op", 1, "durable-body");
    assert(repo->AppendJournal(*tx, record));
    journal_seq = record.seq;
    assert(repo->UpsertCacheEntry(*tx, CacheRecord{.key = "durable/key", .body = "cached", .updated_at_ms = 7}));
    assert(repo->PutSyncState(*tx, "durable_cursor", "9"));
    assert(repo->UpsertOpenConflict(*tx, ConflictRecord{.id = "durable-c", .operation_id = "durable-op", .body = "open", .opened_at_ms = 1}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto journal = repo->ReadJournal(*tx, journal_seq - 1);
  assert(!journal.empty());
  assert(journal[0].op_id == "durable-op");

  bool found = false;
  for (const auto& entry : repo->ListCacheEntries(*tx)) {
    found = found || (entry.key == "durable/key" && entry.body == "cached");
  }
  assert(found);
  assert(repo->GetSyncState(*tx, "durable_cursor") == std::optional<std::string>("9"));

  bool conflict_found = false;
  for (const auto& open : repo->ListOpenConflicts(*tx)) {
    conflict_found = conflict_found || open.id == "durable-c";
  }
  assert(conflict_found);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SYNCORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("syncore_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<syncore::db::sqlite::SqliteDB>(db_path);
    return std::make_shared<syncore::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyJournalAppendReadTruncate(*repo);
    VerifyCheckpointReplaced(*repo);
    VerifyCacheAndQuarantine(*repo, backend.name);
    VerifySyncState(*repo);
    VerifyConflictsAndAudit(*repo);
    VerifyRollbackBehavior(*repo);
    VerifySerializedTransactions(*repo);
  }
  backend.cleanup();

  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SYNCORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
