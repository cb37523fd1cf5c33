#include "internal/oplog/operation_log.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/util/errors.hpp"

namespace {

using syncore::db::Repository;
using syncore::db::memory::MemoryRepository;
using syncore::oplog::AckOutcome;
using syncore::oplog::OperationLog;
using syncore::oplog::OperationLogOptions;
using namespace syncore::v1;

syncore::v1::Operation MakeOp(const std::string& id, Priority priority, std::vector<std::string> depends_on = {}) {
  Operation op;
  op.set_id(id);
  op.set_kind("attendance");
  op.set_priority(priority);
  op.set_payload("payload-" + id);
  for (auto& dep : depends_on) op.add_depends_on(dep);
  return op;
}

std::vector<std::string> Ids(const std::vector<Operation>& ops) {
  std::vector<std::string> ids;
  for (const auto& op : ops) ids.push_back(op.id());
  return ids;
}

std::unique_ptr<OperationLog> OpenLog(const std::shared_ptr<Repository>& repo, OperationLogOptions options = {}) {
  auto log = std::make_unique<OperationLog>(repo, options);
  log->Open();
  return log;
}

void TestPriorityThenFifoOrder() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("low-1", PRIORITY_LOW));
  log->Enqueue(MakeOp("high-1", PRIORITY_HIGH));
  log->Enqueue(MakeOp("low-2", PRIORITY_LOW));
  log->Enqueue(MakeOp("critical-1", PRIORITY_CRITICAL));
  log->Enqueue(MakeOp("high-2", PRIORITY_HIGH));

  auto ready = log->DequeueReady(10, syncore::util::Now());
  assert((Ids(ready) == std::vector<std::string>{"critical-1", "high-1", "high-2", "low-1", "low-2"}));
  for (const auto& op : ready) {
    assert(op.state() == OPERATION_STATE_ADMITTED);
  }
}

void TestDequeueRespectsMax() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("a", PRIORITY_MEDIUM));
  log->Enqueue(MakeOp("b", PRIORITY_MEDIUM));
  log->Enqueue(MakeOp("c", PRIORITY_MEDIUM));

  auto first = log->DequeueReady(2, syncore::util::Now());
  assert((Ids(first) == std::vector<std::string>{"a", "b"}));
  auto second = log->DequeueReady(2, syncore::util::Now());
  assert((Ids(second) == std::vector<std::string>{"c"}));
}

void TestEnqueueIsIdempotentAndMerges() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("op", PRIORITY_LOW));
  auto again = MakeOp("op", PRIORITY_HIGH);
  again.set_payload("updated");
  log->Enqueue(again);

  auto ops = log->ListOperations();
  assert(ops.size() == 1);
  assert(ops[0].payload() == "updated");
  assert(ops[0].priority() == PRIORITY_HIGH);

  // a terminal id stays terminal
  const auto admitted = log->DequeueReady(1, syncore::util::Now());
  assert(admitted.size() == 1);
  log->MarkInFlight("op");
  log->Ack("op", AckOutcome::kCompleted);
  log->Enqueue(MakeOp("op", PRIORITY_LOW));
  assert(!log->Get("op").has_value());
  assert(log->GetTombstone("op")->outcome() == OPERATION_STATE_COMPLETED);

  // duplicate ack is a no-op
  log->Ack("op", AckOutcome::kCompleted);
}

void TestEnqueueValidation() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  bool threw = false;
  try {
    log->Enqueue(MakeOp("no-priority", PRIORITY_UNSPECIFIED));
  } catch (const syncore::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    log->Enqueue(MakeOp("self", PRIORITY_LOW, {"self"}));
  } catch (const syncore::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestCapacityLimit() {
  auto                repo = std::make_shared<MemoryRepository>();
  OperationLogOptions options;
  options.max_operations = 2;
  auto log               = OpenLog(repo, options);

  log->Enqueue(MakeOp("a", PRIORITY_LOW));
  log->Enqueue(MakeOp("b", PRIORITY_LOW));
  bool threw = false;
  try {
    log->Enqueue(MakeOp("c", PRIORITY_LOW));
  } catch (const syncore::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
}

void TestDependenciesGateReadiness() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("child", PRIORITY_CRITICAL, {"parent"}));
  log->Enqueue(MakeOp("parent", PRIORITY_LOW));
  log->Enqueue(MakeOp("orphan", PRIORITY_HIGH, {"never-enqueued"}));

  auto first = log->DequeueReady(10, syncore::util::Now());
  assert((Ids(first) == std::vector<std::string>{"parent"}));

  log->MarkInFlight("parent");
  log->Ack("parent", AckOutcome::kCompleted);

  auto second = log->DequeueReady(10, syncore::util::Now());
  assert((Ids(second) == std::vector<std::string>{"child"}));
  assert(log->Get("orphan")->state() == OPERATION_STATE_QUEUED);
}

void TestFailedDependencyFailsDependents() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto events = std::make_shared<syncore::events::EventBus>();
  auto log    = std::make_unique<OperationLog>(repo, OperationLogOptions{}, events);
  log->Open();

  std::vector<std::string> failed;
  events->Subscribe([&](const Event& event) {
    if (event.type() == EVENT_TYPE_OPERATION_FAILED) failed.push_back(event.subject_id());
  });

  log->Enqueue(MakeOp("parent", PRIORITY_LOW));
  log->Enqueue(MakeOp("child", PRIORITY_LOW, {"parent"}));
  const bool cancelled = log->Cancel("parent");
  assert(cancelled);

  auto ready = log->DequeueReady(10, syncore::util::Now());
  assert(ready.empty());
  assert(log->GetTombstone("child")->reason() == "dependency-failed");
  assert((failed == std::vector<std::string>{"child"}));
}

void TestCancelOnlyWhileQueued() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("queued", PRIORITY_LOW));
  log->Enqueue(MakeOp("admitted", PRIORITY_CRITICAL));
  log->DequeueReady(1, syncore::util::Now());

  assert(!log->Cancel("admitted"));
  assert(log->Cancel("queued"));
  assert(!log->Cancel("queued"));
  assert(log->GetTombstone("queued")->outcome() == OPERATION_STATE_FAILED);
  assert(log->GetTombstone("queued")->reason() == "cancelled");
}

void TestExpiredOperationsFail() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  auto op = MakeOp("stale", PRIORITY_LOW);
  op.set_expires_at_ms(syncore::util::ToUnixMillis(syncore::util::Now()) + 1000);
  log->Enqueue(op);

  auto later = syncore::util::Now() + std::chrono::seconds(5);
  assert(log->DequeueReady(10, later).empty());
  assert(log->GetTombstone("stale")->reason() == "expired");
}

void TestAdmissionCheckDefers() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("deferred", PRIORITY_LOW));
  const auto now   = syncore::util::Now();
  const auto until = now + std::chrono::minutes(10);

  auto ready = log->DequeueReady(10, now, [&](const Operation&) -> std::optional<syncore::util::TimePoint> { return until; });
  assert(ready.empty());
  auto op = log->Get("deferred");
  assert(op->state() == OPERATION_STATE_QUEUED);
  assert(op->scheduled_for_ms() == syncore::util::ToUnixMillis(until));
  assert(log->PeekStatus(now).next_scheduled_ms() == syncore::util::ToUnixMillis(until));

  // not before the deferral, even when admissible
  assert(log->DequeueReady(10, now + std::chrono::minutes(5)).empty());
  assert(log->DequeueReady(10, until).size() == 1);
}

void TestRaisedPriorityDropsDeferral() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  const auto now        = syncore::util::Now();
  const auto window_end = now + std::chrono::hours(2);
  auto       blackout   = [&](const Operation& op) -> std::optional<syncore::util::TimePoint> {
    if (op.priority() == PRIORITY_CRITICAL) return std::nullopt;
    return window_end;
  };

  log->Enqueue(MakeOp("report", PRIORITY_LOW));
  assert(log->DequeueReady(10, now, blackout).empty());
  assert(log->Get("report")->scheduled_for_ms() == syncore::util::ToUnixMillis(window_end));

  log->Enqueue(MakeOp("report", PRIORITY_CRITICAL));
  auto merged = log->Get("report");
  assert(merged->priority() == PRIORITY_CRITICAL);
  assert(merged->scheduled_for_ms() == 0);

  auto ready = log->DequeueReady(10, now + std::chrono::seconds(1), blackout);
  assert((Ids(ready) == std::vector<std::string>{"report"}));
}

void TestCriticalIgnoresStaleSchedule() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  const auto now = syncore::util::Now();
  auto       op  = MakeOp("alert", PRIORITY_CRITICAL);
  op.set_scheduled_for_ms(syncore::util::ToUnixMillis(now + std::chrono::hours(1)));
  log->Enqueue(op);

  assert(log->DequeueReady(10, now).size() == 1);
}

void CompleteOp(OperationLog& log, const std::string& id) {
  log.Enqueue(MakeOp(id, PRIORITY_MEDIUM));
  auto ready = log.DequeueReady(10, syncore::util::Now());
  assert(ready.size() == 1 && ready[0].id() == id);
  log.MarkInFlight(id);
  log.Ack(id, AckOutcome::kCompleted);
}

void TestPrunedTombstonesStayTerminal() {
  auto                repo = std::make_shared<MemoryRepository>();
  OperationLogOptions options;
  options.completed_retention = 2;
  options.checkpoint_every    = 0;
  {
    auto log = OpenLog(repo, options);
    CompleteOp(*log, "a");
    CompleteOp(*log, "b");
    CompleteOp(*log, "c");
    assert(!log->GetTombstone("a").has_value());

    // a dependency on a pruned id is satisfied
    log->Enqueue(MakeOp("d", PRIORITY_MEDIUM, {"a"}));
    auto ready = log->DequeueReady(10, syncore::util::Now());
    assert((Ids(ready) == std::vector<std::string>{"d"}));

    // a pruned completed id is not processed twice
    log->Enqueue(MakeOp("a", PRIORITY_HIGH));
    assert(!log->Get("a").has_value());
    log->Checkpoint();
  }

  auto log = OpenLog(repo, options);
  log->Enqueue(MakeOp("a", PRIORITY_HIGH));
  assert(!log->Get("a").has_value());
  log->Enqueue(MakeOp("e", PRIORITY_MEDIUM, {"a"}));
  auto ready = log->DequeueReady(10, syncore::util::Now());
  assert((Ids(ready) == std::vector<std::string>{"e"}));
}

void TestPruneKeepsReferencedTombstones() {
  auto                repo = std::make_shared<MemoryRepository>();
  OperationLogOptions options;
  options.completed_retention = 1;
  auto log                    = OpenLog(repo, options);

  log->Enqueue(MakeOp("blocker", PRIORITY_LOW, {"missing"}));
  log->Enqueue(MakeOp("child", PRIORITY_LOW, {"parent", "blocker"}));
  CompleteOp(*log, "parent");
  CompleteOp(*log, "x");
  CompleteOp(*log, "y");

  // child still names parent, so its tombstone outlives the retention
  auto tombstone = log->GetTombstone("parent");
  assert(tombstone.has_value());
  assert(tombstone->outcome() == OPERATION_STATE_COMPLETED);
  assert(!log->GetTombstone("x").has_value());

  assert(log->Cancel("blocker"));
  assert(log->DequeueReady(10, syncore::util::Now()).empty());
  assert(log->GetTombstone("child")->reason() == "dependency-failed");
}

void TestAttemptsCounting() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("op", PRIORITY_LOW));
  log->DequeueReady(1, syncore::util::Now());
  assert(log->MarkInFlight("op").attempts() == 1);
  assert(log->RecordRetry("op", "unavailable").attempts() == 2);
  log->Requeue("op", "cancelled");
  assert(log->Get("op")->state() == OPERATION_STATE_QUEUED);
  assert(log->Get("op")->attempts() == 2);

  bool threw = false;
  try {
    log->MarkInFlight("op");
  } catch (const syncore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void VerifyCrashReplay(const std::function<std::shared_ptr<Repository>()>& make_repo) {
  {
    auto log = OpenLog(make_repo());
    log->Enqueue(MakeOp("done", PRIORITY_HIGH));
    log->Enqueue(MakeOp("flying", PRIORITY_HIGH));
    log->Enqueue(MakeOp("waiting", PRIORITY_LOW));
    log->DequeueReady(2, syncore::util::Now());
    log->MarkInFlight("done");
    log->Ack("done", AckOutcome::kCompleted);
    log->MarkInFlight("flying");
    // process dies here
  }

  auto log = OpenLog(make_repo());
  auto ops = log->ListOperations();
  assert((Ids(ops) == std::vector<std::string>{"flying", "waiting"}));
  assert(log->Get("flying")->state() == OPERATION_STATE_IN_FLIGHT);
  assert(log->GetTombstone("done")->outcome() == OPERATION_STATE_COMPLETED);

  auto reverted = log->Recover();
  assert((reverted == std::vector<std::string>{"flying"}));
  assert(log->Get("flying")->state() == OPERATION_STATE_QUEUED);
  // one attempt at MarkInFlight, one for the interrupted transmission
  assert(log->Get("flying")->attempts() == 2);

  // new enqueues keep FIFO after replay
  log->Enqueue(MakeOp("after", PRIORITY_LOW));
  auto ready = log->DequeueReady(10, syncore::util::Now());
  assert((Ids(ready) == std::vector<std::string>{"flying", "waiting", "after"}));
}

void TestCrashReplayMemory() {
  auto repo = std::make_shared<MemoryRepository>();
  VerifyCrashReplay([repo] { return repo; });
}

void TestCrashReplaySqlite() {
  const auto dir = std::filesystem::temp_directory_path() / "syncore_operation_log_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "replay.db";
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  VerifyCrashReplay([path] {
    auto db = std::make_shared<syncore::db::sqlite::SqliteDB>(path.string());
    return std::make_shared<syncore::db::sqlite::SqliteRepository>(db);
  });
}

void TestCheckpointTruncatesJournal() {
  auto                repo = std::make_shared<MemoryRepository>();
  OperationLogOptions options;
  options.checkpoint_every = 3;
  {
    auto log = OpenLog(repo, options);
    for (int i = 0; i < 10; ++i) {
      log->Enqueue(MakeOp("op-" + std::to_string(i), PRIORITY_MEDIUM));
    }
    log->Cancel("op-4");
  }

  {
    auto tx         = repo->Begin();
    auto checkpoint = repo->GetCheckpoint(*tx);
    assert(checkpoint.has_value());
    auto tail = repo->ReadJournal(*tx, checkpoint->last_seq);
    assert(tail.size() < 3);
    tx->Commit();
  }

  auto log = OpenLog(repo, options);
  assert(log->ListOperations().size() == 9);
  assert(log->GetTombstone("op-4").has_value());
  assert(log->PeekStatus().failed_total() == 1);
}

void TestStatusSnapshot() {
  auto repo = std::make_shared<MemoryRepository>();
  auto log  = OpenLog(repo);

  log->Enqueue(MakeOp("a", PRIORITY_CRITICAL));
  log->Enqueue(MakeOp("b", PRIORITY_LOW));
  log->Enqueue(MakeOp("c", PRIORITY_LOW));
  log->DequeueReady(1, syncore::util::Now());
  log->MarkInFlight("a");
  log->Ack("a", AckOutcome::kFailed, "rejected");

  auto status = log->PeekStatus();
  assert(status.live() == 2);
  assert(status.failed_total() == 1);
  assert(status.by_priority_size() == 1);
  assert(status.by_priority(0).priority() == PRIORITY_LOW);
  assert(status.by_priority(0).count() == 2);
}

} // namespace

int main() {
  TestPriorityThenFifoOrder();
  TestDequeueRespectsMax();
  TestEnqueueIsIdempotentAndMerges();
  TestEnqueueValidation();
  TestCapacityLimit();
  TestDependenciesGateReadiness();
  TestFailedDependencyFailsDependents();
  TestCancelOnlyWhileQueued();
  TestExpiredOperationsFail();
  TestAdmissionCheckDefers();
  TestRaisedPriorityDropsDeferral();
  TestCriticalIgnoresStaleSchedule();
  TestPrunedTombstonesStayTerminal();
  TestPruneKeepsReferencedTombstones();
  TestAttemptsCounting();
  TestCrashReplayMemory();
  TestCrashReplaySqlite();
  TestCheckpointTruncatesJournal();
  TestStatusSnapshot();

  std::cout << "operation_log_test: pass\n";
  return 0;
}
