#include "internal/db/sqlite/sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace syncore::db::sqlite {

using syncore::db::ErrorCode;
using syncore::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    int n = sqlite3_column_bytes(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Reads fail loudly: a silently empty journal would lose queued operations.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

static void StepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw std::runtime_error("sqlite step: " + msg);
    }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    sql::RunMigrations(*db_, sql::SchemaMigrations());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_FULL:
            return Result::Err(ErrorCode::StorageFull, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Operation journal
// ------------------------------------------------------------------

Result SqliteRepository::AppendJournal(Transaction& t, model::JournalRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_JOURNAL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.op_id);
    BindI32(st, 2, r.entry_type);
    BindBlob(st, 3, r.body);
    BindU64(st, 4, r.appended_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE)
        r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));

    return Translate(db, rc);
}

std::vector<model::JournalRecord>
SqliteRepository::ReadJournal(Transaction& t, uint64_t after_seq) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_JOURNAL_AFTER);
    BindU64(st, 1, after_seq);

    std::vector<model::JournalRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::JournalRecord r;
        r.seq = ColU64(st, 0);
        r.op_id = ColText(st, 1);
        r.entry_type = ColI32(st, 2);
        r.body = ColBlob(st, 3);
        r.appended_at_ms = ColU64(st, 4);
        out.push_back(std::move(r));
    }
    StepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::TruncateJournal(Transaction& t, uint64_t up_to_seq) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::TRUNCATE_JOURNAL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, up_to_seq);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::PutCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_CHECKPOINT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.last_seq);
    BindBlob(st, 2, r.body);
    BindU64(st, 3, r.taken_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::CheckpointRecord> SqliteRepository::GetCheckpoint(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_CHECKPOINT);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        StepFailed(db, st, rc);
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::CheckpointRecord r;
    r.last_seq = ColU64(st, 0);
    r.body = ColBlob(st, 1);
    r.taken_at_ms = ColU64(st, 2);

    sqlite3_finalize(st);
    return r;
}

// ------------------------------------------------------------------
// Cache segments
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_CACHE_ENTRY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.key);
    BindBlob(st, 2, r.body);
    BindU64(st, 3, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_CACHE_ENTRY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, key);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::CacheRecord> SqliteRepository::ListCacheEntries(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_CACHE_ENTRIES);

    std::vector<model::CacheRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::CacheRecord r;
        r.key = ColText(st, 0);
        r.body = ColBlob(st, 1);
        r.updated_at_ms = ColU64(st, 2);
        out.push_back(std::move(r));
    }
    StepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::InsertQuarantine(Transaction& t, const model::QuarantineRow& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_QUARANTINE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.key);
    BindBlob(st, 2, r.body);
    BindText(st, 3, r.reason);
    BindU64(st, 4, r.quarantined_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::QuarantineRow> SqliteRepository::ListQuarantine(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_QUARANTINE);

    std::vector<model::QuarantineRow> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::QuarantineRow r;
        r.key = ColText(st, 0);
        r.body = ColBlob(st, 1);
        r.reason = ColText(st, 2);
        r.quarantined_at_ms = ColU64(st, 3);
        out.push_back(std::move(r));
    }
    StepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Sync state
// ------------------------------------------------------------------

Result SqliteRepository::PutSyncState(Transaction& t, const std::string& name, const std::string& value) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_SYNC_STATE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, name);
    BindBlob(st, 2, value);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<std::string> SqliteRepository::GetSyncState(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_SYNC_STATE);
    BindText(st, 1, name);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        StepFailed(db, st, rc);
        sqlite3_finalize(st);
        return std::nullopt;
    }

    std::string value = ColBlob(st, 0);
    sqlite3_finalize(st);
    return value;
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertOpenConflict(Transaction& t, const model::ConflictRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_OPEN_CONFLICT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.operation_id);
    BindBlob(st, 3, r.body);
    BindU64(st, 4, r.opened_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteOpenConflict(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_OPEN_CONFLICT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "conflict not found: " + id);

    return Translate(db, rc);
}

std::vector<model::ConflictRecord> SqliteRepository::ListOpenConflicts(Transaction& t) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_OPEN_CONFLICTS);

    std::vector<model::ConflictRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::ConflictRecord r;
        r.id = ColText(st, 0);
        r.operation_id = ColText(st, 1);
        r.body = ColBlob(st, 2);
        r.opened_at_ms = ColU64(st, 3);
        out.push_back(std::move(r));
    }
    StepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::AppendAudit(Transaction& t, model::AuditRow& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_AUDIT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.conflict_id);
    BindBlob(st, 2, r.body);
    BindU64(st, 3, r.recorded_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE)
        r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));

    return Translate(db, rc);
}

std::vector<model::AuditRow> SqliteRepository::ReadAudit(Transaction& t, uint64_t after_seq) {
    auto* db = TX(t).Handle();
    sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_AUDIT_AFTER);
    BindU64(st, 1, after_seq);

    std::vector<model::AuditRow> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::AuditRow r;
        r.seq = ColU64(st, 0);
        r.conflict_id = ColText(st, 1);
        r.body = ColBlob(st, 2);
        r.recorded_at_ms = ColU64(st, 3);
        out.push_back(std::move(r));
    }
    StepFailed(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

}
