#pragma once

namespace syncore::db::sql {

/*
  Canonical SQL used by the sqlite backend.
*/

// journal

static constexpr const char* INSERT_JOURNAL =
    "INSERT INTO op_journal(op_id,entry_type,body,appended_at_ms)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_JOURNAL_AFTER =
    "SELECT seq,op_id,entry_type,body,appended_at_ms"
    " FROM op_journal WHERE seq>? ORDER BY seq ASC;";

static constexpr const char* TRUNCATE_JOURNAL =
    "DELETE FROM op_journal WHERE seq<=?;";

static constexpr const char* UPSERT_CHECKPOINT =
    "INSERT INTO op_checkpoint(id,last_seq,body,taken_at_ms)"
    " VALUES(1,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " last_seq=excluded.last_seq,"
    " body=excluded.body,"
    " taken_at_ms=excluded.taken_at_ms;";

static constexpr const char* SELECT_CHECKPOINT =
    "SELECT last_seq,body,taken_at_ms FROM op_checkpoint WHERE id=1;";

// cache

static constexpr const char* UPSERT_CACHE_ENTRY =
    "INSERT INTO cache_entries(key,body,updated_at_ms)"
    " VALUES(?,?,?)"
    " ON CONFLICT(key) DO UPDATE SET"
    " body=excluded.body,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* DELETE_CACHE_ENTRY =
    "DELETE FROM cache_entries WHERE key=?;";

static constexpr const char* SELECT_CACHE_ENTRIES =
    "SELECT key,body,updated_at_ms FROM cache_entries;";

static constexpr const char* INSERT_QUARANTINE =
    "INSERT INTO cache_quarantine(key,body,reason,quarantined_at_ms)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_QUARANTINE =
    "SELECT key,body,reason,quarantined_at_ms FROM cache_quarantine ORDER BY rowid ASC;";

// sync state

static constexpr const char* UPSERT_SYNC_STATE =
    "INSERT INTO sync_state(name,value)"
    " VALUES(?,?)"
    " ON CONFLICT(name) DO UPDATE SET value=excluded.value;";

static constexpr const char* SELECT_SYNC_STATE =
    "SELECT value FROM sync_state WHERE name=?;";

// conflicts

static constexpr const char* UPSERT_OPEN_CONFLICT =
    "INSERT INTO open_conflicts(id,operation_id,body,opened_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " operation_id=excluded.operation_id,"
    " body=excluded.body;";

static constexpr const char* DELETE_OPEN_CONFLICT =
    "DELETE FROM open_conflicts WHERE id=?;";

static constexpr const char* SELECT_OPEN_CONFLICTS =
    "SELECT id,operation_id,body,opened_at_ms FROM open_conflicts ORDER BY opened_at_ms ASC, id ASC;";

static constexpr const char* INSERT_AUDIT =
    "INSERT INTO conflict_audit(conflict_id,body,recorded_at_ms)"
    " VALUES(?,?,?);";

static constexpr const char* SELECT_AUDIT_AFTER =
    "SELECT seq,conflict_id,body,recorded_at_ms"
    " FROM conflict_audit WHERE seq>? ORDER BY seq ASC;";

}
