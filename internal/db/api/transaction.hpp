#pragma once

namespace syncore::db {

/*
  Unit of atomicity of the local store.

  A journal append, the cache writes it implies and a delta cursor advance
  either all land or none do. Every backend guarantees:

  - one open transaction per repository at a time (Begin() blocks)
  - reads inside the transaction see its own writes
  - nothing is visible to other readers before Commit()
  - destroying an unfinished transaction rolls it back

  SQLite: BEGIN IMMEDIATE on the shared connection
  Memory: working copy swapped in on commit
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace syncore::db
