#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace syncore::db::memory {

/*
  Holds the repository's transaction mutex and a working copy of the
  committed state; Commit() swaps the copy in.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> tx_lock_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace syncore::db::memory
