#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace streamledger::db::memory {

/*
  Transaction = snapshot + write set

  Commit swaps the working copy in only if no other transaction committed
  since the snapshot was taken. A transaction that never asked for Mutable()
  commits without touching the repository.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
  bool                    dirty_            = false;
};

} // namespace streamledger::db::memory
