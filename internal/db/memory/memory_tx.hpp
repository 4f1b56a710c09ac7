#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tables::db::memory {

/*
  Snapshot transaction over MemoryRepository.

  Reads and writes go to a private copy of the committed state. Commit
  publishes the copy only if nothing else was published since the snapshot
  was taken, so two read-check-write edits of one round never both land.
  A transaction that only read commits without that check and without
  invalidating anyone else's snapshot.
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

  // Marks the transaction as a writer.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void RequireOpen() const;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_generation_ = 0;
  bool                    wrote_               = false;
  bool                    committed_           = false;
  bool                    rolled_back_         = false;
};

} // namespace tables::db::memory
