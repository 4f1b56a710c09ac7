#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace tables::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_             = repo_.committed_;
  snapshot_generation_ = repo_.generation_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) rolled_back_ = true;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  RequireOpen();
  wrote_ = true;
  return working_;
}

void MemoryTransaction::Commit() {
  RequireOpen();
  if (!wrote_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.generation_ != snapshot_generation_) {
    throw util::TableConflict("tournament state changed since this transaction started (generation " +
                              std::to_string(snapshot_generation_) + ", now " + std::to_string(repo_.generation_) + ")");
  }
  repo_.committed_ = std::move(working_);
  repo_.generation_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  RequireOpen();
  rolled_back_ = true;
}

void MemoryTransaction::RequireOpen() const {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
}

} // namespace tables::db::memory
