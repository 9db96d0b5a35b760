#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace ledcast::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), tx_lock_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace ledcast::db::memory
