#include "memory_tx.hpp"

namespace tally::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.state_mutex_);
  repo_.committed_ = std::move(working_);
  finished_        = true;
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  writer_.unlock();
}

} // namespace tally::db::memory
