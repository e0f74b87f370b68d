#include "memory_tx.hpp"

namespace settle::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), turn_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (IsOpen()) DoRollback();
}

void MemoryTransaction::DoCommit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != base_version_) {
      throw util::StoreError("memory commit conflict: state changed since transaction began");
    }
    repo_.committed_ = std::move(working_);
    ++repo_.committed_version_;
  }
  turn_.unlock();
}

void MemoryTransaction::DoRollback() {
  working_ = {};
  if (turn_.owns_lock()) turn_.unlock();
}

} // namespace settle::db::memory
