#pragma once

#include <cstdint>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace settle::db::memory {

// Works on a private copy of the repository state; Commit swaps it in if
// no other commit landed since the copy was taken.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> turn_;
  MemoryRepository::State      working_;
  std::uint64_t                base_version_ = 0;
};

} // namespace settle::db::memory
