#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace settle::db {

enum class TxState { kOpen, kCommitted, kRolledBack };

/*
  Unit of work against a Repository.

  Every record written through one Transaction (item transition, terminal
  move, reservation, attempt count, watermark, fee entry) becomes visible
  together on Commit() or not at all. A transaction destroyed while still
  open is rolled back by its backend.

  Transactions on one repository run one at a time. A thread holding an
  open transaction must not Begin() a second one on the same repository.

    memory:   working copy of the committed state, swapped in on commit
    sqlite:   BEGIN IMMEDIATE on the shared connection
    postgres: pqxx::work on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  void Commit() {
    RequireOpen("commit");
    DoCommit();
    state_ = TxState::kCommitted;
  }

  void Rollback() {
    RequireOpen("rollback");
    state_ = TxState::kRolledBack;
    DoRollback();
  }

  TxState State() const {
    return state_;
  }
  bool IsOpen() const {
    return state_ == TxState::kOpen;
  }

 protected:
  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

 private:
  void RequireOpen(const char* op) const {
    if (state_ != TxState::kOpen) {
      throw util::InvalidState(std::string(op) + " on a finished transaction");
    }
  }

  TxState state_ = TxState::kOpen;
};

} // namespace settle::db
