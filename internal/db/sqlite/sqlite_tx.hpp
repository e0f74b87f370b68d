#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace settle::db::sqlite {

// BEGIN IMMEDIATE takes the write lock up front, so a settlement pass never
// fails halfway through on a read-to-write lock upgrade.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
};

} // namespace settle::db::sqlite
