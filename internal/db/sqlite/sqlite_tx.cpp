#include "sqlite_tx.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace settle::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterLock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!IsOpen()) return;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    SETTLE_LOG_ERROR("sqlite: abandoned transaction did not roll back", {observability::ErrorField(e)});
  }
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
  writer_.unlock();
}

void SqliteTransaction::DoRollback() {
  // release the writer lock even if ROLLBACK reports an error
  std::unique_lock<std::mutex> writer = std::move(writer_);
  db_->Exec("ROLLBACK;");
}

} // namespace settle::db::sqlite
