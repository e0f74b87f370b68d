#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace settle::db::postgres {

PgTransaction::PgTransaction(PgPool& pool) : conn_(pool.Checkout()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!IsOpen()) return;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    SETTLE_LOG_ERROR("postgres: abandoned transaction did not roll back", {observability::ErrorField(e)});
  }
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

} // namespace settle::db::postgres
