#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace settle::db::postgres {

// Holds one pooled connection for the duration of a pqxx::work. Any failed
// statement aborts the whole work; callers roll back and retry next pass.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(PgPool& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

} // namespace settle::db::postgres
