#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace settle::db::postgres {

/*
  Bounded set of libpqxx connections shared by the engine, the scheduler
  loops and the fee reconciler.

  A pqxx::connection is not thread-safe, so each checkout is exclusive.
  Dropping the returned shared_ptr hands the connection back; if the pool
  is already gone the connection is closed instead. Checkout() blocks when
  max_connections are out.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  // Runs once on every new connection (statement preparation).
  using ConnectHook = std::function<void(pqxx::connection&)>;

  PgPool(std::string conninfo, std::size_t max_connections, ConnectHook on_connect);

  std::shared_ptr<pqxx::connection> Checkout();

 private:
  std::unique_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t limit_;
  ConnectHook       on_connect_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> parked_;
  std::size_t                                    opened_ = 0;
};

} // namespace settle::db::postgres
