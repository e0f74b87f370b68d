#include "pg_pool.hpp"

#include <utility>

namespace settle::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, ConnectHook on_connect)
    : conninfo_(std::move(conninfo)), limit_(max_connections == 0 ? 1 : max_connections), on_connect_(std::move(on_connect)) {
}

std::shared_ptr<pqxx::connection> PgPool::Checkout() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !parked_.empty() || opened_ < limit_; });

  if (!parked_.empty()) {
    auto conn = std::move(parked_.back());
    parked_.pop_back();
    return Lend(std::move(conn));
  }

  ++opened_;
  lock.unlock();
  try {
    return Lend(Connect());
  } catch (const std::exception&) {
    lock.lock();
    --opened_;
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  if (on_connect_) on_connect_(*conn);
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> owner = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [owner](pqxx::connection* returned) {
    if (auto pool = owner.lock()) {
      pool->GiveBack(returned);
    } else {
      delete returned;
    }
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    parked_.emplace_back(conn);
  }
  returned_.notify_one();
}

} // namespace settle::db::postgres
