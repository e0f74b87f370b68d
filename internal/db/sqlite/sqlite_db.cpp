#include "sqlite_db.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace settle::db::sqlite {

namespace {

// Lock waits longer than this surface as ErrorCode::Busy.
constexpr int kBusyTimeoutMs = 5000;

}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  Open();
  ApplyPragmas();
}

SqliteDB::~SqliteDB() {
  if (handle_ != nullptr) sqlite3_close(handle_);
}

void SqliteDB::Open() {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &handle_, flags, nullptr) == SQLITE_OK) return;

  const std::string reason = handle_ != nullptr ? sqlite3_errmsg(handle_) : "out of memory";
  sqlite3_close(handle_);
  handle_ = nullptr;
  throw util::StoreError("cannot open settlement database " + path_ + ": " + reason);
}

void SqliteDB::ApplyPragmas() {
  Exec("PRAGMA journal_mode=WAL;");
  // a committed transition must survive a crash right after the ledger call
  Exec("PRAGMA synchronous=FULL;");
  if (sqlite3_busy_timeout(handle_, kBusyTimeoutMs) != SQLITE_OK) {
    throw util::StoreError(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(handle_));
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char* raw_err = nullptr;
  if (sqlite3_exec(handle_, sql.c_str(), nullptr, nullptr, &raw_err) == SQLITE_OK) return;

  std::string detail = raw_err != nullptr ? raw_err : sqlite3_errmsg(handle_);
  sqlite3_free(raw_err);
  throw util::StoreError("sqlite exec failed: " + detail);
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements) {
  for (const auto& statement : statements) Exec(statement);
}

} // namespace settle::db::sqlite
