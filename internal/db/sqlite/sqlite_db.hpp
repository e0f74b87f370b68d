#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

namespace settle::db::sqlite {

// Owning handle for the settlement database file. A single connection
// backs the whole repository; WriterLock() is taken by each transaction
// for its lifetime so BEGIN IMMEDIATE is never issued twice on it.
class SqliteDB {
 public:
  // ":memory:" is accepted for tests.
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return handle_;
  }
  std::mutex& WriterLock() {
    return writer_;
  }

  void Exec(const std::string& sql);
  void ApplySchema(const std::vector<std::string>& statements);

 private:
  void Open();
  void ApplyPragmas();

  std::string path_;
  sqlite3*    handle_ = nullptr;
  std::mutex  writer_;
};

} // namespace settle::db::sqlite
